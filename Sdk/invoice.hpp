#ifndef SDK_INVOICE_HPP
#define SDK_INVOICE_HPP

#include"Sdk/Config.hpp"
#include<cstdint>
#include<string>

namespace Sdk {

struct Invoice {
	std::string invoice;
	Network network;
	std::uint64_t amount_sat;
};

/** Sdk::parse_invoice
 *
 * @brief check the bech32 checksum and the
 * human-readable part of a BOLT11 invoice and
 * extract its network and amount.
 *
 * @desc Throws `Sdk::PaymentError` of kind
 * `InvalidInvoice` if the invoice is malformed,
 * has no amount, or is for another network.
 * Tagged fields are not interpreted.
 */
Invoice parse_invoice(std::string const& invoice, Network expected);

}

#endif /* !defined(SDK_INVOICE_HPP) */
