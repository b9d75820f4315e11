#ifndef PERSIST_RESERVEDADDRESS_HPP
#define PERSIST_RESERVEDADDRESS_HPP

#include<cstdint>
#include<string>

namespace Persist {

/** struct Persist::ReservedAddress
 *
 * @brief an address handed out for an expected
 * swap lockup.
 * It may be handed out again once the tip reaches
 * `expiry_block_height`.
 */
struct ReservedAddress {
	std::string address;
	std::uint32_t derivation_index;
	std::uint32_t expiry_block_height;
};

}

#endif /* !defined(PERSIST_RESERVEDADDRESS_HPP) */
