#ifndef WALLET_ADDRESSRESULT_HPP
#define WALLET_ADDRESSRESULT_HPP

#include<cstdint>
#include<string>

namespace Wallet {

/* A wallet address with its derivation index on
 * the external chain.  */
struct AddressResult {
	std::string address;
	std::uint32_t index;
};

}

#endif /* !defined(WALLET_ADDRESSRESULT_HPP) */
