#ifndef BITCOIN_ADDR_TO_SCRIPTPUBKEY_HPP
#define BITCOIN_ADDR_TO_SCRIPTPUBKEY_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<string>
#include<stdexcept>
#include<vector>

namespace Bitcoin {

struct UnknownAddrType : public Util::BacktraceException<std::invalid_argument> {
public:
	explicit
	UnknownAddrType(std::string const& addr)
		: Util::BacktraceException<std::invalid_argument>(
			"Bitcoin::UnknownAddrType: " + addr
		  ) { }
};

enum class Chain
{ Bitcoin
, Liquid
};
enum class Net
{ Main
, Test
, Regtest
};

/** struct Bitcoin::Address
 *
 * @brief a parsed address.
 *
 * @desc `blinding_pubkey` is non-empty (33 bytes)
 * only for Liquid confidential addresses.
 * Base58 Bitcoin addresses cannot tell testnet
 * from regtest and report `Net::Test`.
 */
struct Address {
	Chain chain;
	Net net;
	bool segwit;
	std::vector<std::uint8_t> blinding_pubkey;
	std::vector<std::uint8_t> script_pubkey;

	bool confidential() const { return !blinding_pubkey.empty(); }
};

/** Bitcoin::parse_address
 *
 * @brief parse a bech32/bech32m (Bitcoin and
 * Liquid unconfidential), blech32/blech32m (Liquid
 * confidential) or base58check address, verifying
 * its checksum.
 * Throws `Bitcoin::UnknownAddrType` on failure.
 */
Address parse_address(std::string const&);

/** Bitcoin::addr_to_scriptPubKey
 *
 * @brief given an address, returns the
 * `scriptPubKey` it should have, or
 * throws `Bitcoin::UnknownAddrType`
 * if address format fails.
 */
std::vector<std::uint8_t>
addr_to_scriptPubKey(std::string const&);

/** Bitcoin::is_address_for
 *
 * @brief whether the string is a valid address of
 * the given chain and network.
 * Never throws.
 */
bool is_address_for(std::string const&, Chain, Net);

}

#endif /* !defined(BITCOIN_ADDR_TO_SCRIPTPUBKEY_HPP) */
