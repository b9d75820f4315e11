#ifndef SIGNER_EXTPUBKEY_HPP
#define SIGNER_EXTPUBKEY_HPP

#include"Secp256k1/PubKey.hpp"
#include<cstdint>
#include<string>
#include<vector>

namespace Signer {

/** class Signer::ExtPubKey
 *
 * @brief a BIP32 extended public key.
 */
class ExtPubKey {
private:
	std::uint32_t version;
	std::uint8_t depth;
	std::uint32_t parent_fingerprint;
	std::uint32_t child_number;
	std::vector<std::uint8_t> chain_code;
	Secp256k1::PubKey key;

	ExtPubKey( std::uint32_t version
		 , std::uint8_t depth
		 , std::uint32_t parent_fingerprint
		 , std::uint32_t child_number
		 , std::vector<std::uint8_t> chain_code
		 , Secp256k1::PubKey key
		 );

public:
	static constexpr std::uint32_t mainnet_version = 0x0488B21E;
	static constexpr std::uint32_t testnet_version = 0x043587CF;

	/* Parse the 78-byte serialization.
	 * Throws Signer::SignerError.
	 */
	static
	ExtPubKey parse(std::vector<std::uint8_t> const& bytes);

	/* Build from parts, e.g. while deriving.  */
	static
	ExtPubKey make( std::uint32_t version
		      , std::uint8_t depth
		      , std::uint32_t parent_fingerprint
		      , std::uint32_t child_number
		      , std::vector<std::uint8_t> chain_code
		      , Secp256k1::PubKey key
		      );

	std::vector<std::uint8_t> serialize() const;
	/* Base58check form, e.g. `xpub...` or `tpub...`.  */
	std::string to_string() const;

	Secp256k1::PubKey const& pubkey() const { return key; }
	std::uint8_t get_depth() const { return depth; }
	std::uint32_t get_child_number() const { return child_number; }
	/* First four bytes of HASH160 of the key, as
	 * an integer read big-endian.  */
	std::uint32_t fingerprint() const;
};

}

#endif /* !defined(SIGNER_EXTPUBKEY_HPP) */
