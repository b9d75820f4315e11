#ifndef SIGNER_USERSIGNERIF_HPP
#define SIGNER_USERSIGNERIF_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>
#include<string>
#include<vector>

namespace Signer {

/** class Signer::SignerError
 *
 * @brief thrown when the key-management capability
 * fails or returns something unusable.
 */
class SignerError : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	SignerError(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(msg) { }
};

/** class Signer::UserSignerIF
 *
 * @brief abstract key-management capability supplied
 * by the user of this library.
 *
 * @desc The library never sees private keys; it only
 * asks for public keys and signatures.
 * Implementations may throw any `std::exception` on
 * failure; callers see it as `Signer::SignerError`.
 *
 * Derivation paths are strings in the usual BIP32
 * notation, e.g. `m/84'/1776'/0'/0/5`.
 */
class UserSignerIF {
public:
	virtual ~UserSignerIF() { }

	/* 78-byte BIP32 serialization of the master
	 * public key.  */
	virtual
	std::vector<std::uint8_t> xpub() =0;

	/* 78-byte BIP32 serialization of the public key
	 * at the given path.  */
	virtual
	std::vector<std::uint8_t>
	derive_xpub(std::string const& path) =0;

	/* DER-encoded ECDSA signature of the given
	 * 32-byte hash, with the key at the given path.  */
	virtual
	std::vector<std::uint8_t>
	sign_ecdsa( std::vector<std::uint8_t> const& msg
		  , std::string const& path
		  ) =0;

	/* 65-byte recoverable signature of the given
	 * 32-byte hash with the master key: one header
	 * byte (31 + recovery id), then the 64-byte
	 * compact signature.  */
	virtual
	std::vector<std::uint8_t>
	sign_ecdsa_recoverable(std::vector<std::uint8_t> const& msg) =0;

	/* 32-byte SLIP77 master blinding key.  */
	virtual
	std::vector<std::uint8_t> slip77_master_blinding_key() =0;
};

}

#endif /* !defined(SIGNER_USERSIGNERIF_HPP) */
