#ifndef SIGNER_KEYSIGNER_HPP
#define SIGNER_KEYSIGNER_HPP

#include"Signer/UserSignerIF.hpp"
#include<cstdint>
#include<memory>
#include<string>
#include<vector>

namespace Signer {

/** class Signer::KeySigner
 *
 * @brief a `Signer::UserSignerIF` holding a BIP32
 * master key derived from a seed.
 *
 * @desc Used as the default signer when the caller
 * gives a seed instead of its own signer, and by the
 * tests.
 * The SLIP77 master blinding key is derived from the
 * same seed via SLIP21.
 */
class KeySigner : public UserSignerIF {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	KeySigner() =delete;
	KeySigner(KeySigner const&) =delete;

	/* Seed must be 16 to 64 bytes.  */
	KeySigner( std::vector<std::uint8_t> const& seed
		 , bool mainnet
		 );
	~KeySigner();

	std::vector<std::uint8_t> xpub() override;
	std::vector<std::uint8_t>
	derive_xpub(std::string const& path) override;
	std::vector<std::uint8_t>
	sign_ecdsa( std::vector<std::uint8_t> const& msg
		  , std::string const& path
		  ) override;
	std::vector<std::uint8_t>
	sign_ecdsa_recoverable(std::vector<std::uint8_t> const& msg) override;
	std::vector<std::uint8_t> slip77_master_blinding_key() override;

	/** Signer::KeySigner::parse_path
	 *
	 * @brief parse `m/84'/1'/0'/0/5` into child
	 * numbers, hardened ones with the top bit set.
	 * Both `'` and `h` mark hardened steps.
	 * The leading `m` is optional.
	 *
	 * @desc Throws `Signer::SignerError` on a
	 * malformed path.
	 */
	static
	std::vector<std::uint32_t> parse_path(std::string const& path);
};

}

#endif /* !defined(SIGNER_KEYSIGNER_HPP) */
