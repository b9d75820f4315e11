#ifndef SIGNER_SDKSIGNER_HPP
#define SIGNER_SDKSIGNER_HPP

#include"Signer/ExtPubKey.hpp"
#include<cstdint>
#include<memory>
#include<string>
#include<vector>

namespace Secp256k1 { class PubKey; }
namespace Sha256 { class Hash; }
namespace Signer { class UserSignerIF; }
namespace Wallet { struct Pset; }

namespace Signer {

/** class Signer::SdkSigner
 *
 * @brief adapts a user-supplied `Signer::UserSignerIF`
 * to what the wallet needs: identity, descriptor,
 * transaction signing and message signing.
 *
 * @desc Every failure of the user capability, and
 * every malformed answer from it, is thrown as
 * `Signer::SignerError`.
 */
class SdkSigner {
private:
	std::shared_ptr<UserSignerIF> user;
	ExtPubKey master;

public:
	SdkSigner() =delete;
	explicit
	SdkSigner(std::shared_ptr<UserSignerIF> user);

	/* Master public key.  */
	Secp256k1::PubKey const& pubkey() const {
		return master.pubkey();
	}
	/* Master key fingerprint, 8 lowercase hex digits.  */
	std::string fingerprint() const;

	/** Signer::SdkSigner::wpkh_slip77_descriptor
	 *
	 * @brief the confidential native-segwit descriptor
	 * of account 0, blinded by the SLIP77 master key.
	 *
	 * @param mainnet - selects coin type 1776 instead
	 * of 1.
	 */
	std::string wpkh_slip77_descriptor(bool mainnet);

	/* Sign every input that carries a derivation
	 * path, verifying each signature against the
	 * input pubkey when one is given.  */
	void sign(Wallet::Pset& pset);

	/* 65-byte header-plus-compact recoverable
	 * signature of the hash by the master key.  */
	std::vector<std::uint8_t>
	sign_ecdsa_recoverable(Sha256::Hash const& hash);
};

}

#endif /* !defined(SIGNER_SDKSIGNER_HPP) */
