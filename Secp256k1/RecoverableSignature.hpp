#ifndef SECP256K1_RECOVERABLESIGNATURE_HPP
#define SECP256K1_RECOVERABLESIGNATURE_HPP

#include<cstdint>

namespace Secp256k1 { class PrivKey; }
namespace Secp256k1 { class PubKey; }
namespace Sha256 { class Hash; }

namespace Secp256k1 {

/** class Secp256k1::RecoverableSignature
 *
 * @brief ECDSA signature plus the recovery id that
 * lets a verifier compute the signing public key
 * from the signature and message alone.
 */
class RecoverableSignature {
private:
	/* Opaque secp256k1_ecdsa_recoverable_signature.  */
	std::uint8_t data[65];

	RecoverableSignature();

public:
	RecoverableSignature(RecoverableSignature const&) =default;
	RecoverableSignature& operator=(RecoverableSignature const&) =default;

	static
	RecoverableSignature create( Secp256k1::PrivKey const& sk
				   , Sha256::Hash const& m
				   );

	/* Throws BadSignatureEncoding if the compact
	 * signature or recovery id is invalid.
	 */
	static
	RecoverableSignature from_compact( std::uint8_t const compact[64]
					 , int recid
					 );
	void to_compact(std::uint8_t compact[64], int& recid) const;

	/* Throws InvalidPubKey if no key can be
	 * recovered for the given message.
	 */
	Secp256k1::PubKey recover(Sha256::Hash const& m) const;
};

}

#endif /* !defined(SECP256K1_RECOVERABLESIGNATURE_HPP) */
