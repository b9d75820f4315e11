#ifndef SECP256K1_SIGNATURE_HPP
#define SECP256K1_SIGNATURE_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>
#include<string>
#include<vector>

namespace Secp256k1 { class PrivKey; }
namespace Secp256k1 { class PubKey; }
namespace Sha256 { class Hash; }

namespace Secp256k1 {

class BadSignatureEncoding : public Util::BacktraceException<std::invalid_argument> {
public:
	BadSignatureEncoding()
		: Util::BacktraceException<std::invalid_argument>("Bad signature encoding")
		{ }
};

/** class Secp256k1::Signature
 *
 * @brief ECDSA signature, always low-S and,
 * when created here, low-R.
 */
class Signature {
private:
	std::uint8_t data[64];

	Signature();
	Signature( Secp256k1::PrivKey const&
		 , Sha256::Hash const&
		 );

	bool sig_has_low_r() const;

public:
	Signature(Signature const&) =default;
	Signature& operator=(Signature const&) =default;

	/* Parse 64-byte compact form.  */
	static
	Signature from_buffer(std::uint8_t const buffer[64]);
	void to_buffer(std::uint8_t buffer[64]) const;

	bool valid( Secp256k1::PubKey const& pk
		  , Sha256::Hash const& m
		  ) const;

	static
	Signature create( Secp256k1::PrivKey const& sk
			, Sha256::Hash const& m
			) {
		return Signature(sk, m);
	}

	std::vector<std::uint8_t> der_encode() const;
	/* Throws BadSignatureEncoding.  */
	static
	Signature der_decode(std::vector<std::uint8_t> const& d);
};

}

#endif /* SECP256K1_SIGNATURE_HPP */
