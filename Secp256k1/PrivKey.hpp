#ifndef SECP256K1_PRIVKEY_HPP
#define SECP256K1_PRIVKEY_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>
#include<string>

namespace Secp256k1 { class PubKey; }
namespace Secp256k1 { class RecoverableSignature; }
namespace Secp256k1 { class Signature; }

namespace Secp256k1 {

/* Thrown if caller-provided data would result in an invalid
 * private key.
 */
class InvalidPrivKey : public Util::BacktraceException<std::invalid_argument> {
public:
	InvalidPrivKey()
		: Util::BacktraceException<std::invalid_argument>("Invalid private key.") { }
};

/** class Secp256k1::PrivKey
 *
 * @brief a valid secp256k1 scalar, wiped from
 * memory on destruction.
 */
class PrivKey {
private:
	std::uint8_t key[32];

	explicit
	PrivKey(std::uint8_t const key_[32]);

public:
	PrivKey() =delete;
	PrivKey(PrivKey const&);
	PrivKey& operator=(PrivKey const&);
	~PrivKey();

	/* Load private key from a hex-encoded string.  */
	explicit PrivKey(std::string const&);
	/* Get hex-encoded private key.  */
	explicit operator std::string() const;

	/* Add a tweak modulo the group order, as in
	 * BIP32 child derivation.
	 * Throws InvalidPrivKey if the tweak is out of
	 * range or the sum is zero.
	 */
	PrivKey& tweak_add(std::uint8_t const tweak[32]);

	static PrivKey from_buffer(std::uint8_t const buffer[32]) {
		return PrivKey(buffer);
	}
	void to_buffer(std::uint8_t buffer[32]) const;

	bool operator==(PrivKey const& o) const;
	bool operator!=(PrivKey const& o) const {
		return !(*this == o);
	}

	friend class PubKey;
	friend class RecoverableSignature;
	friend class Signature;
};

}

#endif /* SECP256K1_PRIVKEY_HPP */
