#ifndef SECP256K1_PUBKEY_HPP
#define SECP256K1_PUBKEY_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<memory>
#include<ostream>
#include<stdexcept>
#include<string>
#include<vector>

namespace Secp256k1 { class PrivKey; }
namespace Secp256k1 { class RecoverableSignature; }
namespace Secp256k1 { class Signature; }

namespace Secp256k1 {

/* Thrown in case of being fed an invalid public key.  */
class InvalidPubKey : public Util::BacktraceException<std::invalid_argument> {
public:
	InvalidPubKey() : Util::BacktraceException<std::invalid_argument>("Invalid public key.") { }
};

/** class Secp256k1::PubKey
 *
 * @brief a point on the curve, serialized in
 * 33-byte compressed form.
 */
class PubKey {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	PubKey();

	/* Used by the signature classes.  */
	void const* get_key() const;
	void* get_key();

public:
	/* Load public key from a hex-encoded string.  */
	explicit PubKey(std::string const&);
	/* Create hex-encoded string.  */
	explicit operator std::string() const;
	/* Get the public key behind the given private key.  */
	explicit PubKey(Secp256k1::PrivKey const&);

	PubKey(PubKey const&);
	PubKey(PubKey&&);
	~PubKey();

	PubKey& operator=(PubKey const& o) {
		auto tmp = PubKey(o);
		tmp.pimpl.swap(pimpl);
		return *this;
	}
	PubKey& operator=(PubKey&& o) {
		auto tmp = PubKey(std::move(o));
		tmp.pimpl.swap(pimpl);
		return *this;
	}

	bool operator==(PubKey const&) const;
	bool operator!=(PubKey const& o) const {
		return !(*this == o);
	}

	static PubKey from_buffer(std::uint8_t const buffer[33]);
	void to_buffer(std::uint8_t buffer[33]) const;
	std::vector<std::uint8_t> to_bytes() const;

	friend class Secp256k1::RecoverableSignature;
	friend class Secp256k1::Signature;
};

inline
std::ostream& operator<<(std::ostream& os, PubKey const& pk) {
	return os << std::string(pk);
}

}

#endif /* SECP256K1_PUBKEY_HPP */
