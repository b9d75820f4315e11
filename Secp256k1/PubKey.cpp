#include"Secp256k1/Detail/context.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"
#include<assert.h>
#include<secp256k1.h>
#include<sodium/utils.h>

using Secp256k1::Detail::context;

namespace Secp256k1 {

class PubKey::Impl {
public:
	secp256k1_pubkey key;

	Impl() { }
	explicit Impl(Secp256k1::PrivKey const& sk) {
		auto res = secp256k1_ec_pubkey_create( context.get()
						     , &key
						     , sk.key
						     );
		/* The private key should have been verified.  */
		assert(res == 1);
		(void) res;
	}
	explicit Impl(std::uint8_t const buffer[33]) {
		auto res = secp256k1_ec_pubkey_parse( context.get()
						    , &key
						    , buffer
						    , 33
						    );
		if (!res)
			throw InvalidPubKey();
	}

	void to_buffer(std::uint8_t buffer[33]) const {
		auto size = size_t(33);
		auto res = secp256k1_ec_pubkey_serialize( context.get()
							, buffer
							, &size
							, &key
							, SECP256K1_EC_COMPRESSED
							);
		assert(res == 1);
		assert(size == 33);
		(void) res;
	}
};

PubKey::PubKey() : pimpl(Util::make_unique<Impl>()) { }

PubKey::PubKey(std::string const& s) {
	auto buf = Util::Str::hexread(s);
	if (buf.size() != 33)
		throw InvalidPubKey();
	pimpl = Util::make_unique<Impl>(&buf[0]);
}
PubKey::operator std::string() const {
	std::uint8_t buf[33];
	pimpl->to_buffer(buf);
	return Util::Str::hexdump(buf, sizeof(buf));
}

PubKey::PubKey(Secp256k1::PrivKey const& sk)
	: pimpl(Util::make_unique<Impl>(sk)) { }

PubKey::PubKey(PubKey const& o)
	: pimpl(Util::make_unique<Impl>(*o.pimpl)) { }
PubKey::PubKey(PubKey&& o)
	: pimpl(std::move(o.pimpl)) { }
PubKey::~PubKey() =default;

void const* PubKey::get_key() const {
	return &pimpl->key;
}
void* PubKey::get_key() {
	return &pimpl->key;
}

bool PubKey::operator==(PubKey const& o) const {
	std::uint8_t a[33];
	std::uint8_t b[33];
	pimpl->to_buffer(a);
	o.pimpl->to_buffer(b);
	return sodium_memcmp(a, b, sizeof(a)) == 0;
}

PubKey PubKey::from_buffer(std::uint8_t const buffer[33]) {
	auto rv = PubKey();
	rv.pimpl = Util::make_unique<Impl>(buffer);
	return rv;
}
void PubKey::to_buffer(std::uint8_t buffer[33]) const {
	pimpl->to_buffer(buffer);
}
std::vector<std::uint8_t> PubKey::to_bytes() const {
	auto rv = std::vector<std::uint8_t>(33);
	pimpl->to_buffer(&rv[0]);
	return rv;
}

}
