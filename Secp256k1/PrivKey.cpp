#include"Secp256k1/Detail/context.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Util/Str.hpp"
#include<secp256k1.h>
#include<sodium/utils.h>
#include<string.h>

using Secp256k1::Detail::context;

namespace Secp256k1 {

PrivKey::PrivKey(std::uint8_t const key_[32]) {
	if (!secp256k1_ec_seckey_verify(context.get(), key_))
		throw InvalidPrivKey();
	memcpy(key, key_, 32);
}

PrivKey::PrivKey(std::string const& s) {
	auto buf = Util::Str::hexread(s);
	if (buf.size() != 32)
		throw InvalidPrivKey();
	if (!secp256k1_ec_seckey_verify(context.get(), &buf[0])) {
		sodium_memzero(&buf[0], buf.size());
		throw InvalidPrivKey();
	}
	memcpy(key, &buf[0], 32);
	sodium_memzero(&buf[0], buf.size());
}
PrivKey::operator std::string() const {
	return Util::Str::hexdump(key, sizeof(key));
}

PrivKey::PrivKey(PrivKey const& o) {
	memcpy(key, o.key, 32);
}
PrivKey& PrivKey::operator=(PrivKey const& o) {
	memcpy(key, o.key, 32);
	return *this;
}
PrivKey::~PrivKey() {
	sodium_memzero(key, sizeof(key));
}

PrivKey& PrivKey::tweak_add(std::uint8_t const tweak[32]) {
	std::uint8_t tmp[32];
	memcpy(tmp, key, 32);
	auto res = secp256k1_ec_seckey_tweak_add(context.get(), tmp, tweak);
	if (!res) {
		sodium_memzero(tmp, sizeof(tmp));
		throw InvalidPrivKey();
	}
	memcpy(key, tmp, 32);
	sodium_memzero(tmp, sizeof(tmp));
	return *this;
}

void PrivKey::to_buffer(std::uint8_t buffer[32]) const {
	memcpy(buffer, key, 32);
}

bool PrivKey::operator==(PrivKey const& o) const {
	return 0 == sodium_memcmp(key, o.key, sizeof(key));
}

}
