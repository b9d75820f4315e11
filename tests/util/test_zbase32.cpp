#undef NDEBUG
#include"Util/Zbase32.hpp"
#include<assert.h>

int main() {
	assert(Util::Zbase32::encode({}) == "");
	assert(Util::Zbase32::encode({0x00}) == "yy");
	assert(Util::Zbase32::encode({0xff}) == "9h");

	/* A compact signature: 65 bytes, 104 characters.  */
	auto sig = std::vector<std::uint8_t>(65);
	for (auto i = std::size_t(0); i < sig.size(); ++i)
		sig[i] = std::uint8_t(i * 37 + 1);
	auto str = Util::Zbase32::encode(sig);
	assert(str.size() == 104);

	auto decoded = std::vector<std::uint8_t>();
	assert(Util::Zbase32::decode(decoded, str));
	assert(decoded == sig);

	/* 'l' and 'v' are not in the alphabet.  */
	assert(!Util::Zbase32::decode(decoded, "yyl"));
	assert(!Util::Zbase32::decode(decoded, "v"));

	return 0;
}
