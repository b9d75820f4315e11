#include"Util/Zbase32.hpp"

namespace {

auto const alphabet = std::string("ybndrfg8ejkmcpqxot1uwisza345h769");

}

namespace Util { namespace Zbase32 {

std::string encode(std::vector<std::uint8_t> const& data) {
	auto rv = std::string();
	rv.reserve((data.size() * 8 + 4) / 5);

	auto acc = std::uint32_t(0);
	auto bits = 0;
	for (auto b : data) {
		acc = (acc << 8) | b;
		bits += 8;
		while (bits >= 5) {
			bits -= 5;
			rv.push_back(alphabet[(acc >> bits) & 31]);
		}
	}
	if (bits > 0)
		rv.push_back(alphabet[(acc << (5 - bits)) & 31]);
	return rv;
}

bool decode(std::vector<std::uint8_t>& data, std::string const& str) {
	data.clear();
	data.reserve(str.size() * 5 / 8);

	auto acc = std::uint32_t(0);
	auto bits = 0;
	for (auto c : str) {
		auto idx = alphabet.find(c);
		if (idx == std::string::npos)
			return false;
		acc = (acc << 5) | std::uint32_t(idx);
		bits += 5;
		if (bits >= 8) {
			bits -= 8;
			data.push_back(std::uint8_t((acc >> bits) & 0xFF));
		}
	}
	return true;
}

}}
