#include"Bitcoin/base58.hpp"
#include"Sha256/fun.hpp"
#include<algorithm>
#include<sodium/utils.h>

namespace {

char const alphabet[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int decode_char(char c) {
	auto p = std::find(alphabet, alphabet + 58, c);
	if (p == alphabet + 58)
		return -1;
	return int(p - alphabet);
}

std::string encode(std::vector<std::uint8_t> const& data) {
	auto zeroes = std::size_t(0);
	while (zeroes < data.size() && data[zeroes] == 0)
		++zeroes;

	/* Big-endian base58 digits, little end last.  */
	auto digits = std::vector<std::uint8_t>();
	digits.reserve(data.size() * 138 / 100 + 1);
	for (auto it = data.begin() + zeroes; it != data.end(); ++it) {
		auto carry = std::uint32_t(*it);
		for (auto d = digits.rbegin(); d != digits.rend(); ++d) {
			carry += std::uint32_t(*d) << 8;
			*d = std::uint8_t(carry % 58);
			carry /= 58;
		}
		while (carry > 0) {
			digits.insert(digits.begin(), std::uint8_t(carry % 58));
			carry /= 58;
		}
	}

	auto rv = std::string(zeroes, '1');
	for (auto d : digits)
		rv.push_back(alphabet[d]);
	return rv;
}

bool decode(std::vector<std::uint8_t>& out, std::string const& str) {
	auto zeroes = std::size_t(0);
	while (zeroes < str.size() && str[zeroes] == '1')
		++zeroes;

	auto bytes = std::vector<std::uint8_t>();
	for (auto it = str.begin() + zeroes; it != str.end(); ++it) {
		auto v = decode_char(*it);
		if (v < 0)
			return false;
		auto carry = std::uint32_t(v);
		for (auto b = bytes.rbegin(); b != bytes.rend(); ++b) {
			carry += std::uint32_t(*b) * 58;
			*b = std::uint8_t(carry & 0xFF);
			carry >>= 8;
		}
		while (carry > 0) {
			bytes.insert(bytes.begin(), std::uint8_t(carry & 0xFF));
			carry >>= 8;
		}
	}

	out = std::vector<std::uint8_t>(zeroes, 0);
	out.insert(out.end(), bytes.begin(), bytes.end());
	return true;
}

}

namespace Bitcoin {

std::string base58check_encode(std::vector<std::uint8_t> const& payload) {
	std::uint8_t check[32];
	Sha256::sha256d(payload.data(), payload.size()).to_buffer(check);

	auto data = payload;
	data.insert(data.end(), check, check + 4);
	return encode(data);
}

bool base58check_decode( std::vector<std::uint8_t>& payload
		       , std::string const& str
		       ) {
	auto data = std::vector<std::uint8_t>();
	if (!decode(data, str) || data.size() < 4)
		return false;

	auto body = std::vector<std::uint8_t>(data.begin(), data.end() - 4);
	std::uint8_t check[32];
	Sha256::sha256d(body.data(), body.size()).to_buffer(check);
	if (sodium_memcmp(check, &data[data.size() - 4], 4) != 0)
		return false;

	payload = std::move(body);
	return true;
}

}
