#include"Util/Bech32.hpp"
#include<algorithm>
#include<ctype.h>

namespace {

auto const charset = std::string("qpzry9x8gf2tvdw0s3jn54khce6mua7l");

std::uint32_t const bech32_const = 1;
std::uint32_t const bech32m_const = 0x2bc830a3;
std::uint64_t const blech32_const = 1;
std::uint64_t const blech32m_const = 0x455972a3350f7a1ULL;

std::uint32_t polymod(std::vector<std::uint8_t> const& v) {
	auto c = std::uint32_t(1);
	for (auto v_i : v) {
		auto c0 = std::uint8_t(c >> 25);
		c = ((c & 0x1ffffff) << 5) ^ v_i;
		if (c0 & 1) c ^= 0x3b6a57b2;
		if (c0 & 2) c ^= 0x26508e6d;
		if (c0 & 4) c ^= 0x1ea119fa;
		if (c0 & 8) c ^= 0x3d4233dd;
		if (c0 & 16) c ^= 0x2a1462b3;
	}
	return c;
}
std::uint64_t polymod64(std::vector<std::uint8_t> const& v) {
	auto c = std::uint64_t(1);
	for (auto v_i : v) {
		auto c0 = std::uint8_t(c >> 55);
		c = ((c & 0x7fffffffffffffULL) << 5) ^ v_i;
		if (c0 & 1) c ^= 0x7d52fba40bd886ULL;
		if (c0 & 2) c ^= 0x5e8dbf1a03950cULL;
		if (c0 & 4) c ^= 0x1c3a3c74072a18ULL;
		if (c0 & 8) c ^= 0x385d72fa0e5139ULL;
		if (c0 & 16) c ^= 0x7093e5a608865bULL;
	}
	return c;
}

std::vector<std::uint8_t> expand_hrp(std::string const& hrp) {
	auto rv = std::vector<std::uint8_t>();
	rv.reserve(hrp.size() * 2 + 1);
	for (auto c : hrp)
		rv.push_back(std::uint8_t(c) >> 5);
	rv.push_back(0);
	for (auto c : hrp)
		rv.push_back(std::uint8_t(c) & 31);
	return rv;
}

bool is_blech(Util::Bech32::Encoding e) {
	return e == Util::Bech32::Encoding::Blech32
	    || e == Util::Bech32::Encoding::Blech32m
	     ;
}

}

namespace Util { namespace Bech32 {

Decoded decode(std::string const& str, bool length_limit) {
	auto invalid = Decoded{Encoding::Invalid, "", {}};

	auto lower = false;
	auto upper = false;
	for (auto c : str) {
		if (c < 33 || c > 126)
			return invalid;
		if (islower((unsigned char) c))
			lower = true;
		if (isupper((unsigned char) c))
			upper = true;
	}
	if (lower && upper)
		return invalid;
	if (str.size() > 1000)
		return invalid;

	auto pos = str.rfind('1');
	if (pos == std::string::npos || pos == 0 || pos + 7 > str.size())
		return invalid;

	auto hrp = std::string(str.begin(), str.begin() + pos);
	std::transform(hrp.begin(), hrp.end(), hrp.begin(), [](char c) {
		return char(tolower((unsigned char) c));
	});

	auto values = std::vector<std::uint8_t>();
	values.reserve(str.size() - pos - 1);
	for (auto i = pos + 1; i < str.size(); ++i) {
		auto idx = charset.find(char(tolower((unsigned char) str[i])));
		if (idx == std::string::npos)
			return invalid;
		values.push_back(std::uint8_t(idx));
	}

	auto check = expand_hrp(hrp);
	check.insert(check.end(), values.begin(), values.end());

	auto encoding = Encoding::Invalid;
	auto short_mod = polymod(check);
	if (short_mod == bech32_const)
		encoding = Encoding::Bech32;
	else if (short_mod == bech32m_const)
		encoding = Encoding::Bech32m;
	else if (values.size() >= 12) {
		auto long_mod = polymod64(check);
		if (long_mod == blech32_const)
			encoding = Encoding::Blech32;
		else if (long_mod == blech32m_const)
			encoding = Encoding::Blech32m;
	}
	if (encoding == Encoding::Invalid)
		return invalid;
	/* Plain bech32 keeps the BIP-173 length limit.  */
	if (length_limit && !is_blech(encoding) && str.size() > 90)
		return invalid;

	auto checksum_len = is_blech(encoding) ? 12 : 6;
	values.resize(values.size() - checksum_len);
	return Decoded{encoding, std::move(hrp), std::move(values)};
}

std::string encode( Encoding encoding
		  , std::string const& hrp
		  , std::vector<std::uint8_t> const& values
		  ) {
	auto checksum_len = is_blech(encoding) ? 12 : 6;

	auto check = expand_hrp(hrp);
	check.insert(check.end(), values.begin(), values.end());
	check.resize(check.size() + checksum_len, 0);

	auto mod = std::uint64_t(0);
	switch (encoding) {
	case Encoding::Bech32:
		mod = polymod(check) ^ bech32_const;
		break;
	case Encoding::Bech32m:
		mod = polymod(check) ^ bech32m_const;
		break;
	case Encoding::Blech32:
		mod = polymod64(check) ^ blech32_const;
		break;
	case Encoding::Blech32m:
		mod = polymod64(check) ^ blech32m_const;
		break;
	case Encoding::Invalid:
		return "";
	}

	auto rv = hrp + "1";
	for (auto v : values)
		rv.push_back(charset[v]);
	for (auto i = 0; i < checksum_len; ++i)
		rv.push_back(charset[(mod >> (5 * (checksum_len - 1 - i))) & 31]);
	return rv;
}

bool convert_bits( std::vector<std::uint8_t>& out
		 , std::vector<std::uint8_t> const& in
		 , int frombits, int tobits
		 , bool pad
		 ) {
	auto acc = std::uint32_t(0);
	auto bits = 0;
	auto const maxv = (std::uint32_t(1) << tobits) - 1;
	auto const max_acc = (std::uint32_t(1) << (frombits + tobits - 1)) - 1;
	for (auto value : in) {
		if ((value >> frombits) != 0)
			return false;
		acc = ((acc << frombits) | value) & max_acc;
		bits += frombits;
		while (bits >= tobits) {
			bits -= tobits;
			out.push_back(std::uint8_t((acc >> bits) & maxv));
		}
	}
	if (pad) {
		if (bits)
			out.push_back(std::uint8_t((acc << (tobits - bits)) & maxv));
	} else if (bits >= frombits || ((acc << (tobits - bits)) & maxv)) {
		return false;
	}
	return true;
}

}}
