#include"Util/Str.hpp"
#include"Util/make_unique.hpp"
#include<algorithm>
#include<cctype>
#include<memory>
#include<stdio.h>

namespace {

char const hexdigits[] = "0123456789abcdef";

std::uint8_t parse_hex(char c) {
	if (('0' <= c) && (c <= '9'))
		return std::uint8_t(c - '0');
	if (('a' <= c) && (c <= 'f'))
		return std::uint8_t(c - 'a' + 10);
	if (('A' <= c) && (c <= 'F'))
		return std::uint8_t(c - 'A' + 10);
	throw Util::Str::HexParseFailure(
		std::string("Non-hex character: ") + c
	);
}

}

namespace Util {
namespace Str {

std::string hexbyte(std::uint8_t v) {
	auto rv = std::string(2, '0');
	rv[0] = hexdigits[v >> 4];
	rv[1] = hexdigits[v & 0xF];
	return rv;
}

std::string hexdump(void const* vp, std::size_t s) {
	auto p = (std::uint8_t const*) vp;
	auto rv = std::string();
	rv.reserve(s * 2);
	for (auto i = std::size_t(0); i < s; ++i) {
		rv.push_back(hexdigits[p[i] >> 4]);
		rv.push_back(hexdigits[p[i] & 0xF]);
	}
	return rv;
}

std::vector<std::uint8_t> hexread(std::string const& s) {
	if ((s.length() % 2) != 0)
		throw HexParseFailure("String length must be even.");

	auto buf = std::vector<std::uint8_t>(s.length() / 2);
	for (auto i = std::size_t(0); i < buf.size(); ++i)
		buf[i] = (parse_hex(s[i * 2]) << 4)
		       | parse_hex(s[i * 2 + 1])
		       ;
	return buf;
}

bool ishex(std::string const& s) {
	if ((s.size() % 2) != 0)
		return false;
	return std::all_of(s.begin(), s.end(), [](char c) {
		return isxdigit((unsigned char) c) != 0;
	});
}

std::string vfmt(char const* tpl, va_list ap_orig) {
	va_list ap;

	auto written = std::size_t(0);
	auto size = std::size_t(64);
	auto buf = std::unique_ptr<char[]>();
	do {
		if (size <= written)
			size = written + 1;
		buf = Util::make_unique<char[]>(size);
		va_copy(ap, ap_orig);
		written = std::size_t(vsnprintf(buf.get(), size, tpl, ap));
		va_end(ap);
	} while (size <= written);

	return std::string(buf.get());
}
std::string fmt(char const* tpl, ...) {
	va_list ap;
	va_start(ap, tpl);
	auto rv = vfmt(tpl, ap);
	va_end(ap);
	return rv;
}

}
}
