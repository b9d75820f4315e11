#ifndef UTIL_STR_HPP
#define UTIL_STR_HPP

/*
 * Minor string utilities.
 */

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdarg.h>
#include<stdexcept>
#include<string>
#include<vector>

namespace Util {
namespace Str {

/* Two-digit lowercase hex of the given byte.  */
std::string hexbyte(std::uint8_t);
/* Hex string of the given memory.  */
std::string hexdump(void const* p, std::size_t s);
inline
std::string hexdump(std::vector<std::uint8_t> const& v) {
	return hexdump(v.data(), v.size());
}

struct HexParseFailure : public Util::BacktraceException<std::runtime_error> {
	HexParseFailure(std::string msg)
		: Util::BacktraceException<std::runtime_error>("hexread: " + msg) { }
};
/* Creates a buffer from the given hex string.  */
std::vector<std::uint8_t> hexread(std::string const&);

/* Checks that the given string is a hex string with an
 * even number of digits.
 */
bool ishex(std::string const&);

/* Like `sprintf`.  */
std::string fmt(char const *tpl, ...)
#if defined(__GNUC__)
	__attribute__ ((format (printf, 1, 2)))
#endif
;
std::string vfmt(char const *tpl, va_list ap);

}}

#endif /* !defined(UTIL_STR_HPP) */
