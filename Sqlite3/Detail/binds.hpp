#ifndef SQLITE3_DETAILS_BINDS_HPP
#define SQLITE3_DETAILS_BINDS_HPP

#include<cstddef>
#include<cstdint>
#include<string>
#include<type_traits>

namespace Sqlite3 { namespace Detail {

void bind_d(void* stmt, int l, double);
void bind_i(void* stmt, int l, std::int64_t);
void bind_s(void* stmt, int l, std::string);
void bind_null(void *stmt, int l);

/* Integers (including bool) bind as INTEGER, floating
 * point as REAL.  Values of unsigned 64-bit types above
 * INT64_MAX wrap, so keep amounts and heights below that.
 */
template<typename a, typename = void>
struct Bind;

template<typename a>
struct Bind<a, typename std::enable_if<std::is_integral<a>::value>::type> {
	static void bind(void *stmt, int l, a v) {
		bind_i(stmt, l, std::int64_t(v));
	}
};
template<typename a>
struct Bind<a, typename std::enable_if<std::is_floating_point<a>::value>::type> {
	static void bind(void *stmt, int l, a v) {
		bind_d(stmt, l, double(v));
	}
};

template<>
struct Bind<char const*> {
	static void bind(void *stmt, int l, char const* v) {
		bind_s(stmt, l, v);
	}
};
template<>
struct Bind<std::string> {
	static void bind(void *stmt, int l, std::string v) {
		bind_s(stmt, l, std::move(v));
	}
};

template<>
struct Bind<std::nullptr_t> {
	static void bind(void *stmt, int l, std::nullptr_t) {
		bind_null(stmt, l);
	}
};

}}

#endif /* !defined(SQLITE3_DETAILS_BINDS_HPP) */
