#include"Sqlite3/Detail/binds.hpp"
#include"Util/BacktraceException.hpp"
#include<sqlite3.h>
#include<stdexcept>

namespace {

void check(int res) {
	if (res != SQLITE_OK)
		throw Util::BacktraceException<std::runtime_error>(
			std::string("Sqlite3: bind error: ") + sqlite3_errstr(res)
		);
}

}

namespace Sqlite3 { namespace Detail {

void bind_d(void* stmt, int l, double v) {
	check(sqlite3_bind_double((sqlite3_stmt*) stmt, l, v));
}
void bind_i(void* stmt, int l, std::int64_t v) {
	check(sqlite3_bind_int64((sqlite3_stmt*) stmt, l, v));
}
void bind_s(void* stmt, int l, std::string v) {
	check(sqlite3_bind_text( (sqlite3_stmt*) stmt
			       , l, v.c_str(), int(v.size())
			       , SQLITE_TRANSIENT
			       ));
}
void bind_null(void* stmt, int l) {
	check(sqlite3_bind_null((sqlite3_stmt*) stmt, l));
}

}}
