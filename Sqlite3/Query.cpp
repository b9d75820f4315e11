#include"Sqlite3/Db.hpp"
#include"Sqlite3/Query.hpp"
#include"Sqlite3/Result.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/make_unique.hpp"
#include<sqlite3.h>
#include<stdexcept>

namespace Sqlite3 {

class Query::Impl {
private:
	Db db;
	sqlite3_stmt* stmt;

	sqlite3_stmt* take() {
		if (!stmt)
			throw Util::BacktraceException<std::logic_error>(
				"Sqlite3::Query: already executed"
			);
		auto rv = stmt;
		stmt = nullptr;
		return rv;
	}

public:
	Impl( Db const& db_
	    , void* stmt_
	    ) : db(db_)
	      , stmt((sqlite3_stmt*) stmt_)
	      { }
	~Impl() {
		if (stmt)
			(void) sqlite3_finalize(stmt);
	}

	void* get_stmt() const { return stmt; }
	int get_location(char const* field) const {
		auto loc = sqlite3_bind_parameter_index(stmt, field);
		if (loc == 0)
			throw Util::BacktraceException<std::runtime_error>(
				std::string("Sqlite3::Query::bind: no field: ")
				+ field
			);
		return loc;
	}

	Result execute() {
		/* Result steps once on construction.  */
		return Result(db, take());
	}
	std::size_t run() {
		auto connection = (sqlite3*) db.get_connection();
		auto ss = take();
		auto res = int();
		do {
			res = sqlite3_step(ss);
		} while (res == SQLITE_ROW);
		if (res != SQLITE_DONE) {
			auto err = std::string(sqlite3_errmsg(connection));
			(void) sqlite3_finalize(ss);
			throw Util::BacktraceException<std::runtime_error>(
				"Sqlite3::Query::run: " + err
			);
		}
		(void) sqlite3_finalize(ss);
		return std::size_t(sqlite3_changes(connection));
	}
};

Query::Query(Sqlite3::Db const& db, void* stmt)
	: pimpl(Util::make_unique<Impl>(db, stmt)) { }
Query::Query(Query&&) =default;
Query::~Query() =default;

void* Query::get_stmt() const { return pimpl->get_stmt(); }
int Query::get_location(const char* field) const {
	return pimpl->get_location(field);
}

Result Query::execute() { return pimpl->execute(); }
std::size_t Query::run() { return pimpl->run(); }

}
