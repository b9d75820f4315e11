#ifndef SQLITE3_QUERY_HPP
#define SQLITE3_QUERY_HPP

#include"Sqlite3/Detail/binds.hpp"
#include<cstddef>
#include<memory>
#include<string>

namespace Sqlite3 { class Db; }
namespace Sqlite3 { class Result; }
namespace Sqlite3 { class Tx; }

namespace Sqlite3 {

/** class Sqlite3::Query
 *
 * @brief A prepared statement created by Sqlite3::Tx::query.
 * Bind the named parameters (":name", "@name" or "$name"),
 * then either `execute` it to iterate over rows, or `run`
 * it to learn how many rows an INSERT, UPDATE or DELETE
 * touched.
 * A query is single-use.
 */
class Query {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	friend class Sqlite3::Tx;
	Query(Sqlite3::Db const&, void*);

	void* get_stmt() const;
	int get_location(char const*) const;

public:
	Query() =delete;
	Query(Query&&);
	~Query();

	template<typename a>
	Query& bind(char const* field, a value) {
		Detail::Bind<a>::bind( get_stmt(), get_location(field)
				     , std::move(value)
				     );
		return *this;
	}
	template<typename a>
	Query& bind(std::string const& field, a value) {
		return bind<a>(field.c_str(), std::move(value));
	}
	/* An absent optional binds as NULL.  */
	template<typename a>
	Query& bind(char const* field, std::unique_ptr<a> const& value) {
		if (!value)
			return bind(field, nullptr);
		return bind<a>(field, *value);
	}
	template<typename a>
	Query& bind(std::string const& field, std::unique_ptr<a> const& value) {
		return bind(field.c_str(), value);
	}

	/** Sqlite3::Query::execute
	 *
	 * @brief steps the statement and returns the rows
	 * it yields.
	 * Parameters left unbound are NULL.
	 */
	Result execute();
	/** Sqlite3::Query::run
	 *
	 * @brief steps the statement to completion and
	 * returns the number of rows it changed.
	 */
	std::size_t run();
};

}

#endif /* !defined(SQLITE3_QUERY_HPP) */
