#ifndef SQLITE3_RESULT_HPP
#define SQLITE3_RESULT_HPP

#include"Sqlite3/Db.hpp"
#include"Sqlite3/Detail/columns.hpp"
#include"Util/make_unique.hpp"
#include<cstddef>
#include<iterator>
#include<memory>

namespace Sqlite3 { class Query; }
namespace Sqlite3 { class Result; }

namespace Sqlite3 {

/** class Sqlite3::Row
 *
 * @brief the current row of a `Sqlite3::Result`.
 * Only valid until the result advances.
 */
class Row {
private:
	Result* r;

	friend class Sqlite3::Result;
	explicit
	Row(Result* r_) : r(r_) { }

public:
	Row(Row const&) =delete;

	template<typename a>
	a get(int c);
	/* nullptr if the column is SQL NULL.  */
	template<typename a>
	std::unique_ptr<a> get_optional(int c) {
		if (is_null(c))
			return nullptr;
		return Util::make_unique<a>(get<a>(c));
	}
	bool is_null(int c);
};

/** class Sqlite3::Result
 *
 * @brief the rows produced by `Sqlite3::Query::execute`.
 *
 * @desc A result is a single-pass input range:
 * `for (auto& r : res)` visits each row once, and a
 * second traversal sees nothing.
 * Use `first` when at most one row is expected.
 */
class Result {
private:
	Sqlite3::Db db;
	/* nullptr once all rows were consumed.  */
	void* stmt;

	friend class Sqlite3::Query;
	friend class Sqlite3::Row;

	Result(Sqlite3::Db const& db_, void* stmt_);

	bool advance();

public:
	Result() =delete;
	Result(Result const&) =delete;
	Result(Result&&);
	~Result();

	class iterator {
	private:
		Row row;

		friend class Sqlite3::Result;
		explicit
		iterator(Result* r) : row(r && r->stmt ? r : nullptr) { }

	public:
		typedef std::input_iterator_tag iterator_category;
		typedef Row value_type;
		typedef Row& reference;
		typedef Row* pointer;
		typedef std::ptrdiff_t difference_type;

		iterator() : row(nullptr) { }
		iterator(iterator const& o) : row(o.row.r) { }

		bool operator==(iterator const& o) const {
			return row.r == o.row.r;
		}
		bool operator!=(iterator const& o) const {
			return !(*this == o);
		}
		iterator& operator++() {
			if (row.r && !row.r->advance())
				row.r = nullptr;
			return *this;
		}
		Row& operator*() { return row; }
	};
	iterator begin() { return iterator(this); }
	iterator end() { return iterator(); }

	/** Sqlite3::Result::first
	 *
	 * @brief the column `c` of the first row, or
	 * nullptr if there are no rows or it is NULL.
	 * Remaining rows are discarded.
	 */
	template<typename a>
	std::unique_ptr<a> first(int c = 0) {
		auto rv = std::unique_ptr<a>();
		for (auto& r : *this) {
			rv = r.get_optional<a>(c);
			break;
		}
		return rv;
	}
};

template<typename a>
a Row::get(int c) {
	return Detail::Column<a>::column(r->stmt, c);
}
inline
bool Row::is_null(int c) {
	return Detail::column_is_null(r->stmt, c);
}

}

#endif /* !defined(SQLITE3_RESULT_HPP) */
