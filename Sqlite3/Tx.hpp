#ifndef SQLITE3_TX_HPP
#define SQLITE3_TX_HPP

#include<memory>
#include<string>

namespace Sqlite3 { class Db; }
namespace Sqlite3 { class Query; }

namespace Sqlite3 {

/** class Sqlite3::Tx
 *
 * @brief Represents an ongoing database transaction.
 * Writes will only be committed when the tx is
 * committed.
 *
 * @desc This object is movable but not copyable.
 * If a valid transaction is destroyed without an
 * explicit `commit()`, it is rolled back, so an
 * exception thrown midway never persists partial
 * writes.
 *
 * This has a default constructor which creates an
 * unusable, invalid transaction.
 * The proper way of constructing an `Sqlite3::Tx`
 * is by the `Sqlite3::Db::transact` function.
 */
class Tx {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	friend class Sqlite3::Db;

	explicit
	Tx(Sqlite3::Db const&);

public:
	Tx();
	Tx(Tx&&);
	~Tx();

	Tx& operator=(Tx&&);

	/* Check for validity.  */
	explicit
	operator bool() const { return !!pimpl; }
	bool operator!() const { return !pimpl; }

	Sqlite3::Query query(char const*);
	Sqlite3::Query query(std::string const&);

	/** Sqlite3::Tx::query_execute
	 *
	 * @brief Executes one or more statements with no
	 * parameters and no results, e.g. table creation.
	 */
	void query_execute(char const*);
	void query_execute(std::string const& q) {
		query_execute(q.c_str());
	}

	/* Commit and rollback.
	 * Pre-condition: the transaction is valid.
	 * Post-condition: the transaction will be invalid,
	 * unless commit throws, in which case it remains
	 * valid and is rolled back on destruction.
	 */
	void commit();
	void rollback();
};

}

#endif /* !defined(SQLITE3_TX_HPP) */
