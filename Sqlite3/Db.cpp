#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"Sqlite3/Db.hpp"
#include"Sqlite3/Tx.hpp"
#include"Util/BacktraceException.hpp"
#include<queue>
#include<sqlite3.h>
#include<stdexcept>

namespace Sqlite3 {

class Db::Impl {
private:
	sqlite3* connection;

	bool busy;
	/* Queue of greenthreads blocked on exclusive access.  */
	std::queue<std::function<void()>> blocked;

	void acquire(std::function<void()> grant) {
		if (busy)
			blocked.emplace(std::move(grant));
		else {
			busy = true;
			grant();
		}
	}

	/* Copy between our connection and the given file.  */
	void copy_file(std::string const& filename, bool to_file) {
		auto other = (sqlite3*) nullptr;
		auto flags = to_file ? (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE)
				     : SQLITE_OPEN_READONLY
				     ;
		auto res = sqlite3_open_v2( filename.c_str(), &other
					  , flags, nullptr
					  );
		if (res != SQLITE_OK) {
			auto msg = other ? std::string(sqlite3_errmsg(other))
					 : std::string("Not enough memory")
					 ;
			sqlite3_close_v2(other);
			throw Util::BacktraceException<std::runtime_error>(
				"Sqlite3::Db: open " + filename + ": " + msg
			);
		}

		auto dest = to_file ? other : connection;
		auto src = to_file ? connection : other;
		auto backup = sqlite3_backup_init(dest, "main", src, "main");
		if (!backup) {
			auto msg = std::string(sqlite3_errmsg(dest));
			sqlite3_close_v2(other);
			throw Util::BacktraceException<std::runtime_error>(
				"Sqlite3::Db: sqlite3_backup_init: " + msg
			);
		}
		auto step = sqlite3_backup_step(backup, -1);
		auto finish = sqlite3_backup_finish(backup);
		if (step != SQLITE_DONE || finish != SQLITE_OK) {
			auto msg = std::string(sqlite3_errstr(
				step != SQLITE_DONE ? step : finish
			));
			sqlite3_close_v2(other);
			throw Util::BacktraceException<std::runtime_error>(
				"Sqlite3::Db: sqlite3_backup_step: " + msg
			);
		}
		sqlite3_close_v2(other);
	}

public:
	explicit
	Impl(std::string const& filename) : connection(nullptr), busy(false) {
		auto res = sqlite3_open(filename.c_str(), &connection);
		if (res != SQLITE_OK) {
			auto msg = connection ? std::string(sqlite3_errmsg(connection))
					      : std::string("Not enough memory")
					      ;
			sqlite3_close_v2(connection);
			connection = nullptr;
			throw Util::BacktraceException<std::runtime_error>(
				"Sqlite3::Db: sqlite3_open: " + msg
			);
		}
		res = sqlite3_extended_result_codes(connection, 1);
		if (res == SQLITE_OK)
			res = sqlite3_exec( connection
					  , "PRAGMA foreign_keys = ON;"
					  , NULL, NULL, NULL
					  );
		if (res != SQLITE_OK) {
			auto msg = std::string(sqlite3_errmsg(connection));
			sqlite3_close_v2(connection);
			connection = nullptr;
			throw Util::BacktraceException<std::runtime_error>(
				"Sqlite3::Db: setup: " + msg
			);
		}
	}
	~Impl() {
		if (connection)
			sqlite3_close_v2(connection);
	}

	Ev::Io<Sqlite3::Tx> transact(Db const& db) {
		auto ptx = std::make_shared<Sqlite3::Tx>();
		return Ev::Io< Sqlite3::Tx
			     >([ this, db
			       ]( std::function<void(Sqlite3::Tx)> pass
				, std::function<void(std::exception_ptr)> fail
				) {
			acquire([this, db, pass, fail]() {
				auto tx = Sqlite3::Tx();
				try {
					tx = Sqlite3::Tx(db);
				} catch (...) {
					release();
					return fail(std::current_exception());
				}
				pass(std::move(tx));
			});
		}).then([ptx](Sqlite3::Tx tx) {
			*ptx = std::move(tx);
			return Ev::yield();
		}).then([ptx]() {
			return Ev::lift(std::move(*ptx));
		});
	}
	Ev::Io<void> copy(std::string const& filename, bool to_file) {
		return Ev::Io<void>([ this, filename, to_file
				    ]( std::function<void()> pass
				     , std::function<void(std::exception_ptr)> fail
				     ) {
			acquire([this, filename, to_file, pass, fail]() {
				try {
					copy_file(filename, to_file);
				} catch (...) {
					release();
					return fail(std::current_exception());
				}
				release();
				pass();
			});
		});
	}

	void* get_connection() const { return connection; }
	void release() {
		if (!blocked.empty()) {
			auto grant = std::move(blocked.front());
			blocked.pop();
			grant();
		} else
			busy = false;
	}
};

void* Db::get_connection() const {
	return pimpl->get_connection();
}
void Db::transaction_finish() {
	pimpl->release();
}
Ev::Io<Sqlite3::Tx> Db::transact() {
	return pimpl->transact(*this);
}
Ev::Io<void> Db::backup_to(std::string const& filename) {
	return pimpl->copy(filename, true);
}
Ev::Io<void> Db::restore_from(std::string const& filename) {
	return pimpl->copy(filename, false);
}

Db::Db( std::string const& filename
      ) : pimpl(std::make_shared<Impl>(filename)) { }

}
