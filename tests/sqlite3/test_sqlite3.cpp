#undef NDEBUG
#include"Sqlite3.hpp"
#include"Ev/Io.hpp"
#include"Ev/foreach.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include<assert.h>
#include<memory>
#include<stdexcept>
#include<string>
#include<unistd.h>
#include<vector>

namespace {

std::size_t count_swaps(Sqlite3::Tx& tx) {
	auto n = std::size_t(0);
	auto res = tx.query("SELECT id FROM \"swaps\";").execute();
	for (auto& r : res) {
		(void) r;
		++n;
	}
	return n;
}

}

int main() {
	auto db = Sqlite3::Db(":memory:");
	auto path = "/tmp/test_sqlite3_" + std::to_string(getpid()) + ".sqlite";
	auto order = std::string();

	/* Each writer holds its transaction across a
	 * yield; they must not overlap.  */
	auto writer = [&](char c) {
		return db.transact().then([&, c](Sqlite3::Tx tx) {
			order.push_back(c);
			auto ptx = std::make_shared<Sqlite3::Tx>(std::move(tx));
			return Ev::yield(2).then([&, c, ptx]() {
				order.push_back(c);
				ptx->query("INSERT INTO \"swaps\" VALUES(:id, :amount);")
					.bind(":id", std::string(1, c))
					.bind(":amount", 1000)
					.execute();
				ptx->commit();
				return Ev::lift();
			});
		});
	};

	auto code = Ev::lift().then([&]() {
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		assert(tx);
		tx.query_execute("CREATE TABLE \"swaps\" (id TEXT PRIMARY KEY, amount INTEGER);");
		tx.commit();
		assert(!tx);

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		tx.query("INSERT INTO \"swaps\" VALUES(:id, :amount);")
			.bind(":id", std::string("discarded"))
			.bind(":amount", 5)
			.execute();
		tx.rollback();
		assert(!tx);

		return Ev::foreach(writer, std::vector<char>{'a', 'b'})
		     + db.transact();
	}).then([&](Sqlite3::Tx tx) {
		assert(order.size() == 4);
		assert(order[0] == order[1]);
		assert(order[2] == order[3]);
		assert(count_swaps(tx) == 2);

		auto res = tx.query("SELECT amount FROM \"swaps\" WHERE id = :id;")
			.bind(":id", std::string("a"))
			.execute();
		auto found = false;
		for (auto& r : res) {
			assert(!found);
			found = true;
			assert(r.get<int>(0) == 1000);
		}
		assert(found);
		tx.commit();

		return db.backup_to(path);
	}).then([&]() {
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		tx.query_execute("DELETE FROM \"swaps\";");
		assert(count_swaps(tx) == 0);
		tx.commit();

		return db.restore_from(path) + db.transact();
	}).then([&](Sqlite3::Tx tx) {
		assert(count_swaps(tx) == 2);

		/* run reports changed rows.  */
		auto changed = tx.query("UPDATE \"swaps\" SET amount = 7;").run();
		assert(changed == 2);
		changed = tx.query("DELETE FROM \"swaps\" WHERE id = :id;")
			.bind(":id", std::string("nobody"))
			.run();
		assert(changed == 0);

		/* An absent optional binds NULL.  */
		auto none = std::unique_ptr<int>();
		auto some = std::unique_ptr<int>(new int(42));
		tx.query("INSERT INTO \"swaps\" VALUES(:id, :amount);")
			.bind(":id", std::string("null"))
			.bind(":amount", none)
			.run();
		tx.query("INSERT INTO \"swaps\" VALUES(:id, :amount);")
			.bind(":id", std::string("some"))
			.bind(":amount", some)
			.run();
		auto res = tx.query("SELECT id, amount FROM \"swaps\" WHERE id IN ('null', 'some') ORDER BY id;")
			.execute();
		auto n = 0;
		for (auto& r : res) {
			if (n == 0) {
				assert(r.get<std::string>(0) == "null");
				assert(r.is_null(1));
			} else {
				assert(r.get<std::string>(0) == "some");
				assert(!r.is_null(1));
				assert(r.get<int>(1) == 42);
			}
			++n;
		}
		assert(n == 2);

		auto amount = tx.query("SELECT amount FROM \"swaps\" WHERE id = 'some';")
			.execute()
			.first<int>();
		assert(amount && *amount == 42);
		amount = tx.query("SELECT amount FROM \"swaps\" WHERE id = 'null';")
			.execute()
			.first<int>();
		assert(!amount);
		amount = tx.query("SELECT amount FROM \"swaps\" WHERE id = 'nobody';")
			.execute()
			.first<int>();
		assert(!amount);
		tx.rollback();

		return db.restore_from("/nonexistent/dir/db.sqlite").then([]() {
			return Ev::lift(false);
		}).catching<std::runtime_error>([](std::runtime_error const&) {
			return Ev::lift(true);
		});
	}).then([&](bool failed) {
		assert(failed);
		unlink(path.c_str());
		return Ev::lift(0);
	});

	return Ev::start(code);
}
