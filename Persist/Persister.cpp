#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"Persist/Persister.hpp"
#include"Sqlite3.hpp"
#include"Util/make_unique.hpp"
#include<functional>

namespace {

auto const last_derivation_index = std::string("last_derivation_index");
auto const last_scanned_derivation_index = std::string("last_scanned_derivation_index");

char const swap_columns[] = R"QRY(
	  id, kind, created_at, amount_sat, fees_sat, max_fees_sat
	, invoice, state, failure_reason
	, u_lockup_script, u_claim_script, u_refund_script
	, u_lockup_tx_id, u_claim_tx_id, u_refund_tx_id
	, u_timeout_height, u_state
	, s_lockup_script, s_claim_script, s_refund_script
	, s_lockup_tx_id, s_claim_tx_id, s_refund_tx_id
	, s_timeout_height, s_state
)QRY";

/* Commit after running the body, passing on its result.  */
template<typename a>
struct Commit {
	static
	Ev::Io<a> run( Sqlite3::Tx& tx
		     , std::function<a(Sqlite3::Tx&)> const& f
		     ) {
		auto rv = f(tx);
		tx.commit();
		return Ev::lift(std::move(rv));
	}
};
template<>
struct Commit<void> {
	static
	Ev::Io<void> run( Sqlite3::Tx& tx
			, std::function<void(Sqlite3::Tx&)> const& f
			) {
		f(tx);
		tx.commit();
		return Ev::lift();
	}
};

std::unique_ptr<std::uint32_t>
get_cached(Sqlite3::Tx& tx, std::string const& key) {
	return tx.query(R"QRY(
	SELECT value FROM "Persist_cached_items"
	 WHERE key = :key;
	)QRY")
		.bind(":key", key)
		.execute()
		.first<std::uint32_t>()
		;
}
void set_cached( Sqlite3::Tx& tx
	       , std::string const& key
	       , std::uint32_t value
	       ) {
	tx.query(R"QRY(
	INSERT OR REPLACE INTO "Persist_cached_items"
	VALUES(:key, :value);
	)QRY")
		.bind(":key", key)
		.bind(":value", value)
		.execute()
		;
}

/* Transactions not yet known are stored as NULL.  */
std::unique_ptr<std::string> txid_or_null(std::string const& txid) {
	if (txid.empty())
		return nullptr;
	return Util::make_unique<std::string>(txid);
}
std::string read_txid(Sqlite3::Row& r, int c) {
	auto txid = r.get_optional<std::string>(c);
	return txid ? *txid : std::string();
}

void bind_leg( Sqlite3::Query& q
	     , std::string const& p
	     , Persist::SwapLeg const& leg
	     ) {
	q.bind(p + "lockup_script", leg.lockup_script)
	 .bind(p + "claim_script", leg.claim_script)
	 .bind(p + "refund_script", leg.refund_script)
	 .bind(p + "lockup_tx_id", txid_or_null(leg.lockup_tx_id))
	 .bind(p + "claim_tx_id", txid_or_null(leg.claim_tx_id))
	 .bind(p + "refund_tx_id", txid_or_null(leg.refund_tx_id))
	 .bind(p + "timeout_height", leg.timeout_height)
	 .bind(p + "state", int(leg.state))
	 ;
}

Persist::SwapState to_state(int s) {
	if (s < int(Persist::SwapState::Created)
	 || s > int(Persist::SwapState::Failed))
		throw Persist::PersistError(
			"Unknown swap state " + std::to_string(s)
		);
	return Persist::SwapState(s);
}

Persist::SwapLeg read_leg(Sqlite3::Row& r, int c) {
	auto leg = Persist::SwapLeg();
	leg.lockup_script = r.get<std::string>(c + 0);
	leg.claim_script = r.get<std::string>(c + 1);
	leg.refund_script = r.get<std::string>(c + 2);
	leg.lockup_tx_id = read_txid(r, c + 3);
	leg.claim_tx_id = read_txid(r, c + 4);
	leg.refund_tx_id = read_txid(r, c + 5);
	leg.timeout_height = r.get<std::uint32_t>(c + 6);
	leg.state = to_state(r.get<int>(c + 7));
	return leg;
}

Persist::SwapRecord read_swap(Sqlite3::Row& r) {
	auto swap = Persist::SwapRecord();
	swap.id = r.get<std::string>(0);
	auto kind = r.get<int>(1);
	if (kind < int(Persist::SwapKind::Receive)
	 || kind > int(Persist::SwapKind::ChainSend))
		throw Persist::PersistError(
			"Unknown swap kind " + std::to_string(kind)
		);
	swap.kind = Persist::SwapKind(kind);
	swap.created_at = r.get<std::uint32_t>(2);
	swap.amount_sat = r.get<std::uint64_t>(3);
	swap.fees_sat = r.get<std::uint64_t>(4);
	swap.max_fees_sat = r.get<std::uint64_t>(5);
	swap.invoice = r.get<std::string>(6);
	swap.state = to_state(r.get<int>(7));
	swap.failure_reason = r.get<std::string>(8);
	swap.user_leg = read_leg(r, 9);
	swap.server_leg = read_leg(r, 17);
	return swap;
}

std::vector<Persist::SwapRecord>
select_swaps(Sqlite3::Tx& tx, std::string const& where) {
	auto res = tx.query( std::string("SELECT ") + swap_columns
			   + " FROM \"Persist_swaps\" " + where
			   + " ORDER BY created_at, id;"
			   ).execute();
	auto rv = std::vector<Persist::SwapRecord>();
	for (auto& r : res)
		rv.push_back(read_swap(r));
	return rv;
}

}

namespace Persist {

class Persister::Impl {
private:
	Sqlite3::Db db;

	/* nullptr if we are currently initializing,
	 * pointer to false if currently uninitialized,
	 * pointer to true if already initialized.  */
	std::unique_ptr<bool> initted_flag;

	Ev::Io<void> try_initialize() {
		return Ev::yield().then([this]() {
			if (!initted_flag)
				return Ev::yield().then([this]() {
					return try_initialize();
				});
			if (*initted_flag)
				return Ev::lift();
			initted_flag = nullptr;
			return do_initialize();
		});
	}
	Ev::Io<void> do_initialize() {
		return db.transact().then([this](Sqlite3::Tx tx) {
			tx.query_execute(R"QRY(
			CREATE TABLE IF NOT EXISTS "Persist_cached_items"
			     ( key TEXT PRIMARY KEY
			     , value INTEGER NOT NULL
			     );
			CREATE TABLE IF NOT EXISTS "Persist_reserved_addresses"
			     ( address TEXT PRIMARY KEY
			     , derivation_index INTEGER NOT NULL UNIQUE
			     , expiry_block_height INTEGER NOT NULL
			     );
			CREATE TABLE IF NOT EXISTS "Persist_swaps"
			     ( id TEXT PRIMARY KEY
			     -- Persist::SwapKind.
			     , kind INTEGER NOT NULL
			     , created_at INTEGER NOT NULL
			     , amount_sat INTEGER NOT NULL
			     , fees_sat INTEGER NOT NULL
			     , max_fees_sat INTEGER NOT NULL
			     , invoice TEXT NOT NULL
			     -- Persist::SwapState.
			     , state INTEGER NOT NULL
			     , failure_reason TEXT NOT NULL
			     -- 1 once the state is terminal.
			     , archived INTEGER NOT NULL

			     -- user leg: funds the user locks.
			     , u_lockup_script TEXT NOT NULL
			     , u_claim_script TEXT NOT NULL
			     , u_refund_script TEXT NOT NULL
			     , u_lockup_tx_id TEXT
			     , u_claim_tx_id TEXT
			     , u_refund_tx_id TEXT
			     , u_timeout_height INTEGER NOT NULL
			     , u_state INTEGER NOT NULL

			     -- server leg: funds the counterparty locks.
			     , s_lockup_script TEXT NOT NULL
			     , s_claim_script TEXT NOT NULL
			     , s_refund_script TEXT NOT NULL
			     , s_lockup_tx_id TEXT
			     , s_claim_tx_id TEXT
			     , s_refund_tx_id TEXT
			     , s_timeout_height INTEGER NOT NULL
			     , s_state INTEGER NOT NULL
			     );
			CREATE INDEX IF NOT EXISTS "Persist_swaps_archived_idx"
			    ON "Persist_swaps"(archived);
			)QRY");
			tx.commit();
			initted_flag = Util::make_unique<bool>(true);
			return Ev::lift();
		}).catching<std::runtime_error>([this](std::runtime_error const& e) -> Ev::Io<void> {
			/* Let the next caller try again.  */
			initted_flag = Util::make_unique<bool>(false);
			throw PersistError(
				std::string("Persister: initialize: ") + e.what()
			);
		});
	}

public:
	explicit
	Impl(Sqlite3::Db db_) : db(std::move(db_))
			      , initted_flag(Util::make_unique<bool>(false))
			      { }

	/* Run the body in a transaction and commit.  */
	template<typename a>
	Ev::Io<a> transact( char const* what
			  , std::function<a(Sqlite3::Tx&)> body
			  ) {
		return try_initialize().then([this]() {
			return db.transact();
		}).then([body](Sqlite3::Tx tx) {
			return Commit<a>::run(tx, body);
		}).template catching<std::runtime_error>([what](std::runtime_error const& e) -> Ev::Io<a> {
			if (dynamic_cast<PersistError const*>(&e))
				throw PersistError(e.what());
			throw PersistError(
				std::string("Persister: ") + what + ": " + e.what()
			);
		});
	}

	Ev::Io<void> wrap(char const* what, Ev::Io<void> action) {
		return try_initialize().then([action]() {
			return action;
		}).catching<std::runtime_error>([what](std::runtime_error const& e) -> Ev::Io<void> {
			throw PersistError(
				std::string("Persister: ") + what + ": " + e.what()
			);
		});
	}

	Sqlite3::Db& get_db() { return db; }
};

Persister::Persister(Persister&&) =default;
Persister::~Persister() =default;

Persister::Persister(Sqlite3::Db db)
	: pimpl(Util::make_unique<Impl>(std::move(db))) { }

Ev::Io<std::unique_ptr<std::uint32_t>>
Persister::get_last_derivation_index() {
	return pimpl->transact<std::unique_ptr<std::uint32_t>>(
		"get_last_derivation_index"
	, [](Sqlite3::Tx& tx) {
		return get_cached(tx, last_derivation_index);
	});
}
Ev::Io<void> Persister::set_last_derivation_index(std::uint32_t index) {
	return pimpl->transact<void>(
		"set_last_derivation_index"
	, [index](Sqlite3::Tx& tx) {
		set_cached(tx, last_derivation_index, index);
	});
}

Ev::Io<std::unique_ptr<std::uint32_t>>
Persister::get_last_scanned_derivation_index() {
	return pimpl->transact<std::unique_ptr<std::uint32_t>>(
		"get_last_scanned_derivation_index"
	, [](Sqlite3::Tx& tx) {
		return get_cached(tx, last_scanned_derivation_index);
	});
}
Ev::Io<void>
Persister::set_last_scanned_derivation_index(std::uint32_t index) {
	return pimpl->transact<void>(
		"set_last_scanned_derivation_index"
	, [index](Sqlite3::Tx& tx) {
		set_cached(tx, last_scanned_derivation_index, index);
	});
}

Ev::Io<std::unique_ptr<std::uint32_t>>
Persister::next_derivation_index() {
	return pimpl->transact<std::unique_ptr<std::uint32_t>>(
		"next_derivation_index"
	, [](Sqlite3::Tx& tx) -> std::unique_ptr<std::uint32_t> {
		auto last = get_cached(tx, last_derivation_index);
		if (!last)
			return last;
		auto next = *last + 1;
		set_cached(tx, last_derivation_index, next);
		return Util::make_unique<std::uint32_t>(next);
	});
}

Ev::Io<void>
Persister::insert_or_update_reserved_address(ReservedAddress const& r) {
	return pimpl->transact<void>(
		"insert_or_update_reserved_address"
	, [r](Sqlite3::Tx& tx) {
		tx.query(R"QRY(
		INSERT OR REPLACE INTO "Persist_reserved_addresses"
		VALUES(:address, :derivation_index, :expiry_block_height);
		)QRY")
			.bind(":address", r.address)
			.bind(":derivation_index", r.derivation_index)
			.bind(":expiry_block_height", r.expiry_block_height)
			.execute()
			;
	});
}
Ev::Io<void>
Persister::delete_reserved_address(std::string const& address) {
	return pimpl->transact<void>(
		"delete_reserved_address"
	, [address](Sqlite3::Tx& tx) {
		tx.query(R"QRY(
		DELETE FROM "Persist_reserved_addresses"
		 WHERE address = :address;
		)QRY")
			.bind(":address", address)
			.execute()
			;
	});
}
Ev::Io<std::vector<ReservedAddress>>
Persister::list_reserved_addresses() {
	return pimpl->transact<std::vector<ReservedAddress>>(
		"list_reserved_addresses"
	, [](Sqlite3::Tx& tx) {
		auto res = tx.query(R"QRY(
		SELECT address, derivation_index, expiry_block_height
		  FROM "Persist_reserved_addresses"
		 ORDER BY derivation_index;
		)QRY").execute();
		auto rv = std::vector<ReservedAddress>();
		for (auto& r : res)
			rv.push_back(ReservedAddress{ r.get<std::string>(0)
						    , r.get<std::uint32_t>(1)
						    , r.get<std::uint32_t>(2)
						    });
		return rv;
	});
}

Ev::Io<std::unique_ptr<ReservedAddress>>
Persister::next_expired_reserved_address(std::uint32_t tip) {
	return pimpl->transact<std::unique_ptr<ReservedAddress>>(
		"next_expired_reserved_address"
	, [tip](Sqlite3::Tx& tx) {
		auto res = tx.query(R"QRY(
		SELECT address, derivation_index, expiry_block_height
		  FROM "Persist_reserved_addresses"
		 WHERE expiry_block_height <= :tip
		 ORDER BY expiry_block_height, derivation_index
		 LIMIT 1;
		)QRY")
			.bind(":tip", tip)
			.execute()
			;
		auto rv = std::unique_ptr<ReservedAddress>();
		for (auto& r : res)
			rv = Util::make_unique<ReservedAddress>(ReservedAddress{
				r.get<std::string>(0),
				r.get<std::uint32_t>(1),
				r.get<std::uint32_t>(2)
			});
		if (!rv)
			return rv;
		auto changed = tx.query(R"QRY(
		DELETE FROM "Persist_reserved_addresses"
		 WHERE address = :address;
		)QRY")
			.bind(":address", rv->address)
			.run()
			;
		if (changed != 1)
			throw Persist::PersistError(
				"next_expired_reserved_address: lost " + rv->address
			);
		return rv;
	});
}

Ev::Io<std::unique_ptr<SwapRecord>>
Persister::load_swap(std::string const& id) {
	return pimpl->transact<std::unique_ptr<SwapRecord>>(
		"load_swap"
	, [id](Sqlite3::Tx& tx) {
		auto res = tx.query( std::string("SELECT ") + swap_columns
				   + " FROM \"Persist_swaps\" WHERE id = :id;"
				   )
			.bind(":id", id)
			.execute()
			;
		auto rv = std::unique_ptr<SwapRecord>();
		for (auto& r : res)
			rv = Util::make_unique<SwapRecord>(read_swap(r));
		return rv;
	});
}

Ev::Io<void> Persister::save_swap(SwapRecord const& swap) {
	return pimpl->transact<void>(
		"save_swap"
	, [swap](Sqlite3::Tx& tx) {
		auto q = tx.query(R"QRY(
		INSERT OR REPLACE INTO "Persist_swaps"
		VALUES( :id, :kind, :created_at, :amount_sat, :fees_sat
		      , :max_fees_sat, :invoice, :state, :failure_reason
		      , :archived
		      , :u_lockup_script, :u_claim_script, :u_refund_script
		      , :u_lockup_tx_id, :u_claim_tx_id, :u_refund_tx_id
		      , :u_timeout_height, :u_state
		      , :s_lockup_script, :s_claim_script, :s_refund_script
		      , :s_lockup_tx_id, :s_claim_tx_id, :s_refund_tx_id
		      , :s_timeout_height, :s_state
		      );
		)QRY");
		q.bind(":id", swap.id)
		 .bind(":kind", int(swap.kind))
		 .bind(":created_at", swap.created_at)
		 .bind(":amount_sat", swap.amount_sat)
		 .bind(":fees_sat", swap.fees_sat)
		 .bind(":max_fees_sat", swap.max_fees_sat)
		 .bind(":invoice", swap.invoice)
		 .bind(":state", int(swap.state))
		 .bind(":failure_reason", swap.failure_reason)
		 .bind(":archived", is_terminal(swap.state) ? 1 : 0)
		 ;
		bind_leg(q, ":u_", swap.user_leg);
		bind_leg(q, ":s_", swap.server_leg);
		q.execute();
	});
}

Ev::Io<std::vector<SwapRecord>> Persister::list_swaps() {
	return pimpl->transact<std::vector<SwapRecord>>(
		"list_swaps"
	, [](Sqlite3::Tx& tx) {
		return select_swaps(tx, "");
	});
}
Ev::Io<std::vector<SwapRecord>> Persister::list_ongoing_swaps() {
	return pimpl->transact<std::vector<SwapRecord>>(
		"list_ongoing_swaps"
	, [](Sqlite3::Tx& tx) {
		return select_swaps(tx, "WHERE archived = 0");
	});
}

Ev::Io<void> Persister::backup(std::string const& path) {
	return pimpl->wrap("backup", pimpl->get_db().backup_to(path));
}
Ev::Io<void> Persister::restore(std::string const& path) {
	return pimpl->wrap("restore", pimpl->get_db().restore_from(path));
}

}
