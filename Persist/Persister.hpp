#ifndef PERSIST_PERSISTER_HPP
#define PERSIST_PERSISTER_HPP

#include"Persist/ReservedAddress.hpp"
#include"Persist/SwapRecord.hpp"
#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<memory>
#include<stdexcept>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Sqlite3 { class Db; }

namespace Persist {

/** class Persist::PersistError
 *
 * @brief thrown when the store cannot be read
 * or written.
 */
class PersistError : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	PersistError(std::string const& e)
		: Util::BacktraceException<std::runtime_error>(e) { }
};

/** class Persist::Persister
 *
 * @brief the persistent store of derivation
 * indices, reserved addresses and swap records.
 *
 * @desc Each operation runs in its own database
 * transaction, so each is atomic, and concurrent
 * operations are serialized by the database.
 * Tables are created on first use.
 * Every failure is thrown as `Persist::PersistError`.
 */
class Persister {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Persister() =delete;
	Persister(Persister const&) =delete;
	Persister(Persister&&);
	~Persister();

	explicit
	Persister(Sqlite3::Db db);

	/* nullptr when never set.  */
	Ev::Io<std::unique_ptr<std::uint32_t>>
	get_last_derivation_index();
	Ev::Io<void> set_last_derivation_index(std::uint32_t index);

	Ev::Io<std::unique_ptr<std::uint32_t>>
	get_last_scanned_derivation_index();
	Ev::Io<void> set_last_scanned_derivation_index(std::uint32_t index);

	/** Persist::Persister::next_derivation_index
	 *
	 * @brief atomically advances the last derivation
	 * index by one and returns the new value.
	 *
	 * @desc Returns nullptr, leaving the store
	 * unchanged, when no index was ever stored.
	 */
	Ev::Io<std::unique_ptr<std::uint32_t>>
	next_derivation_index();

	/* Replaces any reservation of the same address
	 * or the same derivation index.  */
	Ev::Io<void>
	insert_or_update_reserved_address(ReservedAddress const& r);
	Ev::Io<void>
	delete_reserved_address(std::string const& address);
	Ev::Io<std::vector<ReservedAddress>>
	list_reserved_addresses();

	/** Persist::Persister::next_expired_reserved_address
	 *
	 * @brief removes and returns the reservation that
	 * expired earliest, if its expiry is at or below
	 * the given tip.
	 * Returns nullptr if none has expired.
	 */
	Ev::Io<std::unique_ptr<ReservedAddress>>
	next_expired_reserved_address(std::uint32_t tip);

	/* nullptr if no swap has the id.  */
	Ev::Io<std::unique_ptr<SwapRecord>>
	load_swap(std::string const& id);
	/* Insert, or atomically replace the record of the
	 * same id.  Terminal records are archived.  */
	Ev::Io<void> save_swap(SwapRecord const& swap);
	/* All swaps, archived included, oldest first.  */
	Ev::Io<std::vector<SwapRecord>> list_swaps();
	/* Swaps not yet archived, oldest first.  */
	Ev::Io<std::vector<SwapRecord>> list_ongoing_swaps();

	/* Copy the whole store into the file.  */
	Ev::Io<void> backup(std::string const& path);
	/* Replace the whole store with the file.  */
	Ev::Io<void> restore(std::string const& path);
};

}

#endif /* !defined(PERSIST_PERSISTER_HPP) */
