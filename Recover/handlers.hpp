#ifndef RECOVER_HANDLERS_HPP
#define RECOVER_HANDLERS_HPP

#include"Persist/SwapRecord.hpp"
#include<cstdint>

namespace Recover { struct SwapTxs; }

namespace Recover {

/* Each handler recomputes a swap record of its
 * kind from the transactions matched to it and the
 * chain tip.
 * They are pure: the same inputs always give the
 * same record, and a terminal record comes back
 * unchanged.
 * Passing a record of another kind throws
 * `std::logic_error`.
 */

/* Failure reason of a chain swap whose legs both
 * ended without both completing.  */
extern char const diverged_legs[];

/* Counterparty locks, we claim; Refundable on timeout
 * once locked, Expired if it never locked.  */
Persist::SwapRecord
resolve_receive( Persist::SwapRecord swap
	       , SwapTxs const& txs
	       , std::uint32_t tip
	       );
/* We lock, counterparty claims; Refundable on timeout.  */
Persist::SwapRecord
resolve_send( Persist::SwapRecord swap
	    , SwapTxs const& txs
	    , std::uint32_t tip
	    );
/* Bitcoin in, Liquid out.  */
Persist::SwapRecord
resolve_chain_receive( Persist::SwapRecord swap
		     , SwapTxs const& txs
		     , std::uint32_t tip
		     );
/* Liquid in, Bitcoin out.  */
Persist::SwapRecord
resolve_chain_send( Persist::SwapRecord swap
		  , SwapTxs const& txs
		  , std::uint32_t tip
		  );

/* Dispatch on the kind of the record.  */
Persist::SwapRecord
resolve( Persist::SwapRecord swap
       , SwapTxs const& txs
       , std::uint32_t tip
       );

}

#endif /* !defined(RECOVER_HANDLERS_HPP) */
