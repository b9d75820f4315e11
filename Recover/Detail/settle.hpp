#ifndef RECOVER_DETAIL_SETTLE_HPP
#define RECOVER_DETAIL_SETTLE_HPP

#include"Persist/SwapRecord.hpp"

namespace Recover { namespace Detail {

/* Throw std::logic_error unless the record has
 * the expected kind.  */
void check_kind( Persist::SwapRecord const& swap
	       , Persist::SwapKind expected
	       );

/* Set the visible state.  When Failed, the reason
 * is an ambiguous leg if either leg failed, else
 * diverged legs.  */
Persist::SwapRecord settle( Persist::SwapRecord swap
			  , Persist::SwapState state
			  );

/** Recover::Detail::combine_legs
 *
 * @brief the visible state of a chain swap from the
 * states of its two legs.
 *
 * @desc The swap only completes once both legs
 * have; a refund of the user leg wins over any
 * progress on the server leg.  Any other pair of
 * terminal legs is Failed, so the swap is archived.
 */
Persist::SwapState combine_legs( Persist::SwapState user
			       , Persist::SwapState server
			       );

}}

#endif /* !defined(RECOVER_DETAIL_SETTLE_HPP) */
