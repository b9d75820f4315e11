#include"Recover/Detail/settle.hpp"
#include"Recover/handlers.hpp"
#include"Recover/resolve_leg.hpp"
#include<stdexcept>
#include<string>

namespace Recover {

char const diverged_legs[] = "diverged-legs";

namespace Detail {

void check_kind( Persist::SwapRecord const& swap
	       , Persist::SwapKind expected
	       ) {
	if (swap.kind == expected)
		return;
	throw std::logic_error(
		std::string("Swap ") + swap.id + " is "
		+ Persist::swap_kind_name(swap.kind) + ", not "
		+ Persist::swap_kind_name(expected)
	);
}

Persist::SwapRecord settle( Persist::SwapRecord swap
			  , Persist::SwapState state
			  ) {
	using Persist::SwapState;
	swap.state = state;
	if (state != SwapState::Failed)
		return swap;
	if ( swap.user_leg.state == SwapState::Failed
	  || swap.server_leg.state == SwapState::Failed
	   )
		swap.failure_reason = ambiguous_resolution;
	else
		swap.failure_reason = diverged_legs;
	return swap;
}

Persist::SwapState combine_legs( Persist::SwapState user
			       , Persist::SwapState server
			       ) {
	using Persist::SwapState;

	if (user == SwapState::Failed || server == SwapState::Failed)
		return SwapState::Failed;
	if (user == SwapState::Refunded)
		return SwapState::Refunded;
	if (user == SwapState::Complete && server == SwapState::Complete)
		return SwapState::Complete;
	/* Both legs ended, not both claimed.  */
	if (Persist::is_terminal(user) && Persist::is_terminal(server))
		return SwapState::Failed;
	if (user == SwapState::Refundable)
		return SwapState::Refundable;
	if ( user == SwapState::Created
	  && ( server == SwapState::Expired
	    || server == SwapState::Refunded
	     )
	   )
		return SwapState::Expired;

	auto either = [user, server](SwapState s) {
		return user == s || server == s;
	};
	if (either(SwapState::Pending) || either(SwapState::Complete))
		return SwapState::Pending;
	if (either(SwapState::WaitingConfirmation))
		return SwapState::WaitingConfirmation;
	return SwapState::Created;
}

}}
