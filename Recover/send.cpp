#include"Recover/Detail/settle.hpp"
#include"Recover/History.hpp"
#include"Recover/handlers.hpp"
#include"Recover/resolve_leg.hpp"

namespace Recover {

Persist::SwapRecord
resolve_send( Persist::SwapRecord swap
	    , SwapTxs const& txs
	    , std::uint32_t tip
	    ) {
	Detail::check_kind(swap, Persist::SwapKind::Send);
	if (Persist::is_terminal(swap.state))
		return swap;

	/* We fund the lockup.  Any spend not paying to
	 * our refund script is the counterparty claim,
	 * which means the invoice was paid.  */
	swap.user_leg = resolve_leg( std::move(swap.user_leg)
				   , txs.user_leg
				   , tip
				   , Funder::User
				   );
	auto state = swap.user_leg.state;
	return Detail::settle(std::move(swap), state);
}

}
