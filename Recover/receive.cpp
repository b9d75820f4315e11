#include"Recover/Detail/settle.hpp"
#include"Recover/History.hpp"
#include"Recover/handlers.hpp"
#include"Recover/resolve_leg.hpp"

namespace Recover {

Persist::SwapRecord
resolve_receive( Persist::SwapRecord swap
	       , SwapTxs const& txs
	       , std::uint32_t tip
	       ) {
	Detail::check_kind(swap, Persist::SwapKind::Receive);
	if (Persist::is_terminal(swap.state))
		return swap;

	/* The counterparty funds the lockup; only our
	 * claim, paying to our claim script, completes
	 * the swap.  Past the timeout the counterparty
	 * takes its funds back.  */
	swap.server_leg = resolve_leg( std::move(swap.server_leg)
				     , txs.server_leg
				     , tip
				     , Funder::Server
				     );
	auto state = swap.server_leg.state;
	return Detail::settle(std::move(swap), state);
}

}
