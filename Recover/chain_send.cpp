#include"Recover/Detail/settle.hpp"
#include"Recover/History.hpp"
#include"Recover/handlers.hpp"
#include"Recover/resolve_leg.hpp"

namespace Recover {

Persist::SwapRecord
resolve_chain_send( Persist::SwapRecord swap
		  , SwapTxs const& txs
		  , std::uint32_t tip
		  ) {
	Detail::check_kind(swap, Persist::SwapKind::ChainSend);
	if (Persist::is_terminal(swap.state))
		return swap;

	/* User leg on Liquid, funded by this wallet.
	 * Server leg on Bitcoin, claimed to an outside
	 * address, so its claim matches any spend that
	 * is not the counterparty refund.  */
	swap.user_leg = resolve_leg( std::move(swap.user_leg)
				   , txs.user_leg
				   , tip
				   , Funder::User
				   );
	swap.server_leg = resolve_leg( std::move(swap.server_leg)
				     , txs.server_leg
				     , tip
				     , Funder::Server
				     );
	auto state = Detail::combine_legs( swap.user_leg.state
					 , swap.server_leg.state
					 );
	return Detail::settle(std::move(swap), state);
}

}
