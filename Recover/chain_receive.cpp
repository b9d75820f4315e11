#include"Recover/Detail/settle.hpp"
#include"Recover/History.hpp"
#include"Recover/handlers.hpp"
#include"Recover/resolve_leg.hpp"

namespace Recover {

Persist::SwapRecord
resolve_chain_receive( Persist::SwapRecord swap
		     , SwapTxs const& txs
		     , std::uint32_t tip
		     ) {
	Detail::check_kind(swap, Persist::SwapKind::ChainReceive);
	if (Persist::is_terminal(swap.state))
		return swap;

	/* User leg on Bitcoin, funded from outside this
	 * wallet, so it is only visible through the
	 * script history.  Server leg on Liquid, claimed
	 * into this wallet.  */
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
