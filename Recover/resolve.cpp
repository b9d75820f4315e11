#include"Recover/handlers.hpp"

namespace Recover {

Persist::SwapRecord
resolve( Persist::SwapRecord swap
       , SwapTxs const& txs
       , std::uint32_t tip
       ) {
	switch (swap.kind) {
	case Persist::SwapKind::Receive:
		return resolve_receive(std::move(swap), txs, tip);
	case Persist::SwapKind::Send:
		return resolve_send(std::move(swap), txs, tip);
	case Persist::SwapKind::ChainReceive:
		return resolve_chain_receive(std::move(swap), txs, tip);
	case Persist::SwapKind::ChainSend:
		return resolve_chain_send(std::move(swap), txs, tip);
	}
	return swap;
}

}
