#include"Ev/Io.hpp"
#include"Ev/foreach.hpp"
#include"Persist/Persister.hpp"
#include"Recover/History.hpp"
#include"Recover/Recoverer.hpp"
#include"Recover/handlers.hpp"
#include"Sdk/log.hpp"
#include"Wallet/OnchainWalletIF.hpp"
#include<algorithm>
#include<memory>

namespace {

struct Context {
	std::vector<Persist::SwapRecord> swaps;
	std::uint32_t tip;
	Recover::History history;
	std::size_t changed;

	Context() : tip(0), changed(0) { }
};

}

namespace Recover {

Ev::Io<std::size_t> Recoverer::recover() {
	auto ctx = std::make_shared<Context>();

	return persister.list_ongoing_swaps().then([this, ctx](std::vector<Persist::SwapRecord> swaps) {
		ctx->swaps = std::move(swaps);
		return wallet.tip();
	}).then([this, ctx](std::uint32_t tip) {
		ctx->tip = tip;
		return wallet.transactions();
	}).then([this, ctx](std::vector<Wallet::WalletTx> txs) -> Ev::Io<std::vector<Wallet::WalletTx>> {
		ctx->history.add(std::move(txs));

		auto scripts = std::vector<std::string>();
		for (auto const& swap : ctx->swaps) {
			auto ss = History::scripts_of(swap);
			scripts.insert(scripts.end(), ss.begin(), ss.end());
		}
		std::sort(scripts.begin(), scripts.end());
		scripts.erase( std::unique(scripts.begin(), scripts.end())
			     , scripts.end()
			     );
		if (scripts.empty())
			return Ev::lift(std::vector<Wallet::WalletTx>());
		return wallet.script_transactions(scripts);
	}).then([this, ctx](std::vector<Wallet::WalletTx> txs) {
		ctx->history.add(std::move(txs));
		auto swaps = std::move(ctx->swaps);
		return Ev::foreach([this, ctx](Persist::SwapRecord swap) -> Ev::Io<void> {
			auto updated = resolve( swap
					      , ctx->history.match(swap)
					      , ctx->tip
					      );
			if (updated == swap)
				return Ev::lift();
			++ctx->changed;
			return Sdk::log( logger, Sdk::Info
				       , "Swap %s (%s): %s -> %s"
				       , swap.id.c_str()
				       , Persist::swap_kind_name(swap.kind)
				       , Persist::swap_state_name(swap.state)
				       , Persist::swap_state_name(updated.state)
				       )
			     + persister.save_swap(updated)
			     ;
		}, std::move(swaps));
	}).then([ctx]() {
		return Ev::lift(ctx->changed);
	});
}

}
