#include"Persist/SwapRecord.hpp"
#include"Recover/History.hpp"

namespace Recover {

void History::index(Wallet::WalletTx const& tx) {
	for (auto const& out : tx.outputs)
		if (!out.script_pubkey.empty())
			paid_to[out.script_pubkey].insert(tx.txid);
	for (auto const& in : tx.inputs)
		if (!in.script_pubkey.empty())
			spent_from[in.script_pubkey].insert(tx.txid);
}

void History::add(Wallet::WalletTx tx) {
	index(tx);

	auto it = txs.find(tx.txid);
	if (it == txs.end()) {
		auto txid = tx.txid;
		txs.emplace(std::move(txid), std::move(tx));
		return;
	}

	auto& old = it->second;
	/* Different sources may see different subsets
	 * of inputs and outputs; keep the fuller view.  */
	if (tx.inputs.size() < old.inputs.size())
		tx.inputs = old.inputs;
	if (tx.outputs.size() < old.outputs.size())
		tx.outputs = old.outputs;
	if (old.confirmed() && !tx.confirmed()) {
		tx.height = old.height;
		tx.timestamp = old.timestamp;
	}
	old = std::move(tx);
}

void History::add(std::vector<Wallet::WalletTx> n_txs) {
	for (auto& tx : n_txs)
		add(std::move(tx));
}

Wallet::WalletTx const* History::find(std::string const& txid) const {
	auto it = txs.find(txid);
	if (it == txs.end())
		return nullptr;
	return &it->second;
}

Wallet::HistoryTxId History::history_id(std::string const& txid) const {
	auto tx = find(txid);
	return Wallet::HistoryTxId{txid, tx ? tx->height : 0};
}

bool History::pays_to( std::string const& txid
		     , std::string const& script
		     ) const {
	auto it = paid_to.find(script);
	if (it == paid_to.end())
		return false;
	return it->second.count(txid) != 0;
}

LegTxs History::match_leg(Persist::SwapLeg const& leg) const {
	auto rv = LegTxs();
	if (!leg.used())
		return rv;

	auto lockups = paid_to.find(leg.lockup_script);
	if (lockups != paid_to.end())
		for (auto const& txid : lockups->second)
			rv.lockup.push_back(history_id(txid));

	auto spends = spent_from.find(leg.lockup_script);
	if (spends == spent_from.end())
		return rv;
	for (auto const& txid : spends->second) {
		if ( !leg.refund_script.empty()
		  && pays_to(txid, leg.refund_script)
		   )
			rv.refund.push_back(history_id(txid));
		else if ( leg.claim_script.empty()
		       || pays_to(txid, leg.claim_script)
			)
			rv.claim.push_back(history_id(txid));
	}
	return rv;
}

SwapTxs History::match(Persist::SwapRecord const& swap) const {
	auto rv = SwapTxs();
	rv.user_leg = match_leg(swap.user_leg);
	rv.server_leg = match_leg(swap.server_leg);
	return rv;
}

std::vector<std::string>
History::scripts_of(Persist::SwapRecord const& swap) {
	auto rv = std::vector<std::string>();
	auto add_script = [&rv](std::string const& s) {
		if (!s.empty())
			rv.push_back(s);
	};
	for (auto leg : {&swap.user_leg, &swap.server_leg}) {
		if (!leg->used())
			continue;
		add_script(leg->lockup_script);
		add_script(leg->claim_script);
		add_script(leg->refund_script);
	}
	return rv;
}

}
