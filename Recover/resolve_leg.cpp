#include"Recover/History.hpp"
#include"Recover/resolve_leg.hpp"

namespace {

/* The most mature sighting: lowest confirmed height,
 * or the first mempool one.  */
Wallet::HistoryTxId const*
most_mature(std::vector<Wallet::HistoryTxId> const& txs) {
	auto rv = (Wallet::HistoryTxId const*) nullptr;
	for (auto const& tx : txs) {
		if (!rv) {
			rv = &tx;
			continue;
		}
		if (!tx.confirmed())
			continue;
		if (!rv->confirmed() || tx.height < rv->height)
			rv = &tx;
	}
	return rv;
}

/* Position in the Created, WaitingConfirmation,
 * Pending progression; -1 for any other state.  */
int progress_rank(Persist::SwapState s) {
	switch (s) {
	case Persist::SwapState::Created: return 0;
	case Persist::SwapState::WaitingConfirmation: return 1;
	case Persist::SwapState::Pending: return 2;
	default: return -1;
	}
}

}

namespace Recover {

char const ambiguous_resolution[] = "ambiguous-resolution";

std::uint32_t confirmations(std::uint32_t height, std::uint32_t tip) {
	if (height == 0)
		return 0;
	/* Our tip may lag the server that reported
	 * the height.  */
	if (tip < height)
		return 1;
	return tip - height + 1;
}

Persist::SwapLeg resolve_leg( Persist::SwapLeg leg
			    , LegTxs const& txs
			    , std::uint32_t tip
			    , Funder funder
			    ) {
	using Persist::SwapState;

	if (Persist::is_terminal(leg.state))
		return leg;

	auto lockup = most_mature(txs.lockup);
	auto claim = most_mature(txs.claim);
	auto refund = most_mature(txs.refund);

	if (lockup)
		leg.lockup_tx_id = lockup->txid;

	if (claim && refund) {
		if ( confirmations(claim->height, tip)
		   > confirmations(refund->height, tip)
		   )
			refund = nullptr;
		else {
			leg.state = SwapState::Failed;
			return leg;
		}
	}

	if (claim) {
		leg.claim_tx_id = claim->txid;
		if (confirmations(claim->height, tip) >= min_confirmations)
			leg.state = SwapState::Complete;
		else
			leg.state = SwapState::Pending;
		return leg;
	}

	if (refund) {
		leg.refund_tx_id = refund->txid;
		leg.state = SwapState::Refunded;
		return leg;
	}

	if (tip > leg.timeout_height) {
		/* A funded server leg can still be claimed
		 * until the counterparty refunds it.  */
		auto funded = !leg.lockup_tx_id.empty();
		if (funder == Funder::Server && !funded)
			leg.state = SwapState::Expired;
		else
			leg.state = SwapState::Refundable;
		return leg;
	}

	if (lockup) {
		auto seen = lockup->confirmed() ? SwapState::Pending
						: SwapState::WaitingConfirmation
						;
		auto current = progress_rank(leg.state);
		if (current >= 0 && current < progress_rank(seen))
			leg.state = seen;
	}
	return leg;
}

}
