#include"Persist/SwapRecord.hpp"

namespace Persist {

char const* swap_kind_name(SwapKind k) {
	switch (k) {
	case SwapKind::Receive: return "receive";
	case SwapKind::Send: return "send";
	case SwapKind::ChainReceive: return "chain-receive";
	case SwapKind::ChainSend: return "chain-send";
	}
	return "unknown";
}

char const* swap_state_name(SwapState s) {
	switch (s) {
	case SwapState::Created: return "created";
	case SwapState::WaitingConfirmation: return "waiting-confirmation";
	case SwapState::Pending: return "pending";
	case SwapState::Complete: return "complete";
	case SwapState::Refundable: return "refundable";
	case SwapState::Refunded: return "refunded";
	case SwapState::Expired: return "expired";
	case SwapState::Failed: return "failed";
	}
	return "unknown";
}

bool is_terminal(SwapState s) {
	switch (s) {
	case SwapState::Complete:
	case SwapState::Refunded:
	case SwapState::Expired:
	case SwapState::Failed:
		return true;
	case SwapState::Created:
	case SwapState::WaitingConfirmation:
	case SwapState::Pending:
	case SwapState::Refundable:
		return false;
	}
	return false;
}

bool SwapLeg::operator==(SwapLeg const& o) const {
	return lockup_script == o.lockup_script
	    && claim_script == o.claim_script
	    && refund_script == o.refund_script
	    && lockup_tx_id == o.lockup_tx_id
	    && claim_tx_id == o.claim_tx_id
	    && refund_tx_id == o.refund_tx_id
	    && timeout_height == o.timeout_height
	    && state == o.state
	     ;
}

bool SwapRecord::operator==(SwapRecord const& o) const {
	return id == o.id
	    && kind == o.kind
	    && created_at == o.created_at
	    && amount_sat == o.amount_sat
	    && fees_sat == o.fees_sat
	    && max_fees_sat == o.max_fees_sat
	    && invoice == o.invoice
	    && user_leg == o.user_leg
	    && server_leg == o.server_leg
	    && state == o.state
	    && failure_reason == o.failure_reason
	     ;
}

}
