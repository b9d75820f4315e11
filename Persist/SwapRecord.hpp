#ifndef PERSIST_SWAPRECORD_HPP
#define PERSIST_SWAPRECORD_HPP

#include<cstdint>
#include<string>

namespace Persist {

enum class SwapKind
{ Receive = 0
, Send = 1
, ChainReceive = 2
, ChainSend = 3
};

enum class SwapState
{ Created = 0
, WaitingConfirmation = 1
, Pending = 2
, Complete = 3
, Refundable = 4
, Refunded = 5
, Expired = 6
, Failed = 7
};

char const* swap_kind_name(SwapKind k);
char const* swap_state_name(SwapState s);
/* Complete, Refunded, Expired and Failed never change.  */
bool is_terminal(SwapState s);

/** struct Persist::SwapLeg
 *
 * @brief one on-chain output of a swap: the lockup
 * that creates it and the claim or refund that
 * spends it.
 *
 * @desc Scripts are scriptPubKeys in hex.
 * `claim_script` is where a claim pays to, and is
 * empty when the claim destination is not ours to
 * know.
 * `refund_script` is where a refund pays to.
 * Txids stay empty until observed.
 */
struct SwapLeg {
	std::string lockup_script;
	std::string claim_script;
	std::string refund_script;

	std::string lockup_tx_id;
	std::string claim_tx_id;
	std::string refund_tx_id;

	std::uint32_t timeout_height;
	SwapState state;

	SwapLeg() : timeout_height(0), state(SwapState::Created) { }

	/* Whether this leg exists for the swap kind.  */
	bool used() const { return !lockup_script.empty(); }

	bool operator==(SwapLeg const& o) const;
	bool operator!=(SwapLeg const& o) const {
		return !(*this == o);
	}
};

/** struct Persist::SwapRecord
 *
 * @brief persisted state of one swap.
 *
 * @desc The user leg holds funds the user locks
 * (sends, and the source side of chain swaps);
 * the server leg holds funds the counterparty
 * locks (receives, and the destination side of
 * chain swaps).
 * Receive and send swaps use only one leg.
 */
struct SwapRecord {
	std::string id;
	SwapKind kind;
	/* Unix seconds.  */
	std::uint32_t created_at;
	std::uint64_t amount_sat;
	std::uint64_t fees_sat;
	std::uint64_t max_fees_sat;
	/* Lightning invoice for receive and send swaps.  */
	std::string invoice;

	SwapLeg user_leg;
	SwapLeg server_leg;

	SwapState state;
	/* Set only when `state` is Failed.  */
	std::string failure_reason;

	SwapRecord() : kind(SwapKind::Receive)
		     , created_at(0)
		     , amount_sat(0)
		     , fees_sat(0)
		     , max_fees_sat(0)
		     , state(SwapState::Created)
		     { }

	bool is_chain() const {
		return kind == SwapKind::ChainReceive
		    || kind == SwapKind::ChainSend
		     ;
	}
	bool is_incoming() const {
		return kind == SwapKind::Receive
		    || kind == SwapKind::ChainReceive
		     ;
	}

	bool operator==(SwapRecord const& o) const;
	bool operator!=(SwapRecord const& o) const {
		return !(*this == o);
	}
};

}

#endif /* !defined(PERSIST_SWAPRECORD_HPP) */
