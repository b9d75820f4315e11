#ifndef RECOVER_RESOLVE_LEG_HPP
#define RECOVER_RESOLVE_LEG_HPP

#include"Persist/SwapRecord.hpp"
#include<cstdint>

namespace Recover { struct LegTxs; }

namespace Recover {

/* Confirmations before a claim is final.  */
std::uint32_t const min_confirmations = 1;

/* Failure reason when a claim and a refund both
 * match and neither is strictly more mature.  */
extern char const ambiguous_resolution[];

/* Who funded the lockup, which decides what a
 * timeout without lockup, claim or refund means.  */
enum class Funder
{ User
, Server
};

/** Recover::confirmations
 *
 * @brief blocks since the transaction confirmed,
 * counting its own block; 0 in mempool.
 */
std::uint32_t confirmations(std::uint32_t height, std::uint32_t tip);

/** Recover::resolve_leg
 *
 * @brief recompute the state of one leg from the
 * transactions matched to it and the chain tip.
 *
 * @desc A terminal leg is returned unchanged.
 * Otherwise, in order:
 * a claim (alone, or strictly more mature than a
 * matching refund) gives Complete once confirmed,
 * else Pending;
 * a claim and refund of equal maturity give Failed;
 * a refund gives Refunded;
 * a tip past the timeout gives Refundable, except
 * that a server-funded leg whose lockup was never
 * seen gives Expired;
 * a lockup gives WaitingConfirmation, or Pending
 * once confirmed, never moving the leg backwards.
 * With nothing matched the leg is unchanged.
 */
Persist::SwapLeg resolve_leg( Persist::SwapLeg leg
			    , LegTxs const& txs
			    , std::uint32_t tip
			    , Funder funder
			    );

}

#endif /* !defined(RECOVER_RESOLVE_LEG_HPP) */
