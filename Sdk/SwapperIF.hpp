#ifndef SDK_SWAPPERIF_HPP
#define SDK_SWAPPERIF_HPP

#include<cmath>
#include<cstdint>
#include<memory>
#include<string>

namespace Ev { template<typename a> class Io; }

namespace Sdk {

/** struct Sdk::SwapPair
 *
 * @brief limits and fees the counterparty quotes
 * for one swap direction.
 */
struct SwapPair {
	std::uint64_t min_sat;
	std::uint64_t max_sat;
	/* Percent of the amount, e.g. 0.25.  */
	double fee_percentage;
	/* On-chain fees charged on top.  */
	std::uint64_t miner_fees_sat;

	std::uint64_t fees_for(std::uint64_t amount_sat) const {
		auto pct = std::ceil(double(amount_sat) * fee_percentage / 100.0);
		return std::uint64_t(pct) + miner_fees_sat;
	}
	bool in_range(std::uint64_t amount_sat) const {
		return min_sat <= amount_sat && amount_sat <= max_sat;
	}
};

/* What the counterparty returns for a new receive
 * swap: it locks funds we claim.  */
struct CreatedReceiveSwap {
	std::string id;
	std::string invoice;
	/* scriptPubKeys, hex.  */
	std::string lockup_script;
	std::string refund_script;
	std::uint32_t timeout_height;
};

/* What the counterparty returns for a new send
 * swap: we lock funds it claims.  */
struct CreatedSendSwap {
	std::string id;
	std::string lockup_address;
	std::uint64_t expected_amount_sat;
	std::string lockup_script;
	std::uint32_t timeout_height;
};

/** class Sdk::SwapperIF
 *
 * @brief the swap counterparty.
 *
 * @desc Failures are reported by throwing; the
 * caller turns them into `Sdk::PaymentError`.
 */
class SwapperIF {
public:
	virtual ~SwapperIF() { }

	/* nullptr if the counterparty offers no pair.  */
	virtual
	Ev::Io<std::unique_ptr<SwapPair>> receive_pair() =0;
	virtual
	Ev::Io<std::unique_ptr<SwapPair>> send_pair() =0;

	virtual
	Ev::Io<CreatedReceiveSwap>
	create_receive_swap( std::uint64_t payer_amount_sat
			   , std::string const& claim_address
			   ) =0;
	virtual
	Ev::Io<CreatedSendSwap>
	create_send_swap( std::string const& invoice
			, std::string const& refund_address
			) =0;
};

}

#endif /* !defined(SDK_SWAPPERIF_HPP) */
