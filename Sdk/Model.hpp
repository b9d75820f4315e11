#ifndef SDK_MODEL_HPP
#define SDK_MODEL_HPP

#include<cstdint>
#include<string>

namespace Sdk {

struct GetInfoRequest {
	/* Run a full scan and recovery first.  */
	bool with_scan;
};
struct GetInfoResponse {
	std::uint64_t balance_sat;
	std::uint64_t pending_send_sat;
	std::uint64_t pending_receive_sat;
	std::string pubkey;
};

struct PrepareReceiveRequest {
	std::uint64_t payer_amount_sat;
};
struct PrepareReceiveResponse {
	std::uint64_t payer_amount_sat;
	std::uint64_t fees_sat;
};
struct ReceivePaymentResponse {
	/* Swap id.  */
	std::string id;
	std::string invoice;
};

struct PrepareSendRequest {
	std::string invoice;
};
struct PrepareSendResponse {
	std::string invoice;
	std::uint64_t fees_sat;
};
struct SendPaymentResponse {
	std::string txid;
};

struct BackupRequest {
	/* Empty for the default path in the working
	 * directory.  */
	std::string backup_path;
};
struct RestoreRequest {
	/* Empty for the default path in the working
	 * directory.  */
	std::string backup_path;
};

enum class PaymentType {
	Receive,
	Send
};
enum class PaymentState {
	Created,
	Pending,
	Complete,
	Failed,
	TimedOut,
	Refundable
};

/** struct Sdk::Payment
 *
 * @brief one entry of the payment list: a swap, or
 * a wallet transaction not tied to any swap.
 *
 * @desc `tx_id` is empty until a transaction is
 * known; `swap_id` is empty for plain on-chain
 * transactions.
 */
struct Payment {
	std::string tx_id;
	std::string swap_id;
	std::uint32_t timestamp;
	std::uint64_t amount_sat;
	std::uint64_t fees_sat;
	PaymentType payment_type;
	PaymentState status;
};

}

#endif /* !defined(SDK_MODEL_HPP) */
