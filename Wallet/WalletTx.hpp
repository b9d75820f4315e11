#ifndef WALLET_WALLETTX_HPP
#define WALLET_WALLETTX_HPP

#include<cstdint>
#include<map>
#include<string>
#include<vector>

namespace Wallet {

/** struct Wallet::TxIo
 *
 * @brief one input or output of a transaction.
 *
 * @desc For an input, `txid`:`vout` is the outpoint
 * being spent and the remaining fields describe the
 * spent output, when known.
 * For an output, `txid`:`vout` is the output itself.
 * Confidential amounts the wallet cannot unblind
 * have `value` 0 and an empty `asset`.
 */
struct TxIo {
	std::string txid;
	std::uint32_t vout;
	/* hex.  */
	std::string script_pubkey;
	std::string asset;
	std::uint64_t value;
	bool is_mine;
};

/** struct Wallet::WalletTx
 *
 * @brief a transaction as seen by the descriptor
 * wallet.
 *
 * @desc `height` 0 means unconfirmed.
 * `balance` maps asset id to the signed net change
 * to the wallet, fee included.
 */
struct WalletTx {
	std::string txid;
	std::uint32_t height;
	std::uint32_t timestamp;
	std::map<std::string, std::int64_t> balance;
	std::uint64_t fee;
	std::vector<TxIo> inputs;
	std::vector<TxIo> outputs;

	bool confirmed() const { return height != 0; }
};

/** struct Wallet::HistoryTxId
 *
 * @brief a transaction id with the height it was
 * seen at, 0 for mempool.
 */
struct HistoryTxId {
	std::string txid;
	std::uint32_t height;

	bool confirmed() const { return height != 0; }
	bool operator==(HistoryTxId const& o) const {
		return txid == o.txid && height == o.height;
	}
	bool operator!=(HistoryTxId const& o) const {
		return !(*this == o);
	}
};

}

#endif /* !defined(WALLET_WALLETTX_HPP) */
