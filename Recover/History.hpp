#ifndef RECOVER_HISTORY_HPP
#define RECOVER_HISTORY_HPP

#include"Wallet/WalletTx.hpp"
#include<cstddef>
#include<map>
#include<set>
#include<string>
#include<vector>

namespace Persist { struct SwapLeg; }
namespace Persist { struct SwapRecord; }

namespace Recover {

/* Transactions matched to one leg of a swap.  */
struct LegTxs {
	/* Pay to the lockup script.  */
	std::vector<Wallet::HistoryTxId> lockup;
	/* Spend the lockup, other than refunds.  */
	std::vector<Wallet::HistoryTxId> claim;
	/* Spend the lockup and pay to the refund script.  */
	std::vector<Wallet::HistoryTxId> refund;

	bool empty() const {
		return lockup.empty() && claim.empty() && refund.empty();
	}
};

struct SwapTxs {
	LegTxs user_leg;
	LegTxs server_leg;
};

/** class Recover::History
 *
 * @brief indexes transactions by txid and by the
 * scripts they pay to and spend from, then matches
 * them to swaps.
 *
 * @desc Adding a txid already present replaces the
 * entry instead of duplicating it; a confirmed
 * sighting is never replaced by an unconfirmed one.
 * Matching is by script only, never by amount.
 */
class History {
private:
	std::map<std::string, Wallet::WalletTx> txs;
	std::map<std::string, std::set<std::string>> paid_to;
	std::map<std::string, std::set<std::string>> spent_from;

	void index(Wallet::WalletTx const& tx);
	Wallet::HistoryTxId history_id(std::string const& txid) const;
	bool pays_to( std::string const& txid
		    , std::string const& script
		    ) const;

public:
	void add(Wallet::WalletTx tx);
	void add(std::vector<Wallet::WalletTx> txs);

	std::size_t size() const { return txs.size(); }
	/* nullptr if absent.  */
	Wallet::WalletTx const* find(std::string const& txid) const;

	LegTxs match_leg(Persist::SwapLeg const& leg) const;
	SwapTxs match(Persist::SwapRecord const& swap) const;

	/* Every non-empty script of the swap's legs.  */
	static
	std::vector<std::string> scripts_of(Persist::SwapRecord const& swap);
};

}

#endif /* !defined(RECOVER_HISTORY_HPP) */
