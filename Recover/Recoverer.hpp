#ifndef RECOVER_RECOVERER_HPP
#define RECOVER_RECOVERER_HPP

#include<cstddef>

namespace Ev { template<typename a> class Io; }
namespace Persist { class Persister; }
namespace Sdk { class LoggerIF; }
namespace Wallet { class OnchainWalletIF; }

namespace Recover {

/** class Recover::Recoverer
 *
 * @brief recomputes the state of every ongoing
 * swap from chain history and saves the records
 * that changed.
 *
 * @desc Run after a full scan of the wallet.
 * Swaps resolve concurrently, each saved in its
 * own transaction.
 */
class Recoverer {
private:
	Wallet::OnchainWalletIF& wallet;
	Persist::Persister& persister;
	Sdk::LoggerIF& logger;

public:
	Recoverer() =delete;
	Recoverer( Wallet::OnchainWalletIF& wallet_
		 , Persist::Persister& persister_
		 , Sdk::LoggerIF& logger_
		 ) : wallet(wallet_)
		   , persister(persister_)
		   , logger(logger_)
		   { }

	/* Number of swap records that changed.  */
	Ev::Io<std::size_t> recover();
};

}

#endif /* !defined(RECOVER_RECOVERER_HPP) */
