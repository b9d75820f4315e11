#ifndef WALLET_CHAINCLIENTIF_HPP
#define WALLET_CHAINCLIENTIF_HPP

#include"Util/BacktraceException.hpp"
#include"Wallet/WalletTx.hpp"
#include<cstdint>
#include<memory>
#include<stdexcept>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }

namespace Wallet {

/** class Wallet::ChainClientError
 *
 * @brief thrown when the blockchain network client
 * cannot connect or a query fails.
 */
class ChainClientError : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	ChainClientError(std::string const& e)
		: Util::BacktraceException<std::runtime_error>(e) { }
};

/** class Wallet::ChainClientIF
 *
 * @brief a connected Electrum-style client of the
 * Liquid chain.
 */
class ChainClientIF {
public:
	virtual ~ChainClientIF() { }

	/* Height of the chain tip.  */
	virtual
	Ev::Io<std::uint32_t> tip() =0;

	/** Wallet::ChainClientIF::script_transactions
	 *
	 * @brief every transaction that pays to or
	 * spends from any of the given scripts, with
	 * all its inputs and outputs.
	 *
	 * @param scripts - scriptPubKeys in hex.
	 */
	virtual
	Ev::Io<std::vector<WalletTx>>
	script_transactions(std::vector<std::string> const& scripts) =0;

	/* Broadcast a raw transaction, returning its txid.  */
	virtual
	Ev::Io<std::string> broadcast(std::string const& tx_hex) =0;
};

/** class Wallet::ChainClientFactoryIF
 *
 * @brief connects network clients.
 */
class ChainClientFactoryIF {
public:
	virtual ~ChainClientFactoryIF() { }

	/* Throws `Wallet::ChainClientError`.  */
	virtual
	Ev::Io<std::unique_ptr<ChainClientIF>>
	connect( std::string const& url
	       , bool tls
	       , bool validate_domain
	       /* seconds.  */
	       , std::uint32_t timeout
	       ) =0;
};

}

#endif /* !defined(WALLET_CHAINCLIENTIF_HPP) */
