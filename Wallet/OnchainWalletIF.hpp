#ifndef WALLET_ONCHAINWALLETIF_HPP
#define WALLET_ONCHAINWALLETIF_HPP

#include"Wallet/AddressResult.hpp"
#include"Wallet/Pset.hpp"
#include"Wallet/WalletTx.hpp"
#include<cstddef>
#include<cstdint>
#include<map>
#include<memory>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }

namespace Wallet {

/** class Wallet::OnchainWalletIF
 *
 * @brief the on-chain wallet as the rest of the
 * library sees it.
 *
 * @desc Every failure is thrown as
 * `Sdk::PaymentError`.
 * `fee_rate` arguments are in sat/vbyte, with 0
 * meaning the configured default.
 */
class OnchainWalletIF {
public:
	virtual ~OnchainWalletIF() { }

	virtual
	Ev::Io<std::vector<WalletTx>> transactions() =0;
	virtual
	Ev::Io<std::map<std::string, WalletTx>> transactions_by_tx_id() =0;

	virtual
	Ev::Io<Transaction>
	build_tx( double fee_rate
		, std::string const& recipient
		, std::string const& asset
		, std::uint64_t amount_sat
		) =0;
	/* If `enforce_amount_sat` is given, fails unless
	 * the drain pays exactly that amount.  */
	virtual
	Ev::Io<Transaction>
	build_drain_tx( double fee_rate
		      , std::string const& recipient
		      , std::unique_ptr<std::uint64_t> enforce_amount_sat
		      ) =0;
	/* `build_tx`, falling back to an enforced drain
	 * on insufficient funds of the native asset.  */
	virtual
	Ev::Io<Transaction>
	build_tx_or_drain_tx( double fee_rate
			    , std::string const& recipient
			    , std::string const& asset
			    , std::uint64_t amount_sat
			    ) =0;

	/* An expired reservation if there is one,
	 * else a fresh address.  */
	virtual
	Ev::Io<AddressResult> next_unused_address() =0;
	/* Keep the address from being handed out again
	 * until the tip reaches `expiry_block_height`.  */
	virtual
	Ev::Io<void> reserve_address( AddressResult const& address
				    , std::uint32_t expiry_block_height
				    ) =0;
	/* Drop the reservations of addresses that were
	 * paid to, returning how many.  */
	virtual
	Ev::Io<std::size_t> release_used_addresses() =0;

	virtual
	Ev::Io<std::uint32_t> tip() =0;
	/* Spendable native-asset balance.  */
	virtual
	Ev::Io<std::uint64_t> balance_sat() =0;

	virtual
	std::string pubkey() =0;
	virtual
	std::string fingerprint() =0;

	virtual
	std::string sign_message(std::string const& msg) =0;
	virtual
	bool check_message( std::string const& msg
			  , std::string const& pubkey
			  , std::string const& signature
			  ) =0;

	virtual
	Ev::Io<void> full_scan() =0;

	/* Chain history of arbitrary scripts, through
	 * the network client.  */
	virtual
	Ev::Io<std::vector<WalletTx>>
	script_transactions(std::vector<std::string> const& scripts) =0;
	virtual
	Ev::Io<std::string> broadcast(std::string const& tx_hex) =0;

	/* Wipe the local wallet store and reopen it
	 * empty.  */
	virtual
	Ev::Io<void> empty_wallet_cache() =0;
};

}

#endif /* !defined(WALLET_ONCHAINWALLETIF_HPP) */
