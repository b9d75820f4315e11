#ifndef WALLET_ONCHAINWALLET_HPP
#define WALLET_ONCHAINWALLET_HPP

#include"Wallet/OnchainWalletIF.hpp"
#include<memory>

namespace Persist { class Persister; }
namespace Sdk { class LoggerIF; }
namespace Sdk { struct Config; }
namespace Signer { class UserSignerIF; }
namespace Wallet { class ChainClientFactoryIF; }
namespace Wallet { class DescriptorWalletFactoryIF; }

namespace Wallet {

/** class Wallet::OnchainWallet
 *
 * @brief the on-chain transaction engine over a
 * confidential descriptor wallet.
 *
 * @desc The descriptor wallet and the network
 * client are each behind their own `Ev::Mutex`.
 * Transaction building and scanning hold the
 * wallet lock for their whole duration.
 * The network client is connected on first use
 * and then reused.
 *
 * The persister, factories and logger must
 * outlive this object.
 */
class OnchainWallet : public OnchainWalletIF {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	explicit
	OnchainWallet(std::unique_ptr<Impl> pimpl);

public:
	OnchainWallet() =delete;
	OnchainWallet(OnchainWallet const&) =delete;
	~OnchainWallet();

	/** Wallet::OnchainWallet::create
	 *
	 * @brief derive the descriptor from the signer
	 * and open its wallet store under the working
	 * directory.
	 *
	 * @desc A store that fails to load is wiped
	 * and opened again, once.
	 */
	static
	Ev::Io<std::unique_ptr<OnchainWallet>>
	create( Sdk::Config const& config
	      , Persist::Persister& persister
	      , std::shared_ptr<Signer::UserSignerIF> user_signer
	      , DescriptorWalletFactoryIF& wallet_factory
	      , ChainClientFactoryIF& client_factory
	      , Sdk::LoggerIF& logger
	      );

	/* The descriptor the wallet tracks.  */
	std::string const& descriptor() const;

	Ev::Io<std::vector<WalletTx>> transactions() override;
	Ev::Io<std::map<std::string, WalletTx>> transactions_by_tx_id() override;
	Ev::Io<Transaction>
	build_tx( double fee_rate
		, std::string const& recipient
		, std::string const& asset
		, std::uint64_t amount_sat
		) override;
	Ev::Io<Transaction>
	build_drain_tx( double fee_rate
		      , std::string const& recipient
		      , std::unique_ptr<std::uint64_t> enforce_amount_sat
		      ) override;
	Ev::Io<Transaction>
	build_tx_or_drain_tx( double fee_rate
			    , std::string const& recipient
			    , std::string const& asset
			    , std::uint64_t amount_sat
			    ) override;
	Ev::Io<AddressResult> next_unused_address() override;
	Ev::Io<void> reserve_address( AddressResult const& address
				    , std::uint32_t expiry_block_height
				    ) override;
	Ev::Io<std::size_t> release_used_addresses() override;
	Ev::Io<std::uint32_t> tip() override;
	Ev::Io<std::uint64_t> balance_sat() override;
	std::string pubkey() override;
	std::string fingerprint() override;
	std::string sign_message(std::string const& msg) override;
	bool check_message( std::string const& msg
			  , std::string const& pubkey
			  , std::string const& signature
			  ) override;
	Ev::Io<void> full_scan() override;
	Ev::Io<std::vector<WalletTx>>
	script_transactions(std::vector<std::string> const& scripts) override;
	Ev::Io<std::string> broadcast(std::string const& tx_hex) override;
	Ev::Io<void> empty_wallet_cache() override;
};

}

#endif /* !defined(WALLET_ONCHAINWALLET_HPP) */
