#include"Bitcoin/addr_to_scriptPubKey.hpp"
#include"Ev/Io.hpp"
#include"Ev/Mutex.hpp"
#include"Ev/now.hpp"
#include"Persist/Persister.hpp"
#include"Sdk/Config.hpp"
#include"Sdk/PaymentError.hpp"
#include"Sdk/log.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Signer/SdkSigner.hpp"
#include"Signer/UserSignerIF.hpp"
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"
#include"Wallet/ChainClientIF.hpp"
#include"Wallet/DescriptorWalletIF.hpp"
#include"Wallet/OnchainWallet.hpp"
#include"Wallet/message.hpp"
#include<set>

namespace {

Bitcoin::Net net_of(Sdk::Network n) {
	switch (n) {
	case Sdk::Network::Mainnet: return Bitcoin::Net::Main;
	case Sdk::Network::Testnet: return Bitcoin::Net::Test;
	case Sdk::Network::Regtest: return Bitcoin::Net::Regtest;
	}
	return Bitcoin::Net::Main;
}

}

namespace Wallet {

class OnchainWallet::Impl {
public:
	Sdk::Config config;
	Persist::Persister& persister;
	Signer::SdkSigner signer;
	DescriptorWalletFactoryIF& wallet_factory;
	ChainClientFactoryIF& client_factory;
	Sdk::LoggerIF& logger;
	std::string descriptor;
	std::string store_dir;

	Ev::Mutex wallet_lock;
	std::unique_ptr<DescriptorWalletIF> wallet;

	Ev::Mutex client_lock;
	std::unique_ptr<ChainClientIF> client;

	Impl( Sdk::Config const& config_
	    , Persist::Persister& persister_
	    , std::shared_ptr<Signer::UserSignerIF> user_signer
	    , DescriptorWalletFactoryIF& wallet_factory_
	    , ChainClientFactoryIF& client_factory_
	    , Sdk::LoggerIF& logger_
	    ) : config(config_)
	      , persister(persister_)
	      , signer(std::move(user_signer))
	      , wallet_factory(wallet_factory_)
	      , client_factory(client_factory_)
	      , logger(logger_)
	      , descriptor(signer.wpkh_slip77_descriptor(config.is_mainnet()))
	      , store_dir(config.wallet_cache_dir(signer.fingerprint()))
	      { }

	/* Turn library errors into payment errors.  */
	template<typename a>
	Ev::Io<a> translate(Ev::Io<a> io) {
		return io.template catching<InsufficientFunds>([](InsufficientFunds const&) -> Ev::Io<a> {
			throw Sdk::PaymentError::insufficient_funds();
		}).template catching<LibraryError>([](LibraryError const& e) -> Ev::Io<a> {
			throw Sdk::PaymentError::lwk_error(e.what());
		}).template catching<StoreError>([](StoreError const& e) -> Ev::Io<a> {
			throw Sdk::PaymentError::generic(e.what());
		}).template catching<ChainClientError>([](ChainClientError const& e) -> Ev::Io<a> {
			throw Sdk::PaymentError::generic(e.what());
		}).template catching<Signer::SignerError>([](Signer::SignerError const& e) -> Ev::Io<a> {
			throw Sdk::PaymentError::signer_error(e.what());
		}).template catching<Persist::PersistError>([this](Persist::PersistError const& e) -> Ev::Io<a> {
			return Sdk::log( logger, Sdk::Error
				       , "%s", e.what()
				       ).then([]() -> Ev::Io<a> {
				throw Sdk::PaymentError::persist_error();
			});
		});
	}

	/* Reopens the store if an earlier reopen failed.  */
	DescriptorWalletIF& get_wallet() {
		if (!wallet)
			wallet = wallet_factory.open(descriptor, store_dir);
		return *wallet;
	}

	double effective_fee_rate(double fee_rate) const {
		return fee_rate > 0 ? fee_rate : config.fee_rate;
	}

	void check_recipient(std::string const& recipient) const {
		if (!Bitcoin::is_address_for( recipient
					    , Bitcoin::Chain::Liquid
					    , net_of(config.network)
					    ))
			throw Sdk::PaymentError::generic(
				"Recipient address " + recipient
				+ " is not a valid ElementsAddress"
			);
	}
	void check_asset(std::string const& asset) const {
		if (asset.size() != 64 || !Util::Str::ishex(asset))
			throw Sdk::PaymentError::generic(
				"Invalid asset id " + asset
			);
	}

	Transaction sign_and_finalize(Pset pset) {
		signer.sign(pset);
		return get_wallet().finalize(pset);
	}

	Ev::Io<void> open_store() {
		return Ev::lift().then([this]() {
			wallet = wallet_factory.open(descriptor, store_dir);
			return Ev::lift();
		}).catching<StoreError>([this](StoreError const& e) {
			return Sdk::log( logger, Sdk::Warn
				       , "Error initialising wallet store, "
					 "wiping %s and retrying: %s"
				       , store_dir.c_str(), e.what()
				       )
			     + Ev::lift().then([this]() {
				wallet_factory.wipe(store_dir);
				wallet = wallet_factory.open(descriptor, store_dir);
				return Ev::lift();
			});
		});
	}

	/* Call with the client lock held.  */
	Ev::Io<void> ensure_client() {
		return Ev::lift().then([this]() -> Ev::Io<void> {
			if (client)
				return Ev::lift();
			return client_factory.connect( config.electrum_url
						     , config.electrum_tls
						     , config.electrum_validate_domain
						     , config.electrum_timeout
						     ).then([this](std::unique_ptr<ChainClientIF> c) {
				client = std::move(c);
				return Ev::lift();
			});
		});
	}

	/* Call with both locks held.  */
	Ev::Io<void> scan_to(std::uint32_t index) {
		return Ev::lift().then([this, index]() {
			return get_wallet().full_scan_to_index(*client, index);
		}).catching<UpdateHeightTooOld>([this, index](UpdateHeightTooOld const& e) {
			return Sdk::log( logger, Sdk::Warn
				       , "Full scan failed with update height too old, "
					 "wiping storage and retrying: %s"
				       , e.what()
				       )
			     + Ev::lift().then([this, index]() {
				wallet.reset();
				wallet_factory.wipe(store_dir);
				return get_wallet().full_scan_to_index(*client, index);
			});
		});
	}

	Ev::Io<std::uint32_t> get_tip() {
		return wallet_lock.run(Ev::lift().then([this]() {
			return Ev::lift(get_wallet().tip());
		}));
	}

	/* Call with the wallet lock held.  Indices held
	 * by live reservations are skipped.  */
	Ev::Io<AddressResult> fresh_address() {
		auto next = std::make_shared<std::unique_ptr<std::uint32_t>>();
		return persister.next_derivation_index().then([this, next](std::unique_ptr<std::uint32_t> n) {
			*next = std::move(n);
			return persister.list_reserved_addresses();
		}).then([this, next](std::vector<Persist::ReservedAddress> reserved) -> Ev::Io<AddressResult> {
			auto& w = get_wallet();
			auto res = *next ? w.address_at(**next)
					 : w.next_unused_address()
					 ;
			auto taken = std::set<std::uint32_t>();
			for (auto const& r : reserved)
				taken.insert(r.derivation_index);
			auto skipped = false;
			while (taken.count(res.index) != 0) {
				res = w.address_at(res.index + 1);
				skipped = true;
			}
			auto log = Sdk::log( logger, Sdk::Debug
					   , "Got unused address %s with derivation index %u"
					   , res.address.c_str()
					   , (unsigned int) res.index
					   );
			if (*next && !skipped)
				return log + Ev::lift(res);
			return log
			     + persister.set_last_derivation_index(res.index)
			     + Ev::lift(res)
			     ;
		});
	}

	Ev::Io<Transaction>
	build_tx( double fee_rate
		, std::string const& recipient
		, std::string const& asset
		, std::uint64_t amount_sat
		) {
		return translate(wallet_lock.run(Ev::lift().then([ this
								 , fee_rate
								 , recipient
								 , asset
								 , amount_sat
								 ]() {
			check_recipient(recipient);
			check_asset(asset);
			auto pset = get_wallet().build_tx( recipient
							 , asset
							 , amount_sat
							 , effective_fee_rate(fee_rate)
							 );
			return Ev::lift(sign_and_finalize(std::move(pset)));
		})));
	}

	Ev::Io<Transaction>
	build_drain_tx( double fee_rate
		      , std::string const& recipient
		      , bool enforce
		      , std::uint64_t enforce_amount_sat
		      ) {
		return translate(wallet_lock.run(Ev::lift().then([ this
								 , fee_rate
								 , recipient
								 , enforce
								 , enforce_amount_sat
								 ]() {
			check_recipient(recipient);
			auto& w = get_wallet();
			auto pset = w.build_drain( recipient
						 , effective_fee_rate(fee_rate)
						 );
			if (enforce) {
				auto details = w.get_details(pset);
				auto it = details.balance.find(w.policy_asset());
				auto delta = (it == details.balance.end()) ?
					std::int64_t(0) : it->second;
				auto outflow = -delta - std::int64_t(details.fee);
				if ( outflow < 0
				  || std::uint64_t(outflow) != enforce_amount_sat
				   )
					throw Sdk::PaymentError::generic(Util::Str::fmt(
						"Drain tx amount %lld sat doesn't match "
						"enforce_amount_sat %llu sat"
					      , (long long) outflow
					      , (unsigned long long) enforce_amount_sat
					));
			}
			return Ev::lift(sign_and_finalize(std::move(pset)));
		})));
	}
};

OnchainWallet::OnchainWallet(std::unique_ptr<Impl> pimpl_)
	: pimpl(std::move(pimpl_)) { }
OnchainWallet::~OnchainWallet() =default;

Ev::Io<std::unique_ptr<OnchainWallet>>
OnchainWallet::create( Sdk::Config const& config
		     , Persist::Persister& persister
		     , std::shared_ptr<Signer::UserSignerIF> user_signer
		     , DescriptorWalletFactoryIF& wallet_factory
		     , ChainClientFactoryIF& client_factory
		     , Sdk::LoggerIF& logger
		     ) {
	auto pconfig = std::make_shared<Sdk::Config>(config);
	auto ppersister = &persister;
	auto pwallet_factory = &wallet_factory;
	auto pclient_factory = &client_factory;
	auto plogger = &logger;
	auto holder = std::make_shared<std::unique_ptr<Impl>>();

	return Ev::lift().then([ pconfig, ppersister, user_signer
			       , pwallet_factory, pclient_factory, plogger
			       , holder
			       ]() {
		try {
			*holder = Util::make_unique<Impl>( *pconfig
							 , *ppersister
							 , user_signer
							 , *pwallet_factory
							 , *pclient_factory
							 , *plogger
							 );
		} catch (Signer::SignerError const& e) {
			throw Sdk::PaymentError::signer_error(e.what());
		}
		auto& impl = **holder;
		return impl.translate(impl.open_store());
	}).then([holder]() {
		return Ev::lift(std::unique_ptr<OnchainWallet>(
			new OnchainWallet(std::move(*holder))
		));
	});
}

std::string const& OnchainWallet::descriptor() const {
	return pimpl->descriptor;
}

Ev::Io<std::vector<WalletTx>> OnchainWallet::transactions() {
	return pimpl->wallet_lock.run(Ev::lift().then([this]() {
		try {
			return Ev::lift(pimpl->get_wallet().transactions());
		} catch (StoreError const& e) {
			throw Sdk::PaymentError::generic(
				std::string("Failed to fetch wallet transactions: ")
				+ e.what()
			);
		}
	}));
}

Ev::Io<std::map<std::string, WalletTx>>
OnchainWallet::transactions_by_tx_id() {
	return transactions().then([](std::vector<WalletTx> txs) {
		auto rv = std::map<std::string, WalletTx>();
		for (auto& tx : txs) {
			auto txid = tx.txid;
			rv[txid] = std::move(tx);
		}
		return Ev::lift(std::move(rv));
	});
}

Ev::Io<Transaction>
OnchainWallet::build_tx( double fee_rate
		       , std::string const& recipient
		       , std::string const& asset
		       , std::uint64_t amount_sat
		       ) {
	return pimpl->build_tx(fee_rate, recipient, asset, amount_sat);
}

Ev::Io<Transaction>
OnchainWallet::build_drain_tx( double fee_rate
			     , std::string const& recipient
			     , std::unique_ptr<std::uint64_t> enforce_amount_sat
			     ) {
	auto enforce = bool(enforce_amount_sat);
	auto amount = enforce ? *enforce_amount_sat : std::uint64_t(0);
	return pimpl->build_drain_tx(fee_rate, recipient, enforce, amount);
}

Ev::Io<Transaction>
OnchainWallet::build_tx_or_drain_tx( double fee_rate
				   , std::string const& recipient
				   , std::string const& asset
				   , std::uint64_t amount_sat
				   ) {
	return pimpl->build_tx( fee_rate, recipient, asset, amount_sat
			      ).catching<Sdk::PaymentError>([ this
							    , fee_rate
							    , recipient
							    , asset
							    , amount_sat
							    ](Sdk::PaymentError const& e) -> Ev::Io<Transaction> {
		if ( e.get_kind() != Sdk::PaymentError::Kind::InsufficientFunds
		  || asset != pimpl->config.policy_asset
		   )
			throw e;
		return Sdk::log( pimpl->logger, Sdk::Warn
			       , "Cannot build tx due to insufficient funds, "
				 "attempting to build drain tx"
			       )
		     + pimpl->build_drain_tx( fee_rate, recipient
					    , true, amount_sat
					    );
	});
}

Ev::Io<AddressResult> OnchainWallet::next_unused_address() {
	return pimpl->translate(pimpl->get_tip().then([this](std::uint32_t tip) {
		return pimpl->persister.next_expired_reserved_address(tip);
	}).then([this](std::unique_ptr<Persist::ReservedAddress> reserved) -> Ev::Io<AddressResult> {
		if (!reserved)
			return pimpl->wallet_lock.run(pimpl->fresh_address());
		if (!Bitcoin::is_address_for( reserved->address
					    , Bitcoin::Chain::Liquid
					    , net_of(pimpl->config.network)
					    ))
			throw Sdk::PaymentError::generic(
				"Reserved address " + reserved->address
				+ " is not a valid ElementsAddress"
			);
		return Sdk::log( pimpl->logger, Sdk::Debug
			       , "Got reserved address %s that expired on "
				 "block height %u"
			       , reserved->address.c_str()
			       , (unsigned int) reserved->expiry_block_height
			       )
		     + Ev::lift(AddressResult{ reserved->address
					     , reserved->derivation_index
					     })
		     ;
	}));
}

Ev::Io<void>
OnchainWallet::reserve_address( AddressResult const& address
			      , std::uint32_t expiry_block_height
			      ) {
	auto reserved = Persist::ReservedAddress{ address.address
						, address.index
						, expiry_block_height
						};
	return pimpl->translate(
		pimpl->persister.insert_or_update_reserved_address(reserved)
	      + Sdk::log( pimpl->logger, Sdk::Debug
			, "Reserved address %s until block height %u"
			, address.address.c_str()
			, (unsigned int) expiry_block_height
			)
	);
}

Ev::Io<std::size_t> OnchainWallet::release_used_addresses() {
	auto paid = std::make_shared<std::set<std::string>>();
	return pimpl->translate(transactions().then([this, paid](std::vector<WalletTx> txs) {
		for (auto const& tx : txs)
			for (auto const& out : tx.outputs)
				paid->insert(out.script_pubkey);
		return pimpl->persister.list_reserved_addresses();
	}).then([this, paid](std::vector<Persist::ReservedAddress> reserved) {
		auto act = Ev::lift();
		auto count = std::size_t(0);
		for (auto const& r : reserved) {
			auto script = std::string();
			try {
				script = Util::Str::hexdump(
					Bitcoin::addr_to_scriptPubKey(r.address)
				);
			} catch (Bitcoin::UnknownAddrType const&) {
				/* Unusable, so drop it as well.  */
				act = act + Sdk::log( pimpl->logger, Sdk::Warn
						    , "Dropping unparseable reserved "
						      "address %s"
						    , r.address.c_str()
						    );
			}
			if (!script.empty() && paid->count(script) == 0)
				continue;
			act = act
			    + pimpl->persister.delete_reserved_address(r.address)
			    + Sdk::log( pimpl->logger, Sdk::Debug
				      , "Released used reserved address %s"
				      , r.address.c_str()
				      )
			    ;
			++count;
		}
		return act + Ev::lift(count);
	}));
}

Ev::Io<std::uint32_t> OnchainWallet::tip() {
	return pimpl->translate(pimpl->get_tip());
}

Ev::Io<std::uint64_t> OnchainWallet::balance_sat() {
	return pimpl->translate(pimpl->wallet_lock.run(Ev::lift().then([this]() -> Ev::Io<std::uint64_t> {
		auto& w = pimpl->get_wallet();
		auto balance = w.balance();
		auto it = balance.find(w.policy_asset());
		if (it == balance.end())
			return Ev::lift(std::uint64_t(0));
		return Ev::lift(it->second);
	})));
}

std::string OnchainWallet::pubkey() {
	return std::string(pimpl->signer.pubkey());
}
std::string OnchainWallet::fingerprint() {
	return pimpl->signer.fingerprint();
}

std::string OnchainWallet::sign_message(std::string const& msg) {
	try {
		return Wallet::sign_message(pimpl->signer, msg);
	} catch (Signer::SignerError const& e) {
		throw Sdk::PaymentError::signer_error(e.what());
	}
}
bool OnchainWallet::check_message( std::string const& msg
				 , std::string const& pubkey
				 , std::string const& signature
				 ) {
	return Wallet::check_message(msg, pubkey, signature);
}

Ev::Io<void> OnchainWallet::full_scan() {
	auto started = std::make_shared<double>(0.0);
	return pimpl->translate(Ev::lift().then([this, started]() {
		*started = Ev::now();
		return pimpl->client_lock.run(pimpl->ensure_client().then([this]() {
			return pimpl->persister.get_last_derivation_index();
		}).then([this](std::unique_ptr<std::uint32_t> last) {
			/* Scan past the last known index so that
			 * addresses derived just after it are found.  */
			auto last_index = last ? *last : std::uint32_t(0);
			auto ceiling = last_index + pimpl->config.scan_buffer;
			return Sdk::log( pimpl->logger, Sdk::Debug
				       , "Full scan to derivation index %u"
				       , (unsigned int) ceiling
				       )
			     + pimpl->wallet_lock.run(pimpl->scan_to(ceiling))
			     + pimpl->persister.set_last_scanned_derivation_index(
					last_index
			       )
			     ;
		}));
	}).then([this, started]() {
		auto ms = (Ev::now() - *started) * 1000.0;
		return Sdk::log( pimpl->logger, Sdk::Info
			       , "Wallet full scan duration: (%.0f ms)"
			       , ms
			       );
	}));
}

Ev::Io<std::vector<WalletTx>>
OnchainWallet::script_transactions(std::vector<std::string> const& scripts) {
	return pimpl->translate(pimpl->client_lock.run(pimpl->ensure_client().then([this, scripts]() {
		return pimpl->client->script_transactions(scripts);
	})));
}

Ev::Io<std::string> OnchainWallet::broadcast(std::string const& tx_hex) {
	return pimpl->translate(pimpl->client_lock.run(pimpl->ensure_client().then([this, tx_hex]() {
		return pimpl->client->broadcast(tx_hex);
	})));
}

Ev::Io<void> OnchainWallet::empty_wallet_cache() {
	return pimpl->translate(pimpl->wallet_lock.run(Ev::lift().then([this]() {
		pimpl->wallet.reset();
		pimpl->wallet_factory.wipe(pimpl->store_dir);
		pimpl->get_wallet();
		return Sdk::log( pimpl->logger, Sdk::Info
			       , "Emptied wallet cache at %s"
			       , pimpl->store_dir.c_str()
			       );
	})));
}

}
