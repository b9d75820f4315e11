#ifndef TESTS_MOCK_FIXTURE_HPP
#define TESTS_MOCK_FIXTURE_HPP

#include"Persist/Persister.hpp"
#include"Sdk/Config.hpp"
#include"Signer/KeySigner.hpp"
#include"Sqlite3.hpp"
#include"Wallet/OnchainWallet.hpp"
#include"tests/mock/Wallet.hpp"

namespace Mock {

/* A real on-chain wallet over the mock library,
 * an in-memory store, and a regtest key signer
 * holding 100,050 sat.  */
struct Fixture {
	State state;
	DescriptorWalletFactory wallet_factory;
	ChainClientFactory client_factory;
	Logger logger;
	Persist::Persister persister;
	Sdk::Config config;
	std::unique_ptr<Wallet::OnchainWallet> wallet;

	Fixture() : state(Sdk::Config::regtest().policy_asset)
		  , wallet_factory(state)
		  , client_factory(state)
		  , persister(Sqlite3::Db(":memory:"))
		  , config(Sdk::Config::regtest())
		  {
		state.balance[state.policy_asset] = 100050;
	}

	Ev::Io<void> open() {
		auto signer = std::make_shared<Signer::KeySigner>(
			std::vector<std::uint8_t>(32, 0x42), false
		);
		return Wallet::OnchainWallet::create( config
						    , persister
						    , signer
						    , wallet_factory
						    , client_factory
						    , logger
						    ).then([this](std::unique_ptr<Wallet::OnchainWallet> w) {
			wallet = std::move(w);
			return Ev::lift();
		});
	}
	std::string const& policy() const { return config.policy_asset; }
};

}

#endif /* !defined(TESTS_MOCK_FIXTURE_HPP) */
