#ifndef TESTS_MOCK_WALLET_HPP
#define TESTS_MOCK_WALLET_HPP

/*
 * In-process stand-ins for the descriptor wallet
 * library and the chain client, shared by tests.
 * All behavior is driven by one `Mock::State`
 * owned by the test.
 */

#include"Ev/Io.hpp"
#include"Sdk/PaymentError.hpp"
#include"Sdk/log.hpp"
#include"Util/Bech32.hpp"
#include"Util/make_unique.hpp"
#include"Wallet/ChainClientIF.hpp"
#include"Wallet/DescriptorWalletIF.hpp"
#include<algorithm>
#include<cstdint>
#include<functional>
#include<map>
#include<memory>
#include<string>
#include<vector>

namespace Mock {

/* Liquid regtest unconfidential P2WPKH address
 * whose program is 20 copies of `fill`.  */
inline
std::string ert_address(std::uint8_t fill) {
	auto program = std::vector<std::uint8_t>(20, fill);
	auto conv = std::vector<std::uint8_t>();
	Util::Bech32::convert_bits(conv, program, 8, 5, true);
	auto values = std::vector<std::uint8_t>{0};
	values.insert(values.end(), conv.begin(), conv.end());
	return Util::Bech32::encode( Util::Bech32::Encoding::Bech32
				   , "ert", values
				   );
}
/* The scriptPubKey of `ert_address(fill)`, hex.  */
inline
std::string ert_script(std::uint8_t fill) {
	auto rv = std::string("0014");
	for (auto i = 0; i < 20; ++i)
		rv += std::string(1, "0123456789abcdef"[fill >> 4])
		    + std::string(1, "0123456789abcdef"[fill & 0xF])
		    ;
	return rv;
}

struct State {
	std::string policy_asset;
	std::map<std::string, std::uint64_t> balance;
	std::uint64_t build_fee;
	std::uint64_t drain_fee;
	std::uint32_t wallet_tip;
	std::vector<Wallet::WalletTx> wallet_txs;
	/* Index the wallet reports as first unused.  */
	std::uint32_t next_unused;

	/* Failures to inject.  */
	unsigned open_failures;
	unsigned too_old_failures;
	bool broadcast_fails;

	/* What happened.  */
	unsigned opens;
	unsigned wipes;
	unsigned connects;
	unsigned builds;
	unsigned drains;
	std::vector<std::uint32_t> scans;
	std::vector<std::string> broadcasts;

	/* Run inside each scan, after the update.  */
	std::function<Ev::Io<void>()> during_scan;

	/* What the chain client sees.  */
	std::uint32_t chain_tip;
	std::vector<Wallet::WalletTx> chain_txs;

	explicit
	State(std::string const& policy_asset_)
		: policy_asset(policy_asset_)
		, build_fee(100)
		, drain_fee(50)
		, wallet_tip(100)
		, next_unused(0)
		, open_failures(0)
		, too_old_failures(0)
		, broadcast_fails(false)
		, opens(0)
		, wipes(0)
		, connects(0)
		, builds(0)
		, drains(0)
		, chain_tip(100)
		{ }
};

class DescriptorWallet : public Wallet::DescriptorWalletIF {
private:
	State& s;
	std::map<std::string, Wallet::PsetDetails> details;
	unsigned counter;

	Wallet::Pset make_pset( std::string const& what
			      , Wallet::PsetDetails d
			      ) {
		auto pset = Wallet::Pset();
		pset.serialized = what + "-" + std::to_string(++counter);
		auto input = Wallet::PsetInput();
		input.sighash = std::string(64, '1');
		input.derivation_path = "m/84'/1'/0'/0/0";
		pset.inputs.push_back(input);
		details[pset.serialized] = std::move(d);
		return pset;
	}

public:
	explicit
	DescriptorWallet(State& s_) : s(s_), counter(0) { }

	Wallet::AddressResult address_at(std::uint32_t index) override {
		return Wallet::AddressResult{ert_address(std::uint8_t(index + 1)), index};
	}
	Wallet::AddressResult next_unused_address() override {
		return address_at(s.next_unused);
	}
	std::uint32_t tip() override { return s.wallet_tip; }
	std::vector<Wallet::WalletTx> transactions() override {
		return s.wallet_txs;
	}
	std::map<std::string, std::uint64_t> balance() override {
		return s.balance;
	}
	std::string policy_asset() override { return s.policy_asset; }

	Wallet::Pset build_tx( std::string const& recipient
			     , std::string const& asset
			     , std::uint64_t amount_sat
			     , double
			     ) override {
		++s.builds;
		auto available = s.balance[asset];
		auto fee = s.build_fee;
		if (asset == s.policy_asset) {
			if (amount_sat + fee > available)
				throw Wallet::InsufficientFunds();
		} else {
			if (amount_sat > available || s.balance[s.policy_asset] < fee)
				throw Wallet::InsufficientFunds();
		}
		auto d = Wallet::PsetDetails();
		d.fee = fee;
		if (asset == s.policy_asset)
			d.balance[asset] = -std::int64_t(amount_sat + fee);
		else {
			d.balance[asset] = -std::int64_t(amount_sat);
			d.balance[s.policy_asset] = -std::int64_t(fee);
		}
		return make_pset("tx-" + recipient, std::move(d));
	}
	Wallet::Pset build_drain( std::string const& recipient
				, double
				) override {
		++s.drains;
		auto available = s.balance[s.policy_asset];
		if (available <= s.drain_fee)
			throw Wallet::InsufficientFunds();
		auto d = Wallet::PsetDetails();
		d.fee = s.drain_fee;
		d.balance[s.policy_asset] = -std::int64_t(available);
		return make_pset("drain-" + recipient, std::move(d));
	}
	Wallet::PsetDetails get_details(Wallet::Pset const& pset) override {
		auto it = details.find(pset.serialized);
		if (it == details.end())
			throw Wallet::LibraryError("unknown pset");
		return it->second;
	}
	Wallet::Transaction finalize(Wallet::Pset const& pset) override {
		for (auto const& i : pset.inputs)
			if (i.signature.empty())
				throw Wallet::LibraryError("unsigned input");
		auto d = get_details(pset);
		auto rv = Wallet::Transaction();
		rv.txid = "txid-" + pset.serialized;
		rv.hex = pset.serialized;
		rv.balance = d.balance;
		rv.fee = d.fee;
		return rv;
	}

	Ev::Io<void> full_scan_to_index( Wallet::ChainClientIF& client
				       , std::uint32_t index
				       ) override {
		return client.tip().then([this, index](std::uint32_t) -> Ev::Io<void> {
			s.scans.push_back(index);
			if (s.too_old_failures > 0) {
				--s.too_old_failures;
				throw Wallet::UpdateHeightTooOld(10, 20);
			}
			s.wallet_tip = s.chain_tip;
			if (s.during_scan)
				return s.during_scan();
			return Ev::lift();
		});
	}
};

class DescriptorWalletFactory : public Wallet::DescriptorWalletFactoryIF {
private:
	State& s;
public:
	explicit
	DescriptorWalletFactory(State& s_) : s(s_) { }

	std::unique_ptr<Wallet::DescriptorWalletIF>
	open(std::string const&, std::string const&) override {
		++s.opens;
		if (s.open_failures > 0) {
			--s.open_failures;
			throw Wallet::StoreError("store is corrupt");
		}
		return Util::make_unique<DescriptorWallet>(s);
	}
	void wipe(std::string const&) override {
		++s.wipes;
	}
};

class ChainClient : public Wallet::ChainClientIF {
private:
	State& s;

	static
	bool touches( Wallet::WalletTx const& tx
		    , std::vector<std::string> const& scripts
		    ) {
		auto has = [&scripts](Wallet::TxIo const& io) {
			return std::find( scripts.begin(), scripts.end()
					, io.script_pubkey
					) != scripts.end();
		};
		return std::any_of(tx.inputs.begin(), tx.inputs.end(), has)
		    || std::any_of(tx.outputs.begin(), tx.outputs.end(), has)
		     ;
	}

public:
	explicit
	ChainClient(State& s_) : s(s_) { }

	Ev::Io<std::uint32_t> tip() override {
		return Ev::lift(s.chain_tip);
	}
	Ev::Io<std::vector<Wallet::WalletTx>>
	script_transactions(std::vector<std::string> const& scripts) override {
		auto rv = std::vector<Wallet::WalletTx>();
		for (auto const& tx : s.chain_txs)
			if (touches(tx, scripts))
				rv.push_back(tx);
		return Ev::lift(std::move(rv));
	}
	Ev::Io<std::string> broadcast(std::string const& tx_hex) override {
		return Ev::lift().then([this, tx_hex]() {
			if (s.broadcast_fails)
				throw Wallet::ChainClientError("bad-txns-inputs-missingorspent");
			s.broadcasts.push_back(tx_hex);
			return Ev::lift("txid-" + tx_hex);
		});
	}
};

class ChainClientFactory : public Wallet::ChainClientFactoryIF {
private:
	State& s;
public:
	explicit
	ChainClientFactory(State& s_) : s(s_) { }

	Ev::Io<std::unique_ptr<Wallet::ChainClientIF>>
	connect(std::string const&, bool, bool, std::uint32_t) override {
		++s.connects;
		return Ev::lift(std::unique_ptr<Wallet::ChainClientIF>(
			Util::make_unique<ChainClient>(s)
		));
	}
};

/* Keeps every message for inspection.  */
class Logger : public Sdk::LoggerIF {
public:
	std::vector<std::pair<Sdk::LogLevel, std::string>> messages;

	Ev::Io<void> log(Sdk::LogLevel l, std::string msg) override {
		messages.emplace_back(l, std::move(msg));
		return Ev::lift();
	}

	bool has(Sdk::LogLevel l, std::string const& part) const {
		return std::any_of( messages.begin(), messages.end()
				  , [l, &part](std::pair<Sdk::LogLevel, std::string> const& m) {
			return m.first == l
			    && m.second.find(part) != std::string::npos
			     ;
		});
	}
};

/* Completes with the payment error the action
 * failed with, or nullptr if it succeeded.  */
template<typename a>
Ev::Io<std::unique_ptr<Sdk::PaymentError>>
capture_error(Ev::Io<a> io) {
	return io.then([](a) {
		return Ev::lift(std::unique_ptr<Sdk::PaymentError>());
	}).template catching<Sdk::PaymentError>([](Sdk::PaymentError const& e) {
		return Ev::lift(Util::make_unique<Sdk::PaymentError>(e));
	});
}
inline
Ev::Io<std::unique_ptr<Sdk::PaymentError>>
capture_error(Ev::Io<void> io) {
	return io.then([]() {
		return Ev::lift(std::unique_ptr<Sdk::PaymentError>());
	}).catching<Sdk::PaymentError>([](Sdk::PaymentError const& e) {
		return Ev::lift(Util::make_unique<Sdk::PaymentError>(e));
	});
}

}

#endif /* !defined(TESTS_MOCK_WALLET_HPP) */
