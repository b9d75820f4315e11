#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Persist/Persister.hpp"
#include"Sdk/LiquidSdk.hpp"
#include"Sdk/PaymentError.hpp"
#include"Sdk/SwapperIF.hpp"
#include"Sdk/invoice.hpp"
#include"Signer/KeySigner.hpp"
#include"Sqlite3.hpp"
#include"Util/Bech32.hpp"
#include"Wallet/OnchainWallet.hpp"
#include"tests/mock/Wallet.hpp"
#include<assert.h>
#include<sys/stat.h>
#include<unistd.h>

using Kind = Sdk::PaymentError::Kind;

namespace {

/* Regtest invoice for the given amount.  */
std::string invoice_for(std::uint64_t amount_sat) {
	auto values = std::vector<std::uint8_t>(7 + 104, 0);
	for (auto i = std::size_t(0); i < values.size(); ++i)
		values[i] = std::uint8_t((i * 7) % 32);
	/* A nano-bitcoin is 100 millisatoshi.  */
	auto hrp = "lnbcrt" + std::to_string(amount_sat * 10) + "n";
	return Util::Bech32::encode(Util::Bech32::Encoding::Bech32, hrp, values);
}

class Swapper : public Sdk::SwapperIF {
public:
	std::unique_ptr<Sdk::SwapPair> receive;
	std::unique_ptr<Sdk::SwapPair> send;
	/* Added to the invoice amount of new receive swaps.  */
	std::uint64_t invoice_skew;
	/* Added to the amount expected by new send swaps.  */
	std::uint64_t lockup_skew;
	unsigned created;
	std::string last_claim_address;
	std::string last_refund_address;

	Swapper() : invoice_skew(0), lockup_skew(0), created(0) {
		receive = Util::make_unique<Sdk::SwapPair>(
			Sdk::SwapPair{1000, 1000000, 0.25, 100}
		);
		send = Util::make_unique<Sdk::SwapPair>(
			Sdk::SwapPair{1000, 1000000, 0.1, 19}
		);
	}

	Ev::Io<std::unique_ptr<Sdk::SwapPair>> receive_pair() override {
		if (!receive)
			return Ev::lift(std::unique_ptr<Sdk::SwapPair>());
		return Ev::lift(Util::make_unique<Sdk::SwapPair>(*receive));
	}
	Ev::Io<std::unique_ptr<Sdk::SwapPair>> send_pair() override {
		if (!send)
			return Ev::lift(std::unique_ptr<Sdk::SwapPair>());
		return Ev::lift(Util::make_unique<Sdk::SwapPair>(*send));
	}

	Ev::Io<Sdk::CreatedReceiveSwap>
	create_receive_swap( std::uint64_t payer_amount_sat
			   , std::string const& claim_address
			   ) override {
		last_claim_address = claim_address;
		auto rv = Sdk::CreatedReceiveSwap();
		rv.id = "receive-" + std::to_string(++created);
		rv.invoice = invoice_for(payer_amount_sat + invoice_skew);
		rv.lockup_script = "0020" + std::string(64, 'a');
		rv.refund_script = Mock::ert_script(0xEE);
		rv.timeout_height = 1500;
		return Ev::lift(rv);
	}
	Ev::Io<Sdk::CreatedSendSwap>
	create_send_swap( std::string const& invoice
			, std::string const& refund_address
			) override {
		last_refund_address = refund_address;
		auto amount = Sdk::parse_invoice(invoice, Sdk::Network::Regtest).amount_sat;
		auto rv = Sdk::CreatedSendSwap();
		rv.id = "send-" + std::to_string(++created);
		rv.lockup_address = Mock::ert_address(0xAA);
		rv.expected_amount_sat = amount + send->fees_for(amount) + lockup_skew;
		rv.lockup_script = Mock::ert_script(0xAA);
		rv.timeout_height = 1400;
		return Ev::lift(rv);
	}
};

struct Harness {
	Mock::State state;
	Mock::DescriptorWalletFactory wallet_factory;
	Mock::ChainClientFactory client_factory;
	Mock::Logger logger;
	Swapper swapper;
	Sdk::Config config;
	/* Still owned by the SDK.  */
	Persist::Persister* store;
	std::unique_ptr<Sdk::LiquidSdk> sdk;

	Harness() : state(Sdk::Config::regtest().policy_asset)
		  , wallet_factory(state)
		  , client_factory(state)
		  , config(Sdk::Config::regtest())
		  , store(nullptr)
		  {
		state.balance[state.policy_asset] = 100050;
	}

	Ev::Io<void> open() {
		auto persister = std::make_shared<std::unique_ptr<Persist::Persister>>(
			Util::make_unique<Persist::Persister>(Sqlite3::Db(":memory:"))
		);
		store = persister->get();
		auto signer = std::make_shared<Signer::KeySigner>(
			std::vector<std::uint8_t>(32, 0x42), false
		);
		return Wallet::OnchainWallet::create( config
						    , **persister
						    , signer
						    , wallet_factory
						    , client_factory
						    , logger
						    ).then([this, persister](std::unique_ptr<Wallet::OnchainWallet> w) {
			sdk = Util::make_unique<Sdk::LiquidSdk>( config
							       , std::move(*persister)
							       , std::move(w)
							       , swapper
							       , logger
							       );
			return Ev::lift();
		});
	}

	Ev::Io<Persist::SwapRecord> swap(std::string const& id) {
		return store->load_swap(id).then([](std::unique_ptr<Persist::SwapRecord> s) {
			assert(s);
			return Ev::lift(*s);
		});
	}
};

Ev::Io<void> test_info() {
	auto h = std::make_shared<Harness>();
	return h->open().then([h]() {
		return h->sdk->get_info(Sdk::GetInfoRequest{false});
	}).then([h](Sdk::GetInfoResponse info) {
		assert(h->state.scans.empty());
		assert(info.balance_sat == 100050);
		assert(info.pending_send_sat == 0);
		assert(info.pending_receive_sat == 0);
		assert(info.pubkey.size() == 66);
		h->state.balance[h->state.policy_asset] = 70000;
		return h->sdk->get_info(Sdk::GetInfoRequest{true});
	}).then([h](Sdk::GetInfoResponse info) {
		/* Scanned before reporting.  */
		assert(h->state.scans.size() == 1);
		assert(info.balance_sat == 70000);
		return Ev::lift();
	});
}

Ev::Io<void> test_receive() {
	auto h = std::make_shared<Harness>();
	return h->open().then([h]() {
		return h->sdk->prepare_receive_payment(Sdk::PrepareReceiveRequest{100000});
	}).then([h](Sdk::PrepareReceiveResponse prep) {
		assert(prep.payer_amount_sat == 100000);
		/* 0.25% of the amount plus miner fees.  */
		assert(prep.fees_sat == 350);
		return h->sdk->receive_payment(prep);
	}).then([h](Sdk::ReceivePaymentResponse res) {
		assert(res.id == "receive-1");
		assert(res.invoice == invoice_for(100000));
		assert(h->swapper.last_claim_address == Mock::ert_address(1));
		return h->swap("receive-1");
	}).then([h](Persist::SwapRecord s) {
		assert(s.kind == Persist::SwapKind::Receive);
		assert(s.state == Persist::SwapState::Created);
		assert(s.amount_sat == 99650);
		assert(s.fees_sat == 350);
		assert(s.invoice == invoice_for(100000));
		assert(s.server_leg.claim_script == Mock::ert_script(1));
		assert(s.server_leg.refund_script == Mock::ert_script(0xEE));
		assert(s.server_leg.timeout_height == 1500);
		assert(h->logger.has(Sdk::Info, "Created receive swap receive-1"));

		/* Fees moved since preparing.  */
		h->swapper.receive->miner_fees_sat = 150;
		auto stale = Sdk::PrepareReceiveResponse();
		stale.payer_amount_sat = 100000;
		stale.fees_sat = 350;
		return Mock::capture_error(h->sdk->receive_payment(stale));
	}).then([h](std::unique_ptr<Sdk::PaymentError> e) {
		assert(e);
		assert(e->get_kind() == Kind::InvalidOrExpiredFees);
		assert(h->swapper.created == 1);

		/* The counterparty hands out an invoice for
		 * another amount.  */
		h->swapper.invoice_skew = 1;
		return h->sdk->prepare_receive_payment(Sdk::PrepareReceiveRequest{50000});
	}).then([h](Sdk::PrepareReceiveResponse prep) {
		return Mock::capture_error(h->sdk->receive_payment(prep));
	}).then([h](std::unique_ptr<Sdk::PaymentError> e) {
		assert(e);
		assert(e->get_kind() == Kind::InvalidInvoice);
		return h->store->list_swaps();
	}).then([h](std::vector<Persist::SwapRecord> swaps) {
		assert(swaps.size() == 1);

		return Mock::capture_error(h->sdk->prepare_receive_payment(
			Sdk::PrepareReceiveRequest{999}
		));
	}).then([h](std::unique_ptr<Sdk::PaymentError> e) {
		assert(e->get_kind() == Kind::AmountOutOfRange);
		return Mock::capture_error(h->sdk->prepare_receive_payment(
			Sdk::PrepareReceiveRequest{1000001}
		));
	}).then([h](std::unique_ptr<Sdk::PaymentError> e) {
		assert(e->get_kind() == Kind::AmountOutOfRange);
		/* Fees would eat the whole amount.  */
		h->swapper.receive->miner_fees_sat = 5000;
		return Mock::capture_error(h->sdk->prepare_receive_payment(
			Sdk::PrepareReceiveRequest{4000}
		));
	}).then([h](std::unique_ptr<Sdk::PaymentError> e) {
		assert(e->get_kind() == Kind::AmountOutOfRange);
		h->swapper.receive.reset();
		return Mock::capture_error(h->sdk->prepare_receive_payment(
			Sdk::PrepareReceiveRequest{100000}
		));
	}).then([](std::unique_ptr<Sdk::PaymentError> e) {
		assert(e->get_kind() == Kind::PairsNotFound);
		return Ev::lift();
	});
}

/* The claim address stays reserved until the swap
 * times out, and is released once a sync sees it paid.  */
Ev::Io<void> test_claim_address_reservation() {
	auto h = std::make_shared<Harness>();
	return h->open().then([h]() {
		return h->sdk->prepare_receive_payment(Sdk::PrepareReceiveRequest{100000});
	}).then([h](Sdk::PrepareReceiveResponse prep) {
		return h->sdk->receive_payment(prep);
	}).then([h](Sdk::ReceivePaymentResponse) {
		return h->store->list_reserved_addresses();
	}).then([h](std::vector<Persist::ReservedAddress> rs) {
		assert(rs.size() == 1);
		assert(rs[0].address == Mock::ert_address(1));
		assert(rs[0].derivation_index == 0);
		assert(rs[0].expiry_block_height == 1500);
		return h->sdk->sync();
	}).then([h]() {
		return h->store->list_reserved_addresses();
	}).then([h](std::vector<Persist::ReservedAddress> rs) {
		/* Nothing paid it yet.  */
		assert(rs.size() == 1);
		auto paid = Wallet::WalletTx();
		paid.txid = "claimed";
		paid.height = 101;
		paid.timestamp = 0;
		paid.fee = 0;
		paid.outputs.push_back(Wallet::TxIo{ "", 0
						   , Mock::ert_script(1)
						   , h->state.policy_asset, 99650
						   , true
						   });
		h->state.wallet_txs.push_back(paid);
		return h->sdk->get_info(Sdk::GetInfoRequest{true});
	}).then([h](Sdk::GetInfoResponse) {
		assert(h->logger.has(Sdk::Debug, "Released 1 used address reservation"));
		return h->store->list_reserved_addresses();
	}).then([](std::vector<Persist::ReservedAddress> rs) {
		assert(rs.empty());
		return Ev::lift();
	});
}

Ev::Io<void> test_send() {
	auto h = std::make_shared<Harness>();
	auto first = invoice_for(50000);
	auto second = invoice_for(40000);
	return h->open().then([h, first]() {
		return h->sdk->prepare_send_payment(Sdk::PrepareSendRequest{first});
	}).then([h, first](Sdk::PrepareSendResponse prep) {
		assert(prep.invoice == first);
		/* 0.1% of the amount plus miner fees.  */
		assert(prep.fees_sat == 69);
		return h->sdk->send_payment(prep);
	}).then([h](Sdk::SendPaymentResponse res) {
		assert(res.txid.find("txid-tx-") == 0);
		assert(h->state.broadcasts.size() == 1);
		assert(h->swapper.last_refund_address == Mock::ert_address(1));
		return h->swap("send-1").then([res](Persist::SwapRecord s) {
			assert(s.kind == Persist::SwapKind::Send);
			assert(s.state == Persist::SwapState::WaitingConfirmation);
			assert(s.user_leg.state == Persist::SwapState::WaitingConfirmation);
			assert(s.user_leg.lockup_tx_id == res.txid);
			assert(s.user_leg.refund_script == Mock::ert_script(1));
			assert(s.amount_sat == 50000);
			assert(s.fees_sat == 69);
			return Ev::lift();
		});
	}).then([h]() {
		return h->sdk->get_info(Sdk::GetInfoRequest{false});
	}).then([h, first](Sdk::GetInfoResponse info) {
		assert(info.pending_send_sat == 50069);
		assert(info.pending_receive_sat == 0);

		/* Same invoice while the first is in flight.  */
		return Mock::capture_error(h->sdk->send_payment(
			Sdk::PrepareSendResponse{first, 69}
		));
	}).then([h](std::unique_ptr<Sdk::PaymentError> e) {
		assert(e);
		assert(e->get_kind() == Kind::Generic);
		assert(e->get_err().find("send-1") != std::string::npos);
		return h->swap("send-1");
	}).then([h, first](Persist::SwapRecord s) {
		s.state = Persist::SwapState::Complete;
		s.user_leg.state = Persist::SwapState::Complete;
		return h->store->save_swap(s)
		     + Mock::capture_error(h->sdk->send_payment(
			Sdk::PrepareSendResponse{first, 69}
		       ));
	}).then([h](std::unique_ptr<Sdk::PaymentError> e) {
		assert(e->get_kind() == Kind::AlreadyClaimed);
		assert(h->state.broadcasts.size() == 1);

		/* Stale fees.  */
		return Mock::capture_error(h->sdk->send_payment(
			Sdk::PrepareSendResponse{invoice_for(40000), 68}
		));
	}).then([h, second](std::unique_ptr<Sdk::PaymentError> e) {
		assert(e->get_kind() == Kind::InvalidOrExpiredFees);

		/* Counterparty asks for more than quoted.  */
		h->swapper.lockup_skew = 1;
		return Mock::capture_error(h->sdk->send_payment(
			Sdk::PrepareSendResponse{second, 59}
		));
	}).then([h, second](std::unique_ptr<Sdk::PaymentError> e) {
		assert(e->get_kind() == Kind::InvalidOrExpiredFees);
		h->swapper.lockup_skew = 0;

		/* The lockup cannot be broadcast.  */
		h->state.broadcast_fails = true;
		return Mock::capture_error(h->sdk->send_payment(
			Sdk::PrepareSendResponse{second, 59}
		));
	}).then([h](std::unique_ptr<Sdk::PaymentError> e) {
		assert(e->get_kind() == Kind::SendError);
		assert(h->logger.has(Sdk::Warn, "Send swap send-3 failed"));
		return h->swap("send-3");
	}).then([h, second](Persist::SwapRecord s) {
		assert(s.state == Persist::SwapState::Failed);
		assert(!s.failure_reason.empty());
		assert(s.user_leg.lockup_tx_id.empty());

		/* A failed attempt does not block a retry.  */
		h->state.broadcast_fails = false;
		return h->sdk->send_payment(Sdk::PrepareSendResponse{second, 59});
	}).then([h](Sdk::SendPaymentResponse res) {
		assert(h->state.broadcasts.size() == 2);
		return h->swap("send-4");
	}).then([h, second](Persist::SwapRecord s) {
		s.state = Persist::SwapState::Refunded;
		s.user_leg.state = Persist::SwapState::Refunded;
		s.user_leg.refund_tx_id = "beef";
		return h->store->save_swap(s)
		     + Mock::capture_error(h->sdk->send_payment(
			Sdk::PrepareSendResponse{second, 59}
		       ));
	}).then([h](std::unique_ptr<Sdk::PaymentError> e) {
		assert(e->get_kind() == Kind::Refunded);
		assert(e->get_refund_tx_id() == "beef");

		/* Not enough to pay at all.  */
		h->state.balance[h->state.policy_asset] = 40;
		return Mock::capture_error(h->sdk->send_payment(
			Sdk::PrepareSendResponse{invoice_for(30000), 49}
		));
	}).then([h](std::unique_ptr<Sdk::PaymentError> e) {
		assert(e->get_kind() == Kind::InsufficientFunds);
		return h->swap("send-5");
	}).then([h](Persist::SwapRecord s) {
		assert(s.state == Persist::SwapState::Failed);

		return Mock::capture_error(h->sdk->prepare_send_payment(
			Sdk::PrepareSendRequest{"lnbc1qqqqq"}
		));
	}).then([h](std::unique_ptr<Sdk::PaymentError> e) {
		assert(e->get_kind() == Kind::InvalidInvoice);
		return Mock::capture_error(h->sdk->prepare_send_payment(
			Sdk::PrepareSendRequest{invoice_for(999)}
		));
	}).then([h](std::unique_ptr<Sdk::PaymentError> e) {
		assert(e->get_kind() == Kind::AmountOutOfRange);
		h->swapper.send.reset();
		return Mock::capture_error(h->sdk->prepare_send_payment(
			Sdk::PrepareSendRequest{invoice_for(20000)}
		));
	}).then([](std::unique_ptr<Sdk::PaymentError> e) {
		assert(e->get_kind() == Kind::PairsNotFound);
		return Ev::lift();
	});
}

Wallet::WalletTx make_tx( std::string const& txid
			      , std::uint32_t timestamp
			      , std::string const& asset
			      , std::int64_t net
			      , std::uint64_t fee
			      , std::uint32_t height
			      ) {
	auto rv = Wallet::WalletTx();
	rv.txid = txid;
	rv.height = height;
	rv.timestamp = timestamp;
	rv.balance[asset] = net;
	rv.fee = fee;
	return rv;
}

Ev::Io<void> test_list_payments() {
	auto h = std::make_shared<Harness>();
	auto lockup = std::make_shared<std::string>();
	return h->open().then([h]() {
		return h->sdk->list_payments();
	}).then([h](std::vector<Sdk::Payment> ps) {
		assert(ps.empty());
		return h->sdk->prepare_receive_payment(Sdk::PrepareReceiveRequest{100000});
	}).then([h](Sdk::PrepareReceiveResponse prep) {
		return h->sdk->receive_payment(prep);
	}).then([h](Sdk::ReceivePaymentResponse) {
		return h->sdk->send_payment(Sdk::PrepareSendResponse{invoice_for(50000), 69});
	}).then([h, lockup](Sdk::SendPaymentResponse res) {
		*lockup = res.txid;
		auto const& policy = h->state.policy_asset;
		h->state.wallet_txs = {
			make_tx("in", 1000, policy, 20000, 0, 90),
			make_tx("out", 2000, policy, -5100, 100, 0),
			/* Belongs to the send swap.  */
			make_tx(res.txid, 3000, policy, -50169, 100, 0)
		};
		return h->sdk->list_payments();
	}).then([h, lockup](std::vector<Sdk::Payment> ps) {
		assert(ps.size() == 4);
		/* Swaps were created now, long after the
		 * plain transactions.  */
		auto send = ps[0].swap_id == "send-2" ? ps[0] : ps[1];
		auto receive = ps[0].swap_id == "send-2" ? ps[1] : ps[0];
		assert(send.swap_id == "send-2");
		assert(send.payment_type == Sdk::PaymentType::Send);
		assert(send.status == Sdk::PaymentState::Pending);
		assert(send.tx_id == *lockup);
		assert(send.amount_sat == 50000);
		assert(send.fees_sat == 69);
		assert(receive.swap_id == "receive-1");
		assert(receive.payment_type == Sdk::PaymentType::Receive);
		assert(receive.status == Sdk::PaymentState::Created);
		assert(receive.tx_id.empty());
		assert(receive.amount_sat == 99650);

		assert(ps[2].tx_id == "out");
		assert(ps[2].payment_type == Sdk::PaymentType::Send);
		assert(ps[2].amount_sat == 5000);
		assert(ps[2].fees_sat == 100);
		assert(ps[2].status == Sdk::PaymentState::Pending);
		assert(ps[2].swap_id.empty());

		assert(ps[3].tx_id == "in");
		assert(ps[3].payment_type == Sdk::PaymentType::Receive);
		assert(ps[3].amount_sat == 20000);
		assert(ps[3].fees_sat == 0);
		assert(ps[3].status == Sdk::PaymentState::Complete);
		return Ev::lift();
	});
}

Ev::Io<void> test_backup() {
	auto h = std::make_shared<Harness>();
	auto dir = std::make_shared<std::string>(
		"/tmp/test_liquidsdk_" + std::to_string(getpid())
	);
	mkdir(dir->c_str(), 0700);
	h->config.working_dir = *dir;
	return h->open().then([h]() {
		return h->sdk->prepare_receive_payment(Sdk::PrepareReceiveRequest{100000});
	}).then([h](Sdk::PrepareReceiveResponse prep) {
		return h->sdk->receive_payment(prep);
	}).then([h](Sdk::ReceivePaymentResponse) {
		/* Default location.  */
		return h->sdk->backup(Sdk::BackupRequest{""});
	}).then([h, dir]() {
		assert(access((*dir + "/backup.sql").c_str(), F_OK) == 0);
		assert(h->logger.has(Sdk::Info, "Backup written to " + *dir + "/backup.sql"));
		return h->swap("receive-1");
	}).then([h](Persist::SwapRecord s) {
		s.state = Persist::SwapState::Failed;
		s.failure_reason = "dropped";
		return h->store->save_swap(s)
		     + h->sdk->restore(Sdk::RestoreRequest{""})
		     + h->swap("receive-1");
	}).then([h](Persist::SwapRecord s) {
		assert(s.state == Persist::SwapState::Created);
		assert(s.failure_reason.empty());

		return Mock::capture_error(h->sdk->restore(
			Sdk::RestoreRequest{"/nonexistent/dir/backup.sql"}
		));
	}).then([h, dir](std::unique_ptr<Sdk::PaymentError> e) {
		assert(e);
		assert(e->get_kind() == Kind::PersistError);
		assert(h->logger.has(Sdk::Error, "Store failure"));

		unlink((*dir + "/backup.sql").c_str());
		rmdir(dir->c_str());

		return h->sdk->empty_wallet_cache();
	}).then([h]() {
		assert(h->state.wipes == 1);
		return Ev::lift();
	});
}

Ev::Io<void> test_connect() {
	auto h = std::make_shared<Harness>();
	auto dir = std::make_shared<std::string>(
		"/tmp/test_liquidsdk_connect_" + std::to_string(getpid())
	);
	mkdir(dir->c_str(), 0700);
	h->config.working_dir = *dir;
	auto signer = std::make_shared<Signer::KeySigner>(
		std::vector<std::uint8_t>(32, 0x42), false
	);
	return Sdk::LiquidSdk::connect( h->config
				      , signer
				      , h->wallet_factory
				      , h->client_factory
				      , h->swapper
				      , h->logger
				      ).then([h](std::unique_ptr<Sdk::LiquidSdk> sdk) {
		assert(sdk);
		assert(h->state.opens == 1);
		assert(h->logger.has(Sdk::Info, "Connected on regtest"));
		h->sdk = std::move(sdk);
		return h->sdk->get_info(Sdk::GetInfoRequest{false});
	}).then([h, dir](Sdk::GetInfoResponse info) {
		assert(info.balance_sat == 100050);
		h->sdk.reset();
		unlink(h->config.storage_path().c_str());
		rmdir(dir->c_str());
		return Ev::lift();
	});
}

}

int main() {
	auto code = test_info()
		  + test_receive()
		  + test_claim_address_reservation()
		  + test_send()
		  + test_list_payments()
		  + test_backup()
		  + test_connect()
		  + Ev::lift(0)
		  ;
	return Ev::start(std::move(code));
}
