#include"Bitcoin/addr_to_scriptPubKey.hpp"
#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"Persist/Persister.hpp"
#include"Recover/Recoverer.hpp"
#include"Sdk/LiquidSdk.hpp"
#include"Sdk/PaymentError.hpp"
#include"Sdk/SwapperIF.hpp"
#include"Sdk/invoice.hpp"
#include"Sdk/log.hpp"
#include"Sqlite3/Db.hpp"
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"
#include"Wallet/OnchainWallet.hpp"
#include<algorithm>
#include<set>

namespace {

/* Anything escaping an entry point becomes a
 * payment error.  */
template<typename a>
Ev::Io<a> boundary(Sdk::LoggerIF& logger, Ev::Io<a> io) {
	return io.template catching<Persist::PersistError>([&logger](Persist::PersistError const& e) {
		return Sdk::log( logger, Sdk::Error
			       , "Store failure: %s", e.what()
			       ).then([]() -> Ev::Io<a> {
			throw Sdk::PaymentError::persist_error();
		});
	}).template catching<std::exception>([](std::exception const& e) -> Ev::Io<a> {
		auto pe = dynamic_cast<Sdk::PaymentError const*>(&e);
		if (pe)
			throw *pe;
		throw Sdk::PaymentError::generic(e.what());
	});
}

std::string script_of(std::string const& address) {
	return Util::Str::hexdump(Bitcoin::addr_to_scriptPubKey(address));
}

Sdk::PaymentState payment_state(Persist::SwapState s) {
	switch (s) {
	case Persist::SwapState::Created:
		return Sdk::PaymentState::Created;
	case Persist::SwapState::WaitingConfirmation:
	case Persist::SwapState::Pending:
		return Sdk::PaymentState::Pending;
	case Persist::SwapState::Complete:
		return Sdk::PaymentState::Complete;
	case Persist::SwapState::Refundable:
		return Sdk::PaymentState::Refundable;
	case Persist::SwapState::Expired:
		return Sdk::PaymentState::TimedOut;
	case Persist::SwapState::Refunded:
	case Persist::SwapState::Failed:
		return Sdk::PaymentState::Failed;
	}
	return Sdk::PaymentState::Failed;
}

/* Funds of the swap that are on their way but not
 * settled yet.  */
bool in_flight(Persist::SwapState s) {
	return s == Persist::SwapState::WaitingConfirmation
	    || s == Persist::SwapState::Pending
	    || s == Persist::SwapState::Refundable
	     ;
}

Sdk::Payment payment_of_swap(Persist::SwapRecord const& swap) {
	auto rv = Sdk::Payment();
	/* The transaction that moved our own funds.  */
	rv.tx_id = swap.is_incoming() ? swap.server_leg.claim_tx_id
				      : swap.user_leg.lockup_tx_id
				      ;
	rv.swap_id = swap.id;
	rv.timestamp = swap.created_at;
	rv.amount_sat = swap.amount_sat;
	rv.fees_sat = swap.fees_sat;
	rv.payment_type = swap.is_incoming() ? Sdk::PaymentType::Receive
					     : Sdk::PaymentType::Send
					     ;
	rv.status = payment_state(swap.state);
	return rv;
}

void add_leg_txids(std::set<std::string>& txids, Persist::SwapLeg const& leg) {
	for (auto const* t : { &leg.lockup_tx_id
			     , &leg.claim_tx_id
			     , &leg.refund_tx_id
			     })
		if (!t->empty())
			txids.insert(*t);
}

Sdk::Payment
payment_of_tx(Wallet::WalletTx const& tx, std::string const& policy_asset) {
	auto rv = Sdk::Payment();
	rv.tx_id = tx.txid;
	rv.timestamp = tx.timestamp;

	auto net = std::int64_t(0);
	auto it = tx.balance.find(policy_asset);
	if (it != tx.balance.end())
		net = it->second;
	if (net >= 0) {
		rv.payment_type = Sdk::PaymentType::Receive;
		rv.amount_sat = std::uint64_t(net);
		rv.fees_sat = 0;
	} else {
		rv.payment_type = Sdk::PaymentType::Send;
		auto out = std::uint64_t(-net);
		rv.fees_sat = tx.fee;
		rv.amount_sat = out > tx.fee ? out - tx.fee : 0;
	}
	rv.status = tx.confirmed() ? Sdk::PaymentState::Complete
				   : Sdk::PaymentState::Pending
				   ;
	return rv;
}

struct ReceiveCtx {
	Sdk::PrepareReceiveResponse req;
	Wallet::AddressResult claim;
};

struct SendCtx {
	Sdk::PrepareSendResponse req;
	std::uint64_t amount_sat;
	std::string refund_address;
	Persist::SwapRecord swap;
};

struct ConnectCtx {
	std::unique_ptr<Persist::Persister> persister;
};

}

namespace Sdk {

class LiquidSdk::Impl {
public:
	Config config;
	std::unique_ptr<Persist::Persister> persister;
	std::unique_ptr<Wallet::OnchainWalletIF> wallet;
	SwapperIF& swapper;
	LoggerIF& logger;
	Recover::Recoverer recoverer;

	Impl( Config config_
	    , std::unique_ptr<Persist::Persister> persister_
	    , std::unique_ptr<Wallet::OnchainWalletIF> wallet_
	    , SwapperIF& swapper_
	    , LoggerIF& logger_
	    ) : config(std::move(config_))
	      , persister(std::move(persister_))
	      , wallet(std::move(wallet_))
	      , swapper(swapper_)
	      , logger(logger_)
	      , recoverer(*wallet, *persister, logger)
	      { }

	Ev::Io<void> sync() {
		return wallet->full_scan()
		     + recoverer.recover().then([this](std::size_t changed) {
			return Sdk::log( logger, Debug
				       , "Recovery updated %zu swap(s)"
				       , changed
				       );
		})
		     + wallet->release_used_addresses().then([this](std::size_t released) {
			return Sdk::log( logger, Debug
				       , "Released %zu used address reservation(s)"
				       , released
				       );
		});
	}

	Ev::Io<SwapPair> pair_or_fail(Ev::Io<std::unique_ptr<SwapPair>> io) {
		return io.then([](std::unique_ptr<SwapPair> pair) {
			if (!pair)
				throw PaymentError::pairs_not_found();
			return Ev::lift(*pair);
		});
	}

	Ev::Io<GetInfoResponse> get_info(GetInfoRequest const& req) {
		auto rv = std::make_shared<GetInfoResponse>();
		auto scan = req.with_scan ? sync() : Ev::lift();
		return scan + Ev::lift().then([this, rv]() {
			rv->pubkey = wallet->pubkey();
			return wallet->balance_sat();
		}).then([this, rv](std::uint64_t balance) {
			rv->balance_sat = balance;
			return persister->list_ongoing_swaps();
		}).then([rv](std::vector<Persist::SwapRecord> swaps) {
			rv->pending_send_sat = 0;
			rv->pending_receive_sat = 0;
			for (auto const& s : swaps) {
				if (!in_flight(s.state))
					continue;
				if (s.is_incoming())
					rv->pending_receive_sat += s.amount_sat;
				else
					rv->pending_send_sat += s.amount_sat
							      + s.fees_sat
							      ;
			}
			return Ev::lift(*rv);
		});
	}

	Ev::Io<PrepareReceiveResponse>
	prepare_receive_payment(PrepareReceiveRequest const& req) {
		auto amount = req.payer_amount_sat;
		return pair_or_fail(swapper.receive_pair()
		).then([amount](SwapPair pair) {
			if (!pair.in_range(amount))
				throw PaymentError::amount_out_of_range();
			auto fees = pair.fees_for(amount);
			if (fees >= amount)
				throw PaymentError::amount_out_of_range();
			auto rv = PrepareReceiveResponse();
			rv.payer_amount_sat = amount;
			rv.fees_sat = fees;
			return Ev::lift(rv);
		});
	}

	Ev::Io<ReceivePaymentResponse>
	receive_payment(PrepareReceiveResponse const& req) {
		auto ctx = std::make_shared<ReceiveCtx>();
		ctx->req = req;
		return prepare_receive_payment(
			PrepareReceiveRequest{req.payer_amount_sat}
		).then([this, ctx](PrepareReceiveResponse current) {
			if (current.fees_sat != ctx->req.fees_sat)
				throw PaymentError::invalid_or_expired_fees();
			return wallet->next_unused_address();
		}).then([this, ctx](Wallet::AddressResult claim) {
			ctx->claim = claim;
			return swapper.create_receive_swap( ctx->req.payer_amount_sat
							  , claim.address
							  );
		}).then([this, ctx](CreatedReceiveSwap created) {
			auto invoice = parse_invoice(created.invoice, config.network);
			if (invoice.amount_sat != ctx->req.payer_amount_sat)
				throw PaymentError::invalid_invoice();
			if (created.lockup_script.empty())
				throw PaymentError::generic(
					"Swap " + created.id + " has no lockup script"
				);

			auto swap = Persist::SwapRecord();
			swap.id = created.id;
			swap.kind = Persist::SwapKind::Receive;
			swap.created_at = std::uint32_t(Ev::now());
			swap.amount_sat = ctx->req.payer_amount_sat
					- ctx->req.fees_sat
					;
			swap.fees_sat = ctx->req.fees_sat;
			swap.max_fees_sat = ctx->req.fees_sat;
			swap.invoice = created.invoice;
			swap.server_leg.lockup_script = created.lockup_script;
			swap.server_leg.claim_script = script_of(ctx->claim.address);
			swap.server_leg.refund_script = created.refund_script;
			swap.server_leg.timeout_height = created.timeout_height;

			auto rv = ReceivePaymentResponse();
			rv.id = created.id;
			rv.invoice = created.invoice;
			return persister->save_swap(swap)
			     + wallet->reserve_address( ctx->claim
						      , swap.server_leg.timeout_height
						      )
			     + Sdk::log( logger, Info
				       , "Created receive swap %s for %llu sat"
				       , swap.id.c_str()
				       , (unsigned long long) swap.amount_sat
				       )
			     + Ev::lift(rv)
			     ;
		});
	}

	Ev::Io<PrepareSendResponse>
	prepare_send_payment(PrepareSendRequest const& req) {
		auto invoice = std::make_shared<Invoice>();
		auto str = req.invoice;
		return Ev::lift().then([this, invoice, str]() {
			*invoice = parse_invoice(str, config.network);
			return pair_or_fail(swapper.send_pair());
		}).then([invoice](SwapPair pair) {
			if (!pair.in_range(invoice->amount_sat))
				throw PaymentError::amount_out_of_range();
			auto rv = PrepareSendResponse();
			rv.invoice = invoice->invoice;
			rv.fees_sat = pair.fees_for(invoice->amount_sat);
			return Ev::lift(rv);
		});
	}

	/* Fail on a payment of the same invoice that
	 * already went out.  */
	static
	void check_duplicate( std::vector<Persist::SwapRecord> const& swaps
			    , std::string const& invoice
			    ) {
		for (auto const& s : swaps) {
			if (s.kind != Persist::SwapKind::Send || s.invoice != invoice)
				continue;
			switch (s.state) {
			case Persist::SwapState::Complete:
				throw PaymentError::already_claimed();
			case Persist::SwapState::Refunded:
				throw PaymentError::refunded(
					"Payment of swap " + s.id + " was refunded",
					s.user_leg.refund_tx_id
				);
			case Persist::SwapState::Failed:
			case Persist::SwapState::Expired:
				break;
			default:
				throw PaymentError::generic(
					"Payment already in progress in swap " + s.id
				);
			}
		}
	}

	Ev::Io<SendPaymentResponse>
	send_payment(PrepareSendResponse const& req) {
		auto ctx = std::make_shared<SendCtx>();
		ctx->req = req;
		return prepare_send_payment(
			PrepareSendRequest{req.invoice}
		).then([this, ctx](PrepareSendResponse current) {
			if (current.fees_sat != ctx->req.fees_sat)
				throw PaymentError::invalid_or_expired_fees();
			ctx->amount_sat = parse_invoice( ctx->req.invoice
						       , config.network
						       ).amount_sat;
			return persister->list_swaps();
		}).then([this, ctx](std::vector<Persist::SwapRecord> swaps) {
			check_duplicate(swaps, ctx->req.invoice);
			return wallet->next_unused_address();
		}).then([this, ctx](Wallet::AddressResult refund) {
			ctx->refund_address = refund.address;
			return swapper.create_send_swap( ctx->req.invoice
						       , refund.address
						       );
		}).then([this, ctx](CreatedSendSwap created) {
			if (created.expected_amount_sat > ctx->amount_sat + ctx->req.fees_sat)
				throw PaymentError::invalid_or_expired_fees();

			auto& swap = ctx->swap;
			swap.id = created.id;
			swap.kind = Persist::SwapKind::Send;
			swap.created_at = std::uint32_t(Ev::now());
			swap.amount_sat = ctx->amount_sat;
			swap.fees_sat = created.expected_amount_sat - ctx->amount_sat;
			swap.max_fees_sat = ctx->req.fees_sat;
			swap.invoice = ctx->req.invoice;
			swap.user_leg.lockup_script = created.lockup_script;
			swap.user_leg.refund_script = script_of(ctx->refund_address);
			swap.user_leg.timeout_height = created.timeout_height;

			return persister->save_swap(swap)
			     + lock_up( ctx
				      , created.lockup_address
				      , created.expected_amount_sat
				      );
		}).then([this, ctx](std::string txid) {
			auto& swap = ctx->swap;
			swap.user_leg.lockup_tx_id = txid;
			swap.user_leg.state = Persist::SwapState::WaitingConfirmation;
			swap.state = Persist::SwapState::WaitingConfirmation;

			auto rv = SendPaymentResponse();
			rv.txid = txid;
			return persister->save_swap(swap)
			     + Sdk::log( logger, Info
				       , "Broadcast lockup %s of send swap %s"
				       , txid.c_str()
				       , swap.id.c_str()
				       )
			     + Ev::lift(rv)
			     ;
		});
	}

	/* Build, sign and broadcast the lockup.  On
	 * failure the swap is saved as failed.  */
	Ev::Io<std::string> lock_up( std::shared_ptr<SendCtx> ctx
				   , std::string const& address
				   , std::uint64_t amount_sat
				   ) {
		return wallet->build_tx_or_drain_tx( config.fee_rate
						   , address
						   , config.policy_asset
						   , amount_sat
						   ).then([this](Wallet::Transaction tx) {
			return wallet->broadcast(tx.hex).catching<PaymentError>([](PaymentError const& e) -> Ev::Io<std::string> {
				throw PaymentError::send_error(e.what());
			});
		}).catching<PaymentError>([this, ctx](PaymentError const& e) {
			auto& swap = ctx->swap;
			swap.user_leg.state = Persist::SwapState::Failed;
			swap.state = Persist::SwapState::Failed;
			swap.failure_reason = e.what();
			auto err = e;
			return Sdk::log( logger, Warn
				       , "Send swap %s failed: %s"
				       , swap.id.c_str(), e.what()
				       )
			     + persister->save_swap(swap).then([err]() -> Ev::Io<std::string> {
				throw err;
			});
		});
	}

	Ev::Io<std::vector<Payment>> list_payments() {
		auto txs = std::make_shared<std::vector<Wallet::WalletTx>>();
		return wallet->transactions().then([this, txs](std::vector<Wallet::WalletTx> r) {
			*txs = std::move(r);
			return persister->list_swaps();
		}).then([this, txs](std::vector<Persist::SwapRecord> swaps) {
			auto rv = std::vector<Payment>();
			auto linked = std::set<std::string>();
			for (auto const& s : swaps) {
				rv.push_back(payment_of_swap(s));
				add_leg_txids(linked, s.user_leg);
				add_leg_txids(linked, s.server_leg);
			}
			for (auto const& tx : *txs) {
				if (linked.count(tx.txid) != 0)
					continue;
				rv.push_back(payment_of_tx(tx, config.policy_asset));
			}
			std::stable_sort( rv.begin(), rv.end()
					, [](Payment const& a, Payment const& b) {
				return a.timestamp > b.timestamp;
			});
			return Ev::lift(std::move(rv));
		});
	}

	std::string backup_path_of(std::string const& path) const {
		return path.empty() ? config.backup_path() : path;
	}
};

LiquidSdk::LiquidSdk( Config config
		    , std::unique_ptr<Persist::Persister> persister
		    , std::unique_ptr<Wallet::OnchainWalletIF> wallet
		    , SwapperIF& swapper
		    , LoggerIF& logger
		    ) : pimpl(Util::make_unique<Impl>( std::move(config)
						     , std::move(persister)
						     , std::move(wallet)
						     , swapper
						     , logger
						     ))
		      { }
LiquidSdk::~LiquidSdk() =default;

Ev::Io<std::unique_ptr<LiquidSdk>>
LiquidSdk::connect( Config const& config
		  , std::shared_ptr<Signer::UserSignerIF> user_signer
		  , Wallet::DescriptorWalletFactoryIF& wallet_factory
		  , Wallet::ChainClientFactoryIF& client_factory
		  , SwapperIF& swapper
		  , LoggerIF& logger
		  ) {
	auto ctx = std::make_shared<ConnectCtx>();
	return boundary(logger, Ev::lift().then([ ctx, config, user_signer
						, &wallet_factory
						, &client_factory
						, &logger
						]() {
		ctx->persister = Util::make_unique<Persist::Persister>(
			Sqlite3::Db(config.storage_path())
		);
		return Wallet::OnchainWallet::create( config
						    , *ctx->persister
						    , user_signer
						    , wallet_factory
						    , client_factory
						    , logger
						    );
	}).then([ctx, config, &swapper, &logger](std::unique_ptr<Wallet::OnchainWallet> wallet) {
		auto rv = Util::make_unique<LiquidSdk>( config
						      , std::move(ctx->persister)
						      , std::move(wallet)
						      , swapper
						      , logger
						      );
		return Sdk::log( logger, Info
			       , "Connected on %s"
			       , network_name(config.network)
			       )
		     + Ev::lift(std::move(rv))
		     ;
	}));
}

Ev::Io<void> LiquidSdk::sync() {
	return boundary(pimpl->logger, pimpl->sync());
}
Ev::Io<GetInfoResponse> LiquidSdk::get_info(GetInfoRequest const& req) {
	return boundary(pimpl->logger, pimpl->get_info(req));
}
Ev::Io<PrepareReceiveResponse>
LiquidSdk::prepare_receive_payment(PrepareReceiveRequest const& req) {
	return boundary(pimpl->logger, pimpl->prepare_receive_payment(req));
}
Ev::Io<ReceivePaymentResponse>
LiquidSdk::receive_payment(PrepareReceiveResponse const& req) {
	return boundary(pimpl->logger, pimpl->receive_payment(req));
}
Ev::Io<PrepareSendResponse>
LiquidSdk::prepare_send_payment(PrepareSendRequest const& req) {
	return boundary(pimpl->logger, pimpl->prepare_send_payment(req));
}
Ev::Io<SendPaymentResponse>
LiquidSdk::send_payment(PrepareSendResponse const& req) {
	return boundary(pimpl->logger, pimpl->send_payment(req));
}
Ev::Io<std::vector<Payment>> LiquidSdk::list_payments() {
	return boundary(pimpl->logger, pimpl->list_payments());
}
Ev::Io<void> LiquidSdk::backup(BackupRequest const& req) {
	auto path = pimpl->backup_path_of(req.backup_path);
	return boundary( pimpl->logger
		       , pimpl->persister->backup(path)
		       + Sdk::log(pimpl->logger, Info, "Backup written to %s", path.c_str())
		       );
}
Ev::Io<void> LiquidSdk::restore(RestoreRequest const& req) {
	auto path = pimpl->backup_path_of(req.backup_path);
	return boundary( pimpl->logger
		       , pimpl->persister->restore(path)
		       + Sdk::log(pimpl->logger, Info, "Restored from %s", path.c_str())
		       );
}
Ev::Io<void> LiquidSdk::empty_wallet_cache() {
	return boundary(pimpl->logger, pimpl->wallet->empty_wallet_cache());
}

}
