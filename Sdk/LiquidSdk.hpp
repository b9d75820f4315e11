#ifndef SDK_LIQUIDSDK_HPP
#define SDK_LIQUIDSDK_HPP

#include"Sdk/Config.hpp"
#include"Sdk/Model.hpp"
#include<memory>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Persist { class Persister; }
namespace Sdk { class LoggerIF; }
namespace Sdk { class SwapperIF; }
namespace Signer { class UserSignerIF; }
namespace Wallet { class ChainClientFactoryIF; }
namespace Wallet { class DescriptorWalletFactoryIF; }
namespace Wallet { class OnchainWalletIF; }

namespace Sdk {

/** class Sdk::LiquidSdk
 *
 * @brief the entry points exposed over the call
 * bridge.
 *
 * @desc Every entry point fails only with
 * `Sdk::PaymentError`.
 * The swapper and logger must outlive this
 * object.
 */
class LiquidSdk {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	LiquidSdk() =delete;
	LiquidSdk(LiquidSdk const&) =delete;
	~LiquidSdk();

	/* The wallet must have been created over the
	 * given persister.  */
	LiquidSdk( Config config
		 , std::unique_ptr<Persist::Persister> persister
		 , std::unique_ptr<Wallet::OnchainWalletIF> wallet
		 , SwapperIF& swapper
		 , LoggerIF& logger
		 );

	/** Sdk::LiquidSdk::connect
	 *
	 * @brief open the store at the configured
	 * storage path and the on-chain wallet of the
	 * signer.
	 */
	static
	Ev::Io<std::unique_ptr<LiquidSdk>>
	connect( Config const& config
	       , std::shared_ptr<Signer::UserSignerIF> user_signer
	       , Wallet::DescriptorWalletFactoryIF& wallet_factory
	       , Wallet::ChainClientFactoryIF& client_factory
	       , SwapperIF& swapper
	       , LoggerIF& logger
	       );

	/* Full scan of the wallet, then recovery of
	 * ongoing swaps.  */
	Ev::Io<void> sync();

	Ev::Io<GetInfoResponse> get_info(GetInfoRequest const& req);

	Ev::Io<PrepareReceiveResponse>
	prepare_receive_payment(PrepareReceiveRequest const& req);
	Ev::Io<ReceivePaymentResponse>
	receive_payment(PrepareReceiveResponse const& req);

	Ev::Io<PrepareSendResponse>
	prepare_send_payment(PrepareSendRequest const& req);
	Ev::Io<SendPaymentResponse>
	send_payment(PrepareSendResponse const& req);

	/* Newest first.  */
	Ev::Io<std::vector<Payment>> list_payments();

	Ev::Io<void> backup(BackupRequest const& req);
	Ev::Io<void> restore(RestoreRequest const& req);

	Ev::Io<void> empty_wallet_cache();
};

}

#endif /* !defined(SDK_LIQUIDSDK_HPP) */
