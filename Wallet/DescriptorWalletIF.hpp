#ifndef WALLET_DESCRIPTORWALLETIF_HPP
#define WALLET_DESCRIPTORWALLETIF_HPP

#include"Util/BacktraceException.hpp"
#include"Wallet/AddressResult.hpp"
#include"Wallet/Pset.hpp"
#include"Wallet/WalletTx.hpp"
#include<cstdint>
#include<map>
#include<memory>
#include<stdexcept>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Wallet { class ChainClientIF; }

namespace Wallet {

/** class Wallet::StoreError
 *
 * @brief the local store of the descriptor wallet
 * is unreadable or inconsistent.
 * Recovered by wiping the store.
 */
class StoreError : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	StoreError(std::string const& e)
		: Util::BacktraceException<std::runtime_error>(e) { }
};
/** class Wallet::UpdateHeightTooOld
 *
 * @brief a scan update is older than what the
 * store already holds.
 */
class UpdateHeightTooOld : public StoreError {
public:
	UpdateHeightTooOld(std::uint32_t update, std::uint32_t stored)
		: StoreError( "Update height " + std::to_string(update)
			    + " too old, internal height "
			    + std::to_string(stored)
			    ) { }
};
/* Coin selection cannot cover amount plus fee.  */
class InsufficientFunds : public Util::BacktraceException<std::runtime_error> {
public:
	InsufficientFunds()
		: Util::BacktraceException<std::runtime_error>("Insufficient funds") { }
};
/* Any other failure of the wallet library.  */
class LibraryError : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	LibraryError(std::string const& e)
		: Util::BacktraceException<std::runtime_error>(e) { }
};

/** class Wallet::DescriptorWalletIF
 *
 * @brief a watch-only wallet for one confidential
 * output descriptor, with its own local store.
 *
 * @desc Not safe for concurrent use; callers
 * serialize access.
 */
class DescriptorWalletIF {
public:
	virtual ~DescriptorWalletIF() { }

	/* Address at the given external index.  */
	virtual
	AddressResult address_at(std::uint32_t index) =0;
	/* First external address with no history.  */
	virtual
	AddressResult next_unused_address() =0;

	/* Height of the last scanned tip.  */
	virtual
	std::uint32_t tip() =0;

	/* Newest first.  Throws `Wallet::StoreError`.  */
	virtual
	std::vector<WalletTx> transactions() =0;

	/* Spendable amount per asset.  */
	virtual
	std::map<std::string, std::uint64_t> balance() =0;

	/* Native asset id, hex.  */
	virtual
	std::string policy_asset() =0;

	/** Wallet::DescriptorWalletIF::build_tx
	 *
	 * @brief an unsigned Pset paying `amount_sat`
	 * of `asset` to `recipient`, with change back
	 * to the wallet.
	 *
	 * @desc Throws `Wallet::InsufficientFunds` or
	 * `Wallet::LibraryError`.
	 *
	 * @param fee_rate - sat/vbyte, 0 for the
	 * library default.
	 */
	virtual
	Pset build_tx( std::string const& recipient
		     , std::string const& asset
		     , std::uint64_t amount_sat
		     , double fee_rate
		     ) =0;
	/* Unsigned Pset spending all native-asset
	 * coins to `recipient`, fee deducted.  */
	virtual
	Pset build_drain( std::string const& recipient
			, double fee_rate
			) =0;

	virtual
	PsetDetails get_details(Pset const& pset) =0;

	/* Throws `Wallet::LibraryError` if any owned
	 * input is unsigned.  */
	virtual
	Transaction finalize(Pset const& pset) =0;

	/** Wallet::DescriptorWalletIF::full_scan_to_index
	 *
	 * @brief scan all addresses up to the given
	 * derivation index, then apply the update to
	 * the store.
	 *
	 * @desc Fails with `Wallet::UpdateHeightTooOld`
	 * when the store is ahead of the update.
	 */
	virtual
	Ev::Io<void> full_scan_to_index( ChainClientIF& client
				       , std::uint32_t index
				       ) =0;
};

/** class Wallet::DescriptorWalletFactoryIF
 *
 * @brief opens descriptor wallets over a store
 * directory.
 */
class DescriptorWalletFactoryIF {
public:
	virtual ~DescriptorWalletFactoryIF() { }

	/* Throws `Wallet::StoreError` if the store
	 * exists but cannot be loaded.  */
	virtual
	std::unique_ptr<DescriptorWalletIF>
	open( std::string const& descriptor
	    , std::string const& store_dir
	    ) =0;

	/* Remove the store directory and its contents.  */
	virtual
	void wipe(std::string const& store_dir) =0;
};

}

#endif /* !defined(WALLET_DESCRIPTORWALLETIF_HPP) */
