#ifndef WALLET_PSET_HPP
#define WALLET_PSET_HPP

#include<cstdint>
#include<map>
#include<string>
#include<vector>

namespace Wallet {

/* One input of a partially-signed transaction.
 * Inputs we do not own have an empty path.  */
struct PsetInput {
	/* hex of the 32-byte digest to sign.  */
	std::string sighash;
	std::string derivation_path;
	/* hex, compressed.  */
	std::string pubkey;
	/* hex, DER plus sighash-type byte; empty until
	 * signed.  */
	std::string signature;
};

/** struct Wallet::Pset
 *
 * @brief a partially-signed Elements transaction.
 *
 * @desc `serialized` is the wallet library's own
 * encoding and is opaque to us; `inputs` exposes
 * what signing needs.
 */
struct Pset {
	std::string serialized;
	std::vector<PsetInput> inputs;
};

/* What the wallet computes a Pset would do to it.  */
struct PsetDetails {
	std::map<std::string, std::int64_t> balance;
	std::uint64_t fee;
};

/* A finalized transaction ready to broadcast.  */
struct Transaction {
	std::string txid;
	std::string hex;
	/* Net wallet change per asset, fee included.  */
	std::map<std::string, std::int64_t> balance;
	std::uint64_t fee;
};

}

#endif /* !defined(WALLET_PSET_HPP) */
