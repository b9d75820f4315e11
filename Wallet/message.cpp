#include"Secp256k1/PubKey.hpp"
#include"Secp256k1/RecoverableSignature.hpp"
#include"Sha256/Hash.hpp"
#include"Sha256/fun.hpp"
#include"Signer/SdkSigner.hpp"
#include"Util/Zbase32.hpp"
#include"Wallet/message.hpp"
#include<cstdint>
#include<vector>

namespace {

char const ln_message_prefix[] = "Lightning Signed Message:";

}

namespace Wallet {

Sha256::Hash message_hash(std::string const& msg) {
	auto data = std::string(ln_message_prefix) + msg;
	return Sha256::sha256d(data.data(), data.size());
}

std::string sign_message( Signer::SdkSigner& signer
			, std::string const& msg
			) {
	return Util::Zbase32::encode(
		signer.sign_ecdsa_recoverable(message_hash(msg))
	);
}

bool check_message( std::string const& msg
		  , std::string const& pubkey
		  , std::string const& signature
		  ) {
	auto sig = std::vector<std::uint8_t>();
	if (!Util::Zbase32::decode(sig, signature))
		return false;
	if (sig.size() != 65)
		return false;

	/* Header is 27 + recid, plus 4 for a
	 * compressed key.  */
	auto header = int(sig[0]);
	if (header < 27 || header > 34)
		return false;
	auto recid = (header - 27) % 4;

	try {
		auto expected = Secp256k1::PubKey(pubkey);
		auto rsig = Secp256k1::RecoverableSignature::from_compact(
			&sig[1], recid
		);
		return rsig.recover(message_hash(msg)) == expected;
	} catch (std::exception const&) {
		return false;
	}
}

}
