#include"Secp256k1/PubKey.hpp"
#include"Secp256k1/Signature.hpp"
#include"Sha256/Hash.hpp"
#include"Signer/SdkSigner.hpp"
#include"Signer/UserSignerIF.hpp"
#include"Util/Str.hpp"
#include"Wallet/Pset.hpp"

namespace {

/* SIGHASH_ALL.  */
std::uint8_t const sighash_all = 0x01;

/* Run a call into the user capability, turning any
 * failure into Signer::SignerError.  */
template<typename f>
auto guard(char const* what, f func) -> decltype(func()) {
	try {
		return func();
	} catch (Signer::SignerError const&) {
		throw;
	} catch (std::exception const& e) {
		throw Signer::SignerError(std::string(what) + ": " + e.what());
	}
}

std::vector<std::uint8_t>
hash_bytes(Sha256::Hash const& h) {
	auto rv = std::vector<std::uint8_t>(32);
	h.to_buffer(&rv[0]);
	return rv;
}

}

namespace Signer {

SdkSigner::SdkSigner(std::shared_ptr<UserSignerIF> user_)
	: user(std::move(user_))
	, master(ExtPubKey::parse(guard("xpub", [this]() {
		return user->xpub();
	  })))
	{ }

std::string SdkSigner::fingerprint() const {
	return Util::Str::fmt("%08x", (unsigned int) master.fingerprint());
}

std::string SdkSigner::wpkh_slip77_descriptor(bool mainnet) {
	auto coin = mainnet ? std::string("1776") : std::string("1");
	auto path = "m/84'/" + coin + "'/0'";

	auto account = ExtPubKey::parse(guard("derive_xpub", [this, &path]() {
		return user->derive_xpub(path);
	}));
	auto slip77 = guard("slip77_master_blinding_key", [this]() {
		return user->slip77_master_blinding_key();
	});
	if (slip77.size() != 32)
		throw SignerError("slip77_master_blinding_key: expected 32 bytes");

	return "ct(slip77(" + Util::Str::hexdump(slip77) + ")"
	     + ",elwpkh([" + fingerprint() + "/84'/" + coin + "'/0']"
	     + account.to_string() + "/<0;1>/*))"
	     ;
}

void SdkSigner::sign(Wallet::Pset& pset) {
	for (auto& input : pset.inputs) {
		if (input.derivation_path.empty())
			continue;
		if (!Sha256::Hash::valid_string(input.sighash))
			throw SignerError("Pset input has no valid sighash");
		auto hash = Sha256::Hash(input.sighash);

		auto der = guard("sign_ecdsa", [this, &hash, &input]() {
			return user->sign_ecdsa( hash_bytes(hash)
					       , input.derivation_path
					       );
		});

		try {
			auto sig = Secp256k1::Signature::der_decode(der);
			if ( !input.pubkey.empty()
			  && !sig.valid(Secp256k1::PubKey(input.pubkey), hash)
			   )
				throw SignerError(
					"sign_ecdsa: signature does not verify for "
					+ input.derivation_path
				);
		} catch (Secp256k1::BadSignatureEncoding const&) {
			throw SignerError("sign_ecdsa: malformed DER signature");
		} catch (Secp256k1::InvalidPubKey const&) {
			throw SignerError("Pset input has an invalid pubkey");
		} catch (Util::Str::HexParseFailure const&) {
			throw SignerError("Pset input has an invalid pubkey");
		}

		der.push_back(sighash_all);
		input.signature = Util::Str::hexdump(der);
	}
}

std::vector<std::uint8_t>
SdkSigner::sign_ecdsa_recoverable(Sha256::Hash const& hash) {
	auto sig = guard("sign_ecdsa_recoverable", [this, &hash]() {
		return user->sign_ecdsa_recoverable(hash_bytes(hash));
	});
	if (sig.size() != 65)
		throw SignerError("sign_ecdsa_recoverable: expected 65 bytes");
	return sig;
}

}
