#undef NDEBUG
#include"Secp256k1/PubKey.hpp"
#include"Signer/KeySigner.hpp"
#include"Signer/SdkSigner.hpp"
#include"Wallet/message.hpp"
#include<assert.h>
#include<memory>

int main() {
	auto user = std::make_shared<Signer::KeySigner>(
		std::vector<std::uint8_t>(32, 0x42), false
	);
	auto signer = Signer::SdkSigner(user);
	auto pubkey = std::string(signer.pubkey());
	auto other = std::string(Signer::SdkSigner(
		std::make_shared<Signer::KeySigner>(std::vector<std::uint8_t>(32, 0x43), false)
	).pubkey());

	auto sig = Wallet::sign_message(signer, "pay to the order of");
	/* 65 bytes of z-base-32.  */
	assert(sig.size() == 104);
	assert(Wallet::check_message("pay to the order of", pubkey, sig));

	assert(!Wallet::check_message("pay to the order of!", pubkey, sig));
	assert(!Wallet::check_message("pay to the order of", other, sig));

	/* Malformed input is simply not valid.  */
	assert(!Wallet::check_message("pay to the order of", pubkey, ""));
	assert(!Wallet::check_message("pay to the order of", pubkey, sig.substr(0, 100)));
	assert(!Wallet::check_message("pay to the order of", pubkey, "lvlvlv"));
	assert(!Wallet::check_message("pay to the order of", "02zz", sig));
	auto bad_header = sig;
	bad_header[0] = 'y';
	assert(!Wallet::check_message("pay to the order of", pubkey, bad_header));

	assert(Wallet::check_message("", pubkey, Wallet::sign_message(signer, "")));

	return 0;
}
