#undef NDEBUG
#include"Bitcoin/addr_to_scriptPubKey.hpp"
#include"Bitcoin/base58.hpp"
#include"Bitcoin/hash160.hpp"
#include"Util/Str.hpp"
#include<assert.h>
#include<string>

int main() {
	/* Version byte 0, all-zero hash.  */
	auto payload = std::vector<std::uint8_t>(21, 0);
	auto str = Bitcoin::base58check_encode(payload);
	assert(str == "1111111111111111111114oLvT2");

	auto decoded = std::vector<std::uint8_t>();
	assert(Bitcoin::base58check_decode(decoded, str));
	assert(decoded == payload);
	assert(Util::Str::hexdump(Bitcoin::addr_to_scriptPubKey(str))
	    == "76a914" + std::string(40, '0') + "88ac"
	      );

	/* Corrupted checksum, and characters outside
	 * the alphabet.  */
	assert(!Bitcoin::base58check_decode(decoded, "1111111111111111111114oLvT3"));
	assert(!Bitcoin::base58check_decode(decoded, "0OIl"));

	/* Liquid regtest P2SH.  */
	auto hash = std::vector<std::uint8_t>(20, 0xab);
	auto p2sh = std::vector<std::uint8_t>{75};
	p2sh.insert(p2sh.end(), hash.begin(), hash.end());
	auto addr = Bitcoin::base58check_encode(p2sh);
	auto parsed = Bitcoin::parse_address(addr);
	assert(parsed.chain == Bitcoin::Chain::Liquid);
	assert(parsed.net == Bitcoin::Net::Regtest);
	assert(!parsed.segwit);
	assert(Util::Str::hexdump(parsed.script_pubkey)
	    == "a914abababababababababababababababababababab87"
	      );

	/* Blinded wrapper around the same P2SH.  */
	auto blinded = std::vector<std::uint8_t>{4, 75};
	blinded.insert(blinded.end(), 33, 0x03);
	blinded.insert(blinded.end(), hash.begin(), hash.end());
	parsed = Bitcoin::parse_address(Bitcoin::base58check_encode(blinded));
	assert(parsed.confidential());
	assert(parsed.blinding_pubkey.size() == 33);
	assert(parsed.script_pubkey.size() == 23);

	assert(Util::Str::hexdump(Bitcoin::hash160("", 0))
	    == "b472a266d0bd89c13706a4132ccfb16f7c3b9fcb"
	      );

	return 0;
}
