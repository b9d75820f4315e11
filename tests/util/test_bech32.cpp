#undef NDEBUG
#include"Util/Bech32.hpp"
#include<assert.h>
#include<string>

using Util::Bech32::Encoding;

namespace {

bool valid(std::string const& s, Encoding expected) {
	return Util::Bech32::decode(s).encoding == expected;
}

}

int main() {
	/* From BIP-173 and BIP-350.  */
	assert(valid("A12UEL5L", Encoding::Bech32));
	assert(valid("a12uel5l", Encoding::Bech32));
	assert(valid("an83characterlonghumanreadablepartthatcontainsthenumber1andtheexcludedcharactersbio1tt5tgs", Encoding::Bech32));
	assert(valid("abcdef1qpzry9x8gf2tvdw0s3jn54khce6mua7lmqqqxw", Encoding::Bech32));
	assert(valid("A1LQFN3A", Encoding::Bech32m));
	assert(valid("a1lqfn3a", Encoding::Bech32m));

	auto d = Util::Bech32::decode("abcdef1qpzry9x8gf2tvdw0s3jn54khce6mua7lmqqqxw");
	assert(d.hrp == "abcdef");
	assert(d.data.size() == 32);
	for (auto i = std::size_t(0); i < d.data.size(); ++i)
		assert(d.data[i] == i);

	assert(valid("pzry9x8gf2tvdw0s3jn54khce6mua7l", Encoding::Invalid));
	assert(valid("10a06t8", Encoding::Invalid));
	assert(valid("1qzzfhee", Encoding::Invalid));
	assert(valid("A1G7SGD8", Encoding::Invalid));
	assert(valid("a12UEL5L", Encoding::Invalid));
	assert(valid("a12uel5m", Encoding::Invalid));

	/* Long strings are only accepted on request.  */
	auto values = std::vector<std::uint8_t>(150, 3);
	auto invoice = Util::Bech32::encode(Encoding::Bech32, "lnbcrt1m", values);
	assert(invoice.size() > 90);
	assert(valid(invoice, Encoding::Invalid));
	d = Util::Bech32::decode(invoice, false);
	assert(d.encoding == Encoding::Bech32);
	assert(d.hrp == "lnbcrt1m");
	assert(d.data == values);

	/* Blinded addresses have a longer checksum and
	 * no length limit.  */
	auto blech = Util::Bech32::encode(Encoding::Blech32, "el", values);
	assert(blech.size() == 2 + 1 + 150 + 12);
	d = Util::Bech32::decode(blech);
	assert(d.encoding == Encoding::Blech32);
	assert(d.data == values);
	auto blechm = Util::Bech32::encode(Encoding::Blech32m, "lq", {1, 2, 3});
	assert(Util::Bech32::decode(blechm).encoding == Encoding::Blech32m);

	auto bits = std::vector<std::uint8_t>();
	auto bytes = std::vector<std::uint8_t>{0xff, 0x00, 0xa5};
	assert(Util::Bech32::convert_bits(bits, bytes, 8, 5, true));
	assert(bits.size() == 5);
	auto back = std::vector<std::uint8_t>();
	assert(Util::Bech32::convert_bits(back, bits, 5, 8, false));
	assert(back == bytes);
	/* Values too wide for the source width.  */
	back.clear();
	assert(!Util::Bech32::convert_bits(back, std::vector<std::uint8_t>{32}, 5, 8, false));

	return 0;
}
