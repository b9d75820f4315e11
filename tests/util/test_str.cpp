#undef NDEBUG
#include"Util/Str.hpp"
#include<assert.h>

int main() {
	assert(Util::Str::hexbyte(0x0a) == "0a");
	auto buf = std::vector<std::uint8_t>{0xde, 0xad, 0x00, 0xff};
	assert(Util::Str::hexdump(buf) == "dead00ff");
	assert(Util::Str::hexread("DEAD00ff") == buf);
	assert(Util::Str::hexread("").empty());

	assert(Util::Str::ishex("00ab"));
	assert(!Util::Str::ishex("0ab"));
	assert(!Util::Str::ishex("zz"));

	auto thrown = false;
	try {
		Util::Str::hexread("abc");
	} catch (Util::Str::HexParseFailure const&) {
		thrown = true;
	}
	assert(thrown);

	assert(Util::Str::fmt("%s swap %u", "send", 3u) == "send swap 3");

	return 0;
}
