#include"Bitcoin/hash160.hpp"
#include"Sha256/fun.hpp"
#include<crypto/ripemd160.h>
#include<sodium/utils.h>

namespace Bitcoin {

std::vector<std::uint8_t> hash160(void const* p, std::size_t len) {
	std::uint8_t buf[32];
	Sha256::fun(p, len).to_buffer(buf);

	auto rv = std::vector<std::uint8_t>(CRIPEMD160::OUTPUT_SIZE);
	auto hasher = CRIPEMD160();
	hasher.Write(buf, sizeof(buf));
	hasher.Finalize(&rv[0]);

	sodium_memzero(buf, sizeof(buf));
	return rv;
}

}
