#ifndef BITCOIN_HASH160_HPP
#define BITCOIN_HASH160_HPP

#include<cstddef>
#include<cstdint>
#include<vector>

namespace Bitcoin {

/** Bitcoin::hash160
 *
 * @brief RIPEMD160 of the SHA256 of the input,
 * as 20 bytes.
 */
std::vector<std::uint8_t> hash160(void const* p, std::size_t len);

}

#endif /* BITCOIN_HASH160_HPP */
