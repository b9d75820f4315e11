#ifndef UTIL_ZBASE32_HPP
#define UTIL_ZBASE32_HPP

#include<cstdint>
#include<string>
#include<vector>

namespace Util { namespace Zbase32 {

/** Util::Zbase32::encode
 *
 * @brief encode bytes in the human-oriented
 * z-base-32 alphabet, most significant bit first,
 * with the final group zero-padded.
 */
std::string encode(std::vector<std::uint8_t> const& data);

/** Util::Zbase32::decode
 *
 * @brief decode a z-base-32 string.
 * Trailing bits that do not form a full byte are
 * dropped.
 *
 * @return false on a character outside the
 * alphabet.
 */
bool decode(std::vector<std::uint8_t>& data, std::string const& str);

}}

#endif /* !defined(UTIL_ZBASE32_HPP) */
