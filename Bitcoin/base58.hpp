#ifndef BITCOIN_BASE58_HPP
#define BITCOIN_BASE58_HPP

#include<cstdint>
#include<string>
#include<vector>

namespace Bitcoin {

/** Bitcoin::base58check_encode
 *
 * @brief encode the payload followed by the first
 * four bytes of its double-SHA256, in base58.
 */
std::string base58check_encode(std::vector<std::uint8_t> const& payload);

/** Bitcoin::base58check_decode
 *
 * @brief decode and verify a base58check string.
 *
 * @return false if the string is not base58, or
 * the checksum does not match.
 */
bool base58check_decode( std::vector<std::uint8_t>& payload
		       , std::string const& str
		       );

}

#endif /* !defined(BITCOIN_BASE58_HPP) */
