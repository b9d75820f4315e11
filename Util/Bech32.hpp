#ifndef UTIL_BECH32_HPP
#define UTIL_BECH32_HPP

#include<cstdint>
#include<string>
#include<vector>

namespace Util { namespace Bech32 {

/** enum Util::Bech32::Encoding
 *
 * @brief which checksum variant a string carries.
 *
 * @desc Blech32 is the Elements variant with a
 * 12-character checksum, used by confidential
 * addresses, which would not fit the 90-character
 * limit of bech32.
 */
enum class Encoding
{ Invalid
, Bech32
, Bech32m
, Blech32
, Blech32m
};

/** struct Util::Bech32::Decoded
 *
 * @brief result of `Util::Bech32::decode`.
 * `data` holds the 5-bit values, without the
 * checksum.
 */
struct Decoded {
	Encoding encoding;
	std::string hrp;
	std::vector<std::uint8_t> data;
};

/** Util::Bech32::decode
 *
 * @brief decode and verify the checksum of a
 * bech32-family string.
 *
 * @desc Returns an `Encoding::Invalid` result if
 * the string is malformed or no checksum variant
 * matches.
 * The returned hrp is lowercase.
 * Plain bech32 strings are limited to 90
 * characters unless `length_limit` is false, as
 * for BOLT11 invoices.
 */
Decoded decode(std::string const& str, bool length_limit = true);

/** Util::Bech32::encode
 *
 * @brief encode the given 5-bit values with the
 * given hrp, appending the checksum of the given
 * variant.
 */
std::string encode( Encoding encoding
		  , std::string const& hrp
		  , std::vector<std::uint8_t> const& values
		  );

/** Util::Bech32::convert_bits
 *
 * @brief regroup a sequence of `frombits`-bit
 * values into `tobits`-bit values.
 *
 * @return false if the input has leftover nonzero
 * bits (or too many padding bits) when `pad` is
 * false.
 */
bool convert_bits( std::vector<std::uint8_t>& out
		 , std::vector<std::uint8_t> const& in
		 , int frombits, int tobits
		 , bool pad
		 );

}}

#endif /* !defined(UTIL_BECH32_HPP) */
