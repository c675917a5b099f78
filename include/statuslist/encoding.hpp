/**
 * @file encoding.hpp
 * @brief Text encodings for binary payloads.
 *
 * - URL-safe base64 without padding (RFC 4648 Section 5), used for the
 *   "lst" member of the JSON form
 * - Lowercase hexadecimal, used to print CBOR documents
 */

#ifndef STATUSLIST_ENCODING_HPP
#define STATUSLIST_ENCODING_HPP

#include "config.hpp"
#include "error.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace statuslist {

/**
 * @brief Encode bytes as URL-safe base64 without '=' padding.
 */
std::string base64url_encode(const std::uint8_t* data, std::size_t size);

inline std::string base64url_encode(const std::vector<std::uint8_t>& data) {
    return base64url_encode(data.data(), data.size());
}

/**
 * @brief Decode URL-safe unpadded base64.
 *
 * Rejects padding characters, characters outside [A-Za-z0-9_-], a length
 * of 1 modulo 4 and non-zero trailing bits.
 *
 * @param text Encoded text
 * @param[out] out Decoded bytes (untouched on error)
 * @return Error::Ok on success, Error::MalformedEncoding otherwise
 */
Error base64url_decode(std::string_view text, std::vector<std::uint8_t>& out);

/**
 * @brief Encode bytes as lowercase hex.
 */
std::string hex_encode(const std::uint8_t* data, std::size_t size);

inline std::string hex_encode(const std::vector<std::uint8_t>& data) {
    return hex_encode(data.data(), data.size());
}

/**
 * @brief Decode hex (either case).
 *
 * @param text Hex digits, even length
 * @param[out] out Decoded bytes (untouched on error)
 * @return Error::Ok on success, Error::MalformedEncoding otherwise
 */
Error hex_decode(std::string_view text, std::vector<std::uint8_t>& out);

} // namespace statuslist

#endif // STATUSLIST_ENCODING_HPP
