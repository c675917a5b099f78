/**
 * @file serialization.hpp
 * @brief Wire forms of a status list.
 *
 * Both forms carry the same members:
 * - "bits": 1, 2, 4 or 8
 * - "lst": the compressed packed buffer
 * - "aggregation_uri": optional, omitted when absent
 *
 * JSON embeds "lst" as URL-safe base64 without padding. CBOR embeds it as
 * a byte string. The adapters only check the document structure; width
 * validation is left to StatusList construction.
 */

#ifndef STATUSLIST_SERIALIZATION_HPP
#define STATUSLIST_SERIALIZATION_HPP

#include "config.hpp"
#include "error.hpp"
#include "status_list.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace statuslist {

/**
 * @brief Render the JSON form, e.g. {"bits":1,"lst":"eNrbuRgAAhcBXQ"}.
 */
std::string to_json(const StatusList& list);

/**
 * @brief Parse the JSON form.
 *
 * "bits" may be an integer or a decimal string.
 *
 * @throws MalformedEncodingException for invalid JSON, missing or mistyped
 *         members, or invalid base64url in "lst"
 * @throws InvalidBitWidthException for an integer width outside {1, 2, 4, 8}
 */
StatusList from_json(std::string_view text);

/**
 * @brief Render the CBOR form.
 */
std::vector<std::uint8_t> to_cbor(const StatusList& list);

/**
 * @brief Parse the CBOR form.
 *
 * @throws MalformedEncodingException for invalid CBOR, missing or mistyped
 *         members ("bits" must be an unsigned integer, "lst" a byte string)
 * @throws InvalidBitWidthException for a width outside {1, 2, 4, 8}
 */
StatusList from_cbor(const std::uint8_t* data, std::size_t size);

inline StatusList from_cbor(const std::vector<std::uint8_t>& data) {
    return from_cbor(data.data(), data.size());
}

/**
 * @brief Render the CBOR form as lowercase hex.
 */
std::string to_cbor_hex(const StatusList& list);

/**
 * @brief Parse the hex rendering of the CBOR form.
 *
 * @throws MalformedEncodingException for invalid hex or CBOR
 */
StatusList from_cbor_hex(std::string_view hex);

} // namespace statuslist

#endif // STATUSLIST_SERIALIZATION_HPP
