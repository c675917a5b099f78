/**
 * @file decoder.hpp
 * @brief Random-access lookup into a status list.
 *
 * The compressed buffer is inflated once, at construction. Lookups then
 * read the packed bytes directly and never touch the compressor again.
 * A constructed decoder is immutable and may be shared between threads.
 *
 * @par Length
 * The format stores no status count. size() is the capacity of the packed
 * buffer, floor(bytes * 8 / bits), so zero padding at the end of the last
 * byte reads back as VALID statuses.
 */

#ifndef STATUSLIST_DECODER_HPP
#define STATUSLIST_DECODER_HPP

#include "config.hpp"
#include "error.hpp"
#include "status_list.hpp"
#include "types.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace statuslist {

class StatusListDecoder {
public:
    /**
     * @brief Inflate a status list.
     *
     * @param list Status list to decode
     * @param max_decompressed_bytes Expansion limit for the packed buffer
     * @throws InvalidBitWidthException for a width outside {1, 2, 4, 8}
     * @throws CorruptDataException for a malformed or truncated stream
     * @throws DecompressionLimitExceededException if the packed buffer is too large
     */
    explicit StatusListDecoder(const StatusList& list,
                               std::size_t max_decompressed_bytes = MAX_DECOMPRESSED_BYTES);

    /**
     * @brief Inflate a width and a base64url "lst" string.
     *
     * @throws MalformedEncodingException if lst is not valid base64url
     */
    static StatusListDecoder from_base64(int bits, std::string_view lst,
                                         std::size_t max_decompressed_bytes =
                                             MAX_DECOMPRESSED_BYTES);

    /**
     * @brief Status at an index.
     *
     * @throws IndexOutOfBoundsException unless index < size()
     */
    [[nodiscard]] StatusCode get_status(std::size_t index) const;

    /**
     * @brief Named status at an index.
     *
     * @return The named type, or std::nullopt for reserved and unnamed codes
     * @throws IndexOutOfBoundsException unless index < size()
     */
    [[nodiscard]] std::optional<StatusType> get_status_type(std::size_t index) const;

    /// Addressable statuses, floor(bytes * 8 / bits).
    [[nodiscard]] std::size_t size() const noexcept;

    [[nodiscard]] bool empty() const noexcept { return packed_.empty(); }

    [[nodiscard]] BitWidth bits() const noexcept { return bits_; }

    /// Decompressed packed buffer.
    [[nodiscard]] const std::vector<std::uint8_t>& raw_bytes() const noexcept { return packed_; }

private:
    StatusListDecoder(BitWidth bits, const std::vector<std::uint8_t>& compressed,
                      std::size_t max_decompressed_bytes);

    BitWidth bits_;
    std::vector<std::uint8_t> packed_;
};

} // namespace statuslist

#endif // STATUSLIST_DECODER_HPP
