/**
 * @file codec.hpp
 * @brief DEFLATE compression of packed buffers.
 *
 * Packed buffers are stored as a zlib stream (RFC 1950 wrapping RFC 1951
 * DEFLATE). Output is deterministic for a given input, level and zlib
 * version. Other DEFLATE implementations may produce different but
 * equally valid bytes.
 *
 * Decompression enforces an upper bound on the inflated size so that a
 * small hostile payload cannot expand without limit.
 */

#ifndef STATUSLIST_CODEC_HPP
#define STATUSLIST_CODEC_HPP

#include "config.hpp"
#include "error.hpp"

#include <vector>

namespace statuslist {

/**
 * @brief Compress a packed buffer.
 *
 * @param data Packed buffer
 * @param size Packed buffer length (may be 0)
 * @param[out] out zlib stream
 * @param level zlib level 0-9
 * @return Error::Ok on success, Error::InvalidArgument for a bad level,
 *         Error::CompressionFailed if zlib fails
 */
Error compress(const std::uint8_t* data, std::size_t size, std::vector<std::uint8_t>& out,
               int level = DEFAULT_COMPRESSION_LEVEL);

/**
 * @brief Compress a packed buffer.
 */
inline Error compress(const std::vector<std::uint8_t>& buffer, std::vector<std::uint8_t>& out,
                      int level = DEFAULT_COMPRESSION_LEVEL) {
    return compress(buffer.data(), buffer.size(), out, level);
}

/**
 * @brief Decompress a zlib stream back to the packed buffer.
 *
 * The input must hold exactly one complete zlib stream; trailing bytes
 * are rejected.
 *
 * @param data zlib stream
 * @param size Stream length
 * @param[out] out Packed buffer (untouched on error)
 * @param max_output Largest accepted inflated size in bytes
 * @return Error::Ok on success, Error::CorruptData for malformed, truncated
 *         or trailing input, Error::DecompressionLimitExceeded if the output
 *         would exceed max_output
 */
Error decompress(const std::uint8_t* data, std::size_t size, std::vector<std::uint8_t>& out,
                 std::size_t max_output = MAX_DECOMPRESSED_BYTES);

/**
 * @brief Decompress a zlib stream back to the packed buffer.
 */
inline Error decompress(const std::vector<std::uint8_t>& buffer, std::vector<std::uint8_t>& out,
                        std::size_t max_output = MAX_DECOMPRESSED_BYTES) {
    return decompress(buffer.data(), buffer.size(), out, max_output);
}

} // namespace statuslist

#endif // STATUSLIST_CODEC_HPP
