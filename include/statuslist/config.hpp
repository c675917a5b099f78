/**
 * @file config.hpp
 * @brief Status list compile-time configuration.
 *
 * Token Status List: compact bit-packed revocation/validity status of
 * many tokens in one compressed bitstream.
 */

#ifndef STATUSLIST_CONFIG_HPP
#define STATUSLIST_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace statuslist {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 0;
inline constexpr int VERSION_MINOR = 3;
inline constexpr int VERSION_PATCH = 0;

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "0.3.0";
}
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// zlib compression level for the packed buffer (0-9, 9 = best)
#ifndef STATUSLIST_COMPRESSION_LEVEL
#define STATUSLIST_COMPRESSION_LEVEL 9
#endif

/// Upper bound on the decompressed packed buffer (16 MiB = 2^27 one-bit statuses)
#ifndef STATUSLIST_MAX_DECOMPRESSED_BYTES
#define STATUSLIST_MAX_DECOMPRESSED_BYTES (16U * 1024U * 1024U)
#endif

inline constexpr int DEFAULT_COMPRESSION_LEVEL = STATUSLIST_COMPRESSION_LEVEL;
inline constexpr int MIN_COMPRESSION_LEVEL = 0;
inline constexpr int MAX_COMPRESSION_LEVEL = 9;
inline constexpr std::size_t MAX_DECOMPRESSED_BYTES = STATUSLIST_MAX_DECOMPRESSED_BYTES;

/// Inflate output chunk size
inline constexpr std::size_t INFLATE_CHUNK_BYTES = 16U * 1024U;

/** @} */

/// A single status value as stored in the packed buffer.
using StatusCode = std::uint8_t;

/**
 * @brief Runtime compression parameters for StatusListBuilder.
 */
struct CodecParams {
    int level = DEFAULT_COMPRESSION_LEVEL; ///< zlib level 0-9
};

} // namespace statuslist

#endif // STATUSLIST_CONFIG_HPP
