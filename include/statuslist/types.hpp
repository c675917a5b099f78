/**
 * @file types.hpp
 * @brief Bit widths and named status types.
 *
 * @par Bit Widths
 * A status list stores every status in the same number of bits, one of
 * 1, 2, 4 or 8. The width fixes how many statuses share a byte (8 / width)
 * and the largest storable code (2^width - 1).
 *
 * @par Status Types
 * Registered values: 0x00 VALID, 0x01 INVALID, 0x02 SUSPENDED, 0x03 and
 * 0x0B-0x0F application specific. 0x04-0x0A are reserved. Codes without a
 * name are still storable when the width allows them.
 */

#ifndef STATUSLIST_TYPES_HPP
#define STATUSLIST_TYPES_HPP

#include "config.hpp"
#include "error.hpp"

#include <optional>

namespace statuslist {

/**
 * @brief Number of bits per status.
 */
enum class BitWidth : std::uint8_t {
    One = 1,
    Two = 2,
    Four = 4,
    Eight = 8
};

/**
 * @brief Named status values.
 */
enum class StatusType : StatusCode {
    Valid = 0x00,
    Invalid = 0x01,
    Suspended = 0x02,
    ApplicationSpecific3 = 0x03,
    ApplicationSpecific11 = 0x0B,
    ApplicationSpecific12 = 0x0C,
    ApplicationSpecific13 = 0x0D,
    ApplicationSpecific14 = 0x0E,
    ApplicationSpecific15 = 0x0F
};

/**
 * @brief Validate an integer bit width.
 *
 * @param bits Candidate width
 * @param[out] width Parsed width (untouched on error)
 * @return Error::Ok, or Error::InvalidBitWidth unless bits is 1, 2, 4 or 8
 */
inline Error to_bit_width(int bits, BitWidth& width) noexcept {
    switch (bits) {
    case 1:
    case 2:
    case 4:
    case 8:
        width = static_cast<BitWidth>(bits);
        return Error::Ok;
    default:
        return Error::InvalidBitWidth;
    }
}

/**
 * @brief Validate an integer bit width, throwing on error.
 * @throws InvalidBitWidthException unless bits is 1, 2, 4 or 8
 */
BitWidth parse_bit_width(int bits);

/// Width as an integer number of bits.
[[nodiscard]] constexpr unsigned bit_count(BitWidth width) noexcept {
    return static_cast<unsigned>(width);
}

/// Statuses stored in one byte.
[[nodiscard]] constexpr unsigned statuses_per_byte(BitWidth width) noexcept {
    return 8U / bit_count(width);
}

/// Largest code storable at this width.
[[nodiscard]] constexpr StatusCode max_status_value(BitWidth width) noexcept {
    return static_cast<StatusCode>((1U << bit_count(width)) - 1U);
}

/// Whether a code fits the width.
[[nodiscard]] constexpr bool fits(StatusCode code, BitWidth width) noexcept {
    return code <= max_status_value(width);
}

/**
 * @brief Map a raw code to its registered name.
 *
 * @param code Status code
 * @return The named type, or std::nullopt for reserved and unnamed codes
 */
inline std::optional<StatusType> to_status_type(StatusCode code) noexcept {
    switch (code) {
    case 0x00:
        return StatusType::Valid;
    case 0x01:
        return StatusType::Invalid;
    case 0x02:
        return StatusType::Suspended;
    case 0x03:
        return StatusType::ApplicationSpecific3;
    case 0x0B:
        return StatusType::ApplicationSpecific11;
    case 0x0C:
        return StatusType::ApplicationSpecific12;
    case 0x0D:
        return StatusType::ApplicationSpecific13;
    case 0x0E:
        return StatusType::ApplicationSpecific14;
    case 0x0F:
        return StatusType::ApplicationSpecific15;
    default:
        return std::nullopt;
    }
}

/// Raw code of a named status.
[[nodiscard]] constexpr StatusCode to_code(StatusType type) noexcept {
    return static_cast<StatusCode>(type);
}

/**
 * @brief Display name of a status type.
 */
inline const char* status_type_name(StatusType type) noexcept {
    switch (type) {
    case StatusType::Valid:
        return "VALID";
    case StatusType::Invalid:
        return "INVALID";
    case StatusType::Suspended:
        return "SUSPENDED";
    case StatusType::ApplicationSpecific3:
    case StatusType::ApplicationSpecific11:
    case StatusType::ApplicationSpecific12:
    case StatusType::ApplicationSpecific13:
    case StatusType::ApplicationSpecific14:
    case StatusType::ApplicationSpecific15:
        return "APPLICATION_SPECIFIC";
    default:
        return "UNKNOWN";
    }
}

} // namespace statuslist

#endif // STATUSLIST_TYPES_HPP
