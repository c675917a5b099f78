/**
 * @file bitpacker.hpp
 * @brief Fixed-width status packing into bytes.
 *
 * This module lays status codes out in the packed buffer that is later
 * compressed into a status list.
 *
 * @par Bit Ordering
 * Statuses are packed LSB-first within each byte:
 * - The first status occupies the least significant bits of byte 0
 * - Following statuses move toward the most significant bits
 * - Packing then continues in the next byte
 *
 * With width 1 the codes [1,0,0,1,1,1,0,1] pack to 0xB9.
 *
 * @par Padding
 * Unused high-order bits of a partially filled last byte are zero.
 * The packed length is always ceil(count * width / 8) bytes.
 */

#ifndef STATUSLIST_BITPACKER_HPP
#define STATUSLIST_BITPACKER_HPP

#include "config.hpp"
#include "error.hpp"
#include "types.hpp"

#include <vector>

namespace statuslist {

/**
 * @brief Packed buffer length for a status count.
 *
 * @param count Number of statuses
 * @param width Bits per status
 * @return ceil(count * width / 8)
 */
[[nodiscard]] constexpr std::size_t packed_size(std::size_t count, BitWidth width) noexcept {
    return (count * bit_count(width) + 7U) / 8U;
}

/**
 * @brief Number of addressable statuses in a packed buffer.
 *
 * @param num_bytes Packed buffer length
 * @param width Bits per status
 * @return floor(num_bytes * 8 / width)
 */
[[nodiscard]] constexpr std::size_t packed_capacity(std::size_t num_bytes, BitWidth width) noexcept {
    return (num_bytes * 8U) / bit_count(width);
}

/**
 * @brief Growable LSB-first writer for fixed-width values.
 *
 * Values are collected in a small accumulator and flushed to the output
 * byte by byte, low bits first.
 */
class PackedWriter {
public:
    explicit PackedWriter(BitWidth width) noexcept : width_(width), acc_(0), acc_len_(0) {}

    /**
     * @brief Reserve space for a known number of statuses.
     */
    void reserve(std::size_t count) {
        data_.reserve(packed_size(count, width_));
    }

    /**
     * @brief Append one status.
     *
     * @param code Status code
     * @return Error::Ok on success, Error::ValueOutOfRange if the code does not fit
     */
    Error append(StatusCode code) {
        if (!fits(code, width_)) {
            return Error::ValueOutOfRange;
        }

        acc_ |= static_cast<std::uint32_t>(code) << acc_len_;
        acc_len_ += bit_count(width_);

        // Flush complete bytes
        while (acc_len_ >= 8) {
            data_.push_back(static_cast<std::uint8_t>(acc_ & 0xFFU));
            acc_ >>= 8;
            acc_len_ -= 8;
        }

        return Error::Ok;
    }

    /**
     * @brief Flush the zero-padded partial byte and release the buffer.
     *
     * The writer is empty afterwards.
     */
    std::vector<std::uint8_t> finish() {
        if (acc_len_ > 0) {
            // High-order bits are already zero
            data_.push_back(static_cast<std::uint8_t>(acc_ & 0xFFU));
        }
        acc_ = 0;
        acc_len_ = 0;
        std::vector<std::uint8_t> out;
        out.swap(data_);
        return out;
    }

    [[nodiscard]] BitWidth width() const noexcept { return width_; }

private:
    BitWidth width_;
    std::vector<std::uint8_t> data_;
    std::uint32_t acc_;
    unsigned acc_len_;
};

/**
 * @brief Pack status codes into a byte buffer.
 *
 * Every code is range-checked before anything is written, so @p out is
 * left untouched on error.
 *
 * @param codes Status codes in list order
 * @param count Number of codes
 * @param width Bits per status
 * @param[out] out Packed buffer, ceil(count * width / 8) bytes
 * @return Error::Ok on success, Error::ValueOutOfRange if a code does not fit
 */
Error pack(const StatusCode* codes, std::size_t count, BitWidth width,
           std::vector<std::uint8_t>& out);

/**
 * @brief Pack status codes into a byte buffer.
 */
inline Error pack(const std::vector<StatusCode>& codes, BitWidth width,
                  std::vector<std::uint8_t>& out) {
    return pack(codes.data(), codes.size(), width, out);
}

/**
 * @brief Read one status from a packed buffer.
 *
 * Extracts exactly width bits starting at bit offset index * width.
 * Reads at most two bytes and allocates nothing.
 *
 * @param data Packed buffer
 * @param num_bytes Packed buffer length
 * @param width Bits per status
 * @param index Status index
 * @param[out] code Status value (untouched on error)
 * @return Error::Ok on success, Error::IndexOutOfBounds unless
 *         index < floor(num_bytes * 8 / width)
 */
inline Error unpack_one(const std::uint8_t* data, std::size_t num_bytes, BitWidth width,
                        std::size_t index, StatusCode& code) noexcept {
    if (index >= packed_capacity(num_bytes, width)) [[unlikely]] {
        return Error::IndexOutOfBounds;
    }

    const unsigned bits = bit_count(width);
    const std::size_t bit_pos = index * bits;
    const std::size_t byte_idx = bit_pos >> 3; // bit_pos / 8
    const auto bit_idx = static_cast<unsigned>(bit_pos & 7); // bit_pos % 8

    std::uint32_t window = data[byte_idx];
    if (bit_idx + bits > 8 && byte_idx + 1 < num_bytes) {
        // Value continues into the next byte
        window |= static_cast<std::uint32_t>(data[byte_idx + 1]) << 8;
    }

    const std::uint32_t mask = (1U << bits) - 1U;
    code = static_cast<StatusCode>((window >> bit_idx) & mask);
    return Error::Ok;
}

/**
 * @brief Read one status from a packed buffer.
 */
inline Error unpack_one(const std::vector<std::uint8_t>& buffer, BitWidth width,
                        std::size_t index, StatusCode& code) noexcept {
    return unpack_one(buffer.data(), buffer.size(), width, index, code);
}

} // namespace statuslist

#endif // STATUSLIST_BITPACKER_HPP
