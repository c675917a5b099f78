/**
 * @file decoder.cpp
 * @brief StatusListDecoder implementation.
 */

#include <statuslist/bitpacker.hpp>
#include <statuslist/codec.hpp>
#include <statuslist/decoder.hpp>
#include <statuslist/encoding.hpp>
#include <statuslist/logger.hpp>

#include <string>

namespace statuslist {

StatusListDecoder::StatusListDecoder(const StatusList& list, std::size_t max_decompressed_bytes)
    : StatusListDecoder(list.bits(), list.lst(), max_decompressed_bytes) {}

StatusListDecoder::StatusListDecoder(BitWidth bits, const std::vector<std::uint8_t>& compressed,
                                     std::size_t max_decompressed_bytes)
    : bits_(bits) {
    BitWidth checked = BitWidth::One;
    throw_if_error(to_bit_width(static_cast<int>(bit_count(bits)), checked), "StatusListDecoder");

    throw_if_error(decompress(compressed, packed_, max_decompressed_bytes), "decompress");

    LogManager::Instance().Debug("decoded status list: {} bits, {} compressed bytes, "
                                 "{} packed bytes, {} statuses",
                                 bit_count(bits_), compressed.size(), packed_.size(), size());
}

StatusListDecoder StatusListDecoder::from_base64(int bits, std::string_view lst,
                                                 std::size_t max_decompressed_bytes) {
    BitWidth width = parse_bit_width(bits);

    std::vector<std::uint8_t> compressed;
    auto result = base64url_decode(lst, compressed);
    if (result != Error::Ok) {
        LogManager::Instance().Warn("rejected lst: not valid base64url ({} chars)", lst.size());
    }
    throw_if_error(result, "lst");

    return StatusListDecoder(width, compressed, max_decompressed_bytes);
}

StatusCode StatusListDecoder::get_status(std::size_t index) const {
    StatusCode code = 0;
    auto result = unpack_one(packed_, bits_, index, code);
    if (result != Error::Ok) {
        throw_if_error(result, "index " + std::to_string(index) + " of " + std::to_string(size()));
    }
    return code;
}

std::optional<StatusType> StatusListDecoder::get_status_type(std::size_t index) const {
    return to_status_type(get_status(index));
}

std::size_t StatusListDecoder::size() const noexcept {
    return packed_capacity(packed_.size(), bits_);
}

} // namespace statuslist
