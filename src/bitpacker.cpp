/**
 * @file bitpacker.cpp
 * @brief Status packing.
 */

#include <statuslist/bitpacker.hpp>

namespace statuslist {

Error pack(const StatusCode* codes, std::size_t count, BitWidth width,
           std::vector<std::uint8_t>& out) {
    if (count > 0 && codes == nullptr) {
        return Error::InvalidArgument;
    }

    // Validate first so a failed pack has no side effects
    for (std::size_t i = 0; i < count; ++i) {
        if (!fits(codes[i], width)) {
            return Error::ValueOutOfRange;
        }
    }

    // Fast path: byte-aligned, one status per byte
    if (width == BitWidth::Eight) {
        out.assign(codes, codes + count);
        return Error::Ok;
    }

    PackedWriter writer(width);
    writer.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        auto result = writer.append(codes[i]);
        if (result != Error::Ok) {
            return result;
        }
    }

    out = writer.finish();
    return Error::Ok;
}

} // namespace statuslist
