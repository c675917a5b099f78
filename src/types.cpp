/**
 * @file types.cpp
 * @brief Bit width parsing.
 */

#include <statuslist/types.hpp>

#include <string>

namespace statuslist {

BitWidth parse_bit_width(int bits) {
    BitWidth width = BitWidth::One;
    throw_if_error(to_bit_width(bits, width), "bits=" + std::to_string(bits));
    return width;
}

} // namespace statuslist
