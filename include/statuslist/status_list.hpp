/**
 * @file status_list.hpp
 * @brief Immutable status list value.
 *
 * A status list is the pair {bits, lst}: the bit width and the zlib
 * compressed packed buffer. An optional aggregation URI names where
 * related status lists can be discovered.
 */

#ifndef STATUSLIST_STATUS_LIST_HPP
#define STATUSLIST_STATUS_LIST_HPP

#include "config.hpp"
#include "types.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace statuslist {

class StatusList {
public:
    /**
     * @brief Construct from an already validated width.
     *
     * @param bits Bits per status
     * @param lst Compressed packed buffer
     * @param aggregation_uri Optional aggregation URI
     */
    StatusList(BitWidth bits, std::vector<std::uint8_t> lst,
               std::optional<std::string> aggregation_uri = std::nullopt)
        : bits_(bits), lst_(std::move(lst)), aggregation_uri_(std::move(aggregation_uri)) {}

    /**
     * @brief Construct from an integer width.
     *
     * @throws InvalidBitWidthException unless bits is 1, 2, 4 or 8
     */
    StatusList(int bits, std::vector<std::uint8_t> lst,
               std::optional<std::string> aggregation_uri = std::nullopt)
        : StatusList(parse_bit_width(bits), std::move(lst), std::move(aggregation_uri)) {}

    [[nodiscard]] BitWidth bits() const noexcept { return bits_; }

    /// Compressed packed buffer.
    [[nodiscard]] const std::vector<std::uint8_t>& lst() const noexcept { return lst_; }

    [[nodiscard]] const std::optional<std::string>& aggregation_uri() const noexcept {
        return aggregation_uri_;
    }

    bool operator==(const StatusList& other) const = default;

private:
    BitWidth bits_;
    std::vector<std::uint8_t> lst_;
    std::optional<std::string> aggregation_uri_;
};

} // namespace statuslist

#endif // STATUSLIST_STATUS_LIST_HPP
