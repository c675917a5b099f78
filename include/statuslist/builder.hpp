/**
 * @file builder.hpp
 * @brief Incremental construction of status lists.
 *
 * The builder is a two-state machine:
 * - Open: statuses may be appended
 * - Built: terminal, reached by a successful build()
 *
 * Any mutation or a second build() after the first one throws
 * BuilderAlreadyFinalizedException. Status lists returned earlier stay
 * valid.
 *
 * A builder must not be used from several threads at once.
 */

#ifndef STATUSLIST_BUILDER_HPP
#define STATUSLIST_BUILDER_HPP

#include "config.hpp"
#include "error.hpp"
#include "status_list.hpp"
#include "types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace statuslist {

class StatusListBuilder {
public:
    /**
     * @brief Create an empty builder.
     *
     * @param bits Bits per status
     * @param params Compression level used by build()
     * @throws InvalidBitWidthException unless bits is 1, 2, 4 or 8
     * @throws InvalidArgumentException if the compression level is not 0-9
     */
    explicit StatusListBuilder(int bits, const CodecParams& params = CodecParams{});

    explicit StatusListBuilder(BitWidth bits, const CodecParams& params = CodecParams{});

    /**
     * @brief Create a builder holding an existing status sequence.
     *
     * The whole sequence is validated before the builder exists.
     *
     * @throws InvalidBitWidthException unless bits is 1, 2, 4 or 8
     * @throws ValueOutOfRangeException if any code does not fit the width
     */
    static StatusListBuilder from_statuses(std::vector<StatusCode> codes, int bits,
                                           const CodecParams& params = CodecParams{});

    /**
     * @brief Append one status.
     *
     * On failure the sequence is unchanged.
     *
     * @param code Status value, must be below 2^bits
     * @return *this
     * @throws ValueOutOfRangeException if the code does not fit the width
     * @throws BuilderAlreadyFinalizedException after build()
     */
    StatusListBuilder& add_status(unsigned code);

    /**
     * @brief Append one named status.
     */
    StatusListBuilder& add_status(StatusType type);

    /**
     * @brief Attach an aggregation URI to the list being built.
     * @throws BuilderAlreadyFinalizedException after build()
     */
    StatusListBuilder& set_aggregation_uri(std::string uri);

    /**
     * @brief Pack and compress the accumulated statuses.
     *
     * Moves the builder to the Built state. An empty builder yields a list
     * whose packed buffer is empty.
     *
     * @return Immutable status list
     * @throws BuilderAlreadyFinalizedException when called a second time
     * @throws CompressionFailedException if zlib fails
     */
    StatusList build();

    /// Index of the most recently appended status.
    [[nodiscard]] std::optional<std::size_t> last_index() const noexcept {
        if (codes_.empty()) {
            return std::nullopt;
        }
        return codes_.size() - 1;
    }

    /// Number of statuses appended so far (0 once built).
    [[nodiscard]] std::size_t size() const noexcept { return codes_.size(); }

    [[nodiscard]] BitWidth bits() const noexcept { return bits_; }

    [[nodiscard]] bool is_built() const noexcept { return state_ == State::Built; }

private:
    enum class State { Open, Built };

    void ensure_open(const char* operation) const;

    BitWidth bits_;
    CodecParams params_;
    State state_;
    std::vector<StatusCode> codes_;
    std::optional<std::string> aggregation_uri_;
};

} // namespace statuslist

#endif // STATUSLIST_BUILDER_HPP
