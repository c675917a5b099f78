/**
 * @file builder.cpp
 * @brief StatusListBuilder implementation.
 */

#include <statuslist/bitpacker.hpp>
#include <statuslist/builder.hpp>
#include <statuslist/codec.hpp>
#include <statuslist/logger.hpp>

#include <string>
#include <utility>

namespace statuslist {

namespace {

void check_params(const CodecParams& params) {
    if (params.level < MIN_COMPRESSION_LEVEL || params.level > MAX_COMPRESSION_LEVEL) {
        throw InvalidArgumentException("compression level must be 0-9, got " +
                                       std::to_string(params.level));
    }
}

} // namespace

StatusListBuilder::StatusListBuilder(int bits, const CodecParams& params)
    : StatusListBuilder(parse_bit_width(bits), params) {}

StatusListBuilder::StatusListBuilder(BitWidth bits, const CodecParams& params)
    : bits_(bits), params_(params), state_(State::Open) {
    BitWidth checked = BitWidth::One;
    throw_if_error(to_bit_width(static_cast<int>(bit_count(bits)), checked), "StatusListBuilder");
    check_params(params_);
}

StatusListBuilder StatusListBuilder::from_statuses(std::vector<StatusCode> codes, int bits,
                                                   const CodecParams& params) {
    StatusListBuilder builder(bits, params);

    for (std::size_t i = 0; i < codes.size(); ++i) {
        if (!fits(codes[i], builder.bits_)) {
            throw ValueOutOfRangeException("status " + std::to_string(codes[i]) + " at index " +
                                           std::to_string(i) + " does not fit in " +
                                           std::to_string(bits) + " bits");
        }
    }

    builder.codes_ = std::move(codes);
    return builder;
}

StatusListBuilder& StatusListBuilder::add_status(unsigned code) {
    ensure_open("add_status");

    if (code > max_status_value(bits_)) {
        throw ValueOutOfRangeException("status " + std::to_string(code) + " does not fit in " +
                                       std::to_string(bit_count(bits_)) + " bits");
    }

    codes_.push_back(static_cast<StatusCode>(code));
    return *this;
}

StatusListBuilder& StatusListBuilder::add_status(StatusType type) {
    return add_status(static_cast<unsigned>(to_code(type)));
}

StatusListBuilder& StatusListBuilder::set_aggregation_uri(std::string uri) {
    ensure_open("set_aggregation_uri");
    aggregation_uri_ = std::move(uri);
    return *this;
}

StatusList StatusListBuilder::build() {
    ensure_open("build");

    std::vector<std::uint8_t> packed;
    throw_if_error(pack(codes_, bits_, packed), "pack");

    std::vector<std::uint8_t> compressed;
    throw_if_error(compress(packed, compressed, params_.level), "compress");

    LogManager::Instance().Debug("built status list: {} statuses, {} bits, {} packed bytes, "
                                 "{} compressed bytes",
                                 codes_.size(), bit_count(bits_), packed.size(),
                                 compressed.size());

    state_ = State::Built;
    codes_.clear();
    codes_.shrink_to_fit();

    return StatusList(bits_, std::move(compressed), std::move(aggregation_uri_));
}

void StatusListBuilder::ensure_open(const char* operation) const {
    if (state_ == State::Built) {
        throw BuilderAlreadyFinalizedException(std::string(operation) +
                                               ": builder already finalized");
    }
}

} // namespace statuslist
