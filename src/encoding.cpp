/**
 * @file encoding.cpp
 * @brief base64url and hex codecs.
 */

#include <statuslist/encoding.hpp>

#include <utility>

namespace statuslist {

namespace {

constexpr char kBase64UrlAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

constexpr char kHexDigits[] = "0123456789abcdef";

// Returns 0-63, or -1 for characters outside the URL-safe alphabet
int base64url_value(char c) noexcept {
    if (c >= 'A' && c <= 'Z') {
        return c - 'A';
    }
    if (c >= 'a' && c <= 'z') {
        return c - 'a' + 26;
    }
    if (c >= '0' && c <= '9') {
        return c - '0' + 52;
    }
    if (c == '-') {
        return 62;
    }
    if (c == '_') {
        return 63;
    }
    return -1;
}

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace

std::string base64url_encode(const std::uint8_t* data, std::size_t size) {
    std::string out;
    out.reserve((size * 4 + 2) / 3);

    std::size_t i = 0;
    for (; i + 3 <= size; i += 3) {
        std::uint32_t group = (static_cast<std::uint32_t>(data[i]) << 16) |
                              (static_cast<std::uint32_t>(data[i + 1]) << 8) | data[i + 2];
        out.push_back(kBase64UrlAlphabet[(group >> 18) & 0x3F]);
        out.push_back(kBase64UrlAlphabet[(group >> 12) & 0x3F]);
        out.push_back(kBase64UrlAlphabet[(group >> 6) & 0x3F]);
        out.push_back(kBase64UrlAlphabet[group & 0x3F]);
    }

    std::size_t tail = size - i;
    if (tail == 1) {
        std::uint32_t group = static_cast<std::uint32_t>(data[i]) << 16;
        out.push_back(kBase64UrlAlphabet[(group >> 18) & 0x3F]);
        out.push_back(kBase64UrlAlphabet[(group >> 12) & 0x3F]);
    } else if (tail == 2) {
        std::uint32_t group = (static_cast<std::uint32_t>(data[i]) << 16) |
                              (static_cast<std::uint32_t>(data[i + 1]) << 8);
        out.push_back(kBase64UrlAlphabet[(group >> 18) & 0x3F]);
        out.push_back(kBase64UrlAlphabet[(group >> 12) & 0x3F]);
        out.push_back(kBase64UrlAlphabet[(group >> 6) & 0x3F]);
    }

    return out;
}

Error base64url_decode(std::string_view text, std::vector<std::uint8_t>& out) {
    if (text.size() % 4 == 1) {
        return Error::MalformedEncoding;
    }

    std::vector<std::uint8_t> bytes;
    bytes.reserve(text.size() * 3 / 4);

    std::uint32_t acc = 0;
    unsigned acc_len = 0;
    for (char c : text) {
        int value = base64url_value(c);
        if (value < 0) {
            return Error::MalformedEncoding;
        }
        acc = (acc << 6) | static_cast<std::uint32_t>(value);
        acc_len += 6;
        if (acc_len >= 8) {
            acc_len -= 8;
            bytes.push_back(static_cast<std::uint8_t>((acc >> acc_len) & 0xFFU));
        }
    }

    // Leftover bits of the last character must be zero
    if (acc_len > 0 && (acc & ((1U << acc_len) - 1U)) != 0) {
        return Error::MalformedEncoding;
    }

    out = std::move(bytes);
    return Error::Ok;
}

std::string hex_encode(const std::uint8_t* data, std::size_t size) {
    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out.push_back(kHexDigits[data[i] >> 4]);
        out.push_back(kHexDigits[data[i] & 0x0F]);
    }
    return out;
}

Error hex_decode(std::string_view text, std::vector<std::uint8_t>& out) {
    if (text.size() % 2 != 0) {
        return Error::MalformedEncoding;
    }

    std::vector<std::uint8_t> bytes;
    bytes.reserve(text.size() / 2);
    for (std::size_t i = 0; i < text.size(); i += 2) {
        int hi = hex_value(text[i]);
        int lo = hex_value(text[i + 1]);
        if (hi < 0 || lo < 0) {
            return Error::MalformedEncoding;
        }
        bytes.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }

    out = std::move(bytes);
    return Error::Ok;
}

} // namespace statuslist
