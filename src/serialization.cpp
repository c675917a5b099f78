/**
 * @file serialization.cpp
 * @brief JSON and CBOR adapters built on nlohmann::json.
 */

#include <statuslist/encoding.hpp>
#include <statuslist/logger.hpp>
#include <statuslist/serialization.hpp>

#include <optional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace statuslist {

namespace {

using Document = nlohmann::ordered_json;

constexpr const char* kBits = "bits";
constexpr const char* kLst = "lst";
constexpr const char* kAggregationUri = "aggregation_uri";

[[noreturn]] void malformed(const char* format, const std::string& detail) {
    LogManager::Instance().Warn("rejected {} document: {}", format, detail);
    throw MalformedEncodingException(std::string(format) + ": " + detail);
}

Document base_document(const StatusList& list) {
    Document doc;
    doc[kBits] = bit_count(list.bits());
    return doc;
}

void add_aggregation_uri(Document& doc, const StatusList& list) {
    if (list.aggregation_uri()) {
        doc[kAggregationUri] = *list.aggregation_uri();
    }
}

// Returns the integer width, or std::nullopt if the member has the wrong type
std::optional<int> read_bits(const Document& value, bool allow_string) {
    if (value.is_number_unsigned()) {
        auto bits = value.get<std::uint64_t>();
        return bits > 255 ? 0 : static_cast<int>(bits);
    }
    if (value.is_number_integer()) {
        // Negative widths are never valid
        return 0;
    }
    if (allow_string && value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        if (text.empty() || text.size() > 3) {
            return std::nullopt;
        }
        int bits = 0;
        for (char c : text) {
            if (c < '0' || c > '9') {
                return std::nullopt;
            }
            bits = bits * 10 + (c - '0');
        }
        return bits;
    }
    return std::nullopt;
}

std::optional<std::string> read_aggregation_uri(const Document& doc, const char* format) {
    auto it = doc.find(kAggregationUri);
    if (it == doc.end()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        malformed(format, "\"aggregation_uri\" must be a string");
    }
    return it->get<std::string>();
}

StatusList parse_cbor_document(const Document& doc) {
    constexpr const char* format = "CBOR";

    if (!doc.is_object()) {
        malformed(format, "top level is not a map");
    }

    auto bits_it = doc.find(kBits);
    if (bits_it == doc.end()) {
        malformed(format, "missing \"bits\"");
    }
    auto bits = read_bits(*bits_it, false);
    if (!bits) {
        malformed(format, "\"bits\" must be an unsigned integer");
    }

    auto lst_it = doc.find(kLst);
    if (lst_it == doc.end()) {
        malformed(format, "missing \"lst\"");
    }
    if (!lst_it->is_binary()) {
        malformed(format, "\"lst\" must be a byte string");
    }
    const auto& binary = lst_it->get_binary();
    std::vector<std::uint8_t> lst(binary.begin(), binary.end());

    return StatusList(*bits, std::move(lst), read_aggregation_uri(doc, format));
}

} // namespace

std::string to_json(const StatusList& list) {
    Document doc = base_document(list);
    doc[kLst] = base64url_encode(list.lst());
    add_aggregation_uri(doc, list);
    return doc.dump();
}

StatusList from_json(std::string_view text) {
    constexpr const char* format = "JSON";

    Document doc;
    try {
        doc = Document::parse(text.begin(), text.end());
    } catch (const nlohmann::json::exception& ex) {
        malformed(format, ex.what());
    }

    if (!doc.is_object()) {
        malformed(format, "top level is not an object");
    }

    auto bits_it = doc.find(kBits);
    if (bits_it == doc.end()) {
        malformed(format, "missing \"bits\"");
    }
    auto bits = read_bits(*bits_it, true);
    if (!bits) {
        malformed(format, "\"bits\" must be an integer or a decimal string");
    }

    auto lst_it = doc.find(kLst);
    if (lst_it == doc.end()) {
        malformed(format, "missing \"lst\"");
    }
    if (!lst_it->is_string()) {
        malformed(format, "\"lst\" must be a string");
    }

    std::vector<std::uint8_t> lst;
    if (base64url_decode(lst_it->get_ref<const std::string&>(), lst) != Error::Ok) {
        malformed(format, "\"lst\" is not valid base64url");
    }

    return StatusList(*bits, std::move(lst), read_aggregation_uri(doc, format));
}

std::vector<std::uint8_t> to_cbor(const StatusList& list) {
    Document doc = base_document(list);
    doc[kLst] = Document::binary(list.lst());
    add_aggregation_uri(doc, list);
    return Document::to_cbor(doc);
}

StatusList from_cbor(const std::uint8_t* data, std::size_t size) {
    Document doc;
    try {
        doc = Document::from_cbor(data, data + size);
    } catch (const nlohmann::json::exception& ex) {
        malformed("CBOR", ex.what());
    }
    return parse_cbor_document(doc);
}

std::string to_cbor_hex(const StatusList& list) {
    return hex_encode(to_cbor(list));
}

StatusList from_cbor_hex(std::string_view hex) {
    std::vector<std::uint8_t> bytes;
    if (hex_decode(hex, bytes) != Error::Ok) {
        malformed("CBOR", "not valid hex");
    }
    return from_cbor(bytes);
}

} // namespace statuslist
