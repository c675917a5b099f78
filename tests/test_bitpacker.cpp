/**
 * @file test_bitpacker.cpp
 * @brief Unit tests for status packing and single-status extraction.
 */

#include <catch2/catch_test_macros.hpp>
#include <statuslist/bitpacker.hpp>

#include <vector>

using namespace statuslist;

TEST_CASE("packed_size and packed_capacity", "[bitpacker]") {
    SECTION("exact multiples of a byte") {
        REQUIRE(packed_size(8, BitWidth::One) == 1);
        REQUIRE(packed_size(4, BitWidth::Two) == 1);
        REQUIRE(packed_size(2, BitWidth::Four) == 1);
        REQUIRE(packed_size(1, BitWidth::Eight) == 1);
    }

    SECTION("partial last byte rounds up") {
        REQUIRE(packed_size(9, BitWidth::One) == 2);
        REQUIRE(packed_size(3, BitWidth::Two) == 1);
        REQUIRE(packed_size(5, BitWidth::Four) == 3);
    }

    SECTION("empty") {
        REQUIRE(packed_size(0, BitWidth::One) == 0);
        REQUIRE(packed_capacity(0, BitWidth::Eight) == 0);
    }

    SECTION("capacity counts every slot in the buffer") {
        REQUIRE(packed_capacity(2, BitWidth::One) == 16);
        REQUIRE(packed_capacity(2, BitWidth::Two) == 8);
        REQUIRE(packed_capacity(2, BitWidth::Four) == 4);
        REQUIRE(packed_capacity(2, BitWidth::Eight) == 2);
    }
}

TEST_CASE("pack bit ordering", "[bitpacker]") {
    std::vector<std::uint8_t> out;

    SECTION("1-bit: first status in bit 0") {
        std::vector<StatusCode> codes = {1, 0, 0, 1, 1, 1, 0, 1, 1, 1, 0, 0, 0, 1, 0, 1};
        REQUIRE(pack(codes, BitWidth::One, out) == Error::Ok);
        REQUIRE(out == std::vector<std::uint8_t>{0xB9, 0xA3});
    }

    SECTION("2-bit: four statuses per byte, low pair first") {
        std::vector<StatusCode> codes = {1, 2, 0, 3, 0, 1, 0, 1, 1, 2, 3, 3};
        REQUIRE(pack(codes, BitWidth::Two, out) == Error::Ok);
        REQUIRE(out == std::vector<std::uint8_t>{0xC9, 0x44, 0xF9});
    }

    SECTION("4-bit: low nibble first") {
        std::vector<StatusCode> codes = {1, 2, 0, 3, 0, 1, 0, 1, 1, 2, 3, 3};
        REQUIRE(pack(codes, BitWidth::Four, out) == Error::Ok);
        REQUIRE(out == std::vector<std::uint8_t>{0x21, 0x30, 0x10, 0x10, 0x21, 0x33});
    }

    SECTION("8-bit: one status per byte") {
        std::vector<StatusCode> codes = {1, 2, 0, 3, 0, 1, 2, 3, 0xFF};
        REQUIRE(pack(codes, BitWidth::Eight, out) == Error::Ok);
        REQUIRE(out == std::vector<std::uint8_t>{1, 2, 0, 3, 0, 1, 2, 3, 0xFF});
    }

    SECTION("second status lands above the first") {
        std::vector<StatusCode> codes = {0, 1};
        REQUIRE(pack(codes, BitWidth::One, out) == Error::Ok);
        REQUIRE(out[0] == 0x02);
        REQUIRE(pack(codes, BitWidth::Two, out) == Error::Ok);
        REQUIRE(out[0] == 0x04);
        REQUIRE(pack(codes, BitWidth::Four, out) == Error::Ok);
        REQUIRE(out[0] == 0x10);
    }
}

TEST_CASE("pack padding", "[bitpacker]") {
    std::vector<std::uint8_t> out;

    SECTION("unused high bits are zero") {
        std::vector<StatusCode> codes = {1, 1, 1};
        REQUIRE(pack(codes, BitWidth::One, out) == Error::Ok);
        REQUIRE(out == std::vector<std::uint8_t>{0x07});
    }

    SECTION("trailing 2-bit statuses") {
        std::vector<StatusCode> codes = {3, 3, 3, 3, 3};
        REQUIRE(pack(codes, BitWidth::Two, out) == Error::Ok);
        REQUIRE(out == std::vector<std::uint8_t>{0xFF, 0x03});
    }

    SECTION("length is ceil(count * width / 8)") {
        for (std::size_t count = 0; count <= 17; ++count) {
            std::vector<StatusCode> codes(count, 1);
            REQUIRE(pack(codes, BitWidth::One, out) == Error::Ok);
            REQUIRE(out.size() == (count + 7) / 8);
        }
    }

    SECTION("empty input yields empty buffer") {
        out = {0xAA};
        REQUIRE(pack(std::vector<StatusCode>{}, BitWidth::Four, out) == Error::Ok);
        REQUIRE(out.empty());
    }
}

TEST_CASE("pack rejects values that do not fit", "[bitpacker]") {
    std::vector<std::uint8_t> out = {0xAA, 0xBB};

    SECTION("1-bit") {
        std::vector<StatusCode> codes = {0, 1, 2};
        REQUIRE(pack(codes, BitWidth::One, out) == Error::ValueOutOfRange);
    }

    SECTION("2-bit") {
        std::vector<StatusCode> codes = {3, 4};
        REQUIRE(pack(codes, BitWidth::Two, out) == Error::ValueOutOfRange);
    }

    SECTION("4-bit") {
        std::vector<StatusCode> codes = {15, 16};
        REQUIRE(pack(codes, BitWidth::Four, out) == Error::ValueOutOfRange);
    }

    // Output left as it was
    REQUIRE(out == std::vector<std::uint8_t>{0xAA, 0xBB});
}

TEST_CASE("unpack_one", "[bitpacker]") {
    StatusCode code = 0xEE;

    SECTION("1-bit reference bytes") {
        const std::vector<std::uint8_t> buffer = {0xB9, 0xA3};
        const StatusCode expected[] = {1, 0, 0, 1, 1, 1, 0, 1, 1, 1, 0, 0, 0, 1, 0, 1};
        for (std::size_t i = 0; i < 16; ++i) {
            REQUIRE(unpack_one(buffer, BitWidth::One, i, code) == Error::Ok);
            REQUIRE(code == expected[i]);
        }
    }

    SECTION("2-bit reference bytes") {
        const std::vector<std::uint8_t> buffer = {0xC9, 0x44, 0xF9};
        const StatusCode expected[] = {1, 2, 0, 3, 0, 1, 0, 1, 1, 2, 3, 3};
        for (std::size_t i = 0; i < 12; ++i) {
            REQUIRE(unpack_one(buffer, BitWidth::Two, i, code) == Error::Ok);
            REQUIRE(code == expected[i]);
        }
    }

    SECTION("4-bit nibbles") {
        const std::vector<std::uint8_t> buffer = {0xA5};
        REQUIRE(unpack_one(buffer, BitWidth::Four, 0, code) == Error::Ok);
        REQUIRE(code == 0x5);
        REQUIRE(unpack_one(buffer, BitWidth::Four, 1, code) == Error::Ok);
        REQUIRE(code == 0xA);
    }

    SECTION("8-bit returns whole bytes") {
        const std::vector<std::uint8_t> buffer = {0x00, 0x7F, 0xFF};
        REQUIRE(unpack_one(buffer, BitWidth::Eight, 2, code) == Error::Ok);
        REQUIRE(code == 0xFF);
    }

    SECTION("index at capacity is out of bounds") {
        const std::vector<std::uint8_t> buffer = {0xFF};
        REQUIRE(unpack_one(buffer, BitWidth::One, 7, code) == Error::Ok);
        REQUIRE(unpack_one(buffer, BitWidth::One, 8, code) == Error::IndexOutOfBounds);
        REQUIRE(unpack_one(buffer, BitWidth::Eight, 1, code) == Error::IndexOutOfBounds);
    }

    SECTION("empty buffer has no statuses") {
        const std::vector<std::uint8_t> buffer;
        code = 9;
        REQUIRE(unpack_one(buffer, BitWidth::Two, 0, code) == Error::IndexOutOfBounds);
        REQUIRE(code == 9);
    }
}

TEST_CASE("pack then unpack_one returns every status", "[bitpacker]") {
    const BitWidth widths[] = {BitWidth::One, BitWidth::Two, BitWidth::Four, BitWidth::Eight};

    for (BitWidth width : widths) {
        // 37 statuses: never a whole number of bytes for widths below 8
        std::vector<StatusCode> codes;
        for (std::size_t i = 0; i < 37; ++i) {
            codes.push_back(static_cast<StatusCode>((i * 7 + 3) % (max_status_value(width) + 1U)));
        }

        std::vector<std::uint8_t> buffer;
        REQUIRE(pack(codes, width, buffer) == Error::Ok);
        REQUIRE(buffer.size() == packed_size(codes.size(), width));

        for (std::size_t i = 0; i < codes.size(); ++i) {
            StatusCode code = 0;
            REQUIRE(unpack_one(buffer, width, i, code) == Error::Ok);
            REQUIRE(code == codes[i]);
        }

        // Padding slots read back as zero
        for (std::size_t i = codes.size(); i < packed_capacity(buffer.size(), width); ++i) {
            StatusCode code = 0xEE;
            REQUIRE(unpack_one(buffer, width, i, code) == Error::Ok);
            REQUIRE(code == 0);
        }
    }
}

TEST_CASE("PackedWriter", "[bitpacker]") {
    SECTION("accumulates across bytes") {
        PackedWriter writer(BitWidth::Two);
        for (int i = 0; i < 5; ++i) {
            REQUIRE(writer.append(2) == Error::Ok);
        }
        auto bytes = writer.finish();
        REQUIRE(bytes == std::vector<std::uint8_t>{0xAA, 0x02});
    }

    SECTION("rejects oversized value without writing") {
        PackedWriter writer(BitWidth::One);
        REQUIRE(writer.append(1) == Error::Ok);
        REQUIRE(writer.append(2) == Error::ValueOutOfRange);
        REQUIRE(writer.finish() == std::vector<std::uint8_t>{0x01});
    }

    SECTION("finish resets the writer") {
        PackedWriter writer(BitWidth::Four);
        REQUIRE(writer.append(0xF) == Error::Ok);
        REQUIRE(writer.finish().size() == 1);
        REQUIRE(writer.finish().empty());
    }
}
