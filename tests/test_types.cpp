/**
 * @file test_types.cpp
 * @brief Unit tests for bit widths, status types and error mapping.
 */

#include <catch2/catch_test_macros.hpp>
#include <statuslist/error.hpp>
#include <statuslist/types.hpp>

#include <cstring>
#include <string>

using namespace statuslist;

TEST_CASE("to_bit_width", "[types]") {
    BitWidth width = BitWidth::Eight;

    SECTION("accepts 1, 2, 4 and 8") {
        REQUIRE(to_bit_width(1, width) == Error::Ok);
        REQUIRE(width == BitWidth::One);
        REQUIRE(to_bit_width(2, width) == Error::Ok);
        REQUIRE(width == BitWidth::Two);
        REQUIRE(to_bit_width(4, width) == Error::Ok);
        REQUIRE(width == BitWidth::Four);
        REQUIRE(to_bit_width(8, width) == Error::Ok);
        REQUIRE(width == BitWidth::Eight);
    }

    SECTION("rejects everything else") {
        for (int bits : {-1, 0, 3, 5, 6, 7, 9, 16, 255}) {
            REQUIRE(to_bit_width(bits, width) == Error::InvalidBitWidth);
        }
        REQUIRE(width == BitWidth::Eight);
    }

    SECTION("parse_bit_width throws") {
        REQUIRE(parse_bit_width(4) == BitWidth::Four);
        REQUIRE_THROWS_AS(parse_bit_width(3), InvalidBitWidthException);
    }
}

TEST_CASE("bit width properties", "[types]") {
    REQUIRE(statuses_per_byte(BitWidth::One) == 8);
    REQUIRE(statuses_per_byte(BitWidth::Two) == 4);
    REQUIRE(statuses_per_byte(BitWidth::Four) == 2);
    REQUIRE(statuses_per_byte(BitWidth::Eight) == 1);

    REQUIRE(max_status_value(BitWidth::One) == 1);
    REQUIRE(max_status_value(BitWidth::Two) == 3);
    REQUIRE(max_status_value(BitWidth::Four) == 15);
    REQUIRE(max_status_value(BitWidth::Eight) == 255);

    REQUIRE(fits(1, BitWidth::One));
    REQUIRE_FALSE(fits(2, BitWidth::One));
    REQUIRE(fits(3, BitWidth::Two));
    REQUIRE_FALSE(fits(16, BitWidth::Four));
    REQUIRE(fits(255, BitWidth::Eight));
}

TEST_CASE("status types", "[types]") {
    SECTION("standard values") {
        REQUIRE(to_status_type(0x00) == StatusType::Valid);
        REQUIRE(to_status_type(0x01) == StatusType::Invalid);
        REQUIRE(to_status_type(0x02) == StatusType::Suspended);
    }

    SECTION("application specific values") {
        REQUIRE(to_status_type(0x03) == StatusType::ApplicationSpecific3);
        REQUIRE(to_status_type(0x0B) == StatusType::ApplicationSpecific11);
        REQUIRE(to_status_type(0x0C) == StatusType::ApplicationSpecific12);
        REQUIRE(to_status_type(0x0D) == StatusType::ApplicationSpecific13);
        REQUIRE(to_status_type(0x0E) == StatusType::ApplicationSpecific14);
        REQUIRE(to_status_type(0x0F) == StatusType::ApplicationSpecific15);
    }

    SECTION("reserved and unnamed values") {
        for (unsigned code = 0x04; code <= 0x0A; ++code) {
            REQUIRE_FALSE(to_status_type(static_cast<StatusCode>(code)).has_value());
        }
        REQUIRE_FALSE(to_status_type(0x10).has_value());
        REQUIRE_FALSE(to_status_type(0xFF).has_value());
    }

    SECTION("codes and names") {
        REQUIRE(to_code(StatusType::Suspended) == 2);
        REQUIRE(to_code(StatusType::ApplicationSpecific15) == 15);
        REQUIRE(std::strcmp(status_type_name(StatusType::Valid), "VALID") == 0);
        REQUIRE(std::strcmp(status_type_name(StatusType::Invalid), "INVALID") == 0);
        REQUIRE(std::strcmp(status_type_name(StatusType::ApplicationSpecific12),
                            "APPLICATION_SPECIFIC") == 0);
    }
}

TEST_CASE("throw_if_error", "[types][error]") {
    SECTION("Ok does not throw") {
        REQUIRE_NOTHROW(throw_if_error(Error::Ok, "ctx"));
    }

    SECTION("each code maps to its exception") {
        REQUIRE_THROWS_AS(throw_if_error(Error::InvalidBitWidth, ""), InvalidBitWidthException);
        REQUIRE_THROWS_AS(throw_if_error(Error::ValueOutOfRange, ""), ValueOutOfRangeException);
        REQUIRE_THROWS_AS(throw_if_error(Error::IndexOutOfBounds, ""), IndexOutOfBoundsException);
        REQUIRE_THROWS_AS(throw_if_error(Error::BuilderAlreadyFinalized, ""),
                          BuilderAlreadyFinalizedException);
        REQUIRE_THROWS_AS(throw_if_error(Error::CorruptData, ""), CorruptDataException);
        REQUIRE_THROWS_AS(throw_if_error(Error::DecompressionLimitExceeded, ""),
                          DecompressionLimitExceededException);
        REQUIRE_THROWS_AS(throw_if_error(Error::MalformedEncoding, ""), MalformedEncodingException);
        REQUIRE_THROWS_AS(throw_if_error(Error::InvalidArgument, ""), InvalidArgumentException);
        REQUIRE_THROWS_AS(throw_if_error(Error::CompressionFailed, ""),
                          CompressionFailedException);
    }

    SECTION("exception carries code and context") {
        try {
            throw_if_error(Error::CorruptData, "decompress");
            FAIL("expected exception");
        } catch (const StatusListException& ex) {
            REQUIRE(ex.code() == Error::CorruptData);
            REQUIRE(std::string(ex.what()).find("decompress") == 0);
        }
    }

    SECTION("error strings") {
        REQUIRE(std::strcmp(error_string(Error::Ok), "Success") == 0);
        REQUIRE(std::strcmp(error_string(Error::IndexOutOfBounds), "Status index out of bounds") ==
                0);
    }
}
