/**
 * @file test_hex.cpp
 * @brief Unit tests for word and digest text conversions.
 */

#include <hashprim/error.hpp>
#include <hashprim/hex.hpp>

#include <catch2/catch_test_macros.hpp>

#include <climits>

using namespace hashprim;

TEST_CASE("format_word", "[hex]") {
    REQUIRE(format_word(0U) == "00000000");
    REQUIRE(format_word(0x81234567U) == "81234567");
    REQUIRE(format_word(0xDEADBEEFU) == "deadbeef");
}

TEST_CASE("to_hex", "[hex]") {
    const std::uint8_t bytes[] = {0x00, 0x0F, 0xA0, 0xFF};

    SECTION("string form") {
        REQUIRE(to_hex(bytes, sizeof(bytes)) == "000fa0ff");
        REQUIRE(to_hex(bytes, 0).empty());
    }

    SECTION("buffer form") {
        char out[9];
        REQUIRE(to_hex(bytes, sizeof(bytes), out, sizeof(out)) == Error::Ok);
        REQUIRE(std::string(out) == "000fa0ff");
    }

    SECTION("buffer too small") {
        char out[8];
        REQUIRE(to_hex(bytes, sizeof(bytes), out, sizeof(out)) == Error::Overflow);
    }

    SECTION("null output") {
        REQUIRE(to_hex(bytes, sizeof(bytes), nullptr, 16) == Error::InvalidArg);
    }
}

TEST_CASE("parse_word accepted forms", "[hex][parse]") {
    word_t value = 0;

    SECTION("decimal") {
        REQUIRE(parse_word("305419896", value) == Error::Ok);
        REQUIRE(value == 0x12345678U);
    }

    SECTION("hex, either case") {
        REQUIRE(parse_word("0x12345678", value) == Error::Ok);
        REQUIRE(value == 0x12345678U);
        REQUIRE(parse_word("0XdeadBEEF", value) == Error::Ok);
        REQUIRE(value == 0xDEADBEEFU);
    }

    SECTION("negative values wrap") {
        REQUIRE(parse_word("-1", value) == Error::Ok);
        REQUIRE(value == 0xFFFFFFFFU);
        REQUIRE(parse_word("-0x100", value) == Error::Ok);
        REQUIRE(value == 0xFFFFFF00U);
    }

    SECTION("arbitrary precision is reduced modulo 2^32") {
        REQUIRE(parse_word("4294967296", value) == Error::Ok);
        REQUIRE(value == 0U);
        REQUIRE(parse_word("12345678901234567890", value) == Error::Ok);
        REQUIRE(value == 0xEB1F0AD2U);
        REQUIRE(parse_word("-12345678901234567890", value) == Error::Ok);
        REQUIRE(value == 0x14E0F52EU);
        REQUIRE(parse_word("0x123456789abcdef0", value) == Error::Ok);
        REQUIRE(value == 0x9ABCDEF0U);
    }
}

TEST_CASE("parse_word rejects malformed text", "[hex][parse]") {
    word_t value = 0x5A5A5A5AU;

    REQUIRE(parse_word("", value) == Error::InvalidArg);
    REQUIRE(parse_word("-", value) == Error::InvalidArg);
    REQUIRE(parse_word("0x", value) == Error::InvalidArg);
    REQUIRE(parse_word("12a", value) == Error::InvalidArg);
    REQUIRE(parse_word("0xfg", value) == Error::InvalidArg);
    REQUIRE(parse_word(" 1", value) == Error::InvalidArg);

    // Output untouched on failure
    REQUIRE(value == 0x5A5A5A5AU);
}

TEST_CASE("parse_count", "[hex][parse]") {
    int n = 0;

    REQUIRE(parse_count("4", n) == Error::Ok);
    REQUIRE(n == 4);
    REQUIRE(parse_count("-1", n) == Error::Ok);
    REQUIRE(n == -1);
    REQUIRE(parse_count("+31", n) == Error::Ok);
    REQUIRE(n == 31);
    REQUIRE(parse_count("2147483647", n) == Error::Ok);
    REQUIRE(n == INT_MAX);
    REQUIRE(parse_count("-2147483648", n) == Error::Ok);
    REQUIRE(n == INT_MIN);

    REQUIRE(parse_count("2147483648", n) == Error::OutOfRange);
    REQUIRE(parse_count("99999999999999999999", n) == Error::OutOfRange);
    REQUIRE(parse_count("", n) == Error::InvalidArg);
    REQUIRE(parse_count("0x4", n) == Error::InvalidArg);
}

#if !HASHPRIM_NO_EXCEPTIONS
TEST_CASE("parse_word_or_throw", "[hex][parse][exceptions]") {
    REQUIRE(parse_word_or_throw("0x81234567") == 0x81234567U);
    REQUIRE_THROWS_AS(parse_word_or_throw("nope"), InvalidArgumentException);

    try {
        (void)parse_word_or_throw("");
        FAIL("expected an exception");
    } catch (const HashprimException& e) {
        REQUIRE(e.code() == Error::InvalidArg);
    }
}
#endif
