/**
 * @file test_compress.cpp
 * @brief Unit tests for the message schedule and compression function.
 *
 * Intermediate values follow the "abc" worked example of FIPS 180-4
 * (NIST SHA256.pdf example, one-block message).
 */

#include <hashprim/compress.hpp>
#include <hashprim/schedule.hpp>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <cstdint>

using namespace hashprim;

/// "abc" padded to one 512-bit block
static std::array<std::uint8_t, BLOCK_BYTES> abc_block() {
    std::array<std::uint8_t, BLOCK_BYTES> block{};
    block[0] = 'a';
    block[1] = 'b';
    block[2] = 'c';
    block[3] = 0x80U;
    block[63] = 24U; // message length in bits
    return block;
}

TEST_CASE("Big-endian word load and store", "[schedule]") {
    const std::uint8_t bytes[4] = {0x12, 0x34, 0x56, 0x78};
    REQUIRE(load_be32(bytes) == 0x12345678U);

    std::uint8_t out[4] = {0, 0, 0, 0};
    store_be32(0xDEADBEEFU, out);
    REQUIRE(out[0] == 0xDE);
    REQUIRE(out[1] == 0xAD);
    REQUIRE(out[2] == 0xBE);
    REQUIRE(out[3] == 0xEF);
}

TEST_CASE("Message schedule for abc", "[schedule]") {
    auto block = abc_block();
    Schedule W{};
    expand_schedule(block.data(), W);

    SECTION("first 16 words are the block") {
        REQUIRE(W[0] == 0x61626380U);
        for (std::size_t t = 1; t < 15; ++t) {
            REQUIRE(W[t] == 0U);
        }
        REQUIRE(W[15] == 0x00000018U);
    }

    SECTION("expanded words") {
        REQUIRE(W[16] == 0x61626380U);
        REQUIRE(W[17] == 0x000F0000U);
        REQUIRE(W[63] == 0x12B1EDEBU);
    }
}

TEST_CASE("Round constants and initial hash", "[compress][constants]") {
    REQUIRE(ROUND_CONSTANTS.size() == 64);
    REQUIRE(ROUND_CONSTANTS[0] == 0x428a2f98U);
    REQUIRE(ROUND_CONSTANTS[63] == 0xc67178f2U);
    REQUIRE(INITIAL_HASH[0] == 0x6a09e667U);
    REQUIRE(INITIAL_HASH[7] == 0x5be0cd19U);
}

TEST_CASE("First round of abc", "[compress][round]") {
    auto block = abc_block();
    Schedule W{};
    expand_schedule(block.data(), W);

    State v = INITIAL_HASH;
    round_step(v, ROUND_CONSTANTS[0], W[0]);

    REQUIRE(v[0] == 0x5d6aebcdU);
    REQUIRE(v[1] == 0x6a09e667U);
    REQUIRE(v[2] == 0xbb67ae85U);
    REQUIRE(v[3] == 0x3c6ef372U);
    REQUIRE(v[4] == 0xfa2a4622U);
    REQUIRE(v[5] == 0x510e527fU);
    REQUIRE(v[6] == 0x9b05688cU);
    REQUIRE(v[7] == 0x1f83d9abU);
}

TEST_CASE("Compress single abc block", "[compress]") {
    auto block = abc_block();
    State hash = INITIAL_HASH;
    compress_block(hash, block.data());

    const State expected = {0xba7816bfU, 0x8f01cfeaU, 0x414140deU, 0x5dae2223U,
                            0xb00361a3U, 0x96177a9cU, 0xb410ff61U, 0xf20015adU};
    REQUIRE(hash == expected);
}
