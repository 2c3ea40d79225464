/**
 * @file test_sha256.cpp
 * @brief SHA-256 digest tests against the NIST FIPS 180-4 vectors.
 */

#include <hashprim/hex.hpp>
#include <hashprim/sha256.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <vector>

using namespace hashprim;

/**
 * @brief Hash a string with the one-shot API, as hex.
 */
static std::string digest_hex(const std::string& message) {
    Digest digest{};
    auto result =
        sha256(reinterpret_cast<const std::uint8_t*>(message.data()), message.size(), digest);
    REQUIRE(result == Error::Ok);
    return to_hex(digest.data(), digest.size());
}

/**
 * @brief Hash a string through the streaming API in fixed-size chunks.
 */
static std::string chunked_hex(const std::string& message, std::size_t chunk) {
    Sha256 ctx;
    const auto* data = reinterpret_cast<const std::uint8_t*>(message.data());
    for (std::size_t pos = 0; pos < message.size(); pos += chunk) {
        std::size_t len = (message.size() - pos < chunk) ? message.size() - pos : chunk;
        REQUIRE(ctx.update(&data[pos], len) == Error::Ok);
    }

    Digest digest{};
    REQUIRE(ctx.finalize(digest) == Error::Ok);
    return to_hex(digest.data(), digest.size());
}

TEST_CASE("NIST vectors", "[sha256][vectors]") {
    SECTION("empty message") {
        REQUIRE(digest_hex("") ==
                "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    }

    SECTION("abc") {
        REQUIRE(digest_hex("abc") ==
                "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    }

    SECTION("448-bit two-block message") {
        REQUIRE(digest_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq") ==
                "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
    }

    SECTION("896-bit message") {
        REQUIRE(digest_hex("abcdefghbcdefghicdefghijdefghijkefghijklfghijklmghijklmn"
                           "hijklmnoijklmnopjklmnopqklmnopqrlmnopqrsmnopqrstnopqrstu") ==
                "cf5b16a778af8380036ce59e7b0492370b249b11e8f07a51afac45037afee9d1");
    }

    SECTION("one million a") {
        REQUIRE(chunked_hex(std::string(1000000, 'a'), 1000) ==
                "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
    }
}

TEST_CASE("Padding boundaries", "[sha256][padding]") {
    // 55 bytes: '1' bit and length fit in one block
    REQUIRE(digest_hex(std::string(55, 'a')) ==
            "9f4390f8d30c2dd92ec9f095b65e2b9ae9b0a925a5258e241c9f1e910f734318");
    // 56 bytes: length spills into a second block
    REQUIRE(digest_hex(std::string(56, 'a')) ==
            "b35439a4ac6f0948b6d6f9e3c6af0f5f590ce20f1bde7090ef7970686ec6738a");
    REQUIRE(digest_hex(std::string(63, 'a')) ==
            "7d3e74a05d7db15bce4ad9ec0658ea98e3f06eeecf16b4c6fff2da457ddc2f34");
    REQUIRE(digest_hex(std::string(64, 'a')) ==
            "ffe054fe7ae0cb6dc65c3af9b61d5209f439851db43d0ba5997337df154668eb");
}

TEST_CASE("Streaming matches one-shot", "[sha256][streaming]") {
    const std::string message = "The quick brown fox jumps over the lazy dog";
    const std::string expected =
        "d7a8fbb307d7809469ca9abcb0082e4f8d5651e46d3cdb762d02d0bf37c9e592";

    REQUIRE(digest_hex(message) == expected);

    SECTION("byte at a time") {
        REQUIRE(chunked_hex(message, 1) == expected);
    }

    SECTION("odd chunk size") {
        REQUIRE(chunked_hex(message, 7) == expected);
    }

    SECTION("chunks straddling block boundaries") {
        std::string long_message(200, 'a');
        std::string reference = digest_hex(long_message);
        REQUIRE(chunked_hex(long_message, 63) == reference);
        REQUIRE(chunked_hex(long_message, 64) == reference);
        REQUIRE(chunked_hex(long_message, 65) == reference);
    }
}

TEST_CASE("Context lifecycle", "[sha256][context]") {
    Sha256 ctx;
    const std::uint8_t abc[] = {'a', 'b', 'c'};

    SECTION("fresh context holds the initial hash") {
        REQUIRE(ctx.state() == INITIAL_HASH);
        REQUIRE(ctx.length() == 0);
        REQUIRE_FALSE(ctx.finalized());
    }

    SECTION("length counts absorbed bytes") {
        REQUIRE(ctx.update(abc, sizeof(abc)) == Error::Ok);
        REQUIRE(ctx.update(abc, sizeof(abc)) == Error::Ok);
        REQUIRE(ctx.length() == 6);
    }

    SECTION("update after finalize is rejected") {
        Digest digest{};
        REQUIRE(ctx.update(abc, sizeof(abc)) == Error::Ok);
        REQUIRE(ctx.finalize(digest) == Error::Ok);
        REQUIRE(ctx.finalized());
        REQUIRE(ctx.update(abc, sizeof(abc)) == Error::InvalidState);
        REQUIRE(ctx.finalize(digest) == Error::InvalidState);
    }

    SECTION("reset allows reuse") {
        Digest first{};
        Digest second{};
        REQUIRE(ctx.update(abc, sizeof(abc)) == Error::Ok);
        REQUIRE(ctx.finalize(first) == Error::Ok);

        ctx.reset();
        REQUIRE(ctx.update(abc, sizeof(abc)) == Error::Ok);
        REQUIRE(ctx.finalize(second) == Error::Ok);
        REQUIRE(first == second);
    }

    SECTION("null data") {
        REQUIRE(ctx.update(nullptr, 0) == Error::Ok);
        REQUIRE(ctx.update(nullptr, 4) == Error::InvalidArg);
    }
}

TEST_CASE("Message length limit", "[sha256][overflow]") {
    SECTION("lengths up to the 64-bit bit-count limit are accepted") {
        REQUIRE(check_message_length(0, 0) == Error::Ok);
        REQUIRE(check_message_length(0, MAX_MESSAGE_BYTES) == Error::Ok);
        REQUIRE(check_message_length(MAX_MESSAGE_BYTES - 64, 64) == Error::Ok);
        REQUIRE(check_message_length(MAX_MESSAGE_BYTES, 0) == Error::Ok);
    }

    SECTION("one byte past the limit overflows") {
        REQUIRE(check_message_length(MAX_MESSAGE_BYTES, 1) == Error::Overflow);
        REQUIRE(check_message_length(MAX_MESSAGE_BYTES - 63, 64) == Error::Overflow);
        REQUIRE(check_message_length(1, MAX_MESSAGE_BYTES) == Error::Overflow);
    }

    SECTION("no wrap-around for huge operands") {
        REQUIRE(check_message_length(UINT64_MAX, 1) == Error::Overflow);
        REQUIRE(check_message_length(1, UINT64_MAX) == Error::Overflow);
    }

    SECTION("limit keeps the bit length within 64 bits") {
        STATIC_REQUIRE(MAX_MESSAGE_BYTES * 8U / 8U == MAX_MESSAGE_BYTES);
    }
}

#if !HASHPRIM_NO_EXCEPTIONS
TEST_CASE("sha256_hex convenience", "[sha256]") {
    REQUIRE(sha256_hex("abc") ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}
#endif
