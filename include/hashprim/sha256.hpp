/**
 * @file sha256.hpp
 * @brief SHA-256 message digest.
 *
 * @cond INTERNAL
 * ============================================================================
 *  _   _    _    ____  _   _ ____  ____  ___ __  __
 * | | | |  / \  / ___|| | | |  _ \|  _ \|_ _|  \/  |
 * | |_| | / _ \ \___ \| |_| | |_) | |_) || || |\/| |
 * |  _  |/ ___ \ ___) |  _  |  __/|  _ < | || |  | |
 * |_| |_/_/   \_\____/|_| |_|_|   |_| \_\___|_|  |_|
 * ============================================================================
 * @endcond
 *
 * Streaming SHA-256 (FIPS 180-4 Section 6.2) built on compress_block():
 * - Padding per Section 5.1.1: '1' bit, zeros, 64-bit big-endian length
 * - Digest per Section 6.2.2: H_0 || H_1 || ... || H_7, big-endian
 *
 * @authors hashprim contributors
 *
 * @see https://nvlpubs.nist.gov/nistpubs/FIPS/NIST.FIPS.180-4.pdf FIPS 180-4
 */

#ifndef HASHPRIM_SHA256_HPP
#define HASHPRIM_SHA256_HPP

#include <array>
#include <cstdint>

#include "compress.hpp"
#include "config.hpp"
#include "error.hpp"

#if !HASHPRIM_NO_EXCEPTIONS
#include <string>
#include <string_view>
#endif

namespace hashprim {

/// 256-bit message digest
using Digest = std::array<std::uint8_t, DIGEST_BYTES>;

/// Longest message whose bit length fits the 64-bit length field
inline constexpr std::uint64_t MAX_MESSAGE_BYTES = (UINT64_MAX >> 3);

/**
 * @brief Check that absorbing more bytes keeps the message length encodable.
 *
 * @param absorbed Bytes already absorbed
 * @param len Bytes about to be absorbed
 * @return Error::Ok, or Error::Overflow if absorbed + len > MAX_MESSAGE_BYTES
 */
[[nodiscard]] constexpr Error check_message_length(std::uint64_t absorbed,
                                                   std::uint64_t len) noexcept {
    if (absorbed > MAX_MESSAGE_BYTES || len > MAX_MESSAGE_BYTES - absorbed) [[unlikely]] {
        return Error::Overflow;
    }
    return Error::Ok;
}

/**
 * @brief Streaming SHA-256 context.
 *
 * Uses static allocation only - no heap allocation. A context is a plain
 * value; distinct contexts share nothing.
 */
class Sha256 {
public:
    /**
     * @brief Construct a context holding H^(0).
     */
    Sha256() noexcept;

    /**
     * @brief Return to the initial state, discarding any buffered input.
     */
    void reset() noexcept;

    /**
     * @brief Absorb message bytes.
     *
     * @param data Message bytes (may be null only if len == 0)
     * @param len Number of bytes
     * @return Error::Ok on success, Error::InvalidArg for null data,
     *         Error::Overflow if the total length exceeds MAX_MESSAGE_BYTES,
     *         Error::InvalidState after finalize()
     */
    Error update(const std::uint8_t* data, std::size_t len) noexcept;

    /**
     * @brief Pad the message and produce the digest.
     *
     * The context must be reset() before reuse.
     *
     * @param[out] digest 32-byte digest
     * @return Error::Ok on success, Error::InvalidState if already finalized
     */
    Error finalize(Digest& digest) noexcept;

    /**
     * @brief Current intermediate hash value H^(i).
     */
    [[nodiscard]] const State& state() const noexcept {
        return state_;
    }

    /**
     * @brief Total message bytes absorbed so far.
     */
    [[nodiscard]] std::uint64_t length() const noexcept {
        return total_bytes_;
    }

    [[nodiscard]] bool finalized() const noexcept {
        return finalized_;
    }

private:
    State state_;
    std::array<std::uint8_t, BLOCK_BYTES> buffer_;
    std::size_t buffer_len_;
    std::uint64_t total_bytes_;
    bool finalized_;
};

/**
 * @brief One-shot SHA-256.
 *
 * @param data Message bytes (may be null only if len == 0)
 * @param len Number of bytes
 * @param[out] digest 32-byte digest
 * @return Error::Ok on success
 */
Error sha256(const std::uint8_t* data, std::size_t len, Digest& digest) noexcept;

#if !HASHPRIM_NO_EXCEPTIONS

/**
 * @brief One-shot SHA-256 of a string, as lowercase hex.
 * @throws HashprimException on failure
 */
std::string sha256_hex(std::string_view message);

#endif // !HASHPRIM_NO_EXCEPTIONS

} // namespace hashprim

#endif // HASHPRIM_SHA256_HPP
