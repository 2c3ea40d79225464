/**
 * @file schedule.hpp
 * @brief SHA-256 message schedule.
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
 * Implements FIPS 180-4 Section 6.2.2 step 1 (Prepare the message schedule):
 * - W_t = M_t^(i)                                          (0 <= t <= 15)
 * - W_t = σ1(W_{t-2}) + W_{t-7} + σ0(W_{t-15}) + W_{t-16}  (16 <= t <= 63)
 *
 * @par Byte Order (FIPS 180-4 Section 3.1)
 * Words are read from the message block big-endian: byte 0 is the most
 * significant byte of W_0.
 *
 * @authors hashprim contributors
 *
 * @see https://nvlpubs.nist.gov/nistpubs/FIPS/NIST.FIPS.180-4.pdf FIPS 180-4
 */

#ifndef HASHPRIM_SCHEDULE_HPP
#define HASHPRIM_SCHEDULE_HPP

#include <array>

#include "config.hpp"
#include "functions.hpp"

namespace hashprim {

/// Expanded message schedule W_0..W_63
using Schedule = std::array<word_t, ROUNDS>;

/**
 * @brief Load a big-endian word from 4 bytes.
 * @param bytes Source (at least 4 bytes)
 * @return Word with bytes[0] as most significant byte
 */
[[nodiscard]] constexpr word_t load_be32(const std::uint8_t* bytes) noexcept {
    return (static_cast<word_t>(bytes[0]) << 24) | (static_cast<word_t>(bytes[1]) << 16) |
           (static_cast<word_t>(bytes[2]) << 8) | static_cast<word_t>(bytes[3]);
}

/**
 * @brief Store a word as 4 big-endian bytes.
 * @param word Word to store
 * @param bytes Destination (at least 4 bytes)
 */
constexpr void store_be32(word_t word, std::uint8_t* bytes) noexcept {
    for (int j = 3; j >= 0; --j) {
        bytes[3 - j] = static_cast<std::uint8_t>((word >> (j * 8)) & 0xFFU);
    }
}

/**
 * @brief Prepare the message schedule for one 512-bit block.
 *
 * @param[in] block 64-byte message block M^(i)
 * @param[out] W Schedule W_0..W_63
 */
constexpr void expand_schedule(const std::uint8_t* block, Schedule& W) noexcept {
    for (std::size_t t = 0; t < BLOCK_WORDS; ++t) {
        W[t] = load_be32(&block[t * 4]);
    }

    // Unsigned addition wraps modulo 2^32
    for (std::size_t t = BLOCK_WORDS; t < ROUNDS; ++t) {
        W[t] = small_sigma1(W[t - 2]) + W[t - 7] + small_sigma0(W[t - 15]) + W[t - 16];
    }
}

} // namespace hashprim

#endif // HASHPRIM_SCHEDULE_HPP
