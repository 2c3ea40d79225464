/**
 * @file compress.hpp
 * @brief SHA-256 compression function.
 *
 * Implements FIPS 180-4 Section 6.2.2 steps 2-4:
 * - Initialize working variables a..h from H^(i-1)
 * - 64 rounds of T1/T2 mixing (round_step)
 * - Add the working variables into H^(i)
 *
 * @authors hashprim contributors
 *
 * @see https://nvlpubs.nist.gov/nistpubs/FIPS/NIST.FIPS.180-4.pdf FIPS 180-4
 */

#ifndef HASHPRIM_COMPRESS_HPP
#define HASHPRIM_COMPRESS_HPP

#include <array>

#include "config.hpp"
#include "functions.hpp"
#include "schedule.hpp"
#include "word.hpp"

namespace hashprim {

/// Hash value / working variables, in order a, b, c, d, e, f, g, h
using State = std::array<word_t, STATE_WORDS>;

/**
 * @brief Round constants K_0..K_63 (FIPS 180-4 Section 4.2.2).
 *
 * First 32 bits of the fractional parts of the cube roots of the first
 * 64 primes.
 */
inline constexpr std::array<word_t, ROUNDS> ROUND_CONSTANTS = {
    0x428a2f98U, 0x71374491U, 0xb5c0fbcfU, 0xe9b5dba5U, 0x3956c25bU, 0x59f111f1U, 0x923f82a4U,
    0xab1c5ed5U, 0xd807aa98U, 0x12835b01U, 0x243185beU, 0x550c7dc3U, 0x72be5d74U, 0x80deb1feU,
    0x9bdc06a7U, 0xc19bf174U, 0xe49b69c1U, 0xefbe4786U, 0x0fc19dc6U, 0x240ca1ccU, 0x2de92c6fU,
    0x4a7484aaU, 0x5cb0a9dcU, 0x76f988daU, 0x983e5152U, 0xa831c66dU, 0xb00327c8U, 0xbf597fc7U,
    0xc6e00bf3U, 0xd5a79147U, 0x06ca6351U, 0x14292967U, 0x27b70a85U, 0x2e1b2138U, 0x4d2c6dfcU,
    0x53380d13U, 0x650a7354U, 0x766a0abbU, 0x81c2c92eU, 0x92722c85U, 0xa2bfe8a1U, 0xa81a664bU,
    0xc24b8b70U, 0xc76c51a3U, 0xd192e819U, 0xd6990624U, 0xf40e3585U, 0x106aa070U, 0x19a4c116U,
    0x1e376c08U, 0x2748774cU, 0x34b0bcb5U, 0x391c0cb3U, 0x4ed8aa4aU, 0x5b9cca4fU, 0x682e6ff3U,
    0x748f82eeU, 0x78a5636fU, 0x84c87814U, 0x8cc70208U, 0x90befffaU, 0xa4506cebU, 0xbef9a3f7U,
    0xc67178f2U};

/**
 * @brief Initial hash value H^(0) (FIPS 180-4 Section 5.3.3).
 *
 * First 32 bits of the fractional parts of the square roots of the first
 * 8 primes.
 */
inline constexpr State INITIAL_HASH = {0x6a09e667U, 0xbb67ae85U, 0x3c6ef372U, 0xa54ff53aU,
                                       0x510e527fU, 0x9b05688cU, 0x1f83d9abU, 0x5be0cd19U};

/**
 * @brief One compression round.
 *
 * - T1 = h + Σ1(e) + Ch(e, f, g) + K_t + W_t
 * - T2 = Σ0(a) + Maj(a, b, c)
 * - h = g, g = f, f = e, e = d + T1, d = c, c = b, b = a, a = T1 + T2
 *
 * @param[in,out] v Working variables a..h
 * @param k Round constant K_t
 * @param w Schedule word W_t
 */
constexpr void round_step(State& v, word_t k, word_t w) noexcept {
    const word_t t1 = v[7] + big_sigma1(v[4]) + ch(v[4], v[5], v[6]) + k + w;
    const word_t t2 = big_sigma0(v[0]) + maj(v[0], v[1], v[2]);

    v[7] = v[6];
    v[6] = v[5];
    v[5] = v[4];
    v[4] = v[3] + t1;
    v[3] = v[2];
    v[2] = v[1];
    v[1] = v[0];
    v[0] = t1 + t2;
}

/**
 * @brief Compress one 512-bit block into the hash value.
 *
 * @param[in,out] hash Intermediate hash value H^(i-1), updated to H^(i)
 * @param[in] block 64-byte message block
 */
constexpr void compress_block(State& hash, const std::uint8_t* block) noexcept {
    Schedule W{};
    expand_schedule(block, W);

    State v = hash;
    for (std::size_t t = 0; t < ROUNDS; ++t) {
        round_step(v, ROUND_CONSTANTS[t], W[t]);
    }

    for (std::size_t i = 0; i < STATE_WORDS; ++i) {
        hash[i] += v[i];
    }
}

} // namespace hashprim

#endif // HASHPRIM_COMPRESS_HPP
