/**
 * @file config.hpp
 * @brief hashprim compile-time configuration.
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
 * FIPS 180-4: Secure Hash Standard (SHA-256 word primitives)
 *
 * @authors hashprim contributors
 *
 * @see https://nvlpubs.nist.gov/nistpubs/FIPS/NIST.FIPS.180-4.pdf FIPS 180-4
 */

#ifndef HASHPRIM_CONFIG_HPP
#define HASHPRIM_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace hashprim {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// 32-bit word type (FIPS 180-4 Section 2.1)
using word_t = std::uint32_t;
inline constexpr unsigned WORD_BITS = 32U;

/// Rotate and shift counts are reduced with this mask
inline constexpr unsigned COUNT_MASK = WORD_BITS - 1U;

/// Message block size in bytes (512 bits)
inline constexpr std::size_t BLOCK_BYTES = 64U;
inline constexpr std::size_t BLOCK_WORDS = BLOCK_BYTES / 4U;

/// Number of compression rounds and schedule words
inline constexpr std::size_t ROUNDS = 64U;

/// Working variables a..h
inline constexpr std::size_t STATE_WORDS = 8U;

/// Message digest size in bytes (256 bits)
inline constexpr std::size_t DIGEST_BYTES = 32U;
inline constexpr std::size_t DIGEST_HEX_CHARS = DIGEST_BYTES * 2U;

/// Padding: length field occupies the last 8 bytes of the final block
inline constexpr std::size_t LENGTH_FIELD_BYTES = 8U;
inline constexpr std::size_t PAD_BOUNDARY = BLOCK_BYTES - LENGTH_FIELD_BYTES;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define HASHPRIM_NO_EXCEPTIONS=1 to disable exceptions for embedded use.
 * @{
 */
#ifndef HASHPRIM_NO_EXCEPTIONS
#define HASHPRIM_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace hashprim

#endif // HASHPRIM_CONFIG_HPP
