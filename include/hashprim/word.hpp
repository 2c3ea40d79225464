/**
 * @file word.hpp
 * @brief Fixed-width 32-bit word primitives.
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
 * Implements the bit operations of FIPS 180-4 Section 2.2.2 and the
 * three-input mixing functions of Section 4.1.2 on 32-bit words:
 * - ROTR^n(x), ROTL^n(x), SHR^n(x)
 * - Parity(x, y, z), Ch(x, y, z), Maj(x, y, z)
 *
 * @par Count Policy
 * Rotate and shift counts are reduced modulo 32 before use, for every
 * operation alike. Negative counts wrap the same way (-1 acts as 31), so
 * shr(x, 32) == x. Use check_count() where a count outside [0, 32) must
 * be rejected instead.
 *
 * @authors hashprim contributors
 *
 * @see https://nvlpubs.nist.gov/nistpubs/FIPS/NIST.FIPS.180-4.pdf FIPS 180-4
 */

#ifndef HASHPRIM_WORD_HPP
#define HASHPRIM_WORD_HPP

#include <type_traits>

#include "config.hpp"
#include "error.hpp"

namespace hashprim {

namespace detail {

/**
 * @brief Reduce a signed count into [0, 32).
 *
 * Two's complement conversion makes this a true modulo for negatives.
 */
[[nodiscard]] constexpr unsigned reduce_count(int n) noexcept {
    return static_cast<unsigned>(n) & COUNT_MASK;
}

} // namespace detail

/**
 * @brief Normalize any integer to a 32-bit word (x mod 2^32).
 *
 * Defined for every sign and magnitude of every built-in integral type.
 *
 * @tparam T Integral type
 * @param x Value to normalize
 * @return x reduced modulo 2^32
 */
template <typename T> [[nodiscard]] constexpr word_t to_uint32(T x) noexcept {
    static_assert(std::is_integral_v<T>, "to_uint32 requires an integral type");
    return static_cast<word_t>(x);
}

/**
 * @brief Circular right rotation, ROTR^n(x).
 *
 * @param x Word to rotate
 * @param n Rotation count (reduced modulo 32)
 * @return (x >> n) | (x << (32 - n))
 */
[[nodiscard]] constexpr word_t rotr(word_t x, int n) noexcept {
    const unsigned c = detail::reduce_count(n);
    return (x >> c) | (x << ((0U - c) & COUNT_MASK));
}

/**
 * @brief Circular left rotation, ROTL^n(x). Inverse of rotr().
 */
[[nodiscard]] constexpr word_t rotl(word_t x, int n) noexcept {
    const unsigned c = detail::reduce_count(n);
    return (x << c) | (x >> ((0U - c) & COUNT_MASK));
}

/**
 * @brief Logical right shift, SHR^n(x). Vacated bits are zero.
 *
 * @param x Word to shift
 * @param n Shift count (reduced modulo 32)
 * @return x >> n
 */
[[nodiscard]] constexpr word_t shr(word_t x, int n) noexcept {
    return x >> detail::reduce_count(n);
}

/**
 * @brief Parity(x, y, z) = x XOR y XOR z.
 */
[[nodiscard]] constexpr word_t parity(word_t x, word_t y, word_t z) noexcept {
    return x ^ y ^ z;
}

/**
 * @brief Ch(x, y, z) = (x AND y) XOR (NOT x AND z).
 *
 * Each bit of x selects the bit of y (1) or of z (0).
 */
[[nodiscard]] constexpr word_t ch(word_t x, word_t y, word_t z) noexcept {
    return (x & y) ^ (~x & z);
}

/**
 * @brief Maj(x, y, z) = (x AND y) XOR (x AND z) XOR (y AND z).
 *
 * Each result bit is the majority vote of the three input bits.
 */
[[nodiscard]] constexpr word_t maj(word_t x, word_t y, word_t z) noexcept {
    return (x & y) ^ (x & z) ^ (y & z);
}

/**
 * @brief Validate a rotate/shift count.
 *
 * @param n Count
 * @return Error::Ok if 0 <= n < 32, Error::OutOfRange otherwise
 */
[[nodiscard]] constexpr Error check_count(int n) noexcept {
    if (n < 0 || n >= static_cast<int>(WORD_BITS)) [[unlikely]] {
        return Error::OutOfRange;
    }
    return Error::Ok;
}

} // namespace hashprim

#endif // HASHPRIM_WORD_HPP
