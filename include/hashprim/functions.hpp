/**
 * @file functions.hpp
 * @brief SHA-256 sigma functions (FIPS 180-4 Section 4.1.2).
 *
 * - Σ0(x) = ROTR^2(x)  XOR ROTR^13(x) XOR ROTR^22(x)   (Equation 4.4)
 * - Σ1(x) = ROTR^6(x)  XOR ROTR^11(x) XOR ROTR^25(x)   (Equation 4.5)
 * - σ0(x) = ROTR^7(x)  XOR ROTR^18(x) XOR SHR^3(x)     (Equation 4.6)
 * - σ1(x) = ROTR^17(x) XOR ROTR^19(x) XOR SHR^10(x)    (Equation 4.7)
 *
 * Ch and Maj (Equations 4.2, 4.3) live in word.hpp.
 *
 * @authors hashprim contributors
 */

#ifndef HASHPRIM_FUNCTIONS_HPP
#define HASHPRIM_FUNCTIONS_HPP

#include "config.hpp"
#include "word.hpp"

namespace hashprim {

/// Σ0, applied to working variable a
[[nodiscard]] constexpr word_t big_sigma0(word_t x) noexcept {
    return rotr(x, 2) ^ rotr(x, 13) ^ rotr(x, 22);
}

/// Σ1, applied to working variable e
[[nodiscard]] constexpr word_t big_sigma1(word_t x) noexcept {
    return rotr(x, 6) ^ rotr(x, 11) ^ rotr(x, 25);
}

/// σ0, message schedule
[[nodiscard]] constexpr word_t small_sigma0(word_t x) noexcept {
    return rotr(x, 7) ^ rotr(x, 18) ^ shr(x, 3);
}

/// σ1, message schedule
[[nodiscard]] constexpr word_t small_sigma1(word_t x) noexcept {
    return rotr(x, 17) ^ rotr(x, 19) ^ shr(x, 10);
}

} // namespace hashprim

#endif // HASHPRIM_FUNCTIONS_HPP
