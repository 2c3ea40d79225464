/**
 * @file hex.hpp
 * @brief Text conversions for words and digests.
 *
 * Hex output is lowercase. parse_word() is the boundary where integers of
 * arbitrary precision enter the library: the text may be any length and is
 * reduced modulo 2^32, exactly like to_uint32().
 *
 * @authors hashprim contributors
 */

#ifndef HASHPRIM_HEX_HPP
#define HASHPRIM_HEX_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include "config.hpp"
#include "error.hpp"

namespace hashprim {

/**
 * @brief Encode bytes as lowercase hex into a caller buffer.
 *
 * @param bytes Source bytes
 * @param len Number of bytes
 * @param[out] out Destination, NUL-terminated on success
 * @param out_size Destination capacity (needs 2 * len + 1)
 * @return Error::Ok on success, Error::Overflow if out is too small,
 *         Error::InvalidArg for null pointers
 */
Error to_hex(const std::uint8_t* bytes, std::size_t len, char* out,
             std::size_t out_size) noexcept;

/**
 * @brief Encode bytes as a lowercase hex string.
 */
std::string to_hex(const std::uint8_t* bytes, std::size_t len);

/**
 * @brief Format a word as exactly 8 lowercase hex digits.
 */
std::string format_word(word_t x);

/**
 * @brief Parse integer text into a word, reducing modulo 2^32.
 *
 * Accepted forms: [-]digits (decimal) and [-]0x/0X hexdigits, any length.
 *
 * @param text Input text
 * @param[out] out Parsed word (unchanged on failure)
 * @return Error::Ok on success, Error::InvalidArg on malformed text
 */
Error parse_word(std::string_view text, word_t& out) noexcept;

/**
 * @brief Parse a signed decimal shift/rotate count.
 *
 * @param text Input text
 * @param[out] out Parsed count (unchanged on failure)
 * @return Error::Ok on success, Error::InvalidArg on malformed text,
 *         Error::OutOfRange if the value does not fit an int
 */
Error parse_count(std::string_view text, int& out) noexcept;

#if !HASHPRIM_NO_EXCEPTIONS

/**
 * @brief parse_word() that throws.
 * @throws InvalidArgumentException on malformed text
 */
word_t parse_word_or_throw(std::string_view text);

#endif // !HASHPRIM_NO_EXCEPTIONS

} // namespace hashprim

#endif // HASHPRIM_HEX_HPP
