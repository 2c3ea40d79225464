/**
 * @file hex.cpp
 * @brief Text conversions for words and digests.
 *
 * @authors hashprim contributors
 */

#include <hashprim/hex.hpp>
#include <hashprim/schedule.hpp>

#include <climits>

namespace hashprim {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

/// Digit value in the given base, or -1
int digit_value(char c, unsigned base) noexcept {
    int value = -1;
    if (c >= '0' && c <= '9') {
        value = c - '0';
    } else if (c >= 'a' && c <= 'f') {
        value = c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
        value = c - 'A' + 10;
    }
    if (value >= static_cast<int>(base)) {
        return -1;
    }
    return value;
}

} // namespace

Error to_hex(const std::uint8_t* bytes, std::size_t len, char* out,
             std::size_t out_size) noexcept {
    if (out == nullptr || (bytes == nullptr && len > 0)) [[unlikely]] {
        return Error::InvalidArg;
    }
    if (out_size < (len * 2U) + 1U) [[unlikely]] {
        return Error::Overflow;
    }

    for (std::size_t i = 0; i < len; ++i) {
        out[i * 2] = HEX_DIGITS[bytes[i] >> 4];
        out[(i * 2) + 1] = HEX_DIGITS[bytes[i] & 0x0FU];
    }
    out[len * 2] = '\0';
    return Error::Ok;
}

std::string to_hex(const std::uint8_t* bytes, std::size_t len) {
    std::string text;
    text.reserve(len * 2U);
    for (std::size_t i = 0; i < len; ++i) {
        text.push_back(HEX_DIGITS[bytes[i] >> 4]);
        text.push_back(HEX_DIGITS[bytes[i] & 0x0FU]);
    }
    return text;
}

std::string format_word(word_t x) {
    std::uint8_t bytes[4];
    store_be32(x, bytes);
    return to_hex(bytes, sizeof(bytes));
}

Error parse_word(std::string_view text, word_t& out) noexcept {
    bool negative = false;
    if (!text.empty() && text.front() == '-') {
        negative = true;
        text.remove_prefix(1);
    }

    unsigned base = 10U;
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        base = 16U;
        text.remove_prefix(2);
    }

    if (text.empty()) {
        return Error::InvalidArg;
    }

    // Horner's rule in word_t wraps modulo 2^32 at every step
    word_t value = 0;
    for (char c : text) {
        int digit = digit_value(c, base);
        if (digit < 0) {
            return Error::InvalidArg;
        }
        value = (value * base) + static_cast<word_t>(digit);
    }

    out = negative ? (0U - value) : value;
    return Error::Ok;
}

Error parse_count(std::string_view text, int& out) noexcept {
    bool negative = false;
    if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }

    if (text.empty()) {
        return Error::InvalidArg;
    }

    long long value = 0;
    bool too_large = false;
    for (char c : text) {
        int digit = digit_value(c, 10U);
        if (digit < 0) {
            return Error::InvalidArg;
        }
        if (!too_large) {
            value = (value * 10) + digit;
            if (value > static_cast<long long>(INT_MAX) + 1) {
                too_large = true;
            }
        }
    }

    if (negative) {
        value = -value;
    }
    if (too_large || value > INT_MAX || value < INT_MIN) {
        return Error::OutOfRange;
    }

    out = static_cast<int>(value);
    return Error::Ok;
}

#if !HASHPRIM_NO_EXCEPTIONS

word_t parse_word_or_throw(std::string_view text) {
    word_t value = 0;
    throw_if_error(parse_word(text, value), "parse_word '" + std::string(text) + "'");
    return value;
}

#endif // !HASHPRIM_NO_EXCEPTIONS

} // namespace hashprim
