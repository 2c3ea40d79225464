/**
 * @file error.hpp
 * @brief hashprim error handling.
 *
 * Provides both exception-based and error-code-based error handling
 * for embedded compatibility (-fno-exceptions).
 *
 * @authors hashprim contributors
 */

#ifndef HASHPRIM_ERROR_HPP
#define HASHPRIM_ERROR_HPP

#include "config.hpp"

#if !HASHPRIM_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace hashprim {

/**
 * @brief Error codes for error-code-based error handling.
 *
 * Used by every fallible noexcept function, and when exceptions are
 * disabled (HASHPRIM_NO_EXCEPTIONS=1).
 */
enum class Error {
    Ok = 0,           ///< Success
    InvalidArg = -1,  ///< Invalid argument (malformed text, null buffer)
    Overflow = -2,    ///< Message length or output buffer overflow
    OutOfRange = -3,  ///< Shift/rotate count outside [0, 32)
    InvalidState = -4 ///< Context used after finalize() without reset()
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::InvalidArg:
        return "Invalid argument";
    case Error::Overflow:
        return "Overflow";
    case Error::OutOfRange:
        return "Count out of range";
    case Error::InvalidState:
        return "Invalid context state";
    default:
        return "Unknown error";
    }
}

#if !HASHPRIM_NO_EXCEPTIONS

/**
 * @brief Base exception for hashprim errors.
 */
class HashprimException : public std::runtime_error {
public:
    explicit HashprimException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgumentException : public HashprimException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : HashprimException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for length or buffer overflow.
 */
class OverflowException : public HashprimException {
public:
    explicit OverflowException(const std::string& message)
        : HashprimException(message, Error::Overflow) {}
};

/**
 * @brief Exception for out-of-range shift/rotate counts.
 */
class OutOfRangeException : public HashprimException {
public:
    explicit OutOfRangeException(const std::string& message)
        : HashprimException(message, Error::OutOfRange) {}
};

/**
 * @brief Throw the exception matching an error code.
 *
 * Does nothing for Error::Ok.
 *
 * @param error Error code
 * @param context Prefix for the exception message
 */
inline void throw_if_error(Error error, const std::string& context) {
    switch (error) {
    case Error::Ok:
        return;
    case Error::Overflow:
        throw OverflowException(context + ": " + error_string(error));
    case Error::OutOfRange:
        throw OutOfRangeException(context + ": " + error_string(error));
    case Error::InvalidArg:
        throw InvalidArgumentException(context + ": " + error_string(error));
    default:
        throw HashprimException(context + ": " + error_string(error), error);
    }
}

#endif // !HASHPRIM_NO_EXCEPTIONS

} // namespace hashprim

#endif // HASHPRIM_ERROR_HPP
