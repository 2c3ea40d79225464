/**
 * @file hashprim.hpp
 * @brief hashprim umbrella header.
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
 * Pulls in the word primitives, the SHA-256 functions, schedule and
 * compression, the streaming digest and the text helpers.
 *
 * @authors hashprim contributors
 *
 * @see https://nvlpubs.nist.gov/nistpubs/FIPS/NIST.FIPS.180-4.pdf FIPS 180-4
 */

#ifndef HASHPRIM_HPP
#define HASHPRIM_HPP

#include "compress.hpp"
#include "config.hpp"
#include "error.hpp"
#include "functions.hpp"
#include "hex.hpp"
#include "schedule.hpp"
#include "sha256.hpp"
#include "word.hpp"

namespace hashprim {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace hashprim

#endif // HASHPRIM_HPP
