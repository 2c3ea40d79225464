/**
 * @file compress.cpp
 * @brief Schedule and compression compilation unit.
 *
 * All implementation is in the headers (constexpr functions).
 *
 * @see include/hashprim/compress.hpp for the full implementation
 */

#include <hashprim/compress.hpp>
#include <hashprim/schedule.hpp>

// All implementation is in the header (constexpr functions)
