/**
 * @file word.cpp
 * @brief Word primitives compilation unit.
 *
 * The primitives are constexpr functions defined in word.hpp and
 * functions.hpp. This unit checks that both headers compile in isolation
 * and pins the reference values at compile time.
 *
 * @see include/hashprim/word.hpp for the full implementation
 */

#include <hashprim/functions.hpp>
#include <hashprim/word.hpp>

namespace hashprim {

static_assert(rotr(0x12345678U, 4) == 0x81234567U);
static_assert(shr(0x80000000U, 4) == 0x08000000U);
static_assert(parity(0xAAAAAAAAU, 0x55555555U, 0xFFFFFFFFU) == 0x00000000U);
static_assert(ch(0xFF00FF00U, 0x0F0F0F0FU, 0xF0F0F0F0U) == 0x0FF00FF0U);
static_assert(to_uint32(-1) == 0xFFFFFFFFU);

} // namespace hashprim
