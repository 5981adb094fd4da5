#ifndef _LIB_V6NET_UINT128_HPP_
#define _LIB_V6NET_UINT128_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>

namespace v6net {

/**
 * Using 128 bit types makes arithmetic operations on IPv6 addresses
 * much easier to implement.
 */

static_assert(std::is_integral_v<__int128>, "128 bit types must be integral");
using uint128_t = unsigned __int128;
using int128_t = __int128;

constexpr uint128_t uint128_max = ~uint128_t{0};

constexpr uint128_t make_uint128(uint64_t high, uint64_t low)
{
    return ((static_cast<uint128_t>(high) << 64) | low);
}

constexpr uint64_t high_bits(uint128_t value)
{
    return (static_cast<uint64_t>(value >> 64));
}

constexpr uint64_t low_bits(uint128_t value)
{
    return (static_cast<uint64_t>(value));
}

/* Absolute value of a signed 128 bit value, including the minimum value */
constexpr uint128_t magnitude(int128_t value)
{
    return (value < 0 ? uint128_t{0} - static_cast<uint128_t>(value)
                      : static_cast<uint128_t>(value));
}

/**
 * Add a signed delta to an unsigned 128 bit value.
 *
 * @return
 *   the sum, or nothing if the result falls outside [0, 2^128 - 1]
 */
std::optional<uint128_t> checked_add(uint128_t value, int128_t delta);

/**
 * Subtract a signed delta from an unsigned 128 bit value.
 *
 * @return
 *   the difference, or nothing if the result falls outside [0, 2^128 - 1]
 */
std::optional<uint128_t> checked_subtract(uint128_t value, int128_t delta);

/* Decimal representations; the standard library has no 128 bit overloads */
std::string to_string(uint128_t value);
std::string to_string(int128_t value);

/* Lower-case, 0x-prefixed hexadecimal representation */
std::string to_hex_string(uint128_t value);

} // namespace v6net

#endif /* _LIB_V6NET_UINT128_HPP_ */
