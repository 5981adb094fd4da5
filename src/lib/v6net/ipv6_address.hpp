#ifndef _LIB_V6NET_IPV6_ADDRESS_HPP_
#define _LIB_V6NET_IPV6_ADDRESS_HPP_

#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>

#include "v6net/errors.hpp"
#include "v6net/ipv6_format.hpp"
#include "v6net/uint128.hpp"

namespace v6net {

/**
 * Immutable IPv6 Address
 */
class ipv6_address final
{
public:
    static constexpr size_t SIZE_IN_BITS = 128;
    static constexpr size_t SIZE_IN_U16 = SIZE_IN_BITS / 16;

    constexpr ipv6_address() noexcept
        : m_value(0)
    {}

    constexpr explicit ipv6_address(uint128_t value) noexcept
        : m_value(value)
    {}

    constexpr ipv6_address(uint64_t high, uint64_t low) noexcept
        : m_value(make_uint128(high, low))
    {}

    /* These throw v6net::exception on invalid input */
    ipv6_address(const char*);
    ipv6_address(const std::string&);

    ipv6_address(const ipv6_address&) = default;
    ipv6_address& operator=(const ipv6_address&) = default;

    /**
     * Parse an IPv6 address; "/<prefix length>" is not allowed.
     */
    static tl::expected<ipv6_address, error> parse(std::string_view input);

    /**
     * Create an address from an integer.  Negative values are out of range;
     * every unsigned value up to 128 bits is valid.
     */
    template <typename T>
    static std::enable_if_t<std::is_integral_v<T>,
                            tl::expected<ipv6_address, error>>
    from_integer(T value)
    {
        if constexpr (std::is_signed_v<T>) {
            if (value < 0) {
                return (make_unexpected_error(
                    error_code::out_of_range,
                    to_string(static_cast<int128_t>(value))
                        + " is less than 0"));
            }
        }
        return (ipv6_address(static_cast<uint128_t>(value)));
    }

    /**
     * Create an IPv6 address mask from the specified prefix length.
     * @param[in] prefix_length
     *   Prefix length in bits
     * @return
     *   IPv6 adddress mask
     */
    static ipv6_address make_prefix_mask(unsigned prefix_length);

    constexpr uint128_t to_integer() const noexcept { return (m_value); }

    uint16_t hextet(size_t idx) const;
    hextet_array hextets() const noexcept;

    /**
     * Address arithmetic.  Results beyond either end of the address
     * space are errors; nothing wraps.
     */
    tl::expected<ipv6_address, error> add(int128_t delta) const;
    tl::expected<ipv6_address, error> subtract(int128_t delta) const;

    constexpr ipv6_address operator&(uint128_t mask) const noexcept
    {
        return (ipv6_address(m_value & mask));
    }

    constexpr ipv6_address operator|(uint128_t mask) const noexcept
    {
        return (ipv6_address(m_value | mask));
    }

    constexpr ipv6_address operator&(const ipv6_address& mask) const noexcept
    {
        return (ipv6_address(m_value & mask.m_value));
    }

    constexpr ipv6_address operator|(const ipv6_address& mask) const noexcept
    {
        return (ipv6_address(m_value | mask.m_value));
    }

private:
    uint128_t m_value;
};

/*
 * Throwing versions of add() and subtract().  Only address-on-the-left
 * arithmetic exists.
 */
ipv6_address operator+(const ipv6_address& lhs, int128_t rhs);
ipv6_address operator-(const ipv6_address& lhs, int128_t rhs);

std::string to_string(const ipv6_address&);
std::string to_string(const ipv6_address&, const format_options&);

/**
 * Format an address using a flag string; see parse_format_spec().
 */
tl::expected<std::string, error> format(const ipv6_address&,
                                        std::string_view spec);

int compare(const ipv6_address&, const ipv6_address&);

inline bool operator==(const ipv6_address& lhs, const ipv6_address& rhs)
{
    return compare(lhs, rhs) == 0;
}
inline bool operator!=(const ipv6_address& lhs, const ipv6_address& rhs)
{
    return compare(lhs, rhs) != 0;
}
inline bool operator<(const ipv6_address& lhs, const ipv6_address& rhs)
{
    return compare(lhs, rhs) < 0;
}
inline bool operator>(const ipv6_address& lhs, const ipv6_address& rhs)
{
    return compare(lhs, rhs) > 0;
}
inline bool operator<=(const ipv6_address& lhs, const ipv6_address& rhs)
{
    return compare(lhs, rhs) <= 0;
}
inline bool operator>=(const ipv6_address& lhs, const ipv6_address& rhs)
{
    return compare(lhs, rhs) >= 0;
}

inline std::ostream& operator<<(std::ostream& os, const ipv6_address& value)
{
    os << to_string(value);
    return os;
}

} // namespace v6net

namespace std {

template <> struct hash<v6net::ipv6_address>
{
    size_t operator()(const v6net::ipv6_address& ip) const
    {
        const auto value = ip.to_integer();
        return (std::hash<uint64_t>{}(v6net::high_bits(value))
                ^ std::hash<uint64_t>{}(v6net::low_bits(value)));
    }
};

} // namespace std

#endif /* _LIB_V6NET_IPV6_ADDRESS_HPP_ */
