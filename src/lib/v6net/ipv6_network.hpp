#ifndef _LIB_V6NET_IPV6_NETWORK_HPP_
#define _LIB_V6NET_IPV6_NETWORK_HPP_

#include <cstddef>
#include <optional>
#include <string>
#include <type_traits>

#include "v6net/ipv6_address.hpp"
#include "v6net/ipv6_network_range.hpp"

namespace v6net {

/**
 * Immutable IPv6 Network
 *
 * The base address is masked to the prefix on construction, so every
 * network contains its own base address.
 */
class ipv6_network
{
    ipv6_address m_addr;
    unsigned m_prefix;

    ipv6_network(const ipv6_address&, unsigned, std::nullptr_t);

public:
    constexpr static unsigned max_prefix_length = 128;

    /* These throw v6net::exception on invalid input */
    ipv6_network(const ipv6_address&, unsigned);
    explicit ipv6_network(const std::string& cidr);

    /**
     * Parse "<address>/<prefix length>".
     */
    static tl::expected<ipv6_network, error> parse(std::string_view input);

    static tl::expected<ipv6_network, error> create(const ipv6_address&,
                                                    unsigned prefix_length);
    static tl::expected<ipv6_network, error> create(std::string_view address,
                                                    unsigned prefix_length);
    static tl::expected<ipv6_network, error> create(const char* address,
                                                    unsigned prefix_length);
    static tl::expected<ipv6_network, error> create(const std::string& address,
                                                    unsigned prefix_length);

    template <typename T>
    static std::enable_if_t<std::is_integral_v<T>,
                            tl::expected<ipv6_network, error>>
    create(T address, unsigned prefix_length)
    {
        return (ipv6_address::from_integer(address).and_then(
            [&](const auto& addr) { return (create(addr, prefix_length)); }));
    }

    const ipv6_address& address() const;
    unsigned prefix_length() const;

    uint128_t prefix_mask() const;
    uint128_t max_index() const;

    /**
     * Number of addresses in the network, 2^(128 - prefix length).
     * @return
     *   the count, or nothing for a /0 network, whose count needs 129 bits
     */
    std::optional<uint128_t> host_count() const;

    ipv6_address first() const;
    ipv6_address last() const;

    bool contains(const ipv6_address&) const;

    /**
     * Get the address at the given offset from the base address.
     * Valid indexes are 0 through max_index(), inclusive.
     */
    tl::expected<ipv6_address, error> address_at(uint128_t index) const;

    template <typename T>
    std::enable_if_t<std::is_integral_v<T>, tl::expected<ipv6_address, error>>
    address_at(T index) const
    {
        if constexpr (std::is_signed_v<T>) {
            if (index < 0) {
                return (make_unexpected_error(
                    error_code::index_out_of_range,
                    to_string(static_cast<int128_t>(index))
                        + " is not between 0 and " + to_string(max_index())));
            }
        }
        return (address_at(static_cast<uint128_t>(index)));
    }

    /* Every address in the network, ascending */
    ipv6_network_range range() const;

    /**
     * Select addresses in [start, stop), walked by step.  Integer bounds
     * are offsets from the base address; the window may extend past the
     * network.  Defaults are the first address, one past the last address,
     * and a step of 1.
     */
    tl::expected<ipv6_network_range, error>
    slice(const range_bound& start = {},
          const range_bound& stop = {},
          std::optional<int128_t> step = std::nullopt) const;

    ipv6_network_range::iterator begin() const;
    ipv6_network_range::iterator end() const;
};

std::string to_string(const ipv6_network&);
std::string to_string(const ipv6_network&, const format_options&);

tl::expected<std::string, error> format(const ipv6_network&,
                                        std::string_view spec);

int compare(const ipv6_network&, const ipv6_network&);

inline bool operator==(const ipv6_network& lhs, const ipv6_network& rhs)
{
    return compare(lhs, rhs) == 0;
}
inline bool operator!=(const ipv6_network& lhs, const ipv6_network& rhs)
{
    return compare(lhs, rhs) != 0;
}
inline bool operator<(const ipv6_network& lhs, const ipv6_network& rhs)
{
    return compare(lhs, rhs) < 0;
}
inline bool operator>(const ipv6_network& lhs, const ipv6_network& rhs)
{
    return compare(lhs, rhs) > 0;
}
inline bool operator<=(const ipv6_network& lhs, const ipv6_network& rhs)
{
    return compare(lhs, rhs) <= 0;
}
inline bool operator>=(const ipv6_network& lhs, const ipv6_network& rhs)
{
    return compare(lhs, rhs) >= 0;
}

inline std::ostream& operator<<(std::ostream& os, const ipv6_network& value)
{
    os << to_string(value);
    return os;
}

} // namespace v6net

#endif /* _LIB_V6NET_IPV6_NETWORK_HPP_ */
