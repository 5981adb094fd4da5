#ifndef _LIB_V6NET_IPV6_NETWORK_RANGE_HPP_
#define _LIB_V6NET_IPV6_NETWORK_RANGE_HPP_

#include <iterator>
#include <variant>

#include "v6net/ipv6_address.hpp"

namespace v6net {

/**
 * A slice bound: unspecified, an offset from the network's base
 * address, or an absolute address.
 */
using range_bound = std::variant<std::monostate, int128_t, ipv6_address>;

/**
 * Cursor over a range of addresses.  The cursor moves from first toward
 * last in steps of stride and stops before it would pass last.
 */
class ipv6_network_iterator
{
    ipv6_address m_cursor;
    uint128_t m_last = 0;
    uint128_t m_stride = 1;
    bool m_reverse = false;
    bool m_done = true;

public:
    using difference_type = std::ptrdiff_t;
    using value_type = ipv6_address;
    using pointer = const ipv6_address*;
    using reference = const ipv6_address&;
    using iterator_category = std::forward_iterator_tag;

    /* Exhausted iterator */
    ipv6_network_iterator() = default;

    ipv6_network_iterator(uint128_t first,
                          uint128_t last,
                          uint128_t stride,
                          bool reverse);

    reference operator*() const { return (m_cursor); }
    pointer operator->() const { return (&m_cursor); }

    ipv6_network_iterator& operator++();
    ipv6_network_iterator operator++(int);

    bool operator==(const ipv6_network_iterator& other) const;
    bool operator!=(const ipv6_network_iterator& other) const
    {
        return (!(*this == other));
    }
};

/**
 * Immutable, lazily enumerated range of addresses: the window
 * [lower, upper] walked by step.  A negative step walks the same window
 * from upper down toward lower.  Every begin() starts a new traversal.
 */
class ipv6_network_range
{
    uint128_t m_lower = 0;
    uint128_t m_upper = 0;
    int128_t m_step = 1;
    bool m_empty = true;

    explicit ipv6_network_range(int128_t step)
        : m_step(step)
    {}

public:
    using iterator = ipv6_network_iterator;
    using const_iterator = ipv6_network_iterator;

    ipv6_network_range(const ipv6_address& lower,
                       const ipv6_address& upper,
                       int128_t step = 1);

    /**
     * Build a range from slice bounds.
     *
     * @param[in] base
     *   address that integer bounds are offsets from
     * @param[in] last
     *   the final address of the network; the default stop is one past it
     * @param[in] start, stop
     *   half-open window bounds
     * @param[in] step
     *   non-zero distance between consecutive addresses
     *
     * @return
     *   the range, or an error if the step is 0 or the window reaches
     *   outside the address space
     */
    static tl::expected<ipv6_network_range, error>
    make(const ipv6_address& base,
         const ipv6_address& last,
         const range_bound& start,
         const range_bound& stop,
         std::optional<int128_t> step);

    static ipv6_network_range empty_range(int128_t step = 1)
    {
        return (ipv6_network_range(step));
    }

    bool empty() const { return (m_empty); }
    int128_t step() const { return (m_step); }

    /* Window bounds; meaningless for an empty range */
    ipv6_address lower() const { return (ipv6_address(m_lower)); }
    ipv6_address upper() const { return (ipv6_address(m_upper)); }

    iterator begin() const;
    iterator end() const { return (iterator()); }
};

} // namespace v6net

#endif /* _LIB_V6NET_IPV6_NETWORK_RANGE_HPP_ */
