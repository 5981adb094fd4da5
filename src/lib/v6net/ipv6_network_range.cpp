#include "utils/overloaded_visitor.hpp"
#include "v6net/ipv6_network_range.hpp"

namespace v6net {

ipv6_network_iterator::ipv6_network_iterator(uint128_t first,
                                             uint128_t last,
                                             uint128_t stride,
                                             bool reverse)
    : m_cursor(ipv6_address(first))
    , m_last(last)
    , m_stride(stride)
    , m_reverse(reverse)
    , m_done(false)
{}

ipv6_network_iterator& ipv6_network_iterator::operator++()
{
    if (m_done) { return (*this); }

    /* Compare distances instead of positions so the cursor never wraps */
    const auto cursor = m_cursor.to_integer();
    const auto remaining = m_reverse ? cursor - m_last : m_last - cursor;
    if (remaining < m_stride) {
        m_done = true;
    } else {
        m_cursor = ipv6_address(m_reverse ? cursor - m_stride
                                          : cursor + m_stride);
    }

    return (*this);
}

ipv6_network_iterator ipv6_network_iterator::operator++(int)
{
    auto to_return = *this;
    operator++();
    return (to_return);
}

bool ipv6_network_iterator::operator==(const ipv6_network_iterator& other) const
{
    if (m_done || other.m_done) { return (m_done == other.m_done); }

    return (m_cursor == other.m_cursor && m_last == other.m_last
            && m_stride == other.m_stride && m_reverse == other.m_reverse);
}

ipv6_network_range::ipv6_network_range(const ipv6_address& lower,
                                       const ipv6_address& upper,
                                       int128_t step)
    : m_lower(lower.to_integer())
    , m_upper(upper.to_integer())
    , m_step(step)
    , m_empty(lower > upper)
{
    if (step == 0) {
        throw exception(error{error_code::invalid_step, "step cannot be 0"});
    }
}

static tl::expected<uint128_t, error> resolve_start(const ipv6_address& base,
                                                    const range_bound& start)
{
    return (std::visit(
        utils::overloaded_visitor(
            [&](const std::monostate&) -> tl::expected<uint128_t, error> {
                return (base.to_integer());
            },
            [&](const int128_t& offset) -> tl::expected<uint128_t, error> {
                if (auto value = checked_add(base.to_integer(), offset)) {
                    return (*value);
                }
                return (make_unexpected_error(
                    error_code::out_of_range,
                    "start offset " + to_string(offset)
                        + " is outside of the address space"));
            },
            [](const ipv6_address& addr) -> tl::expected<uint128_t, error> {
                return (addr.to_integer());
            }),
        start));
}

/*
 * Convert an exclusive stop bound to the inclusive upper end of the window.
 * An empty optional means the window ends below address 0.
 */
static tl::expected<std::optional<uint128_t>, error>
resolve_stop(const ipv6_address& base,
             const ipv6_address& last,
             const range_bound& stop)
{
    using result_type = tl::expected<std::optional<uint128_t>, error>;

    return (std::visit(
        utils::overloaded_visitor(
            [&](const std::monostate&) -> result_type {
                return (last.to_integer());
            },
            [&](const int128_t& offset) -> result_type {
                if (auto value = checked_add(base.to_integer(), offset)) {
                    if (*value == 0) { return (std::nullopt); }
                    return (*value - 1);
                }

                if (offset < 0) { return (std::nullopt); }

                /* One past the final address is the only valid stop beyond it */
                if (checked_add(base.to_integer(), offset - 1) == uint128_max) {
                    return (uint128_max);
                }

                return (make_unexpected_error(
                    error_code::out_of_range,
                    "stop offset " + to_string(offset)
                        + " is outside of the address space"));
            },
            [](const ipv6_address& addr) -> result_type {
                if (addr.to_integer() == 0) { return (std::nullopt); }
                return (addr.to_integer() - 1);
            }),
        stop));
}

tl::expected<ipv6_network_range, error>
ipv6_network_range::make(const ipv6_address& base,
                         const ipv6_address& last,
                         const range_bound& start,
                         const range_bound& stop,
                         std::optional<int128_t> step)
{
    if (step && *step == 0) {
        return (make_unexpected_error(error_code::invalid_step));
    }

    const auto walk = step.value_or(1);

    auto lower = resolve_start(base, start);
    if (!lower) { return (tl::make_unexpected(std::move(lower.error()))); }

    auto upper = resolve_stop(base, last, stop);
    if (!upper) { return (tl::make_unexpected(std::move(upper.error()))); }

    if (!*upper || **upper < *lower) { return (empty_range(walk)); }

    return (ipv6_network_range(
        ipv6_address(*lower), ipv6_address(**upper), walk));
}

ipv6_network_range::iterator ipv6_network_range::begin() const
{
    if (m_empty) { return (end()); }

    /* A negative step walks the window from the top */
    return (m_step > 0
                ? iterator(m_lower, m_upper, magnitude(m_step), false)
                : iterator(m_upper, m_lower, magnitude(m_step), true));
}

} // namespace v6net
