#include "core/v6n_log.h"
#include "v6net/ipv6_network.hpp"
#include "v6net/ipv6_parser.hpp"

namespace v6net {

ipv6_network::ipv6_network(const ipv6_address& addr,
                           unsigned prefix,
                           std::nullptr_t)
    : m_addr(addr & ipv6_address::make_prefix_mask(prefix))
    , m_prefix(prefix)
{}

ipv6_network::ipv6_network(const ipv6_address& addr, unsigned prefix)
    : ipv6_network(value_or_throw(create(addr, prefix)))
{}

ipv6_network::ipv6_network(const std::string& cidr)
    : ipv6_network(value_or_throw(parse(cidr)))
{}

tl::expected<ipv6_network, error> ipv6_network::parse(std::string_view input)
{
    auto result = parser::parse_address(input, parser::prefix_policy::require);
    if (!result) { return (tl::make_unexpected(std::move(result.error()))); }

    return (ipv6_address::from_integer(result->value).and_then(
        [&](const auto& addr) {
            return (create(addr, *result->prefix_length));
        }));
}

tl::expected<ipv6_network, error> ipv6_network::create(const ipv6_address& addr,
                                                       unsigned prefix_length)
{
    if (prefix_length > max_prefix_length) {
        V6N_LOG(V6N_LOG_DEBUG,
                "Rejecting prefix length %u for %s",
                prefix_length,
                to_string(addr).c_str());
        return (make_unexpected_error(error_code::out_of_range,
                                      std::to_string(prefix_length)
                                          + " is larger than "
                                          + std::to_string(max_prefix_length)));
    }

    return (ipv6_network(addr, prefix_length, nullptr));
}

tl::expected<ipv6_network, error> ipv6_network::create(std::string_view address,
                                                       unsigned prefix_length)
{
    return (ipv6_address::parse(address).and_then([&](const auto& addr) {
        return (create(addr, prefix_length));
    }));
}

tl::expected<ipv6_network, error> ipv6_network::create(const char* address,
                                                       unsigned prefix_length)
{
    return (create(std::string_view(address), prefix_length));
}

tl::expected<ipv6_network, error>
ipv6_network::create(const std::string& address, unsigned prefix_length)
{
    return (create(std::string_view(address), prefix_length));
}

const ipv6_address& ipv6_network::address() const { return (m_addr); }

unsigned ipv6_network::prefix_length() const { return (m_prefix); }

uint128_t ipv6_network::prefix_mask() const
{
    return (ipv6_address::make_prefix_mask(m_prefix).to_integer());
}

uint128_t ipv6_network::max_index() const { return (~prefix_mask()); }

std::optional<uint128_t> ipv6_network::host_count() const
{
    if (m_prefix == 0) { return (std::nullopt); }
    return (uint128_t{1} << (max_prefix_length - m_prefix));
}

ipv6_address ipv6_network::first() const { return (m_addr); }

ipv6_address ipv6_network::last() const { return (m_addr | max_index()); }

bool ipv6_network::contains(const ipv6_address& addr) const
{
    return ((addr & prefix_mask()) == m_addr);
}

tl::expected<ipv6_address, error> ipv6_network::address_at(uint128_t index) const
{
    if (index > max_index()) {
        return (make_unexpected_error(error_code::index_out_of_range,
                                      to_string(index)
                                          + " is not between 0 and "
                                          + to_string(max_index())));
    }

    /* The base has no host bits set, so this can't carry */
    return (ipv6_address(m_addr.to_integer() | index));
}

ipv6_network_range ipv6_network::range() const
{
    return (ipv6_network_range(first(), last()));
}

tl::expected<ipv6_network_range, error>
ipv6_network::slice(const range_bound& start,
                    const range_bound& stop,
                    std::optional<int128_t> step) const
{
    return (ipv6_network_range::make(m_addr, last(), start, stop, step));
}

ipv6_network_range::iterator ipv6_network::begin() const
{
    return (range().begin());
}

ipv6_network_range::iterator ipv6_network::end() const
{
    return (range().end());
}

std::string to_string(const ipv6_network& network)
{
    return (to_string(network.address()) + "/"
            + std::to_string(network.prefix_length()));
}

std::string to_string(const ipv6_network& network,
                      const format_options& options)
{
    return (to_string(network.address(), options) + "/"
            + std::to_string(network.prefix_length()));
}

tl::expected<std::string, error> format(const ipv6_network& network,
                                        std::string_view spec)
{
    return (parse_format_spec(spec).map(
        [&](const auto& options) { return (to_string(network, options)); }));
}

int compare(const ipv6_network& lhs, const ipv6_network& rhs)
{
    if (lhs.address() < rhs.address())
        return (-1);
    else if (lhs.address() > rhs.address())
        return (1);
    else if (lhs.prefix_length() < rhs.prefix_length())
        return (-1);
    else if (lhs.prefix_length() > rhs.prefix_length())
        return (1);
    else
        return (0);
}

} // namespace v6net
