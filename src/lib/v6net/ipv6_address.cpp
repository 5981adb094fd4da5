#include <stdexcept>

#include "v6net/ipv6_address.hpp"
#include "v6net/ipv6_parser.hpp"

namespace v6net {

ipv6_address::ipv6_address(const char* input)
    : ipv6_address(value_or_throw(parse(input)))
{}

ipv6_address::ipv6_address(const std::string& input)
    : ipv6_address(value_or_throw(parse(input)))
{}

tl::expected<ipv6_address, error> ipv6_address::parse(std::string_view input)
{
    auto result = parser::parse_address(input, parser::prefix_policy::forbid);
    if (!result) { return (tl::make_unexpected(std::move(result.error()))); }

    return (from_integer(result->value));
}

ipv6_address ipv6_address::make_prefix_mask(unsigned prefix_length)
{
    if (prefix_length > SIZE_IN_BITS) {
        throw std::out_of_range(std::to_string(prefix_length)
                                + " is larger than "
                                + std::to_string(SIZE_IN_BITS));
    }

    /* Shifting a 128 bit value by 128 is undefined */
    if (prefix_length == 0) { return (ipv6_address()); }

    return (ipv6_address(uint128_max << (SIZE_IN_BITS - prefix_length)));
}

uint16_t ipv6_address::hextet(size_t idx) const
{
    if (idx > (SIZE_IN_U16 - 1)) {
        throw std::out_of_range(std::to_string(idx) + " is not between 0 and "
                                + std::to_string(SIZE_IN_U16 - 1));
    }

    return (static_cast<uint16_t>(m_value >> ((SIZE_IN_U16 - 1 - idx) * 16)));
}

hextet_array ipv6_address::hextets() const noexcept
{
    auto output = hextet_array{};
    for (size_t idx = 0; idx < SIZE_IN_U16; idx++) {
        output[idx] =
            static_cast<uint16_t>(m_value >> ((SIZE_IN_U16 - 1 - idx) * 16));
    }
    return (output);
}

tl::expected<ipv6_address, error> ipv6_address::add(int128_t delta) const
{
    auto result = checked_add(m_value, delta);
    if (!result) {
        return (make_unexpected_error(error_code::out_of_range,
                                      to_string(*this) + " + "
                                          + to_string(delta)
                                          + " is not a valid address"));
    }

    return (ipv6_address(*result));
}

tl::expected<ipv6_address, error> ipv6_address::subtract(int128_t delta) const
{
    auto result = checked_subtract(m_value, delta);
    if (!result) {
        return (make_unexpected_error(error_code::out_of_range,
                                      to_string(*this) + " - "
                                          + to_string(delta)
                                          + " is not a valid address"));
    }

    return (ipv6_address(*result));
}

ipv6_address operator+(const ipv6_address& lhs, int128_t rhs)
{
    return (value_or_throw(lhs.add(rhs)));
}

ipv6_address operator-(const ipv6_address& lhs, int128_t rhs)
{
    return (value_or_throw(lhs.subtract(rhs)));
}

std::string to_string(const ipv6_address& addr)
{
    return (format_hextets(addr.hextets(), format_short));
}

std::string to_string(const ipv6_address& addr, const format_options& options)
{
    return (format_hextets(addr.hextets(), options));
}

tl::expected<std::string, error> format(const ipv6_address& addr,
                                        std::string_view spec)
{
    return (parse_format_spec(spec).map(
        [&](const auto& options) { return (to_string(addr, options)); }));
}

int compare(const ipv6_address& lhs, const ipv6_address& rhs)
{
    if (lhs.to_integer() < rhs.to_integer()) {
        return (-1);
    } else if (lhs.to_integer() > rhs.to_integer()) {
        return (1);
    } else {
        return (0);
    }
}

} // namespace v6net
