#include <algorithm>

#include "v6net/uint128.hpp"

namespace v6net {

std::optional<uint128_t> checked_add(uint128_t value, int128_t delta)
{
    const auto step = magnitude(delta);
    if (delta < 0) {
        if (step > value) { return (std::nullopt); }
        return (value - step);
    }

    if (uint128_max - value < step) { return (std::nullopt); }
    return (value + step);
}

std::optional<uint128_t> checked_subtract(uint128_t value, int128_t delta)
{
    const auto step = magnitude(delta);
    if (delta < 0) {
        if (uint128_max - value < step) { return (std::nullopt); }
        return (value + step);
    }

    if (step > value) { return (std::nullopt); }
    return (value - step);
}

static std::string to_string_base(uint128_t value, unsigned base)
{
    static constexpr char digits[] = "0123456789abcdef";

    if (value == 0) { return ("0"); }

    auto output = std::string{};
    while (value) {
        output.push_back(digits[static_cast<unsigned>(value % base)]);
        value /= base;
    }
    std::reverse(std::begin(output), std::end(output));

    return (output);
}

std::string to_string(uint128_t value) { return (to_string_base(value, 10)); }

std::string to_string(int128_t value)
{
    return (value < 0 ? "-" + to_string_base(magnitude(value), 10)
                      : to_string_base(magnitude(value), 10));
}

std::string to_hex_string(uint128_t value)
{
    return ("0x" + to_string_base(value, 16));
}

} // namespace v6net
