#include "core/v6n_log.h"
#include "v6net/ipv6_format.hpp"

namespace v6net {

static constexpr size_t min_elision_length = 2;
static constexpr size_t max_address_length = 39;

/* Cannot match any hextet, so it always terminates the final run */
static constexpr uint32_t run_sentinel = 0x10000;

tl::expected<format_options, error> parse_format_spec(std::string_view spec)
{
    auto options = format_options{};

    for (size_t idx = 0; idx < spec.size(); idx++) {
        switch (spec[idx]) {
        case 's':
            options = format_short;
            break;
        case 'l':
            options = format_long;
            break;
        case 'c':
            options.compression = compression_mode::compress;
            break;
        case 'e':
            options.compression = compression_mode::expand;
            break;
        case 'p':
            options.padding = padding_mode::pad;
            break;
        case 't':
            options.padding = padding_mode::trim;
            break;
        default:
            V6N_LOG(V6N_LOG_DEBUG,
                    "Invalid format flag '%c' in \"%.*s\"",
                    spec[idx],
                    static_cast<int>(spec.size()),
                    spec.data());
            return (make_unexpected_error(
                error_code::invalid_format_flag, {}, spec.substr(idx, 1), idx));
        }
    }

    return (options);
}

std::string to_string(const format_options& options)
{
    return (std::string(options.compression == compression_mode::compress
                            ? "c"
                            : "e")
            + (options.padding == padding_mode::pad ? "p" : "t"));
}

std::optional<elision> find_elision(const hextet_array& hextets)
{
    auto best = std::optional<elision>{};
    auto run_start = size_t{0};

    for (size_t idx = 1; idx <= hextets.size(); idx++) {
        const auto value =
            idx < hextets.size() ? uint32_t{hextets[idx]} : run_sentinel;
        if (value == hextets[run_start]) { continue; }

        const auto length = idx - run_start;
        if (hextets[run_start] == 0 && length >= min_elision_length
            && (!best || length > best->length)) {
            best = elision{run_start, length};
        }

        run_start = idx;
    }

    return (best);
}

static void append_hextet(std::string& output,
                          uint16_t value,
                          padding_mode padding)
{
    static constexpr char hex_digits[] = "0123456789abcdef";

    auto leading = true;
    for (int shift = 12; shift >= 0; shift -= 4) {
        const auto nibble = (value >> shift) & 0xf;
        leading = leading && nibble == 0 && shift > 0;
        if (leading && padding == padding_mode::trim) { continue; }
        output.push_back(hex_digits[nibble]);
    }
}

std::string format_hextets(const hextet_array& hextets,
                           const format_options& options)
{
    const auto skip = options.compression == compression_mode::compress
                          ? find_elision(hextets)
                          : std::nullopt;

    auto output = std::string{};
    output.reserve(max_address_length);

    auto separate = false;
    for (size_t idx = 0; idx < hextets.size(); idx++) {
        if (skip && idx == skip->start) {
            output.append("::");
            separate = false;
            idx += skip->length - 1;
            continue;
        }

        if (separate) { output.push_back(':'); }
        append_hextet(output, hextets[idx], options.padding);
        separate = true;
    }

    return (output);
}

} // namespace v6net
