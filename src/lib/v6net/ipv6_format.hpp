#ifndef _LIB_V6NET_IPV6_FORMAT_HPP_
#define _LIB_V6NET_IPV6_FORMAT_HPP_

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "v6net/errors.hpp"

namespace v6net {

using hextet_array = std::array<uint16_t, 8>;

enum class compression_mode {
    compress, /**< replace the longest run of zero hextets with "::" */
    expand,   /**< print every hextet */
};

enum class padding_mode {
    pad,  /**< print 4 digits per hextet */
    trim, /**< drop leading zeros, keeping at least one digit */
};

struct format_options
{
    compression_mode compression = compression_mode::compress;
    padding_mode padding = padding_mode::trim;
};

inline bool operator==(const format_options& lhs, const format_options& rhs)
{
    return (lhs.compression == rhs.compression && lhs.padding == rhs.padding);
}

inline bool operator!=(const format_options& lhs, const format_options& rhs)
{
    return (!(lhs == rhs));
}

/* Canonical form, e.g. 2001:db8::1 */
constexpr format_options format_short = {compression_mode::compress,
                                         padding_mode::trim};

/* Fully expanded form, e.g. 2001:0db8:0000:0000:0000:0000:0000:0001 */
constexpr format_options format_long = {compression_mode::expand,
                                        padding_mode::pad};

/**
 * Parse a format specification string.
 *
 * Flags are single characters, applied left to right:
 *   s: short (compress + trim)
 *   l: long (expand + pad)
 *   c: compress
 *   e: expand
 *   p: pad
 *   t: trim
 * The last flag to touch an option wins.  An empty string is the short
 * form.
 */
tl::expected<format_options, error> parse_format_spec(std::string_view spec);

std::string to_string(const format_options&);

struct elision
{
    size_t start;
    size_t length;
};

/**
 * Find the hextets to replace with "::": the longest run of two or more
 * zero hextets; the leftmost one on a tie.
 */
std::optional<elision> find_elision(const hextet_array& hextets);

std::string format_hextets(const hextet_array& hextets,
                           const format_options& options = format_short);

} // namespace v6net

#endif /* _LIB_V6NET_IPV6_FORMAT_HPP_ */
