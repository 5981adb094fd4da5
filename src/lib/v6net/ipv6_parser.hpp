#ifndef _LIB_V6NET_IPV6_PARSER_HPP_
#define _LIB_V6NET_IPV6_PARSER_HPP_

#include <optional>
#include <string_view>

#include "v6net/errors.hpp"
#include "v6net/uint128.hpp"

namespace v6net::parser {

enum class prefix_policy {
    forbid,  /**< "/<len>" is an error */
    allow,   /**< "/<len>" is optional */
    require, /**< "/<len>" must be present */
};

struct parse_result
{
    uint128_t value = 0;
    std::optional<unsigned> prefix_length;
};

/**
 * Fold IPv6 address text into its 128 bit value.
 *
 * Hextets before a "::" fill the value from the most significant end;
 * hextets after it are shifted in from the least significant end, so the
 * size of the elided gap never needs to be known.  Without "::" exactly
 * 8 hextets are required; with it, at most 7.
 *
 * @param[in] input
 *   address text, optionally followed by "/<prefix length>"
 * @param[in] policy
 *   whether a prefix length may or must follow the address
 *
 * @return
 *   the address value and prefix length (if any), or the first error found
 */
tl::expected<parse_result, error>
parse_address(std::string_view input,
              prefix_policy policy = prefix_policy::forbid);

} // namespace v6net::parser

#endif /* _LIB_V6NET_IPV6_PARSER_HPP_ */
