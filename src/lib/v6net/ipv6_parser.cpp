#include <charconv>
#include <cstdint>

#include "core/v6n_log.h"
#include "utils/overloaded_visitor.hpp"
#include "v6net/ipv6_parser.hpp"
#include "v6net/ipv6_token.hpp"

namespace v6net::parser {

static constexpr unsigned max_hextets = 8;
static constexpr size_t max_hextet_digits = 4;
static constexpr unsigned hextet_bits = 16;

using step_result = tl::expected<void, error>;

static tl::unexpected<error> make_token_error(error_code code,
                                              const token::lexeme& lex,
                                              std::string detail = {})
{
    return (make_unexpected_error(code, std::move(detail), lex.text, lex.offset));
}

/*
 * Accumulated state for one address.  hi holds the hextets seen before
 * the elision, placed from the top down; lo holds the hextets after it,
 * shifted in from the bottom.
 */
class address_builder
{
    uint128_t m_hi = 0;
    uint128_t m_lo = 0;
    unsigned m_hi_count = 0;
    unsigned m_lo_count = 0;
    bool m_elided = false;
    std::optional<unsigned> m_prefix_length;

public:
    step_result add_hextet(const token::hex_group& hex)
    {
        if (hex.text.size() > max_hextet_digits) {
            return (make_token_error(error_code::malformed_hextet, hex));
        }

        auto value = uint16_t{0};
        auto [ptr, ec] = std::from_chars(
            hex.text.data(), hex.text.data() + hex.text.size(), value, 16);
        if (ec != std::errc{} || ptr != hex.text.data() + hex.text.size()) {
            return (make_token_error(error_code::malformed_hextet,
                                     hex,
                                     "not a hexadecimal number"));
        }

        if (m_elided) {
            if (m_hi_count + m_lo_count + 1 >= max_hextets) {
                return (make_token_error(error_code::invalid_hextet_count,
                                         hex,
                                         "too many hextets around '::'"));
            }
            m_lo = (m_lo << hextet_bits) | value;
            m_lo_count++;
        } else {
            if (m_hi_count >= max_hextets) {
                return (make_token_error(
                    error_code::invalid_hextet_count, hex, "too many hextets"));
            }
            m_hi |= static_cast<uint128_t>(value)
                    << ((max_hextets - 1 - m_hi_count) * hextet_bits);
            m_hi_count++;
        }

        return {};
    }

    step_result add_elision(const token::double_colon& skip)
    {
        if (m_elided) {
            return (make_token_error(error_code::multiple_elision, skip));
        }
        if (m_hi_count >= max_hextets) {
            return (make_token_error(error_code::invalid_hextet_count,
                                     skip,
                                     "'::' must replace at least one hextet"));
        }

        m_elided = true;
        return {};
    }

    step_result set_prefix_length(const token::prefix_length& prefix,
                                  prefix_policy policy)
    {
        if (policy == prefix_policy::forbid) {
            return (make_token_error(error_code::unexpected_prefix_length,
                                     prefix));
        }

        auto digits = prefix.digits();
        auto value = uint32_t{0};
        auto [ptr, ec] =
            std::from_chars(digits.data(), digits.data() + digits.size(), value);
        if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
            return (make_token_error(error_code::prefix_length_out_of_range,
                                     prefix));
        }

        m_prefix_length = value;
        return {};
    }

    bool has_prefix_length() const { return (m_prefix_length.has_value()); }

    tl::expected<parse_result, error> finish(prefix_policy policy) const
    {
        if (!m_elided && m_hi_count != max_hextets) {
            return (make_unexpected_error(
                error_code::invalid_hextet_count,
                "found " + std::to_string(m_hi_count) + " hextets"));
        }

        if (policy == prefix_policy::require && !m_prefix_length) {
            return (make_unexpected_error(error_code::missing_prefix_length));
        }

        return (parse_result{m_hi | m_lo, m_prefix_length});
    }
};

static tl::expected<parse_result, error>
parse_tokens(std::string_view input, prefix_policy policy)
{
    auto builder = address_builder{};

    for (const auto& tok : token::token_stream(input)) {
        if (builder.has_prefix_length()) {
            return (make_token_error(error_code::trailing_data_after_prefix,
                                     token::get_lexeme(tok)));
        }

        auto result = std::visit(
            utils::overloaded_visitor(
                [&](const token::hex_group& hex) {
                    return (builder.add_hextet(hex));
                },
                [&](const token::double_colon& skip) {
                    return (builder.add_elision(skip));
                },
                [](const token::colon&) { return (step_result{}); },
                [&](const token::prefix_length& prefix) {
                    return (builder.set_prefix_length(prefix, policy));
                },
                [](const token::unrecognized& junk) -> step_result {
                    return (make_token_error(error_code::unrecognized_token,
                                             junk));
                }),
            tok);

        if (!result) { return (tl::make_unexpected(std::move(result.error()))); }
    }

    return (builder.finish(policy));
}

tl::expected<parse_result, error> parse_address(std::string_view input,
                                                prefix_policy policy)
{
    auto result = parse_tokens(input, policy);
    if (!result) {
        V6N_LOG(V6N_LOG_DEBUG,
                "Rejecting IPv6 address \"%.*s\": %s",
                static_cast<int>(input.size()),
                input.data(),
                to_string(result.error()).c_str());
    }

    return (result);
}

} // namespace v6net::parser
