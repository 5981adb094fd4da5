#ifndef _LIB_V6NET_ERRORS_HPP_
#define _LIB_V6NET_ERRORS_HPP_

#include <string>
#include <string_view>
#include <system_error>

#include "tl/expected.hpp"

namespace v6net {

enum class error_code {
    none = 0,
    malformed_hextet,
    multiple_elision,
    unrecognized_token,
    trailing_data_after_prefix,
    missing_prefix_length,
    out_of_range,
    invalid_step,
    index_out_of_range,
    invalid_format_flag,
    invalid_hextet_count,
    unexpected_prefix_length,
    prefix_length_out_of_range,
};

const std::error_category& category() noexcept;

std::error_code make_error_code(error_code);

/**
 * Details of a failed conversion or validation.
 * The lexeme and offset are only meaningful for errors found while
 * scanning text; offset is npos otherwise.
 */
struct error
{
    static constexpr size_t npos = std::string_view::npos;

    error_code code = error_code::none;
    std::string detail;
    std::string lexeme;
    size_t offset = npos;
};

std::string to_string(const error&);

tl::unexpected<error> make_unexpected_error(error_code code,
                                            std::string detail = {},
                                            std::string_view lexeme = {},
                                            size_t offset = error::npos);

/**
 * Exception thrown by the constructors that cannot return an error.
 */
class exception : public std::system_error
{
    error m_error;

public:
    explicit exception(const error&);

    const error& get_error() const noexcept { return (m_error); }
};

/* Unwrap an expected value, throwing on failure */
template <typename T> T value_or_throw(tl::expected<T, error>&& result)
{
    if (!result) { throw exception(result.error()); }
    return (std::move(*result));
}

} // namespace v6net

namespace std {

template <> struct is_error_code_enum<v6net::error_code> : true_type
{};

} // namespace std

#endif /* _LIB_V6NET_ERRORS_HPP_ */
