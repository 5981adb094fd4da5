#include "v6net/errors.hpp"

namespace v6net {

class v6net_category final : public std::error_category
{
public:
    const char* name() const noexcept override { return ("v6net"); }

    std::string message(int value) const override
    {
        switch (static_cast<error_code>(value)) {
        case error_code::none:
            return ("success");
        case error_code::malformed_hextet:
            return ("hextet must be 4 hexadecimal digits or less");
        case error_code::multiple_elision:
            return ("address can only have one '::'");
        case error_code::unrecognized_token:
            return ("unrecognized text in address");
        case error_code::trailing_data_after_prefix:
            return ("unexpected text after prefix length");
        case error_code::missing_prefix_length:
            return ("no prefix length specified");
        case error_code::out_of_range:
            return ("value out of range");
        case error_code::invalid_step:
            return ("step cannot be 0");
        case error_code::index_out_of_range:
            return ("index is outside of the network");
        case error_code::invalid_format_flag:
            return ("unrecognized format flag");
        case error_code::invalid_hextet_count:
            return ("address must have 8 hextets, or fewer than 8 with '::'");
        case error_code::unexpected_prefix_length:
            return ("prefix length is not allowed here");
        case error_code::prefix_length_out_of_range:
            return ("prefix length is too large");
        }

        return ("unknown error " + std::to_string(value));
    }
};

const std::error_category& category() noexcept
{
    static const v6net_category instance;
    return (instance);
}

std::error_code make_error_code(error_code code)
{
    return {static_cast<int>(code), category()};
}

std::string to_string(const error& e)
{
    auto output = category().message(static_cast<int>(e.code));
    if (!e.detail.empty()) { output += ": " + e.detail; }
    if (!e.lexeme.empty()) {
        output += " ('" + e.lexeme + "'";
        if (e.offset != error::npos) {
            output += " at offset " + std::to_string(e.offset);
        }
        output += ")";
    }

    return (output);
}

tl::unexpected<error> make_unexpected_error(error_code code,
                                            std::string detail,
                                            std::string_view lexeme,
                                            size_t offset)
{
    return (tl::make_unexpected(
        error{code, std::move(detail), std::string(lexeme), offset}));
}

exception::exception(const error& e)
    : std::system_error(make_error_code(e.code), e.detail)
    , m_error(e)
{}

} // namespace v6net
