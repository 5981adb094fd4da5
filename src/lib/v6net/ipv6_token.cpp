#include <algorithm>
#include <stdexcept>
#include <string>

#include "v6net/ipv6_token.hpp"

namespace v6net::token {

static constexpr std::string_view elision_text = "::";

static bool is_digit(char c) { return (c >= '0' && c <= '9'); }

static bool is_alnum(char c)
{
    return (is_digit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'));
}

static bool starts_token(std::string_view input, size_t offset)
{
    const auto c = input[offset];
    return (c == ':' || is_alnum(c)
            || (c == '/' && offset + 1 < input.size()
                && is_digit(input[offset + 1])));
}

static size_t run_length(std::string_view input, bool (*pred)(char))
{
    return (static_cast<size_t>(std::distance(
        std::begin(input),
        std::find_if_not(std::begin(input), std::end(input), pred))));
}

token next_token(std::string_view input, size_t offset)
{
    if (offset >= input.size()) {
        throw std::out_of_range(std::to_string(offset)
                                + " is not less than input length "
                                + std::to_string(input.size()));
    }

    const auto rest = input.substr(offset);

    /* "::" has to be tried first; ":" is a prefix of it */
    if (rest.substr(0, elision_text.size()) == elision_text) {
        return (double_colon{{rest.substr(0, elision_text.size()), offset}});
    }

    if (rest.front() == ':') { return (colon{{rest.substr(0, 1), offset}}); }

    if (is_alnum(rest.front())) {
        return (hex_group{{rest.substr(0, run_length(rest, is_alnum)), offset}});
    }

    if (rest.front() == '/' && rest.size() > 1 && is_digit(rest[1])) {
        auto length = 1 + run_length(rest.substr(1), is_digit);
        return (prefix_length{{rest.substr(0, length), offset}});
    }

    auto length = size_t{1};
    while (offset + length < input.size()
           && !starts_token(input, offset + length)) {
        length++;
    }

    return (unrecognized{{rest.substr(0, length), offset}});
}

const lexeme& get_lexeme(const token& tok)
{
    return (std::visit([](const lexeme& lex) -> const lexeme& { return (lex); },
                       tok));
}

token_stream::iterator::iterator(std::string_view input, size_t offset)
    : m_input(input)
{
    if (offset < m_input.size()) { m_token = next_token(m_input, offset); }
}

token_stream::iterator& token_stream::iterator::operator++()
{
    auto offset = get_lexeme(*m_token).end();
    if (offset < m_input.size()) {
        m_token = next_token(m_input, offset);
    } else {
        m_token.reset();
    }

    return (*this);
}

token_stream::iterator token_stream::iterator::operator++(int)
{
    auto to_return = *this;
    operator++();
    return (to_return);
}

bool token_stream::iterator::operator==(const iterator& other) const
{
    if (!m_token || !other.m_token) { return (!m_token && !other.m_token); }

    return (get_lexeme(*m_token).offset == get_lexeme(*other.m_token).offset);
}

} // namespace v6net::token
