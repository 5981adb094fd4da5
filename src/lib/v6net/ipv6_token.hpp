#ifndef _LIB_V6NET_IPV6_TOKEN_HPP_
#define _LIB_V6NET_IPV6_TOKEN_HPP_

#include <iterator>
#include <memory>
#include <optional>
#include <string_view>
#include <variant>

namespace v6net::token {

/**
 * A span of address text. Lexemes view the input; they must not outlive
 * the string they were scanned from.
 */
struct lexeme
{
    std::string_view text;
    size_t offset;

    size_t end() const { return (offset + text.size()); }
};

/* Run of alphanumerics; length and digits are checked by the parser */
struct hex_group : lexeme
{};

/* "::" */
struct double_colon : lexeme
{};

/* ":" */
struct colon : lexeme
{};

/* "/" followed by decimal digits */
struct prefix_length : lexeme
{
    std::string_view digits() const { return (text.substr(1)); }
};

/* Anything else; only used for diagnostics */
struct unrecognized : lexeme
{};

using token =
    std::variant<hex_group, double_colon, colon, prefix_length, unrecognized>;

/**
 * Scan the token starting at the given offset.
 *
 * @param[in] input
 *   address text
 * @param[in] offset
 *   position of the token; must be less than input.size()
 *
 * @return
 *   the longest token starting at offset
 */
token next_token(std::string_view input, size_t offset);

const lexeme& get_lexeme(const token&);

/**
 * Input range over the tokens of an address string.
 */
class token_stream
{
    std::string_view m_input;

public:
    class iterator
    {
        std::string_view m_input;
        std::optional<token> m_token;

    public:
        using difference_type = std::ptrdiff_t;
        using value_type = token;
        using pointer = const token*;
        using reference = const token&;
        using iterator_category = std::input_iterator_tag;

        iterator() = default;
        iterator(std::string_view input, size_t offset);

        reference operator*() const { return (*m_token); }
        pointer operator->() const { return (std::addressof(*m_token)); }

        iterator& operator++();
        iterator operator++(int);

        bool operator==(const iterator& other) const;
        bool operator!=(const iterator& other) const
        {
            return (!(*this == other));
        }
    };

    explicit token_stream(std::string_view input)
        : m_input(input)
    {}

    iterator begin() const { return (iterator(m_input, 0)); }
    iterator end() const { return (iterator()); }
};

} // namespace v6net::token

#endif /* _LIB_V6NET_IPV6_TOKEN_HPP_ */
