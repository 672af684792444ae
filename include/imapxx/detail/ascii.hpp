#pragma once

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace imapxx
{
namespace detail
{
    [[nodiscard]] constexpr char ascii_toupper(char c) noexcept
    {
        return (c >= 'a' && c <= 'z') ? static_cast<char>(c - ('a' - 'A')) : c;
    }

    [[nodiscard]] inline bool iequals_ascii(std::string_view a, std::string_view b) noexcept
    {
        if (a.size() != b.size())
            return false;

        for (std::size_t i = 0; i < a.size(); ++i)
        {
            if (ascii_toupper(a[i]) != ascii_toupper(b[i]))
                return false;
        }
        return true;
    }

    [[nodiscard]] inline bool starts_with_ci(std::string_view text, std::string_view prefix) noexcept
    {
        if (text.size() < prefix.size())
            return false;
        return iequals_ascii(text.substr(0, prefix.size()), prefix);
    }

    [[nodiscard]] inline std::string to_upper_ascii(std::string_view input)
    {
        std::string out;
        out.reserve(input.size());
        for (char ch : input)
            out.push_back(ascii_toupper(ch));
        return out;
    }

    [[nodiscard]] inline std::string_view ltrim(std::string_view text) noexcept
    {
        while (!text.empty() && text.front() == ' ')
            text.remove_prefix(1);
        return text;
    }

    [[nodiscard]] inline std::pair<std::string_view, std::string_view> split_token(std::string_view text) noexcept
    {
        text = ltrim(text);
        auto pos = text.find(' ');
        if (pos == std::string_view::npos)
            return {text, std::string_view{}};
        return {text.substr(0, pos), ltrim(text.substr(pos + 1))};
    }

    [[nodiscard]] inline bool is_digits(std::string_view text) noexcept
    {
        if (text.empty())
            return false;
        for (char ch : text)
        {
            if (ch < '0' || ch > '9')
                return false;
        }
        return true;
    }

    template<typename Unsigned>
    [[nodiscard]] inline bool parse_uint(std::string_view token, Unsigned& out) noexcept
    {
        if (!is_digits(token))
            return false;
        Unsigned value = 0;
        auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
        if (ec != std::errc{} || ptr != token.data() + token.size())
            return false;
        out = value;
        return true;
    }

    // RFC 3501 ATOM-CHAR: any CHAR except atom-specials.
    [[nodiscard]] constexpr bool is_atom_char(char ch) noexcept
    {
        const auto c = static_cast<unsigned char>(ch);
        if (c <= 0x1f || c >= 0x7f)
            return false;
        switch (ch)
        {
            case '(': case ')': case '{': case ' ': case '%': case '*':
            case '"': case '\\': case ']':
                return false;
            default:
                return true;
        }
    }

    [[nodiscard]] inline bool is_atom(std::string_view text) noexcept
    {
        if (text.empty())
            return false;
        for (char ch : text)
        {
            if (!is_atom_char(ch))
                return false;
        }
        return true;
    }

    [[nodiscard]] inline bool is_7bit(std::string_view text) noexcept
    {
        for (char ch : text)
        {
            if (static_cast<unsigned char>(ch) > 0x7f)
                return false;
        }
        return true;
    }

} // namespace detail
} // namespace imapxx
