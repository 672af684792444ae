/*

utf7.hpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Modified UTF-7 (RFC 3501 section 5.1.3) for mailbox names.

*/


#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <imapxx/detail/result.hpp>

namespace imapxx::imap
{

namespace utf7_detail
{

inline constexpr std::string_view alphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+,";

[[nodiscard]] inline int sextet_value(char ch) noexcept
{
    const auto pos = alphabet.find(ch);
    return pos == std::string_view::npos ? -1 : static_cast<int>(pos);
}

[[nodiscard]] inline result<std::string> invalid(std::string_view what)
{
    std::string message = "Invalid ";
    message += what;
    message += '.';
    return fail<std::string>(error_code::invalid_mailbox, std::move(message));
}

/// Next code point of a UTF-8 string, or nullopt on malformed input.
[[nodiscard]] inline std::optional<std::uint32_t> next_utf8(std::string_view text, std::size_t& index)
{
    const auto lead = static_cast<unsigned char>(text[index]);
    std::size_t extra = 0;
    std::uint32_t cp = 0;
    std::uint32_t min = 0;
    if (lead < 0x80)
    {
        ++index;
        return lead;
    }
    if ((lead >> 5) == 0x6)
    {
        extra = 1; cp = lead & 0x1F; min = 0x80;
    }
    else if ((lead >> 4) == 0xE)
    {
        extra = 2; cp = lead & 0x0F; min = 0x800;
    }
    else if ((lead >> 3) == 0x1E)
    {
        extra = 3; cp = lead & 0x07; min = 0x10000;
    }
    else
        return std::nullopt;

    if (index + extra >= text.size())
        return std::nullopt;
    for (std::size_t k = 1; k <= extra; ++k)
    {
        const auto cont = static_cast<unsigned char>(text[index + k]);
        if ((cont & 0xC0) != 0x80)
            return std::nullopt;
        cp = (cp << 6) | (cont & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        return std::nullopt;
    index += extra + 1;
    return cp;
}

inline void put_utf8(std::uint32_t cp, std::string& out)
{
    if (cp <= 0x7F)
        out.push_back(static_cast<char>(cp));
    else if (cp <= 0x7FF)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp <= 0xFFFF)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

/// Writes UTF-16BE units as modified base64 between `&` and `-`.
inline void put_shifted(const std::vector<std::uint16_t>& units, std::string& out)
{
    out.push_back('&');
    std::uint32_t bits = 0;
    int nbits = 0;
    for (std::uint16_t unit : units)
    {
        bits = (bits << 16) | unit;
        nbits += 16;
        while (nbits >= 6)
        {
            nbits -= 6;
            out.push_back(alphabet[(bits >> nbits) & 0x3F]);
        }
        bits &= (1u << nbits) - 1;
    }
    if (nbits > 0)
        out.push_back(alphabet[(bits << (6 - nbits)) & 0x3F]);
    out.push_back('-');
}

} // namespace utf7_detail

/// UTF-8 mailbox name to its wire form.
[[nodiscard]] inline result<std::string> encode_modified_utf7(std::string_view utf8)
{
    std::string out;
    out.reserve(utf8.size());
    std::vector<std::uint16_t> pending;

    std::size_t index = 0;
    while (index < utf8.size())
    {
        const auto cp = utf7_detail::next_utf8(utf8, index);
        if (!cp)
            return utf7_detail::invalid("UTF-8 in mailbox name");

        if (*cp >= 0x20 && *cp <= 0x7E)
        {
            if (!pending.empty())
            {
                utf7_detail::put_shifted(pending, out);
                pending.clear();
            }
            if (*cp == '&')
                out += "&-";
            else
                out.push_back(static_cast<char>(*cp));
            continue;
        }

        if (*cp <= 0xFFFF)
            pending.push_back(static_cast<std::uint16_t>(*cp));
        else
        {
            const std::uint32_t v = *cp - 0x10000;
            pending.push_back(static_cast<std::uint16_t>(0xD800 + (v >> 10)));
            pending.push_back(static_cast<std::uint16_t>(0xDC00 + (v & 0x3FF)));
        }
    }
    if (!pending.empty())
        utf7_detail::put_shifted(pending, out);
    return out;
}

/// Wire mailbox name back to UTF-8.
[[nodiscard]] inline result<std::string> decode_modified_utf7(std::string_view mutf7)
{
    std::string out;
    out.reserve(mutf7.size());

    std::size_t i = 0;
    while (i < mutf7.size())
    {
        const auto ch = static_cast<unsigned char>(mutf7[i]);
        if (ch & 0x80)
            return utf7_detail::invalid("modified UTF-7");
        if (ch != '&')
        {
            out.push_back(static_cast<char>(ch));
            ++i;
            continue;
        }

        const auto end = mutf7.find('-', i + 1);
        if (end == std::string_view::npos)
            return utf7_detail::invalid("modified UTF-7");
        if (end == i + 1)
        {
            out.push_back('&');
            i = end + 1;
            continue;
        }

        std::uint32_t bits = 0;
        int nbits = 0;
        std::optional<std::uint16_t> high;
        for (std::size_t k = i + 1; k < end; ++k)
        {
            const int v = utf7_detail::sextet_value(mutf7[k]);
            if (v < 0)
                return utf7_detail::invalid("modified UTF-7");
            bits = (bits << 6) | static_cast<std::uint32_t>(v);
            nbits += 6;
            if (nbits < 16)
                continue;
            nbits -= 16;
            const auto unit = static_cast<std::uint16_t>((bits >> nbits) & 0xFFFF);
            bits &= (1u << nbits) - 1;

            if (high)
            {
                if (unit < 0xDC00 || unit > 0xDFFF)
                    return utf7_detail::invalid("modified UTF-7");
                utf7_detail::put_utf8(0x10000 + ((static_cast<std::uint32_t>(*high) - 0xD800) << 10) + (unit - 0xDC00u), out);
                high.reset();
            }
            else if (unit >= 0xD800 && unit <= 0xDBFF)
                high = unit;
            else if (unit >= 0xDC00 && unit <= 0xDFFF)
                return utf7_detail::invalid("modified UTF-7");
            else
                utf7_detail::put_utf8(unit, out);
        }
        // Leftover bits are zero padding shorter than one sextet.
        if (high || nbits >= 6 || bits != 0)
            return utf7_detail::invalid("modified UTF-7");
        i = end + 1;
    }
    return out;
}

} // namespace imapxx::imap
