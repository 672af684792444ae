#pragma once

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace imapxx
{
namespace detail
{

inline void append_sv(std::string& out, std::string_view sv)
{
    out.reserve(out.size() + sv.size());
    out.append(sv.data(), sv.size());
}

inline void append_char(std::string& out, char ch)
{
    out.reserve(out.size() + 1);
    out.push_back(ch);
}

inline void append_space(std::string& out)
{
    append_char(out, ' ');
}

inline void append_crlf(std::string& out)
{
    out.reserve(out.size() + 2);
    out.append("\r\n", 2);
}

inline void append_uint(std::string& out, std::uint64_t value, int base = 10)
{
    char buffer[64];
    const auto result = std::to_chars(buffer, buffer + sizeof(buffer), value, base);
    if (result.ec != std::errc())
        return;
    const auto len = static_cast<std::size_t>(result.ptr - buffer);
    out.reserve(out.size() + len);
    out.append(buffer, len);
}

/// IMAP quoted string: DQUOTE *QUOTED-CHAR DQUOTE, escaping `"` and `\`.
inline void append_quoted(std::string& out, std::string_view text)
{
    out.reserve(out.size() + text.size() + 2);
    out.push_back('"');
    for (char ch : text)
    {
        if (ch == '"' || ch == '\\')
            out.push_back('\\');
        out.push_back(ch);
    }
    out.push_back('"');
}

/// Literal header `{n}` or, for LITERAL+, `{n+}`.
inline void append_literal_header(std::string& out, std::size_t size, bool non_synchronizing)
{
    append_char(out, '{');
    append_uint(out, static_cast<std::uint64_t>(size));
    if (non_synchronizing)
        append_char(out, '+');
    append_char(out, '}');
}

} // namespace detail
} // namespace imapxx
