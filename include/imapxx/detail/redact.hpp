#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <imapxx/detail/ascii.hpp>

namespace imapxx::detail
{

inline constexpr std::string_view redacted_marker = "<redacted>";

/// Length of the atom, quoted string or literal header at the start of `text`.
[[nodiscard]] inline std::size_t astring_length(std::string_view text) noexcept
{
    if (text.empty())
        return 0;
    if (text.front() == '"')
    {
        for (std::size_t i = 1; i < text.size(); ++i)
        {
            if (text[i] == '\\')
                ++i;
            else if (text[i] == '"')
                return i + 1;
        }
        return text.size();
    }
    const auto end = text.find(' ');
    return end == std::string_view::npos ? text.size() : end;
}

[[nodiscard]] inline bool looks_like_base64(std::string_view text) noexcept
{
    if (text.empty())
        return false;
    for (unsigned char ch : text)
    {
        const bool alnum = (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9');
        if (!alnum && ch != '+' && ch != '/' && ch != '=')
            return false;
    }
    return true;
}

/**
Outgoing line with its secrets replaced by `<redacted>`:

- `tag LOGIN user password`: everything after the user name;
- `tag AUTHENTICATE mechanism initial-response`: the initial response;
- a bare SASL answer sent after a continuation.

Other lines are returned unchanged, line end included.
**/
[[nodiscard]] inline std::string redact_line(std::string_view line)
{
    std::string_view body = line;
    while (!body.empty() && (body.back() == '\r' || body.back() == '\n'))
        body.remove_suffix(1);
    const std::string_view line_end = line.substr(body.size());

    auto rebuild = [line_end](std::string_view kept)
    {
        std::string out(kept);
        if (!out.empty())
            out += ' ';
        out += redacted_marker;
        out += line_end;
        return out;
    };

    const auto tag_end = body.find(' ');
    if (tag_end == std::string_view::npos)
    {
        if (body.size() >= 12 && looks_like_base64(body))
            return rebuild({});
        return std::string(line);
    }

    std::string_view rest = body.substr(tag_end + 1);
    const auto verb_end = rest.find(' ');
    if (verb_end == std::string_view::npos)
        return std::string(line);
    const std::string_view verb = rest.substr(0, verb_end);
    rest.remove_prefix(verb_end + 1);

    // Both commands keep one argument: the user name or the mechanism.
    if (!iequals_ascii(verb, "LOGIN") && !iequals_ascii(verb, "AUTHENTICATE"))
        return std::string(line);
    const auto first = astring_length(rest);
    if (first >= rest.size())
        return std::string(line);
    const auto kept = body.size() - rest.size() + first;
    return rebuild(body.substr(0, kept));
}

} // namespace imapxx::detail
