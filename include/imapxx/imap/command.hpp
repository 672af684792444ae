/*

command.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <imapxx/detail/append.hpp>
#include <imapxx/detail/ascii.hpp>
#include <imapxx/detail/result.hpp>
#include <imapxx/detail/sanitize.hpp>
#include <imapxx/imap/utf7.hpp>

namespace imapxx::imap
{

struct command_part
{
    enum class kind
    {
        text,
        literal
    };

    kind type = kind::text;
    std::string data;
};

/**
Command arguments as text interleaved with literals.

Text never contains CR or LF; each literal is sent after its `{n}` header, once
the server asks for it or right away with LITERAL+.
**/
class command_line
{
public:
    command_line() = default;

    explicit command_line(std::string_view verb)
    {
        atom(verb);
    }

    /// Verbatim token preceded by a separator.
    command_line& atom(std::string_view token)
    {
        separate();
        detail::append_sv(text(), token);
        return *this;
    }

    /// Verbatim text without separator.
    command_line& raw(std::string_view fragment)
    {
        detail::append_sv(text(), fragment);
        return *this;
    }

    command_line& quoted(std::string_view str)
    {
        separate();
        detail::append_quoted(text(), str);
        return *this;
    }

    command_line& literal(std::string data)
    {
        separate();
        parts_.push_back(command_part{command_part::kind::literal, std::move(data)});
        return *this;
    }

    /// Quoted string, or a literal when quoting cannot carry it.
    command_line& string(std::string_view str, std::size_t literal_threshold)
    {
        if (needs_literal(str, literal_threshold))
            return literal(std::string(str));
        return quoted(str);
    }

    command_line& open_list()
    {
        separate();
        detail::append_char(text(), '(');
        return *this;
    }

    command_line& close_list()
    {
        detail::append_char(text(), ')');
        return *this;
    }

    command_line& append(const command_line& other)
    {
        for (const auto& part : other.parts_)
        {
            if (part.type == command_part::kind::literal)
            {
                separate();
                parts_.push_back(part);
                continue;
            }
            std::string_view data = part.data;
            while (!data.empty() && data.front() == ' ')
                data.remove_prefix(1);
            if (data.empty())
                continue;
            separate();
            detail::append_sv(text(), data);
        }
        return *this;
    }

    [[nodiscard]] const std::vector<command_part>& parts() const noexcept
    {
        return parts_;
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return parts_.empty() || (parts_.size() == 1 && parts_.front().type == command_part::kind::text && parts_.front().data.empty());
    }

    [[nodiscard]] bool has_literal() const noexcept
    {
        for (const auto& part : parts_)
        {
            if (part.type == command_part::kind::literal)
                return true;
        }
        return false;
    }

    /// First token, upper-cased.
    [[nodiscard]] std::string verb() const
    {
        if (parts_.empty() || parts_.front().type != command_part::kind::text)
            return {};
        return detail::to_upper_ascii(detail::split_token(parts_.front().data).first);
    }

    /// Flat rendering with literals as `{n}\r\n<data>`, without the trailing CRLF.
    [[nodiscard]] std::string str() const
    {
        std::string out;
        for (const auto& part : parts_)
        {
            if (part.type == command_part::kind::literal)
            {
                detail::append_literal_header(out, part.data.size(), false);
                detail::append_crlf(out);
            }
            detail::append_sv(out, part.data);
        }
        return out;
    }

    /// Strings that quoting cannot carry, or that are long enough to send as literals.
    [[nodiscard]] static bool needs_literal(std::string_view str, std::size_t literal_threshold) noexcept
    {
        if (str.size() > literal_threshold)
            return true;
        for (char ch : str)
        {
            const auto c = static_cast<unsigned char>(ch);
            if (c < 0x20 || c >= 0x7f)
                return true;
        }
        return false;
    }

private:
    std::string& text()
    {
        if (parts_.empty() || parts_.back().type != command_part::kind::text)
            parts_.push_back(command_part{});
        return parts_.back().data;
    }

    void separate()
    {
        if (parts_.empty())
            return;
        if (parts_.back().type == command_part::kind::literal)
        {
            parts_.push_back(command_part{command_part::kind::text, " "});
            return;
        }
        const auto& data = parts_.back().data;
        if (data.empty() || data.back() == ' ' || data.back() == '(')
            return;
        detail::append_space(parts_.back().data);
    }

    std::vector<command_part> parts_;
};

/// Quoted or literal mailbox argument in modified UTF-7.
[[nodiscard]] inline result_void append_mailbox(command_line& cmd, std::string_view name, std::size_t literal_threshold)
{
    IMAPXX_TRY_VOID(detail::ensure_no_crlf_or_nul(name, "mailbox"));
    std::string encoded;
    IMAPXX_TRY_ASSIGN(encoded, encode_modified_utf7(name));
    cmd.string(encoded, literal_threshold);
    return ok();
}

/// Parenthesized flag list, flags validated as atoms.
[[nodiscard]] inline result_void append_flag_list(command_line& cmd, const std::vector<std::string>& flags)
{
    cmd.open_list();
    for (const auto& flag : flags)
    {
        std::string_view bare = flag;
        if (!bare.empty() && bare.front() == '\\')
            bare.remove_prefix(1);
        if (!detail::is_atom(bare))
        {
            std::string message = "Invalid flag: ";
            message += flag;
            return fail(error_code::invalid_argument, std::move(message));
        }
        cmd.atom(flag);
    }
    cmd.close_list();
    return ok();
}

} // namespace imapxx::imap
