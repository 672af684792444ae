/*

error_detail.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <imapxx/detail/append.hpp>

namespace imapxx::detail
{

/// `key=value` lines attached to transport errors; a line break inside a value becomes a space.
class error_detail
{
public:
    error_detail& add(std::string_view key, std::string_view value)
    {
        append_sv(text_, key);
        append_char(text_, '=');
        for (char ch : value)
            text_ += (ch == '\r' || ch == '\n') ? ' ' : ch;
        append_char(text_, '\n');
        return *this;
    }

    error_detail& add(std::string_view key, std::uint64_t value)
    {
        append_sv(text_, key);
        append_char(text_, '=');
        append_uint(text_, value);
        append_char(text_, '\n');
        return *this;
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return text_.empty();
    }

    [[nodiscard]] const std::string& str() const noexcept
    {
        return text_;
    }

private:
    std::string text_;
};

} // namespace imapxx::detail
