/*

sanitize.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <imapxx/detail/append.hpp>
#include <imapxx/detail/result.hpp>

namespace imapxx
{
namespace detail
{

/// Position of the first CR, LF or NUL, or `npos`.
[[nodiscard]] inline std::size_t find_line_break_or_nul(std::string_view value) noexcept
{
    for (std::size_t i = 0; i < value.size(); ++i)
    {
        if (value[i] == '\r' || value[i] == '\n' || value[i] == '\0')
            return i;
    }
    return std::string_view::npos;
}

/// Caller text that ends up on the wire must not be able to start a new command.
[[nodiscard]] inline result_void ensure_no_crlf_or_nul(std::string_view value, std::string_view field)
{
    const auto pos = find_line_break_or_nul(value);
    if (pos == std::string_view::npos)
        return ok();

    std::string message = "Invalid ";
    append_sv(message, field);
    append_sv(message, value[pos] == '\0' ? ": NUL" : ": line break");
    append_sv(message, " at offset ");
    append_uint(message, pos);
    return fail(error_code::invalid_argument, std::move(message));
}

[[nodiscard]] inline result_void ensure_not_empty(std::string_view value, std::string_view field)
{
    if (!value.empty())
        return ok();

    std::string message = "Invalid ";
    append_sv(message, field);
    append_sv(message, ": empty.");
    return fail(error_code::invalid_argument, std::move(message));
}

} // namespace detail
} // namespace imapxx
