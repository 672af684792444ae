/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
No exceptions are thrown by imapxx - all errors are returned via result<T>.

*/

#pragma once

#include <cstdint>
#include <expected>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include <imapxx/detail/append.hpp>

namespace imapxx
{

/// Error codes for imapxx operations
enum class error_code : std::uint16_t
{
    success = 0,

    // Network errors (100-199)
    connection_failed = 100,
    connection_closed = 101,
    socket_error = 102,
    dns_resolution_failed = 103,
    tls_handshake_failed = 104,

    // Timeouts (200-299)
    connection_timeout = 200,
    auth_timeout = 201,
    socket_timeout = 202,

    // Protocol errors (300-399)
    parse_error = 300,
    unknown_tag = 301,
    line_too_long = 302,
    unexpected_bye = 303,
    protocol_violation = 304,

    // Tagged server replies (400-499)
    imap_no = 400,
    imap_bad = 401,

    // Input validation (500-599)
    invalid_argument = 500,
    invalid_criteria = 501,
    invalid_state = 502,
    capability_not_supported = 503,
    invalid_mailbox = 504,

    // Caller withdrew the command (900)
    cancelled = 900,
};

/// Coarse classification of error codes
enum class error_category : std::uint8_t
{
    none,
    network,
    timeout,
    protocol,
    server,
    validation,
    cancelled
};

[[nodiscard]] constexpr error_category category_of(error_code ec) noexcept
{
    const auto c = static_cast<std::uint16_t>(ec);
    if (c == 0)
        return error_category::none;
    if (c < 200)
        return error_category::network;
    if (c < 300)
        return error_category::timeout;
    if (c < 400)
        return error_category::protocol;
    if (c < 500)
        return error_category::server;
    if (c < 600)
        return error_category::validation;
    return error_category::cancelled;
}

/// Errors of these categories tear the connection down.
[[nodiscard]] constexpr bool is_fatal(error_code ec) noexcept
{
    switch (category_of(ec))
    {
        case error_category::network:
        case error_category::timeout:
        case error_category::protocol:
            return true;
        case error_category::none:
        case error_category::server:
        case error_category::validation:
        case error_category::cancelled:
            return false;
    }
    return false;
}

/// Convert error code to string
[[nodiscard]] constexpr std::string_view error_code_to_string(error_code ec) noexcept
{
    switch (ec)
    {
        case error_code::success: return "Success";
        case error_code::connection_failed: return "Connection failed";
        case error_code::connection_closed: return "Connection closed";
        case error_code::socket_error: return "Socket error";
        case error_code::dns_resolution_failed: return "DNS resolution failed";
        case error_code::tls_handshake_failed: return "TLS handshake failed";
        case error_code::connection_timeout: return "Connection timeout";
        case error_code::auth_timeout: return "Authentication timeout";
        case error_code::socket_timeout: return "Socket timeout";
        case error_code::parse_error: return "Parse error";
        case error_code::unknown_tag: return "Unknown tag";
        case error_code::line_too_long: return "Line too long";
        case error_code::unexpected_bye: return "Unexpected BYE";
        case error_code::protocol_violation: return "Protocol violation";
        case error_code::imap_no: return "IMAP NO response";
        case error_code::imap_bad: return "IMAP BAD response";
        case error_code::invalid_argument: return "Invalid argument";
        case error_code::invalid_criteria: return "Invalid search criteria";
        case error_code::invalid_state: return "Invalid state";
        case error_code::capability_not_supported: return "Capability not supported";
        case error_code::invalid_mailbox: return "Invalid mailbox";
        case error_code::cancelled: return "Operation cancelled";
    }
    return "Unknown error";
}

inline std::ostream& operator<<(std::ostream& os, error_code ec)
{
    return os << static_cast<std::uint16_t>(ec) << ' ' << error_code_to_string(ec);
}

/// Rich error type with code, message, and optional server response
class error
{
public:
    error() noexcept : code_(error_code::success) {}

    explicit error(error_code code)
        : code_(code), message_(error_code_to_string(code)) {}

    error(error_code code, std::string message)
        : code_(code), message_(std::move(message)) {}

    error(error_code code, std::string message, std::string server_response)
        : code_(code), message_(std::move(message)), server_response_(std::move(server_response)) {}

    [[nodiscard]] error_code code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::string& server_response() const noexcept { return server_response_; }

    [[nodiscard]] error_category category() const noexcept { return category_of(code_); }
    [[nodiscard]] bool is_fatal() const noexcept { return imapxx::is_fatal(code_); }

    [[nodiscard]] bool is_success() const noexcept { return code_ == error_code::success; }
    [[nodiscard]] explicit operator bool() const noexcept { return !is_success(); }

    [[nodiscard]] bool is(error_code ec) const noexcept { return code_ == ec; }

    /// Format error for display
    [[nodiscard]] std::string to_string() const
    {
        std::string out;
        detail::append_char(out, '[');
        detail::append_uint(out, static_cast<std::uint64_t>(code_));
        detail::append_sv(out, "] ");
        detail::append_sv(out, message_);
        if (!server_response_.empty())
        {
            detail::append_sv(out, ": ");
            detail::append_sv(out, server_response_);
        }
        return out;
    }

private:
    error_code code_;
    std::string message_;
    std::string server_response_;
};

/// Result type alias using std::expected
template<typename T>
using result = std::expected<T, error>;

/// Void result for operations that don't return a value
using result_void = std::expected<void, error>;

/// Helper to create successful result
template<typename T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

/// Helper to create void success
[[nodiscard]] inline constexpr result_void ok()
{
    return result_void{};
}

/// Helper to create error result
template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error err)
{
    return std::unexpected(std::move(err));
}

template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error_code code)
{
    return std::unexpected(error(code));
}

template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error_code code, std::string message)
{
    return std::unexpected(error(code, std::move(message)));
}

template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error_code code, std::string message, std::string server_response)
{
    return std::unexpected(error(code, std::move(message), std::move(server_response)));
}

/// Propagate the error of a result-returning expression.
/// Usage: IMAPXX_TRY_VOID(check_something());
#define IMAPXX_TRY_VOID(expr) \
    do { \
        auto&& _imapxx_result = (expr); \
        if (!_imapxx_result) [[unlikely]] \
            return std::unexpected(std::move(_imapxx_result).error()); \
    } while (0)

/// Same but moves the value into an existing variable
#define IMAPXX_TRY_ASSIGN(lhs, expr) \
    do { \
        auto&& _imapxx_result = (expr); \
        if (!_imapxx_result) [[unlikely]] \
            return std::unexpected(std::move(_imapxx_result).error()); \
        lhs = std::move(*_imapxx_result); \
    } while (0)

} // namespace imapxx
