/*

options.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include <imapxx/imap/search.hpp>

namespace imapxx::imap
{

struct credentials
{
    std::string user;
    std::string password;
    /// Pre-encoded SASL XOAUTH2 initial response.
    std::string xoauth2;
    /// Raw OAuth2 bearer token, encoded together with `user`.
    std::string access_token;

    [[nodiscard]] bool uses_xoauth2() const noexcept
    {
        return !xoauth2.empty() || !access_token.empty();
    }
};

struct timeouts
{
    std::chrono::milliseconds connect{10000};
    /// Greeting plus authentication; 0 disables.
    std::chrono::milliseconds auth{5000};
    /// Idle socket; 0 disables.
    std::chrono::milliseconds socket{0};
};

struct keepalive
{
    bool enabled = true;
    /// Delay before a NOOP, or before entering IDLE, once the connection is quiet.
    std::chrono::milliseconds interval{10000};
    /// IDLE is restarted after this long.
    std::chrono::milliseconds idle_interval{300000};
    /// NOOP even when the server supports IDLE.
    bool force_noop = false;
};

/// Connection settings, already validated by the caller.
struct options
{
    credentials auth;
    std::string host;
    std::uint16_t port = 143;
    /// Implicit TLS (typically port 993).
    bool tls = false;
    imap::timeouts timeouts;
    imap::keepalive keepalive;
    /// Strings longer than this are sent as literals.
    std::size_t literal_threshold = 1024;
    negation_dialect negation = negation_dialect::not_keyword;
    /// Commands outstanding at once after authentication.
    std::size_t max_in_flight = 1;
    std::size_t max_line_length = 1024 * 1024;
    bool redact_secrets_in_trace = true;
    /// Receives every protocol line, sent and received.
    std::function<void(std::string_view)> debug;
};

} // namespace imapxx::imap
