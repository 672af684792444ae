/*

sasl.hpp
--------

Client side of the SASL mechanisms used with IMAP AUTHENTICATE.

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string>
#include <string_view>
#include <imapxx/codec/base64.hpp>
#include <imapxx/detail/result.hpp>
#include <imapxx/detail/sanitize.hpp>

namespace imapxx::sasl
{

enum class mechanism
{
    plain,
    xoauth2
};

/// Name as announced in `AUTH=` capabilities and sent after AUTHENTICATE.
[[nodiscard]] constexpr std::string_view mechanism_name(mechanism m) noexcept
{
    switch (m)
    {
        case mechanism::plain: return "PLAIN";
        case mechanism::xoauth2: return "XOAUTH2";
    }
    return "UNKNOWN";
}

/**
Initial response of PLAIN (RFC 4616): `\0user\0password`, Base64 encoded.
The authorization identity is left empty.
**/
[[nodiscard]] inline result<std::string> encode_plain(std::string_view username, std::string_view password)
{
    IMAPXX_TRY_VOID(detail::ensure_no_crlf_or_nul(username, "username"));
    IMAPXX_TRY_VOID(detail::ensure_no_crlf_or_nul(password, "password"));

    std::string message(1, '\0');
    message += username;
    message += '\0';
    message += password;
    return base64::encode(message);
}

/**
Initial response of XOAUTH2 (Google, Microsoft):
`user=<user>^Aauth=Bearer <token>^A^A`, Base64 encoded.
**/
[[nodiscard]] inline result<std::string> encode_xoauth2(std::string_view username, std::string_view access_token)
{
    IMAPXX_TRY_VOID(detail::ensure_no_crlf_or_nul(username, "username"));
    IMAPXX_TRY_VOID(detail::ensure_not_empty(access_token, "access token"));
    IMAPXX_TRY_VOID(detail::ensure_no_crlf_or_nul(access_token, "access token"));

    std::string message = "user=";
    message += username;
    message += "\x01" "auth=Bearer ";
    message += access_token;
    message += "\x01\x01";
    return base64::encode(message);
}

/// After a rejected XOAUTH2 response the server sends a Base64 JSON status in a
/// continuation; this is the decoded text, or empty when it is not Base64.
[[nodiscard]] inline std::string xoauth2_failure(std::string_view challenge)
{
    auto decoded = base64::decode(challenge);
    if (!decoded)
        return {};
    return std::move(*decoded);
}

} // namespace imapxx::sasl
