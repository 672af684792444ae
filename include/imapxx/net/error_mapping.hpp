/*

error_mapping.hpp
-----------------

Centralized mapping between Asio error codes and imapxx::error_code for network I/O.

*/

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <imapxx/detail/asio_decl.hpp>
#include <imapxx/detail/error_detail.hpp>
#include <imapxx/detail/result.hpp>

namespace imapxx::net
{

enum class io_stage
{
    resolve,
    connect,
    handshake,
    read,
    write
};

[[nodiscard]] constexpr std::string_view stage_name(io_stage stage) noexcept
{
    switch (stage)
    {
        case io_stage::resolve: return "resolve";
        case io_stage::connect: return "connect";
        case io_stage::handshake: return "handshake";
        case io_stage::read: return "read";
        case io_stage::write: return "write";
    }
    return "unknown";
}

/// The peer went away cleanly: a close, not an error.
[[nodiscard]] inline bool is_orderly_close(const asio::error_code& ec) noexcept
{
    return ec == asio::error::eof || ec == asio::ssl::error::stream_truncated;
}

[[nodiscard]] inline error_code map_net_error(io_stage stage, const asio::error_code& ec, bool timeout_triggered) noexcept
{
    if (timeout_triggered || ec == asio::error::timed_out)
        return stage == io_stage::read || stage == io_stage::write ? error_code::socket_timeout : error_code::connection_timeout;
    if (ec == asio::error::host_not_found || ec == asio::error::host_not_found_try_again)
        return error_code::dns_resolution_failed;
    if (ec == asio::error::connection_refused)
        return error_code::connection_failed;
    if (ec == asio::error::eof || ec == asio::error::connection_reset || ec == asio::error::broken_pipe)
        return error_code::connection_closed;

    switch (stage)
    {
        case io_stage::resolve: return error_code::dns_resolution_failed;
        case io_stage::connect: return error_code::connection_failed;
        case io_stage::handshake: return error_code::tls_handshake_failed;
        case io_stage::read: return error_code::socket_error;
        case io_stage::write: return error_code::socket_error;
    }
    return error_code::socket_error;
}

[[nodiscard]] inline detail::error_detail make_net_detail(
    std::string_view host,
    std::string_view service,
    io_stage stage,
    std::string_view op)
{
    detail::error_detail detail;
    detail.add("proto", "imap");
    detail.add("host", host);
    detail.add("service", service);
    detail.add("stage", stage_name(stage));
    detail.add("op", op);
    return detail;
}

/// Error with the Asio message and a `key=value` detail block as server response.
[[nodiscard]] inline error make_net_error(
    io_stage stage,
    std::string_view op,
    const asio::error_code& ec,
    bool timeout_triggered,
    std::string_view host,
    std::string_view service)
{
    const auto code = map_net_error(stage, ec, timeout_triggered);
    std::string message(error_code_to_string(code));
    if (ec && !timeout_triggered)
    {
        message += ": ";
        message += ec.message();
    }
    auto detail = make_net_detail(host, service, stage, op);
    if (ec)
    {
        detail.add("asio.category", ec.category().name());
        detail.add("asio.value", static_cast<std::uint64_t>(ec.value() < 0 ? -ec.value() : ec.value()));
    }
    return error(code, std::move(message), detail.str());
}

} // namespace imapxx::net
