/*

transport.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Byte transport consumed by the IMAP connection. The engine never touches
sockets or DNS; it only sees this interface.

*/

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include <imapxx/detail/result.hpp>

namespace imapxx::net
{

class transport
{
public:
    struct handlers
    {
        std::function<void()> on_connect;
        std::function<void(std::string_view)> on_data;
        std::function<void(const error&)> on_error;
        std::function<void()> on_close;
    };

    using timer_id = std::uint64_t;

    virtual ~transport() = default;

    /// Begin connecting; progress is reported through `h`.
    virtual void start(handlers h) = 0;

    /// Queue bytes for sending, in call order.
    virtual void write(std::string bytes) = 0;

    /// Close without further callbacks.
    virtual void close() = 0;

    /// One-shot timer on the transport's event loop.
    virtual timer_id schedule(std::chrono::milliseconds delay, std::function<void()> fn) = 0;

    virtual void cancel(timer_id id) = 0;
};

} // namespace imapxx::net
