/*

imap_watch.cpp
--------------

Keeps a connection to the inbox open and reports new mail, expunges and
flag changes as the server announces them. Stops after ten minutes.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <utility>
#include <boost/asio.hpp>
#include "example_util.hpp"
#include <imapxx/detail/log.hpp>
#include <imapxx/imap/connection.hpp>
#include <imapxx/net/asio_transport.hpp>


using imapxx::imap::connection;
using imapxx::imap::event;
using imapxx::imap::event_kind;
using std::cout;
using std::endl;


int main()
{
    boost::asio::io_context io_ctx;
    imapxx::log::logger::instance().set_level(imapxx::log::level::info);

    imapxx::imap::options options;
    options.host = "imap.example.com";
    options.port = 993;
    options.tls = true;
    // modify username/password to use real credentials
    options.auth.user = "imapxx";
    options.auth.password = "imapxxpass";
    options.keepalive.interval = std::chrono::seconds(5);
    options.keepalive.idle_interval = std::chrono::minutes(5);

    auto transport = std::make_unique<imapxx::net::asio_transport>(io_ctx, imapxx::net::asio_settings::from(options));
    connection conn(options, std::move(transport));

    conn.on(event_kind::error, [](const event& ev) { print_error(*ev.err); });
    conn.on(event_kind::alert, [](const event& ev) { cout << "ALERT: " << ev.message << endl; });
    conn.on(event_kind::mail, [](const event& ev) { cout << ev.number << " new message(s)" << endl; });
    conn.on(event_kind::expunge, [](const event& ev) { cout << "message " << ev.number << " expunged" << endl; });
    conn.on(event_kind::update, [](const event& ev)
    {
        cout << "message " << ev.number << " flags:";
        if (ev.attributes)
        {
            for (const auto& flag : ev.attributes->flags)
                cout << ' ' << flag;
        }
        cout << endl;
    });
    conn.on(event_kind::uidvalidity, [](const event& ev) { cout << "UIDVALIDITY is now " << ev.number << endl; });
    conn.on(event_kind::close, [&io_ctx](const event& ev)
    {
        cout << "closed" << (ev.had_error ? " after an error" : "") << endl;
        io_ctx.stop();
    });
    conn.on(event_kind::ready, [&conn](const event&)
    {
        conn.open_box("INBOX", false, [&conn](imapxx::result<imapxx::imap::mailbox> box)
        {
            if (!box)
            {
                print_error(box.error());
                return conn.end();
            }
            cout << "watching " << box->name << " (" << box->messages.total << " messages)" << endl;
        });
    });

    boost::asio::steady_timer stop(io_ctx, std::chrono::minutes(10));
    stop.async_wait([&conn](const boost::system::error_code& ec)
    {
        if (!ec)
            conn.end();
    });

    conn.connect();
    io_ctx.run();
    return EXIT_SUCCESS;
}
