/*

imap_fetch_one.cpp
------------------

Connects to an IMAP server over TLS, fetches the headers and flags of
the most recent message and prints them.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <boost/asio.hpp>
#include "example_util.hpp"
#include <imapxx/imap/connection.hpp>
#include <imapxx/net/asio_transport.hpp>


using imapxx::imap::connection;
using imapxx::imap::event;
using imapxx::imap::event_kind;
using imapxx::imap::fetch_handlers;
using imapxx::imap::fetch_options;
using std::cout;
using std::endl;


int main()
{
    boost::asio::io_context io_ctx;

    imapxx::imap::options options;
    options.host = "imap.gmail.com";
    options.port = 993;
    options.tls = true;
    // an OAuth2 access token obtained elsewhere
    options.auth.user = "imapxx@gmail.com";
    options.auth.access_token = "ya29.token";
    options.keepalive.enabled = false;
    options.debug = [](std::string_view line) { std::cerr << line << '\n'; };

    auto transport = std::make_unique<imapxx::net::asio_transport>(io_ctx, imapxx::net::asio_settings::from(options));
    connection conn(options, std::move(transport));
    int status = EXIT_FAILURE;

    conn.on(event_kind::error, [](const event& ev) { print_error(*ev.err); });
    conn.on(event_kind::ready, [&conn, &status](const event&)
    {
        conn.open_box("INBOX", true, [&conn, &status](imapxx::result<imapxx::imap::mailbox> box)
        {
            if (!box || box->messages.total == 0)
            {
                if (!box)
                    print_error(box.error());
                return conn.end();
            }

            fetch_options what;
            what.bodies = {"HEADER.FIELDS (FROM TO SUBJECT DATE)"};
            fetch_handlers handlers;
            handlers.on_body = [](const imapxx::imap::body_info& info, std::string data)
            {
                cout << "[" << info.which << "]" << endl << data;
            };
            handlers.on_attributes = [](const imapxx::imap::message_attributes& attrs)
            {
                cout << "UID " << attrs.uid << ", flags:";
                for (const auto& flag : attrs.flags)
                    cout << ' ' << flag;
                cout << endl;
            };
            conn.seq().fetch(box->messages.total, what, std::move(handlers), [&conn, &status](imapxx::result_void done)
            {
                if (!done)
                    print_error(done.error());
                else
                    status = EXIT_SUCCESS;
                conn.end();
            });
        });
    });

    conn.connect();
    io_ctx.run();
    return status;
}
