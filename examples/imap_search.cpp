/*

imap_search.cpp
---------------

Connects to an IMAP server over TLS and searches the inbox for unseen
messages with a given subject.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <vector>
#include <utility>
#include <boost/asio.hpp>
#include "example_util.hpp"
#include <imapxx/imap/connection.hpp>
#include <imapxx/net/asio_transport.hpp>


using imapxx::imap::connection;
using imapxx::imap::criterion;
using imapxx::imap::event;
using imapxx::imap::event_kind;
using std::cout;
using std::endl;


int main()
{
    boost::asio::io_context io_ctx;

    imapxx::imap::options options;
    options.host = "imap-mail.outlook.com";
    options.port = 993;
    options.tls = true;
    // modify username/password to use real credentials
    options.auth.user = "imapxx@outlook.com";
    options.auth.password = "imapxxpass";
    options.keepalive.enabled = false;

    auto transport = std::make_unique<imapxx::net::asio_transport>(io_ctx, imapxx::net::asio_settings::from(options));
    connection conn(options, std::move(transport));
    int status = EXIT_FAILURE;

    conn.on(event_kind::error, [](const event& ev) { print_error(*ev.err); });
    conn.on(event_kind::ready, [&conn, &status](const event&)
    {
        conn.open_box("INBOX", true, [&conn, &status](imapxx::result<imapxx::imap::mailbox> box)
        {
            if (!box)
            {
                print_error(box.error());
                return conn.end();
            }
            cout << box->messages.total << " messages in " << box->name << endl;

            std::vector<criterion> criteria{imapxx::imap::flag_key::unseen, criterion::subject("imapxx")};
            conn.search(criteria, [&conn, &status](imapxx::result<std::vector<std::uint32_t>> uids)
            {
                if (!uids)
                    print_error(uids.error());
                else
                {
                    for (auto uid : *uids)
                        cout << uid << endl;
                    status = EXIT_SUCCESS;
                }
                conn.end();
            });
        });
    });

    conn.connect();
    io_ctx.run();
    return status;
}
