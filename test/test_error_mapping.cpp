/*

test_error_mapping.cpp
----------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE error_mapping_test

#include <string>
#include <boost/test/unit_test.hpp>
#include <imapxx/net/error_mapping.hpp>

using imapxx::error_code;
using imapxx::net::io_stage;


BOOST_AUTO_TEST_CASE(net_error_mapping)
{
    BOOST_TEST(imapxx::net::map_net_error(
        io_stage::read,
        imapxx::asio::error::operation_aborted,
        true) == error_code::socket_timeout);

    BOOST_TEST(imapxx::net::map_net_error(
        io_stage::connect,
        imapxx::asio::error::operation_aborted,
        true) == error_code::connection_timeout);

    BOOST_TEST(imapxx::net::map_net_error(
        io_stage::read,
        imapxx::asio::error::eof,
        false) == error_code::connection_closed);

    BOOST_TEST(imapxx::net::map_net_error(
        io_stage::connect,
        imapxx::asio::error::connection_refused,
        false) == error_code::connection_failed);

    BOOST_TEST(imapxx::net::map_net_error(
        io_stage::resolve,
        imapxx::asio::error::host_not_found,
        false) == error_code::dns_resolution_failed);

    BOOST_TEST(imapxx::net::map_net_error(
        io_stage::handshake,
        imapxx::asio::error::operation_not_supported,
        false) == error_code::tls_handshake_failed);

    BOOST_TEST(imapxx::net::map_net_error(
        io_stage::write,
        imapxx::asio::error::broken_pipe,
        false) == error_code::connection_closed);
}

BOOST_AUTO_TEST_CASE(orderly_close)
{
    BOOST_TEST(imapxx::net::is_orderly_close(imapxx::asio::error::eof));
    BOOST_TEST(!imapxx::net::is_orderly_close(imapxx::asio::error::connection_reset));
}

BOOST_AUTO_TEST_CASE(net_error_detail)
{
    const auto err = imapxx::net::make_net_error(io_stage::connect, "async_connect",
        imapxx::asio::error::connection_refused, false, "imap.example.com", "993");
    BOOST_TEST(err.code() == error_code::connection_failed);
    BOOST_TEST(err.is_fatal());
    BOOST_TEST(err.message().find("Connection failed: ") == 0u);

    const auto& detail = err.server_response();
    BOOST_TEST(detail.find("proto=imap\n") != std::string::npos);
    BOOST_TEST(detail.find("host=imap.example.com\n") != std::string::npos);
    BOOST_TEST(detail.find("service=993\n") != std::string::npos);
    BOOST_TEST(detail.find("stage=connect\n") != std::string::npos);
    BOOST_TEST(detail.find("op=async_connect\n") != std::string::npos);
    BOOST_TEST(detail.find("asio.value=") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(timeout_message_has_no_asio_text)
{
    const auto err = imapxx::net::make_net_error(io_stage::connect, "async_connect",
        imapxx::asio::error::operation_aborted, true, "imap.example.com", "143");
    BOOST_TEST(err.code() == error_code::connection_timeout);
    BOOST_TEST(err.message() == "Connection timeout");
}

BOOST_AUTO_TEST_CASE(detail_block)
{
    imapxx::detail::error_detail detail;
    BOOST_TEST(detail.empty());
    detail.add("host", "h").add("port", 993);
    BOOST_TEST(detail.str() == "host=h\nport=993\n");
    detail.add("reason", "line one\r\nline two");
    BOOST_TEST(detail.str() == "host=h\nport=993\nreason=line one  line two\n");
}
