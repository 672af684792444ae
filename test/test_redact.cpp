/*

test_redact.cpp
---------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE redact_test

#include <boost/test/unit_test.hpp>
#include <imapxx/detail/redact.hpp>


BOOST_AUTO_TEST_CASE(redact_login)
{
    BOOST_TEST(imapxx::detail::redact_line("A1 LOGIN user pass\r\n") == "A1 LOGIN user <redacted>\r\n");
    BOOST_TEST(imapxx::detail::redact_line("A1 login \"user\" \"p w\"\r\n") == "A1 login \"user\" <redacted>\r\n");
}

BOOST_AUTO_TEST_CASE(redact_login_keeps_quoted_user)
{
    BOOST_TEST(imapxx::detail::redact_line("A4 LOGIN \"john doe\" secret\r\n") == "A4 LOGIN \"john doe\" <redacted>\r\n");
    BOOST_TEST(imapxx::detail::redact_line("A5 LOGIN \"a\\\"b\" pw\r\n") == "A5 LOGIN \"a\\\"b\" <redacted>\r\n");
}

BOOST_AUTO_TEST_CASE(redact_authenticate)
{
    BOOST_TEST(imapxx::detail::redact_line("A2 AUTHENTICATE XOAUTH2 dXNlcj1hQGIuY29tAWF1dGg9\r\n")
        == "A2 AUTHENTICATE XOAUTH2 <redacted>\r\n");
    BOOST_TEST(imapxx::detail::redact_line("A2 AUTHENTICATE XOAUTH2\r\n") == "A2 AUTHENTICATE XOAUTH2\r\n");
}

BOOST_AUTO_TEST_CASE(redact_continuation_payload)
{
    BOOST_TEST(imapxx::detail::redact_line("dXNlcj1hQGIuY29tAWF1dGg9\r\n") == "<redacted>\r\n");
    BOOST_TEST(imapxx::detail::redact_line("DONE\r\n") == "DONE\r\n");
}

BOOST_AUTO_TEST_CASE(other_commands_unchanged)
{
    BOOST_TEST(imapxx::detail::redact_line("A3 SELECT INBOX\r\n") == "A3 SELECT INBOX\r\n");
    BOOST_TEST(imapxx::detail::redact_line("") == "");
}
