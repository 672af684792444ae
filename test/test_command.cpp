/*

test_command.cpp
----------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE command_test

#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <imapxx/imap/command.hpp>

using imapxx::imap::command_line;
using imapxx::imap::command_part;


BOOST_AUTO_TEST_CASE(atoms_and_lists)
{
    command_line cmd("uid");
    cmd.atom("FETCH").atom("1:*").open_list().atom("UID").atom("FLAGS").close_list();
    BOOST_TEST(cmd.str() == "uid FETCH 1:* (UID FLAGS)");
    BOOST_TEST(cmd.verb() == "UID");
    BOOST_TEST(!cmd.has_literal());
}

BOOST_AUTO_TEST_CASE(quoting)
{
    command_line cmd("LOGIN");
    cmd.quoted("user").quoted("pa\"ss\\word");
    BOOST_TEST(cmd.str() == "LOGIN \"user\" \"pa\\\"ss\\\\word\"");
}

BOOST_AUTO_TEST_CASE(string_switches_to_literal)
{
    command_line cmd("SEARCH");
    cmd.atom("SUBJECT").string("short", 8).atom("BODY").string("rather long text", 8);
    BOOST_TEST(cmd.has_literal());
    BOOST_TEST(cmd.str() == "SEARCH SUBJECT \"short\" BODY {16}\r\nrather long text");

    const auto& parts = cmd.parts();
    BOOST_REQUIRE(parts.size() == 2u);
    BOOST_TEST((parts[1].type == command_part::kind::literal));
}

BOOST_AUTO_TEST_CASE(eight_bit_needs_literal)
{
    BOOST_TEST(command_line::needs_literal("caf\xC3\xA9", 1024));
    BOOST_TEST(command_line::needs_literal("line\r\nbreak", 1024));
    BOOST_TEST(!command_line::needs_literal("plain text", 1024));
    BOOST_TEST(command_line::needs_literal("plain text", 4));
}

BOOST_AUTO_TEST_CASE(text_after_literal)
{
    command_line cmd("APPEND");
    cmd.atom("INBOX").literal("body").atom("EXTRA");
    BOOST_TEST(cmd.str() == "APPEND INBOX {4}\r\nbody EXTRA");
    BOOST_TEST(cmd.parts().size() == 3u);
}

BOOST_AUTO_TEST_CASE(append_other_line)
{
    command_line args;
    args.atom("FROM").literal("x\xC3\xA9").atom("UNSEEN");
    command_line cmd("UID SEARCH");
    cmd.atom("CHARSET UTF-8").append(args);
    BOOST_TEST(cmd.str() == "UID SEARCH CHARSET UTF-8 FROM {3}\r\nx\xC3\xA9 UNSEEN");
}

BOOST_AUTO_TEST_CASE(mailbox_arguments)
{
    command_line cmd("SELECT");
    BOOST_REQUIRE(imapxx::imap::append_mailbox(cmd, "Entw\xC3\xBC" "rfe", 1024).has_value());
    BOOST_TEST(cmd.str() == "SELECT \"Entw&APw-rfe\"");

    command_line bad("SELECT");
    auto res = imapxx::imap::append_mailbox(bad, "INBOX\r\nA2 LOGOUT", 1024);
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().code() == imapxx::error_code::invalid_argument);
}

BOOST_AUTO_TEST_CASE(flag_lists)
{
    command_line cmd("STORE");
    BOOST_REQUIRE(imapxx::imap::append_flag_list(cmd, {"\\Seen", "$Label1"}).has_value());
    BOOST_TEST(cmd.str() == "STORE (\\Seen $Label1)");

    command_line empty("STORE");
    BOOST_REQUIRE(imapxx::imap::append_flag_list(empty, {}).has_value());
    BOOST_TEST(empty.str() == "STORE ()");

    command_line bad("STORE");
    BOOST_TEST(!imapxx::imap::append_flag_list(bad, {"two words"}).has_value());
}
