/*

test_types.cpp
--------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE types_test

#include <boost/test/unit_test.hpp>
#include <imapxx/imap/types.hpp>

using imapxx::imap::message_set;


BOOST_AUTO_TEST_CASE(message_set_wire_form)
{
    message_set set{101, 102};
    set.add_range(200, 210).add_range(300, 0);
    auto str = set.str();
    BOOST_REQUIRE(str.has_value());
    BOOST_TEST(*str == "101,102,200:210,300:*");
}

BOOST_AUTO_TEST_CASE(message_set_parse)
{
    auto set = message_set::parse("1,4:7,9:*");
    BOOST_REQUIRE(set.has_value());
    BOOST_TEST(*set->str() == "1,4:7,9:*");

    BOOST_TEST(message_set::parse("*").has_value());
    BOOST_TEST(!message_set::parse("").has_value());
    BOOST_TEST(!message_set::parse("0").has_value());
    BOOST_TEST(!message_set::parse("1,").has_value());
    BOOST_TEST(!message_set::parse("a:b").has_value());
}

BOOST_AUTO_TEST_CASE(zero_is_not_a_message_number)
{
    auto zero = message_set(0u).str();
    BOOST_REQUIRE(!zero.has_value());
    BOOST_TEST(zero.error().code() == imapxx::error_code::invalid_argument);
    BOOST_TEST(zero.error().message() == "Invalid message identifier: 0");

    message_set range;
    range.add_range(0, 5);
    BOOST_TEST(!range.str().has_value());

    message_set mixed{7, 0};
    BOOST_TEST(!mixed.str().has_value());
}

BOOST_AUTO_TEST_CASE(empty_set_has_no_wire_form)
{
    message_set set;
    BOOST_TEST(set.empty());
    auto str = set.str();
    BOOST_REQUIRE(!str.has_value());
    BOOST_TEST(str.error().code() == imapxx::error_code::invalid_argument);
}

BOOST_AUTO_TEST_CASE(failed_add_keeps_set)
{
    message_set set{5};
    BOOST_TEST(!set.add("6,x").has_value());
    BOOST_TEST(*set.str() == "5");
}

BOOST_AUTO_TEST_CASE(flag_normalization)
{
    using imapxx::imap::normalize_flag;
    BOOST_TEST(normalize_flag("Seen") == "\\Seen");
    BOOST_TEST(normalize_flag("\\seen") == "\\Seen");
    BOOST_TEST(normalize_flag("DELETED") == "\\Deleted");
    BOOST_TEST(normalize_flag("$Forwarded") == "$Forwarded");
    BOOST_TEST(imapxx::imap::is_system_flag("\\flagged"));
    BOOST_TEST(!imapxx::imap::is_system_flag("Flagged"));
}

BOOST_AUTO_TEST_CASE(status_words)
{
    using imapxx::imap::parse_status;
    using imapxx::imap::status;
    BOOST_TEST((parse_status("ok") == status::ok));
    BOOST_TEST((parse_status("PREAUTH") == status::preauth));
    BOOST_TEST((parse_status("MAYBE") == status::unknown));
}

BOOST_AUTO_TEST_CASE(error_formatting)
{
    imapxx::error err(imapxx::error_code::imap_no, "Mailbox does not exist", "[NONEXISTENT] Mailbox does not exist");
    BOOST_TEST(err.to_string() == "[400] Mailbox does not exist: [NONEXISTENT] Mailbox does not exist");
    BOOST_TEST(!err.is_fatal());
    BOOST_TEST(imapxx::is_fatal(imapxx::error_code::unknown_tag));
    BOOST_TEST(imapxx::is_fatal(imapxx::error_code::auth_timeout));
    BOOST_TEST(!imapxx::is_fatal(imapxx::error_code::cancelled));
}
