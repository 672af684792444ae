/*

test_tokenizer.cpp
------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE tokenizer_test

#include <string>
#include <boost/test/unit_test.hpp>
#include <imapxx/imap/tokenizer.hpp>

using imapxx::imap::line_kind;
using imapxx::imap::tokenizer;


BOOST_AUTO_TEST_CASE(classifies_lines)
{
    tokenizer tok;
    BOOST_REQUIRE(tok.feed("* OK ready\r\n+ go ahead\r\nA1 OK done\r\n* 3 EXISTS\r\n").has_value());

    auto greeting = tok.next();
    BOOST_REQUIRE(greeting.has_value());
    BOOST_TEST((greeting->kind == line_kind::untagged));
    BOOST_TEST(!greeting->numeric);
    BOOST_TEST(greeting->rest() == "OK ready");

    auto cont = tok.next();
    BOOST_REQUIRE(cont.has_value());
    BOOST_TEST((cont->kind == line_kind::continuation));

    auto tagged = tok.next();
    BOOST_REQUIRE(tagged.has_value());
    BOOST_TEST((tagged->kind == line_kind::tagged));
    BOOST_TEST(tagged->tag == "A1");

    auto exists = tok.next();
    BOOST_REQUIRE(exists.has_value());
    BOOST_TEST(exists->numeric);
    BOOST_TEST(!tok.next().has_value());
}

BOOST_AUTO_TEST_CASE(byte_at_a_time)
{
    tokenizer tok;
    const std::string stream = "* 1 FETCH (UID 7)\r\nA2 OK\r\n";
    for (char ch : stream)
        BOOST_REQUIRE(tok.feed(std::string_view(&ch, 1)).has_value());
    BOOST_TEST(tok.next().has_value());
    BOOST_TEST(tok.next()->tag == "A2");
}

BOOST_AUTO_TEST_CASE(literal_split_across_chunks)
{
    tokenizer tok;
    BOOST_REQUIRE(tok.feed("* 1 FETCH (UID 7 BODY[TEXT] {11}\r\nhello").has_value());
    BOOST_TEST(tok.in_literal());
    BOOST_TEST(!tok.has_line());
    BOOST_REQUIRE(tok.feed(" world)\r\n").has_value());

    auto line = tok.next();
    BOOST_REQUIRE(line.has_value());
    BOOST_REQUIRE(line->literals.size() == 1u);
    BOOST_REQUIRE(line->segments.size() == 2u);
    BOOST_TEST(line->literals[0] == "hello world");
    BOOST_TEST(line->segments[0] == "* 1 FETCH (UID 7 BODY[TEXT] {11}");
    BOOST_TEST(line->segments[1] == ")");
}

BOOST_AUTO_TEST_CASE(literal_with_line_breaks)
{
    tokenizer tok;
    BOOST_REQUIRE(tok.feed("* 2 FETCH (BODY[] {8}\r\na\r\nb\r\n\r\n)\r\n").has_value());
    auto line = tok.next();
    BOOST_REQUIRE(line.has_value());
    BOOST_TEST(line->literals[0] == "a\r\nb\r\n\r\n");
}

BOOST_AUTO_TEST_CASE(empty_literal)
{
    tokenizer tok;
    BOOST_REQUIRE(tok.feed("* LIST () \"/\" {0}\r\n\r\n").has_value());
    auto line = tok.next();
    BOOST_REQUIRE(line.has_value());
    BOOST_REQUIRE(line->literals.size() == 1u);
    BOOST_TEST(line->literals[0].empty());
    BOOST_TEST(line->segments[1].empty());
}

BOOST_AUTO_TEST_CASE(huge_literal_announcement)
{
    tokenizer tok;
    BOOST_REQUIRE(tok.feed("* 1 FETCH (BODY[] {4294967296}\r\n").has_value());
    BOOST_TEST(tok.in_literal());
    BOOST_REQUIRE(tok.feed("only a few bytes").has_value());
    BOOST_TEST(tok.in_literal());
    BOOST_TEST(!tok.has_line());

    tokenizer over;
    auto res = over.feed("* 1 FETCH (BODY[] {4294967297}\r\n");
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().code() == imapxx::error_code::parse_error);
    BOOST_TEST(!over.in_literal());
}

BOOST_AUTO_TEST_CASE(bare_newline_accepted)
{
    tokenizer tok;
    BOOST_REQUIRE(tok.feed("* OK hi\nA1 OK done\n").has_value());
    BOOST_TEST(tok.next()->rest() == "OK hi");
    BOOST_TEST(tok.next()->tag == "A1");
}

BOOST_AUTO_TEST_CASE(malformed_lines_poison_the_stream)
{
    tokenizer tok;
    auto res = tok.feed("A1 MAYBE later\r\n");
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().code() == imapxx::error_code::parse_error);
    BOOST_TEST(tok.failed());
    BOOST_TEST(!tok.feed("* OK\r\n").has_value());

    tok.reset();
    BOOST_TEST(tok.feed("* OK\r\n").has_value());
    BOOST_TEST(tok.has_line());
}

BOOST_AUTO_TEST_CASE(line_length_limit)
{
    tokenizer tok(16);
    auto res = tok.feed("* OK this line is far too long");
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().code() == imapxx::error_code::line_too_long);
}

BOOST_AUTO_TEST_CASE(render_for_logging)
{
    tokenizer tok;
    BOOST_REQUIRE(tok.feed("* 1 FETCH (BODY[] {2}\r\nhi)\r\n").has_value());
    BOOST_TEST(tok.next()->str() == "* 1 FETCH (BODY[] {2}\r\nhi)");
}
