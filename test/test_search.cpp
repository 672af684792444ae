/*

test_search.cpp
---------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE search_test

#include <chrono>
#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <imapxx/imap/search.hpp>

using namespace imapxx::imap;


static std::string render(const std::vector<criterion>& criteria, const compile_options& opts = {})
{
    auto compiled = compile(criteria, opts);
    BOOST_REQUIRE(compiled.has_value());
    return compiled->args.str();
}


BOOST_AUTO_TEST_CASE(conjunction)
{
    BOOST_TEST(render({criterion::from("a@b.com"), flag_key::unseen}) == "FROM \"a@b.com\" UNSEEN");
}

BOOST_AUTO_TEST_CASE(empty_criteria_rejected)
{
    auto compiled = compile({});
    BOOST_REQUIRE(!compiled.has_value());
    BOOST_TEST(compiled.error().code() == imapxx::error_code::invalid_criteria);
}

BOOST_AUTO_TEST_CASE(keys_with_arguments)
{
    using namespace std::chrono;
    BOOST_TEST(render({criterion::date(date_key::since, year{2024} / March / 5)}) == "SINCE 05-Mar-2024");
    BOOST_TEST(render({criterion::size(size_key::larger, 10000)}) == "LARGER 10000");
    BOOST_TEST(render({criterion::header("X-Mailer", "imapxx")}) == "HEADER \"X-Mailer\" \"imapxx\"");
    BOOST_TEST(render({criterion::uid(message_set{}.add_range(100, 0))}) == "UID 100:*");
    BOOST_TEST(render({criterion::sequence(message_set{1, 2})}) == "1,2");
    BOOST_TEST(render({criterion::string(string_key::keyword, "$Forwarded")}) == "KEYWORD $Forwarded");
}

BOOST_AUTO_TEST_CASE(invalid_arguments)
{
    using namespace std::chrono;
    BOOST_TEST(!compile({criterion::string(string_key::keyword, "two words")}).has_value());
    BOOST_TEST(!compile({criterion::date(date_key::on, year{2024} / February / 30)}).has_value());
    BOOST_TEST(!compile({criterion::header("", "x")}).has_value());
    BOOST_TEST(!compile({criterion::uid(message_set{})}).has_value());
    BOOST_TEST(!compile({criterion::from(std::string("a\0b", 3))}).has_value());
}

BOOST_AUTO_TEST_CASE(long_strings_become_literals)
{
    compile_options opts;
    opts.literal_threshold = 4;
    auto compiled = compile({criterion::subject("meeting notes")}, opts);
    BOOST_REQUIRE(compiled.has_value());
    BOOST_TEST(compiled->args.has_literal());
    BOOST_TEST(compiled->args.str() == "SUBJECT {13}\r\nmeeting notes");
    BOOST_TEST(!compiled->utf8);
}

BOOST_AUTO_TEST_CASE(non_ascii_needs_charset)
{
    auto compiled = compile({criterion::subject("R\xC3\xA9union")});
    BOOST_REQUIRE(compiled.has_value());
    BOOST_TEST(compiled->utf8);
    BOOST_TEST(compiled->args.has_literal());
}

BOOST_AUTO_TEST_CASE(or_and_not)
{
    BOOST_TEST(render({criterion::either(criterion::from("a"), criterion::from("b"))}) == "OR FROM \"a\" FROM \"b\"");
    BOOST_TEST(render({criterion::negate(flag_key::seen), flag_key::flagged}) == "NOT SEEN FLAGGED");
}

BOOST_AUTO_TEST_CASE(bang_negation)
{
    compile_options opts;
    opts.negation = negation_dialect::bang_prefix;
    BOOST_TEST(render({criterion::negate(criterion::from("x"))}, opts) == "!FROM \"x\"");
    BOOST_TEST(render({criterion::negate(criterion::either(criterion::from("a"), criterion::from("b")))}, opts)
        == "NOT OR FROM \"a\" FROM \"b\"");
    BOOST_TEST(render({criterion::negate(criterion::negate(flag_key::seen))}, opts) == "NOT !SEEN");
    BOOST_TEST(render({criterion::negate(criterion::sequence(message_set{1, 2}))}, opts) == "NOT 1,2");
}

BOOST_AUTO_TEST_CASE(gmail_keys)
{
    auto raw = compile({criterion::gmail_raw("has:attachment in:unread")});
    BOOST_REQUIRE(raw.has_value());
    BOOST_TEST(raw->gmail);
    BOOST_TEST(raw->args.str() == "X-GM-RAW \"has:attachment in:unread\"");

    auto thread = compile({criterion::extension("x-gm-thrid", "1266894439832287888")});
    BOOST_REQUIRE(thread.has_value());
    BOOST_TEST(thread->args.str() == "X-GM-THRID 1266894439832287888");

    auto plain = compile({flag_key::all});
    BOOST_TEST(!plain->gmail);
}

BOOST_AUTO_TEST_CASE(loose_form)
{
    auto parsed = parse_criteria({{"FROM", "a@b.com"}, {"UNSEEN"}, {"SINCE", "2024-03-05"}});
    BOOST_REQUIRE(parsed.has_value());
    BOOST_TEST(render(*parsed) == "FROM \"a@b.com\" UNSEEN SINCE 05-Mar-2024");

    auto ored = parse_criteria({{"OR", "SEEN", "!FLAGGED"}});
    BOOST_REQUIRE(ored.has_value());
    BOOST_TEST(render(*ored) == "OR SEEN NOT FLAGGED");

    auto with_set = parse_criteria({{"UID", "4:9"}, {"1:3"}});
    BOOST_REQUIRE(with_set.has_value());
    BOOST_TEST(render(*with_set) == "UID 4:9 1:3");
}

BOOST_AUTO_TEST_CASE(loose_form_errors)
{
    auto unknown = parse_criteria({{"SOMETIME"}});
    BOOST_REQUIRE(!unknown.has_value());
    BOOST_TEST(unknown.error().message() == "Unknown search key: SOMETIME");

    BOOST_TEST(!parse_criteria({{"FROM"}}).has_value());
    BOOST_TEST(!parse_criteria({{"LARGER", "big"}}).has_value());
    BOOST_TEST(!parse_criteria({{"OR", "SEEN"}}).has_value());
    BOOST_TEST(!parse_criteria({{}}).has_value());
    BOOST_TEST(!parse_criteria({}).has_value());
}

BOOST_AUTO_TEST_CASE(search_dates)
{
    using namespace std::chrono;
    auto rfc = parse_search_date("5-mar-2024");
    BOOST_REQUIRE(rfc.has_value());
    BOOST_TEST((*rfc == year{2024} / March / 5));

    auto iso = parse_search_date("2024-03-05");
    BOOST_REQUIRE(iso.has_value());
    BOOST_TEST((*iso == *rfc));

    BOOST_TEST(!parse_search_date("2024-13-01").has_value());
    BOOST_TEST(!parse_search_date("tomorrow").has_value());
}
