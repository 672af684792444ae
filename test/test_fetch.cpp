/*

test_fetch.cpp
--------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE fetch_test

#include <string>
#include <boost/test/unit_test.hpp>
#include <imapxx/imap/fetch.hpp>
#include <imapxx/imap/tokenizer.hpp>

using namespace imapxx::imap;


static untagged_response untagged(std::string_view text)
{
    tokenizer tok;
    BOOST_REQUIRE(tok.feed(text).has_value());
    auto line = tok.next();
    BOOST_REQUIRE(line.has_value());
    auto resp = parse_untagged(*line);
    BOOST_REQUIRE(resp.has_value());
    return std::move(*resp);
}


BOOST_AUTO_TEST_CASE(default_items)
{
    auto compiled = compile_fetch({});
    BOOST_REQUIRE(compiled.has_value());
    BOOST_TEST(compiled->items.str() == "(UID FLAGS INTERNALDATE)");
    BOOST_TEST(compiled->modifiers.empty());
    BOOST_TEST(!compiled->gmail);
}

BOOST_AUTO_TEST_CASE(bodies_peek_unless_marking_seen)
{
    fetch_options opts;
    opts.size = true;
    opts.bodies = {"HEADER.FIELDS (FROM TO)", "TEXT"};
    auto peek = compile_fetch(opts);
    BOOST_REQUIRE(peek.has_value());
    BOOST_TEST(peek->items.str() == "(UID FLAGS INTERNALDATE RFC822.SIZE BODY.PEEK[HEADER.FIELDS (FROM TO)] BODY.PEEK[TEXT])");

    opts.mark_seen = true;
    opts.size = false;
    opts.bodies = {""};
    auto seen = compile_fetch(opts);
    BOOST_REQUIRE(seen.has_value());
    BOOST_TEST(seen->items.str() == "(UID FLAGS INTERNALDATE BODY[])");
}

BOOST_AUTO_TEST_CASE(extensions_and_modifiers)
{
    fetch_options opts;
    opts.structure = true;
    opts.extensions = {"x-gm-labels", "MODSEQ"};
    opts.modifiers = {"CHANGEDSINCE 12345"};
    auto compiled = compile_fetch(opts);
    BOOST_REQUIRE(compiled.has_value());
    BOOST_TEST(compiled->items.str() == "(UID FLAGS INTERNALDATE BODYSTRUCTURE X-GM-LABELS MODSEQ)");
    BOOST_TEST(compiled->modifiers.str() == "(CHANGEDSINCE 12345)");
    BOOST_TEST(compiled->gmail);
    BOOST_TEST(compiled->condstore);
}

BOOST_AUTO_TEST_CASE(invalid_items)
{
    fetch_options section;
    section.bodies = {"TEXT]"};
    BOOST_TEST(!compile_fetch(section).has_value());

    fetch_options ext;
    ext.extensions = {"BAD ITEM"};
    BOOST_TEST(!compile_fetch(ext).has_value());

    fetch_options modifier;
    modifier.modifiers = {"CHANGEDSINCE 1\r\nA9 LOGOUT"};
    BOOST_TEST(!compile_fetch(modifier).has_value());
}

BOOST_AUTO_TEST_CASE(interpret_fetch)
{
    auto resp = untagged("* 12 FETCH (UID 101 FLAGS (\\Seen $Work) INTERNALDATE \"17-Jul-1996 02:44:25 -0700\" "
        "RFC822.SIZE 4286 BODY[TEXT] {5}\r\nhello X-GM-THRID 99 X-GM-LABELS (\\Inbox \"My Label\") MODSEQ (624140003) X-CUSTOM 1)\r\n");
    auto fetched = fetched_from(resp);
    BOOST_REQUIRE(fetched.has_value());

    const auto& attrs = fetched->attributes;
    BOOST_TEST(attrs.uid == 101u);
    BOOST_TEST(attrs.seqno == 12u);
    BOOST_REQUIRE(attrs.flags.size() == 2u);
    BOOST_TEST(attrs.flags[1] == "$Work");
    BOOST_TEST(attrs.date.has_value());
    BOOST_TEST(*attrs.size == 4286u);
    BOOST_TEST(*attrs.x_gm_thrid == 99u);
    BOOST_REQUIRE(attrs.x_gm_labels.size() == 2u);
    BOOST_TEST(attrs.x_gm_labels[1] == "My Label");
    BOOST_TEST(*attrs.modseq == 624140003u);
    BOOST_TEST(attrs.extensions.count("X-CUSTOM") == 1u);

    BOOST_REQUIRE(fetched->bodies.size() == 1u);
    BOOST_TEST(fetched->bodies[0].first.which == "TEXT");
    BOOST_TEST(fetched->bodies[0].first.size == 5u);
    BOOST_TEST(fetched->bodies[0].first.seqno == 12u);
    BOOST_TEST(fetched->bodies[0].second == "hello");
}

BOOST_AUTO_TEST_CASE(header_fields_section)
{
    auto resp = untagged("* 3 FETCH (BODY[HEADER.FIELDS (FROM)] \"From: a@b.com\" UID 9)\r\n");
    auto fetched = fetched_from(resp);
    BOOST_REQUIRE(fetched.has_value());
    BOOST_REQUIRE(fetched->bodies.size() == 1u);
    BOOST_TEST(fetched->bodies[0].first.which == "HEADER.FIELDS (FROM)");
    BOOST_TEST(fetched->attributes.uid == 9u);
}

BOOST_AUTO_TEST_CASE(malformed_fetch)
{
    BOOST_TEST(!fetched_from(untagged("* 3 FETCH (UID)\r\n")).has_value());
    BOOST_TEST(!fetched_from(untagged("* 3 FETCH (UID abc)\r\n")).has_value());
    BOOST_TEST(!fetched_from(untagged("* 3 EXISTS\r\n")).has_value());
}
