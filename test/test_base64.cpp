/*

test_base64.cpp
---------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE base64_test

#include <string>
#include <boost/test/unit_test.hpp>
#include <imapxx/codec/base64.hpp>

using imapxx::base64;


BOOST_AUTO_TEST_CASE(encode_pads_to_quads)
{
    BOOST_TEST(base64::encode("") == "");
    BOOST_TEST(base64::encode("t") == "dA==");
    BOOST_TEST(base64::encode("te") == "dGU=");
    BOOST_TEST(base64::encode("tes") == "dGVz");
    BOOST_TEST(base64::encode("test") == "dGVzdA==");
}

BOOST_AUTO_TEST_CASE(encode_never_wraps)
{
    const std::string text(300, 'x');
    const auto enc = base64::encode(text);
    BOOST_TEST(enc.size() == 400u);
    BOOST_TEST(enc.find('\n') == std::string::npos);
}

BOOST_AUTO_TEST_CASE(decode_with_and_without_padding)
{
    auto padded = base64::decode("dGVzdA==");
    BOOST_REQUIRE(padded.has_value());
    BOOST_TEST(*padded == "test");

    auto bare = base64::decode("dGVzdA");
    BOOST_REQUIRE(bare.has_value());
    BOOST_TEST(*bare == "test");
}

BOOST_AUTO_TEST_CASE(decode_binary)
{
    const std::string plain("\0user\0pass", 10);
    auto dec = base64::decode(base64::encode(plain));
    BOOST_REQUIRE(dec.has_value());
    BOOST_TEST(dec->size() == 10u);
    BOOST_TEST(*dec == plain);
}

BOOST_AUTO_TEST_CASE(decode_rejects_bad_input)
{
    auto bad = base64::decode("dGV*dA==");
    BOOST_REQUIRE(!bad.has_value());
    BOOST_TEST(bad.error().code() == imapxx::error_code::invalid_argument);

    auto truncated = base64::decode("dGVzd");
    BOOST_REQUIRE(!truncated.has_value());
    BOOST_TEST(truncated.error().message() == "Truncated base64 input.");
}
