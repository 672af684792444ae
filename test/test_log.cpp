/*

test_log.cpp
------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE log_test

#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <imapxx/detail/log.hpp>

using imapxx::log::level;
using imapxx::log::logger;


struct log_capture
{
    log_capture()
        : saved_level(logger::instance().get_level())
    {
        logger::instance().set_sink([this](const imapxx::log::entry& e) { entries.push_back(e); });
    }

    ~log_capture()
    {
        logger::instance().clear_sink();
        logger::instance().set_level(saved_level);
        logger::instance().set_trace_enabled(false);
    }

    level saved_level;
    std::vector<imapxx::log::entry> entries;
};


BOOST_FIXTURE_TEST_CASE(level_filtering, log_capture)
{
    logger::instance().set_level(level::warn);
    IMAPXX_DEBUG("hidden");
    IMAPXX_INFO("hidden too");
    IMAPXX_WARN("shown");
    IMAPXX_ERROR("also shown");

    BOOST_REQUIRE(entries.size() == 2u);
    BOOST_TEST(entries[0].text == "shown");
    BOOST_TEST((entries[0].lvl == level::warn));
    BOOST_TEST(entries[1].text == "also shown");
    BOOST_TEST(!entries[1].traffic.has_value());
}

BOOST_FIXTURE_TEST_CASE(level_off_silences, log_capture)
{
    logger::instance().set_level(level::off);
    IMAPXX_ERROR("nothing");
    BOOST_TEST(entries.empty());
    BOOST_TEST(!logger::instance().is_enabled(level::fatal));
}

BOOST_FIXTURE_TEST_CASE(source_location_recorded, log_capture)
{
    logger::instance().set_level(level::debug);
    IMAPXX_DEBUG("here");
    BOOST_REQUIRE(entries.size() == 1u);
    BOOST_TEST(std::string(entries[0].location.file_name()).find("test_log") != std::string::npos);
    BOOST_TEST(entries[0].location.line() > 0u);
}

BOOST_FIXTURE_TEST_CASE(protocol_trace_needs_opt_in, log_capture)
{
    IMAPXX_TRACE_SEND("imap", "A1 NOOP\r\n");
    BOOST_TEST(entries.empty());

    logger::instance().set_trace_enabled(true);
    IMAPXX_TRACE_SEND("imap", "A1 NOOP\r\n");
    IMAPXX_TRACE_RECV("imap", "A1 OK done\r\n");
    BOOST_REQUIRE(entries.size() == 2u);
    BOOST_REQUIRE(entries[0].traffic.has_value());
    BOOST_TEST((*entries[0].traffic == imapxx::log::direction::send));
    BOOST_TEST(entries[0].channel == "imap");
    BOOST_TEST(entries[0].text == "A1 NOOP\r\n");
    BOOST_TEST((entries[0].lvl == level::trace));
    BOOST_TEST((*entries[1].traffic == imapxx::log::direction::receive));
}

BOOST_AUTO_TEST_CASE(level_names)
{
    BOOST_TEST(imapxx::log::level_to_string(level::trace) == "TRACE");
    BOOST_TEST(imapxx::log::level_to_string(level::warn) == "WARN");
    BOOST_TEST(imapxx::log::level_to_string(level::off) == "OFF");
}

BOOST_AUTO_TEST_CASE(level_parsing)
{
    BOOST_TEST((imapxx::log::parse_level("debug") == level::debug));
    BOOST_TEST((imapxx::log::parse_level("WARN") == level::warn));
    BOOST_TEST((imapxx::log::parse_level("Warning") == level::warn));
    BOOST_TEST((imapxx::log::parse_level("off") == level::off));
    BOOST_TEST(!imapxx::log::parse_level("loud").has_value());
    BOOST_TEST(!imapxx::log::parse_level("").has_value());
}
