/*

test_dispatcher.cpp
-------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE dispatcher_test

#include <stdexcept>
#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <imapxx/imap/dispatcher.hpp>

using namespace imapxx::imap;


static event make_event(event_kind kind)
{
    event ev;
    ev.kind = kind;
    return ev;
}


BOOST_AUTO_TEST_CASE(delivery_in_registration_order)
{
    dispatcher d;
    std::vector<int> calls;
    d.on(event_kind::mail, [&calls](const event&) { calls.push_back(1); });
    d.on(event_kind::mail, [&calls](const event&) { calls.push_back(2); });
    d.on(event_kind::expunge, [&calls](const event&) { calls.push_back(3); });

    event ev = make_event(event_kind::mail);
    ev.number = 4;
    BOOST_TEST(d.emit(ev));
    BOOST_TEST(calls == (std::vector<int>{1, 2}), boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(lifecycle_events_fire_once)
{
    dispatcher d;
    int closes = 0;
    d.on(event_kind::close, [&closes](const event&) { ++closes; });

    BOOST_TEST(d.emit(make_event(event_kind::close)));
    BOOST_TEST(!d.emit(make_event(event_kind::close)));
    BOOST_TEST(closes == 1);
    BOOST_TEST(d.fired(event_kind::close));

    BOOST_TEST(d.emit(make_event(event_kind::mail)));
    BOOST_TEST(d.emit(make_event(event_kind::mail)));

    d.rearm();
    BOOST_TEST(!d.fired(event_kind::close));
    BOOST_TEST(d.emit(make_event(event_kind::close)));
    BOOST_TEST(closes == 2);
}

BOOST_AUTO_TEST_CASE(throwing_observer_is_isolated)
{
    auto& logger = imapxx::log::logger::instance();
    std::vector<std::string> logged;
    logger.set_sink([&logged](const imapxx::log::entry& e) { logged.push_back(e.text); });

    dispatcher d;
    bool second_called = false;
    d.on(event_kind::alert, [](const event&) { throw std::runtime_error("boom"); });
    d.on(event_kind::alert, [&second_called](const event&) { second_called = true; });

    event ev = make_event(event_kind::alert);
    ev.message = "Disk full";
    BOOST_TEST(d.emit(ev));
    BOOST_TEST(second_called);
    BOOST_REQUIRE(logged.size() == 1u);
    BOOST_TEST(logged[0] == "Observer of 'alert' threw: boom");

    bool after_int_called = false;
    d.on(event_kind::mail, [](const event&) { throw 42; });
    d.on(event_kind::mail, [&after_int_called](const event&) { after_int_called = true; });
    BOOST_TEST(d.emit(make_event(event_kind::mail)));
    BOOST_TEST(after_int_called);
    BOOST_REQUIRE(logged.size() == 2u);
    BOOST_TEST(logged[1] == "Observer of 'mail' threw an unknown exception");

    logger.clear_sink();
}

BOOST_AUTO_TEST_CASE(unsubscribe)
{
    dispatcher d;
    int count = 0;
    const auto id = d.on(event_kind::update, [&count](const event&) { ++count; });
    BOOST_TEST(d.size() == 1u);
    BOOST_TEST(d.off(id));
    BOOST_TEST(!d.off(id));
    d.emit(make_event(event_kind::update));
    BOOST_TEST(count == 0);
}

BOOST_AUTO_TEST_CASE(observer_removing_itself)
{
    dispatcher d;
    int count = 0;
    dispatcher::observer_id id = 0;
    id = d.on(event_kind::mail, [&](const event&)
    {
        ++count;
        d.off(id);
    });
    d.emit(make_event(event_kind::mail));
    d.emit(make_event(event_kind::mail));
    BOOST_TEST(count == 1);
    BOOST_TEST(d.size() == 0u);
}

BOOST_AUTO_TEST_CASE(kind_names)
{
    BOOST_TEST(to_string(event_kind::uidvalidity) == "uidvalidity");
    BOOST_TEST(to_string(event_kind::ready) == "ready");
}
