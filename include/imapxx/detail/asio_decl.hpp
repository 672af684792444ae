/*

asio_decl.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

`imapxx::asio` names the Asio flavour the transport is built on: Boost.Asio by
default, standalone Asio with IMAPXX_USE_STANDALONE_ASIO. Only completion
handlers are used, no coroutines.

*/

#pragma once

#if defined(IMAPXX_USE_STANDALONE_ASIO)

#include <system_error>
#include <asio/version.hpp>
#if ASIO_VERSION < 101200
#error "imapxx needs Asio 1.12.0 or later"
#endif
#include <asio.hpp>
#include <asio/ssl.hpp>

namespace imapxx::asio
{
    using namespace ::asio;
    using tcp = ::asio::ip::tcp;
    using error_code = std::error_code;
} // namespace imapxx::asio

#else

#include <boost/asio/version.hpp>
#if BOOST_ASIO_VERSION < 101200
#error "imapxx needs Boost.Asio 1.12.0 (Boost 1.66) or later"
#endif
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/system/error_code.hpp>

namespace imapxx::asio
{
    using namespace boost::asio;
    using tcp = boost::asio::ip::tcp;
    using error_code = boost::system::error_code;
} // namespace imapxx::asio

#endif
