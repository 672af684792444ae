/*

asio_transport.hpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

TCP transport over Boost.Asio, with optional implicit TLS through OpenSSL.

*/

#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <openssl/ssl.h>

#include <imapxx/detail/asio_decl.hpp>
#include <imapxx/detail/log.hpp>
#include <imapxx/imap/options.hpp>
#include <imapxx/net/error_mapping.hpp>
#include <imapxx/net/transport.hpp>

namespace imapxx::net
{

struct asio_settings
{
    std::string host;
    std::string service = "143";
    bool tls = false;
    /// Check the certificate chain against the default verify paths and the host name.
    bool verify_peer = true;
    std::chrono::milliseconds connect_timeout{10000};
    /// Idle socket; 0 disables.
    std::chrono::milliseconds socket_timeout{0};

    [[nodiscard]] static asio_settings from(const imap::options& opts)
    {
        asio_settings s;
        s.host = opts.host;
        s.service = std::to_string(opts.port);
        s.tls = opts.tls;
        s.connect_timeout = opts.timeouts.connect;
        s.socket_timeout = opts.timeouts.socket;
        return s;
    }
};

/**
Transport running on a caller-owned `io_context`.

All handlers are invoked from the context's thread. Pending operations keep
the shared state alive; `close()` drops the handlers so nothing is reported
afterwards.
**/
class asio_transport : public transport
{
public:
    asio_transport(asio::io_context& ioc, asio_settings settings)
        : ioc_(ioc), settings_(std::move(settings))
    {
    }

    ~asio_transport() override
    {
        close();
    }

    asio_transport(const asio_transport&) = delete;
    asio_transport& operator=(const asio_transport&) = delete;

    /// Every start uses a fresh socket, so a closed transport can connect again.
    void start(handlers h) override
    {
        close();
        state_ = std::make_shared<state>(ioc_, settings_);
        state_->handlers_ = std::move(h);
        state::start(state_);
    }

    void write(std::string bytes) override
    {
        if (state_)
            state::write(state_, std::move(bytes));
    }

    void close() override
    {
        if (state_)
            state_->shutdown();
    }

    timer_id schedule(std::chrono::milliseconds delay, std::function<void()> fn) override
    {
        if (!state_)
            return 0;
        return state::schedule(state_, delay, std::move(fn));
    }

    void cancel(timer_id id) override
    {
        if (state_)
            state_->cancel_timer(id);
    }

    [[nodiscard]] const asio_settings& settings() const noexcept
    {
        return settings_;
    }

private:
    struct state : std::enable_shared_from_this<state>
    {
        state(asio::io_context& ioc, asio_settings s)
            : ioc_(ioc),
              settings_(std::move(s)),
              resolver_(ioc),
              ssl_ctx_(asio::ssl::context::tls_client),
              stream_(ioc, ssl_ctx_),
              connect_timer_(ioc),
              idle_timer_(ioc)
        {
        }

        static void start(const std::shared_ptr<state>& self)
        {
            if (self->settings_.tls)
            {
                asio::error_code ec;
                self->ssl_ctx_.set_default_verify_paths(ec);
                if (ec)
                    IMAPXX_WARN("Failed to load the default certificate verify paths.");
                if (self->settings_.verify_peer)
                {
                    self->stream_.set_verify_mode(asio::ssl::verify_peer);
                    self->stream_.set_verify_callback(asio::ssl::host_name_verification(self->settings_.host));
                }
                // SNI
                if (SSL_set_tlsext_host_name(self->stream_.native_handle(), self->settings_.host.c_str()) != 1)
                    IMAPXX_WARN("Failed to set the TLS server name.");
            }

            if (self->settings_.connect_timeout.count() > 0)
            {
                self->connect_timer_.expires_after(self->settings_.connect_timeout);
                self->connect_timer_.async_wait([self](const asio::error_code& ec)
                {
                    if (ec || self->connected_ || self->closed_)
                        return;
                    self->connect_timed_out_ = true;
                    self->resolver_.cancel();
                    asio::error_code ignored;
                    self->stream_.next_layer().close(ignored);
                });
            }

            self->resolver_.async_resolve(self->settings_.host, self->settings_.service,
                [self](const asio::error_code& ec, asio::tcp::resolver::results_type results)
                {
                    if (self->closed_)
                        return;
                    if (ec)
                    {
                        self->fail(io_stage::resolve, "async_resolve", ec);
                        return;
                    }
                    asio::async_connect(self->stream_.next_layer(), results,
                        [self](const asio::error_code& ec, const asio::tcp::endpoint&)
                        {
                            if (self->closed_)
                                return;
                            if (ec)
                            {
                                self->fail(io_stage::connect, "async_connect", ec);
                                return;
                            }
                            if (self->settings_.tls)
                                handshake(self);
                            else
                                connected(self);
                        });
                });
        }

        static void handshake(const std::shared_ptr<state>& self)
        {
            self->stream_.async_handshake(asio::ssl::stream_base::client,
                [self](const asio::error_code& ec)
                {
                    if (self->closed_)
                        return;
                    if (ec)
                    {
                        self->fail(io_stage::handshake, "async_handshake", ec);
                        return;
                    }
                    connected(self);
                });
        }

        static void connected(const std::shared_ptr<state>& self)
        {
            if (self->connect_timed_out_)
            {
                self->fail(io_stage::connect, "async_connect", asio::error::timed_out);
                return;
            }
            self->connected_ = true;
            self->connect_timer_.cancel();
            self->touch();
            auto on_connect = self->handlers_.on_connect;
            if (on_connect)
                on_connect();
            if (self->closed_)
                return;
            read(self);
            flush(self);
        }

        static void read(const std::shared_ptr<state>& self)
        {
            auto on_read = [self](const asio::error_code& ec, std::size_t n)
            {
                if (self->closed_)
                    return;
                if (ec)
                {
                    if (is_orderly_close(ec))
                        self->remote_closed();
                    else
                        self->fail(io_stage::read, "async_read_some", ec);
                    return;
                }
                self->touch();
                // The receiver may close or destroy the transport from inside the handler.
                auto on_data = self->handlers_.on_data;
                if (on_data)
                    on_data(std::string_view(self->buffer_.data(), n));
                if (!self->closed_)
                    read(self);
            };
            if (self->settings_.tls)
                self->stream_.async_read_some(asio::buffer(self->buffer_), std::move(on_read));
            else
                self->stream_.next_layer().async_read_some(asio::buffer(self->buffer_), std::move(on_read));
        }

        static void write(const std::shared_ptr<state>& self, std::string bytes)
        {
            if (self->closed_)
                return;
            self->outbox_.push_back(std::move(bytes));
            if (self->connected_ && !self->writing_)
                flush(self);
        }

        static void flush(const std::shared_ptr<state>& self)
        {
            if (self->outbox_.empty() || self->writing_ || self->closed_)
                return;
            self->writing_ = true;
            auto on_write = [self](const asio::error_code& ec, std::size_t)
            {
                self->writing_ = false;
                if (self->closed_)
                    return;
                if (ec)
                {
                    self->fail(io_stage::write, "async_write", ec);
                    return;
                }
                self->outbox_.pop_front();
                self->touch();
                flush(self);
            };
            const auto& front = self->outbox_.front();
            if (self->settings_.tls)
                asio::async_write(self->stream_, asio::buffer(front), std::move(on_write));
            else
                asio::async_write(self->stream_.next_layer(), asio::buffer(front), std::move(on_write));
        }

        static timer_id schedule(const std::shared_ptr<state>& self, std::chrono::milliseconds delay, std::function<void()> fn)
        {
            const auto id = ++self->last_timer_;
            auto timer = std::make_shared<asio::steady_timer>(self->ioc_);
            timer->expires_after(delay);
            self->timers_[id] = timer;
            timer->async_wait([self, id, fn = std::move(fn)](const asio::error_code& ec)
            {
                if (ec || self->closed_)
                    return;
                if (self->timers_.erase(id) == 0)
                    return;
                if (fn)
                    fn();
            });
            return id;
        }

        void cancel_timer(timer_id id)
        {
            auto it = timers_.find(id);
            if (it == timers_.end())
                return;
            it->second->cancel();
            timers_.erase(it);
        }

        /// Restart the socket idle timeout.
        void touch()
        {
            if (settings_.socket_timeout.count() <= 0)
                return;
            idle_timer_.expires_after(settings_.socket_timeout);
            idle_timer_.async_wait([this, weak = weak_from_this()](const asio::error_code& ec)
            {
                auto self = weak.lock();
                if (!self || ec || closed_)
                    return;
                fail(io_stage::read, "idle", asio::error::timed_out);
            });
        }

        void fail(io_stage stage, std::string_view op, const asio::error_code& ec)
        {
            auto err = make_net_error(stage, op, ec, connect_timed_out_ && stage != io_stage::read && stage != io_stage::write,
                settings_.host, settings_.service);
            IMAPXX_DEBUG(err.to_string());
            auto on_error = std::move(handlers_.on_error);
            shutdown();
            if (on_error)
                on_error(err);
        }

        void remote_closed()
        {
            auto on_close = std::move(handlers_.on_close);
            shutdown();
            if (on_close)
                on_close();
        }

        void shutdown()
        {
            if (closed_)
                return;
            closed_ = true;
            handlers_ = transport::handlers{};
            asio::error_code ignored;
            resolver_.cancel();
            connect_timer_.cancel();
            idle_timer_.cancel();
            for (auto& [id, timer] : timers_)
                timer->cancel();
            timers_.clear();
            // A pending async_write still references the front buffer.
            if (!writing_)
                outbox_.clear();
            stream_.next_layer().shutdown(asio::tcp::socket::shutdown_both, ignored);
            stream_.next_layer().close(ignored);
        }

        asio::io_context& ioc_;
        asio_settings settings_;
        asio::tcp::resolver resolver_;
        asio::ssl::context ssl_ctx_;
        asio::ssl::stream<asio::tcp::socket> stream_;
        asio::steady_timer connect_timer_;
        asio::steady_timer idle_timer_;
        transport::handlers handlers_;
        std::deque<std::string> outbox_;
        std::map<timer_id, std::shared_ptr<asio::steady_timer>> timers_;
        std::array<char, 16384> buffer_{};
        timer_id last_timer_ = 0;
        bool connected_ = false;
        bool writing_ = false;
        bool closed_ = false;
        bool connect_timed_out_ = false;
    };

    asio::io_context& ioc_;
    asio_settings settings_;
    std::shared_ptr<state> state_;
};

} // namespace imapxx::net
