/*

connection.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <imapxx/detail/ascii.hpp>
#include <imapxx/detail/log.hpp>
#include <imapxx/detail/result.hpp>
#include <imapxx/detail/sanitize.hpp>
#include <imapxx/detail/sasl.hpp>
#include <imapxx/imap/command.hpp>
#include <imapxx/imap/dispatcher.hpp>
#include <imapxx/imap/fetch.hpp>
#include <imapxx/imap/mailbox_tree.hpp>
#include <imapxx/imap/options.hpp>
#include <imapxx/imap/parser.hpp>
#include <imapxx/imap/pipeline.hpp>
#include <imapxx/imap/search.hpp>
#include <imapxx/imap/session_state.hpp>
#include <imapxx/imap/tokenizer.hpp>
#include <imapxx/imap/types.hpp>
#include <imapxx/net/transport.hpp>

namespace imapxx::imap
{

template<typename T>
using callback = std::function<void(result<T>)>;

using done_callback = std::function<void(result_void)>;

/// Tag of the command an operation queued, for `connection::cancel`. Empty when
/// the operation was refused before anything was queued.
using command_tag = std::string;

struct append_options
{
    /// Defaults to the selected mailbox.
    std::string mailbox;
    std::vector<std::string> flags;
    std::optional<std::chrono::system_clock::time_point> date;
};

class connection;

/// Message operations addressed by sequence number instead of UID.
class sequence_view
{
public:
    explicit sequence_view(connection& conn) noexcept
        : conn_(&conn)
    {
    }

    command_tag search(const std::vector<criterion>& criteria, callback<std::vector<std::uint32_t>> cb);
    command_tag fetch(const message_set& source, const fetch_options& opts, fetch_handlers handlers, done_callback cb);
    command_tag copy(const message_set& source, std::string_view mailbox, done_callback cb);
    command_tag move(const message_set& source, std::string_view mailbox, done_callback cb);
    command_tag add_flags(const message_set& source, const std::vector<std::string>& flags, done_callback cb);
    command_tag del_flags(const message_set& source, const std::vector<std::string>& flags, done_callback cb);
    command_tag set_flags(const message_set& source, const std::vector<std::string>& flags, done_callback cb);
    command_tag add_keywords(const message_set& source, const std::vector<std::string>& keywords, done_callback cb);
    command_tag del_keywords(const message_set& source, const std::vector<std::string>& keywords, done_callback cb);
    command_tag set_keywords(const message_set& source, const std::vector<std::string>& keywords, done_callback cb);
    command_tag set_labels(const message_set& source, const std::vector<std::string>& labels, done_callback cb);
    command_tag add_labels(const message_set& source, const std::vector<std::string>& labels, done_callback cb);
    command_tag del_labels(const message_set& source, const std::vector<std::string>& labels, done_callback cb);

private:
    connection* conn_;
};

/**
IMAP client connection driven by transport callbacks.

Every operation reports through its callback, exactly once. Invalid input or
an operation not allowed in the current state is reported before anything is
written. Fatal errors (network, timeout, protocol) fail every outstanding
command with the same error, then emit `error` and `close`.

Operations return the tag of the command whose completion their callback
reports: CLOSE for `close_box`, the first COPY of a `move` without MOVE.
**/
class connection
{
public:
    connection(options opts, std::unique_ptr<net::transport> transport)
        : opts_(std::move(opts)),
          transport_(std::move(transport)),
          tokenizer_(opts_.max_line_length),
          pipeline_([this](std::string bytes) { transport_->write(std::move(bytes)); })
    {
        pipeline_.set_redact_secrets(opts_.redact_secrets_in_trace);
        pipeline_.set_trace_handler([this](std::string_view line) { debug_trace("=> ", line); });
        pipeline_.set_drained_handler([this] { on_drained(); });
    }

    ~connection()
    {
        if (active_)
        {
            cancel_timers();
            transport_->close();
        }
    }

    connection(const connection&) = delete;
    connection& operator=(const connection&) = delete;

    dispatcher::observer_id on(event_kind kind, dispatcher::observer fn)
    {
        return events_.on(kind, std::move(fn));
    }

    bool off(dispatcher::observer_id id)
    {
        return events_.off(id);
    }

    // Lifecycle

    /// Connects, authenticates and emits `ready`, or `error` then `close`.
    void connect()
    {
        if (active_)
        {
            IMAPXX_WARN("connect() called on an active connection.");
            return;
        }
        events_.rearm();
        tokenizer_.reset();
        pipeline_.set_max_in_flight(1);
        pipeline_.set_literal_plus(false);
        active_ = true;
        ready_ = false;
        ending_ = false;
        greeted_ = false;
        idle_renewing_ = false;

        const std::weak_ptr<bool> alive = alive_;
        net::transport::handlers h;
        h.on_connect = [this, alive]
        {
            if (!alive.expired())
                on_transport_connect();
        };
        h.on_data = [this, alive](std::string_view chunk)
        {
            if (!alive.expired())
                on_transport_data(chunk, alive);
        };
        h.on_error = [this, alive](const error& err)
        {
            if (!alive.expired())
                teardown(err);
        };
        h.on_close = [this, alive]
        {
            if (!alive.expired())
                on_transport_close();
        };
        transport_->start(std::move(h));
    }

    /// LOGOUT once everything queued before it has completed.
    void end()
    {
        if (!active_ || ending_)
            return;
        ending_ = true;
        cancel_timers();

        pending_request req;
        req.line = command_line("LOGOUT");
        req.on_done = [this](result<tagged_response> r)
        {
            if (!r && !r.error().is_fatal())
                IMAPXX_DEBUG("LOGOUT failed: " + r.error().to_string());
            finish_end();
        };
        pipeline_.send(std::move(req));
    }

    /**
    Withdraws a command, its callback gets `cancelled` right away. A queued
    command is never written. One already written keeps its place until the
    server answers, and that answer is dropped. A cancelled SELECT leaves no
    mailbox selected. False for an unknown or completed tag.
    **/
    bool cancel(std::string_view tag)
    {
        if (tag.empty())
            return false;
        return pipeline_.cancel(tag);
    }

    /// Close the transport right away; outstanding commands fail with `connection_closed`.
    void destroy()
    {
        if (!active_)
            return;
        shut_down();
        pipeline_.fail_all(error(error_code::connection_closed, "Connection destroyed."));
        emit_close(false);
    }

    // Session

    [[nodiscard]] connection_state state() const noexcept
    {
        return session_.state();
    }

    [[nodiscard]] const session_state& session() const noexcept
    {
        return session_;
    }

    [[nodiscard]] const std::optional<mailbox>& box() const noexcept
    {
        return session_.box();
    }

    [[nodiscard]] const namespaces& get_namespaces() const noexcept
    {
        return session_.get_namespaces();
    }

    [[nodiscard]] std::optional<char> delimiter() const noexcept
    {
        return session_.delimiter();
    }

    [[nodiscard]] bool server_supports(std::string_view capability) const
    {
        return session_.has_capability(capability);
    }

    [[nodiscard]] const options& get_options() const noexcept
    {
        return opts_;
    }

    // Mailboxes

    command_tag open_box(std::string_view name, bool read_only, callback<mailbox> cb)
    {
        if (auto check = require(connection_state::authenticated); !check)
            return rejected(cb, std::unexpected(check.error()));
        command_line line(read_only ? "EXAMINE" : "SELECT");
        if (auto added = append_mailbox(line, name, opts_.literal_threshold); !added)
            return rejected(cb, std::unexpected(added.error()));

        pending_request req;
        req.line = std::move(line);
        req.on_sent = [this, box_name = std::string(name), read_only]
        {
            session_.begin_select(box_name, read_only);
        };
        req.on_done = [this, cb = std::move(cb)](result<tagged_response> r)
        {
            if (!r)
            {
                if (!r.error().is_fatal())
                    session_.abort_select();
                cb(std::unexpected(r.error()));
                return;
            }
            cb(session_.finish_select());
        };
        return pipeline_.send(std::move(req));
    }

    /// CLOSE expunges; without `auto_expunge` UNSELECT, or EXAMINE then CLOSE, keep deleted messages.
    command_tag close_box(bool auto_expunge, done_callback cb)
    {
        if (auto check = require(connection_state::selected); !check)
            return rejected(cb, check);

        auto on_closed = [this, cb = std::move(cb)](result<tagged_response> r)
        {
            if (!r)
                return cb(std::unexpected(r.error()));
            session_.close_box();
            cb(ok());
        };

        const auto& box = *session_.box();
        if (auto_expunge || box.read_only)
            return send_simple(command_line("CLOSE"), std::move(on_closed));
        if (server_supports("UNSELECT"))
            return send_simple(command_line("UNSELECT"), std::move(on_closed));

        // CLOSE on a read-only mailbox does not expunge.
        command_line examine("EXAMINE");
        if (auto added = append_mailbox(examine, box.name, opts_.literal_threshold); !added)
            return rejected(on_closed, std::unexpected(added.error()));
        pending_request req;
        req.line = std::move(examine);
        req.on_sent = [this, name = box.name] { session_.begin_select(name, true); };
        req.on_done = [this](result<tagged_response> r)
        {
            if (r)
                return;
            IMAPXX_DEBUG("EXAMINE before CLOSE failed: " + r.error().to_string());
            if (!r.error().is_fatal())
                session_.abort_select();
        };
        pipeline_.send(std::move(req));
        return send_simple(command_line("CLOSE"), std::move(on_closed));
    }

    command_tag add_box(std::string_view name, done_callback cb)
    {
        return mailbox_command("CREATE", name, std::move(cb));
    }

    command_tag del_box(std::string_view name, done_callback cb)
    {
        return mailbox_command("DELETE", name, std::move(cb));
    }

    command_tag rename_box(std::string_view old_name, std::string_view new_name, done_callback cb)
    {
        if (auto check = require(connection_state::authenticated); !check)
            return rejected(cb, check);
        command_line line("RENAME");
        if (auto added = append_mailbox(line, old_name, opts_.literal_threshold); !added)
            return rejected(cb, added);
        if (auto added = append_mailbox(line, new_name, opts_.literal_threshold); !added)
            return rejected(cb, added);
        return send_simple(std::move(line), done_adapter(std::move(cb)));
    }

    command_tag subscribe_box(std::string_view name, done_callback cb)
    {
        return mailbox_command("SUBSCRIBE", name, std::move(cb));
    }

    command_tag unsubscribe_box(std::string_view name, done_callback cb)
    {
        return mailbox_command("UNSUBSCRIBE", name, std::move(cb));
    }

    /// Counters of a mailbox other than the selected one.
    command_tag status(std::string_view name, callback<mailbox> cb)
    {
        if (auto check = require(connection_state::authenticated); !check)
            return rejected(cb, std::unexpected(check.error()));
        if (session_.is_selected(name))
            return rejected(cb, fail<mailbox>(error_code::invalid_state, "STATUS is not allowed on the selected mailbox."));

        command_line line("STATUS");
        if (auto added = append_mailbox(line, name, opts_.literal_threshold); !added)
            return rejected(cb, std::unexpected(added.error()));
        line.open_list().atom("MESSAGES").atom("RECENT").atom("UNSEEN").atom("UIDVALIDITY").atom("UIDNEXT").close_list();

        auto found = std::make_shared<std::optional<mailbox>>();
        pending_request req;
        req.line = std::move(line);
        req.expects = {untagged_kind::status};
        req.on_data = [found](const untagged_response& resp)
        {
            auto box = status_from(resp);
            if (box)
                *found = std::move(*box);
            else
                IMAPXX_WARN(box.error().to_string());
        };
        req.on_done = [found, box_name = std::string(name), cb = std::move(cb)](result<tagged_response> r)
        {
            if (!r)
                return cb(std::unexpected(r.error()));
            if (!*found)
                return cb(fail<mailbox>(error_code::parse_error, "STATUS completed without STATUS data."));
            mailbox box = std::move(**found);
            box.name = box_name;
            cb(std::move(box));
        };
        return pipeline_.send(std::move(req));
    }

    command_tag get_boxes(std::string_view prefix, callback<mailbox_tree> cb)
    {
        return list_command("LIST", prefix, untagged_kind::list, std::move(cb));
    }

    command_tag get_subscribed_boxes(std::string_view prefix, callback<mailbox_tree> cb)
    {
        return list_command("LSUB", prefix, untagged_kind::lsub, std::move(cb));
    }

    // Selected mailbox

    /// Permanently remove every message flagged \Deleted.
    command_tag expunge(done_callback cb)
    {
        if (auto check = require(connection_state::selected); !check)
            return rejected(cb, check);
        return send_simple(command_line("EXPUNGE"), done_adapter(std::move(cb)));
    }

    /// Remove only the given UIDs (UIDPLUS).
    command_tag expunge(const message_set& uids, done_callback cb)
    {
        if (auto check = require(connection_state::selected); !check)
            return rejected(cb, check);
        if (!server_supports("UIDPLUS"))
            return rejected(cb, fail(error_code::capability_not_supported, "UID EXPUNGE requires UIDPLUS."));
        auto set = uids.str();
        if (!set)
            return rejected(cb, std::unexpected(set.error()));
        command_line line("UID EXPUNGE");
        line.atom(*set);
        return send_simple(std::move(line), done_adapter(std::move(cb)));
    }

    command_tag append(std::string data, const append_options& opts, done_callback cb)
    {
        if (auto check = require(connection_state::authenticated); !check)
            return rejected(cb, check);
        if (data.empty())
            return rejected(cb, fail(error_code::invalid_argument, "Message data is empty."));

        std::string_view box_name = opts.mailbox;
        if (box_name.empty())
        {
            if (!session_.box())
                return rejected(cb, fail(error_code::invalid_argument, "No mailbox given and none is selected."));
            box_name = session_.box()->name;
        }

        command_line line("APPEND");
        if (auto added = append_mailbox(line, box_name, opts_.literal_threshold); !added)
            return rejected(cb, added);
        if (!opts.flags.empty())
        {
            std::vector<std::string> flags;
            for (const auto& flag : opts.flags)
                flags.push_back(normalize_flag(flag));
            if (auto added = append_flag_list(line, flags); !added)
                return rejected(cb, added);
        }
        if (opts.date)
            line.quoted(format_internal_date(*opts.date));
        line.literal(std::move(data));
        return send_simple(std::move(line), done_adapter(std::move(cb)));
    }

    /// UIDs of the messages matching every criterion.
    command_tag search(const std::vector<criterion>& criteria, callback<std::vector<std::uint32_t>> cb)
    {
        return search_impl(true, criteria, std::move(cb));
    }

    /// Per message: `on_body` for each section, then `on_attributes`, then `on_end`; `cb` after the last one.
    command_tag fetch(const message_set& uids, const fetch_options& opts, fetch_handlers handlers, done_callback cb)
    {
        return fetch_impl(true, uids, opts, std::move(handlers), std::move(cb));
    }

    command_tag copy(const message_set& uids, std::string_view mailbox, done_callback cb)
    {
        return copy_impl(true, uids, mailbox, std::move(cb));
    }

    command_tag move(const message_set& uids, std::string_view mailbox, done_callback cb)
    {
        return move_impl(true, uids, mailbox, std::move(cb));
    }

    command_tag add_flags(const message_set& uids, const std::vector<std::string>& flags, done_callback cb)
    {
        return store_flags(true, uids, "+FLAGS", flags, false, std::move(cb));
    }

    command_tag del_flags(const message_set& uids, const std::vector<std::string>& flags, done_callback cb)
    {
        return store_flags(true, uids, "-FLAGS", flags, false, std::move(cb));
    }

    command_tag set_flags(const message_set& uids, const std::vector<std::string>& flags, done_callback cb)
    {
        return store_flags(true, uids, "FLAGS", flags, false, std::move(cb));
    }

    command_tag add_keywords(const message_set& uids, const std::vector<std::string>& keywords, done_callback cb)
    {
        return store_flags(true, uids, "+FLAGS", keywords, true, std::move(cb));
    }

    command_tag del_keywords(const message_set& uids, const std::vector<std::string>& keywords, done_callback cb)
    {
        return store_flags(true, uids, "-FLAGS", keywords, true, std::move(cb));
    }

    command_tag set_keywords(const message_set& uids, const std::vector<std::string>& keywords, done_callback cb)
    {
        return store_flags(true, uids, "FLAGS", keywords, true, std::move(cb));
    }

    /// Gmail labels (X-GM-EXT-1).
    command_tag set_labels(const message_set& uids, const std::vector<std::string>& labels, done_callback cb)
    {
        return store_labels(true, uids, "X-GM-LABELS", labels, std::move(cb));
    }

    command_tag add_labels(const message_set& uids, const std::vector<std::string>& labels, done_callback cb)
    {
        return store_labels(true, uids, "+X-GM-LABELS", labels, std::move(cb));
    }

    command_tag del_labels(const message_set& uids, const std::vector<std::string>& labels, done_callback cb)
    {
        return store_labels(true, uids, "-X-GM-LABELS", labels, std::move(cb));
    }

    [[nodiscard]] sequence_view seq() noexcept
    {
        return sequence_view(*this);
    }

private:
    friend class sequence_view;

    // Transport events

    void on_transport_connect()
    {
        if (auto moved = session_.transition(connection_state::connected); !moved)
            return teardown(moved.error());
        if (opts_.timeouts.auth.count() > 0)
        {
            auth_timer_ = transport_->schedule(opts_.timeouts.auth, [this]
            {
                auth_timer_.reset();
                teardown(error(error_code::auth_timeout, "Timed out waiting for authentication."));
            });
        }
    }

    void on_transport_data(std::string_view chunk, std::weak_ptr<bool> alive)
    {
        auto fed = tokenizer_.feed(chunk);
        while (auto line = tokenizer_.next())
        {
            handle_line(*line);
            if (alive.expired() || !active_)
                return;
        }
        if (!fed)
            teardown(fed.error());
    }

    void on_transport_close()
    {
        if (ending_)
        {
            finish_end();
            return;
        }
        if (!active_)
            return;
        shut_down();
        pipeline_.fail_all(error(error_code::connection_closed, "Connection closed by the server."));
        events_.emit(event{event_kind::end});
        emit_close(false);
    }

    // Response routing

    void handle_line(const response_line& line)
    {
        const auto text = line.str();
        IMAPXX_TRACE_RECV("IMAP", text);
        debug_trace("<= ", text);

        if (!greeted_)
            return handle_greeting(line);

        switch (line.kind)
        {
            case line_kind::tagged:
                return handle_tagged(line);
            case line_kind::untagged:
                return handle_untagged(line);
            case line_kind::continuation:
                if (auto handled = pipeline_.on_continuation(continuation_text(line)); !handled)
                    teardown(handled.error());
                return;
        }
    }

    void handle_greeting(const response_line& line)
    {
        greeted_ = true;
        if (line.kind != line_kind::untagged)
            return teardown(error(error_code::parse_error, "Expected a server greeting.", line.str()));
        auto resp = parse_untagged(line);
        if (!resp)
            return teardown(resp.error());
        if (resp->kind != untagged_kind::condition)
            return teardown(error(error_code::parse_error, "Expected a server greeting.", resp->raw));

        const auto& greeting = resp->condition;
        auto notices = session_.apply(*resp);
        if (!notices)
            return teardown(notices.error());
        emit_notices(*notices);
        switch (greeting.st)
        {
            case status::ok:
                if (session_.has_capabilities())
                    authenticate();
                else
                    request_capabilities([this] { authenticate(); });
                return;
            case status::preauth:
                if (auto moved = session_.transition(connection_state::authenticated); !moved)
                    return teardown(moved.error());
                after_auth(greeting.code == "CAPABILITY");
                return;
            case status::bye:
                return teardown(error(error_code::unexpected_bye, greeting.text, resp->raw));
            default:
                return teardown(error(error_code::parse_error, "Unexpected server greeting.", resp->raw));
        }
    }

    void handle_tagged(const response_line& line)
    {
        auto resp = parse_tagged(line);
        if (!resp)
            return teardown(resp.error());
        if (resp->result.code == "ALERT")
            emit_notices({alert_notice{resp->result.text}});
        if (auto n = session_.apply_code(resp->result))
            emit_notices({*n});
        if (auto routed = pipeline_.on_tagged(*resp); !routed)
            teardown(routed.error());
    }

    void handle_untagged(const response_line& line)
    {
        auto resp = parse_untagged(line);
        if (!resp)
            return teardown(resp.error());

        if (resp->kind == untagged_kind::condition && resp->condition.st == status::bye)
        {
            if (ending_)
                return;
            return teardown(error(error_code::unexpected_bye, resp->condition.text, resp->raw));
        }

        auto notices = session_.apply(*resp);
        if (!notices)
            return teardown(notices.error());
        emit_notices(*notices);
        if (!active_)
            return;
        if (pipeline_.on_untagged(*resp))
            return;

        if (resp->kind == untagged_kind::fetch)
        {
            auto fetched = fetched_from(*resp);
            if (!fetched)
            {
                IMAPXX_WARN(fetched.error().to_string());
                return;
            }
            event ev{event_kind::update};
            ev.number = resp->number;
            ev.uid = fetched->attributes.uid;
            ev.attributes = std::move(fetched->attributes);
            events_.emit(ev);
        }
    }

    void emit_notices(const std::vector<state_notice>& notices)
    {
        for (const auto& notice : notices)
        {
            event ev;
            if (const auto* mail = std::get_if<mail_notice>(&notice))
            {
                ev.kind = event_kind::mail;
                ev.number = mail->count;
            }
            else if (const auto* gone = std::get_if<expunge_notice>(&notice))
            {
                ev.kind = event_kind::expunge;
                ev.number = gone->seqno;
                ev.uid = gone->uid;
            }
            else if (const auto* validity = std::get_if<uidvalidity_notice>(&notice))
            {
                ev.kind = event_kind::uidvalidity;
                ev.number = validity->uid_validity;
            }
            else if (const auto* alert = std::get_if<alert_notice>(&notice))
            {
                ev.kind = event_kind::alert;
                ev.message = alert->text;
            }
            events_.emit(ev);
        }
    }

    // Connection setup

    void request_capabilities(std::function<void()> next)
    {
        pending_request req;
        req.line = command_line("CAPABILITY");
        req.on_done = [this, next = std::move(next)](result<tagged_response> r)
        {
            if (!r)
                return teardown(r.error());
            next();
        };
        pipeline_.send(std::move(req));
    }

    void authenticate()
    {
        if (opts_.auth.uses_xoauth2())
        {
            std::string token = opts_.auth.xoauth2;
            if (token.empty())
            {
                auto encoded = sasl::encode_xoauth2(opts_.auth.user, opts_.auth.access_token);
                if (!encoded)
                    return teardown(encoded.error());
                token = std::move(*encoded);
            }
            else if (auto valid = detail::ensure_no_crlf_or_nul(token, "xoauth2"); !valid)
                return teardown(valid.error());
            return authenticate_sasl(sasl::mechanism::xoauth2, std::move(token));
        }

        if (server_supports("LOGINDISABLED"))
        {
            if (!server_supports("AUTH=PLAIN"))
                return teardown(error(error_code::capability_not_supported, "The server does not allow LOGIN."));
            auto encoded = sasl::encode_plain(opts_.auth.user, opts_.auth.password);
            if (!encoded)
                return teardown(encoded.error());
            return authenticate_sasl(sasl::mechanism::plain, std::move(*encoded));
        }
        if (auto valid = detail::ensure_no_crlf_or_nul(opts_.auth.user, "username"); !valid)
            return teardown(valid.error());
        if (auto valid = detail::ensure_no_crlf_or_nul(opts_.auth.password, "password"); !valid)
            return teardown(valid.error());

        pending_request req;
        req.line = command_line("LOGIN");
        req.line.string(opts_.auth.user, opts_.literal_threshold);
        req.line.string(opts_.auth.password, opts_.literal_threshold);
        req.sensitive = true;
        req.on_done = [this](result<tagged_response> r) { authenticated(std::move(r)); };
        pipeline_.send(std::move(req));
    }

    /// AUTHENTICATE with `response` sent inline (SASL-IR) or after the first continuation.
    void authenticate_sasl(sasl::mechanism mech, std::string response)
    {
        std::string capability = "AUTH=";
        capability += sasl::mechanism_name(mech);
        if (!server_supports(capability))
        {
            std::string message = "The server does not offer ";
            message += capability;
            return teardown(error(error_code::capability_not_supported, std::move(message)));
        }

        pending_request req;
        req.line = command_line("AUTHENTICATE");
        req.line.atom(sasl::mechanism_name(mech));
        const bool initial_response = server_supports("SASL-IR");
        if (initial_response)
            req.line.atom(response);
        // A rejected XOAUTH2 response is followed by an error challenge, answered with an empty line.
        req.on_challenge = [mech, response = std::move(response), sent = initial_response](std::string_view challenge) mutable
        {
            if (!sent)
            {
                sent = true;
                return response;
            }
            if (mech == sasl::mechanism::xoauth2)
                IMAPXX_DEBUG("XOAUTH2 rejected: " + sasl::xoauth2_failure(challenge));
            return std::string{};
        };
        req.sensitive = true;
        req.on_done = [this](result<tagged_response> r) { authenticated(std::move(r)); };
        pipeline_.send(std::move(req));
    }

    void authenticated(result<tagged_response> r)
    {
        if (!r)
            return teardown(r.error());
        if (auto moved = session_.transition(connection_state::authenticated); !moved)
            return teardown(moved.error());
        after_auth(r->result.code == "CAPABILITY");
    }

    /// CAPABILITY (unless just announced), NAMESPACE, then the hierarchy delimiter.
    void after_auth(bool fresh_capabilities)
    {
        if (auth_timer_)
        {
            transport_->cancel(*auth_timer_);
            auth_timer_.reset();
        }
        auto lookup_delimiter = [this]
        {
            request_delimiter([this] { become_ready(); });
        };
        auto lookup_namespaces = [this, lookup_delimiter]
        {
            if (server_supports("NAMESPACE"))
                request_namespaces(lookup_delimiter);
            else
                lookup_delimiter();
        };
        if (fresh_capabilities)
            lookup_namespaces();
        else
            request_capabilities(lookup_namespaces);
    }

    void request_namespaces(std::function<void()> next)
    {
        pending_request req;
        req.line = command_line("NAMESPACE");
        req.expects = {untagged_kind::namespace_};
        req.on_data = [this](const untagged_response& resp)
        {
            auto ns = namespaces_from(resp);
            if (!ns)
            {
                IMAPXX_WARN(ns.error().to_string());
                return;
            }
            if (!ns->personal.empty() && ns->personal.front().delimiter)
                session_.set_delimiter(ns->personal.front().delimiter);
            session_.set_namespaces(std::move(*ns));
        };
        req.on_done = [this, next = std::move(next)](result<tagged_response> r)
        {
            if (!r)
                return teardown(r.error());
            next();
        };
        pipeline_.send(std::move(req));
    }

    void request_delimiter(std::function<void()> next)
    {
        pending_request req;
        req.line = command_line("LIST");
        req.line.quoted("").quoted("");
        req.expects = {untagged_kind::list};
        req.on_data = [this](const untagged_response& resp)
        {
            if (resp.values.size() >= 2)
                session_.set_delimiter(parser_detail::to_delimiter(resp.values[1]));
        };
        req.on_done = [this, next = std::move(next)](result<tagged_response> r)
        {
            if (!r)
                return teardown(r.error());
            next();
        };
        pipeline_.send(std::move(req));
    }

    void become_ready()
    {
        pipeline_.set_max_in_flight(opts_.max_in_flight);
        pipeline_.set_literal_plus(server_supports("LITERAL+"));
        ready_ = true;
        events_.emit(event{event_kind::ready});
    }

    // Keepalive

    void on_drained()
    {
        if (!ready_ || !active_ || ending_ || !opts_.keepalive.enabled)
            return;
        if (idle_renewing_)
        {
            idle_renewing_ = false;
            keepalive_tick();
            return;
        }
        if (keepalive_timer_)
            transport_->cancel(*keepalive_timer_);
        keepalive_timer_ = transport_->schedule(opts_.keepalive.interval, [this]
        {
            keepalive_timer_.reset();
            keepalive_tick();
        });
    }

    void keepalive_tick()
    {
        if (!active_ || ending_ || !pipeline_.empty())
            return;

        if (server_supports("IDLE") && !opts_.keepalive.force_noop)
        {
            pending_request req;
            req.line = command_line("IDLE");
            req.idle = true;
            req.on_done = [this](result<tagged_response> r)
            {
                if (idle_timer_)
                {
                    transport_->cancel(*idle_timer_);
                    idle_timer_.reset();
                }
                if (!r && !r.error().is_fatal())
                    IMAPXX_DEBUG("IDLE ended with " + r.error().to_string());
            };
            pipeline_.send(std::move(req));
            idle_timer_ = transport_->schedule(opts_.keepalive.idle_interval, [this]
            {
                idle_timer_.reset();
                idle_renewing_ = true;
                pipeline_.interrupt_idle();
            });
            return;
        }

        pending_request req;
        req.line = command_line("NOOP");
        req.on_done = [](result<tagged_response> r)
        {
            if (!r && !r.error().is_fatal())
                IMAPXX_DEBUG("NOOP failed: " + r.error().to_string());
        };
        pipeline_.send(std::move(req));
    }

    void cancel_timers()
    {
        for (auto* timer : {&auth_timer_, &keepalive_timer_, &idle_timer_})
        {
            if (*timer)
            {
                transport_->cancel(**timer);
                timer->reset();
            }
        }
    }

    // Teardown

    /// Stop everything without notifying anyone.
    void shut_down()
    {
        active_ = false;
        ready_ = false;
        idle_renewing_ = false;
        cancel_timers();
        transport_->close();
        if (auto moved = session_.transition(connection_state::disconnected); !moved)
            IMAPXX_ERROR(moved.error().to_string());
    }

    /// Fatal error: every outstanding command fails with `err`, then `error` and `close`.
    void teardown(const error& err)
    {
        if (!active_)
            return;
        IMAPXX_ERROR(err.to_string());
        shut_down();
        pipeline_.fail_all(err);
        event ev{event_kind::error};
        ev.err = err;
        events_.emit(ev);
        emit_close(true);
    }

    void finish_end()
    {
        if (!active_)
            return;
        shut_down();
        pipeline_.fail_all(error(error_code::connection_closed, "Connection ended."));
        events_.emit(event{event_kind::end});
        emit_close(false);
    }

    void emit_close(bool had_error)
    {
        event ev{event_kind::close};
        ev.had_error = had_error;
        events_.emit(ev);
    }

    void debug_trace(std::string_view prefix, std::string_view line)
    {
        if (!opts_.debug)
            return;
        std::string out(prefix);
        out.append(line.data(), line.size());
        while (!out.empty() && (out.back() == '\n' || out.back() == '\r'))
            out.pop_back();
        opts_.debug(out);
    }

    // Command helpers

    [[nodiscard]] result_void require(connection_state needed) const
    {
        const auto current = session_.state();
        bool allowed = active_ && ready_ && !ending_;
        if (needed == connection_state::selected)
            allowed = allowed && current == connection_state::selected;
        else
            allowed = allowed && (current == connection_state::authenticated || current == connection_state::selected);
        if (allowed)
            return ok();
        std::string message = "Operation requires the ";
        message += to_string(needed);
        message += " state, connection is ";
        message += to_string(current);
        return fail(error_code::invalid_state, std::move(message));
    }

    /// Operation refused before anything was queued.
    template<typename Callback, typename Result>
    static command_tag rejected(Callback& cb, Result&& r)
    {
        cb(std::forward<Result>(r));
        return {};
    }

    [[nodiscard]] static std::function<void(result<tagged_response>)> done_adapter(done_callback cb)
    {
        return [cb = std::move(cb)](result<tagged_response> r)
        {
            if (!r)
                return cb(std::unexpected(r.error()));
            cb(ok());
        };
    }

    command_tag send_simple(command_line line, std::function<void(result<tagged_response>)> on_done)
    {
        pending_request req;
        req.line = std::move(line);
        req.on_done = std::move(on_done);
        return pipeline_.send(std::move(req));
    }

    command_tag mailbox_command(std::string_view verb, std::string_view name, done_callback cb)
    {
        if (auto check = require(connection_state::authenticated); !check)
            return rejected(cb, check);
        command_line line(verb);
        if (auto added = append_mailbox(line, name, opts_.literal_threshold); !added)
            return rejected(cb, added);
        return send_simple(std::move(line), done_adapter(std::move(cb)));
    }

    command_tag list_command(std::string_view verb, std::string_view prefix, untagged_kind kind, callback<mailbox_tree> cb)
    {
        if (auto check = require(connection_state::authenticated); !check)
            return rejected(cb, std::unexpected(check.error()));
        command_line line(verb);
        if (auto added = append_mailbox(line, prefix, opts_.literal_threshold); !added)
            return rejected(cb, std::unexpected(added.error()));
        line.quoted("*");

        auto entries = std::make_shared<std::vector<list_entry>>();
        pending_request req;
        req.line = std::move(line);
        req.expects = {kind};
        req.on_data = [entries](const untagged_response& resp)
        {
            auto entry = list_from(resp);
            if (entry)
                entries->push_back(std::move(*entry));
            else
                IMAPXX_WARN(entry.error().to_string());
        };
        req.on_done = [entries, cb = std::move(cb)](result<tagged_response> r)
        {
            if (!r)
                return cb(std::unexpected(r.error()));
            cb(build_mailbox_tree(*entries));
        };
        return pipeline_.send(std::move(req));
    }

    command_tag search_impl(bool uid, const std::vector<criterion>& criteria, callback<std::vector<std::uint32_t>> cb)
    {
        if (auto check = require(connection_state::selected); !check)
            return rejected(cb, std::unexpected(check.error()));
        auto compiled = compile(criteria, compile_options{opts_.literal_threshold, opts_.negation});
        if (!compiled)
            return rejected(cb, std::unexpected(compiled.error()));
        if (compiled->gmail && !server_supports("X-GM-EXT-1"))
            return rejected(cb, fail<std::vector<std::uint32_t>>(error_code::capability_not_supported, "Gmail search keys require X-GM-EXT-1."));

        command_line line(uid ? "UID SEARCH" : "SEARCH");
        if (compiled->utf8)
            line.atom("CHARSET").atom("UTF-8");
        line.append(compiled->args);

        auto ids = std::make_shared<std::vector<std::uint32_t>>();
        pending_request req;
        req.line = std::move(line);
        req.expects = {untagged_kind::search};
        req.on_data = [ids](const untagged_response& resp)
        {
            auto found = search_from(resp);
            if (!found)
            {
                IMAPXX_WARN(found.error().to_string());
                return;
            }
            ids->insert(ids->end(), found->ids.begin(), found->ids.end());
        };
        req.on_done = [ids, cb = std::move(cb)](result<tagged_response> r)
        {
            if (!r)
                return cb(std::unexpected(r.error()));
            cb(std::move(*ids));
        };
        return pipeline_.send(std::move(req));
    }

    command_tag fetch_impl(bool uid, const message_set& source, const fetch_options& opts, fetch_handlers handlers, done_callback cb)
    {
        if (auto check = require(connection_state::selected); !check)
            return rejected(cb, check);
        auto set = source.str();
        if (!set)
            return rejected(cb, std::unexpected(set.error()));
        auto compiled = compile_fetch(opts);
        if (!compiled)
            return rejected(cb, std::unexpected(compiled.error()));
        if (compiled->gmail && !server_supports("X-GM-EXT-1"))
            return rejected(cb, fail(error_code::capability_not_supported, "Gmail fetch items require X-GM-EXT-1."));
        if (compiled->condstore && !server_supports("CONDSTORE"))
            return rejected(cb, fail(error_code::capability_not_supported, "MODSEQ and CHANGEDSINCE require CONDSTORE."));

        command_line line(uid ? "UID FETCH" : "FETCH");
        line.atom(*set);
        line.append(compiled->items);
        if (!compiled->modifiers.empty())
            line.append(compiled->modifiers);

        pending_request req;
        req.line = std::move(line);
        req.expects = {untagged_kind::fetch};
        req.on_data = [handlers = std::move(handlers)](const untagged_response& resp)
        {
            auto fetched = fetched_from(resp);
            if (!fetched)
            {
                IMAPXX_WARN(fetched.error().to_string());
                return;
            }
            for (auto& [info, data] : fetched->bodies)
            {
                if (handlers.on_body)
                    handlers.on_body(info, std::move(data));
            }
            if (handlers.on_attributes)
                handlers.on_attributes(fetched->attributes);
            if (handlers.on_end)
                handlers.on_end(fetched->attributes.seqno);
        };
        req.on_done = done_adapter(std::move(cb));
        return pipeline_.send(std::move(req));
    }

    command_tag copy_impl(bool uid, const message_set& source, std::string_view mailbox, done_callback cb)
    {
        auto line = transfer_line(uid ? "UID COPY" : "COPY", source, mailbox);
        if (!line)
            return rejected(cb, std::unexpected(line.error()));
        return send_simple(std::move(*line), done_adapter(std::move(cb)));
    }

    /// MOVE, or COPY then \Deleted then UID EXPUNGE (UIDPLUS); without UIDPLUS the
    /// originals stay flagged \Deleted.
    command_tag move_impl(bool uid, const message_set& source, std::string_view mailbox, done_callback cb)
    {
        if (server_supports("MOVE"))
        {
            auto line = transfer_line(uid ? "UID MOVE" : "MOVE", source, mailbox);
            if (!line)
                return rejected(cb, std::unexpected(line.error()));
            return send_simple(std::move(*line), done_adapter(std::move(cb)));
        }

        auto copy = transfer_line(uid ? "UID COPY" : "COPY", source, mailbox);
        if (!copy)
            return rejected(cb, std::unexpected(copy.error()));
        auto set = source.str();
        if (!set)
            return rejected(cb, std::unexpected(set.error()));

        return send_simple(std::move(*copy), [this, uid, set = *set, cb = std::move(cb)](result<tagged_response> r) mutable
        {
            if (!r)
                return cb(std::unexpected(r.error()));
            command_line store(uid ? "UID STORE" : "STORE");
            store.atom(set).atom("+FLAGS").raw(" (\\Deleted)");
            send_simple(std::move(store), [this, uid, set, cb = std::move(cb)](result<tagged_response> r) mutable
            {
                if (!r)
                    return cb(std::unexpected(r.error()));
                if (!uid || !server_supports("UIDPLUS"))
                {
                    IMAPXX_WARN("Server lacks MOVE and UIDPLUS, moved messages left flagged \\Deleted.");
                    return cb(ok());
                }
                command_line expunge("UID EXPUNGE");
                expunge.atom(set);
                send_simple(std::move(expunge), done_adapter(std::move(cb)));
            });
        });
    }

    [[nodiscard]] result<command_line> transfer_line(std::string_view verb, const message_set& source, std::string_view mailbox) const
    {
        IMAPXX_TRY_VOID(require(connection_state::selected));
        std::string set;
        IMAPXX_TRY_ASSIGN(set, source.str());
        command_line line(verb);
        line.atom(set);
        IMAPXX_TRY_VOID(append_mailbox(line, mailbox, opts_.literal_threshold));
        return line;
    }

    /// Non-silent STORE; the resulting FETCH responses surface as `update` events.
    command_tag store_flags(bool uid, const message_set& source, std::string_view item, const std::vector<std::string>& values,
        bool keywords, done_callback cb)
    {
        if (auto check = require(connection_state::selected); !check)
            return rejected(cb, check);
        const bool replace = item == "FLAGS";
        if (values.empty() && !replace)
            return rejected(cb, fail(error_code::invalid_argument, "No flags given."));

        std::vector<std::string> normalized;
        for (const auto& value : values)
        {
            if (keywords)
            {
                if (value.empty() || value.front() == '\\' || !detail::is_atom(value))
                {
                    std::string message = "Invalid keyword: ";
                    message += value;
                    return rejected(cb, fail(error_code::invalid_argument, std::move(message)));
                }
                normalized.push_back(value);
            }
            else
                normalized.push_back(normalize_flag(value));
        }

        auto set = source.str();
        if (!set)
            return rejected(cb, std::unexpected(set.error()));
        command_line line(uid ? "UID STORE" : "STORE");
        line.atom(*set).atom(item);
        if (auto added = append_flag_list(line, normalized); !added)
            return rejected(cb, added);
        return send_simple(std::move(line), done_adapter(std::move(cb)));
    }

    command_tag store_labels(bool uid, const message_set& source, std::string_view item, const std::vector<std::string>& labels,
        done_callback cb)
    {
        if (auto check = require(connection_state::selected); !check)
            return rejected(cb, check);
        if (!server_supports("X-GM-EXT-1"))
            return rejected(cb, fail(error_code::capability_not_supported, "Labels require X-GM-EXT-1."));
        const bool replace = item == "X-GM-LABELS";
        if (labels.empty() && !replace)
            return rejected(cb, fail(error_code::invalid_argument, "No labels given."));

        auto set = source.str();
        if (!set)
            return rejected(cb, std::unexpected(set.error()));
        command_line line(uid ? "UID STORE" : "STORE");
        line.atom(*set).atom(item).open_list();
        for (const auto& label : labels)
        {
            // System labels such as \Important are atoms, user labels are mailbox names.
            if (!label.empty() && label.front() == '\\' && detail::is_atom(std::string_view(label).substr(1)))
                line.atom(label);
            else if (auto added = append_mailbox(line, label, opts_.literal_threshold); !added)
                return rejected(cb, added);
        }
        line.close_list();
        return send_simple(std::move(line), done_adapter(std::move(cb)));
    }

    options opts_;
    std::unique_ptr<net::transport> transport_;
    tokenizer tokenizer_;
    pipeline pipeline_;
    session_state session_;
    dispatcher events_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
    std::optional<net::transport::timer_id> auth_timer_;
    std::optional<net::transport::timer_id> keepalive_timer_;
    std::optional<net::transport::timer_id> idle_timer_;
    bool active_ = false;
    bool ready_ = false;
    bool ending_ = false;
    bool greeted_ = false;
    bool idle_renewing_ = false;
};

inline command_tag sequence_view::search(const std::vector<criterion>& criteria, callback<std::vector<std::uint32_t>> cb)
{
    return conn_->search_impl(false, criteria, std::move(cb));
}

inline command_tag sequence_view::fetch(const message_set& source, const fetch_options& opts, fetch_handlers handlers, done_callback cb)
{
    return conn_->fetch_impl(false, source, opts, std::move(handlers), std::move(cb));
}

inline command_tag sequence_view::copy(const message_set& source, std::string_view mailbox, done_callback cb)
{
    return conn_->copy_impl(false, source, mailbox, std::move(cb));
}

inline command_tag sequence_view::move(const message_set& source, std::string_view mailbox, done_callback cb)
{
    return conn_->move_impl(false, source, mailbox, std::move(cb));
}

inline command_tag sequence_view::add_flags(const message_set& source, const std::vector<std::string>& flags, done_callback cb)
{
    return conn_->store_flags(false, source, "+FLAGS", flags, false, std::move(cb));
}

inline command_tag sequence_view::del_flags(const message_set& source, const std::vector<std::string>& flags, done_callback cb)
{
    return conn_->store_flags(false, source, "-FLAGS", flags, false, std::move(cb));
}

inline command_tag sequence_view::set_flags(const message_set& source, const std::vector<std::string>& flags, done_callback cb)
{
    return conn_->store_flags(false, source, "FLAGS", flags, false, std::move(cb));
}

inline command_tag sequence_view::add_keywords(const message_set& source, const std::vector<std::string>& keywords, done_callback cb)
{
    return conn_->store_flags(false, source, "+FLAGS", keywords, true, std::move(cb));
}

inline command_tag sequence_view::del_keywords(const message_set& source, const std::vector<std::string>& keywords, done_callback cb)
{
    return conn_->store_flags(false, source, "-FLAGS", keywords, true, std::move(cb));
}

inline command_tag sequence_view::set_keywords(const message_set& source, const std::vector<std::string>& keywords, done_callback cb)
{
    return conn_->store_flags(false, source, "FLAGS", keywords, true, std::move(cb));
}

inline command_tag sequence_view::set_labels(const message_set& source, const std::vector<std::string>& labels, done_callback cb)
{
    return conn_->store_labels(false, source, "X-GM-LABELS", labels, std::move(cb));
}

inline command_tag sequence_view::add_labels(const message_set& source, const std::vector<std::string>& labels, done_callback cb)
{
    return conn_->store_labels(false, source, "+X-GM-LABELS", labels, std::move(cb));
}

inline command_tag sequence_view::del_labels(const message_set& source, const std::vector<std::string>& labels, done_callback cb)
{
    return conn_->store_labels(false, source, "-X-GM-LABELS", labels, std::move(cb));
}

} // namespace imapxx::imap
