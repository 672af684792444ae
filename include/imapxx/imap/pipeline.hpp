/*

pipeline.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Tags outgoing commands, writes them in submission order and matches tagged
completions back to their callers.

*/

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <imapxx/detail/append.hpp>
#include <imapxx/detail/ascii.hpp>
#include <imapxx/detail/log.hpp>
#include <imapxx/detail/redact.hpp>
#include <imapxx/detail/result.hpp>
#include <imapxx/imap/command.hpp>
#include <imapxx/imap/parser.hpp>

namespace imapxx::imap
{

/// A command handed to the pipeline together with its callbacks.
struct pending_request
{
    command_line line;
    /// Untagged data kinds routed to `on_data` while the command is in flight.
    std::vector<untagged_kind> expects;
    std::function<void(const untagged_response&)> on_data;
    std::function<void(result<tagged_response>)> on_done;
    /// Called right before the command is written.
    std::function<void()> on_sent;
    /// Answer to a `+` challenge (AUTHENTICATE), without CRLF.
    std::function<std::string(std::string_view)> on_challenge;
    /// Keepalive IDLE, ended with DONE as soon as anything else is queued.
    bool idle = false;
    /// Hide arguments from protocol traces.
    bool sensitive = false;
};

class pipeline
{
public:
    using writer = std::function<void(std::string)>;

    explicit pipeline(writer write)
        : write_(std::move(write))
    {
    }

    pipeline(const pipeline&) = delete;
    pipeline& operator=(const pipeline&) = delete;

    /// Queue a command; returns its tag.
    std::string send(pending_request req)
    {
        entry e;
        e.tag = next_tag();
        e.barrier = is_barrier(req.line.verb()) || req.idle;
        e.req = std::move(req);
        std::string tag = e.tag;
        queue_.push_back(std::move(e));

        interrupt_idle();
        pump();
        return tag;
    }

    /// Tagged completion. An unknown tag is a protocol violation.
    result_void on_tagged(const tagged_response& resp)
    {
        auto it = find_in_flight(resp.tag);
        if (it == in_flight_.end())
        {
            std::string message = "Tagged response for unknown tag ";
            message += resp.tag;
            return fail(error_code::unknown_tag, std::move(message));
        }

        entry e = std::move(*it);
        in_flight_.erase(it);

        if (e.cancelled)
        {
            std::string message = "Dropping late reply for cancelled command ";
            message += e.tag;
            IMAPXX_DEBUG(message);
        }
        else if (e.req.on_done)
        {
            if (resp.result.st == status::ok)
                e.req.on_done(resp);
            else
                e.req.on_done(std::unexpected(server_error(resp)));
        }

        pump();
        notify_drained();
        return ok();
    }

    /// Routes untagged data to the oldest in-flight command expecting it.
    bool on_untagged(const untagged_response& resp)
    {
        for (auto& e : in_flight_)
        {
            if (e.cancelled || !e.req.on_data)
                continue;
            if (std::find(e.req.expects.begin(), e.req.expects.end(), resp.kind) == e.req.expects.end())
                continue;
            e.req.on_data(resp);
            return true;
        }
        return false;
    }

    /// `+` continuation request from the server.
    result_void on_continuation(std::string_view text)
    {
        for (auto& e : in_flight_)
        {
            if (e.awaiting_literal)
            {
                e.awaiting_literal = false;
                e.literal_granted = true;
                write_parts(e);
                pump();
                return ok();
            }
        }

        for (auto& e : in_flight_)
        {
            if (e.req.idle && !e.idle_accepted)
            {
                e.idle_accepted = true;
                if (e.done_requested)
                    write_done(e);
                return ok();
            }
            if (e.req.on_challenge)
            {
                std::string answer = e.req.on_challenge(text);
                detail::append_crlf(answer);
                trace(answer, true);
                write_(std::move(answer));
                return ok();
            }
        }

        return fail(error_code::parse_error, "Unexpected continuation request.");
    }

    /// Withdraw a command. A command already written stays known so its late reply can be dropped.
    bool cancel(std::string_view tag)
    {
        for (auto it = queue_.begin(); it != queue_.end(); ++it)
        {
            if (it->tag != tag)
                continue;
            entry e = std::move(*it);
            queue_.erase(it);
            complete(e, error(error_code::cancelled));
            notify_drained();
            return true;
        }

        auto it = find_in_flight(tag);
        if (it == in_flight_.end() || it->cancelled)
            return false;
        it->cancelled = true;
        auto done = std::move(it->req.on_done);
        if (it->req.idle)
            end_idle(*it);
        if (done)
            done(std::unexpected(error(error_code::cancelled)));
        return true;
    }

    /// Resolve every queued and in-flight command with `err`.
    void fail_all(const error& err)
    {
        std::list<entry> in_flight = std::move(in_flight_);
        std::list<entry> queued = std::move(queue_);
        in_flight_.clear();
        queue_.clear();
        for (auto& e : in_flight)
        {
            if (!e.cancelled)
                complete(e, err);
        }
        for (auto& e : queued)
            complete(e, err);
    }

    /// Ask a running IDLE to finish.
    void interrupt_idle()
    {
        for (auto& e : in_flight_)
        {
            if (e.req.idle)
                end_idle(e);
        }
    }

    void set_literal_plus(bool enabled) noexcept
    {
        literal_plus_ = enabled;
    }

    void set_max_in_flight(std::size_t n)
    {
        max_in_flight_ = std::max<std::size_t>(n, 1);
        pump();
    }

    void set_redact_secrets(bool enabled) noexcept
    {
        redact_ = enabled;
    }

    /// Called when nothing is queued or in flight after a completion.
    void set_drained_handler(std::function<void()> handler)
    {
        on_drained_ = std::move(handler);
    }

    /// Receives every trace line sent, after redaction.
    void set_trace_handler(std::function<void(std::string_view)> handler)
    {
        on_trace_ = std::move(handler);
    }

    [[nodiscard]] std::size_t queued() const noexcept
    {
        return queue_.size();
    }

    [[nodiscard]] std::size_t in_flight() const noexcept
    {
        return in_flight_.size();
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return queue_.empty() && in_flight_.empty();
    }

    [[nodiscard]] bool idling() const noexcept
    {
        for (const auto& e : in_flight_)
        {
            if (e.req.idle && !e.done_sent)
                return true;
        }
        return false;
    }

    [[nodiscard]] bool is_outstanding(std::string_view tag) const noexcept
    {
        for (const auto& list : {&queue_, &in_flight_})
        {
            for (const auto& e : *list)
            {
                if (e.tag == tag)
                    return true;
            }
        }
        return false;
    }

private:
    struct entry
    {
        std::string tag;
        pending_request req;
        /// Index of the next part to write.
        std::size_t next_part = 0;
        bool started = false;
        bool awaiting_literal = false;
        bool literal_granted = false;
        bool barrier = false;
        bool cancelled = false;
        bool idle_accepted = false;
        bool done_requested = false;
        bool done_sent = false;
    };

    [[nodiscard]] static bool is_barrier(std::string_view verb) noexcept
    {
        static constexpr std::string_view barriers[] = {
            "SELECT", "EXAMINE", "CLOSE", "UNSELECT", "LOGOUT", "LOGIN", "AUTHENTICATE", "IDLE"
        };
        return std::find(std::begin(barriers), std::end(barriers), verb) != std::end(barriers);
    }

    [[nodiscard]] std::string next_tag()
    {
        while (true)
        {
            std::string tag = "A";
            const auto start = tag.size();
            detail::append_uint(tag, ++counter_, 36);
            for (auto i = start; i < tag.size(); ++i)
                tag[i] = detail::ascii_toupper(tag[i]);
            if (!is_outstanding(tag))
                return tag;
        }
    }

    std::list<entry>::iterator find_in_flight(std::string_view tag)
    {
        return std::find_if(in_flight_.begin(), in_flight_.end(),
            [tag](const entry& e) { return e.tag == tag; });
    }

    [[nodiscard]] bool can_send(const entry& next) const noexcept
    {
        for (const auto& e : in_flight_)
        {
            // No interleaving inside a command, nothing next to IDLE or a barrier.
            if (e.awaiting_literal || e.req.idle || e.barrier)
                return false;
        }
        if (next.barrier)
            return in_flight_.empty();
        return in_flight_.size() < max_in_flight_;
    }

    void pump()
    {
        if (pumping_)
        {
            repump_ = true;
            return;
        }
        pumping_ = true;
        do
        {
            repump_ = false;
            while (!queue_.empty() && can_send(queue_.front()))
            {
                in_flight_.splice(in_flight_.end(), queue_, queue_.begin());
                entry& e = in_flight_.back();
                if (e.req.on_sent)
                    e.req.on_sent();
                write_parts(e);
            }
        } while (repump_);
        pumping_ = false;
    }

    /// Writes from `next_part` up to the next synchronizing literal or the end.
    void write_parts(entry& e)
    {
        std::string out;
        if (!e.started)
        {
            e.started = true;
            detail::append_sv(out, e.tag);
            detail::append_space(out);
        }

        const auto& parts = e.req.line.parts();
        while (e.next_part < parts.size())
        {
            const auto& part = parts[e.next_part];
            if (part.type == command_part::kind::text)
            {
                detail::append_sv(out, part.data);
                ++e.next_part;
                continue;
            }

            if (e.literal_granted)
            {
                e.literal_granted = false;
                flush(out, e.req.sensitive);
                write_literal(part.data, e.req.sensitive);
                ++e.next_part;
                continue;
            }

            detail::append_literal_header(out, part.data.size(), literal_plus_);
            detail::append_crlf(out);
            if (literal_plus_)
            {
                flush(out, e.req.sensitive);
                write_literal(part.data, e.req.sensitive);
                ++e.next_part;
                continue;
            }

            flush(out, e.req.sensitive);
            e.awaiting_literal = true;
            return;
        }

        detail::append_crlf(out);
        flush(out, e.req.sensitive);
    }

    void flush(std::string& out, bool sensitive)
    {
        if (out.empty())
            return;
        trace(out, sensitive);
        write_(std::move(out));
        out.clear();
    }

    void write_literal(const std::string& data, bool sensitive)
    {
        if (sensitive && redact_)
            trace_raw("<redacted literal>");
        else
            trace_raw(data);
        write_(data);
    }

    void write_done(entry& e)
    {
        e.done_sent = true;
        trace("DONE\r\n", false);
        write_("DONE\r\n");
    }

    void end_idle(entry& e)
    {
        if (e.done_sent)
            return;
        if (e.idle_accepted)
            write_done(e);
        else
            e.done_requested = true;
    }

    void trace(std::string_view line, bool sensitive)
    {
        if (redact_ && sensitive)
            trace_raw(detail::redact_line(line));
        else
            trace_raw(line);
    }

    void trace_raw(std::string_view line)
    {
        IMAPXX_TRACE_SEND("IMAP", line);
        if (on_trace_)
            on_trace_(line);
    }

    [[nodiscard]] static error server_error(const tagged_response& resp)
    {
        std::string full;
        if (!resp.result.code.empty())
        {
            detail::append_char(full, '[');
            detail::append_sv(full, resp.result.code);
            if (!resp.result.code_args.empty())
            {
                detail::append_space(full);
                detail::append_sv(full, resp.result.code_args);
            }
            detail::append_sv(full, "] ");
        }
        detail::append_sv(full, resp.result.text);
        const auto code = resp.result.st == status::no ? error_code::imap_no : error_code::imap_bad;
        return error(code, resp.result.text, std::move(full));
    }

    static void complete(entry& e, const error& err)
    {
        if (e.req.on_done)
        {
            auto done = std::move(e.req.on_done);
            done(std::unexpected(err));
        }
    }

    void notify_drained()
    {
        if (empty() && on_drained_)
            on_drained_();
    }

    writer write_;
    std::list<entry> queue_;
    std::list<entry> in_flight_;
    std::uint64_t counter_ = 0;
    std::size_t max_in_flight_ = 1;
    bool literal_plus_ = false;
    bool redact_ = true;
    bool pumping_ = false;
    bool repump_ = false;
    std::function<void()> on_drained_;
    std::function<void(std::string_view)> on_trace_;
};

} // namespace imapxx::imap
