/*

dispatcher.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <imapxx/detail/log.hpp>
#include <imapxx/detail/result.hpp>
#include <imapxx/imap/types.hpp>

namespace imapxx::imap
{

enum class event_kind
{
    ready,
    error,
    end,
    close,
    alert,
    mail,
    expunge,
    update,
    uidvalidity
};

[[nodiscard]] constexpr std::string_view to_string(event_kind kind) noexcept
{
    switch (kind)
    {
        case event_kind::ready: return "ready";
        case event_kind::error: return "error";
        case event_kind::end: return "end";
        case event_kind::close: return "close";
        case event_kind::alert: return "alert";
        case event_kind::mail: return "mail";
        case event_kind::expunge: return "expunge";
        case event_kind::update: return "update";
        case event_kind::uidvalidity: return "uidvalidity";
    }
    return "unknown";
}

/**
Payload of a connection event. Which fields are meaningful depends on `kind`:

- `error`: `err`;
- `close`: `had_error`;
- `alert`: `message`;
- `mail`: `number` (count of new messages);
- `expunge`: `number` (sequence number), `uid` when known;
- `update`: `number` (sequence number), `attributes`;
- `uidvalidity`: `number` (new UIDVALIDITY).
**/
struct event
{
    event_kind kind = event_kind::ready;
    std::optional<error> err;
    bool had_error = false;
    std::string message;
    std::uint32_t number = 0;
    std::uint32_t uid = 0;
    std::optional<message_attributes> attributes;
};

/// Observer registry; delivery is synchronous and in registration order.
class dispatcher
{
public:
    using observer = std::function<void(const event&)>;
    using observer_id = std::size_t;

    observer_id on(event_kind kind, observer fn)
    {
        const auto id = ++last_id_;
        observers_.push_back(registration{id, kind, std::move(fn)});
        return id;
    }

    bool off(observer_id id)
    {
        auto it = std::find_if(observers_.begin(), observers_.end(),
            [id](const registration& r) { return r.id == id; });
        if (it == observers_.end())
            return false;
        observers_.erase(it);
        return true;
    }

    /// Deliver `ev`; `ready`, `error`, `end` and `close` at most once until `rearm()`.
    /// Returns false when the event was suppressed.
    bool emit(const event& ev)
    {
        if (is_once(ev.kind))
        {
            auto& fired = fired_[static_cast<std::size_t>(ev.kind)];
            if (fired)
                return false;
            fired = true;
        }

        // Observers may register or remove observers while being called.
        const auto snapshot = observers_;
        for (const auto& r : snapshot)
        {
            if (r.kind != ev.kind || !r.fn)
                continue;
            try
            {
                r.fn(ev);
            }
            catch (const std::exception& exc)
            {
                std::string message = "Observer of '";
                message += to_string(ev.kind);
                message += "' threw: ";
                message += exc.what();
                IMAPXX_ERROR(message);
            }
            catch (...)
            {
                std::string message = "Observer of '";
                message += to_string(ev.kind);
                message += "' threw an unknown exception";
                IMAPXX_ERROR(message);
            }
        }
        return true;
    }

    [[nodiscard]] bool fired(event_kind kind) const noexcept
    {
        return fired_[static_cast<std::size_t>(kind)];
    }

    /// New connection lifetime.
    void rearm() noexcept
    {
        for (auto& f : fired_)
            f = false;
    }

    [[nodiscard]] std::size_t size() const noexcept
    {
        return observers_.size();
    }

private:
    struct registration
    {
        observer_id id = 0;
        event_kind kind = event_kind::ready;
        observer fn;
    };

    [[nodiscard]] static constexpr bool is_once(event_kind kind) noexcept
    {
        return kind == event_kind::ready || kind == event_kind::error
            || kind == event_kind::end || kind == event_kind::close;
    }

    std::vector<registration> observers_;
    observer_id last_id_ = 0;
    bool fired_[9] = {};
};

} // namespace imapxx::imap
