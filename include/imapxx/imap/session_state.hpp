/*

session_state.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Connection state machine, capability set and the selected mailbox with its
sequence number to UID table. The table only holds messages the server told
something about, so its size never follows a count announced by the server.

*/

#pragma once

#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <imapxx/detail/append.hpp>
#include <imapxx/detail/ascii.hpp>
#include <imapxx/detail/log.hpp>
#include <imapxx/detail/result.hpp>
#include <imapxx/imap/fetch.hpp>
#include <imapxx/imap/parser.hpp>
#include <imapxx/imap/types.hpp>

namespace imapxx::imap
{

/// Side effects of applying a server push, for the dispatcher.
struct mail_notice
{
    std::uint32_t count = 0;
};

struct expunge_notice
{
    std::uint32_t seqno = 0;
    /// 0 when the UID was never learned.
    std::uint32_t uid = 0;
};

struct uidvalidity_notice
{
    std::uint32_t uid_validity = 0;
};

struct alert_notice
{
    std::string text;
};

using state_notice = std::variant<mail_notice, expunge_notice, uidvalidity_notice, alert_notice>;

class session_state
{
public:
    [[nodiscard]] connection_state state() const noexcept
    {
        return state_;
    }

    /// Forward transitions, `selected -> authenticated` on close, anything to `disconnected`.
    result_void transition(connection_state to)
    {
        const auto from = state_;
        const bool allowed = to == connection_state::disconnected
            || static_cast<int>(to) == static_cast<int>(from) + 1
            || (from == connection_state::connected && to == connection_state::authenticated)
            || (from == connection_state::selected && to == connection_state::authenticated)
            || (from == connection_state::selected && to == connection_state::selected);
        if (!allowed)
        {
            std::string message = "Invalid state transition from ";
            message += to_string(from);
            message += " to ";
            message += to_string(to);
            return fail(error_code::invalid_state, std::move(message));
        }
        state_ = to;
        if (to == connection_state::disconnected)
            clear_session();
        return ok();
    }

    // Capabilities

    void set_capabilities(std::vector<std::string> caps)
    {
        capabilities_.clear();
        for (auto& cap : caps)
            capabilities_.insert(detail::to_upper_ascii(cap));
    }

    [[nodiscard]] bool has_capability(std::string_view cap) const
    {
        return capabilities_.count(detail::to_upper_ascii(cap)) != 0;
    }

    [[nodiscard]] const std::set<std::string>& capabilities() const noexcept
    {
        return capabilities_;
    }

    [[nodiscard]] bool has_capabilities() const noexcept
    {
        return !capabilities_.empty();
    }

    void set_namespaces(namespaces ns)
    {
        namespaces_ = std::move(ns);
    }

    [[nodiscard]] const namespaces& get_namespaces() const noexcept
    {
        return namespaces_;
    }

    void set_delimiter(std::optional<char> delimiter) noexcept
    {
        delimiter_ = delimiter;
    }

    [[nodiscard]] std::optional<char> delimiter() const noexcept
    {
        return delimiter_;
    }

    // Selected mailbox

    /// SELECT/EXAMINE written: a fresh snapshot collects the untagged data.
    void begin_select(std::string name, bool read_only)
    {
        box_ = mailbox{};
        box_->name = std::move(name);
        box_->read_only = read_only;
        box_->delimiter = delimiter_;
        slots_.clear();
        selecting_ = true;
    }

    /// Tagged OK of SELECT/EXAMINE, its response code already applied.
    result<mailbox> finish_select()
    {
        selecting_ = false;
        if (!box_)
            return fail<mailbox>(error_code::invalid_state, "No mailbox is being selected.");
        IMAPXX_TRY_VOID(transition(connection_state::selected));
        return *box_;
    }

    /// A failed SELECT leaves no mailbox selected.
    void abort_select()
    {
        drop_box();
    }

    void close_box()
    {
        drop_box();
    }

    [[nodiscard]] const std::optional<mailbox>& box() const noexcept
    {
        return box_;
    }

    /// INBOX is case-insensitive, other names are compared as given.
    [[nodiscard]] bool is_selected(std::string_view name) const noexcept
    {
        if (state_ != connection_state::selected || !box_)
            return false;
        if (detail::iequals_ascii(name, "INBOX"))
            return detail::iequals_ascii(box_->name, "INBOX");
        return box_->name == name;
    }

    // Sequence number table

    [[nodiscard]] std::size_t message_count() const noexcept
    {
        return box_ ? box_->messages.total : 0;
    }

    /// Number of messages whose UID or flags are known.
    [[nodiscard]] std::size_t tracked_count() const noexcept
    {
        return slots_.size();
    }

    [[nodiscard]] std::optional<std::uint32_t> uid_of(std::uint32_t seqno) const
    {
        const auto it = slots_.find(seqno);
        if (it == slots_.end() || it->second.uid == 0)
            return std::nullopt;
        return it->second.uid;
    }

    [[nodiscard]] std::optional<std::uint32_t> seqno_of(std::uint32_t uid) const noexcept
    {
        for (const auto& [seqno, slot] : slots_)
        {
            if (slot.uid == uid)
                return seqno;
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<std::vector<std::string>> flags_of(std::uint32_t uid) const
    {
        for (const auto& [seqno, slot] : slots_)
        {
            if (slot.uid == uid)
                return slot.flags;
        }
        return std::nullopt;
    }

    /**
    Applies an untagged response and returns the notifications it causes.

    EXPUNGE or FETCH naming a sequence number outside the mailbox is a
    `protocol_violation`.
    **/
    result<std::vector<state_notice>> apply(const untagged_response& resp)
    {
        std::vector<state_notice> notices;
        switch (resp.kind)
        {
            case untagged_kind::condition:
                if (resp.condition.code == "ALERT")
                    notices.push_back(alert_notice{resp.condition.text});
                if (auto n = apply_code(resp.condition))
                    notices.push_back(*n);
                break;

            case untagged_kind::capability:
                set_capabilities(capabilities_from(resp));
                break;

            case untagged_kind::exists:
                if (box_)
                {
                    const auto previous = box_->messages.total;
                    box_->messages.total = resp.number;
                    if (resp.number < previous)
                        slots_.erase(slots_.upper_bound(resp.number), slots_.end());
                    if (!selecting_ && resp.number > previous)
                        notices.push_back(mail_notice{resp.number - previous});
                }
                break;

            case untagged_kind::recent:
                if (box_)
                    box_->messages.recent = resp.number;
                break;

            case untagged_kind::expunge:
                if (box_)
                {
                    state_notice n;
                    IMAPXX_TRY_ASSIGN(n, apply_expunge(resp));
                    notices.push_back(std::move(n));
                }
                break;

            case untagged_kind::fetch:
                IMAPXX_TRY_VOID(apply_fetch(resp));
                break;

            case untagged_kind::flags:
                if (box_ && !resp.values.empty() && resp.values.front().is_list())
                    box_->flags = flags_from(resp.values.front());
                break;

            default:
                break;
        }
        return notices;
    }

    /// Response code of a tagged or untagged condition; a UIDVALIDITY change
    /// invalidates every cached UID.
    std::optional<state_notice> apply_code(const status_response& resp)
    {
        const auto& code = resp.code;
        if (code.empty())
            return std::nullopt;
        if (code == "CAPABILITY")
        {
            set_capabilities(parse_capabilities(resp.code_args));
            return std::nullopt;
        }
        if (!box_)
            return std::nullopt;

        if (code == "UIDVALIDITY")
        {
            std::uint32_t v = 0;
            if (!detail::parse_uint(resp.code_args, v))
                return std::nullopt;
            const bool changed = box_->uid_validity != 0 && box_->uid_validity != v;
            box_->uid_validity = v;
            if (changed)
            {
                slots_.clear();
                if (!selecting_)
                    return uidvalidity_notice{v};
            }
        }
        else if (code == "UIDNEXT")
        {
            std::uint32_t v = 0;
            if (detail::parse_uint(resp.code_args, v))
                box_->uid_next = v;
        }
        else if (code == "UNSEEN")
        {
            // First unseen sequence number, kept until a STATUS gives the count.
            std::uint32_t v = 0;
            if (detail::parse_uint(resp.code_args, v))
                box_->messages.unseen = v;
        }
        else if (code == "PERMANENTFLAGS")
        {
            box_->permanent_flags = flags_from_text(resp.code_args);
            box_->keywords.clear();
            box_->new_keywords = false;
            for (const auto& flag : box_->permanent_flags)
            {
                if (flag == "\\*")
                    box_->new_keywords = true;
                else if (!flag.empty() && flag.front() != '\\')
                    box_->keywords.push_back(flag);
            }
        }
        else if (code == "READ-ONLY")
            box_->read_only = true;
        else if (code == "READ-WRITE")
            box_->read_only = false;
        else if (code == "UIDNOTSTICKY")
            box_->persistent_uids = false;
        else if (code == "HIGHESTMODSEQ")
        {
            std::uint64_t v = 0;
            if (detail::parse_uint(resp.code_args, v))
                box_->highest_modseq = v;
        }
        else if (code == "NOMODSEQ")
            box_->highest_modseq = 0;
        return std::nullopt;
    }

private:
    struct slot_t
    {
        std::uint32_t uid = 0;
        std::optional<std::vector<std::string>> flags;
    };

    [[nodiscard]] result_void check_seqno(const untagged_response& resp) const
    {
        if (resp.number != 0 && resp.number <= box_->messages.total)
            return ok();
        std::string message = "Sequence number ";
        detail::append_uint(message, resp.number);
        message += " is outside the mailbox of ";
        detail::append_uint(message, box_->messages.total);
        message += " messages.";
        return std::unexpected(error(error_code::protocol_violation, std::move(message), resp.raw));
    }

    result<state_notice> apply_expunge(const untagged_response& resp)
    {
        IMAPXX_TRY_VOID(check_seqno(resp));
        const auto seqno = resp.number;
        std::uint32_t uid = 0;

        // Every later message moves down by one, UIDs stay attached to their messages.
        auto it = slots_.find(seqno);
        if (it != slots_.end())
        {
            uid = it->second.uid;
            it = slots_.erase(it);
        }
        else
            it = slots_.upper_bound(seqno);
        while (it != slots_.end())
        {
            auto node = slots_.extract(it++);
            --node.key();
            slots_.insert(std::move(node));
        }

        --box_->messages.total;
        if (box_->messages.recent > box_->messages.total)
            box_->messages.recent = box_->messages.total;
        return state_notice{expunge_notice{seqno, uid}};
    }

    result_void apply_fetch(const untagged_response& resp)
    {
        if (!box_)
            return ok();
        IMAPXX_TRY_VOID(check_seqno(resp));
        auto fetched = fetched_from(resp);
        if (!fetched)
            return ok();
        auto& slot = slots_[resp.number];
        const auto& attrs = fetched->attributes;
        if (attrs.uid != 0)
            slot.uid = attrs.uid;
        if (has_item(resp, "FLAGS"))
            slot.flags = attrs.flags;
        return ok();
    }

    [[nodiscard]] static bool has_item(const untagged_response& resp, std::string_view name)
    {
        const auto& items = resp.values.front().items;
        for (std::size_t i = 0; i < items.size(); i += 2)
        {
            if (items[i].is_atom() && detail::iequals_ascii(items[i].text, name))
                return true;
        }
        return false;
    }

    void drop_box()
    {
        selecting_ = false;
        box_.reset();
        slots_.clear();
        if (state_ == connection_state::selected)
            state_ = connection_state::authenticated;
    }

    void clear_session()
    {
        box_.reset();
        slots_.clear();
        selecting_ = false;
        capabilities_.clear();
        namespaces_ = namespaces{};
        delimiter_.reset();
    }

    connection_state state_ = connection_state::disconnected;
    std::set<std::string> capabilities_;
    namespaces namespaces_;
    std::optional<char> delimiter_;
    std::optional<mailbox> box_;
    std::map<std::uint32_t, slot_t> slots_;
    bool selecting_ = false;
};

} // namespace imapxx::imap
