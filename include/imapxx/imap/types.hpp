/*

types.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <imapxx/detail/append.hpp>
#include <imapxx/detail/ascii.hpp>
#include <imapxx/detail/result.hpp>

namespace imapxx::imap
{

enum class status
{
    ok,
    no,
    bad,
    preauth,
    bye,
    unknown
};

[[nodiscard]] inline status parse_status(std::string_view word) noexcept
{
    if (detail::iequals_ascii(word, "OK"))
        return status::ok;
    if (detail::iequals_ascii(word, "NO"))
        return status::no;
    if (detail::iequals_ascii(word, "BAD"))
        return status::bad;
    if (detail::iequals_ascii(word, "PREAUTH"))
        return status::preauth;
    if (detail::iequals_ascii(word, "BYE"))
        return status::bye;
    return status::unknown;
}

enum class connection_state
{
    disconnected,
    connected,
    authenticated,
    selected
};

[[nodiscard]] constexpr std::string_view to_string(connection_state state) noexcept
{
    switch (state)
    {
        case connection_state::disconnected: return "disconnected";
        case connection_state::connected: return "connected";
        case connection_state::authenticated: return "authenticated";
        case connection_state::selected: return "selected";
    }
    return "unknown";
}

/// Parsed IMAP value: atom, quoted string, literal, NIL or parenthesized list.
struct value
{
    enum class kind
    {
        atom,
        string,
        literal,
        nil,
        list
    };

    kind type = kind::nil;
    std::string text;
    std::vector<value> items;

    [[nodiscard]] bool is_nil() const noexcept { return type == kind::nil; }
    [[nodiscard]] bool is_list() const noexcept { return type == kind::list; }
    [[nodiscard]] bool is_atom() const noexcept { return type == kind::atom; }

    /// Atom, quoted string or literal.
    [[nodiscard]] bool is_text() const noexcept
    {
        return type == kind::atom || type == kind::string || type == kind::literal;
    }

    [[nodiscard]] static value make_atom(std::string text)
    {
        return value{kind::atom, std::move(text), {}};
    }

    [[nodiscard]] static value make_string(std::string text)
    {
        return value{kind::string, std::move(text), {}};
    }

    [[nodiscard]] static value make_literal(std::string text)
    {
        return value{kind::literal, std::move(text), {}};
    }

    [[nodiscard]] static value make_list(std::vector<value> items)
    {
        return value{kind::list, {}, std::move(items)};
    }
};

struct namespace_extension
{
    std::string name;
    std::vector<std::string> params;
};

struct namespace_entry
{
    std::string prefix;
    std::optional<char> delimiter;
    std::vector<namespace_extension> extensions;
};

struct namespaces
{
    std::vector<namespace_entry> personal;
    std::vector<namespace_entry> other;
    std::vector<namespace_entry> shared;
};

/// Message counters of a mailbox; `recent` counts messages with \Recent ("new").
struct message_counts
{
    std::uint32_t total = 0;
    std::uint32_t recent = 0;
    std::uint32_t unseen = 0;
};

/// Snapshot of a mailbox, either the selected one or a STATUS reply.
struct mailbox
{
    std::string name;
    bool read_only = false;
    std::optional<char> delimiter;
    std::vector<std::string> flags;
    std::vector<std::string> permanent_flags;
    /// Non-system permanent flags.
    std::vector<std::string> keywords;
    /// `\*` present in PERMANENTFLAGS.
    bool new_keywords = false;
    std::uint32_t uid_validity = 0;
    std::uint32_t uid_next = 0;
    bool persistent_uids = true;
    std::uint64_t highest_modseq = 0;
    message_counts messages;
};

struct body_info
{
    /// Section specifier without the BODY[] wrapper, e.g. `TEXT` or `HEADER.FIELDS (FROM)`.
    std::string which;
    std::uint64_t size = 0;
    std::uint32_t seqno = 0;
};

struct message_attributes
{
    std::uint32_t uid = 0;
    std::uint32_t seqno = 0;
    std::vector<std::string> flags;
    std::optional<std::chrono::system_clock::time_point> date;
    std::optional<std::uint64_t> size;
    std::optional<value> structure;
    std::optional<value> envelope;
    std::optional<std::uint64_t> modseq;
    std::optional<std::uint64_t> x_gm_thrid;
    std::optional<std::uint64_t> x_gm_msgid;
    std::vector<std::string> x_gm_labels;
    /// Attributes without a dedicated field, keyed by upper-cased name.
    std::map<std::string, value> extensions;
};

/// One node of the `get_boxes` result.
struct mailbox_node
{
    std::string name;
    std::string full_name;
    std::vector<std::string> attribs;
    std::optional<char> delimiter;
    std::vector<mailbox_node> children;
};

using mailbox_tree = std::vector<mailbox_node>;

[[nodiscard]] inline const mailbox_node* find_box(const mailbox_tree& tree, std::string_view name) noexcept
{
    for (const auto& node : tree)
    {
        if (node.name == name)
            return &node;
    }
    return nullptr;
}

/// Message identifiers: numbers, ranges such as `2504:2507` or `2504:*`, or `*`.
class message_set
{
public:
    message_set() = default;

    message_set(std::uint32_t id)
    {
        add(id);
    }

    message_set(std::initializer_list<std::uint32_t> ids)
    {
        for (auto id : ids)
            add(id);
    }

    message_set& add(std::uint32_t id)
    {
        std::string item;
        detail::append_uint(item, id);
        items_.push_back(std::move(item));
        return *this;
    }

    /// `last == 0` stands for `*`.
    message_set& add_range(std::uint32_t first, std::uint32_t last)
    {
        std::string item;
        detail::append_uint(item, first);
        detail::append_char(item, ':');
        if (last == 0)
            detail::append_char(item, '*');
        else
            detail::append_uint(item, last);
        items_.push_back(std::move(item));
        return *this;
    }

    /// Accepts `n`, `*`, `n:m`, `n:*` and comma-separated lists of those.
    result_void add(std::string_view text)
    {
        if (text.empty())
            return fail(error_code::invalid_argument, "Empty message identifier.");

        std::vector<std::string> parsed;
        while (!text.empty())
        {
            const auto comma = text.find(',');
            const auto item = text.substr(0, comma);
            if (!valid_item(item))
            {
                std::string message = "Invalid message identifier: ";
                message += item;
                return fail(error_code::invalid_argument, std::move(message));
            }
            parsed.emplace_back(item);
            if (comma == std::string_view::npos)
                break;
            text.remove_prefix(comma + 1);
            if (text.empty())
                return fail(error_code::invalid_argument, "Trailing comma in message identifiers.");
        }
        for (auto& item : parsed)
            items_.push_back(std::move(item));
        return ok();
    }

    [[nodiscard]] static result<message_set> parse(std::string_view text)
    {
        message_set set;
        IMAPXX_TRY_VOID(set.add(text));
        return set;
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return items_.empty();
    }

    /// Wire form, comma-joined. Message numbers start at 1, so an item
    /// holding 0 is rejected here.
    [[nodiscard]] result<std::string> str() const
    {
        if (items_.empty())
            return fail<std::string>(error_code::invalid_argument, "Empty message source.");
        std::string out;
        for (std::size_t i = 0; i < items_.size(); ++i)
        {
            if (!valid_item(items_[i]))
            {
                std::string message = "Invalid message identifier: ";
                message += items_[i];
                return fail<std::string>(error_code::invalid_argument, std::move(message));
            }
            if (i > 0)
                detail::append_char(out, ',');
            detail::append_sv(out, items_[i]);
        }
        return out;
    }

private:
    [[nodiscard]] static bool valid_number(std::string_view part) noexcept
    {
        if (part == "*")
            return true;
        std::uint32_t n = 0;
        return detail::parse_uint(part, n) && n > 0;
    }

    [[nodiscard]] static bool valid_item(std::string_view item) noexcept
    {
        const auto colon = item.find(':');
        if (colon == std::string_view::npos)
            return valid_number(item);
        return valid_number(item.substr(0, colon)) && valid_number(item.substr(colon + 1));
    }

    std::vector<std::string> items_;
};

/// RFC 3501 system flags; others are keywords.
[[nodiscard]] inline bool is_system_flag(std::string_view flag) noexcept
{
    static constexpr std::string_view system_flags[] = {
        "\\Seen", "\\Answered", "\\Flagged", "\\Deleted", "\\Draft", "\\Recent"
    };
    for (auto f : system_flags)
    {
        if (detail::iequals_ascii(flag, f))
            return true;
    }
    return false;
}

/// `Seen` or `\seen` to `\Seen`; anything else unchanged.
[[nodiscard]] inline std::string normalize_flag(std::string_view flag)
{
    std::string_view bare = flag;
    if (!bare.empty() && bare.front() == '\\')
        bare.remove_prefix(1);
    static constexpr std::string_view system_flags[] = {
        "Seen", "Answered", "Flagged", "Deleted", "Draft"
    };
    for (auto f : system_flags)
    {
        if (detail::iequals_ascii(bare, f))
        {
            std::string out = "\\";
            out += f;
            return out;
        }
    }
    return std::string(flag);
}

} // namespace imapxx::imap
