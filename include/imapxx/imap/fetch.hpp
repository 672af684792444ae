/*

fetch.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <imapxx/detail/append.hpp>
#include <imapxx/detail/ascii.hpp>
#include <imapxx/detail/result.hpp>
#include <imapxx/detail/sanitize.hpp>
#include <imapxx/imap/command.hpp>
#include <imapxx/imap/parser.hpp>
#include <imapxx/imap/types.hpp>

namespace imapxx::imap
{

struct fetch_options
{
    /// Use BODY[] instead of BODY.PEEK[] so the server sets \Seen.
    bool mark_seen = false;
    bool structure = false;
    bool envelope = false;
    bool size = false;
    /// Extension items such as `X-GM-LABELS` or `MODSEQ`.
    std::vector<std::string> extensions;
    /// Fetch modifiers, e.g. `CHANGEDSINCE 12345`.
    std::vector<std::string> modifiers;
    /// Body sections: `HEADER`, `TEXT`, `HEADER.FIELDS (TO FROM)`, `1.2`, `` for the whole message.
    std::vector<std::string> bodies;
};

/// Per-message callbacks of a fetch, invoked as bodies, attributes, end.
struct fetch_handlers
{
    std::function<void(const body_info&, std::string)> on_body;
    std::function<void(const message_attributes&)> on_attributes;
    std::function<void(std::uint32_t seqno)> on_end;
};

struct fetched_message
{
    message_attributes attributes;
    std::vector<std::pair<body_info, std::string>> bodies;
};

namespace fetch_detail
{

[[nodiscard]] inline bool valid_section(std::string_view section) noexcept
{
    for (char ch : section)
    {
        const auto c = static_cast<unsigned char>(ch);
        if (c < 0x20 || c >= 0x7f || ch == '[' || ch == ']')
            return false;
    }
    return true;
}

[[nodiscard]] inline bool is_gmail_item(std::string_view item) noexcept
{
    return detail::starts_with_ci(item, "X-GM-");
}

/// `BODY[HEADER.FIELDS (FROM)]<0>` to `HEADER.FIELDS (FROM)`; nullopt when not a body item.
[[nodiscard]] inline std::optional<std::string> section_of(std::string_view item)
{
    const auto open = item.find('[');
    if (open == std::string_view::npos)
        return std::nullopt;
    const auto name = item.substr(0, open);
    if (!detail::iequals_ascii(name, "BODY") && !detail::iequals_ascii(name, "BODY.PEEK")
        && !detail::iequals_ascii(name, "BINARY"))
        return std::nullopt;
    const auto close = item.rfind(']');
    if (close == std::string_view::npos || close < open)
        return std::nullopt;
    return std::string(item.substr(open + 1, close - open - 1));
}

} // namespace fetch_detail

struct compiled_fetch
{
    command_line items;
    command_line modifiers;
    bool gmail = false;
    bool condstore = false;
};

/// FETCH item list: `(UID FLAGS INTERNALDATE ...)` and the optional modifier list.
[[nodiscard]] inline result<compiled_fetch> compile_fetch(const fetch_options& opts)
{
    compiled_fetch out;
    out.items.open_list();
    out.items.atom("UID").atom("FLAGS").atom("INTERNALDATE");
    if (opts.structure)
        out.items.atom("BODYSTRUCTURE");
    if (opts.envelope)
        out.items.atom("ENVELOPE");
    if (opts.size)
        out.items.atom("RFC822.SIZE");

    for (const auto& ext : opts.extensions)
    {
        if (!detail::is_atom(ext))
        {
            std::string message = "Invalid fetch extension: ";
            message += ext;
            return fail<compiled_fetch>(error_code::invalid_argument, std::move(message));
        }
        if (fetch_detail::is_gmail_item(ext))
            out.gmail = true;
        if (detail::iequals_ascii(ext, "MODSEQ"))
            out.condstore = true;
        out.items.atom(detail::to_upper_ascii(ext));
    }

    for (const auto& section : opts.bodies)
    {
        if (!fetch_detail::valid_section(section))
        {
            std::string message = "Invalid body section: ";
            message += section;
            return fail<compiled_fetch>(error_code::invalid_argument, std::move(message));
        }
        std::string item = opts.mark_seen ? "BODY[" : "BODY.PEEK[";
        item += section;
        item += ']';
        out.items.atom(item);
    }
    out.items.close_list();

    if (!opts.modifiers.empty())
    {
        out.modifiers.open_list();
        for (const auto& modifier : opts.modifiers)
        {
            IMAPXX_TRY_VOID(detail::ensure_no_crlf_or_nul(modifier, "fetch modifier"));
            if (detail::starts_with_ci(modifier, "CHANGEDSINCE"))
                out.condstore = true;
            out.modifiers.atom(modifier);
        }
        out.modifiers.close_list();
    }
    return out;
}

/// Interprets `* n FETCH (...)`.
[[nodiscard]] inline result<fetched_message> fetched_from(const untagged_response& resp)
{
    if (resp.kind != untagged_kind::fetch || resp.values.size() != 1 || !resp.values.front().is_list())
        return std::unexpected(error(error_code::parse_error, "Not a FETCH response.", resp.raw));

    fetched_message out;
    auto& attrs = out.attributes;
    attrs.seqno = resp.number;

    const auto& items = resp.values.front().items;
    if (items.size() % 2 != 0)
        return std::unexpected(error(error_code::parse_error, "Odd FETCH item list.", resp.raw));

    for (std::size_t i = 0; i < items.size(); i += 2)
    {
        const auto& key_value = items[i];
        const auto& v = items[i + 1];
        if (!key_value.is_atom())
            return std::unexpected(error(error_code::parse_error, "FETCH item name is not an atom.", resp.raw));
        const auto key = detail::to_upper_ascii(key_value.text);

        if (auto section = fetch_detail::section_of(key_value.text))
        {
            body_info info;
            info.which = std::move(*section);
            info.seqno = resp.number;
            std::string data = v.is_nil() ? std::string{} : v.text;
            info.size = data.size();
            out.bodies.emplace_back(std::move(info), std::move(data));
            continue;
        }

        if (key == "UID")
        {
            std::uint32_t uid = 0;
            if (!v.is_atom() || !detail::parse_uint(v.text, uid))
                return std::unexpected(error(error_code::parse_error, "Bad UID in FETCH.", resp.raw));
            attrs.uid = uid;
        }
        else if (key == "FLAGS")
        {
            if (!v.is_list())
                return std::unexpected(error(error_code::parse_error, "Bad FLAGS in FETCH.", resp.raw));
            attrs.flags = flags_from(v);
        }
        else if (key == "INTERNALDATE")
        {
            if (v.is_text())
                attrs.date = parse_internal_date(v.text);
        }
        else if (key == "RFC822.SIZE")
        {
            std::uint64_t n = 0;
            if (v.is_atom() && detail::parse_uint(v.text, n))
                attrs.size = n;
        }
        else if (key == "BODYSTRUCTURE" || key == "BODY")
            attrs.structure = v;
        else if (key == "ENVELOPE")
            attrs.envelope = v;
        else if (key == "MODSEQ")
        {
            std::uint64_t n = 0;
            if (v.is_list() && !v.items.empty() && v.items.front().is_atom() && detail::parse_uint(v.items.front().text, n))
                attrs.modseq = n;
        }
        else if (key == "X-GM-THRID" || key == "X-GM-MSGID")
        {
            std::uint64_t n = 0;
            if (v.is_atom() && detail::parse_uint(v.text, n))
                (key == "X-GM-THRID" ? attrs.x_gm_thrid : attrs.x_gm_msgid) = n;
        }
        else if (key == "X-GM-LABELS")
        {
            if (v.is_list())
                attrs.x_gm_labels = flags_from(v);
        }
        else
            attrs.extensions[key] = v;
    }
    return out;
}

} // namespace imapxx::imap
