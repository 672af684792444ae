/*

parser.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Turns tokenized response lines into typed responses and interprets the
untagged data responses a client needs.

*/

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include <imapxx/detail/append.hpp>
#include <imapxx/detail/ascii.hpp>
#include <imapxx/detail/log.hpp>
#include <imapxx/detail/result.hpp>
#include <imapxx/imap/tokenizer.hpp>
#include <imapxx/imap/types.hpp>
#include <imapxx/imap/utf7.hpp>

namespace imapxx::imap
{

enum class untagged_kind
{
    condition,
    capability,
    exists,
    recent,
    expunge,
    fetch,
    search,
    list,
    lsub,
    status,
    flags,
    namespace_,
    other
};

/// Status word, optional `[CODE args]` and human readable text.
struct status_response
{
    status st = status::unknown;
    std::string code;
    std::string code_args;
    std::string text;
};

struct untagged_response
{
    untagged_kind kind = untagged_kind::other;
    /// Upper-cased response keyword (`EXISTS`, `FETCH`, `OK`, ...).
    std::string keyword;
    std::uint32_t number = 0;
    status_response condition;
    std::vector<value> values;
    std::string raw;
};

struct tagged_response
{
    std::string tag;
    status_response result;
};

namespace parser_detail
{

[[nodiscard]] inline error grammar_error(std::string_view what, std::string_view line)
{
    std::string message(what);
    detail::append_sv(message, " Line: ");
    detail::append_sv(message, line.substr(0, 120));
    return error(error_code::parse_error, std::move(message));
}

/// Reads values from a response line, crossing into literals.
class value_reader
{
public:
    value_reader(const response_line& line, std::size_t offset)
        : line_(line), pos_(offset)
    {
    }

    result<std::vector<value>> read_all()
    {
        std::vector<value> out;
        while (true)
        {
            skip_spaces();
            if (at_end())
                return out;
            value v;
            IMAPXX_TRY_ASSIGN(v, read_value());
            out.push_back(std::move(v));
        }
    }

private:
    [[nodiscard]] std::string_view segment() const noexcept
    {
        return line_.segments[seg_];
    }

    [[nodiscard]] bool at_end() const noexcept
    {
        return seg_ + 1 >= line_.segments.size() && pos_ >= segment().size();
    }

    [[nodiscard]] bool segment_exhausted() const noexcept
    {
        return pos_ >= segment().size();
    }

    void skip_spaces() noexcept
    {
        while (!segment_exhausted() && segment()[pos_] == ' ')
            ++pos_;
    }

    [[nodiscard]] error fail_here(std::string_view what) const
    {
        return grammar_error(what, line_.segments.front());
    }

    result<value> read_value()
    {
        if (segment_exhausted())
            return std::unexpected(fail_here("Unexpected end of response."));

        const char ch = segment()[pos_];
        if (ch == '(')
            return read_list();
        if (ch == '"')
            return read_quoted();
        if (ch == '{')
            return read_literal();
        if (ch == ')')
            return std::unexpected(fail_here("Unbalanced parenthesis."));
        return read_atom();
    }

    result<value> read_list()
    {
        ++pos_;
        std::vector<value> items;
        while (true)
        {
            skip_spaces();
            if (segment_exhausted())
                return std::unexpected(fail_here("Unterminated list."));
            if (segment()[pos_] == ')')
            {
                ++pos_;
                return value::make_list(std::move(items));
            }
            value v;
            IMAPXX_TRY_ASSIGN(v, read_value());
            items.push_back(std::move(v));
        }
    }

    result<value> read_quoted()
    {
        ++pos_;
        std::string text;
        const auto seg = segment();
        while (pos_ < seg.size())
        {
            const char ch = seg[pos_++];
            if (ch == '"')
                return value::make_string(std::move(text));
            if (ch == '\\')
            {
                if (pos_ >= seg.size())
                    break;
                text.push_back(seg[pos_++]);
                continue;
            }
            text.push_back(ch);
        }
        return std::unexpected(fail_here("Unterminated quoted string."));
    }

    result<value> read_literal()
    {
        // The tokenizer only splits segments at a trailing `{n}`.
        const auto seg = segment();
        if (seg_ >= line_.literals.size() || seg.back() != '}' || seg.rfind('{') != pos_)
            return std::unexpected(fail_here("Misplaced literal marker."));
        value v = value::make_literal(line_.literals[seg_]);
        ++seg_;
        pos_ = 0;
        return v;
    }

    result<value> read_atom()
    {
        const auto seg = segment();
        const auto start = pos_;
        while (pos_ < seg.size())
        {
            const char ch = seg[pos_];
            if (ch == ' ' || ch == '(' || ch == ')')
                break;
            if (ch == '[')
            {
                // Section specifiers such as BODY[HEADER.FIELDS (FROM)] stay in the atom.
                const auto close = seg.find(']', pos_);
                if (close == std::string_view::npos)
                    return std::unexpected(fail_here("Unterminated section specifier."));
                pos_ = close + 1;
                continue;
            }
            ++pos_;
        }
        std::string text(seg.substr(start, pos_ - start));
        if (detail::iequals_ascii(text, "NIL"))
            return value{};
        return value::make_atom(std::move(text));
    }

    const response_line& line_;
    std::size_t seg_ = 0;
    std::size_t pos_ = 0;
};

[[nodiscard]] inline status_response parse_status_text(status st, std::string_view text)
{
    status_response out;
    out.st = st;
    text = detail::ltrim(text);
    if (!text.empty() && text.front() == '[')
    {
        const auto close = text.find(']');
        if (close != std::string_view::npos)
        {
            const auto [code, args] = detail::split_token(text.substr(1, close - 1));
            out.code = detail::to_upper_ascii(code);
            out.code_args = std::string(args);
            text = detail::ltrim(text.substr(close + 1));
        }
    }
    out.text = std::string(text);
    return out;
}

[[nodiscard]] inline untagged_kind data_kind(std::string_view keyword) noexcept
{
    if (keyword == "CAPABILITY") return untagged_kind::capability;
    if (keyword == "SEARCH") return untagged_kind::search;
    if (keyword == "LIST") return untagged_kind::list;
    if (keyword == "LSUB") return untagged_kind::lsub;
    if (keyword == "STATUS") return untagged_kind::status;
    if (keyword == "FLAGS") return untagged_kind::flags;
    if (keyword == "NAMESPACE") return untagged_kind::namespace_;
    return untagged_kind::other;
}

[[nodiscard]] inline untagged_kind numeric_kind(std::string_view keyword) noexcept
{
    if (keyword == "EXISTS") return untagged_kind::exists;
    if (keyword == "RECENT") return untagged_kind::recent;
    if (keyword == "EXPUNGE") return untagged_kind::expunge;
    if (keyword == "FETCH") return untagged_kind::fetch;
    return untagged_kind::other;
}

[[nodiscard]] inline std::optional<std::uint32_t> to_uint32(const value& v) noexcept
{
    std::uint32_t n = 0;
    if (v.type != value::kind::atom || !detail::parse_uint(v.text, n))
        return std::nullopt;
    return n;
}

[[nodiscard]] inline std::optional<std::uint64_t> to_uint64(const value& v) noexcept
{
    std::uint64_t n = 0;
    if (v.type != value::kind::atom || !detail::parse_uint(v.text, n))
        return std::nullopt;
    return n;
}

[[nodiscard]] inline std::optional<char> to_delimiter(const value& v) noexcept
{
    if (v.is_nil() || !v.is_text() || v.text.empty())
        return std::nullopt;
    return v.text.front();
}

} // namespace parser_detail

/// Classifies an untagged line and reads the values of data responses.
[[nodiscard]] inline result<untagged_response> parse_untagged(const response_line& line)
{
    untagged_response out;
    out.raw = line.str();

    std::string_view rest = line.rest();
    const std::string_view first = line.segments.front();

    auto [word, tail] = detail::split_token(rest);
    if (line.numeric)
    {
        if (!detail::parse_uint(word, out.number))
            return std::unexpected(parser_detail::grammar_error("Bad message number.", first));
        std::tie(word, tail) = detail::split_token(tail);
    }
    out.keyword = detail::to_upper_ascii(word);

    if (line.numeric)
        out.kind = parser_detail::numeric_kind(out.keyword);
    else
    {
        const status st = parse_status(out.keyword);
        if (st != status::unknown)
        {
            out.kind = untagged_kind::condition;
            out.condition = parser_detail::parse_status_text(st, tail);
            return out;
        }
        out.kind = parser_detail::data_kind(out.keyword);
    }

    if (out.kind == untagged_kind::other)
        return out;
    if (tail.empty())
    {
        if (out.kind == untagged_kind::fetch)
            return std::unexpected(parser_detail::grammar_error("FETCH without data.", first));
        return out;
    }

    // Offset of the data within the first segment.
    const auto offset = static_cast<std::size_t>(tail.data() - first.data());
    parser_detail::value_reader reader(line, offset);
    IMAPXX_TRY_ASSIGN(out.values, reader.read_all());

    if (out.kind == untagged_kind::fetch && (out.values.size() != 1 || !out.values.front().is_list()))
        return std::unexpected(parser_detail::grammar_error("FETCH data is not a list.", first));
    return out;
}

[[nodiscard]] inline result<tagged_response> parse_tagged(const response_line& line)
{
    tagged_response out;
    out.tag = line.tag;
    const auto [word, tail] = detail::split_token(line.rest());
    out.result = parser_detail::parse_status_text(parse_status(word), tail);
    return out;
}

/// Text of a `+` continuation request.
[[nodiscard]] inline std::string_view continuation_text(const response_line& line) noexcept
{
    return detail::ltrim(line.rest());
}

[[nodiscard]] inline std::vector<std::string> parse_capabilities(std::string_view text)
{
    std::vector<std::string> caps;
    while (!text.empty())
    {
        auto [token, rest] = detail::split_token(text);
        if (!token.empty())
            caps.push_back(detail::to_upper_ascii(token));
        text = rest;
    }
    return caps;
}

[[nodiscard]] inline std::vector<std::string> capabilities_from(const untagged_response& resp)
{
    std::vector<std::string> caps;
    for (const auto& v : resp.values)
    {
        if (v.is_text())
            caps.push_back(detail::to_upper_ascii(v.text));
    }
    return caps;
}

[[nodiscard]] inline std::vector<std::string> flags_from(const value& list)
{
    std::vector<std::string> flags;
    for (const auto& item : list.items)
    {
        if (item.is_text())
            flags.push_back(item.text);
    }
    return flags;
}

/// `(\Seen \Deleted \*)` as found in response code arguments.
[[nodiscard]] inline std::vector<std::string> flags_from_text(std::string_view text)
{
    text = detail::ltrim(text);
    if (!text.empty() && text.front() == '(')
        text.remove_prefix(1);
    if (const auto close = text.find(')'); close != std::string_view::npos)
        text = text.substr(0, close);
    std::vector<std::string> flags;
    while (!text.empty())
    {
        auto [token, rest] = detail::split_token(text);
        if (!token.empty())
            flags.emplace_back(token);
        text = rest;
    }
    return flags;
}

struct search_result
{
    std::vector<std::uint32_t> ids;
    std::optional<std::uint64_t> modseq;
};

/// `* SEARCH 2 84 882` with an optional trailing `(MODSEQ n)`.
[[nodiscard]] inline result<search_result> search_from(const untagged_response& resp)
{
    search_result out;
    for (const auto& v : resp.values)
    {
        if (v.is_list())
        {
            if (v.items.size() == 2 && v.items[0].is_text() && detail::iequals_ascii(v.items[0].text, "MODSEQ"))
                out.modseq = parser_detail::to_uint64(v.items[1]);
            continue;
        }
        const auto id = parser_detail::to_uint32(v);
        if (!id)
            return std::unexpected(parser_detail::grammar_error("Bad SEARCH result.", resp.raw));
        out.ids.push_back(*id);
    }
    return out;
}

struct list_entry
{
    std::vector<std::string> attribs;
    std::optional<char> delimiter;
    std::string name;
};

/// `* LIST (\HasNoChildren) "/" "INBOX"`; the name is decoded from modified UTF-7.
[[nodiscard]] inline result<list_entry> list_from(const untagged_response& resp)
{
    if (resp.values.size() < 3 || !resp.values[0].is_list() || !resp.values[2].is_text())
        return std::unexpected(parser_detail::grammar_error("Bad LIST response.", resp.raw));

    list_entry out;
    out.attribs = flags_from(resp.values[0]);
    out.delimiter = parser_detail::to_delimiter(resp.values[1]);
    auto decoded = decode_modified_utf7(resp.values[2].text);
    if (decoded)
        out.name = std::move(*decoded);
    else
    {
        IMAPXX_WARN("Mailbox name is not valid modified UTF-7, kept verbatim.");
        out.name = resp.values[2].text;
    }
    return out;
}

/// `* STATUS blurdybloop (MESSAGES 231 UIDNEXT 44292)`.
[[nodiscard]] inline result<mailbox> status_from(const untagged_response& resp)
{
    if (resp.values.size() != 2 || !resp.values[0].is_text() || !resp.values[1].is_list())
        return std::unexpected(parser_detail::grammar_error("Bad STATUS response.", resp.raw));

    mailbox box;
    auto decoded = decode_modified_utf7(resp.values[0].text);
    box.name = decoded ? std::move(*decoded) : resp.values[0].text;

    const auto& items = resp.values[1].items;
    for (std::size_t i = 0; i + 1 < items.size(); i += 2)
    {
        if (!items[i].is_text())
            continue;
        const auto key = detail::to_upper_ascii(items[i].text);
        const auto n = parser_detail::to_uint64(items[i + 1]);
        if (!n)
            continue;
        if (key == "MESSAGES")
            box.messages.total = static_cast<std::uint32_t>(*n);
        else if (key == "RECENT")
            box.messages.recent = static_cast<std::uint32_t>(*n);
        else if (key == "UNSEEN")
            box.messages.unseen = static_cast<std::uint32_t>(*n);
        else if (key == "UIDNEXT")
            box.uid_next = static_cast<std::uint32_t>(*n);
        else if (key == "UIDVALIDITY")
            box.uid_validity = static_cast<std::uint32_t>(*n);
        else if (key == "HIGHESTMODSEQ")
            box.highest_modseq = *n;
    }
    return box;
}

/// `* NAMESPACE (("" "/")) NIL (("Public/" "/" "X-PARAM" ("a" "b")))`.
[[nodiscard]] inline result<namespaces> namespaces_from(const untagged_response& resp)
{
    if (resp.values.size() != 3)
        return std::unexpected(parser_detail::grammar_error("Bad NAMESPACE response.", resp.raw));

    auto read_group = [&resp](const value& group, std::vector<namespace_entry>& out) -> result_void
    {
        if (group.is_nil())
            return ok();
        if (!group.is_list())
            return std::unexpected(parser_detail::grammar_error("Bad NAMESPACE group.", resp.raw));
        for (const auto& desc : group.items)
        {
            if (!desc.is_list() || desc.items.size() < 2 || !desc.items[0].is_text())
                return std::unexpected(parser_detail::grammar_error("Bad NAMESPACE entry.", resp.raw));
            namespace_entry entry;
            entry.prefix = desc.items[0].text;
            entry.delimiter = parser_detail::to_delimiter(desc.items[1]);
            for (std::size_t i = 2; i + 1 < desc.items.size(); i += 2)
            {
                namespace_extension ext;
                ext.name = desc.items[i].text;
                for (const auto& p : desc.items[i + 1].items)
                    ext.params.push_back(p.text);
                entry.extensions.push_back(std::move(ext));
            }
            out.push_back(std::move(entry));
        }
        return ok();
    };

    namespaces out;
    IMAPXX_TRY_VOID(read_group(resp.values[0], out.personal));
    IMAPXX_TRY_VOID(read_group(resp.values[1], out.other));
    IMAPXX_TRY_VOID(read_group(resp.values[2], out.shared));
    return out;
}

/// INTERNALDATE: `17-Jul-1996 02:44:25 -0700`, day possibly space padded.
[[nodiscard]] inline std::optional<std::chrono::system_clock::time_point> parse_internal_date(std::string_view text)
{
    using namespace std::chrono;
    static constexpr std::string_view months[] = {
        "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
    };

    text = detail::ltrim(text);
    const auto dash1 = text.find('-');
    if (dash1 == std::string_view::npos || text.size() < dash1 + 21)
        return std::nullopt;

    unsigned d = 0;
    int y = 0;
    int hh = 0, mm = 0, ss = 0, tz = 0;
    if (!detail::parse_uint(text.substr(0, dash1), d))
        return std::nullopt;
    const auto mon = text.substr(dash1 + 1, 3);
    unsigned m = 0;
    for (unsigned i = 0; i < 12; ++i)
    {
        if (detail::iequals_ascii(mon, months[i]))
            m = i + 1;
    }
    if (m == 0 || text[dash1 + 4] != '-')
        return std::nullopt;
    const auto rest = text.substr(dash1 + 5);
    // yyyy hh:mm:ss +zzzz
    if (rest.size() < 19 || rest[4] != ' ' || rest[7] != ':' || rest[10] != ':' || rest[13] != ' ')
        return std::nullopt;
    if (!detail::parse_uint(rest.substr(0, 4), y)
        || !detail::parse_uint(rest.substr(5, 2), hh)
        || !detail::parse_uint(rest.substr(8, 2), mm)
        || !detail::parse_uint(rest.substr(11, 2), ss)
        || !detail::parse_uint(rest.substr(15, 4), tz))
        return std::nullopt;
    const char sign = rest[14];
    if (sign != '+' && sign != '-')
        return std::nullopt;

    const year_month_day ymd{year{y}, month{m}, day{d}};
    if (!ymd.ok())
        return std::nullopt;
    auto tp = sys_days{ymd} + hours{hh} + minutes{mm} + seconds{ss};
    const auto offset = hours{tz / 100} + minutes{tz % 100};
    tp = (sign == '+') ? tp - offset : tp + offset;
    return time_point_cast<system_clock::duration>(tp);
}

/// INTERNALDATE for APPEND, in UTC: `17-Jul-1996 09:44:25 +0000`.
[[nodiscard]] inline std::string format_internal_date(std::chrono::system_clock::time_point tp)
{
    using namespace std::chrono;
    static constexpr std::string_view months[] = {
        "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
    };
    auto two = [](std::string& out, unsigned v)
    {
        detail::append_char(out, static_cast<char>('0' + v / 10));
        detail::append_char(out, static_cast<char>('0' + v % 10));
    };

    const auto midnight = floor<days>(tp);
    const year_month_day ymd{midnight};
    const hh_mm_ss<seconds> time{floor<seconds>(tp - midnight)};

    std::string out;
    two(out, static_cast<unsigned>(ymd.day()));
    detail::append_char(out, '-');
    detail::append_sv(out, months[static_cast<unsigned>(ymd.month()) - 1]);
    detail::append_char(out, '-');
    detail::append_uint(out, static_cast<std::uint64_t>(static_cast<int>(ymd.year())));
    detail::append_space(out);
    two(out, static_cast<unsigned>(time.hours().count()));
    detail::append_char(out, ':');
    two(out, static_cast<unsigned>(time.minutes().count()));
    detail::append_char(out, ':');
    two(out, static_cast<unsigned>(time.seconds().count()));
    detail::append_sv(out, " +0000");
    return out;
}

} // namespace imapxx::imap
