/*

search.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Search criteria and their compilation to SEARCH arguments.

*/

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <imapxx/detail/append.hpp>
#include <imapxx/detail/ascii.hpp>
#include <imapxx/detail/result.hpp>
#include <imapxx/imap/command.hpp>
#include <imapxx/imap/types.hpp>

namespace imapxx::imap
{

enum class flag_key
{
    all,
    answered,
    deleted,
    draft,
    flagged,
    new_,
    seen,
    recent,
    old,
    unanswered,
    undeleted,
    undraft,
    unflagged,
    unseen
};

enum class string_key
{
    bcc,
    body,
    cc,
    from,
    subject,
    text,
    to,
    keyword,
    unkeyword
};

enum class date_key
{
    before,
    on,
    since,
    sent_before,
    sent_on,
    sent_since
};

enum class size_key
{
    larger,
    smaller
};

/// How a negated criterion is written on the wire.
enum class negation_dialect
{
    not_keyword,
    bang_prefix
};

class criterion;

struct flag_test
{
    flag_key key;
};

struct string_match
{
    string_key key;
    std::string value;
};

struct header_match
{
    std::string name;
    std::string value;
};

struct date_match
{
    date_key key;
    std::chrono::year_month_day date;
};

struct size_match
{
    size_key key;
    std::uint64_t bytes = 0;
};

struct uid_match
{
    message_set uids;
};

struct sequence_match
{
    message_set seqnos;
};

/// Server extension key, e.g. Gmail `X-GM-RAW`.
struct extension_match
{
    std::string key;
    std::string value;
};

struct negation
{
    std::shared_ptr<const criterion> inner;
};

struct or_match
{
    std::shared_ptr<const criterion> left;
    std::shared_ptr<const criterion> right;
};

class criterion
{
public:
    using variant_type = std::variant<flag_test, string_match, header_match, date_match, size_match,
        uid_match, sequence_match, extension_match, negation, or_match>;

    criterion(flag_key key) : v_(flag_test{key}) {}

    template<typename T>
    criterion(T v) requires std::is_constructible_v<variant_type, T> : v_(std::move(v)) {}

    [[nodiscard]] static criterion flag(flag_key key)
    {
        return criterion(flag_test{key});
    }

    [[nodiscard]] static criterion string(string_key key, std::string value)
    {
        return criterion(string_match{key, std::move(value)});
    }

    [[nodiscard]] static criterion from(std::string value)
    {
        return string(string_key::from, std::move(value));
    }

    [[nodiscard]] static criterion subject(std::string value)
    {
        return string(string_key::subject, std::move(value));
    }

    [[nodiscard]] static criterion header(std::string name, std::string value)
    {
        return criterion(header_match{std::move(name), std::move(value)});
    }

    [[nodiscard]] static criterion date(date_key key, std::chrono::year_month_day day)
    {
        return criterion(date_match{key, day});
    }

    [[nodiscard]] static criterion size(size_key key, std::uint64_t bytes)
    {
        return criterion(size_match{key, bytes});
    }

    [[nodiscard]] static criterion uid(message_set uids)
    {
        return criterion(uid_match{std::move(uids)});
    }

    [[nodiscard]] static criterion sequence(message_set seqnos)
    {
        return criterion(sequence_match{std::move(seqnos)});
    }

    [[nodiscard]] static criterion extension(std::string key, std::string value)
    {
        return criterion(extension_match{std::move(key), std::move(value)});
    }

    [[nodiscard]] static criterion gmail_raw(std::string query)
    {
        return extension("X-GM-RAW", std::move(query));
    }

    [[nodiscard]] static criterion negate(criterion inner)
    {
        return criterion(negation{std::make_shared<const criterion>(std::move(inner))});
    }

    [[nodiscard]] static criterion either(criterion left, criterion right)
    {
        return criterion(or_match{std::make_shared<const criterion>(std::move(left)),
            std::make_shared<const criterion>(std::move(right))});
    }

    [[nodiscard]] const variant_type& get() const noexcept
    {
        return v_;
    }

private:
    variant_type v_;
};

struct compile_options
{
    std::size_t literal_threshold = 1024;
    negation_dialect negation = negation_dialect::not_keyword;
};

struct compiled_criteria
{
    command_line args;
    /// A string argument is not 7-bit, SEARCH needs `CHARSET UTF-8`.
    bool utf8 = false;
    /// Uses Gmail `X-GM-*` keys.
    bool gmail = false;
};

namespace search_detail
{

[[nodiscard]] constexpr std::string_view keyword(flag_key key) noexcept
{
    switch (key)
    {
        case flag_key::all: return "ALL";
        case flag_key::answered: return "ANSWERED";
        case flag_key::deleted: return "DELETED";
        case flag_key::draft: return "DRAFT";
        case flag_key::flagged: return "FLAGGED";
        case flag_key::new_: return "NEW";
        case flag_key::seen: return "SEEN";
        case flag_key::recent: return "RECENT";
        case flag_key::old: return "OLD";
        case flag_key::unanswered: return "UNANSWERED";
        case flag_key::undeleted: return "UNDELETED";
        case flag_key::undraft: return "UNDRAFT";
        case flag_key::unflagged: return "UNFLAGGED";
        case flag_key::unseen: return "UNSEEN";
    }
    return "ALL";
}

[[nodiscard]] constexpr std::string_view keyword(string_key key) noexcept
{
    switch (key)
    {
        case string_key::bcc: return "BCC";
        case string_key::body: return "BODY";
        case string_key::cc: return "CC";
        case string_key::from: return "FROM";
        case string_key::subject: return "SUBJECT";
        case string_key::text: return "TEXT";
        case string_key::to: return "TO";
        case string_key::keyword: return "KEYWORD";
        case string_key::unkeyword: return "UNKEYWORD";
    }
    return "TEXT";
}

[[nodiscard]] constexpr std::string_view keyword(date_key key) noexcept
{
    switch (key)
    {
        case date_key::before: return "BEFORE";
        case date_key::on: return "ON";
        case date_key::since: return "SINCE";
        case date_key::sent_before: return "SENTBEFORE";
        case date_key::sent_on: return "SENTON";
        case date_key::sent_since: return "SENTSINCE";
    }
    return "ON";
}

inline constexpr std::string_view month_names[] = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
};

[[nodiscard]] inline bool is_gmail_key(std::string_view key) noexcept
{
    return detail::starts_with_ci(key, "X-GM-");
}

/// Gmail numeric ids go bare, everything else as a string.
[[nodiscard]] inline bool numeric_extension(std::string_view key) noexcept
{
    return detail::iequals_ascii(key, "X-GM-THRID") || detail::iequals_ascii(key, "X-GM-MSGID");
}

class compiler
{
public:
    compiler(const compile_options& opts, compiled_criteria& out)
        : opts_(opts), out_(out)
    {
    }

    result_void emit(const criterion& c)
    {
        return std::visit([this](const auto& v) { return emit_one(v); }, c.get());
    }

private:
    result_void emit_one(const flag_test& v)
    {
        out_.args.atom(keyword(v.key));
        return ok();
    }

    result_void emit_one(const string_match& v)
    {
        out_.args.atom(keyword(v.key));
        if (v.key == string_key::keyword || v.key == string_key::unkeyword)
        {
            if (!detail::is_atom(v.value))
                return fail(error_code::invalid_criteria, "KEYWORD argument must be an atom.");
            out_.args.atom(v.value);
            return ok();
        }
        return emit_string(v.value);
    }

    result_void emit_one(const header_match& v)
    {
        if (v.name.empty())
            return fail(error_code::invalid_criteria, "HEADER needs a field name.");
        out_.args.atom("HEADER");
        IMAPXX_TRY_VOID(emit_string(v.name));
        return emit_string(v.value);
    }

    result_void emit_one(const date_match& v)
    {
        if (!v.date.ok())
            return fail(error_code::invalid_criteria, "Invalid search date.");
        out_.args.atom(keyword(v.key));
        out_.args.atom(format_date(v.date));
        return ok();
    }

    result_void emit_one(const size_match& v)
    {
        out_.args.atom(v.key == size_key::larger ? "LARGER" : "SMALLER");
        std::string n;
        detail::append_uint(n, v.bytes);
        out_.args.atom(n);
        return ok();
    }

    result_void emit_one(const uid_match& v)
    {
        std::string set;
        IMAPXX_TRY_ASSIGN(set, v.uids.str());
        out_.args.atom("UID");
        out_.args.atom(set);
        return ok();
    }

    result_void emit_one(const sequence_match& v)
    {
        std::string set;
        IMAPXX_TRY_ASSIGN(set, v.seqnos.str());
        out_.args.atom(set);
        return ok();
    }

    result_void emit_one(const extension_match& v)
    {
        if (!detail::is_atom(v.key))
            return fail(error_code::invalid_criteria, "Extension key must be an atom.");
        if (is_gmail_key(v.key))
            out_.gmail = true;
        out_.args.atom(detail::to_upper_ascii(v.key));
        if (numeric_extension(v.key) && detail::is_digits(v.value))
        {
            out_.args.atom(v.value);
            return ok();
        }
        return emit_string(v.value);
    }

    result_void emit_one(const negation& v)
    {
        if (!v.inner)
            return fail(error_code::invalid_criteria, "Empty negation.");
        // `!` needs a search keyword to stick to; OR, NOT and bare sequence
        // sets fall back to NOT.
        const auto& inner = v.inner->get();
        const bool keyworded = !std::holds_alternative<negation>(inner) && !std::holds_alternative<or_match>(inner)
            && !std::holds_alternative<sequence_match>(inner);
        if (opts_.negation == negation_dialect::not_keyword || !keyworded)
        {
            out_.args.atom("NOT");
            return emit(*v.inner);
        }

        compiled_criteria sub;
        compiler nested(opts_, sub);
        IMAPXX_TRY_VOID(nested.emit(*v.inner));
        out_.utf8 = out_.utf8 || sub.utf8;
        out_.gmail = out_.gmail || sub.gmail;
        out_.args.atom("!");
        for (const auto& part : sub.args.parts())
        {
            if (part.type == command_part::kind::literal)
                out_.args.literal(part.data);
            else
                out_.args.raw(part.data);
        }
        return ok();
    }

    result_void emit_one(const or_match& v)
    {
        if (!v.left || !v.right)
            return fail(error_code::invalid_criteria, "OR needs two criteria.");
        out_.args.atom("OR");
        IMAPXX_TRY_VOID(emit(*v.left));
        return emit(*v.right);
    }

    result_void emit_string(std::string_view s)
    {
        if (s.find('\0') != std::string_view::npos)
            return fail(error_code::invalid_criteria, "NUL is not allowed in search strings.");
        if (!detail::is_7bit(s))
            out_.utf8 = true;
        out_.args.string(s, opts_.literal_threshold);
        return ok();
    }

    [[nodiscard]] static std::string format_date(const std::chrono::year_month_day& ymd)
    {
        std::string out;
        const auto d = static_cast<unsigned>(ymd.day());
        if (d < 10)
            detail::append_char(out, '0');
        detail::append_uint(out, d);
        detail::append_char(out, '-');
        detail::append_sv(out, month_names[static_cast<unsigned>(ymd.month()) - 1]);
        detail::append_char(out, '-');
        detail::append_uint(out, static_cast<std::uint64_t>(static_cast<int>(ymd.year())));
        return out;
    }

    const compile_options& opts_;
    compiled_criteria& out_;
};

} // namespace search_detail

/// Space-joined SEARCH arguments for criteria ANDed together.
[[nodiscard]] inline result<compiled_criteria> compile(const std::vector<criterion>& criteria,
    const compile_options& opts = {})
{
    if (criteria.empty())
        return fail<compiled_criteria>(error_code::invalid_criteria, "Search criteria must not be empty.");

    compiled_criteria out;
    search_detail::compiler c(opts, out);
    for (const auto& item : criteria)
        IMAPXX_TRY_VOID(c.emit(item));
    return out;
}

/// `dd-Mon-yyyy` or `yyyy-mm-dd`.
[[nodiscard]] inline result<std::chrono::year_month_day> parse_search_date(std::string_view text)
{
    using namespace std::chrono;
    auto bad = [&text]()
    {
        std::string message = "Invalid date: ";
        message += text;
        return fail<year_month_day>(error_code::invalid_criteria, std::move(message));
    };

    const auto first = text.find('-');
    const auto second = first == std::string_view::npos ? first : text.find('-', first + 1);
    if (second == std::string_view::npos)
        return bad();
    const auto a = text.substr(0, first);
    const auto b = text.substr(first + 1, second - first - 1);
    const auto c = text.substr(second + 1);

    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    if (a.size() == 4)
    {
        if (!detail::parse_uint(a, y) || !detail::parse_uint(b, m) || !detail::parse_uint(c, d))
            return bad();
    }
    else
    {
        if (!detail::parse_uint(a, d) || !detail::parse_uint(c, y))
            return bad();
        for (unsigned i = 0; i < 12; ++i)
        {
            if (detail::iequals_ascii(b, search_detail::month_names[i]))
                m = i + 1;
        }
    }
    const year_month_day ymd{year{y}, month{m}, day{d}};
    if (!ymd.ok())
        return bad();
    return ymd;
}

namespace search_detail
{

class loose_reader
{
public:
    explicit loose_reader(const std::vector<std::string>& tokens)
        : tokens_(tokens)
    {
    }

    [[nodiscard]] bool done() const noexcept
    {
        return pos_ >= tokens_.size();
    }

    result<criterion> read()
    {
        if (done())
            return fail<criterion>(error_code::invalid_criteria, "Incomplete search term.");

        std::string_view token = tokens_[pos_++];
        bool negated = false;
        if (!token.empty() && token.front() == '!')
        {
            negated = true;
            token.remove_prefix(1);
        }
        criterion c = flag_key::all;
        IMAPXX_TRY_ASSIGN(c, read_key(detail::to_upper_ascii(token), token));
        if (negated)
            return criterion::negate(std::move(c));
        return c;
    }

private:
    result<std::string> arg(std::string_view key)
    {
        if (done())
        {
            std::string message = "Missing argument for ";
            message += key;
            return fail<std::string>(error_code::invalid_criteria, std::move(message));
        }
        return tokens_[pos_++];
    }

    result<criterion> read_key(const std::string& key, std::string_view original)
    {
        static constexpr std::pair<std::string_view, flag_key> flags[] = {
            {"ALL", flag_key::all}, {"ANSWERED", flag_key::answered}, {"DELETED", flag_key::deleted},
            {"DRAFT", flag_key::draft}, {"FLAGGED", flag_key::flagged}, {"NEW", flag_key::new_},
            {"SEEN", flag_key::seen}, {"RECENT", flag_key::recent}, {"OLD", flag_key::old},
            {"UNANSWERED", flag_key::unanswered}, {"UNDELETED", flag_key::undeleted},
            {"UNDRAFT", flag_key::undraft}, {"UNFLAGGED", flag_key::unflagged}, {"UNSEEN", flag_key::unseen}
        };
        static constexpr std::pair<std::string_view, string_key> strings[] = {
            {"BCC", string_key::bcc}, {"BODY", string_key::body}, {"CC", string_key::cc},
            {"FROM", string_key::from}, {"SUBJECT", string_key::subject}, {"TEXT", string_key::text},
            {"TO", string_key::to}, {"KEYWORD", string_key::keyword}, {"UNKEYWORD", string_key::unkeyword}
        };
        static constexpr std::pair<std::string_view, date_key> dates[] = {
            {"BEFORE", date_key::before}, {"ON", date_key::on}, {"SINCE", date_key::since},
            {"SENTBEFORE", date_key::sent_before}, {"SENTON", date_key::sent_on},
            {"SENTSINCE", date_key::sent_since}
        };

        for (const auto& [name, k] : flags)
        {
            if (key == name)
                return criterion(k);
        }
        for (const auto& [name, k] : strings)
        {
            if (key == name)
            {
                std::string v;
                IMAPXX_TRY_ASSIGN(v, arg(name));
                return criterion::string(k, std::move(v));
            }
        }
        for (const auto& [name, k] : dates)
        {
            if (key == name)
            {
                std::string v;
                IMAPXX_TRY_ASSIGN(v, arg(name));
                std::chrono::year_month_day ymd;
                IMAPXX_TRY_ASSIGN(ymd, parse_search_date(v));
                return criterion::date(k, ymd);
            }
        }
        if (key == "LARGER" || key == "SMALLER")
        {
            std::string v;
            IMAPXX_TRY_ASSIGN(v, arg(key));
            std::uint64_t n = 0;
            if (!detail::parse_uint(v, n))
                return fail<criterion>(error_code::invalid_criteria, "Size must be a number.");
            return criterion::size(key == "LARGER" ? size_key::larger : size_key::smaller, n);
        }
        if (key == "HEADER")
        {
            std::string name;
            std::string v;
            IMAPXX_TRY_ASSIGN(name, arg(key));
            IMAPXX_TRY_ASSIGN(v, arg(key));
            return criterion::header(std::move(name), std::move(v));
        }
        if (key == "UID")
        {
            std::string v;
            IMAPXX_TRY_ASSIGN(v, arg(key));
            auto set = message_set::parse(v);
            if (!set)
                return fail<criterion>(error_code::invalid_criteria, set.error().message());
            return criterion::uid(std::move(*set));
        }
        if (key == "OR")
        {
            criterion left = flag_key::all;
            criterion right = flag_key::all;
            IMAPXX_TRY_ASSIGN(left, read());
            IMAPXX_TRY_ASSIGN(right, read());
            return criterion::either(std::move(left), std::move(right));
        }
        if (key == "NOT")
        {
            criterion inner = flag_key::all;
            IMAPXX_TRY_ASSIGN(inner, read());
            return criterion::negate(std::move(inner));
        }
        if (search_detail::is_gmail_key(key))
        {
            std::string v;
            IMAPXX_TRY_ASSIGN(v, arg(key));
            return criterion::extension(key, std::move(v));
        }
        if (!original.empty() && (detail::is_digits(original.substr(0, 1)) || original.front() == '*'))
        {
            auto set = message_set::parse(original);
            if (set)
                return criterion::sequence(std::move(*set));
        }

        std::string message = "Unknown search key: ";
        message += original;
        return fail<criterion>(error_code::invalid_criteria, std::move(message));
    }

    const std::vector<std::string>& tokens_;
    std::size_t pos_ = 0;
};

} // namespace search_detail

/**
Criteria from their loose textual form, one term per inner vector:
`{{"FROM", "a@b.com"}, {"UNSEEN"}}`. Keys may carry a `!` prefix for
negation and `OR` consumes the two following terms of the same vector.
**/
[[nodiscard]] inline result<std::vector<criterion>> parse_criteria(const std::vector<std::vector<std::string>>& terms)
{
    std::vector<criterion> out;
    for (const auto& term : terms)
    {
        if (term.empty())
            return fail<std::vector<criterion>>(error_code::invalid_criteria, "Empty search term.");
        search_detail::loose_reader reader(term);
        while (!reader.done())
        {
            criterion c = flag_key::all;
            IMAPXX_TRY_ASSIGN(c, reader.read());
            out.push_back(std::move(c));
        }
    }
    if (out.empty())
        return fail<std::vector<criterion>>(error_code::invalid_criteria, "Search criteria must not be empty.");
    return out;
}

} // namespace imapxx::imap
