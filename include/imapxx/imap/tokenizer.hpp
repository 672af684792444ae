/*

tokenizer.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Incremental splitter of the server byte stream into logical response lines.
A logical line spans every literal announced with `{n}` at the end of a
physical line, so the tokenizer alternates between line mode and
fixed-length literal mode.

*/

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <imapxx/detail/append.hpp>
#include <imapxx/detail/ascii.hpp>
#include <imapxx/detail/result.hpp>

namespace imapxx::imap
{

enum class line_kind
{
    tagged,
    untagged,
    continuation
};

/**
One logical response line.

`segments` holds the textual pieces; segment `i` ends with the `{n}` marker of
`literals[i]`, so there is always one segment more than literals.
**/
struct response_line
{
    line_kind kind = line_kind::untagged;
    std::string tag;
    /// `* 23 EXISTS`, `* 5 FETCH (...)`.
    bool numeric = false;
    std::vector<std::string> segments;
    std::vector<std::string> literals;

    /// Line text with literals rendered inline, for logging.
    [[nodiscard]] std::string str() const
    {
        std::string out;
        for (std::size_t i = 0; i < segments.size(); ++i)
        {
            detail::append_sv(out, segments[i]);
            if (i < literals.size())
            {
                detail::append_crlf(out);
                detail::append_sv(out, literals[i]);
            }
        }
        return out;
    }

    /// Text after the tag, `*` or `+` of the first segment.
    [[nodiscard]] std::string_view rest() const noexcept
    {
        if (segments.empty())
            return {};
        std::string_view first = segments.front();
        const auto pos = first.find(' ');
        if (pos == std::string_view::npos)
            return {};
        return first.substr(pos + 1);
    }
};

class tokenizer
{
public:
    static constexpr std::size_t default_max_line_length = 1024 * 1024;

    explicit tokenizer(std::size_t max_line_length = default_max_line_length)
        : max_line_length_(max_line_length)
    {
    }

    /// Consume the next transport chunk. Complete lines become available
    /// through `next()`. Any error is final until `reset()`.
    result_void feed(std::string_view chunk)
    {
        if (failure_)
            return std::unexpected(*failure_);

        while (!chunk.empty())
        {
            if (literal_remaining_ > 0)
            {
                const auto take = std::min(literal_remaining_, chunk.size());
                current_.literals.back().append(chunk.data(), take);
                literal_remaining_ -= take;
                chunk.remove_prefix(take);
                continue;
            }

            const auto nl = chunk.find('\n');
            if (nl == std::string_view::npos)
            {
                pending_.append(chunk.data(), chunk.size());
                chunk = {};
                if (pending_.size() > max_line_length_)
                    return poison(error_code::line_too_long, "Response line exceeds the maximum length.");
                break;
            }

            pending_.append(chunk.data(), nl);
            chunk.remove_prefix(nl + 1);
            if (!pending_.empty() && pending_.back() == '\r')
                pending_.pop_back();
            if (pending_.size() > max_line_length_)
                return poison(error_code::line_too_long, "Response line exceeds the maximum length.");

            IMAPXX_TRY_VOID(end_of_physical_line());
        }
        return ok();
    }

    /// Next complete logical line, if any.
    [[nodiscard]] std::optional<response_line> next()
    {
        if (ready_.empty())
            return std::nullopt;
        response_line line = std::move(ready_.front());
        ready_.pop_front();
        return line;
    }

    [[nodiscard]] bool has_line() const noexcept
    {
        return !ready_.empty();
    }

    /// True while a literal body is being collected.
    [[nodiscard]] bool in_literal() const noexcept
    {
        return literal_remaining_ > 0;
    }

    [[nodiscard]] bool failed() const noexcept
    {
        return failure_.has_value();
    }

    /// Restart from a fresh stream.
    void reset()
    {
        pending_.clear();
        current_ = response_line{};
        literal_remaining_ = 0;
        ready_.clear();
        failure_.reset();
    }

private:
    result_void end_of_physical_line()
    {
        std::string segment = std::move(pending_);
        pending_.clear();

        std::uint64_t announced = 0;
        const bool has_literal = literal_marker(segment, announced);
        current_.segments.push_back(std::move(segment));

        if (has_literal)
        {
            if (announced > max_literal_size)
                return poison(error_code::parse_error, "Announced literal is too large.");
            // The buffer grows with the bytes received, not with the announced size.
            current_.literals.emplace_back();
            literal_remaining_ = static_cast<std::size_t>(announced);
            // `{0}` continues in line mode right away.
            return ok();
        }

        IMAPXX_TRY_VOID(classify(current_));
        ready_.push_back(std::move(current_));
        current_ = response_line{};
        return ok();
    }

    /// `{n}` at the very end of a physical line.
    [[nodiscard]] static bool literal_marker(std::string_view segment, std::uint64_t& size) noexcept
    {
        if (segment.size() < 3 || segment.back() != '}')
            return false;
        const auto open = segment.rfind('{');
        if (open == std::string_view::npos)
            return false;
        const auto digits = segment.substr(open + 1, segment.size() - open - 2);
        return detail::parse_uint(digits, size);
    }

    result_void classify(response_line& line)
    {
        const std::string_view first = line.segments.front();
        if (first.empty())
            return poison(error_code::parse_error, "Empty response line.");

        const auto [head, rest] = detail::split_token(first);
        if (head == "+")
        {
            line.kind = line_kind::continuation;
            return ok();
        }

        if (head == "*")
        {
            if (rest.empty())
                return poison_with_line(line, "Untagged response without content.");
            line.kind = line_kind::untagged;
            const auto [word, tail] = detail::split_token(rest);
            line.numeric = detail::is_digits(word);
            if (line.numeric && tail.empty())
                return poison_with_line(line, "Numeric untagged response without keyword.");
            return ok();
        }

        if (!valid_tag(head))
            return poison_with_line(line, "Malformed response tag.");

        const auto [word, tail] = detail::split_token(rest);
        const auto st = detail::to_upper_ascii(word);
        if (st != "OK" && st != "NO" && st != "BAD")
            return poison_with_line(line, "Tagged response without OK, NO or BAD.");
        line.kind = line_kind::tagged;
        line.tag = std::string(head);
        return ok();
    }

    [[nodiscard]] static bool valid_tag(std::string_view tag) noexcept
    {
        if (tag.empty())
            return false;
        for (char ch : tag)
        {
            if (!detail::is_atom_char(ch) || ch == '+')
                return false;
        }
        return true;
    }

    result_void poison_with_line(const response_line& line, std::string_view what)
    {
        std::string message(what);
        detail::append_sv(message, " Line: ");
        std::string_view text = line.segments.front();
        detail::append_sv(message, text.substr(0, 120));
        return poison(error_code::parse_error, std::move(message));
    }

    result_void poison(error_code code, std::string message)
    {
        failure_ = error(code, std::move(message));
        return std::unexpected(*failure_);
    }

    static constexpr std::uint64_t max_literal_size = std::uint64_t{1} << 32;

    std::size_t max_line_length_;
    std::string pending_;
    response_line current_;
    std::size_t literal_remaining_ = 0;
    std::deque<response_line> ready_;
    std::optional<error> failure_;
};

} // namespace imapxx::imap
