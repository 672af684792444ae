/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Process-wide logger of the library: severity filtering, an optional sink
callback and tracing of the IMAP conversation.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

#include <imapxx/detail/append.hpp>
#include <imapxx/detail/ascii.hpp>

namespace imapxx::log
{

enum class level : std::uint8_t
{
    trace = 0,   ///< Protocol lines
    debug = 1,
    info = 2,
    warn = 3,    ///< Recoverable problems, e.g. an unparsable untagged response
    error = 4,   ///< The connection is being torn down
    fatal = 5,
    off = 6
};

/// Which way a traced protocol line travelled.
enum class direction : std::uint8_t
{
    send,
    receive
};

/// One record handed to the sink.
struct entry
{
    level lvl = level::info;
    std::chrono::system_clock::time_point timestamp;
    /// Message, or the protocol line for traffic records.
    std::string text;
    std::source_location location;
    /// Set for protocol traffic only.
    std::optional<direction> traffic;
    /// Protocol of a traffic record, e.g. `IMAP`.
    std::string channel;
};

using sink = std::function<void(const entry&)>;

[[nodiscard]] constexpr std::string_view level_to_string(level lvl) noexcept
{
    switch (lvl)
    {
        case level::trace: return "TRACE";
        case level::debug: return "DEBUG";
        case level::info:  return "INFO";
        case level::warn:  return "WARN";
        case level::error: return "ERROR";
        case level::fatal: return "FATAL";
        case level::off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Case-insensitive inverse of `level_to_string`; `warning` is accepted too.
[[nodiscard]] inline std::optional<level> parse_level(std::string_view name) noexcept
{
    for (auto lvl : {level::trace, level::debug, level::info, level::warn, level::error, level::fatal, level::off})
    {
        if (detail::iequals_ascii(name, level_to_string(lvl)))
            return lvl;
    }
    if (detail::iequals_ascii(name, "warning"))
        return level::warn;
    return std::nullopt;
}

/**
Logger shared by every connection of the process.

Filtering is lock-free; the sink runs under a mutex, so records from
connections living on different threads never interleave. Without a sink,
records go to `std::cerr` as `[hh:mm:ss.mmm] [LEVEL] message`.
**/
class logger
{
public:
    static logger& instance() noexcept
    {
        static logger inst;
        return inst;
    }

    void set_level(level lvl) noexcept
    {
        min_level_.store(static_cast<std::uint8_t>(lvl), std::memory_order_relaxed);
    }

    [[nodiscard]] level get_level() const noexcept
    {
        return static_cast<level>(min_level_.load(std::memory_order_relaxed));
    }

    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return lvl != level::off && static_cast<std::uint8_t>(lvl) >= min_level_.load(std::memory_order_relaxed);
    }

    void set_sink(sink fn)
    {
        std::lock_guard lock(mutex_);
        sink_ = std::move(fn);
    }

    void clear_sink()
    {
        std::lock_guard lock(mutex_);
        sink_ = nullptr;
    }

    /// Protocol traffic is recorded only once enabled, whatever the level.
    void set_trace_enabled(bool enabled) noexcept
    {
        trace_enabled_.store(enabled, std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_trace_enabled() const noexcept
    {
        return trace_enabled_.load(std::memory_order_relaxed);
    }

    /// Longest traced line printed by the default output, 0 for no limit.
    void set_trace_limit(std::size_t bytes) noexcept
    {
        trace_limit_.store(bytes, std::memory_order_relaxed);
    }

    void log(level lvl, std::string_view message, std::source_location loc = std::source_location::current())
    {
        if (!is_enabled(lvl))
            return;
        entry e;
        e.lvl = lvl;
        e.timestamp = std::chrono::system_clock::now();
        e.text = std::string(message);
        e.location = loc;
        dispatch(e);
    }

    void trace_protocol(std::string_view channel, direction dir, std::string_view line,
        std::source_location loc = std::source_location::current())
    {
        if (!is_trace_enabled())
            return;
        entry e;
        e.lvl = level::trace;
        e.timestamp = std::chrono::system_clock::now();
        e.text = std::string(line);
        e.location = loc;
        e.traffic = dir;
        e.channel = std::string(channel);
        dispatch(e);
    }

private:
    logger() = default;

    void dispatch(const entry& e)
    {
        std::lock_guard lock(mutex_);
        if (sink_)
            sink_(e);
        else
            std::cerr << format(e, trace_limit_.load(std::memory_order_relaxed));
    }

    static void append_padded(std::string& out, std::uint64_t value, std::size_t width)
    {
        std::string digits;
        detail::append_uint(digits, value);
        if (digits.size() < width)
            out.append(width - digits.size(), '0');
        out += digits;
    }

    [[nodiscard]] static std::string format(const entry& e, std::size_t limit)
    {
        const auto time = std::chrono::system_clock::to_time_t(e.timestamp);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(e.timestamp.time_since_epoch()) % 1000;
        std::tm local{};
        localtime_r(&time, &local);

        std::string out = "[";
        append_padded(out, static_cast<std::uint64_t>(local.tm_hour), 2);
        out += ':';
        append_padded(out, static_cast<std::uint64_t>(local.tm_min), 2);
        out += ':';
        append_padded(out, static_cast<std::uint64_t>(local.tm_sec), 2);
        out += '.';
        append_padded(out, static_cast<std::uint64_t>(ms.count()), 3);
        out += "] ";

        if (e.traffic)
        {
            out += e.channel;
            out += *e.traffic == direction::send ? " => " : " <= ";
            out += printable_line(e.text, limit);
        }
        else
        {
            out += '[';
            out += level_to_string(e.lvl);
            out += "] ";
            out += e.text;
        }
        out += '\n';
        return out;
    }

    /// Drops the line end, masks control bytes and cuts long literals.
    [[nodiscard]] static std::string printable_line(std::string_view line, std::size_t limit)
    {
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
            line.remove_suffix(1);
        const bool cut = limit > 0 && line.size() > limit;
        if (cut)
            line = line.substr(0, limit);

        std::string out;
        out.reserve(line.size() + 16);
        for (char ch : line)
            out += static_cast<unsigned char>(ch) < 0x20 ? '.' : ch;
        if (cut)
            out += "... [truncated]";
        return out;
    }

    std::atomic<std::uint8_t> min_level_{static_cast<std::uint8_t>(level::info)};
    std::atomic<bool> trace_enabled_{false};
    std::atomic<std::size_t> trace_limit_{512};
    std::mutex mutex_;
    sink sink_;
};

#define IMAPXX_LOG(lvl, msg) \
    ::imapxx::log::logger::instance().log(lvl, msg, std::source_location::current())

#define IMAPXX_DEBUG(msg)  IMAPXX_LOG(::imapxx::log::level::debug, msg)
#define IMAPXX_INFO(msg)   IMAPXX_LOG(::imapxx::log::level::info, msg)
#define IMAPXX_WARN(msg)   IMAPXX_LOG(::imapxx::log::level::warn, msg)
#define IMAPXX_ERROR(msg)  IMAPXX_LOG(::imapxx::log::level::error, msg)

#define IMAPXX_TRACE_SEND(channel, line) \
    ::imapxx::log::logger::instance().trace_protocol(channel, ::imapxx::log::direction::send, line)

#define IMAPXX_TRACE_RECV(channel, line) \
    ::imapxx::log::logger::instance().trace_protocol(channel, ::imapxx::log::direction::receive, line)

} // namespace imapxx::log
