/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Process-wide diagnostics for credential resolution. Access tokens appear at debug level and below; callers that
must keep them out of logs stay at info.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace xoauthxx::log
{

enum class level : std::uint8_t
{
    trace = 0,   ///< Every candidate probed.
    debug = 1,   ///< Requests, commands and live access tokens.
    info = 2,
    warn = 3,    ///< Incomplete store entries.
    error = 4,   ///< Failed token exchanges.
    off = 5
};

struct entry
{
    level lvl;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::source_location location;
};

using callback_t = std::function<void(const entry&)>;

[[nodiscard]] constexpr std::string_view level_to_string(level lvl) noexcept
{
    switch (lvl)
    {
        case level::trace: return "trace";
        case level::debug: return "debug";
        case level::info: return "info";
        case level::warn: return "warn";
        case level::error: return "error";
        case level::off: return "off";
    }
    return "unknown";
}

/// Inverse of `level_to_string`.
[[nodiscard]] inline std::optional<level> level_from_string(std::string_view name) noexcept
{
    for (auto lvl : {level::trace, level::debug, level::info, level::warn, level::error, level::off})
    {
        if (level_to_string(lvl) == name)
            return lvl;
    }
    return std::nullopt;
}

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
        threshold_.store(static_cast<std::uint8_t>(lvl), std::memory_order_relaxed);
    }

    [[nodiscard]] level get_level() const noexcept
    {
        return static_cast<level>(threshold_.load(std::memory_order_relaxed));
    }

    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return lvl != level::off && static_cast<std::uint8_t>(lvl) >= threshold_.load(std::memory_order_relaxed);
    }

    /// Route entries to `cb` instead of stderr; returns the previous callback.
    callback_t set_callback(callback_t cb)
    {
        std::lock_guard lock(mutex_);
        std::swap(callback_, cb);
        return cb;
    }

    void clear_callback()
    {
        set_callback(nullptr);
    }

    void log(level lvl, std::string message, std::source_location loc = std::source_location::current())
    {
        if (!is_enabled(lvl))
            return;

        const entry e{lvl, std::chrono::system_clock::now(), std::move(message), loc};
        std::lock_guard lock(mutex_);
        if (callback_)
            callback_(e);
        else
            write_stderr(e);
    }

private:
    logger() = default;

    // xoauthxx 2025-01-31T10:04:05Z debug token_endpoint.hpp:142: message
    static void write_stderr(const entry& e)
    {
        const std::time_t when = std::chrono::system_clock::to_time_t(e.timestamp);
        std::tm utc{};
        gmtime_r(&when, &utc);
        char stamp[32];
        std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%SZ", &utc);

        std::string_view file = e.location.file_name();
        if (const auto slash = file.find_last_of('/'); slash != std::string_view::npos)
            file.remove_prefix(slash + 1);

        std::string line = "xoauthxx ";
        line += stamp;
        line += ' ';
        line += level_to_string(e.lvl);
        line += ' ';
        line += file;
        line += ':';
        line += std::to_string(e.location.line());
        line += ": ";
        for (char c : e.message)
            line += static_cast<unsigned char>(c) < 0x20 ? ' ' : c;
        line += '\n';
        std::cerr << line;
    }

    std::atomic<std::uint8_t> threshold_{static_cast<std::uint8_t>(level::info)};
    std::mutex mutex_;
    callback_t callback_;
};

/// Installs a level and callback for its lifetime, restoring the previous ones afterwards.
class scoped_sink
{
public:
    scoped_sink(level lvl, callback_t cb)
        : previous_level_(logger::instance().get_level()),
          previous_callback_(logger::instance().set_callback(std::move(cb)))
    {
        logger::instance().set_level(lvl);
    }

    ~scoped_sink()
    {
        logger::instance().set_callback(std::move(previous_callback_));
        logger::instance().set_level(previous_level_);
    }

    scoped_sink(const scoped_sink&) = delete;
    scoped_sink& operator=(const scoped_sink&) = delete;

private:
    level previous_level_;
    callback_t previous_callback_;
};

#define XOAUTHXX_LOG(lvl, msg) \
    ::xoauthxx::log::logger::instance().log(lvl, msg, std::source_location::current())

#define XOAUTHXX_TRACE(msg) XOAUTHXX_LOG(::xoauthxx::log::level::trace, msg)
#define XOAUTHXX_DEBUG(msg) XOAUTHXX_LOG(::xoauthxx::log::level::debug, msg)
#define XOAUTHXX_INFO(msg) XOAUTHXX_LOG(::xoauthxx::log::level::info, msg)
#define XOAUTHXX_WARN(msg) XOAUTHXX_LOG(::xoauthxx::log::level::warn, msg)
#define XOAUTHXX_ERROR(msg) XOAUTHXX_LOG(::xoauthxx::log::level::error, msg)

} // namespace xoauthxx::log
