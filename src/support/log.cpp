//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/log.cpp
// Purpose: Logger state, level filtering and the default stderr sink.
// Key invariants: The sink is invoked under the logger mutex so lines from
//                 concurrent threads never interleave.
// Ownership/Lifetime: Process-wide state with static storage duration.
// Links: src/support/log.hpp
//
//===----------------------------------------------------------------------===//

#include "support/log.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace quasar::log
{

namespace
{

std::atomic<int> g_level{static_cast<int>(Level::Info)};

std::mutex &sinkMutex()
{
    static std::mutex mu;
    return mu;
}

Sink &sinkSlot()
{
    static Sink sink;
    return sink;
}

void writeStderr(Level level, std::string_view component, std::string_view message)
{
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);

    char stamp[16];
    std::snprintf(stamp, sizeof(stamp), "%02d:%02d:%02d", tm.tm_hour, tm.tm_min, tm.tm_sec);

    const std::string_view name = levelName(level);
    std::fprintf(stderr,
                 "[%.*s] %s [%.*s] %.*s\n",
                 static_cast<int>(name.size()),
                 name.data(),
                 stamp,
                 static_cast<int>(component.size()),
                 component.data(),
                 static_cast<int>(message.size()),
                 message.data());
}

} // namespace

void setLevel(Level level)
{
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

Level level()
{
    return static_cast<Level>(g_level.load(std::memory_order_relaxed));
}

bool enabled(Level lvl)
{
    return lvl != Level::Off && static_cast<int>(lvl) >= g_level.load(std::memory_order_relaxed);
}

void setSink(Sink sink)
{
    std::lock_guard<std::mutex> lock(sinkMutex());
    sinkSlot() = std::move(sink);
}

void write(Level lvl, std::string_view component, std::string_view message)
{
    if (!enabled(lvl))
        return;

    std::lock_guard<std::mutex> lock(sinkMutex());
    if (sinkSlot())
        sinkSlot()(lvl, component, message);
    else
        writeStderr(lvl, component, message);
}

std::string_view levelName(Level lvl)
{
    switch (lvl)
    {
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARN";
        case Level::Error:
            return "ERROR";
        case Level::Off:
            return "OFF";
    }
    return "?";
}

std::optional<Level> parseLevel(std::string_view text)
{
    if (text.size() == 1 && text[0] >= '0' && text[0] <= '4')
        return static_cast<Level>(text[0] - '0');

    std::string lower;
    lower.reserve(text.size());
    for (char c : text)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (lower == "debug")
        return Level::Debug;
    if (lower == "info")
        return Level::Info;
    if (lower == "warn" || lower == "warning")
        return Level::Warn;
    if (lower == "error")
        return Level::Error;
    if (lower == "off")
        return Level::Off;
    return std::nullopt;
}

} // namespace quasar::log
