//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/log.hpp
// Purpose: Leveled logging for the IPC core with a bracketed subsystem tag.
//
// Log Levels:
//   Debug (0) - Detailed diagnostic information
//   Info  (1) - General informational messages (default)
//   Warn  (2) - Warning conditions
//   Error (3) - Error conditions
//   Off   (4) - Disable all logging
//
// Messages are written to stderr with format:
//   [LEVEL] HH:MM:SS [component] message
//
// Key invariants: Level and sink changes are visible to all threads; one
//                 message is written as one unit.
// Ownership/Lifetime: The installed sink is owned by the logger.
// Links: src/support/log.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <functional>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace quasar::log
{

enum class Level : int
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4,
};

/// @brief Receives every message that passes the level filter.
using Sink = std::function<void(Level, std::string_view component, std::string_view message)>;

/// @brief Set the minimum level that is emitted.
void setLevel(Level level);

/// @brief Current minimum level.
Level level();

/// @brief True when messages at @p level pass the filter.
bool enabled(Level level);

/// @brief Replace the output sink; an empty sink restores stderr output.
void setSink(Sink sink);

/// @brief Emit one already formatted message.
void write(Level level, std::string_view component, std::string_view message);

/// @brief Upper-case name used in the output prefix ("DEBUG", "INFO", ...).
std::string_view levelName(Level level);

/// @brief Parse a level name (case-insensitive) or a digit 0-4.
std::optional<Level> parseLevel(std::string_view text);

namespace detail
{
template <typename... Args> std::string concat(const Args &...args)
{
    std::ostringstream os;
    (os << ... << args);
    return os.str();
}
} // namespace detail

template <typename... Args> void debug(std::string_view component, const Args &...args)
{
    if (enabled(Level::Debug))
        write(Level::Debug, component, detail::concat(args...));
}

template <typename... Args> void info(std::string_view component, const Args &...args)
{
    if (enabled(Level::Info))
        write(Level::Info, component, detail::concat(args...));
}

template <typename... Args> void warn(std::string_view component, const Args &...args)
{
    if (enabled(Level::Warn))
        write(Level::Warn, component, detail::concat(args...));
}

template <typename... Args> void error(std::string_view component, const Args &...args)
{
    if (enabled(Level::Error))
        write(Level::Error, component, detail::concat(args...));
}

} // namespace quasar::log
