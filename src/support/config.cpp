//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/config.cpp
// Purpose: Environment overrides for the runtime Config.
// Key invariants: A malformed variable never changes the default it targets.
// Ownership/Lifetime: Reads the process environment; holds no state.
// Links: src/support/config.hpp
//
//===----------------------------------------------------------------------===//

#include "support/config.hpp"

#include <charconv>
#include <cstdlib>
#include <string_view>

namespace quasar::support
{

namespace
{

template <typename T> void overrideNumber(const char *name, T &target, T minimum)
{
    const char *raw = std::getenv(name);
    if (!raw)
        return;

    std::string_view text(raw);
    T parsed{};
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec != std::errc() || end != text.data() + text.size() || parsed < minimum)
    {
        log::warn("config", "ignoring ", name, "=", text);
        return;
    }
    target = parsed;
}

} // namespace

Config Config::fromEnvironment()
{
    Config cfg;

    if (const char *raw = std::getenv("QUASAR_LOG_LEVEL"))
    {
        if (auto lvl = log::parseLevel(raw))
            cfg.logLevel = *lvl;
        else
            log::warn("config", "ignoring QUASAR_LOG_LEVEL=", raw);
    }

    overrideNumber<std::uint32_t>("QUASAR_MAX_FRAME_BYTES", cfg.maxFrameBytes, 16);
    overrideNumber<std::size_t>("QUASAR_MAX_OUTSTANDING", cfg.maxOutstandingCalls, 1);
    overrideNumber<std::uint32_t>("QUASAR_CAS_RETRY_LIMIT", cfg.casRetryLimit, 0);
    overrideNumber<std::size_t>("QUASAR_HANDLE_CAPACITY", cfg.handleTableCapacity, 1);
    return cfg;
}

void Config::apply() const
{
    log::setLevel(logLevel);
}

} // namespace quasar::support
