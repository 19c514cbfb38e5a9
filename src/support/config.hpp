//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/config.hpp
// Purpose: Build-time tracing toggles and runtime limits for the IPC core.
// Key invariants: Defaults are usable without any environment set.
// Ownership/Lifetime: Config is a plain value copied into each component.
// Links: src/support/config.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/log.hpp"

#include <cstddef>
#include <cstdint>

// -----------------------------------------------------------------------------
// Debug / tracing toggles (keep OFF by default)
// -----------------------------------------------------------------------------
//
// Values are `0` (disabled) or `1` (enabled). They may be overridden via the
// build system (e.g., `target_compile_definitions`).

/// Emit a Debug line for every stream read/write and registration.
#ifndef QUASAR_DEBUG_STREAM
#define QUASAR_DEBUG_STREAM 0
#endif

/// Emit a Debug line for every portal frame sent or received.
#ifndef QUASAR_DEBUG_PORTAL
#define QUASAR_DEBUG_PORTAL 0
#endif

namespace quasar::support
{

/**
 * @brief Runtime limits shared by the kernel substrate and portals.
 *
 * @details
 * Every component takes a Config by value at construction, so a test can
 * shrink a limit for one portal without affecting others.
 */
struct Config
{
    log::Level logLevel = log::Level::Info;

    /// Largest envelope (kind byte plus payload) a portal accepts.
    std::uint32_t maxFrameBytes = 1u << 20;

    /// Calls a portal allows in flight before send() reports Busy.
    std::size_t maxOutstandingCalls = 64;

    /// CAS attempts per AtomicState transition; 0 retries until success.
    std::uint32_t casRetryLimit = 0;

    /// Slots in each process's handle table.
    std::size_t handleTableCapacity = 256;

    /// Bytes requested from the stream per portal read.
    std::size_t readChunkBytes = 4096;

    /**
     * @brief Defaults overridden by QUASAR_* environment variables.
     *
     * @details
     * Recognised variables: QUASAR_LOG_LEVEL, QUASAR_MAX_FRAME_BYTES,
     * QUASAR_MAX_OUTSTANDING, QUASAR_CAS_RETRY_LIMIT, QUASAR_HANDLE_CAPACITY.
     * Malformed values are ignored and reported at Warn.
     */
    static Config fromEnvironment();

    /// @brief Install logLevel as the process-wide log level.
    void apply() const;
};

} // namespace quasar::support
