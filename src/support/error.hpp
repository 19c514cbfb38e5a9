//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/error.hpp
// Purpose: Shared error codes for the IPC core and helpers to name them.
// Key invariants: Codes are stable; Error::None is the only non-error value.
// Ownership/Lifetime: Plain enumeration; names are static strings.
// Links: src/support/result.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>

namespace quasar::support
{

/**
 * @brief Error codes reported by every layer of the IPC core.
 *
 * @details
 * Codes are grouped the same way callers reason about them:
 * - usage errors are detected before any I/O and are recoverable;
 * - liveness errors report a peer, handle or portal that went away;
 * - protocol errors report a peer that broke the wire contract.
 *
 * Guard errors raised by an AtomicState are not listed here; they use the
 * error type declared with the guard.
 */
enum class Error : std::int32_t
{
    None = 0, ///< No error (success)

    // General (-1 to -99)
    InvalidArg = -1,  ///< Invalid argument provided
    NotFound = -2,    ///< Resource not found
    NoResource = -3,  ///< Table or slot exhausted
    Busy = -4,        ///< Too many outstanding operations
    Cancelled = -5,   ///< Operation cancelled cooperatively
    Contended = -6,   ///< CAS retry limit exhausted
    Timeout = -7,     ///< Wait timed out

    // Handles (-100 to -199)
    InvalidHandle = -100,  ///< Handle does not resolve in the caller's table
    HandleClosed = -101,   ///< Handle was closed or adopted mid-operation
    WrongDirection = -102, ///< Read on a producer or write on a consumer
    Denied = -103,         ///< Handle lacks the right for the operation

    // Streams and sync modes (-300 to -399)
    PeerClosed = -300,        ///< The other side of the stream is gone
    AlreadyRegistered = -301, ///< A Signal/Wakeup is already armed

    // Atomic state (-400 to -499)
    DuplicateBit = -400,  ///< Two guards declared for the same bit
    BitOutOfRange = -401, ///< Bit index outside the declared width
    GuardConflict = -402, ///< Guard requires a bit both set and clear

    // Portals (-500 to -599)
    PortalClosed = -500,      ///< Portal already entered Closed
    ProtocolViolation = -501, ///< Malformed or inconsistent frame from peer
    SchemaMismatch = -502,    ///< Call or value does not match its route
    UnknownRoute = -503,      ///< Route name not in the schema
    DuplicateRoute = -504,    ///< Route declared twice in one builder
    NotNegotiated = -505,     ///< Portal has not completed its handshake
    Remote = -506,            ///< Peer answered the call with an error
};

/// @brief Stable, human readable name of @p error (e.g. "PeerClosed").
std::string_view errorName(Error error);

/// @brief Map a numeric code received from a peer back to an Error.
/// @details Codes that are not defined here (and 0) map to Error::Remote.
Error errorFromCode(std::int32_t code);

/// @brief Check whether @p error represents success.
inline bool isOk(Error error)
{
    return error == Error::None;
}

/// @brief Stream @p error by name for logs and test output.
std::ostream &operator<<(std::ostream &os, Error error);

} // namespace quasar::support
