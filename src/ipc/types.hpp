//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ipc/types.hpp
// Purpose: Handle encoding, endpoint rights and completion records for streams.
// Key invariants:
//   - A handle packs a 24-bit slot index and an 8-bit generation.
//   - HANDLE_INVALID never names a live slot.
// Ownership/Lifetime: Plain values.
// Links: src/ipc/handle_table.hpp, src/ipc/kernel.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace quasar::ipc
{

/// Process-scoped endpoint identifier.
using Handle = std::uint32_t;

/// Process identifier; process 0 is the kernel itself.
using ProcessId = std::uint32_t;

/// Endpoint rights mask.
using Rights = std::uint32_t;

constexpr Handle HANDLE_INVALID = 0xFFFFFFFFu;
constexpr ProcessId KERNEL_PID = 0;

constexpr std::uint32_t HANDLE_INDEX_BITS = 24;
constexpr std::uint32_t HANDLE_INDEX_MASK = (1u << HANDLE_INDEX_BITS) - 1;
constexpr std::size_t MAX_HANDLE_SLOTS = HANDLE_INDEX_MASK; // index 0xFFFFFF is reserved

// Rights
constexpr Rights RIGHT_NONE = 0;
constexpr Rights RIGHT_READ = 1u << 0;
constexpr Rights RIGHT_WRITE = 1u << 1;
constexpr Rights RIGHT_DERIVE = 1u << 2;
constexpr Rights RIGHT_TRANSFER = 1u << 3;

constexpr Rights PRODUCER_RIGHTS = RIGHT_WRITE | RIGHT_DERIVE | RIGHT_TRANSFER;
constexpr Rights CONSUMER_RIGHTS = RIGHT_READ | RIGHT_TRANSFER;

/// @brief Extract the slot index from a handle.
inline constexpr std::uint32_t handle_index(Handle h)
{
    return h & HANDLE_INDEX_MASK;
}

/// @brief Extract the generation from a handle.
inline constexpr std::uint8_t handle_gen(Handle h)
{
    return static_cast<std::uint8_t>(h >> HANDLE_INDEX_BITS);
}

/// @brief Pack a slot index and generation into a handle.
inline constexpr Handle make_handle(std::uint32_t index, std::uint8_t gen)
{
    return (static_cast<Handle>(gen) << HANDLE_INDEX_BITS) | (index & HANDLE_INDEX_MASK);
}

/// Which end of a stream a handle refers to.
enum class Side : std::uint8_t
{
    Producer,
    Consumer,
};

/// Direction of a primitive operation.
enum class Direction : std::uint8_t
{
    Read,
    Write,
};

std::string_view sideName(Side side);
std::string_view directionName(Direction dir);

/// @brief Outcome of a primitive read or write.
struct Completion
{
    std::size_t bytes = 0; ///< Bytes transferred
    bool pending = false;  ///< A Signal/Wakeup registration was armed instead
};

/// @brief Readiness notification posted to a process's signal queue.
struct Signal
{
    Handle handle = HANDLE_INVALID;
    Direction direction = Direction::Read;
};

/// @brief Both ends of a freshly created stream.
struct StreamPair
{
    Handle producer = HANDLE_INVALID;
    Handle consumer = HANDLE_INVALID;
};

/// @brief Result of launching a process with a standard stream.
struct Launch
{
    ProcessId child = 0;
    Handle stdinProducer = HANDLE_INVALID; ///< Held by the parent
};

} // namespace quasar::ipc
