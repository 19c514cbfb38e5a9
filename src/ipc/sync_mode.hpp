//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ipc/sync_mode.hpp
// Purpose: Synchronization modes and the tagged continuation used by Wakeup.
// Key invariants:
//   - A Continuation is plain data; the kernel re-issues the recorded
//     operation and hands the outcome to the Waker.
//   - The buffer named by a Continuation must stay valid until the Waker
//     runs or the registration is cancelled.
// Ownership/Lifetime: SyncMode shares ownership of its Waker.
// Links: src/ipc/kernel.hpp, src/ipc/sync_bridge.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ipc/types.hpp"
#include "support/result.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <utility>

namespace quasar::ipc
{

class Waker;

/**
 * @brief Everything needed to resume a read that could not progress.
 *
 * @details
 * Recorded by the kernel when a Wakeup-mode operation would otherwise wait.
 * When the stream becomes ready the kernel performs @ref op again on behalf
 * of @ref pid against @ref buffer and delivers the result to @ref waker.
 */
struct Continuation
{
    Direction op = Direction::Read;
    ProcessId pid = 0;
    Handle handle = HANDLE_INVALID;
    std::span<std::uint8_t> buffer;
    std::uint64_t taskId = 0; ///< Requester identity, used to cancel
    std::shared_ptr<Waker> waker;
};

/**
 * @brief Receiver of re-issued operation results.
 *
 * @details
 * complete() runs on the thread that made the stream ready (a writer, a
 * closing process) and must not block or call back into the same stream.
 */
class Waker
{
  public:
    virtual ~Waker() = default;

    virtual void complete(const Continuation &cont, support::Result<Completion> result) = 0;
};

/**
 * @brief How a primitive read/write behaves when it cannot progress.
 *
 * @details
 * - Blocking: the calling thread waits.
 * - Signal: a registration is armed and a Signal is queued for the process
 *   once the stream is ready; the caller re-issues the read.
 * - Attempt: returns immediately, possibly with zero bytes.
 * - Wakeup: a Continuation is recorded and completed by the kernel.
 */
class SyncMode
{
  public:
    enum class Kind : std::uint8_t
    {
        Blocking,
        Signal,
        Attempt,
        Wakeup,
    };

    static SyncMode blocking()
    {
        return SyncMode(Kind::Blocking);
    }

    static SyncMode signal()
    {
        return SyncMode(Kind::Signal);
    }

    static SyncMode attempt()
    {
        return SyncMode(Kind::Attempt);
    }

    static SyncMode wakeup(std::shared_ptr<Waker> waker, std::uint64_t taskId = 0)
    {
        SyncMode m(Kind::Wakeup);
        m.waker_ = std::move(waker);
        m.taskId_ = taskId;
        return m;
    }

    [[nodiscard]] Kind kind() const
    {
        return kind_;
    }

    [[nodiscard]] const std::shared_ptr<Waker> &waker() const
    {
        return waker_;
    }

    [[nodiscard]] std::uint64_t taskId() const
    {
        return taskId_;
    }

  private:
    explicit SyncMode(Kind kind) : kind_(kind) {}

    Kind kind_;
    std::shared_ptr<Waker> waker_;
    std::uint64_t taskId_ = 0;
};

} // namespace quasar::ipc
