//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ipc/sync_bridge.hpp
// Purpose: One operation shape for every SyncMode plus task-suspending reads.
//
// Key invariants:
//   - An async read resumes exactly once: with data, an error, or Cancelled.
//   - Cancelling deregisters the wakeup before reporting Cancelled; bytes the
//     kernel already delivered are never dropped.
//
// Ownership/Lifetime:
//   - The bridge borrows the kernel and executor; both must outlive it and
//     every operation it started.
//   - Buffers passed to async reads must stay valid until the read resumes.
//
// Links: src/ipc/kernel.hpp, src/sched/executor.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ipc/kernel.hpp"
#include "ipc/sync_mode.hpp"
#include "sched/cancel.hpp"
#include "sched/executor.hpp"
#include "sched/task.hpp"
#include "support/result.hpp"

#include <atomic>
#include <coroutine>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>

namespace quasar::ipc
{

/**
 * @brief Adapter from the kernel's SyncMode primitives to a process's code.
 *
 * @details
 * read()/write() forward to the kernel with the requested mode. readAsync()
 * issues the read in Wakeup mode: when data is already there the awaiting
 * task continues without suspending; otherwise it suspends and the kernel's
 * re-issue posts it back to the executor.
 */
class SyncBridge
{
  public:
    SyncBridge(Kernel &kernel, ProcessId pid);
    SyncBridge(Kernel &kernel, ProcessId pid, sched::Executor &executor);

    [[nodiscard]] ProcessId pid() const
    {
        return pid_;
    }

    [[nodiscard]] Kernel &kernel() const
    {
        return *kernel_;
    }

    /// @brief Read with an explicit mode.
    support::Result<Completion> read(Handle h, std::span<std::uint8_t> buf, const SyncMode &mode);

    /// @brief Write with an explicit mode; always completes immediately.
    support::Result<Completion> write(Handle h, std::span<const std::uint8_t> bytes, const SyncMode &mode);

    /// Shared between a suspended read and the kernel's re-issue.
    struct WakeState;

    /**
     * @brief Awaitable read for cooperative tasks.
     *
     * @details
     * co_await yields Result<Completion>. Errors: Cancelled when @p token
     * fires first, AlreadyRegistered when another wakeup is armed on the
     * handle, plus the kernel's read errors.
     */
    class ReadAwaiter
    {
      public:
        ReadAwaiter(SyncBridge &bridge, Handle h, std::span<std::uint8_t> buf, sched::CancelToken token);

        bool await_ready();
        bool await_suspend(std::coroutine_handle<> awaiting);
        support::Result<Completion> await_resume();

      private:
        SyncBridge *bridge_;
        Handle handle_;
        std::span<std::uint8_t> buf_;
        sched::CancelToken token_;
        std::uint64_t taskId_;
        std::shared_ptr<WakeState> state_;
        std::optional<support::Result<Completion>> immediate_;
        sched::CancelToken::CallbackId cancelId_ = sched::CancelToken::NO_CALLBACK;
    };

    /// @brief Suspend the calling task until some bytes arrive.
    ReadAwaiter readAsync(Handle h, std::span<std::uint8_t> buf, sched::CancelToken token);

    /// @brief Write from a task; checks cancellation before writing.
    sched::Task<support::Result<Completion>> writeAsync(Handle h,
                                                       std::span<const std::uint8_t> bytes,
                                                       sched::CancelToken token);

    /**
     * @brief Read until @p buf is full.
     *
     * @return Bytes read (always buf.size()) or the first error. Bytes read
     *         before an error stay consumed.
     */
    sched::Task<support::Result<std::size_t>> readExact(Handle h,
                                                       std::span<std::uint8_t> buf,
                                                       sched::CancelToken token);

  private:
    Kernel *kernel_;
    ProcessId pid_;
    sched::Executor *executor_;
};

} // namespace quasar::ipc
