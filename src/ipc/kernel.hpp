//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ipc/kernel.hpp
// Purpose: Hosted kernel substrate: processes, handle tables, streams and
//          the read/write primitives with their synchronization modes.
//
// Key invariants:
//   - Handles resolve only in the table of the process that owns them.
//   - Writes never wait; reads follow the requested SyncMode.
//   - Registrations fire outside every kernel and stream lock.
//
// Ownership/Lifetime:
//   - The kernel owns processes and their handle tables.
//   - Streams live as long as a handle or an in-flight read refers to them.
//
// Links: src/ipc/stream.hpp, src/ipc/handle_table.hpp, src/ipc/sync_mode.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ipc/handle_table.hpp"
#include "ipc/stream.hpp"
#include "ipc/sync_mode.hpp"
#include "ipc/types.hpp"
#include "support/config.hpp"
#include "support/result.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace quasar::ipc
{

/**
 * @brief In-process stand-in for the OS kernel's IPC surface.
 *
 * @details
 * Every operation names the calling process explicitly, the way a syscall
 * handler would take it from the current task. Process 0 is the kernel and
 * exists from construction.
 *
 * Locking: the kernel mutex guards processes, handle tables and signal
 * queues. Each stream has its own mutex, always taken after the kernel
 * mutex. Blocking reads wait on the stream without holding the kernel mutex.
 */
class Kernel
{
  public:
    explicit Kernel(support::Config config = {});
    ~Kernel();

    Kernel(const Kernel &) = delete;
    Kernel &operator=(const Kernel &) = delete;

    // Processes -------------------------------------------------------------

    /// @brief Create a process with an empty handle table.
    ProcessId spawnProcess(std::string name);

    /**
     * @brief Create a child process with a standard stream.
     *
     * @details
     * The stream's consumer is placed in the child's table (retrievable via
     * standardStream()) and its producer in the parent's.
     */
    support::Result<Launch> launch(ProcessId parent, std::string program);

    /// @brief Consumer handle of the child's standard stream.
    support::Result<Handle> standardStream(ProcessId child) const;

    /**
     * @brief Tear down a process.
     *
     * @details
     * Closes every handle the process owns, so peers observe PeerClosed,
     * drops its registrations and signals, and invalidates its handles.
     */
    support::Result<void> terminate(ProcessId pid);

    [[nodiscard]] bool alive(ProcessId pid) const;
    [[nodiscard]] std::string processName(ProcessId pid) const;
    [[nodiscard]] std::size_t handleCount(ProcessId pid) const;

    // Streams ---------------------------------------------------------------

    /// @brief Create a stream with both endpoints owned by @p pid.
    support::Result<StreamPair> createStream(ProcessId pid);

    /**
     * @brief Append @p bytes through producer handle @p h.
     *
     * @details
     * Streams are unbounded, so every mode completes immediately with all
     * bytes written. Fails WrongDirection on a consumer handle and PeerClosed
     * when the consumer endpoint is gone.
     */
    support::Result<Completion> write(ProcessId pid, Handle h, std::span<const std::uint8_t> bytes, const SyncMode &mode);

    /**
     * @brief Read from consumer handle @p h into @p buf.
     *
     * @details
     * Data present: every mode returns it. Stream empty with live producers:
     * Attempt returns zero bytes, Blocking waits, Signal and Wakeup arm a
     * registration and return pending. All producers gone and buffer
     * drained: PeerClosed.
     */
    support::Result<Completion> read(ProcessId pid, Handle h, std::span<std::uint8_t> buf, const SyncMode &mode);

    /// @brief Move the endpoint named by @p h from @p from to @p to.
    support::Result<Handle> adopt(ProcessId from, Handle h, ProcessId to);

    /// @brief Derive another producer handle to the same stream.
    support::Result<Handle> clone(ProcessId pid, Handle producer);

    /// @brief Close one endpoint handle.
    support::Result<void> close(ProcessId pid, Handle h);

    // Registrations and signals ----------------------------------------------

    /**
     * @brief Drop the registration armed through @p h, if any.
     *
     * @details
     * Waits out an in-flight re-issue. @p taskId of zero matches any
     * requester.
     *
     * @return True when a registration was removed before it fired.
     */
    bool cancelRegistration(ProcessId pid, Handle h, Direction dir, std::uint64_t taskId = 0);

    /// @brief True when a Signal/Wakeup registration is armed for (@p h, @p dir).
    [[nodiscard]] bool hasRegistration(ProcessId pid, Handle h, Direction dir) const;

    /// @brief Pop the next queued signal of @p pid without waiting.
    std::optional<Signal> takeSignal(ProcessId pid);

    /// @brief Wait up to @p timeout for a signal; Timeout or NotFound on failure.
    support::Result<Signal> waitSignal(ProcessId pid, std::chrono::milliseconds timeout);

    [[nodiscard]] const support::Config &config() const
    {
        return config_;
    }

  private:
    struct Process
    {
        ProcessId id;
        std::string name;
        HandleTable table;
        std::deque<Signal> signals;
        std::optional<Handle> standardStream;
        bool alive = true;

        Process(ProcessId pid, std::string n, std::size_t capacity)
            : id(pid), name(std::move(n)), table(capacity)
        {
        }
    };

    /// Registration taken out of a stream, waiting to be fired.
    struct Firing
    {
        std::shared_ptr<Stream> stream;
        Registration reg;
        bool invalidated = false; ///< Consumer was closed or moved
    };

    Process *findLocked(ProcessId pid);
    const Process *findLocked(ProcessId pid) const;
    ProcessId spawnLocked(std::string name);
    support::Result<StreamPair> createStreamLocked(ProcessId producerOwner, ProcessId consumerOwner);
    void releaseEntryLocked(HandleEntry &entry, std::vector<Firing> &firings);
    void fire(Firing firing);
    void fireAll(std::vector<Firing> &firings);
    void postSignal(ProcessId pid, Signal sig);

    support::Config config_;
    mutable std::mutex mu_;
    std::condition_variable signalCv_;
    std::map<ProcessId, std::unique_ptr<Process>> processes_;
    ProcessId nextPid_ = KERNEL_PID;
    std::uint64_t nextStreamId_ = 1;
};

} // namespace quasar::ipc
