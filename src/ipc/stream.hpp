//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ipc/stream.hpp
// Purpose: Unbounded many-writer, single-reader byte stream.
//
// Key invariants:
//   - Bytes of one append() land contiguously and in order.
//   - At most one read registration is armed at a time.
//   - The consumer epoch changes whenever the consumer handle is closed or
//     moved; a read started under an older epoch fails with HandleClosed.
//   - While a registration is being fired, cancellation waits for it.
//
// Ownership/Lifetime:
//   - Streams are shared by the handles naming them and by in-flight reads.
//   - The stream owns its buffered bytes and its armed registration.
//
// Links: src/ipc/kernel.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ipc/sync_mode.hpp"
#include "ipc/types.hpp"
#include "support/result.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <span>

namespace quasar::ipc
{

/**
 * @brief A Signal or Wakeup armed on the read side of a stream.
 *
 * @details
 * Signal registrations carry no continuation; Wakeup registrations carry the
 * continuation the kernel re-issues.
 */
struct Registration
{
    SyncMode::Kind kind = SyncMode::Kind::Signal;
    ProcessId pid = 0;
    Handle handle = HANDLE_INVALID;
    std::uint64_t epoch = 0;
    std::optional<Continuation> continuation;
};

/**
 * @brief Kernel byte stream object.
 *
 * @details
 * The stream knows nothing about processes or handle tables; the kernel
 * resolves handles and then calls into the stream. Operations that make the
 * stream ready (append, last producer release, consumer invalidation) take
 * the armed registration out and report it so the kernel can fire it outside
 * the stream lock. Every reported registration must be paired with one
 * finishFiring() call.
 */
class Stream
{
  public:
    explicit Stream(std::uint64_t id);

    Stream(const Stream &) = delete;
    Stream &operator=(const Stream &) = delete;

    [[nodiscard]] std::uint64_t id() const
    {
        return id_;
    }

    // Endpoint lifecycle ------------------------------------------------

    void addProducer();

    /// Drop one producer; on the last one, wake readers and report the armed registration.
    std::optional<Registration> releaseProducer();

    /// Close the consumer endpoint; later appends fail PeerClosed.
    std::optional<Registration> closeConsumer();

    /// Move the consumer endpoint to a new holder; in-flight reads fail HandleClosed.
    std::optional<Registration> rebindConsumer();

    [[nodiscard]] std::uint64_t consumerEpoch() const;

    // Data path -----------------------------------------------------------

    /// Append @p bytes; PeerClosed when the consumer is closed.
    support::Result<std::optional<Registration>> append(std::span<const std::uint8_t> bytes);

    /// Take what is available now (possibly nothing).
    support::Result<Completion> readNow(std::span<std::uint8_t> buf, std::uint64_t epoch);

    /// Wait on the calling thread until data, producer closure or invalidation.
    support::Result<Completion> readBlocking(std::span<std::uint8_t> buf, std::uint64_t epoch);

    /// Take available data, or arm @p reg and report pending.
    support::Result<Completion> readOrArm(std::span<std::uint8_t> buf, Registration reg);

    // Registration firing --------------------------------------------------

    /**
     * @brief Perform the read recorded by a fired Wakeup registration.
     *
     * @details
     * Returns the outcome to deliver, or nullopt when there was still nothing
     * to read and the registration was re-armed.
     */
    std::optional<support::Result<Completion>> reissue(Registration &reg);

    /// Mark one fired registration as fully delivered.
    void finishFiring();

    /**
     * @brief Drop the armed registration of (@p pid, @p handle, @p taskId).
     *
     * @details
     * Waits for any in-flight firing to finish first. A @p taskId of zero
     * matches any requester.
     *
     * @return True if a registration was removed before it fired.
     */
    bool cancelRegistration(ProcessId pid, Handle handle, std::uint64_t taskId);

    [[nodiscard]] bool hasRegistration() const;

  private:
    std::size_t takeLocked(std::span<std::uint8_t> buf);
    std::optional<Registration> takeArmedLocked();

    const std::uint64_t id_;

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<std::uint8_t> buffer_;
    std::size_t producers_ = 0;
    bool consumerOpen_ = true;
    std::uint64_t epoch_ = 0;
    std::optional<Registration> armed_;
    std::size_t firing_ = 0;
};

} // namespace quasar::ipc
