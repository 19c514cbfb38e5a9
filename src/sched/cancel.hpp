//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/sched/cancel.hpp
// Purpose: Cooperative cancellation token consulted at every suspend point.
//
// Key invariants:
//   - Once cancelled, a token stays cancelled.
//   - Each registered callback runs at most once, on the cancelling thread.
//   - removeCallback() returns only once its callback can no longer run.
//
// Ownership/Lifetime:
//   - Tokens are cheap shared handles; copies observe the same state.
//   - Callbacks are released after they run or are removed.
//
// Links: src/sched/cancel.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <functional>
#include <memory>

namespace quasar::sched
{

/**
 * @brief Shared cancellation flag with callbacks.
 *
 * @details
 * Cancellation is a request, not a preemption: suspended operations register
 * a callback that deregisters their wakeup and resumes them with Cancelled;
 * running code polls isCancelled() at its own suspend points.
 */
class CancelToken
{
  public:
    using Callback = std::function<void()>;
    using CallbackId = std::uint64_t;

    /// Id returned when the callback already ran (token was cancelled).
    static constexpr CallbackId NO_CALLBACK = 0;

    /// Create a new token (not cancelled).
    CancelToken();

    /// Request cancellation and run every registered callback once.
    void cancel() const;

    [[nodiscard]] bool isCancelled() const;

    /**
     * @brief Register @p cb to run on cancellation.
     *
     * @details
     * When the token is already cancelled @p cb runs immediately on the
     * calling thread and NO_CALLBACK is returned.
     */
    CallbackId onCancel(Callback cb) const;

    /**
     * @brief Remove a callback that has not run yet.
     *
     * @details
     * When the callback is running on another thread, waits for it to
     * return. Removing from inside the callback itself does not wait.
     */
    void removeCallback(CallbackId id) const;

  private:
    struct State;
    std::shared_ptr<State> state_;
};

} // namespace quasar::sched
