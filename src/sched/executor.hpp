//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/sched/executor.hpp
// Purpose: FIFO executor that runs posted jobs and resumes suspended tasks.
//
// Key invariants:
//   - Jobs run one at a time, in post() order, on the thread calling run*().
//   - post() is safe from any thread; it is how wakeups re-enter the
//     executor.
//
// Ownership/Lifetime:
//   - The executor owns queued jobs until they run.
//   - Spawned tasks own themselves once started.
//
// Links: src/sched/task.hpp, src/sched/executor.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sched/task.hpp"

#include <condition_variable>
#include <coroutine>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>

namespace quasar::sched
{

/**
 * @brief Cooperative FIFO scheduler.
 *
 * @details
 * The ready queue is strictly first-in first-out; there is no priority or
 * time slicing. A task gives up the executor only at an awaited suspend
 * point, after which whatever wakes it (a kernel re-issue, a cancellation,
 * another task) posts its coroutine handle back here.
 */
class Executor
{
  public:
    using Job = std::function<void()>;

    Executor() = default;
    Executor(const Executor &) = delete;
    Executor &operator=(const Executor &) = delete;

    /// Queue @p job; thread safe.
    void post(Job job);

    /// Queue the resumption of @p handle; thread safe.
    void post(std::coroutine_handle<> handle);

    /// Start @p task on this executor without waiting for it.
    template <typename T> void spawn(Task<T> task)
    {
        post(std::coroutine_handle<>(drive(std::move(task)).handle));
    }

    /// @brief Run queued jobs until the queue is empty.
    /// @return Number of jobs executed.
    std::size_t runUntilIdle();

    /**
     * @brief Run jobs, sleeping while the queue is empty, until @p done holds.
     *
     * @details
     * @p done is checked before every job, so work posted from other threads
     * keeps the loop alive. Returns immediately when @p done already holds.
     */
    void runUntil(const std::function<bool()> &done);

    /// Run until stop() is called.
    void run();

    /// Ask run() to return after the current job; thread safe.
    void stop();

    /// Jobs currently queued.
    [[nodiscard]] std::size_t pending() const;

    /**
     * @brief Drive @p task to completion on the calling thread.
     *
     * @details
     * Spawns the task and runs the executor until it finishes. Wakeups posted
     * by other threads in the meantime are executed as usual.
     */
    template <typename T> T blockOn(Task<T> task)
    {
        bool finished = false;
        if constexpr (std::is_void_v<T>)
        {
            post(std::coroutine_handle<>(signalDone(std::move(task), finished).handle));
            runUntil([&] { return finished; });
        }
        else
        {
            std::optional<T> out;
            post(std::coroutine_handle<>(capture(std::move(task), out, finished).handle));
            runUntil([&] { return finished; });
            return std::move(*out);
        }
    }

  private:
    template <typename T> static Detached drive(Task<T> task)
    {
        co_await std::move(task);
    }

    static Detached signalDone(Task<void> task, bool &finished)
    {
        co_await std::move(task);
        finished = true;
    }

    template <typename T> static Detached capture(Task<T> task, std::optional<T> &out, bool &finished)
    {
        out.emplace(co_await std::move(task));
        finished = true;
    }

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<Job> ready_;
    bool stopRequested_ = false;
};

} // namespace quasar::sched
