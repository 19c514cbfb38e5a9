//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/sched/executor.cpp
// Purpose: Ready queue and run loops of the FIFO executor.
// Key invariants: Jobs execute outside the queue mutex.
// Ownership/Lifetime: Queued jobs are destroyed after they run.
// Links: src/sched/executor.hpp
//
//===----------------------------------------------------------------------===//

#include "sched/executor.hpp"

namespace quasar::sched
{

void Executor::post(Job job)
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        ready_.push_back(std::move(job));
    }
    cv_.notify_one();
}

void Executor::post(std::coroutine_handle<> handle)
{
    post(Job([handle] { handle.resume(); }));
}

std::size_t Executor::runUntilIdle()
{
    std::size_t count = 0;
    for (;;)
    {
        Job job;
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (ready_.empty())
                return count;
            job = std::move(ready_.front());
            ready_.pop_front();
        }
        job();
        ++count;
    }
}

void Executor::runUntil(const std::function<bool()> &done)
{
    while (!done())
    {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mu_);
            cv_.wait(lock, [this] { return !ready_.empty(); });
            job = std::move(ready_.front());
            ready_.pop_front();
        }
        job();
    }
}

void Executor::run()
{
    for (;;)
    {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mu_);
            cv_.wait(lock, [this] { return stopRequested_ || !ready_.empty(); });
            if (stopRequested_)
            {
                stopRequested_ = false;
                return;
            }
            job = std::move(ready_.front());
            ready_.pop_front();
        }
        job();
    }
}

void Executor::stop()
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        stopRequested_ = true;
    }
    cv_.notify_all();
}

std::size_t Executor::pending() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return ready_.size();
}

} // namespace quasar::sched
