//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/sched/cancel.cpp
// Purpose: Shared state and callback dispatch for CancelToken.
// Key invariants: Callbacks run outside the token mutex.
// Ownership/Lifetime: State is shared by every copy of a token.
// Links: src/sched/cancel.hpp
//
//===----------------------------------------------------------------------===//

#include "sched/cancel.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace quasar::sched
{

struct CancelToken::State
{
    std::atomic<bool> cancelled{false};
    std::mutex mu;
    std::condition_variable idle;
    CallbackId nextId = 1;
    std::vector<std::pair<CallbackId, Callback>> callbacks;
    std::vector<CallbackId> firing; ///< taken by cancel(), not yet returned
    std::thread::id runner;
};

CancelToken::CancelToken() : state_(std::make_shared<State>()) {}

void CancelToken::cancel() const
{
    std::vector<std::pair<CallbackId, Callback>> toRun;
    {
        std::lock_guard<std::mutex> lock(state_->mu);
        bool expected = false;
        if (!state_->cancelled.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
            return;
        toRun.swap(state_->callbacks);
        state_->runner = std::this_thread::get_id();
        for (const auto &entry : toRun)
            state_->firing.push_back(entry.first);
    }
    for (auto &entry : toRun)
    {
        entry.second();
        {
            std::lock_guard<std::mutex> lock(state_->mu);
            auto &ids = state_->firing;
            ids.erase(std::find(ids.begin(), ids.end(), entry.first));
        }
        state_->idle.notify_all();
    }
}

bool CancelToken::isCancelled() const
{
    return state_->cancelled.load(std::memory_order_acquire);
}

CancelToken::CallbackId CancelToken::onCancel(Callback cb) const
{
    {
        std::lock_guard<std::mutex> lock(state_->mu);
        if (!state_->cancelled.load(std::memory_order_acquire))
        {
            CallbackId id = state_->nextId++;
            state_->callbacks.emplace_back(id, std::move(cb));
            return id;
        }
    }
    cb();
    return NO_CALLBACK;
}

void CancelToken::removeCallback(CallbackId id) const
{
    if (id == NO_CALLBACK)
        return;
    std::unique_lock<std::mutex> lock(state_->mu);
    auto &cbs = state_->callbacks;
    for (auto it = cbs.begin(); it != cbs.end(); ++it)
    {
        if (it->first == id)
        {
            cbs.erase(it);
            return;
        }
    }
    if (state_->runner == std::this_thread::get_id())
        return;
    auto &ids = state_->firing;
    state_->idle.wait(lock, [&] { return std::find(ids.begin(), ids.end(), id) == ids.end(); });
}

} // namespace quasar::sched
