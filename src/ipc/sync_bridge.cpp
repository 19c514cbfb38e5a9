//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ipc/sync_bridge.cpp
// Purpose: Wakeup delivery and cancellation for suspended reads.
// Key invariants: WakeState::complete() wins at most once; later calls are
//                 ignored.
// Ownership/Lifetime: WakeState is shared by the awaiter, the kernel's
//                     continuation and the cancel callback.
// Links: src/ipc/sync_bridge.hpp
//
//===----------------------------------------------------------------------===//

#include "ipc/sync_bridge.hpp"

#include "support/config.hpp"
#include "support/log.hpp"

namespace quasar::ipc
{

using support::Err;
using support::Error;
using support::Result;

namespace
{

std::atomic<std::uint64_t> g_nextTaskId{1};

} // namespace

struct SyncBridge::WakeState : Waker
{
    explicit WakeState(sched::Executor *exec) : executor(exec) {}

    void complete(const Continuation &cont, Result<Completion> result) override
    {
        (void)cont;
        deliver(std::move(result));
    }

    void deliver(Result<Completion> result)
    {
        std::coroutine_handle<> waiter;
        {
            std::lock_guard<std::mutex> lock(mu);
            if (done)
                return;
            done = true;
            outcome.emplace(std::move(result));
            waiter = handle;
        }
        if (waiter)
            executor->post(waiter);
    }

    sched::Executor *executor;
    std::mutex mu;
    bool done = false;
    std::optional<Result<Completion>> outcome;
    std::coroutine_handle<> handle;
};

SyncBridge::SyncBridge(Kernel &kernel, ProcessId pid) : kernel_(&kernel), pid_(pid), executor_(nullptr) {}

SyncBridge::SyncBridge(Kernel &kernel, ProcessId pid, sched::Executor &executor)
    : kernel_(&kernel), pid_(pid), executor_(&executor)
{
}

Result<Completion> SyncBridge::read(Handle h, std::span<std::uint8_t> buf, const SyncMode &mode)
{
    return kernel_->read(pid_, h, buf, mode);
}

Result<Completion> SyncBridge::write(Handle h, std::span<const std::uint8_t> bytes, const SyncMode &mode)
{
    return kernel_->write(pid_, h, bytes, mode);
}

SyncBridge::ReadAwaiter::ReadAwaiter(SyncBridge &bridge,
                                     Handle h,
                                     std::span<std::uint8_t> buf,
                                     sched::CancelToken token)
    : bridge_(&bridge), handle_(h), buf_(buf), token_(std::move(token)),
      taskId_(g_nextTaskId.fetch_add(1, std::memory_order_relaxed))
{
}

bool SyncBridge::ReadAwaiter::await_ready()
{
    if (token_.isCancelled())
    {
        immediate_.emplace(Err(Error::Cancelled));
        return true;
    }
    if (!bridge_->executor_)
    {
        immediate_.emplace(Err(Error::InvalidArg));
        return true;
    }

    state_ = std::make_shared<WakeState>(bridge_->executor_);
    auto r = bridge_->kernel_->read(bridge_->pid_, handle_, buf_, SyncMode::wakeup(state_, taskId_));
    if (r.is_err() || !r.value().pending)
    {
        immediate_.emplace(std::move(r));
        return true;
    }

#if QUASAR_DEBUG_STREAM
    log::debug("bridge", "pid ", bridge_->pid_, " task ", taskId_, " suspends on ", handle_);
#endif
    return false;
}

bool SyncBridge::ReadAwaiter::await_suspend(std::coroutine_handle<> awaiting)
{
    {
        std::lock_guard<std::mutex> lock(state_->mu);
        // The kernel may have completed the read between arming and here.
        if (state_->done)
            return false;
        state_->handle = awaiting;
    }

    Kernel *kernel = bridge_->kernel_;
    const ProcessId pid = bridge_->pid_;
    const Handle h = handle_;
    const std::uint64_t taskId = taskId_;
    std::shared_ptr<WakeState> state = state_;

    cancelId_ = token_.onCancel(
        [kernel, pid, h, taskId, state]
        {
            if (kernel->cancelRegistration(pid, h, Direction::Read, taskId))
                log::debug("bridge", "pid ", pid, " task ", taskId, " cancelled wakeup on ", h);
            state->deliver(Err(Error::Cancelled));
        });
    return true;
}

Result<Completion> SyncBridge::ReadAwaiter::await_resume()
{
    if (immediate_)
        return std::move(*immediate_);

    token_.removeCallback(cancelId_);

    std::lock_guard<std::mutex> lock(state_->mu);
    return std::move(*state_->outcome);
}

SyncBridge::ReadAwaiter SyncBridge::readAsync(Handle h, std::span<std::uint8_t> buf, sched::CancelToken token)
{
    return ReadAwaiter(*this, h, buf, std::move(token));
}

sched::Task<Result<Completion>> SyncBridge::writeAsync(Handle h,
                                                      std::span<const std::uint8_t> bytes,
                                                      sched::CancelToken token)
{
    if (token.isCancelled())
        co_return Err(Error::Cancelled);
    co_return kernel_->write(pid_, h, bytes, SyncMode::attempt());
}

sched::Task<Result<std::size_t>> SyncBridge::readExact(Handle h,
                                                      std::span<std::uint8_t> buf,
                                                      sched::CancelToken token)
{
    std::size_t got = 0;
    while (got < buf.size())
    {
        auto r = co_await readAsync(h, buf.subspan(got), token);
        if (r.is_err())
            co_return Err(r.error());
        got += r.value().bytes;
    }
    co_return Result<std::size_t>::Ok(got);
}

} // namespace quasar::ipc
