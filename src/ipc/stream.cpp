//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ipc/stream.cpp
// Purpose: Buffering, blocking reads and registration bookkeeping of Stream.
// Key invariants: cv_ is notified on every change a waiter may care about.
// Ownership/Lifetime: See stream.hpp.
// Links: src/ipc/stream.hpp
//
//===----------------------------------------------------------------------===//

#include "ipc/stream.hpp"

#include "support/config.hpp"
#include "support/log.hpp"

#include <algorithm>

namespace quasar::ipc
{

using support::Err;
using support::Error;
using support::Result;

Stream::Stream(std::uint64_t id) : id_(id) {}

void Stream::addProducer()
{
    std::lock_guard<std::mutex> lock(mu_);
    ++producers_;
}

std::optional<Registration> Stream::releaseProducer()
{
    std::optional<Registration> reg;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (producers_ > 0)
            --producers_;
        if (producers_ == 0)
            reg = takeArmedLocked();
    }
    cv_.notify_all();
    return reg;
}

std::optional<Registration> Stream::closeConsumer()
{
    std::optional<Registration> reg;
    {
        std::lock_guard<std::mutex> lock(mu_);
        consumerOpen_ = false;
        ++epoch_;
        buffer_.clear();
        reg = takeArmedLocked();
    }
    cv_.notify_all();
    return reg;
}

std::optional<Registration> Stream::rebindConsumer()
{
    std::optional<Registration> reg;
    {
        std::lock_guard<std::mutex> lock(mu_);
        ++epoch_;
        reg = takeArmedLocked();
    }
    cv_.notify_all();
    return reg;
}

std::uint64_t Stream::consumerEpoch() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return epoch_;
}

Result<std::optional<Registration>> Stream::append(std::span<const std::uint8_t> bytes)
{
    std::optional<Registration> reg;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!consumerOpen_)
            return Err(Error::PeerClosed);
        buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
        if (!bytes.empty())
            reg = takeArmedLocked();
    }
    if (!bytes.empty())
        cv_.notify_all();

#if QUASAR_DEBUG_STREAM
    log::debug("stream", "#", id_, " append ", bytes.size(), " bytes");
#endif
    return Result<std::optional<Registration>>::Ok(std::move(reg));
}

Result<Completion> Stream::readNow(std::span<std::uint8_t> buf, std::uint64_t epoch)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (epoch != epoch_)
        return Err(Error::HandleClosed);

    const std::size_t n = takeLocked(buf);
    if (n == 0 && !buf.empty() && producers_ == 0)
        return Err(Error::PeerClosed);
    return Result<Completion>::Ok(Completion{n, false});
}

Result<Completion> Stream::readBlocking(std::span<std::uint8_t> buf, std::uint64_t epoch)
{
    if (buf.empty())
        return Result<Completion>::Ok(Completion{});

    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [&] { return epoch != epoch_ || !buffer_.empty() || producers_ == 0; });

    if (epoch != epoch_)
        return Err(Error::HandleClosed);

    const std::size_t n = takeLocked(buf);
    if (n == 0)
        return Err(Error::PeerClosed);
    return Result<Completion>::Ok(Completion{n, false});
}

Result<Completion> Stream::readOrArm(std::span<std::uint8_t> buf, Registration reg)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (reg.epoch != epoch_)
        return Err(Error::HandleClosed);
    if (buf.empty())
        return Result<Completion>::Ok(Completion{});

    const std::size_t n = takeLocked(buf);
    if (n > 0)
        return Result<Completion>::Ok(Completion{n, false});
    if (producers_ == 0)
        return Err(Error::PeerClosed);
    if (armed_.has_value())
        return Err(Error::AlreadyRegistered);

    armed_ = std::move(reg);
#if QUASAR_DEBUG_STREAM
    log::debug("stream", "#", id_, " armed registration");
#endif
    return Result<Completion>::Ok(Completion{0, true});
}

std::optional<Result<Completion>> Stream::reissue(Registration &reg)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (reg.epoch != epoch_)
        return Result<Completion>(Err(Error::HandleClosed));

    std::span<std::uint8_t> buf = reg.continuation ? reg.continuation->buffer : std::span<std::uint8_t>{};
    const std::size_t n = takeLocked(buf);
    if (n > 0)
        return Result<Completion>::Ok(Completion{n, false});
    if (producers_ == 0)
        return Result<Completion>(Err(Error::PeerClosed));

    // Another reader drained the data first; wait for the next append.
    if (!armed_.has_value())
    {
        armed_ = reg;
        return std::nullopt;
    }
    return Result<Completion>(Err(Error::AlreadyRegistered));
}

void Stream::finishFiring()
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (firing_ > 0)
            --firing_;
    }
    cv_.notify_all();
}

bool Stream::cancelRegistration(ProcessId pid, Handle handle, std::uint64_t taskId)
{
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this] { return firing_ == 0; });

    if (!armed_ || armed_->pid != pid || armed_->handle != handle)
        return false;
    if (taskId != 0 && (!armed_->continuation || armed_->continuation->taskId != taskId))
        return false;

    armed_.reset();
    return true;
}

bool Stream::hasRegistration() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return armed_.has_value();
}

std::size_t Stream::takeLocked(std::span<std::uint8_t> buf)
{
    const std::size_t n = std::min(buf.size(), buffer_.size());
    std::copy_n(buffer_.begin(), n, buf.begin());
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(n));
    return n;
}

std::optional<Registration> Stream::takeArmedLocked()
{
    if (!armed_)
        return std::nullopt;
    std::optional<Registration> reg = std::move(armed_);
    armed_.reset();
    ++firing_;
    return reg;
}

} // namespace quasar::ipc
