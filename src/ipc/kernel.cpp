//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ipc/kernel.cpp
// Purpose: Handle resolution, endpoint transfer and registration firing.
//
// Endpoint transfer:
//   1. The source entry is resolved and checked for RIGHT_TRANSFER.
//   2. A new entry is inserted into the destination table.
//   3. The source entry is removed, invalidating the old handle.
//   4. A moved consumer bumps the stream epoch, so readers blocked through
//      the old handle wake with HandleClosed.
//
// Key invariants: fire() is only ever called with no lock held.
// Ownership/Lifetime: See kernel.hpp.
// Links: src/ipc/kernel.hpp
//
//===----------------------------------------------------------------------===//

#include "ipc/kernel.hpp"

#include "support/log.hpp"

namespace quasar::ipc
{

using support::Err;
using support::Error;
using support::Result;

std::string_view sideName(Side side)
{
    return side == Side::Producer ? "producer" : "consumer";
}

std::string_view directionName(Direction dir)
{
    return dir == Direction::Read ? "read" : "write";
}

Kernel::Kernel(support::Config config) : config_(config)
{
    std::lock_guard<std::mutex> lock(mu_);
    spawnLocked("kernel");
}

Kernel::~Kernel() = default;

Kernel::Process *Kernel::findLocked(ProcessId pid)
{
    auto it = processes_.find(pid);
    if (it == processes_.end() || !it->second->alive)
        return nullptr;
    return it->second.get();
}

const Kernel::Process *Kernel::findLocked(ProcessId pid) const
{
    auto it = processes_.find(pid);
    if (it == processes_.end() || !it->second->alive)
        return nullptr;
    return it->second.get();
}

ProcessId Kernel::spawnLocked(std::string name)
{
    const ProcessId pid = nextPid_++;
    log::debug("kernel", "spawn pid ", pid, " '", name, "'");
    processes_.emplace(pid, std::make_unique<Process>(pid, std::move(name), config_.handleTableCapacity));
    return pid;
}

ProcessId Kernel::spawnProcess(std::string name)
{
    std::lock_guard<std::mutex> lock(mu_);
    return spawnLocked(std::move(name));
}

Result<Launch> Kernel::launch(ProcessId parent, std::string program)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (!findLocked(parent))
        return Err(Error::NotFound);

    const ProcessId child = spawnLocked(std::move(program));
    auto pair = createStreamLocked(parent, child);
    if (pair.is_err())
    {
        processes_.erase(child);
        return Err(pair.error());
    }

    findLocked(child)->standardStream = pair.value().consumer;
    log::info("kernel", "launched pid ", child, " from pid ", parent);
    return Result<Launch>::Ok(Launch{child, pair.value().producer});
}

Result<Handle> Kernel::standardStream(ProcessId child) const
{
    std::lock_guard<std::mutex> lock(mu_);
    const Process *p = findLocked(child);
    if (!p || !p->standardStream)
        return Err(Error::NotFound);
    return Result<Handle>::Ok(*p->standardStream);
}

Result<void> Kernel::terminate(ProcessId pid)
{
    if (pid == KERNEL_PID)
        return Err(Error::InvalidArg);

    std::vector<Firing> firings;
    {
        std::lock_guard<std::mutex> lock(mu_);
        Process *p = findLocked(pid);
        if (!p)
            return Err(Error::NotFound);

        auto entries = p->table.drain();
        for (auto &item : entries)
            releaseEntryLocked(item.second, firings);
        p->signals.clear();
        p->standardStream.reset();
        p->alive = false;
        log::info("kernel", "terminated pid ", pid, " (", entries.size(), " handles closed)");
    }
    signalCv_.notify_all();
    fireAll(firings);
    return support::Ok();
}

bool Kernel::alive(ProcessId pid) const
{
    std::lock_guard<std::mutex> lock(mu_);
    return findLocked(pid) != nullptr;
}

std::string Kernel::processName(ProcessId pid) const
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = processes_.find(pid);
    return it == processes_.end() ? std::string() : it->second->name;
}

std::size_t Kernel::handleCount(ProcessId pid) const
{
    std::lock_guard<std::mutex> lock(mu_);
    const Process *p = findLocked(pid);
    return p ? p->table.count() : 0;
}

Result<StreamPair> Kernel::createStreamLocked(ProcessId producerOwner, ProcessId consumerOwner)
{
    Process *prodProc = findLocked(producerOwner);
    Process *consProc = findLocked(consumerOwner);
    if (!prodProc || !consProc)
        return Err(Error::NotFound);

    auto stream = std::make_shared<Stream>(nextStreamId_++);
    stream->addProducer();

    auto producer = prodProc->table.insert(stream, Side::Producer, PRODUCER_RIGHTS);
    if (producer.is_err())
        return Err(producer.error());

    auto consumer = consProc->table.insert(stream, Side::Consumer, CONSUMER_RIGHTS);
    if (consumer.is_err())
    {
        auto undo = prodProc->table.remove(producer.value());
        if (undo.is_err())
            log::error("kernel", "failed to roll back producer handle: ", undo.error());
        return Err(consumer.error());
    }

    return Result<StreamPair>::Ok(StreamPair{producer.value(), consumer.value()});
}

Result<StreamPair> Kernel::createStream(ProcessId pid)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto pair = createStreamLocked(pid, pid);
    if (pair.is_ok())
        log::debug("kernel", "pid ", pid, " created stream (producer ", pair.value().producer, ", consumer ",
                   pair.value().consumer, ")");
    return pair;
}

Result<Completion> Kernel::write(ProcessId pid, Handle h, std::span<const std::uint8_t> bytes, const SyncMode &mode)
{
    (void)mode; // streams are unbounded; every mode completes immediately

    std::shared_ptr<Stream> stream;
    {
        std::lock_guard<std::mutex> lock(mu_);
        Process *p = findLocked(pid);
        HandleEntry *e = p ? p->table.get(h) : nullptr;
        if (!e)
            return Err(Error::InvalidHandle);
        if (e->side != Side::Producer)
            return Err(Error::WrongDirection);
        if ((e->rights & RIGHT_WRITE) == 0)
            return Err(Error::Denied);
        stream = e->stream;
    }

    auto appended = stream->append(bytes);
    if (appended.is_err())
        return Err(appended.error());

    if (std::optional<Registration> reg = appended.take())
        fire(Firing{stream, std::move(*reg), false});

    return Result<Completion>::Ok(Completion{bytes.size(), false});
}

Result<Completion> Kernel::read(ProcessId pid, Handle h, std::span<std::uint8_t> buf, const SyncMode &mode)
{
    std::shared_ptr<Stream> stream;
    std::uint64_t epoch = 0;
    {
        std::lock_guard<std::mutex> lock(mu_);
        Process *p = findLocked(pid);
        HandleEntry *e = p ? p->table.get(h) : nullptr;
        if (!e)
            return Err(Error::InvalidHandle);
        if (e->side != Side::Consumer)
            return Err(Error::WrongDirection);
        if ((e->rights & RIGHT_READ) == 0)
            return Err(Error::Denied);
        stream = e->stream;
        epoch = stream->consumerEpoch();
    }

    switch (mode.kind())
    {
        case SyncMode::Kind::Attempt:
            return stream->readNow(buf, epoch);

        case SyncMode::Kind::Blocking:
            return stream->readBlocking(buf, epoch);

        case SyncMode::Kind::Signal:
        {
            Registration reg;
            reg.kind = SyncMode::Kind::Signal;
            reg.pid = pid;
            reg.handle = h;
            reg.epoch = epoch;
            return stream->readOrArm(buf, std::move(reg));
        }

        case SyncMode::Kind::Wakeup:
        {
            if (!mode.waker())
                return Err(Error::InvalidArg);
            Registration reg;
            reg.kind = SyncMode::Kind::Wakeup;
            reg.pid = pid;
            reg.handle = h;
            reg.epoch = epoch;
            reg.continuation = Continuation{Direction::Read, pid, h, buf, mode.taskId(), mode.waker()};
            return stream->readOrArm(buf, std::move(reg));
        }
    }
    return Err(Error::InvalidArg);
}

Result<Handle> Kernel::adopt(ProcessId from, Handle h, ProcessId to)
{
    std::vector<Firing> firings;
    Handle moved = HANDLE_INVALID;
    {
        std::lock_guard<std::mutex> lock(mu_);
        Process *src = findLocked(from);
        if (!src)
            return Err(Error::InvalidHandle);
        Process *dst = findLocked(to);
        if (!dst)
            return Err(Error::NotFound);

        auto entry = src->table.getWithRights(h, RIGHT_TRANSFER);
        if (entry.is_err())
            return Err(entry.error());

        std::shared_ptr<Stream> stream = entry.value()->stream;
        const Side side = entry.value()->side;
        const Rights rights = entry.value()->rights;

        auto inserted = dst->table.insert(stream, side, rights);
        if (inserted.is_err())
            return Err(inserted.error());
        moved = inserted.value();

        auto removed = src->table.remove(h);
        if (removed.is_err())
            return Err(removed.error());

        if (src->standardStream == h)
            src->standardStream.reset();

        if (side == Side::Consumer)
        {
            if (std::optional<Registration> reg = stream->rebindConsumer())
                firings.push_back(Firing{stream, std::move(*reg), true});
        }

        log::debug("kernel", "adopt ", sideName(side), " pid ", from, ":", h, " -> pid ", to, ":", moved);
    }
    fireAll(firings);
    return Result<Handle>::Ok(moved);
}

Result<Handle> Kernel::clone(ProcessId pid, Handle producer)
{
    std::lock_guard<std::mutex> lock(mu_);
    Process *p = findLocked(pid);
    if (!p)
        return Err(Error::InvalidHandle);

    auto entry = p->table.getWithRights(producer, RIGHT_DERIVE);
    if (entry.is_err())
        return Err(entry.error());
    if (entry.value()->side != Side::Producer)
        return Err(Error::WrongDirection);

    std::shared_ptr<Stream> stream = entry.value()->stream;
    const Rights rights = entry.value()->rights;
    auto derived = p->table.insert(stream, Side::Producer, rights);
    if (derived.is_ok())
        stream->addProducer();
    return derived;
}

Result<void> Kernel::close(ProcessId pid, Handle h)
{
    std::vector<Firing> firings;
    {
        std::lock_guard<std::mutex> lock(mu_);
        Process *p = findLocked(pid);
        if (!p)
            return Err(Error::InvalidHandle);

        auto removed = p->table.remove(h);
        if (removed.is_err())
            return Err(removed.error());

        HandleEntry entry = removed.take();
        if (p->standardStream == h)
            p->standardStream.reset();
        log::debug("kernel", "pid ", pid, " closed ", sideName(entry.side), " ", h);
        releaseEntryLocked(entry, firings);
    }
    fireAll(firings);
    return support::Ok();
}

bool Kernel::cancelRegistration(ProcessId pid, Handle h, Direction dir, std::uint64_t taskId)
{
    if (dir != Direction::Read)
        return false;

    std::shared_ptr<Stream> stream;
    {
        std::lock_guard<std::mutex> lock(mu_);
        Process *p = findLocked(pid);
        HandleEntry *e = p ? p->table.get(h) : nullptr;
        if (!e || e->side != Side::Consumer)
            return false;
        stream = e->stream;
    }
    return stream->cancelRegistration(pid, h, taskId);
}

bool Kernel::hasRegistration(ProcessId pid, Handle h, Direction dir) const
{
    if (dir != Direction::Read)
        return false;

    std::lock_guard<std::mutex> lock(mu_);
    const Process *p = findLocked(pid);
    if (!p)
        return false;
    const HandleEntry *e = p->table.get(h);
    return e && e->side == Side::Consumer && e->stream->hasRegistration();
}

std::optional<Signal> Kernel::takeSignal(ProcessId pid)
{
    std::lock_guard<std::mutex> lock(mu_);
    Process *p = findLocked(pid);
    if (!p || p->signals.empty())
        return std::nullopt;
    Signal sig = p->signals.front();
    p->signals.pop_front();
    return sig;
}

Result<Signal> Kernel::waitSignal(ProcessId pid, std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mu_);
    signalCv_.wait_for(lock,
                       timeout,
                       [&]
                       {
                           const Process *p = findLocked(pid);
                           return !p || !p->signals.empty();
                       });

    Process *p = findLocked(pid);
    if (!p)
        return Err(Error::NotFound);
    if (p->signals.empty())
        return Err(Error::Timeout);
    Signal sig = p->signals.front();
    p->signals.pop_front();
    return Result<Signal>::Ok(sig);
}

void Kernel::releaseEntryLocked(HandleEntry &entry, std::vector<Firing> &firings)
{
    if (!entry.stream)
        return;

    std::optional<Registration> reg;
    bool invalidated = false;
    if (entry.side == Side::Producer)
    {
        reg = entry.stream->releaseProducer();
    }
    else
    {
        reg = entry.stream->closeConsumer();
        invalidated = true;
    }

    if (reg)
        firings.push_back(Firing{entry.stream, std::move(*reg), invalidated});
}

void Kernel::fire(Firing firing)
{
    Registration &reg = firing.reg;

    if (reg.kind == SyncMode::Kind::Signal)
    {
        if (!firing.invalidated)
            postSignal(reg.pid, Signal{reg.handle, Direction::Read});
        firing.stream->finishFiring();
        return;
    }

    std::optional<Result<Completion>> outcome;
    if (firing.invalidated)
        outcome.emplace(Err(Error::HandleClosed));
    else
        outcome = firing.stream->reissue(reg);

    if (outcome && reg.continuation && reg.continuation->waker)
    {
#if QUASAR_DEBUG_STREAM
        log::debug("stream", "#", firing.stream->id(), " wakeup pid ", reg.pid, " task ", reg.continuation->taskId);
#endif
        const Continuation &cont = *reg.continuation;
        cont.waker->complete(cont, std::move(*outcome));
    }
    firing.stream->finishFiring();
}

void Kernel::fireAll(std::vector<Firing> &firings)
{
    for (Firing &f : firings)
        fire(std::move(f));
    firings.clear();
}

void Kernel::postSignal(ProcessId pid, Signal sig)
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        Process *p = findLocked(pid);
        if (!p)
            return;
        p->signals.push_back(sig);
    }
    signalCv_.notify_all();
}

} // namespace quasar::ipc
