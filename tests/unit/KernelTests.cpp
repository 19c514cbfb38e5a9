//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/KernelTests.cpp
// Purpose: Exercise streams through the simulated kernel: every SyncMode,
//          handle transfer, cloning and process teardown.
// Key invariants:
//   - Writes from one producer stay contiguous and in order.
//   - A consumer moved or closed mid-wait wakes its waiter with HandleClosed.
// Ownership/Lifetime: Each test owns its Kernel; helper threads are joined
//                     before the kernel is destroyed.
// Links: src/ipc/kernel.hpp, src/ipc/stream.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "ipc/kernel.hpp"

#include <array>
#include <chrono>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace quasar;
using namespace quasar::ipc;
using support::Error;
using support::Result;

namespace
{

std::span<const std::uint8_t> bytesOf(std::string_view s)
{
    return {reinterpret_cast<const std::uint8_t *>(s.data()), s.size()};
}

std::string readAll(Kernel &k, ProcessId pid, Handle h)
{
    std::string out;
    std::array<std::uint8_t, 16> buf{};
    for (;;)
    {
        auto r = k.read(pid, h, buf, SyncMode::attempt());
        if (r.is_err() || r.value().bytes == 0)
            return out;
        out.append(reinterpret_cast<const char *>(buf.data()), r.value().bytes);
    }
}

/// Records the single completion the kernel delivers.
class RecordingWaker : public Waker
{
  public:
    void complete(const Continuation &cont, Result<Completion> result) override
    {
        std::lock_guard<std::mutex> lock(mu);
        handle = cont.handle;
        taskId = cont.taskId;
        outcome.emplace(std::move(result));
        ++calls;
    }

    std::mutex mu;
    Handle handle = HANDLE_INVALID;
    std::uint64_t taskId = 0;
    std::optional<Result<Completion>> outcome;
    int calls = 0;
};

struct Pair
{
    Kernel kernel;
    ProcessId pid = 0;
    StreamPair ends;

    Pair()
    {
        pid = kernel.spawnProcess("app");
        auto created = kernel.createStream(pid);
        EXPECT_TRUE(created.is_ok());
        ends = created.value();
    }
};

} // namespace

TEST(KernelTest, KernelProcessExistsAndCannotBeTerminated)
{
    Kernel k;
    EXPECT_TRUE(k.alive(KERNEL_PID));
    EXPECT_EQ(k.processName(KERNEL_PID), "kernel");

    auto r = k.terminate(KERNEL_PID);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error(), Error::InvalidArg);
}

TEST(KernelTest, AttemptOnEmptyStreamReturnsZero)
{
    Pair p;
    std::array<std::uint8_t, 8> buf{};
    auto r = p.kernel.read(p.pid, p.ends.consumer, buf, SyncMode::attempt());
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().bytes, 0u);
    EXPECT_FALSE(r.value().pending);
}

TEST(KernelTest, ProducersInterleaveOnlyAtWriteBoundaries)
{
    Pair p;
    auto second = p.kernel.clone(p.pid, p.ends.producer);
    ASSERT_TRUE(second.is_ok());

    std::thread a([&] { EXPECT_TRUE(p.kernel.write(p.pid, p.ends.producer, bytesOf("AB"), SyncMode::attempt()).is_ok()); });
    std::thread b([&] { EXPECT_TRUE(p.kernel.write(p.pid, second.value(), bytesOf("12"), SyncMode::attempt()).is_ok()); });
    a.join();
    b.join();

    const std::string got = readAll(p.kernel, p.pid, p.ends.consumer);
    EXPECT_TRUE(got == "AB12" || got == "12AB") << got;
}

TEST(KernelTest, BlockingReadWaitsForData)
{
    Pair p;
    auto reader = std::async(std::launch::async,
                             [&]
                             {
                                 std::array<std::uint8_t, 8> buf{};
                                 auto r = p.kernel.read(p.pid, p.ends.consumer, buf, SyncMode::blocking());
                                 return r.is_ok() ? std::string(reinterpret_cast<const char *>(buf.data()),
                                                                r.value().bytes)
                                                  : std::string("error");
                             });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ASSERT_TRUE(p.kernel.write(p.pid, p.ends.producer, bytesOf("ping"), SyncMode::blocking()).is_ok());
    EXPECT_EQ(reader.get(), "ping");
}

TEST(KernelTest, SignalModeQueuesOneSignalWhenReady)
{
    Pair p;
    std::array<std::uint8_t, 8> buf{};

    auto first = p.kernel.read(p.pid, p.ends.consumer, buf, SyncMode::signal());
    ASSERT_TRUE(first.is_ok());
    EXPECT_TRUE(first.value().pending);
    EXPECT_TRUE(p.kernel.hasRegistration(p.pid, p.ends.consumer, Direction::Read));
    EXPECT_FALSE(p.kernel.takeSignal(p.pid).has_value());

    auto second = p.kernel.read(p.pid, p.ends.consumer, buf, SyncMode::signal());
    ASSERT_TRUE(second.is_err());
    EXPECT_EQ(second.error(), Error::AlreadyRegistered);

    ASSERT_TRUE(p.kernel.write(p.pid, p.ends.producer, bytesOf("x"), SyncMode::attempt()).is_ok());

    auto sig = p.kernel.waitSignal(p.pid, std::chrono::milliseconds(500));
    ASSERT_TRUE(sig.is_ok());
    EXPECT_EQ(sig.value().handle, p.ends.consumer);
    EXPECT_EQ(sig.value().direction, Direction::Read);
    EXPECT_FALSE(p.kernel.hasRegistration(p.pid, p.ends.consumer, Direction::Read));

    auto again = p.kernel.read(p.pid, p.ends.consumer, buf, SyncMode::attempt());
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value().bytes, 1u);
}

TEST(KernelTest, TakeSignalPopsSignalsInArrivalOrder)
{
    Pair p;
    auto other = p.kernel.createStream(p.pid);
    ASSERT_TRUE(other.is_ok());
    std::array<std::uint8_t, 8> buf{};

    ASSERT_TRUE(p.kernel.read(p.pid, p.ends.consumer, buf, SyncMode::signal()).is_ok());
    ASSERT_TRUE(p.kernel.read(p.pid, other.value().consumer, buf, SyncMode::signal()).is_ok());

    ASSERT_TRUE(p.kernel.write(p.pid, other.value().producer, bytesOf("b"), SyncMode::attempt()).is_ok());
    ASSERT_TRUE(p.kernel.write(p.pid, p.ends.producer, bytesOf("a"), SyncMode::attempt()).is_ok());

    auto first = p.kernel.takeSignal(p.pid);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->handle, other.value().consumer);
    auto second = p.kernel.takeSignal(p.pid);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->handle, p.ends.consumer);
    EXPECT_FALSE(p.kernel.takeSignal(p.pid).has_value());
    EXPECT_FALSE(p.kernel.takeSignal(p.pid + 100).has_value());
}

TEST(KernelTest, WaitSignalTimesOut)
{
    Pair p;
    auto r = p.kernel.waitSignal(p.pid, std::chrono::milliseconds(5));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error(), Error::Timeout);
}

TEST(KernelTest, WakeupModeReissuesIntoTheCallersBuffer)
{
    Pair p;
    auto waker = std::make_shared<RecordingWaker>();
    std::array<std::uint8_t, 8> buf{};

    auto armed = p.kernel.read(p.pid, p.ends.consumer, buf, SyncMode::wakeup(waker, 42));
    ASSERT_TRUE(armed.is_ok());
    EXPECT_TRUE(armed.value().pending);

    ASSERT_TRUE(p.kernel.write(p.pid, p.ends.producer, bytesOf("hey"), SyncMode::attempt()).is_ok());

    ASSERT_EQ(waker->calls, 1);
    ASSERT_TRUE(waker->outcome->is_ok());
    EXPECT_EQ(waker->outcome->value().bytes, 3u);
    EXPECT_EQ(waker->taskId, 42u);
    EXPECT_EQ(std::string(reinterpret_cast<const char *>(buf.data()), 3), "hey");
}

TEST(KernelTest, CancelledRegistrationNeverFires)
{
    Pair p;
    auto waker = std::make_shared<RecordingWaker>();
    std::array<std::uint8_t, 8> buf{};

    ASSERT_TRUE(p.kernel.read(p.pid, p.ends.consumer, buf, SyncMode::wakeup(waker, 7)).is_ok());
    EXPECT_FALSE(p.kernel.cancelRegistration(p.pid, p.ends.consumer, Direction::Read, 8));
    EXPECT_TRUE(p.kernel.cancelRegistration(p.pid, p.ends.consumer, Direction::Read, 7));
    EXPECT_FALSE(p.kernel.hasRegistration(p.pid, p.ends.consumer, Direction::Read));

    ASSERT_TRUE(p.kernel.write(p.pid, p.ends.producer, bytesOf("late"), SyncMode::attempt()).is_ok());
    EXPECT_EQ(waker->calls, 0);
    EXPECT_EQ(readAll(p.kernel, p.pid, p.ends.consumer), "late");
}

TEST(KernelTest, AdoptMovesTheConsumerAndWakesItsWaiter)
{
    Pair p;
    const ProcessId other = p.kernel.spawnProcess("other");
    auto waker = std::make_shared<RecordingWaker>();
    std::array<std::uint8_t, 8> buf{};

    ASSERT_TRUE(p.kernel.read(p.pid, p.ends.consumer, buf, SyncMode::wakeup(waker, 1)).is_ok());

    auto moved = p.kernel.adopt(p.pid, p.ends.consumer, other);
    ASSERT_TRUE(moved.is_ok());

    ASSERT_EQ(waker->calls, 1);
    ASSERT_TRUE(waker->outcome->is_err());
    EXPECT_EQ(waker->outcome->error(), Error::HandleClosed);

    auto stale = p.kernel.read(p.pid, p.ends.consumer, buf, SyncMode::attempt());
    ASSERT_TRUE(stale.is_err());
    EXPECT_EQ(stale.error(), Error::InvalidHandle);

    ASSERT_TRUE(p.kernel.write(p.pid, p.ends.producer, bytesOf("to other"), SyncMode::attempt()).is_ok());
    EXPECT_EQ(readAll(p.kernel, other, moved.value()), "to other");
}

TEST(KernelTest, BlockedReaderSeesHandleClosedWhenConsumerMoves)
{
    Pair p;
    const ProcessId other = p.kernel.spawnProcess("other");

    auto reader = std::async(std::launch::async,
                             [&]
                             {
                                 std::array<std::uint8_t, 8> buf{};
                                 return p.kernel.read(p.pid, p.ends.consumer, buf, SyncMode::blocking());
                             });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ASSERT_TRUE(p.kernel.adopt(p.pid, p.ends.consumer, other).is_ok());

    auto r = reader.get();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error(), Error::HandleClosed);
}

TEST(KernelTest, TerminatingTheLastProducerOwnerEndsTheStream)
{
    Kernel k;
    const ProcessId parent = k.spawnProcess("shell");
    auto launched = k.launch(parent, "child");
    ASSERT_TRUE(launched.is_ok());
    const Launch child = launched.value();

    auto stdinHandle = k.standardStream(child.child);
    ASSERT_TRUE(stdinHandle.is_ok());

    ASSERT_TRUE(k.write(parent, child.stdinProducer, bytesOf("bye"), SyncMode::attempt()).is_ok());
    ASSERT_TRUE(k.terminate(parent).is_ok());
    EXPECT_FALSE(k.alive(parent));

    std::array<std::uint8_t, 8> buf{};
    auto first = k.read(child.child, stdinHandle.value(), buf, SyncMode::attempt());
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(first.value().bytes, 3u);

    auto second = k.read(child.child, stdinHandle.value(), buf, SyncMode::blocking());
    ASSERT_TRUE(second.is_err());
    EXPECT_EQ(second.error(), Error::PeerClosed);
}

TEST(KernelTest, WritingToATerminatedConsumerFails)
{
    Kernel k;
    const ProcessId parent = k.spawnProcess("shell");
    auto launched = k.launch(parent, "child");
    ASSERT_TRUE(launched.is_ok());

    ASSERT_TRUE(k.terminate(launched.value().child).is_ok());
    auto r = k.write(parent, launched.value().stdinProducer, bytesOf("x"), SyncMode::attempt());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error(), Error::PeerClosed);

    auto again = k.terminate(launched.value().child);
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(again.error(), Error::NotFound);
}

TEST(KernelTest, CloneKeepsTheStreamOpenUntilEveryProducerCloses)
{
    Pair p;
    auto extra = p.kernel.clone(p.pid, p.ends.producer);
    ASSERT_TRUE(extra.is_ok());

    ASSERT_TRUE(p.kernel.close(p.pid, p.ends.producer).is_ok());
    std::array<std::uint8_t, 8> buf{};
    auto stillOpen = p.kernel.read(p.pid, p.ends.consumer, buf, SyncMode::attempt());
    ASSERT_TRUE(stillOpen.is_ok());

    ASSERT_TRUE(p.kernel.close(p.pid, extra.value()).is_ok());
    auto ended = p.kernel.read(p.pid, p.ends.consumer, buf, SyncMode::attempt());
    ASSERT_TRUE(ended.is_err());
    EXPECT_EQ(ended.error(), Error::PeerClosed);
}

TEST(KernelTest, DirectionAndRightsAreEnforced)
{
    Pair p;
    std::array<std::uint8_t, 8> buf{};

    auto readProducer = p.kernel.read(p.pid, p.ends.producer, buf, SyncMode::attempt());
    ASSERT_TRUE(readProducer.is_err());
    EXPECT_EQ(readProducer.error(), Error::WrongDirection);

    auto writeConsumer = p.kernel.write(p.pid, p.ends.consumer, bytesOf("x"), SyncMode::attempt());
    ASSERT_TRUE(writeConsumer.is_err());
    EXPECT_EQ(writeConsumer.error(), Error::WrongDirection);

    auto cloneConsumer = p.kernel.clone(p.pid, p.ends.consumer);
    ASSERT_TRUE(cloneConsumer.is_err());
    EXPECT_EQ(cloneConsumer.error(), Error::Denied);

    const ProcessId stranger = p.kernel.spawnProcess("stranger");
    auto foreign = p.kernel.read(stranger, p.ends.consumer, buf, SyncMode::attempt());
    ASSERT_TRUE(foreign.is_err());
    EXPECT_EQ(foreign.error(), Error::InvalidHandle);
}

TEST(KernelTest, HandleTableCapacityComesFromConfig)
{
    support::Config cfg;
    cfg.handleTableCapacity = 2;
    Kernel k(cfg);
    const ProcessId pid = k.spawnProcess("tiny");

    ASSERT_TRUE(k.createStream(pid).is_ok());
    EXPECT_EQ(k.handleCount(pid), 2u);
    auto full = k.createStream(pid);
    ASSERT_TRUE(full.is_err());
    EXPECT_EQ(full.error(), Error::NoResource);
    EXPECT_EQ(k.handleCount(pid), 2u);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
