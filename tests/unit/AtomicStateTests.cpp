//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/AtomicStateTests.cpp
// Purpose: Verify guarded single-bit transitions, builder validation and
//          lock-free behaviour under concurrent writers.
// Key invariants: A failed transition never changes the bit vector.
// Ownership/Lifetime: Each test owns its AtomicState; worker threads are
//                     joined before assertions.
// Links: src/state/atomic_state.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "state/atomic_state.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace quasar;
using support::Error;

namespace
{

enum class DoorError
{
    Locked,
    Open,
};

constexpr unsigned OPEN = 0;
constexpr unsigned LOCKED = 1;

state::AtomicState<DoorError> makeDoor()
{
    auto built = state::AtomicState<DoorError>::builder(2)
                     .guard(OPEN, {}, {LOCKED}, DoorError::Locked)
                     .guard(LOCKED, {}, {OPEN}, DoorError::Open)
                     .build();
    EXPECT_TRUE(built.is_ok());
    return built.take();
}

Error buildError(state::AtomicState<DoorError>::Builder builder)
{
    auto built = builder.build();
    return built.is_err() ? built.error() : Error::None;
}

} // namespace

TEST(AtomicStateTest, GuardsAreCheckedAgainstTheResultingState)
{
    auto door = makeDoor();

    ASSERT_TRUE(door.intoState(OPEN, true).is_ok());
    EXPECT_TRUE(door.test(OPEN));

    auto lock = door.intoState(LOCKED, true);
    ASSERT_TRUE(lock.is_err());
    ASSERT_TRUE(lock.error().isGuard());
    EXPECT_EQ(lock.error().guardError(), DoorError::Open);
    EXPECT_EQ(door.bits(), 0b01u);

    ASSERT_TRUE(door.intoState(OPEN, false).is_ok());
    ASSERT_TRUE(door.intoState(LOCKED, true).is_ok());

    auto open = door.intoState(OPEN, true);
    ASSERT_TRUE(open.is_err());
    EXPECT_EQ(open.error().guardError(), DoorError::Locked);
    EXPECT_EQ(door.bits(), 0b10u);
}

TEST(AtomicStateTest, RewritingTheCurrentValueSucceeds)
{
    auto door = makeDoor();
    EXPECT_TRUE(door.intoState(OPEN, false).is_ok());
    EXPECT_EQ(door.bits(), 0u);
}

TEST(AtomicStateTest, OutOfRangeBitIsAUsageError)
{
    auto door = makeDoor();
    auto r = door.intoState(2, true);
    ASSERT_TRUE(r.is_err());
    EXPECT_FALSE(r.error().isGuard());
    EXPECT_EQ(r.error().usageError(), Error::BitOutOfRange);
}

TEST(AtomicStateTest, DomainErrorMayItselfBeAnError)
{
    auto built = state::AtomicState<Error>::builder(2).guard(1, {0}, {}, Error::NotNegotiated).build();
    ASSERT_TRUE(built.is_ok());
    auto st = built.take();

    auto r = st.intoState(1, true);
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(r.error().isGuard());
    EXPECT_EQ(r.error().guardError(), Error::NotNegotiated);
}

TEST(AtomicStateTest, BuilderRejectsMalformedTables)
{
    using State = state::AtomicState<DoorError>;

    EXPECT_EQ(buildError(State::builder(0)), Error::InvalidArg);
    EXPECT_EQ(buildError(State::builder(65)), Error::InvalidArg);
    EXPECT_EQ(buildError(State::builder(2).initial(0b100)), Error::BitOutOfRange);
    EXPECT_EQ(buildError(State::builder(2).guard(2, {}, {}, DoorError::Open)), Error::BitOutOfRange);
    EXPECT_EQ(buildError(State::builder(2).guard(0, {5}, {}, DoorError::Open)), Error::BitOutOfRange);
    EXPECT_EQ(buildError(State::builder(2).guard(0, {}, {1}, DoorError::Open).guard(0, {}, {}, DoorError::Open)),
              Error::DuplicateBit);
    EXPECT_EQ(buildError(State::builder(3).guard(0, {1}, {1}, DoorError::Open)), Error::GuardConflict);
    EXPECT_EQ(buildError(State::builder(3).guard(0, {0}, {}, DoorError::Open)), Error::GuardConflict);
}

TEST(AtomicStateTest, FullWidthStateUsesTheTopBit)
{
    auto built = state::AtomicState<DoorError>::builder(64).initial(1ull << 63).build();
    ASSERT_TRUE(built.is_ok());
    auto st = built.take();
    EXPECT_TRUE(st.test(63));
    ASSERT_TRUE(st.intoState(63, false).is_ok());
    EXPECT_EQ(st.bits(), 0u);
}

TEST(AtomicStateTest, ConcurrentWritersOnDisjointBitsLoseNothing)
{
    constexpr unsigned kThreads = 16;
    constexpr int kRounds = 2000;

    auto built = state::AtomicState<DoorError>::builder(kThreads).build();
    ASSERT_TRUE(built.is_ok());
    auto st = built.take();

    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    for (unsigned bit = 0; bit < kThreads; ++bit)
    {
        workers.emplace_back(
            [&st, &failures, bit]
            {
                for (int i = 0; i < kRounds; ++i)
                {
                    if (st.intoState(bit, true).is_err() || st.intoState(bit, false).is_err())
                        failures.fetch_add(1);
                }
                if (st.intoState(bit, true).is_err())
                    failures.fetch_add(1);
            });
    }
    for (auto &t : workers)
        t.join();

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(st.bits(), (1ull << kThreads) - 1);
}

TEST(AtomicStateTest, ContendedTransitionLeavesTheBitUntouched)
{
    constexpr unsigned kThreads = 8;
    constexpr int kRounds = 5000;

    auto built = state::AtomicState<DoorError>::builder(kThreads).casRetryLimit(1).build();
    ASSERT_TRUE(built.is_ok());
    auto st = built.take();

    std::vector<char> expected(kThreads, 0);
    std::atomic<int> wrongErrors{0};
    std::vector<std::thread> workers;
    for (unsigned bit = 0; bit < kThreads; ++bit)
    {
        workers.emplace_back(
            [&, bit]
            {
                bool mine = false;
                for (int i = 0; i < kRounds; ++i)
                {
                    const bool want = (i % 2) == 0;
                    auto r = st.intoState(bit, want);
                    if (r.is_ok())
                        mine = want;
                    else if (r.error().isGuard() || r.error().usageError() != Error::Contended)
                        wrongErrors.fetch_add(1);
                }
                expected[bit] = mine;
            });
    }
    for (auto &t : workers)
        t.join();

    EXPECT_EQ(wrongErrors.load(), 0);
    for (unsigned bit = 0; bit < kThreads; ++bit)
        EXPECT_EQ(st.test(bit), expected[bit] != 0) << "bit " << bit;
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
