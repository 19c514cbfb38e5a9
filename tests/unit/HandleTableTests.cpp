//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/HandleTableTests.cpp
// Purpose: Verify slot reuse, generation checks and rights filtering of the
//          per-process handle table.
// Key invariants: A removed handle never resolves again, even after its slot
//                 is reused.
// Ownership/Lifetime: Streams are shared with the table under test.
// Links: src/ipc/handle_table.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "ipc/handle_table.hpp"
#include "ipc/stream.hpp"

#include <memory>

using namespace quasar;
using namespace quasar::ipc;
using support::Error;

TEST(HandleTableTest, HandlesEncodeIndexAndGeneration)
{
    const Handle h = make_handle(0x123456, 7);
    EXPECT_EQ(handle_index(h), 0x123456u);
    EXPECT_EQ(handle_gen(h), 7u);
}

TEST(HandleTableTest, RemovedHandleGoesStaleWhenSlotIsReused)
{
    HandleTable table(4);
    auto stream = std::make_shared<Stream>(1);

    auto first = table.insert(stream, Side::Producer, PRODUCER_RIGHTS);
    ASSERT_TRUE(first.is_ok());
    const Handle old = first.value();
    ASSERT_NE(table.get(old), nullptr);

    auto removed = table.remove(old);
    ASSERT_TRUE(removed.is_ok());
    EXPECT_EQ(removed.value().stream, stream);
    EXPECT_EQ(table.get(old), nullptr);

    auto second = table.insert(stream, Side::Consumer, CONSUMER_RIGHTS);
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(handle_index(second.value()), handle_index(old));
    EXPECT_NE(second.value(), old);
    EXPECT_EQ(table.get(old), nullptr);
    ASSERT_NE(table.get(second.value()), nullptr);
    EXPECT_EQ(table.get(second.value())->side, Side::Consumer);

    auto again = table.remove(old);
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(again.error(), Error::InvalidHandle);
}

TEST(HandleTableTest, FullTableReportsNoResource)
{
    HandleTable table(2);
    auto stream = std::make_shared<Stream>(1);
    ASSERT_TRUE(table.insert(stream, Side::Producer, PRODUCER_RIGHTS).is_ok());
    ASSERT_TRUE(table.insert(stream, Side::Producer, PRODUCER_RIGHTS).is_ok());

    auto third = table.insert(stream, Side::Producer, PRODUCER_RIGHTS);
    ASSERT_TRUE(third.is_err());
    EXPECT_EQ(third.error(), Error::NoResource);
    EXPECT_EQ(table.count(), 2u);
}

TEST(HandleTableTest, RightsAreCheckedOnLookup)
{
    HandleTable table;
    auto stream = std::make_shared<Stream>(1);
    auto h = table.insert(stream, Side::Consumer, CONSUMER_RIGHTS);
    ASSERT_TRUE(h.is_ok());

    EXPECT_TRUE(table.getWithRights(h.value(), RIGHT_READ).is_ok());

    auto derive = table.getWithRights(h.value(), RIGHT_DERIVE);
    ASSERT_TRUE(derive.is_err());
    EXPECT_EQ(derive.error(), Error::Denied);

    auto bogus = table.getWithRights(HANDLE_INVALID, RIGHT_READ);
    ASSERT_TRUE(bogus.is_err());
    EXPECT_EQ(bogus.error(), Error::InvalidHandle);
}

TEST(HandleTableTest, DrainEmptiesTheTable)
{
    HandleTable table(8);
    auto stream = std::make_shared<Stream>(1);
    for (int i = 0; i < 3; ++i)
        ASSERT_TRUE(table.insert(stream, Side::Producer, PRODUCER_RIGHTS).is_ok());

    auto drained = table.drain();
    EXPECT_EQ(drained.size(), 3u);
    EXPECT_EQ(table.count(), 0u);
    for (const auto &item : drained)
        EXPECT_EQ(table.get(item.first), nullptr);
}

TEST(HandleTableTest, CapacityIsClamped)
{
    HandleTable table(0);
    EXPECT_EQ(table.capacity(), 1u);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
