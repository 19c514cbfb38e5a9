//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/StateTableTests.cpp
// Purpose: Check the textual state-table loader and its line-numbered errors.
// Key invariants: Every rejected line is reported with its 1-based number.
// Ownership/Lifetime: Tables are plain values owned by each test.
// Links: src/state/state_table.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "state/state_table.hpp"

#include <sstream>
#include <string>

using namespace quasar;
using support::Error;

namespace
{

constexpr const char *kDoor = R"(# front door
width 2
initial 0b00

bit 0 clear 1 error 1   # open only when unlocked
bit 1 clear 0 error 2   # lock only when closed
)";

enum class DoorError
{
    Unknown,
    Locked,
    Open,
};

DoorError mapDoor(std::uint32_t id)
{
    switch (id)
    {
        case 1:
            return DoorError::Locked;
        case 2:
            return DoorError::Open;
        default:
            return DoorError::Unknown;
    }
}

state::LoadError loadError(const char *text)
{
    auto r = state::loadStateTable(text);
    EXPECT_TRUE(r.is_err()) << text;
    return r.is_err() ? r.error() : state::LoadError{};
}

} // namespace

TEST(StateTableTest, LoadsDirectivesAndComments)
{
    auto loaded = state::loadStateTable(kDoor);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error();

    const state::StateTable &table = loaded.value();
    EXPECT_EQ(table.width, 2u);
    EXPECT_EQ(table.initial, 0u);
    ASSERT_EQ(table.guards.size(), 2u);
    EXPECT_EQ(table.guards[0].bit, 0u);
    EXPECT_EQ(table.guards[0].requireClear, std::vector<unsigned>{1});
    EXPECT_EQ(table.guards[0].errorId, 1u);
    EXPECT_EQ(table.guards[0].line, 5u);
    EXPECT_EQ(table.guards[1].line, 6u);
}

TEST(StateTableTest, BuildsAWorkingStateMachine)
{
    auto loaded = state::loadStateTable(kDoor);
    ASSERT_TRUE(loaded.is_ok());

    auto built = loaded.value().build<DoorError>(mapDoor);
    ASSERT_TRUE(built.is_ok());
    auto door = built.take();

    ASSERT_TRUE(door.intoState(1, true).is_ok());
    auto open = door.intoState(0, true);
    ASSERT_TRUE(open.is_err());
    EXPECT_EQ(open.error().guardError(), DoorError::Locked);
}

TEST(StateTableTest, InitialAcceptsHexAndBitLists)
{
    auto hex = state::loadStateTable("width 8\ninitial 0x81\n");
    ASSERT_TRUE(hex.is_ok());
    EXPECT_EQ(hex.value().initial, 0x81u);

    auto list = state::loadStateTable("width 8\ninitial 0 7\n");
    ASSERT_TRUE(list.is_ok());
    EXPECT_EQ(list.value().initial, 0x81u);
}

TEST(StateTableTest, ErrorsCarryTheOffendingLine)
{
    auto unknown = loadError("width 4\n\nfrobnicate 3\n");
    EXPECT_EQ(unknown.line, 3u);
    EXPECT_EQ(unknown.code, Error::InvalidArg);

    auto range = loadError("width 2\nbit 0 set 4 error 1\n");
    EXPECT_EQ(range.line, 2u);
    EXPECT_EQ(range.code, Error::BitOutOfRange);

    auto noError = loadError("width 2\nbit 1 set 0\n");
    EXPECT_EQ(noError.line, 2u);

    auto early = loadError("bit 0 error 1\nwidth 2\n");
    EXPECT_EQ(early.line, 1u);

    auto missing = loadError("# nothing\n");
    EXPECT_EQ(missing.line, 0u);

    std::ostringstream os;
    os << range;
    EXPECT_NE(os.str().find("2"), std::string::npos);
}

TEST(StateTableTest, StructuralErrorsSurfaceFromBuild)
{
    auto loaded = state::loadStateTable("width 2\nbit 0 set 1 clear 1 error 1\n");
    ASSERT_TRUE(loaded.is_ok());
    auto built = loaded.value().build<DoorError>(mapDoor);
    ASSERT_TRUE(built.is_err());
    EXPECT_EQ(built.error(), Error::GuardConflict);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
