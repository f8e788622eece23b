#include <gtest/gtest.h>

#include <string>

#include "MoveExecutor.hpp"
#include "TestUtils.hpp"

namespace fs = std::filesystem;

class MoveExecutorTest : public ::testing::Test {
protected:
    TempDir temp_;
};

TEST_F(MoveExecutorTest, MovesAndCreatesParentFolders) {
    writeFile(temp_ / "src/a.bin", "payload");
    MoveExecutor mover(false);

    std::string error;
    EXPECT_EQ(mover.moveFile(temp_ / "src/a.bin", temp_ / "dst/Set/Disc 1/a.bin", error), MoveResult::Moved);
    EXPECT_TRUE(error.empty());
    EXPECT_FALSE(fs::exists(temp_ / "src/a.bin"));
    EXPECT_EQ(readFile(temp_ / "dst/Set/Disc 1/a.bin"), "payload");
}

TEST_F(MoveExecutorTest, NeverOverwritesExistingDestination) {
    writeFile(temp_ / "src/a.bin", "new");
    writeFile(temp_ / "dst/a.bin", "old");
    MoveExecutor mover(false);

    std::string error;
    EXPECT_EQ(mover.moveFile(temp_ / "src/a.bin", temp_ / "dst/a.bin", error), MoveResult::Conflict);
    EXPECT_EQ(readFile(temp_ / "dst/a.bin"), "old");
    EXPECT_TRUE(fs::exists(temp_ / "src/a.bin"));
}

TEST_F(MoveExecutorTest, MissingSourceFails) {
    MoveExecutor mover(false);
    std::string error;
    EXPECT_EQ(mover.moveFile(temp_ / "src/none.bin", temp_ / "dst/none.bin", error), MoveResult::Failed);
    EXPECT_FALSE(error.empty());
}

TEST_F(MoveExecutorTest, DryRunTouchesNothing) {
    writeFile(temp_ / "src/a.bin", "payload");
    MoveExecutor mover(true);

    std::string error;
    EXPECT_EQ(mover.moveFile(temp_ / "src/a.bin", temp_ / "dst/sub/a.bin", error), MoveResult::Simulated);
    EXPECT_TRUE(fs::exists(temp_ / "src/a.bin"));
    EXPECT_FALSE(fs::exists(temp_ / "dst"));
}

TEST_F(MoveExecutorTest, DryRunRemembersPlannedDestinations) {
    writeFile(temp_ / "src/a.bin", "one");
    writeFile(temp_ / "src/b.bin", "two");
    MoveExecutor mover(true);

    std::string error;
    EXPECT_EQ(mover.moveFile(temp_ / "src/a.bin", temp_ / "dst/x.bin", error), MoveResult::Simulated);
    EXPECT_TRUE(mover.destinationOccupied(temp_ / "dst/./x.bin"));
    EXPECT_EQ(mover.moveFile(temp_ / "src/b.bin", temp_ / "dst/x.bin", error), MoveResult::Conflict);
}
