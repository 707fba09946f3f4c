#include <gtest/gtest.h>
#include "io/Transfer.hpp"
#include "types/Error.hpp"
#include "support/TempTree.hpp"

#include <cerrno>

using namespace trashy;
using trashy::test::TempTreeTest;

namespace fs = std::filesystem;

class TransferTest : public TempTreeTest {};

TEST_F(TransferTest, MoveNoReplaceMovesIntoFreeSlot) {
    writeTextFile(root / "a", "alpha");
    ASSERT_EQ(io::moveNoReplace(root / "a", root / "b"), 0);
    EXPECT_FALSE(entryExists(root / "a"));
    EXPECT_EQ(readTextFile(root / "b"), "alpha");
}

TEST_F(TransferTest, MoveNoReplaceNeverClobbers) {
    writeTextFile(root / "a", "alpha");
    writeTextFile(root / "b", "beta");
    EXPECT_EQ(io::moveNoReplace(root / "a", root / "b"), EEXIST);
    EXPECT_EQ(readTextFile(root / "a"), "alpha");
    EXPECT_EQ(readTextFile(root / "b"), "beta");
}

TEST_F(TransferTest, MoveNoReplaceReportsMissingSource) {
    EXPECT_EQ(io::moveNoReplace(root / "missing", root / "b"), ENOENT);
}

TEST_F(TransferTest, TreeStatsCountsEntriesAndBytesWithoutFollowingLinks) {
    writeTextFile(root / "t/a.txt", "12345");
    writeTextFile(root / "t/sub/b.txt", "123");
    fs::create_symlink("/etc", root / "t/link");

    const auto stats = io::treeStats(root / "t");
    EXPECT_EQ(stats.entries, 5u); // t, a.txt, sub, b.txt, link
    EXPECT_EQ(stats.bytes, 8u);
}

TEST_F(TransferTest, CrossDeviceMoveCopiesVerifiesAndRemovesSource) {
    // Same filesystem here, but the copy path must work regardless
    writeTextFile(root / "src/a.txt", "payload");
    writeTextFile(root / "src/deep/b.bin", std::string(4096, 'x'));
    fs::create_symlink("a.txt", root / "src/alias");
    fs::permissions(root / "src/a.txt", fs::perms::owner_read);
    const auto before = io::treeStats(root / "src");

    EXPECT_TRUE(io::crossDeviceMove(root / "src", root / "dst"));

    EXPECT_FALSE(entryExists(root / "src"));
    EXPECT_EQ(io::treeStats(root / "dst"), before);
    EXPECT_EQ(readTextFile(root / "dst/a.txt"), "payload");
    EXPECT_EQ(fs::read_symlink(root / "dst/alias"), "a.txt");
    EXPECT_EQ(fs::status(root / "dst/a.txt").permissions() & fs::perms::all, fs::perms::owner_read);
    EXPECT_FALSE(entryExists(io::stagingPathFor(root / "dst")));
}

TEST_F(TransferTest, CrossDeviceMoveRefusesExistingDestination) {
    writeTextFile(root / "src", "new");
    writeTextFile(root / "dst", "old");
    try {
        (void)io::crossDeviceMove(root / "src", root / "dst");
        FAIL() << "expected DestinationExists";
    } catch (const types::Error& e) {
        EXPECT_EQ(e.code(), types::ErrorCode::DestinationExists);
    }
    EXPECT_EQ(readTextFile(root / "src"), "new");
    EXPECT_EQ(readTextFile(root / "dst"), "old");
}

TEST_F(TransferTest, CrossDeviceMoveOfUnsupportedEntryLeavesNothingBehind) {
    writeTextFile(root / "src/a.txt", "payload");
    ASSERT_EQ(::mkfifo((root / "src/pipe").c_str(), 0600), 0);

    EXPECT_THROW((void)io::crossDeviceMove(root / "src", root / "dst"), types::Error);
    EXPECT_TRUE(entryExists(root / "src/a.txt"));
    EXPECT_FALSE(entryExists(root / "dst"));
    EXPECT_FALSE(entryExists(io::stagingPathFor(root / "dst")));
}
