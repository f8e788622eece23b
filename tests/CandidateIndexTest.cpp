#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include <unistd.h>

#include "CandidateIndex.hpp"
#include "TestUtils.hpp"

TEST(CandidateIndexTest, CompositeKeyUppercasesChecksum) {
    EXPECT_EQ(makeCompositeKey("aabbccdd", 100), "AABBCCDD:100");
}

TEST(CandidateIndexTest, KeysMapToOrderedIdLists) {
    CandidateIndex index;
    const CandidateId first = index.add("/pool/a", 50, "11112222");
    const CandidateId second = index.add("/pool/b", 50, "11112222");
    const CandidateId other = index.add("/pool/c", 51, "11112222");

    EXPECT_EQ(index.size(), 3u);
    EXPECT_EQ(index.keyCount(), 2u);
    EXPECT_EQ(index.candidatesFor("11112222:50"), (std::vector<CandidateId>{first, second}));
    EXPECT_EQ(index.candidatesFor("11112222:51"), (std::vector<CandidateId>{other}));
    EXPECT_TRUE(index.candidatesFor("FFFFFFFF:1").empty());
    EXPECT_EQ(index.file(second).path, std::filesystem::path("/pool/b"));
    EXPECT_THROW(index.file(42), std::out_of_range);
}

class CandidateIndexerTest : public ::testing::Test {
protected:
    TempDir temp_;
};

TEST_F(CandidateIndexerTest, IndexesFilesInSortedPathOrder) {
    writeFile(temp_ / "pool/zeta/copy.bin", "same");
    writeFile(temp_ / "pool/alpha/copy.bin", "same");
    writeFile(temp_ / "pool/middle.bin", "other");

    CandidateIndex index;
    CandidateIndexer indexer(3);
    ASSERT_TRUE(indexer.build(temp_ / "pool", index));

    ASSERT_EQ(index.size(), 3u);
    const auto& ids = index.candidatesFor(makeCompositeKey(crcOf("same"), 4));
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(index.file(ids[0]).path, temp_ / "pool/alpha/copy.bin");
    EXPECT_EQ(index.file(ids[1]).path, temp_ / "pool/zeta/copy.bin");
    EXPECT_TRUE(indexer.issues().empty());
}

TEST_F(CandidateIndexerTest, PrunesExcludedFolders) {
    writeFile(temp_ / "pool/keep.bin", "keep");
    writeFile(temp_ / "pool/organized/done.bin", "done");
    writeFile(temp_ / "pool/manifests/list.csv", "done.bin,4,00000000,,");

    CandidateIndex index;
    CandidateIndexer indexer(0, {temp_ / "pool/organized", temp_ / "pool/manifests"});
    ASSERT_TRUE(indexer.build(temp_ / "pool", index));

    ASSERT_EQ(index.size(), 1u);
    EXPECT_EQ(index.files()[0].path.filename(), "keep.bin");
}

TEST_F(CandidateIndexerTest, UnreadableFileIsExcludedAndReported) {
    writeFile(temp_ / "pool/locked.bin", "locked");
    writeFile(temp_ / "pool/open.bin", "open");
    std::filesystem::permissions(temp_ / "pool/locked.bin", std::filesystem::perms::none);
    if (access((temp_ / "pool/locked.bin").c_str(), R_OK) == 0) {
        GTEST_SKIP() << "permission bits are not enforced for this user";
    }

    CandidateIndex index;
    CandidateIndexer indexer(2);
    ASSERT_TRUE(indexer.build(temp_ / "pool", index));

    ASSERT_EQ(index.size(), 1u);
    EXPECT_EQ(index.files()[0].path, temp_ / "pool/open.bin");
    ASSERT_EQ(indexer.issues().size(), 1u);
    EXPECT_EQ(indexer.issues()[0].kind, IssueKind::ChecksumComputeError);
    EXPECT_EQ(indexer.issues()[0].subject, (temp_ / "pool/locked.bin").string());
}

TEST_F(CandidateIndexerTest, MissingRootFails) {
    CandidateIndex index;
    CandidateIndexer indexer(1);
    EXPECT_FALSE(indexer.build(temp_ / "nowhere", index));
    EXPECT_EQ(index.size(), 0u);
}
