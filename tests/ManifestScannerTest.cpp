#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "ManifestParser.hpp"
#include "ManifestScanner.hpp"
#include "TestUtils.hpp"

class ManifestScannerTest : public ::testing::Test {
protected:
    TempDir temp_;
};

TEST_F(ManifestScannerTest, WritesSortedRowsWithParentFolder) {
    writeFile(temp_ / "scan/Disc 2/b.bin", "bbb");
    writeFile(temp_ / "scan/Disc 1/a.bin", "a");

    ManifestScanner scanner(2, {"Comment"});
    ASSERT_TRUE(scanner.scan(temp_ / "scan", temp_ / "out.csv"));
    EXPECT_EQ(scanner.rowsWritten(), 2u);
    EXPECT_EQ(scanner.filesSkipped(), 0u);

    std::ostringstream expected;
    expected << "FileName,Size,CRC32,Path,Comment\n"
             << "a.bin,1," << crcOf("a") << ",Disc 1,\n"
             << "b.bin,3," << crcOf("bbb") << ",Disc 2,\n";
    EXPECT_EQ(readFile(temp_ / "out.csv"), expected.str());
}

TEST_F(ManifestScannerTest, OutputInsideScannedFolderIsSkipped) {
    writeFile(temp_ / "scan/a.bin", "a");
    writeFile(temp_ / "scan/list.csv", "stale");

    ManifestScanner scanner(1);
    ASSERT_TRUE(scanner.scan(temp_ / "scan", temp_ / "scan/list.csv"));
    EXPECT_EQ(scanner.rowsWritten(), 1u);
}

TEST_F(ManifestScannerTest, OutputParsesBackAsManifest) {
    writeFile(temp_ / "scan/x/one.bin", "one");
    writeFile(temp_ / "scan/x/two, three.bin", "two");

    ManifestScanner scanner(0);
    ASSERT_TRUE(scanner.scan(temp_ / "scan", temp_ / "scan.csv"));

    const ParsedManifest manifest = ManifestParser().parse(readFile(temp_ / "scan.csv"), "scan.csv");
    EXPECT_TRUE(manifest.headerDetected);
    ASSERT_EQ(manifest.entries.size(), 2u);
    EXPECT_EQ(manifest.entries[1].fileName, "two, three.bin");
    EXPECT_EQ(manifest.entries[1].checksum, crcOf("two"));
    EXPECT_EQ(manifest.entries[1].relativePath, std::filesystem::path("x"));
}

TEST_F(ManifestScannerTest, MissingFolderFails) {
    ManifestScanner scanner(1);
    EXPECT_FALSE(scanner.scan(temp_ / "nowhere", temp_ / "out.csv"));
}
