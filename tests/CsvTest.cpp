#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "Csv.hpp"

TEST(CsvTest, SplitsPlainFields) {
    std::vector<std::string> fields;
    ASSERT_TRUE(splitCsvLine("a.bin,100,AABBCCDD,dir", fields));
    EXPECT_EQ(fields, (std::vector<std::string>{"a.bin", "100", "AABBCCDD", "dir"}));
}

TEST(CsvTest, QuotedFieldWithCommaAndDoubledQuote) {
    std::vector<std::string> fields;
    ASSERT_TRUE(splitCsvLine("a.bin,1,00000001,dir,\"Says \"\"hi\"\", twice\"", fields));
    ASSERT_EQ(fields.size(), 5u);
    EXPECT_EQ(fields[4], "Says \"hi\", twice");
}

TEST(CsvTest, StripsLineEndingAndKeepsEmptyFields) {
    std::vector<std::string> fields;
    ASSERT_TRUE(splitCsvLine("x,,y,\r\n", fields));
    EXPECT_EQ(fields, (std::vector<std::string>{"x", "", "y", ""}));
}

TEST(CsvTest, BackslashPathFollowedByComment) {
    std::vector<std::string> fields;
    ASSERT_TRUE(splitCsvLine("f.rom,4,0000ABCD,\\Games\\Arcade\\,Dump verified", fields));
    ASSERT_EQ(fields.size(), 5u);
    EXPECT_EQ(fields[3], "\\Games\\Arcade\\");
    EXPECT_EQ(fields[4], "Dump verified");
}

TEST(CsvTest, QuoteInsideUnquotedFieldIsLiteral) {
    std::vector<std::string> fields;
    ASSERT_TRUE(splitCsvLine("12\" disc,3", fields));
    EXPECT_EQ(fields[0], "12\" disc");
}

TEST(CsvTest, UnterminatedQuoteIsReported) {
    std::vector<std::string> fields;
    EXPECT_FALSE(splitCsvLine("a,\"open field", fields));
    ASSERT_EQ(fields.size(), 2u);
    EXPECT_EQ(fields[1], "open field");
}

TEST(CsvTest, RecordJoinsLinesInsideQuotes) {
    std::istringstream in("a,\"one\r\ntwo\",b\r\nnext,row\n\"never\nclosed\n");
    std::vector<std::string> fields;
    std::size_t lineNumber = 0;
    bool terminated = false;

    ASSERT_TRUE(readCsvRecord(in, fields, lineNumber, terminated));
    EXPECT_TRUE(terminated);
    EXPECT_EQ(fields, (std::vector<std::string>{"a", "one\r\ntwo", "b"}));
    EXPECT_EQ(lineNumber, 2u);

    ASSERT_TRUE(readCsvRecord(in, fields, lineNumber, terminated));
    EXPECT_TRUE(terminated);
    EXPECT_EQ(fields, (std::vector<std::string>{"next", "row"}));
    EXPECT_EQ(lineNumber, 3u);

    ASSERT_TRUE(readCsvRecord(in, fields, lineNumber, terminated));
    EXPECT_FALSE(terminated);
    EXPECT_EQ(lineNumber, 5u);

    EXPECT_FALSE(readCsvRecord(in, fields, lineNumber, terminated));
}

TEST(CsvTest, WriteRowEscapesOnlyWhenNeeded) {
    std::ostringstream out;
    writeCsvRow(out, {"plain", "with,comma", "with \"quote\"", ""});
    EXPECT_EQ(out.str(), "plain,\"with,comma\",\"with \"\"quote\"\"\",\n");

    std::vector<std::string> fields;
    ASSERT_TRUE(splitCsvLine(out.str(), fields));
    EXPECT_EQ(fields, (std::vector<std::string>{"plain", "with,comma", "with \"quote\"", ""}));
}

TEST(CsvTest, TrimAndLower) {
    EXPECT_EQ(trimWhitespace("  a b \t"), "a b");
    EXPECT_EQ(trimWhitespace("   "), "");
    EXPECT_EQ(toLowerAscii("CRC32.CSV"), "crc32.csv");
}
