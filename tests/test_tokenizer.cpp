#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "csv/csv_count.hpp"
#include "csv/dialect.hpp"
#include "csv/tokenizer.hpp"

using namespace dsprof;

namespace {

std::vector<std::vector<std::string>> parse_all(std::string_view text, CsvDialect d = {}) {
    record_parser p(text, d);
    std::vector<std::vector<std::string>> out;
    std::vector<std::string> fields;
    while (p.next(fields)) out.push_back(fields);
    return out;
}

}

TEST(RecordParser, QuotedFieldsAndEscapes) {
    const auto rows = parse_all("a,b\n\"x, y\",\"say \"\"hi\"\"\"\n");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[1][0], "x, y");
    EXPECT_EQ(rows[1][1], "say \"hi\"");
}

TEST(RecordParser, QuotedNewlineAndMixedLineEndings) {
    const auto rows = parse_all("a,b\r\n\"line1\nline2\",2\r3,4\n\n5,6");
    ASSERT_EQ(rows.size(), 4u);
    EXPECT_EQ(rows[1][0], "line1\nline2");
    EXPECT_EQ(rows[2][0], "3");
    EXPECT_EQ(rows[3][1], "6");
}

TEST(RecordParser, TracksRecordLines) {
    record_parser p("h\n\"a\nb\"\nc\n", CsvDialect{});
    std::vector<std::string> f;
    ASSERT_TRUE(p.next(f));
    EXPECT_EQ(p.record_line(), 1u);
    ASSERT_TRUE(p.next(f));
    EXPECT_EQ(p.record_line(), 2u);
    ASSERT_TRUE(p.next(f));
    EXPECT_EQ(p.record_line(), 4u);
}

TEST(RecordParser, UnterminatedQuoteThrows) {
    record_parser p("a\n\"open", CsvDialect{});
    std::vector<std::string> f;
    ASSERT_TRUE(p.next(f));
    EXPECT_THROW(p.next(f), csv_parse_error);
}

TEST(RecordParser, TrailingEmptyField) {
    const auto rows = parse_all("a,b,c\n1,,\n");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[1], (std::vector<std::string>{"1", "", ""}));
}

TEST(SplitPartitions, BoundariesNeverSplitQuotedRecords) {
    std::string body;
    for (int i = 0; i < 200; ++i) body += "\"multi\nline " + std::to_string(i) + "\"," + std::to_string(i) + "\n";

    const auto parts = split_partitions(body, '"', 4, 2);
    ASSERT_GE(parts.size(), 2u);
    EXPECT_EQ(parts.front().begin, 0u);
    EXPECT_EQ(parts.back().end, body.size());

    std::size_t records = 0;
    for (std::size_t k = 0; k < parts.size(); ++k) {
        if (k) EXPECT_EQ(parts[k].begin, parts[k - 1].end);
        record_parser p(std::string_view(body).substr(parts[k].begin, parts[k].end - parts[k].begin),
                        CsvDialect{}, parts[k].first_line);
        std::vector<std::string> f;
        while (p.next(f)) {
            ASSERT_EQ(f.size(), 2u);
            EXPECT_EQ(f[0].rfind("multi\nline ", 0), 0u);
            // two physical lines per record, body starting on line 2
            EXPECT_EQ(p.record_line(), 2 + 2 * std::stoull(f[1]));
            ++records;
        }
    }
    EXPECT_EQ(records, 200u);
}

TEST(SplitPartitions, SmallInputStaysWhole) {
    const auto parts = split_partitions("a,b\n1,2\n", '"', 8);
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].end, 8u);
}

TEST(SniffDelimiter, PicksConsistentCandidate) {
    EXPECT_EQ(sniff_delimiter("a;b;c\n1;2;3\n4;5;6\n"), ';');
    EXPECT_EQ(sniff_delimiter("a\tb\n1\t2\n"), '\t');
    EXPECT_EQ(sniff_delimiter("name|note\nx|\"a, b\"\ny|c\n"), '|');
    EXPECT_EQ(sniff_delimiter("single\ncolumn\n"), ',');
}
