#include <gtest/gtest.h>
#include <optional>
#include <string>

#include "core/errors.hpp"
#include "load/loader.hpp"

using namespace dsprof;

namespace {

// ASCII -> UTF-16LE with BOM
std::string utf16le(std::string_view ascii) {
    std::string out = "\xFF\xFE";
    for (char c : ascii) {
        out.push_back(c);
        out.push_back('\0');
    }
    return out;
}

std::string cell(const ColumnarTable& t, std::size_t col, std::size_t row) {
    return std::string(text_at(t.column(col), row));
}

}

TEST(Loader, ReadsHeaderCellsAndNullTokens) {
    const auto loaded = load_dataset("id,name\n1,Ann\n2,NA\n3, null \n", "people.csv", ProfilerConfig{});
    const auto& t = loaded.table;
    ASSERT_EQ(t.column_count(), 2u);
    ASSERT_EQ(t.row_count(), 3u);
    EXPECT_EQ(t.column(0).name, "id");
    EXPECT_EQ(cell(t, 1, 0), "Ann");
    EXPECT_TRUE(t.column(1).is_null(1));
    EXPECT_TRUE(t.column(1).is_null(2));
    EXPECT_EQ(loaded.encoding, "UTF-8");
    EXPECT_FALSE(loaded.partitioned);
}

TEST(Loader, HeaderOnlyGivesEmptyColumns) {
    const auto t = load_table("a,b\n", "empty.csv", ProfilerConfig{});
    EXPECT_EQ(t.column_count(), 2u);
    EXPECT_EQ(t.row_count(), 0u);
}

TEST(Loader, EmptyFileIsALoadError) {
    try {
        load_table("", "nothing.csv", ProfilerConfig{});
        FAIL() << "expected LoadError";
    } catch (const LoadError& e) {
        EXPECT_NE(std::string(e.what()).find("no columns to parse"), std::string::npos);
    }
}

TEST(Loader, RejectsUnsupportedExtension) {
    EXPECT_THROW(load_table("{}", "data.json", ProfilerConfig{}), LoadError);
    EXPECT_THROW(load_table("a\n1\n", "README", ProfilerConfig{}), LoadError);
    EXPECT_TRUE(is_supported_extension("Report.XLSX"));
}

TEST(Loader, ShortRowsArePaddedLongRowsFail) {
    const auto t = load_table("a,b,c\n1\n", "short.csv", ProfilerConfig{});
    ASSERT_EQ(t.row_count(), 1u);
    EXPECT_TRUE(t.column(2).is_null(0));

    try {
        load_table("a,b\n1,2,3\n", "long.csv", ProfilerConfig{});
        FAIL() << "expected LoadError";
    } catch (const LoadError& e) {
        const std::string msg = describe(e);
        EXPECT_NE(msg.find("cannot read long.csv"), std::string::npos);
        EXPECT_NE(msg.find("line 2: expected 2 fields, saw 3"), std::string::npos);
    }
}

TEST(Loader, MalformedQuotingIsALoadError) {
    EXPECT_THROW(load_table("a,b\n\"never closed,1\n", "bad.csv", ProfilerConfig{}), LoadError);
}

TEST(Loader, BlankAndDuplicateHeaders) {
    const auto t = load_table("a,a,\n1,2,3\n", "dups.csv", ProfilerConfig{});
    EXPECT_EQ(t.column(0).name, "a");
    EXPECT_EQ(t.column(1).name, "a.1");
    EXPECT_EQ(t.column(2).name, "Unnamed: 2");
    EXPECT_EQ(t.find("a.1"), std::optional<std::size_t>(1));
    EXPECT_FALSE(t.find("b"));
}

TEST(LoaderEncoding, FallsBackToLatin1) {
    const auto loaded = load_dataset("name\nJos\xE9\n", "latin.csv", ProfilerConfig{});
    EXPECT_EQ(loaded.encoding, "LATIN1");
    EXPECT_EQ(cell(loaded.table, 0, 0), "Jos\xC3\xA9");
}

TEST(LoaderEncoding, Utf16WithBomIsTriedFirst) {
    const auto loaded = load_dataset(utf16le("a,b\n1,2\n"), "wide.csv", ProfilerConfig{});
    EXPECT_EQ(loaded.encoding, "UTF-16");
    ASSERT_EQ(loaded.table.column_count(), 2u);
    EXPECT_EQ(loaded.table.column(0).name, "a");
    EXPECT_EQ(cell(loaded.table, 1, 0), "2");
}

TEST(LoaderEncoding, Utf8BomIsStripped) {
    const auto t = load_table("\xEF\xBB\xBFid\n7\n", "bom.csv", ProfilerConfig{});
    EXPECT_EQ(t.column(0).name, "id");
}

TEST(LoaderEncoding, CandidateOrderIsConfigurable) {
    ProfilerConfig cfg;
    cfg.encodings = {"CP1252"};
    const auto loaded = load_dataset("v\n\x80 5\n", "euro.csv", cfg);
    EXPECT_EQ(loaded.encoding, "CP1252");
    EXPECT_EQ(cell(loaded.table, 0, 0), "\xE2\x82\xAC 5");
}

TEST(LoaderDialect, DelimiterByExtensionOrOverride) {
    EXPECT_EQ(load_dataset("a\tb\n1\t2\n", "t.tsv", ProfilerConfig{}).delimiter, '\t');
    EXPECT_EQ(load_dataset("a;b\n1;2\n3;4\n", "t.txt", ProfilerConfig{}).delimiter, ';');

    ProfilerConfig cfg;
    cfg.delimiter = '|';
    const auto loaded = load_dataset("a|b\n1|2\n", "t.csv", cfg);
    EXPECT_EQ(loaded.delimiter, '|');
    EXPECT_EQ(loaded.table.column_count(), 2u);
}

TEST(LoaderPartitioned, MatchesSinglePass) {
    std::string csv = "id,note,amount\n";
    for (int i = 0; i < 3000; ++i) {
        csv += std::to_string(i) + ",";
        if (i % 7 == 0) csv += "\"quoted, with \"\"escapes\"\"\nand a newline\"";
        else if (i % 11 == 0) csv += "NA";
        else csv += "plain " + std::to_string(i);
        csv += "," + std::to_string(i * 0.5) + "\n";
    }

    ProfilerConfig single;
    ProfilerConfig parallel;
    parallel.partition_threshold_bytes = 1;
    parallel.partition_count = 4;
    parallel.workers = 4;

    const auto a = load_dataset(csv, "big.csv", single);
    const auto b = load_dataset(csv, "big.csv", parallel);
    EXPECT_FALSE(a.partitioned);
    EXPECT_TRUE(b.partitioned);

    ASSERT_EQ(a.table.row_count(), 3000u);
    ASSERT_EQ(b.table.row_count(), a.table.row_count());
    ASSERT_EQ(b.table.column_count(), a.table.column_count());
    for (std::size_t c = 0; c < a.table.column_count(); ++c) {
        EXPECT_EQ(b.table.column(c).name, a.table.column(c).name);
        EXPECT_EQ(b.table.column(c).missing, a.table.column(c).missing);
        for (std::size_t r = 0; r < a.table.row_count(); ++r)
            ASSERT_EQ(cell(b.table, c, r), cell(a.table, c, r)) << "column " << c << " row " << r;
    }
}

TEST(LoaderPartitioned, ErrorsFallBackToSinglePass) {
    // invalid UTF-8 aborts the partitioned path; the single pass decodes it as LATIN1
    std::string csv = "k\n";
    for (int i = 0; i < 500; ++i) csv += "caf\xE9 " + std::to_string(i) + "\n";
    ProfilerConfig cfg;
    cfg.partition_threshold_bytes = 1;
    cfg.partition_count = 2;
    const auto loaded = load_dataset(csv, "fallback.csv", cfg);
    EXPECT_FALSE(loaded.partitioned);
    EXPECT_EQ(loaded.encoding, "LATIN1");
    EXPECT_EQ(loaded.table.row_count(), 500u);
}

TEST(LoaderSpreadsheet, ConvertsThroughExternalCommand) {
    ProfilerConfig cfg;
    cfg.xlsx_converter = "cat"; // passes the bytes through as CSV
    const auto loaded = load_dataset("x,y\n1,2\n", "sheet.xlsx", cfg);
    ASSERT_EQ(loaded.table.row_count(), 1u);
    EXPECT_EQ(cell(loaded.table, 1, 0), "2");
}

TEST(LoaderSpreadsheet, MissingOrFailingConverterIsALoadError) {
    ProfilerConfig cfg;
    cfg.xls_converter = "dsprof-no-such-converter";
    EXPECT_THROW(load_table("x", "sheet.xls", cfg), LoadError);

    cfg.xlsx_converter = "false";
    EXPECT_THROW(load_table("x", "sheet.xlsx", cfg), LoadError);
}
