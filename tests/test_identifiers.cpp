#include <gtest/gtest.h>
#include <random>
#include <string>
#include <vector>

#include "config/profiler_config.hpp"
#include "schema/identifiers.hpp"

using namespace dsprof;

namespace {

std::string column(std::string_view raw, std::size_t position = 1) {
    return sanitize_identifier(raw, identifier_kind::column, position, ProfilerConfig{}.column_name_limit());
}

bool only_identifier_chars(const std::string& s) {
    for (char c : s) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
        if (!ok) return false;
    }
    return true;
}

}

TEST(Identifiers, PunctuationAndCase) {
    EXPECT_EQ(column("Amount ($)"), "amount");
    EXPECT_EQ(column("Customer ID"), "customer_id");
    EXPECT_EQ(column("  e-mail  "), "e_mail");
}

TEST(Identifiers, OrderDateGolden) {
    EXPECT_EQ(column("Order Date!"), "order_date_col");
    EXPECT_EQ(column("order_date_col"), "order_date_col");
}

TEST(Identifiers, ReservedWordsGetSuffix) {
    EXPECT_EQ(column("order"), "order_col");
    EXPECT_EQ(column(" Order "), "order_col");
    EXPECT_EQ(column("USER"), "user_col");
    EXPECT_EQ(column("orders"), "orders");
}

TEST(Identifiers, ReservedLeadingWordGetsSuffix) {
    EXPECT_EQ(column("User Name"), "user_name_col");
    EXPECT_EQ(column("group-id"), "group_id_col");
    EXPECT_EQ(column("orderly"), "orderly");
    EXPECT_EQ(column("customer_order"), "customer_order");
    // digit after the first word is the generated prefix shape
    EXPECT_EQ(column("order 2"), "order_2");
    EXPECT_EQ(column("select_col"), "select_col");
}

TEST(Identifiers, ReservedSuffixStaysWithinLimit) {
    const std::string raw = "order_" + std::string(70, 'x');
    const std::string once = column(raw);
    EXPECT_EQ(once, "order_" + std::string(49, 'x') + "_col");
    EXPECT_EQ(once.size(), 59u);
    EXPECT_EQ(column(once), once);
}

TEST(Identifiers, LeadingDigitGetsPrefix) {
    EXPECT_EQ(column("2024 Sales"), "col_2024_sales");
    EXPECT_EQ(sanitize_identifier("1st", identifier_kind::table, 0, 55), "table_1st");
}

TEST(Identifiers, EmptyNamesUsePosition) {
    EXPECT_EQ(column("", 3), "unnamed_3");
    EXPECT_EQ(column("!!!", 1), "unnamed_1");
    EXPECT_EQ(sanitize_identifier("", identifier_kind::table, 0, 55), "dataset");
}

TEST(Identifiers, TruncatesToLimit) {
    const ProfilerConfig cfg;
    EXPECT_EQ(cfg.column_name_limit(), 59u);
    EXPECT_EQ(cfg.table_name_limit(), 55u);

    EXPECT_EQ(column(std::string(70, 'a')), std::string(59, 'a'));
    // a cut that lands on '_' is stripped again
    EXPECT_EQ(column(std::string(58, 'b') + "_tail"), std::string(58, 'b'));
}

TEST(Identifiers, MultiByteCodePointsBecomeOneUnderscore) {
    EXPECT_EQ(column("Caf\xC3\xA9 M\xC3\xBCnster"), "caf__m_nster");
    EXPECT_EQ(column("\xE6\x97\xA5\xE4\xBB\x98"), "unnamed_1");
}

TEST(Identifiers, DuplicatesGetCounters) {
    const auto names = sanitize_column_names({"id", "ID", "Id!", "name"}, ProfilerConfig{});
    ASSERT_EQ(names.size(), 4u);
    EXPECT_EQ(names[0], "id");
    EXPECT_EQ(names[1], "id_1");
    EXPECT_EQ(names[2], "id_2");
    EXPECT_EQ(names[3], "name");
}

TEST(Identifiers, DuplicateSuffixDoesNotCollideWithExistingName) {
    const auto names = deduplicate_identifiers({"a", "a_1", "a"});
    EXPECT_EQ(names, (std::vector<std::string>{"a", "a_1", "a_2"}));
}

TEST(Identifiers, BlankHeadersNumberedByPosition) {
    const auto names = sanitize_column_names({"x", "", "  "}, ProfilerConfig{});
    EXPECT_EQ(names, (std::vector<std::string>{"x", "unnamed_2", "unnamed_3"}));
}

TEST(Identifiers, TableNameFromFilename) {
    ProfilerConfig cfg;
    EXPECT_EQ(table_name_for("Sales Data 2024.CSV", cfg), "sales_data_2024");
    EXPECT_EQ(table_name_for("/tmp/exports/orders.tsv", cfg), "orders");
    EXPECT_EQ(table_name_for("order.csv", cfg), "order_col");
    EXPECT_EQ(table_name_for("2024.xlsx", cfg), "table_2024");
    EXPECT_EQ(table_name_for("notes.json", cfg), "notes_json");

    cfg.table_prefix = "stg";
    EXPECT_EQ(table_name_for("Sales Data 2024.csv", cfg), "stg_sales_data_2024");
}

TEST(Identifiers, TableNameTruncated) {
    const ProfilerConfig cfg;
    EXPECT_EQ(table_name_for(std::string(80, 't') + ".csv", cfg), std::string(55, 't'));
}

TEST(Identifiers, QuotedForSql) {
    EXPECT_EQ(quote_identifier("order_col"), "\"order_col\"");
}

TEST(Identifiers, SanitizingIsIdempotent) {
    const std::vector<std::string> pieces = {
        "a", "Z", "7", "_", " ", "-", "!", "order", "select", "\xC3\xA9", "\xE2\x82\xAC", "Name", "0",
        "__", "table", "x9", "\t"};
    std::mt19937 rng(20240601);
    std::uniform_int_distribution<std::size_t> pick(0, pieces.size() - 1);
    std::uniform_int_distribution<int> len(0, 30);

    for (int round = 0; round < 500; ++round) {
        std::string raw;
        const int n = len(rng);
        for (int i = 0; i < n; ++i) raw += pieces[pick(rng)];

        const std::string once = column(raw, 4);
        const std::string twice = column(once, 4);
        EXPECT_EQ(once, twice) << "raw: '" << raw << "'";
        ASSERT_FALSE(once.empty());
        EXPECT_NE(once.front(), '_') << "raw: '" << raw << "'";
        EXPECT_TRUE(only_identifier_chars(once)) << "raw: '" << raw << "'";
        EXPECT_LE(once.size(), 59u);
    }
}
