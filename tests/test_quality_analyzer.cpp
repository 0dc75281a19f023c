#include <gtest/gtest.h>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "quality/quality_analyzer.hpp"
#include "test_helpers.hpp"
#include "types/type_optimizer.hpp"

using namespace dsprof;
using dsprof::testing::cells;
using dsprof::testing::text_column;

namespace {

class QualityAnalyzerTest : public ::testing::Test {
protected:
    ColumnQuality analyze(Column c) {
        optimize_column(c, cfg_);
        AnalysisContext ctx{cfg_, detector_};
        return analyze_column(c, ctx);
    }

    ProfilerConfig cfg_;
    PatternDetector detector_{0.8, 16};
};

void expect_invariants(const ColumnQuality& q, semantic_type type) {
    EXPECT_LE(q.null_count, q.row_count);
    EXPECT_LE(q.unique_count, q.row_count);
    EXPECT_LE(q.sample_values.size(), 5u);
    EXPECT_LE(q.top_values.size(), 10u);
    if (!q.error) EXPECT_EQ(q.numeric.has_value(), is_numeric(type));
}

}

TEST_F(QualityAnalyzerTest, AgeAndNameScenario) {
    const auto age = analyze(text_column("age", cells({"25", "30", nullptr})));
    EXPECT_EQ(age.row_count, 3u);
    EXPECT_EQ(age.null_count, 1u);
    EXPECT_EQ(age.unique_count, 2u);
    ASSERT_TRUE(age.numeric);
    EXPECT_DOUBLE_EQ(age.numeric->min, 25.0);
    EXPECT_DOUBLE_EQ(age.numeric->max, 30.0);
    EXPECT_DOUBLE_EQ(age.numeric->mean, 27.5);
    EXPECT_DOUBLE_EQ(age.numeric->median, 27.5);
    EXPECT_FALSE(age.enum_values);
    expect_invariants(age, semantic_type::integer_);

    const auto name = analyze(text_column("name", cells({"Ann", "Bo", "Cy"})));
    EXPECT_EQ(name.null_count, 0u);
    EXPECT_EQ(name.unique_count, 3u);
    EXPECT_FALSE(name.numeric);
    EXPECT_EQ(name.sample_values, (std::vector<std::string>{"Ann", "Bo", "Cy"}));
    expect_invariants(name, semantic_type::text_);
}

TEST_F(QualityAnalyzerTest, RobustOutlierOnSkewedSample) {
    const auto q = analyze(text_column("v", cells({"1", "2", "3", "4", "1000"})));
    ASSERT_TRUE(q.numeric);
    EXPECT_EQ(q.outlier_count, 1u);
    EXPECT_DOUBLE_EQ(q.numeric->median, 3.0);
    EXPECT_DOUBLE_EQ(q.numeric->mean, 202.0);
}

TEST_F(QualityAnalyzerTest, StandardZScoreIsBoundedBySampleSize) {
    cfg_.outliers = outlier_method::standard;
    const auto q = analyze(text_column("v", cells({"1", "2", "3", "4", "1000"})));
    EXPECT_EQ(q.outlier_count, 0u);
}

TEST_F(QualityAnalyzerTest, NoSpreadMeansNoOutliers) {
    const auto q = analyze(text_column("v", cells({"7", "7", "7", "7"})));
    EXPECT_EQ(q.outlier_count, 0u);
    EXPECT_DOUBLE_EQ(q.numeric->std_dev, 0.0);
}

TEST_F(QualityAnalyzerTest, SingleValueHasZeroStdDev) {
    const auto q = analyze(text_column("v", cells({"4.5"})));
    ASSERT_TRUE(q.numeric);
    EXPECT_DOUBLE_EQ(q.numeric->std_dev, 0.0);
}

TEST_F(QualityAnalyzerTest, SampleStdDev) {
    const auto q = analyze(text_column("v", cells({"2", "4", "4", "4", "5", "5", "7", "9"})));
    EXPECT_NEAR(q.numeric->std_dev, std::sqrt(32.0 / 7.0), 1e-12);
    EXPECT_DOUBLE_EQ(q.numeric->median, 4.5);
}

TEST_F(QualityAnalyzerTest, TopValuesByCountThenFirstSeen) {
    const auto q = analyze(text_column("c", cells({"b", "a", "a", "c", "b", "d"})));
    ASSERT_EQ(q.top_values.size(), 4u);
    EXPECT_EQ(q.top_values[0].value, "b");
    EXPECT_EQ(q.top_values[0].count, 2u);
    EXPECT_EQ(q.top_values[1].value, "a");
    EXPECT_EQ(q.top_values[2].value, "c");
    EXPECT_EQ(q.top_values[3].value, "d");
}

TEST_F(QualityAnalyzerTest, EnumValuesFollowCategoricalPolicy) {
    std::vector<std::optional<std::string>> v;
    for (int i = 0; i < 200; ++i) v.emplace_back(i % 3 == 0 ? "M" : (i % 3 == 1 ? "F" : "U"));
    const auto q = analyze(text_column("gender", v));
    ASSERT_TRUE(q.enum_values);
    EXPECT_EQ(*q.enum_values, (std::vector<std::string>{"M", "F", "U"}));
    EXPECT_FALSE(q.pattern);
    expect_invariants(q, semantic_type::text_);

    const auto free_text = analyze(text_column("city", cells({"Oslo", "Rome", "Lima"})));
    EXPECT_FALSE(free_text.enum_values);
}

TEST_F(QualityAnalyzerTest, LowCardinalityIntegersGetEnumValues) {
    std::vector<std::optional<std::string>> v;
    for (int i = 0; i < 100; ++i) v.emplace_back(std::to_string(i % 3 + 1));
    const auto q = analyze(text_column("rating", v));
    ASSERT_TRUE(q.numeric);
    ASSERT_TRUE(q.enum_values);
    EXPECT_EQ(q.enum_values->size(), 3u);
}

TEST_F(QualityAnalyzerTest, AllNullColumn) {
    const auto q = analyze(text_column("blank", cells({nullptr, nullptr, nullptr})));
    EXPECT_EQ(q.null_count, 3u);
    EXPECT_EQ(q.unique_count, 0u);
    EXPECT_DOUBLE_EQ(q.missing_pct, 100.0);
    EXPECT_FALSE(q.enum_values);
    EXPECT_FALSE(q.numeric);
    EXPECT_FALSE(q.pattern);
}

TEST_F(QualityAnalyzerTest, OverflowDegradesOnlyThatColumn) {
    const auto q = analyze(text_column("huge", cells({"1.7e308", "-1.7e308"})));
    ASSERT_TRUE(q.error);
    EXPECT_NE(q.error->find("overflowed"), std::string::npos);
    EXPECT_FALSE(q.numeric);
    EXPECT_EQ(q.row_count, 2u);
}

TEST_F(QualityAnalyzerTest, EmailPatternOnFreeText) {
    const auto q = analyze(text_column("contact", cells({"a@x.com", "b@y.org", "c.d@z.co.uk", "e-f@w.io"})));
    ASSERT_TRUE(q.pattern);
    EXPECT_EQ(*q.pattern, special_pattern::email);
}

TEST(Correlation, PearsonOverPairwiseCompleteRows) {
    Column a = text_column("a", cells({"1", "2", "3", "4", nullptr}));
    Column b = text_column("b", cells({"2", "4", "6", "8", "100"}));
    Column c = text_column("c", cells({"4", "3", "2", "1", "0"}));
    Column k = text_column("k", cells({"5", "5", "5", "5", "5"}));
    ProfilerConfig cfg;
    for (Column* col : {&a, &b, &c, &k}) optimize_column(*col, cfg);

    EXPECT_NEAR(*pearson(a, b), 1.0, 1e-12);
    EXPECT_NEAR(*pearson(a, c), -1.0, 1e-12);
    EXPECT_FALSE(pearson(a, k)); // zero variance
}

TEST(Correlation, DatasetMatrixIsSymmetric) {
    ColumnarTable t;
    t.add_column(text_column("x", cells({"1", "2", "3", "5"})));
    t.add_column(text_column("label", cells({"p", "q", "r", "s"})));
    t.add_column(text_column("y", cells({"2", "1", "4", "3"})));
    t.add_column(text_column("z", cells({"1.5", "2.5", "2.0", "9.0"})));
    ProfilerConfig cfg;
    for (std::size_t i = 0; i < t.column_count(); ++i) optimize_column(t.column(i), cfg);

    const auto m = dataset_correlations(t, {"x", "label", "y", "z"});
    ASSERT_TRUE(m);
    EXPECT_EQ(m->columns, (std::vector<std::string>{"x", "y", "z"}));
    ASSERT_EQ(m->values.size(), 3u);
    for (std::size_t i = 0; i < 3; ++i) {
        EXPECT_NEAR(*m->values[i][i], 1.0, 1e-12);
        for (std::size_t j = 0; j < 3; ++j) EXPECT_EQ(m->values[i][j], m->values[j][i]);
    }
}

TEST(Correlation, NeedsTwoNumericColumns) {
    ColumnarTable t;
    t.add_column(text_column("x", cells({"1", "2"})));
    t.add_column(text_column("s", cells({"a", "b"})));
    ProfilerConfig cfg;
    for (std::size_t i = 0; i < t.column_count(); ++i) optimize_column(t.column(i), cfg);
    EXPECT_FALSE(dataset_correlations(t, {"x", "s"}));
}

TEST(EstimateTableBytes, CountsNarrowedStorage) {
    ColumnarTable t;
    t.add_column(text_column("n", cells({"1", "2", "3", "4"})));
    ProfilerConfig cfg;
    optimize_column(t.column(0), cfg);
    EXPECT_EQ(estimate_table_bytes(t), 4u + 4u); // mask + uint8 values
}

TEST_F(QualityAnalyzerTest, HugeTextCellDoesNotAbortAnalysis) {
    const std::string blob = "{\"k\":\"" + std::string(200000, 'x') + "\"}";
    const auto q = analyze(text_column("payload", cells({blob.c_str(), "note a", "note b"})));
    EXPECT_FALSE(q.error);
    EXPECT_FALSE(q.pattern);
    EXPECT_EQ(q.row_count, 3u);
    expect_invariants(q, semantic_type::text_);
}

TEST_F(QualityAnalyzerTest, IntegerBoundsKeptExact) {
    const auto q = analyze(text_column("id", cells({"9223372036854775807", "9223372036854775806", nullptr})));
    ASSERT_TRUE(q.numeric);
    ASSERT_TRUE(q.numeric->exact);
    EXPECT_EQ(q.numeric->exact->min, 9223372036854775806LL);
    EXPECT_EQ(q.numeric->exact->max, std::numeric_limits<std::int64_t>::max());

    const auto f = analyze(text_column("ratio", cells({"0.5", "1.5"})));
    ASSERT_TRUE(f.numeric);
    EXPECT_FALSE(f.numeric->exact);
}
