#include <gtest/gtest.h>
#include <filesystem>
#include <random>
#include <string>

#include "core/errors.hpp"
#include "io/file_stats.hpp"
#include "pipeline/orchestrator.hpp"
#include "report/emit_profile_json.hpp"
#include "report/emit_run_json.hpp"
#include "report/file_sink.hpp"
#include "report/render_context.hpp"

using namespace dsprof;
namespace fs = std::filesystem;

namespace {

const char* kOrders =
    "Customer ID,Order Date!,Amount ($),Region,Active\n"
    "1,2024-01-15,10.5,North,yes\n"
    "2,2024-02-01,20,South,no\n"
    "3,not a date,30.25,North,yes\n"
    "4,2024-03-05,,North,no\n";

ProfilingRun orders_run() {
    Profiler profiler(ProfilerConfig{});
    return profiler.profile(kOrders, "orders.csv");
}

// Fresh directory under the system temp dir, removed on scope exit.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = fs::temp_directory_path() / ("dsprof_test_" + std::to_string(rd()));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

bool has_partial_files(const fs::path& dir) {
    for (const auto& e : fs::directory_iterator(dir)) {
        if (e.path().extension() == ".partial") return true;
    }
    return false;
}

}

TEST(ProfileJson, CarriesSectionsAndSanitizedNames) {
    const auto run = orders_run();
    const std::string json = profile_to_json(run.profile);
    EXPECT_NE(json.find(R"("version":"1")"), std::string::npos);
    EXPECT_NE(json.find(R"("table_name":"orders")"), std::string::npos);
    EXPECT_NE(json.find(R"("name":"order_date_col","source_name":"Order Date!","type":"DATE","storage":"datetime64")"),
              std::string::npos);
    EXPECT_NE(json.find(R"("correlations":{"columns":["customer_id","amount"])"), std::string::npos);
    EXPECT_NE(json.find(R"("heuristic":"temporal")"), std::string::npos);
    for (const char* key : {"\"columns\":[", "\"quality\":", "\"schema\":", "\"example_queries\":",
                            "\"query_hints\":", "\"schema_summary\":", "\"warnings\":"})
        EXPECT_NE(json.find(key), std::string::npos) << key;
}

TEST(ProfileJson, EscapesStrings) {
    DatasetProfile p;
    p.table_name = "t";
    p.source_filename = "we\"ird\n.csv";
    const std::string json = profile_to_json(p);
    EXPECT_NE(json.find(R"("source_filename":"we\"ird\n.csv")"), std::string::npos);
    EXPECT_NE(json.find(R"("correlations":null)"), std::string::npos);
}

TEST(RunJson, Fields) {
    RunReport r;
    r.source_filename = "orders.csv";
    r.input_bytes = 2048;
    r.rows = 4;
    r.columns = 5;
    r.encoding = "UTF-8";
    r.delimiter = '\t';
    r.workers = 3;
    r.wall_ms = 12.5;
    r.pattern_cache_hits = 3;
    r.pattern_cache_misses = 1;
    r.stages.push_back(RunStage{"load", 1, 2.0});
    r.stages.push_back(RunStage{"analyze", 1, 4.5});

    const std::string json = run_to_json(r, "2024-01-01T00:00:00Z", "2024-01-01T00:00:01Z", "complete");
    EXPECT_NE(json.find(R"("source":"orders.csv")"), std::string::npos);
    EXPECT_NE(json.find(R"("state":"complete")"), std::string::npos);
    EXPECT_NE(json.find(R"("delimiter":"\t")"), std::string::npos);
    EXPECT_NE(json.find(R"("cache_hit_pct":75)"), std::string::npos);
    EXPECT_NE(json.find(R"({"name":"analyze","calls":1,"total_ms":4.5})"), std::string::npos);
}

TEST(RunJson, NoPatternLookups) {
    const std::string json = run_to_json(RunReport{}, "a", "b", "failed");
    EXPECT_NE(json.find(R"("cache_hit_pct":null)"), std::string::npos);
    EXPECT_NE(json.find(R"("stages":[)"), std::string::npos);
}

TEST(ProfileJson, IntegerBoundsAreExact) {
    Profiler profiler(ProfilerConfig{});
    const auto run = profiler.profile("id\n9007199254740993\n1\n-9223372036854775808\n", "ids.csv");
    const std::string json = profile_to_json(run.profile);
    EXPECT_NE(json.find(R"("numeric":{"min":-9223372036854775808,"max":9007199254740993,)"), std::string::npos)
        << json;
}

TEST(RenderContext, DefaultTemplate) {
    const auto run = orders_run();
    const std::string text = render_context(run.profile);
    EXPECT_EQ(text.rfind("Table orders (from orders.csv): 4 rows, 5 columns.\n", 0), 0u);
    EXPECT_NE(text.find("- order_date_col TIMESTAMP: "), std::string::npos);
    EXPECT_NE(text.find("SELECT COUNT(*) FROM orders;"), std::string::npos);
    EXPECT_NE(text.find("Notes:\n- order_date_col: "), std::string::npos);
    // triple braces: no HTML escaping
    EXPECT_EQ(text.find("&#39;"), std::string::npos);
}

TEST(RenderContext, CustomTemplate) {
    const auto run = orders_run();
    EXPECT_EQ(render_context(run.profile, "{{table_name}}|{{#columns}}{{name}},{{/columns}}"),
              "orders|customer_id,order_date_col,amount,region,active,");
}

TEST(RenderContext, InvalidTemplateThrows) {
    const auto run = orders_run();
    EXPECT_THROW(render_context(run.profile, "{{#columns}}unclosed"), Error);
}

TEST(RenderContext, BundledTemplate) {
    const fs::path bundled = find_template("templates/context.mustache");
    ASSERT_FALSE(bundled.empty());
    const auto run = orders_run();
    const std::string text = render_context(run.profile, read_template(bundled));
    EXPECT_EQ(text.rfind("Table orders (loaded from orders.csv) holds 4 rows in 5 columns.\n", 0), 0u);
    EXPECT_NE(text.find("- order_date_col TIMESTAMP: "), std::string::npos);
    EXPECT_NE(text.find("Notes:"), std::string::npos);
}

TEST(CsvField, QuotesOnlyWhenNeeded) {
    EXPECT_EQ(csv_field("plain"), "plain");
    EXPECT_EQ(csv_field(""), "");
    EXPECT_EQ(csv_field("a,b"), "\"a,b\"");
    EXPECT_EQ(csv_field("say \"hi\""), "\"say \"\"hi\"\"\"");
    EXPECT_EQ(csv_field("two\nlines"), "\"two\nlines\"");
    EXPECT_EQ(csv_field("a,b", '\t'), "a,b");
    EXPECT_EQ(csv_field("a\tb", '\t'), "\"a\tb\"");
}

TEST(FileSink, CommitWritesDataset) {
    TempDir tmp;
    auto run = orders_run();
    Profiler profiler(ProfilerConfig{});
    FileSink sink(tmp.path());
    profiler.hand_off(run, sink);

    EXPECT_EQ(sink.batches_written(), 1u);
    EXPECT_FALSE(has_partial_files(tmp.path()));
    for (const char* name : {"schema.sql", "rows.csv", "profile.json", "context.txt"})
        EXPECT_TRUE(fs::exists(tmp.path() / name)) << name;

    EXPECT_EQ(read_file_bytes(tmp.path() / "schema.sql"), run.profile.schema.create_table_sql);
    EXPECT_EQ(read_file_bytes(tmp.path() / "rows.csv"),
              "customer_id,order_date_col,amount,region,active\n"
              "1,2024-01-15 00:00:00,10.5,North,true\n"
              "2,2024-02-01 00:00:00,20,South,false\n"
              "3,,30.25,North,true\n"
              "4,2024-03-05 00:00:00,,North,false\n");
    EXPECT_EQ(read_file_bytes(tmp.path() / "profile.json"), profile_to_json(run.profile));
}

TEST(FileSink, RollbackKeepsPreviousDataset) {
    TempDir tmp;
    write_file_bytes(tmp.path() / "schema.sql", "old");
    auto run = orders_run();

    FileSink sink(tmp.path());
    sink.begin_dataset(run.profile.schema);
    sink.write_rows(run.table, 0, 2);
    sink.rollback();

    EXPECT_FALSE(has_partial_files(tmp.path()));
    EXPECT_FALSE(fs::exists(tmp.path() / "rows.csv"));
    EXPECT_EQ(read_file_bytes(tmp.path() / "schema.sql"), "old");
}

TEST(FileSink, FailedCommitRestoresPreviousDataset) {
    TempDir tmp;
    auto run = orders_run();
    Profiler profiler(ProfilerConfig{});
    {
        FileSink first(tmp.path());
        profiler.hand_off(run, first);
    }
    const std::string old_schema = read_file_bytes(tmp.path() / "schema.sql");
    const std::string old_rows = read_file_bytes(tmp.path() / "rows.csv");

    SchemaDocument replacement = run.profile.schema;
    replacement.create_table_sql = "CREATE TABLE \"replacement\" ();\n";
    FileSink sink(tmp.path());
    sink.begin_dataset(replacement);
    sink.write_rows(run.table, 0, 1);
    sink.write_profiles(run.profile);
    // last staged file vanishes, so its rename fails after the others were installed
    fs::remove(tmp.path() / "context.txt.partial");
    EXPECT_THROW(sink.commit(), Error);

    EXPECT_EQ(read_file_bytes(tmp.path() / "schema.sql"), old_schema);
    EXPECT_EQ(read_file_bytes(tmp.path() / "rows.csv"), old_rows);
    EXPECT_TRUE(fs::exists(tmp.path() / "profile.json"));
    EXPECT_TRUE(fs::exists(tmp.path() / "context.txt"));
    EXPECT_FALSE(has_partial_files(tmp.path()));
    for (const auto& e : fs::directory_iterator(tmp.path()))
        EXPECT_NE(e.path().extension().string(), ".previous") << e.path().string();
}

TEST(FileSink, CommitReplacesPreviousDataset) {
    TempDir tmp;
    write_file_bytes(tmp.path() / "schema.sql", "old");
    auto run = orders_run();
    Profiler profiler(ProfilerConfig{});
    FileSink sink(tmp.path());
    profiler.hand_off(run, sink);

    EXPECT_EQ(read_file_bytes(tmp.path() / "schema.sql"), run.profile.schema.create_table_sql);
    EXPECT_FALSE(fs::exists(tmp.path() / "schema.sql.previous"));
}

TEST(FileSink, AbandonedDatasetRolledBackOnDestruction) {
    TempDir tmp;
    auto run = orders_run();
    {
        FileSink sink(tmp.path());
        sink.begin_dataset(run.profile.schema);
    }
    EXPECT_FALSE(has_partial_files(tmp.path()));
    EXPECT_FALSE(fs::exists(tmp.path() / "schema.sql"));
}

TEST(FileSink, RejectsOutOfOrderCalls) {
    TempDir tmp;
    auto run = orders_run();
    FileSink sink(tmp.path());
    EXPECT_THROW(sink.write_rows(run.table, 0, 1), Error);
    EXPECT_THROW(sink.commit(), Error);
}
