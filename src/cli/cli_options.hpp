#pragma once
#include <CLI/CLI.hpp>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "../config/profiler_config.hpp"
#include "../core/errors.hpp"
#include "../util/log.hpp"

namespace dsprof {

struct AppOptions {
    // Required/paths
    std::string input;
    std::string project_id;
    std::string output_root = "artifacts";
    std::string context_template; // empty = templates/context.mustache if present, else built-in
    std::string log_level;        // empty = DSPROF_LOG_LEVEL / warn

    // CSV parsing, kept as text until validated
    std::string delimiter;        // empty = by extension / sniffed
    std::string quote = "\"";
    double partition_threshold_mb = 500.0;

    ProfilerConfig profiler;
};

// Registers every option on `app`, bound to `opt`. Values from --config (TOML/INI) use the same names.
inline void configure_cli(CLI::App& app, AppOptions& opt) {
    ProfilerConfig& cfg = opt.profiler;
    app.set_version_flag("--version", "0.2.0");
    app.set_config("--config", "", "Read options from a TOML/INI file");

    // Required/basic
    app.add_option("input,--input", opt.input, "Path to the input file (.csv, .tsv, .txt, .xlsx, .xls)")->required();
    app.add_option("--project-id",  opt.project_id, "Project/run identifier");
    app.add_option("--output-root", opt.output_root, "Artifacts output root");
    app.add_option("--template",    opt.context_template, "Mustache template for context.txt");
    app.add_option("--log-level",   opt.log_level, "debug, info, warn, error or off")
        ->check(CLI::IsMember({"debug", "info", "warn", "error", "off"}, CLI::ignore_case));

    // Loading
    app.add_option("--encoding", cfg.encodings, "Encoding candidates, in order")->delimiter(',');
    app.add_option("-d,--delimiter", opt.delimiter, "Field delimiter (single character; default by extension)");
    app.add_option("-q,--quote", opt.quote, "Quote character (single character, default '\"')");
    app.add_option("--null-token", cfg.null_tokens, "Cell values read as null")->delimiter(',');
    app.add_option("--partition-threshold-mb", opt.partition_threshold_mb, "Parse files above this size in parallel partitions");
    app.add_option("--partitions", cfg.partition_count, "Partition count (0 = one per worker)");
    app.add_option("--xlsx-converter", cfg.xlsx_converter, "Command converting .xlsx to CSV");
    app.add_option("--xls-converter", cfg.xls_converter, "Command converting .xls to CSV");

    // Type inference
    const std::map<std::string, categorical_policy> policies{
        {"ratio", categorical_policy::ratio}, {"ratio_or_absolute", categorical_policy::ratio_or_absolute}};
    const std::map<std::string, outlier_method> methods{
        {"robust", outlier_method::robust}, {"standard", outlier_method::standard}};
    app.add_option("--temporal-ratio", cfg.temporal_min_ratio, "Minimum parsed share for a date column");
    app.add_option("--categorical-policy", cfg.category_policy, "ratio or ratio_or_absolute")
        ->transform(CLI::CheckedTransformer(policies, CLI::ignore_case));
    app.add_option("--categorical-ratio", cfg.categorical_ratio, "unique/rows below this is categorical");
    app.add_option("--categorical-max-unique", cfg.categorical_max_unique, "Absolute unique limit (ratio_or_absolute)");

    // Quality
    app.add_option("--outliers", cfg.outliers, "robust or standard")
        ->transform(CLI::CheckedTransformer(methods, CLI::ignore_case));
    app.add_option("--outlier-z", cfg.outlier_z_threshold, "Outlier z-score threshold");
    app.add_option("--pattern-sample", cfg.pattern_sample_size, "Values sampled for pattern detection");
    app.add_option("--pattern-ratio", cfg.pattern_min_ratio, "Minimum match share for a pattern");
    app.add_option("--pattern-cache", cfg.pattern_cache_capacity, "Pattern cache capacity");
    app.add_option("--samples", cfg.sample_value_count, "Sample values per column");
    app.add_option("--top-values", cfg.top_value_count, "Top values per column");

    // Schema
    app.add_option("--max-identifier", cfg.max_identifier_length, "Maximum SQL identifier length");
    app.add_option("--table-prefix", cfg.table_prefix, "Prefix joined to the table name");

    // Orchestration
    app.add_option("--workers", cfg.workers, "Worker threads (0 = all cores)");
    app.add_option("--min-batch", cfg.min_batch_rows, "Minimum rows per persistence batch");
    app.add_option("--max-batch", cfg.max_batch_rows, "Maximum rows per persistence batch");
    app.add_option("--batch-fraction", cfg.batch_memory_fraction, "Share of available memory per batch");
}

// Post-parse checks; failures surface as CLI11 validation errors.
inline void finalize_options(AppOptions& opt) {
    auto one_char = [](const std::string& s, const char* name) {
        if (s.size() != 1)
            throw CLI::ValidationError{name, "must be a single character"};
    };
    ProfilerConfig& cfg = opt.profiler;
    if (!opt.delimiter.empty()) {
        if (opt.delimiter == "\\t") opt.delimiter = "\t";
        one_char(opt.delimiter, "delimiter");
        cfg.delimiter = opt.delimiter[0];
    }
    one_char(opt.quote, "quote");
    cfg.quote = opt.quote[0];

    if (opt.partition_threshold_mb <= 0.0)
        throw CLI::ValidationError{"partition-threshold-mb", "must be > 0"};
    cfg.partition_threshold_bytes = static_cast<std::uint64_t>(opt.partition_threshold_mb * 1024.0 * 1024.0);

    try {
        cfg.validate();
    } catch (const ConfigError& e) {
        throw CLI::ValidationError{"config", e.what()};
    }

    if (!opt.log_level.empty()) set_log_level(parse_log_level(opt.log_level));
}

inline std::filesystem::path ensure_artifacts_dir(const std::string& root, const std::string& project_id) {
    namespace fs = std::filesystem;
    fs::path dir = fs::path(root) / project_id;
    fs::create_directories(dir);
    return dir;
}

}
