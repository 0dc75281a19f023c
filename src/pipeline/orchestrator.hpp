#pragma once
#include <fmt/format.h>
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../config/profiler_config.hpp"
#include "../core/errors.hpp"
#include "../core/profile.hpp"
#include "../core/table.hpp"
#include "../enrich/metadata_enricher.hpp"
#include "../load/loader.hpp"
#include "../metrics/process_stats.hpp"
#include "../metrics/timers.hpp"
#include "../quality/quality_analyzer.hpp"
#include "../schema/schema_synthesizer.hpp"
#include "../types/type_optimizer.hpp"
#include "../util/log.hpp"
#include "persistence.hpp"
#include "worker_pool.hpp"

namespace dsprof {

enum class run_state { idle, loading, optimizing, analyzing, synthesizing, enriching, complete, failed };

inline const char* to_string(run_state s) {
    switch (s) {
        case run_state::idle:         return "idle";
        case run_state::loading:      return "loading";
        case run_state::optimizing:   return "optimizing";
        case run_state::analyzing:    return "analyzing";
        case run_state::synthesizing: return "synthesizing";
        case run_state::enriching:    return "enriching";
        case run_state::complete:     return "complete";
        default:                      return "failed";
    }
}

// Shared flag; honoured at stage boundaries and by column tasks until the handoff starts streaming.
class CancellationToken {
public:
    void cancel() noexcept { flag_.store(true, std::memory_order_relaxed); }
    bool cancelled() const noexcept { return flag_.load(std::memory_order_relaxed); }
    void throw_if_cancelled(const char* stage) const {
        if (cancelled()) throw CancelledError(stage);
    }

private:
    std::atomic<bool> flag_{false};
};

// (stage, percent, message); best effort.
using progress_callback = std::function<void(std::string_view, int, std::string_view)>;

struct RunReport {
    std::string source_filename;
    std::uint64_t input_bytes = 0;
    std::size_t rows = 0;
    std::size_t columns = 0;
    std::string encoding;
    char delimiter = ',';
    bool partitioned = false;
    int workers = 1;
    std::vector<RunStage> stages;
    double wall_ms = 0.0;
    double rss_peak_mb = 0.0;
    std::size_t pattern_cache_hits = 0;
    std::size_t pattern_cache_misses = 0;
    std::size_t batch_size = 0; // set by the handoff
    std::size_t batches = 0;
};

struct ProfilingRun {
    DatasetProfile profile;
    ColumnarTable table; // optimized, row-aligned with profile.schema
    RunReport report;
};

class Profiler {
public:
    explicit Profiler(ProfilerConfig cfg, progress_callback progress = {})
        : cfg_(std::move(cfg)), progress_(std::move(progress))
    {
        cfg_.validate();
    }

    run_state state() const { return state_.load(); }

    // idle -> loading -> optimizing -> analyzing -> synthesizing -> enriching -> complete.
    // Any failure moves to `failed` and surfaces one typed error.
    ProfilingRun profile(std::string_view bytes, std::string_view filename, const CancellationToken* cancel = nullptr) {
        start_run();
        const std::string name(filename);
        try {
            return run_stages(bytes, name, cancel);
        } catch (const LoadError&) {
            fail();
            throw;
        } catch (const SchemaError&) {
            fail();
            throw;
        } catch (const ProfilingError&) {
            fail();
            throw;
        } catch (const std::exception&) {
            const run_state at = state_.load();
            fail();
            std::throw_with_nested(ProfilingError(fmt::format("{} failed while {}", name, to_string(at))));
        }
    }

    // Streams the optimized table in memory-bounded batches, then the profiles; rolls back on failure.
    // Cancellation is only honoured before the first batch.
    void hand_off(ProfilingRun& run, PersistenceSink& sink, const CancellationToken* cancel = nullptr) {
        if (cancel) cancel->throw_if_cancelled("handoff");

        const std::uint64_t per_row = per_row_byte_estimate(run.table);
        const std::uint64_t available = available_memory_bytes().value_or(1ull << 30);
        const std::size_t batch = optimal_batch_size(available, per_row, cfg_);
        run.report.batch_size = batch;
        run.report.batches = 0;
        log_info("handing off {} rows of {} in batches of {}", run.table.row_count(), run.profile.table_name, batch);
        report_progress("storing", 90, fmt::format("Storing {} rows", run.table.row_count()));

        StageTimings timings;
        try {
            ScopedStage st(timings, "persist");
            sink.begin_dataset(run.profile.schema);
            for (std::size_t first = 0; first < run.table.row_count(); first += batch) {
                sink.write_rows(run.table, first, std::min(batch, run.table.row_count() - first));
                ++run.report.batches;
            }
            sink.write_profiles(run.profile);
            sink.commit();
        } catch (const std::exception&) {
            sink.rollback();
            std::throw_with_nested(ProfilingError(fmt::format("persisting {} failed", run.profile.table_name)));
        }
        for (const auto& s : timings.stages()) run.report.stages.push_back(s);
        report_progress("finalizing", 100, "Dataset stored");
    }

private:
    void start_run() {
        run_state cur = state_.load();
        for (;;) {
            if (cur != run_state::idle && cur != run_state::complete && cur != run_state::failed)
                throw ProfilingError(fmt::format("a run is already {}", to_string(cur)));
            if (state_.compare_exchange_weak(cur, run_state::loading)) return;
        }
    }

    void advance(run_state from, run_state to) {
        run_state expected = from;
        if (!state_.compare_exchange_strong(expected, to))
            throw ProfilingError(fmt::format("illegal transition {} -> {} (state is {})",
                                             to_string(from), to_string(to), to_string(expected)));
    }

    void fail() { state_.store(run_state::failed); }

    void report_progress(std::string_view stage, int percent, const std::string& message) {
        if (!progress_) return;
        try {
            progress_(stage, percent, message);
        } catch (const std::exception& e) {
            log_warn("progress callback failed at {}: {}", stage, e.what());
        }
    }

    static void check(const CancellationToken* cancel, const char* stage) {
        if (cancel) cancel->throw_if_cancelled(stage);
    }

    ProfilingRun run_stages(std::string_view bytes, const std::string& filename, const CancellationToken* cancel) {
        WallTimer wall;
        wall.start();
        StageTimings timings;
        ProfilingRun run;
        const int workers = resolve_workers(cfg_.workers);
        run.report.source_filename = filename;
        run.report.input_bytes = bytes.size();
        run.report.workers = workers;

        // ---------- loading ----------
        report_progress("loading", 10, fmt::format("Loading {}", filename));
        check(cancel, "loading");
        {
            ScopedStage st(timings, "load");
            LoadedTable loaded = load_dataset(bytes, filename, cfg_);
            run.table = std::move(loaded.table);
            run.report.encoding = loaded.encoding;
            run.report.delimiter = loaded.delimiter;
            run.report.partitioned = loaded.partitioned;
        }
        ColumnarTable& table = run.table;
        const std::size_t ncols = table.column_count();
        run.report.rows = table.row_count();
        run.report.columns = ncols;
        log_info("loaded {}: {} rows x {} columns ({})", filename, table.row_count(), ncols, run.report.encoding);

        // ---------- optimizing ----------
        check(cancel, "loading");
        advance(run_state::loading, run_state::optimizing);
        report_progress("optimizing", 30, "Inferring column types");
        std::vector<TypeDecision> decisions(ncols);
        {
            ScopedStage st(timings, "optimize");
            const auto errors = fan_out(ncols, workers, [&](std::size_t i) {
                if (cancel && cancel->cancelled()) return;
                decisions[i] = optimize_column(table.column(i), cfg_);
            });
            check(cancel, "optimizing");
            rethrow_first(errors);
        }
        table.verify();

        // ---------- analyzing ----------
        advance(run_state::optimizing, run_state::analyzing);
        report_progress("analyzing", 50, "Computing column statistics");
        std::vector<ColumnQuality> qualities(ncols);
        std::optional<CorrelationMatrix> correlations;
        PatternDetector detector(cfg_.pattern_min_ratio, cfg_.pattern_cache_capacity);
        {
            ScopedStage st(timings, "analyze");
            AnalysisContext ctx{cfg_, detector};
            const auto errors = fan_out(ncols, workers, [&](std::size_t i) {
                if (cancel && cancel->cancelled()) return;
                qualities[i] = analyze_column(table.column(i), ctx);
            });
            check(cancel, "analyzing");
            rethrow_first(errors);

            std::vector<std::string> raw_names;
            for (const auto& c : table.columns()) raw_names.push_back(c.name);
            correlations = dataset_correlations(table, raw_names);
        }
        run.report.pattern_cache_hits = detector.cache().hits();
        run.report.pattern_cache_misses = detector.cache().misses();

        // ---------- synthesizing ----------
        check(cancel, "analyzing");
        advance(run_state::analyzing, run_state::synthesizing);
        report_progress("synthesizing", 70, "Generating table schema");
        SchemaDocument schema;
        {
            ScopedStage st(timings, "synthesize");
            schema = synthesize_schema(table, filename, cfg_);
        }

        // ---------- enriching ----------
        check(cancel, "synthesizing");
        advance(run_state::synthesizing, run_state::enriching);
        report_progress("enriching", 85, "Generating column metadata");
        {
            ScopedStage st(timings, "enrich");
            run.profile = assemble(table, filename, std::move(schema), decisions, qualities, std::move(correlations));
        }

        advance(run_state::enriching, run_state::complete);
        report_progress("complete", 100, fmt::format("Profiled {} columns", ncols));

        wall.stop();
        run.report.wall_ms = wall.ms();
        run.report.stages = timings.stages();
        run.report.rss_peak_mb = process_peak_rss_mb();
        return run;
    }

    // Single aggregation routine; runs after every column task has joined.
    DatasetProfile assemble(const ColumnarTable& table,
                            const std::string& filename,
                            SchemaDocument schema,
                            const std::vector<TypeDecision>& decisions,
                            std::vector<ColumnQuality>& qualities,
                            std::optional<CorrelationMatrix> correlations) const
    {
        DatasetProfile p;
        p.table_name = schema.table_name;
        p.source_filename = filename;
        p.row_count = table.row_count();
        p.column_count = table.column_count();

        std::unordered_map<std::string, std::string> sanitized;
        for (const auto& sc : schema.columns) sanitized.emplace(sc.source_name, sc.name);

        for (std::size_t i = 0; i < table.column_count(); ++i) {
            const Column& col = table.column(i);
            const SchemaColumn& sc = schema.columns[i];
            ColumnQuality& q = qualities[i];

            ColumnProfile cp;
            cp.name = sc.name;
            cp.source_name = sc.source_name;
            cp.type = col.type;
            cp.storage = col.storage();
            cp.sql_type = sc.sql_type;
            cp.nullable = sc.nullable;
            cp.is_category = q.enum_values.has_value();
            cp.row_count = q.row_count;
            cp.unique_count = q.unique_count;
            cp.null_count = q.null_count;
            cp.numeric = q.numeric;
            cp.outlier_count = q.outlier_count;
            cp.sample_values = q.sample_values;
            cp.top_values = q.top_values;
            cp.enum_values = q.enum_values;
            cp.pattern = q.pattern;
            cp.analysis_error = q.error;

            ColumnAnnotations a = enrich_column(cp);
            cp.synonym_mappings = std::move(a.synonyms);
            cp.value_mappings = std::move(a.value_mappings);
            cp.example_queries = std::move(a.example_queries);
            cp.description = std::move(a.description);

            if (q.error) p.quality.errors.push_back(ColumnAnalysisError{sc.name, *q.error});
            if (decisions[i].warning) {
                TypeInferenceWarning w = *decisions[i].warning;
                w.column = sc.name;
                p.warnings.push_back(std::move(w));
            }
            p.quality.columns.emplace(sc.name, std::move(q));
            p.columns.push_back(std::move(cp));
        }

        p.quality.row_count = p.row_count;
        p.quality.column_count = p.column_count;
        p.quality.estimated_bytes = estimate_table_bytes(table);
        if (correlations) {
            for (auto& n : correlations->columns) n = sanitized.at(n);
            p.quality.correlations = std::move(correlations);
        }

        DatasetAnnotations da = enrich_dataset(p.table_name, p.columns);
        p.example_queries = std::move(da.example_queries);
        p.query_hints = std::move(da.query_hints);
        p.schema_summary = std::move(da.schema_summary);
        p.schema = std::move(schema);
        return p;
    }

    ProfilerConfig cfg_;
    progress_callback progress_;
    std::atomic<run_state> state_{run_state::idle};
};

}
