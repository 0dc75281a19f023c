#pragma once
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "../config/profiler_config.hpp"
#include "../core/errors.hpp"
#include "../core/profile.hpp"
#include "../core/table.hpp"
#include "../util/log.hpp"
#include "correlation.hpp"
#include "numeric_stats.hpp"
#include "pattern_detector.hpp"

namespace dsprof {

// Shared by every column task of one run; the detector's cache is the only mutable part.
struct AnalysisContext {
    const ProfilerConfig& config;
    PatternDetector& patterns;
};

namespace detail {

inline bool may_be_categorical(semantic_type t) {
    return t == semantic_type::text_ || t == semantic_type::integer_ || t == semantic_type::float_;
}

inline void fill_statistics(const Column& col, const ProfilerConfig& cfg, ColumnQuality& q) {
    value_counter counts;
    numeric_stats ns;
    const bool numeric = is_numeric(col.type);

    for (std::size_t i = 0; i < col.size(); ++i) {
        if (col.is_null(i)) continue;
        std::string s = render_value(col, i);
        if (q.sample_values.size() < cfg.sample_value_count) q.sample_values.push_back(s);
        counts.add(s);
        if (numeric) {
            if (const auto x = numeric_at(col, i)) ns.add(*x);
        }
    }

    q.unique_count = counts.distinct();
    if (q.row_count > 0) {
        q.missing_pct = 100.0 * static_cast<double>(q.null_count) / static_cast<double>(q.row_count);
        q.unique_pct = 100.0 * static_cast<double>(q.unique_count) / static_cast<double>(q.row_count);
    }
    q.top_values = counts.top(cfg.top_value_count);
    if (may_be_categorical(col.type) && cfg.is_categorical(q.unique_count, q.row_count))
        q.enum_values = counts.values();

    if (numeric && ns.non_null_count > 0) {
        if (!std::isfinite(ns.mean) || !std::isfinite(ns.m2))
            throw AnalysisError("numeric summary overflowed for column '" + col.name + "'");
        q.numeric = ns.summary();
        if (col.type == semantic_type::integer_) q.numeric->exact = integer_bounds(col);
        q.outlier_count = ns.count_outliers(cfg.outliers, cfg.outlier_z_threshold);
    }
}

inline std::vector<std::string> pattern_sample(const Column& col, std::size_t limit) {
    std::vector<std::string> sample;
    for (std::size_t i = 0; i < col.size() && sample.size() < limit; ++i) {
        if (!col.is_null(i)) sample.emplace_back(text_at(col, i));
    }
    return sample;
}

} // namespace detail

// Stats for one column. A failure part-way leaves what was computed and sets `error`.
inline ColumnQuality analyze_column(const Column& col, AnalysisContext& ctx) {
    ColumnQuality q;
    q.row_count = col.size();
    q.null_count = col.null_count();
    try {
        detail::fill_statistics(col, ctx.config, q);
        if (col.type == semantic_type::text_ && !q.enum_values)
            q.pattern = ctx.patterns.detect(detail::pattern_sample(col, ctx.config.pattern_sample_size));
    } catch (const std::exception& e) {
        q.error = describe(e);
        log_warn("analysis of column '{}' failed: {}", col.name, *q.error);
    }
    return q;
}

// In-memory footprint of the optimized table, strings counted by payload.
inline std::uint64_t estimate_table_bytes(const ColumnarTable& t) {
    std::uint64_t total = 0;
    for (const auto& c : t.columns()) {
        total += c.missing.size();
        total += std::visit([](const auto& v) -> std::uint64_t {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, std::vector<std::string>>) {
                std::uint64_t n = 0;
                for (const auto& s : v) n += sizeof(std::string) + (s.size() > 15 ? s.size() : 0);
                return n;
            } else if constexpr (std::is_same_v<V, categorical_values>) {
                std::uint64_t n = v.codes.size() * sizeof(std::uint32_t);
                for (const auto& s : v.categories) n += sizeof(std::string) + s.size();
                return n;
            } else if constexpr (std::is_same_v<V, std::vector<bool>>) {
                return (v.size() + 7) / 8;
            } else {
                return v.size() * sizeof(typename V::value_type);
            }
        }, c.values);
    }
    return total;
}

// Correlations over INTEGER/FLOAT columns; only when there are at least two.
inline std::optional<CorrelationMatrix> dataset_correlations(const ColumnarTable& t,
                                                             const std::vector<std::string>& names)
{
    std::vector<std::size_t> numeric;
    std::vector<std::string> numeric_names;
    for (std::size_t i = 0; i < t.column_count(); ++i) {
        if (is_numeric(t.column(i).type)) {
            numeric.push_back(i);
            numeric_names.push_back(names[i]);
        }
    }
    if (numeric.size() < 2) return std::nullopt;
    return correlation_matrix(t, numeric, numeric_names);
}

}
