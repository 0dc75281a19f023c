#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "../core/errors.hpp"
#include "../util/nulls.hpp"

namespace dsprof {

enum class categorical_policy {
    ratio,             // unique / rows < categorical_ratio
    ratio_or_absolute  // ... or unique < categorical_max_unique
};

enum class outlier_method {
    robust,   // modified z-score around the median
    standard  // population z-score around the mean
};

inline const char* to_string(categorical_policy p) {
    return p == categorical_policy::ratio ? "ratio" : "ratio_or_absolute";
}
inline const char* to_string(outlier_method m) {
    return m == outlier_method::robust ? "robust" : "standard";
}

struct ProfilerConfig {
    // ---------- loading ----------
    std::vector<std::string> encodings = {"UTF-8", "LATIN1", "ISO-8859-1", "CP1252", "UTF-16"};
    std::uint64_t partition_threshold_bytes = 500ull * 1024 * 1024;
    std::size_t partition_count = 0; // 0 = one per worker
    char delimiter = '\0';           // 0 = by extension / sniffed
    char quote = '"';
    std::vector<std::string> null_tokens = default_null_tokens();
    std::string xlsx_converter = "xlsx2csv";
    std::string xls_converter = "xls2csv";

    // ---------- type inference ----------
    double temporal_min_ratio = 0.5;
    categorical_policy category_policy = categorical_policy::ratio;
    double categorical_ratio = 0.05;
    std::size_t categorical_max_unique = 50;

    // ---------- quality ----------
    outlier_method outliers = outlier_method::robust;
    double outlier_z_threshold = 3.0;
    std::size_t pattern_sample_size = 1000;
    double pattern_min_ratio = 0.8;
    std::size_t pattern_cache_capacity = 1000;
    std::size_t sample_value_count = 5;
    std::size_t top_value_count = 10;

    // ---------- schema ----------
    std::size_t max_identifier_length = 63;
    std::size_t table_name_headroom = 8;  // room for a prefix added downstream
    std::size_t column_name_headroom = 4; // room for de-duplication suffixes
    std::string table_prefix;

    // ---------- orchestration ----------
    int workers = 0; // 0 = all cores
    std::size_t min_batch_rows = 1000;
    std::size_t max_batch_rows = 50000;
    double batch_memory_fraction = 0.1;

    std::size_t table_name_limit() const { return max_identifier_length - table_name_headroom; }
    std::size_t column_name_limit() const { return max_identifier_length - column_name_headroom; }

    bool is_categorical(std::size_t unique_count, std::size_t row_count) const {
        if (row_count == 0 || unique_count == 0) return false;
        const double ratio = static_cast<double>(unique_count) / static_cast<double>(row_count);
        if (ratio < categorical_ratio) return true;
        return category_policy == categorical_policy::ratio_or_absolute && unique_count < categorical_max_unique;
    }

    void validate() const {
        if (encodings.empty()) throw ConfigError("encodings must not be empty");
        if (quote == '\0') throw ConfigError("quote must be set");
        if (delimiter != '\0' && delimiter == quote) throw ConfigError("delimiter and quote must differ");
        if (delimiter == '\n' || delimiter == '\r') throw ConfigError("delimiter must not be a line break");
        auto ratio = [](double v, const char* name) {
            if (!(v > 0.0 && v < 1.0)) throw ConfigError(std::string(name) + " must be in (0, 1)");
        };
        ratio(temporal_min_ratio, "temporal_min_ratio");
        ratio(categorical_ratio, "categorical_ratio");
        ratio(pattern_min_ratio, "pattern_min_ratio");
        ratio(batch_memory_fraction, "batch_memory_fraction");
        if (!(outlier_z_threshold > 0.0)) throw ConfigError("outlier_z_threshold must be > 0");
        if (pattern_sample_size == 0) throw ConfigError("pattern_sample_size must be > 0");
        if (pattern_cache_capacity == 0) throw ConfigError("pattern_cache_capacity must be > 0");
        if (max_identifier_length < 16 ||
            table_name_headroom > max_identifier_length - 8 ||
            column_name_headroom > max_identifier_length - 8)
            throw ConfigError("identifier limits leave no room for names");
        if (workers < 0) throw ConfigError("workers must be >= 0");
        if (min_batch_rows == 0 || min_batch_rows > max_batch_rows)
            throw ConfigError("batch bounds must satisfy 0 < min_batch_rows <= max_batch_rows");
    }
};

}
