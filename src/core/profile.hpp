#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace dsprof {

enum class special_pattern { email, phone, url, json, date, currency, geolocation };

inline const char* to_string(special_pattern p) {
    switch (p) {
        case special_pattern::email:       return "EMAIL";
        case special_pattern::phone:       return "PHONE";
        case special_pattern::url:         return "URL";
        case special_pattern::json:        return "JSON";
        case special_pattern::date:        return "DATE";
        case special_pattern::currency:    return "CURRENCY";
        default:                           return "GEOLOCATION";
    }
}

struct ValueCount {
    std::string value;
    std::size_t count = 0;
};

struct NumericSummary {
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
    double median = 0.0;
    double std_dev = 0.0; // sample (n-1); 0 for a single value
    std::optional<integer_range> exact; // INTEGER columns; min/max above 2^53 are rounded
};

// Per-column output of the quality analyzer.
struct ColumnQuality {
    std::size_t row_count = 0;
    std::size_t null_count = 0;
    std::size_t unique_count = 0;
    double missing_pct = 0.0;
    double unique_pct = 0.0;
    std::optional<NumericSummary> numeric;
    std::size_t outlier_count = 0;
    std::optional<special_pattern> pattern;
    std::vector<std::string> sample_values;
    std::vector<ValueCount> top_values;
    std::optional<std::vector<std::string>> enum_values; // set iff categorical
    std::optional<std::string> error;
};

// Pearson coefficients over numeric columns; nullopt where undefined.
struct CorrelationMatrix {
    std::vector<std::string> columns;
    std::vector<std::vector<std::optional<double>>> values;
};

struct ColumnAnalysisError {
    std::string column;
    std::string message;
};

struct QualityReport {
    std::size_t row_count = 0;
    std::size_t column_count = 0;
    std::uint64_t estimated_bytes = 0;
    std::map<std::string, ColumnQuality> columns; // keyed by sanitized name
    std::optional<CorrelationMatrix> correlations;
    std::vector<ColumnAnalysisError> errors;
};

struct TypeInferenceWarning {
    std::string column;
    std::string heuristic;
    std::string message;
};

struct SchemaColumn {
    std::string name;        // sanitized
    std::string source_name; // as loaded
    std::string sql_type;
    bool nullable = true;
};

struct SchemaDocument {
    std::string table_name;
    std::vector<SchemaColumn> columns;
    std::string create_table_sql;

    std::vector<std::string> column_names() const {
        std::vector<std::string> out;
        out.reserve(columns.size());
        for (const auto& c : columns) out.push_back(c.name);
        return out;
    }
};

struct ColumnProfile {
    std::string name;
    std::string source_name;
    semantic_type type = semantic_type::text_;
    storage_type storage = storage_type::text_;
    std::string sql_type;
    bool nullable = true;
    bool is_category = false;
    std::size_t row_count = 0;
    std::size_t unique_count = 0;
    std::size_t null_count = 0;
    std::optional<NumericSummary> numeric;
    std::size_t outlier_count = 0;
    std::vector<std::string> sample_values;
    std::vector<ValueCount> top_values;
    std::optional<std::vector<std::string>> enum_values;
    std::map<std::string, std::string> value_mappings;
    std::map<std::string, std::vector<std::string>> synonym_mappings;
    std::vector<std::string> example_queries;
    std::string description;
    std::optional<special_pattern> pattern;
    std::optional<std::string> analysis_error;

    std::size_t non_null_count() const { return row_count - null_count; }
};

struct DatasetProfile {
    std::string table_name;
    std::string source_filename;
    std::size_t row_count = 0;
    std::size_t column_count = 0;
    std::vector<ColumnProfile> columns;
    QualityReport quality;
    SchemaDocument schema;
    std::vector<std::string> example_queries;
    std::map<std::string, std::string> query_hints;
    std::string schema_summary;
    std::vector<TypeInferenceWarning> warnings;
};

}
