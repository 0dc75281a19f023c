#pragma once
#include <fmt/format.h>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "../core/profile.hpp"
#include "../util/json_escape.hpp"

namespace dsprof {

namespace detail {

inline std::string json_value_counts(const std::vector<ValueCount>& values) {
    std::string out = "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i) out += ",";
        out += fmt::format(R"({{"value":{},"count":{}}})", json_string(values[i].value), values[i].count);
    }
    return out + "]";
}

inline std::string json_numeric(const std::optional<NumericSummary>& n) {
    if (!n) return "null";
    const std::string lo = n->exact ? fmt::format("{}", n->exact->min) : json_number(n->min);
    const std::string hi = n->exact ? fmt::format("{}", n->exact->max) : json_number(n->max);
    return fmt::format(R"({{"min":{},"max":{},"mean":{},"median":{},"std_dev":{}}})",
                       lo, hi, json_number(n->mean), json_number(n->median), json_number(n->std_dev));
}

inline std::string json_string_map(const std::map<std::string, std::string>& m) {
    std::string out = "{";
    bool first = true;
    for (const auto& kv : m) {
        if (!first) out += ",";
        first = false;
        out += json_string(kv.first) + ":" + json_string(kv.second);
    }
    return out + "}";
}

inline std::string json_synonyms(const std::map<std::string, std::vector<std::string>>& m) {
    std::string out = "{";
    bool first = true;
    for (const auto& kv : m) {
        if (!first) out += ",";
        first = false;
        out += json_string(kv.first) + ":" + json_string_array(kv.second);
    }
    return out + "}";
}

inline std::string json_optional_string(const std::optional<std::string>& s) {
    return s ? json_string(*s) : std::string("null");
}

inline std::string json_column(const ColumnProfile& c) {
    std::string out = "{";
    out += fmt::format(R"("name":{},"source_name":{},"type":"{}","storage":"{}","sql_type":{},)",
                       json_string(c.name), json_string(c.source_name), to_string(c.type),
                       to_string(c.storage), json_string(c.sql_type));
    out += fmt::format(R"("nullable":{},"is_category":{},"row_count":{},"null_count":{},"non_null_count":{},"unique_count":{},)",
                       c.nullable ? "true" : "false", c.is_category ? "true" : "false",
                       c.row_count, c.null_count, c.non_null_count(), c.unique_count);
    out += fmt::format(R"("numeric":{},"outlier_count":{},"pattern":{},)",
                       json_numeric(c.numeric), c.outlier_count,
                       c.pattern ? json_string(to_string(*c.pattern)) : std::string("null"));
    out += fmt::format(R"("sample_values":{},"top_values":{},"enum_values":{},)",
                       json_string_array(c.sample_values), json_value_counts(c.top_values),
                       c.enum_values ? json_string_array(*c.enum_values) : std::string("null"));
    out += fmt::format(R"("value_mappings":{},"synonym_mappings":{},"example_queries":{},)",
                       json_string_map(c.value_mappings), json_synonyms(c.synonym_mappings),
                       json_string_array(c.example_queries));
    out += fmt::format(R"("description":{},"analysis_error":{})",
                       json_string(c.description), json_optional_string(c.analysis_error));
    return out + "}";
}

inline std::string json_correlations(const std::optional<CorrelationMatrix>& m) {
    if (!m) return "null";
    std::string rows = "[";
    for (std::size_t i = 0; i < m->values.size(); ++i) {
        if (i) rows += ",";
        rows += "[";
        for (std::size_t j = 0; j < m->values[i].size(); ++j) {
            if (j) rows += ",";
            rows += json_number(m->values[i][j]);
        }
        rows += "]";
    }
    rows += "]";
    return fmt::format(R"({{"columns":{},"values":{}}})", json_string_array(m->columns), rows);
}

} // namespace detail

// profile.json (schema v1)
inline std::string profile_to_json(const DatasetProfile& p) {
    std::string out;
    out += "{\n";
    out += R"(  "version":"1",)";
    out += "\n  " + fmt::format(R"("dataset":{{"table_name":{},"source_filename":{},"rows":{},"columns":{}}},)",
                                json_string(p.table_name), json_string(p.source_filename),
                                p.row_count, p.column_count);

    out += "\n  \"columns\":[\n";
    for (std::size_t i = 0; i < p.columns.size(); ++i) {
        out += "    " + detail::json_column(p.columns[i]);
        if (i + 1 < p.columns.size()) out += ",";
        out += "\n";
    }
    out += "  ],\n";

    std::string errors = "[";
    for (std::size_t i = 0; i < p.quality.errors.size(); ++i) {
        if (i) errors += ",";
        errors += fmt::format(R"({{"column":{},"message":{}}})",
                              json_string(p.quality.errors[i].column), json_string(p.quality.errors[i].message));
    }
    errors += "]";
    out += "  " + fmt::format(R"("quality":{{"row_count":{},"column_count":{},"estimated_bytes":{},"correlations":{},"errors":{}}},)",
                              p.quality.row_count, p.quality.column_count, p.quality.estimated_bytes,
                              detail::json_correlations(p.quality.correlations), errors);

    out += "\n  " + fmt::format(R"("schema":{{"table_name":{},"create_table_sql":{}}},)",
                                json_string(p.schema.table_name), json_string(p.schema.create_table_sql));
    out += "\n  " + fmt::format(R"("example_queries":{},)", json_string_array(p.example_queries));
    out += "\n  " + fmt::format(R"("query_hints":{},)", detail::json_string_map(p.query_hints));
    out += "\n  " + fmt::format(R"("schema_summary":{},)", json_string(p.schema_summary));

    std::string warnings = "[";
    for (std::size_t i = 0; i < p.warnings.size(); ++i) {
        const auto& w = p.warnings[i];
        if (i) warnings += ",";
        warnings += fmt::format(R"({{"column":{},"heuristic":{},"message":{}}})",
                                json_string(w.column), json_string(w.heuristic), json_string(w.message));
    }
    warnings += "]";
    out += "\n  " + fmt::format(R"("warnings":{})", warnings);
    out += "\n}\n";
    return out;
}

}
