#pragma once
#include <fmt/format.h>
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../config/profiler_config.hpp"
#include "../core/errors.hpp"
#include "../core/profile.hpp"
#include "../core/table.hpp"
#include "../util/strings.hpp"
#include "identifiers.hpp"

namespace dsprof {

inline constexpr std::string_view kRowIdColumn = "_row_id";
inline constexpr std::string_view kCreatedAtColumn = "_created_at";

// Capacity ladder on the longest value in code points.
inline std::string varchar_for_length(std::size_t max_len) {
    std::size_t cap = 5000;
    if (max_len <= 5) cap = 20;
    else if (max_len <= 20) cap = 50;
    else if (max_len <= 100) cap = 200;
    else if (max_len <= 500) cap = 1000;
    return fmt::format("VARCHAR({})", cap);
}

inline std::string integer_sql_type(std::int64_t lo, std::int64_t hi) {
    if (lo >= std::numeric_limits<std::int16_t>::min() && hi <= std::numeric_limits<std::int16_t>::max())
        return "SMALLINT";
    if (lo >= std::numeric_limits<std::int32_t>::min() && hi <= std::numeric_limits<std::int32_t>::max())
        return "INTEGER";
    return "BIGINT";
}

namespace detail {

inline std::size_t max_text_length(const Column& c) {
    std::size_t longest = 0;
    for (std::size_t i = 0; i < c.size(); ++i) {
        if (!c.is_null(i)) longest = std::max(longest, utf8_length(render_value(c, i)));
    }
    return longest;
}

inline std::string sql_type_for(const Column& c) {
    switch (c.type) {
        case semantic_type::integer_: {
            const auto range = integer_bounds(c);
            if (!range) return "SMALLINT";
            return integer_sql_type(range->min, range->max);
        }
        case semantic_type::float_:   return "DOUBLE PRECISION";
        case semantic_type::boolean_: return "BOOLEAN";
        case semantic_type::date_:    return "TIMESTAMP";
        case semantic_type::text_:    return varchar_for_length(max_text_length(c));
    }
    throw SchemaError(fmt::format("column '{}' has no SQL mapping", c.name));
}

} // namespace detail

// Deterministic CREATE TABLE for an optimized table.
inline SchemaDocument synthesize_schema(const ColumnarTable& t, std::string_view filename, const ProfilerConfig& cfg) {
    if (t.column_count() == 0)
        throw SchemaError(fmt::format("{} has no columns; cannot create a table", filename));

    SchemaDocument doc;
    doc.table_name = table_name_for(filename, cfg);

    std::vector<std::string> raw;
    raw.reserve(t.column_count());
    for (const auto& c : t.columns()) raw.push_back(c.name);
    const auto names = sanitize_column_names(raw, cfg);

    for (std::size_t i = 0; i < t.column_count(); ++i) {
        const Column& c = t.column(i);
        doc.columns.push_back(SchemaColumn{names[i], c.name, detail::sql_type_for(c), c.null_count() > 0});
    }

    std::string sql = fmt::format("CREATE TABLE {} (\n", quote_identifier(doc.table_name));
    sql += fmt::format("    {} BIGSERIAL PRIMARY KEY,\n", quote_identifier(kRowIdColumn));
    for (const auto& col : doc.columns) {
        sql += fmt::format("    {} {}{},\n", quote_identifier(col.name), col.sql_type, col.nullable ? "" : " NOT NULL");
    }
    sql += fmt::format("    {} TIMESTAMP NOT NULL DEFAULT CURRENT_TIMESTAMP\n", quote_identifier(kCreatedAtColumn));
    sql += ");\n";
    doc.create_table_sql = std::move(sql);
    return doc;
}

}
