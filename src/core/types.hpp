#pragma once
#include <cstdint>

namespace dsprof {

// Decided once per column by the type optimizer.
enum class semantic_type { integer_, float_, boolean_, date_, text_ };

// Physical representation; order matches column_values alternatives.
enum class storage_type {
    text_, categorical_, boolean_, timestamp_, float64_,
    int64_, int32_, int16_, int8_, uint32_, uint16_, uint8_
};

struct timestamp {
    std::int64_t unix_seconds = 0;
    bool operator==(const timestamp& o) const { return unix_seconds == o.unix_seconds; }
    bool operator<(const timestamp& o) const { return unix_seconds < o.unix_seconds; }
};

// Exact bounds of an integer column.
struct integer_range {
    std::int64_t min = 0;
    std::int64_t max = 0;
};

inline const char* to_string(semantic_type t) {
    switch (t) {
        case semantic_type::integer_: return "INTEGER";
        case semantic_type::float_:   return "FLOAT";
        case semantic_type::boolean_: return "BOOLEAN";
        case semantic_type::date_:    return "DATE";
        default:                      return "TEXT";
    }
}

inline const char* to_string(storage_type t) {
    switch (t) {
        case storage_type::text_:        return "text";
        case storage_type::categorical_: return "category";
        case storage_type::boolean_:     return "bool";
        case storage_type::timestamp_:   return "datetime64";
        case storage_type::float64_:     return "float64";
        case storage_type::int64_:       return "int64";
        case storage_type::int32_:       return "int32";
        case storage_type::int16_:       return "int16";
        case storage_type::int8_:        return "int8";
        case storage_type::uint32_:      return "uint32";
        case storage_type::uint16_:      return "uint16";
        default:                         return "uint8";
    }
}

inline bool is_numeric(semantic_type t) {
    return t == semantic_type::integer_ || t == semantic_type::float_;
}

}
