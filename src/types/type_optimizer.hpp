#pragma once
#include <fmt/format.h>
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

#include "../config/profiler_config.hpp"
#include "../core/profile.hpp"
#include "../core/table.hpp"
#include "infer.hpp"
#include "parse_date.hpp"

namespace dsprof {

struct TypeDecision {
    semantic_type type = semantic_type::text_;
    storage_type storage = storage_type::text_;
    std::string heuristic; // which rule accepted the column
    std::size_t coerced_nulls = 0;
    std::optional<TypeInferenceWarning> warning;
};

namespace detail {

template <typename T>
std::vector<T> narrow_copy(const std::vector<std::int64_t>& v) {
    std::vector<T> out;
    out.reserve(v.size());
    for (auto x : v) out.push_back(static_cast<T>(x));
    return out;
}

// Smallest signed/unsigned width that holds [min, max]; storage only.
inline void narrow_integers(Column& c) {
    auto* v = std::get_if<std::vector<std::int64_t>>(&c.values);
    if (!v) return;
    std::optional<std::int64_t> lo, hi;
    for (std::size_t i = 0; i < v->size(); ++i) {
        if (c.is_null(i)) continue;
        const auto x = (*v)[i];
        if (!lo || x < *lo) lo = x;
        if (!hi || x > *hi) hi = x;
    }
    if (!lo) return;

    if (*lo >= 0) {
        if (*hi <= std::numeric_limits<std::uint8_t>::max())       c.values = narrow_copy<std::uint8_t>(*v);
        else if (*hi <= std::numeric_limits<std::uint16_t>::max()) c.values = narrow_copy<std::uint16_t>(*v);
        else if (*hi <= std::numeric_limits<std::uint32_t>::max()) c.values = narrow_copy<std::uint32_t>(*v);
    } else {
        if (*lo >= std::numeric_limits<std::int8_t>::min() && *hi <= std::numeric_limits<std::int8_t>::max())
            c.values = narrow_copy<std::int8_t>(*v);
        else if (*lo >= std::numeric_limits<std::int16_t>::min() && *hi <= std::numeric_limits<std::int16_t>::max())
            c.values = narrow_copy<std::int16_t>(*v);
        else if (*lo >= std::numeric_limits<std::int32_t>::min() && *hi <= std::numeric_limits<std::int32_t>::max())
            c.values = narrow_copy<std::int32_t>(*v);
    }
}

// ---------- heuristics (each reads the original cells) ----------
struct temporal_trial {
    std::vector<timestamp> values;
    std::vector<std::uint8_t> missing;
    std::size_t parsed = 0;
};

inline std::optional<temporal_trial> try_temporal(const std::vector<std::string>& cells,
                                                  const std::vector<std::uint8_t>& missing,
                                                  std::size_t non_null,
                                                  double min_ratio)
{
    temporal_trial t;
    t.values.resize(cells.size());
    t.missing = missing;
    std::size_t failures = 0;
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (missing[i]) continue;
        if (auto ts = try_parse_timestamp(cells[i])) {
            t.values[i] = *ts;
            ++t.parsed;
        } else {
            t.missing[i] = 1;
            // the failures alone already rule out a majority
            if (static_cast<double>(++failures) >= static_cast<double>(non_null) * (1.0 - min_ratio))
                return std::nullopt;
        }
    }
    if (t.parsed == 0 || static_cast<double>(t.parsed) <= min_ratio * static_cast<double>(non_null))
        return std::nullopt;
    return t;
}

template <typename T, typename Parse>
std::optional<std::vector<T>> try_all(const std::vector<std::string>& cells,
                                      const std::vector<std::uint8_t>& missing,
                                      Parse parse)
{
    std::vector<T> out(cells.size());
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (missing[i]) continue;
        auto v = parse(cells[i]);
        if (!v) return std::nullopt;
        out[i] = *v;
    }
    return out;
}

inline std::optional<std::vector<bool>> try_boolean(const std::vector<std::string>& cells,
                                                    const std::vector<std::uint8_t>& missing)
{
    std::unordered_set<std::string> distinct;
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (missing[i]) continue;
        distinct.insert(to_lower(trim_view(cells[i])));
        if (distinct.size() > 2) return std::nullopt;
    }
    if (distinct.empty()) return std::nullopt;

    for (const auto& vocab : bool_vocabularies()) {
        const bool fits = std::all_of(distinct.begin(), distinct.end(), [&](const std::string& s) {
            return s == vocab.true_token || s == vocab.false_token;
        });
        if (!fits) continue;
        std::vector<bool> out(cells.size(), false);
        for (std::size_t i = 0; i < cells.size(); ++i) {
            if (!missing[i]) out[i] = *try_parse_bool(cells[i], vocab);
        }
        return out;
    }
    return std::nullopt;
}

inline categorical_values encode_categories(const std::vector<std::string>& cells,
                                            const std::vector<std::uint8_t>& missing)
{
    categorical_values cat;
    cat.codes.resize(cells.size(), 0);
    std::unordered_map<std::string_view, std::uint32_t> index;
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (missing[i]) continue;
        auto it = index.find(cells[i]);
        if (it == index.end()) {
            it = index.emplace(cells[i], static_cast<std::uint32_t>(cat.categories.size())).first;
            cat.categories.push_back(cells[i]);
        }
        cat.codes[i] = it->second;
    }
    return cat;
}

inline std::size_t count_distinct_text(const std::vector<std::string>& cells,
                                       const std::vector<std::uint8_t>& missing)
{
    std::unordered_set<std::string_view> distinct;
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (!missing[i]) distinct.insert(cells[i]);
    }
    return distinct.size();
}

} // namespace detail

// Rewrites one column in place to its tightest native type.
// Rules in order: temporal (> temporal_min_ratio parse, the rest coerced to null),
// integer, float, boolean vocabulary, categorical text, free text.
// Row count and alignment never change.
inline TypeDecision optimize_column(Column& col, const ProfilerConfig& cfg) {
    TypeDecision d;

    if (col.storage() != storage_type::text_) {
        // already typed; only integer width can still tighten
        detail::narrow_integers(col);
        d.type = col.type;
        d.storage = col.storage();
        d.heuristic = "pre-typed";
        return d;
    }

    const auto& cells = std::get<std::vector<std::string>>(col.values);
    const std::size_t rows = col.size();
    const std::size_t non_null = rows - col.null_count();

    auto finish = [&](semantic_type t, const char* heuristic) {
        col.type = t;
        d.type = t;
        d.storage = col.storage();
        d.heuristic = heuristic;
        return d;
    };

    if (non_null == 0) return finish(semantic_type::text_, "all-null");

    if (auto t = detail::try_temporal(cells, col.missing, non_null, cfg.temporal_min_ratio)) {
        d.coerced_nulls = non_null - t->parsed;
        if (d.coerced_nulls > 0) {
            d.warning = TypeInferenceWarning{
                col.name, "temporal",
                fmt::format("{} of {} non-null values did not parse as dates and were set to null",
                            d.coerced_nulls, non_null)};
        }
        col.missing = std::move(t->missing);
        col.values = std::move(t->values);
        return finish(semantic_type::date_, "temporal");
    }

    if (auto ints = detail::try_all<std::int64_t>(cells, col.missing,
                                                  [](const std::string& s) { return try_parse_int64(s); })) {
        col.values = std::move(*ints);
        detail::narrow_integers(col);
        return finish(semantic_type::integer_, "integer");
    }

    if (auto floats = detail::try_all<double>(cells, col.missing,
                                              [](const std::string& s) { return try_parse_float64(s); })) {
        col.values = std::move(*floats);
        return finish(semantic_type::float_, "float");
    }

    if (auto flags = detail::try_boolean(cells, col.missing)) {
        col.values = std::move(*flags);
        return finish(semantic_type::boolean_, "boolean");
    }

    if (cfg.is_categorical(detail::count_distinct_text(cells, col.missing), rows)) {
        col.values = detail::encode_categories(cells, col.missing);
        return finish(semantic_type::text_, "categorical");
    }

    return finish(semantic_type::text_, "text");
}

}
