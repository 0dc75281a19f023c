#pragma once
#include <fmt/format.h>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "types.hpp"
#include "../types/parse_date.hpp"

namespace dsprof {

// Dictionary-encoded text; categories keep first-seen order.
struct categorical_values {
    std::vector<std::string> categories;
    std::vector<std::uint32_t> codes;
};

// Alternatives are listed in storage_type order.
using column_values = std::variant<
    std::vector<std::string>,
    categorical_values,
    std::vector<bool>,
    std::vector<timestamp>,
    std::vector<double>,
    std::vector<std::int64_t>,
    std::vector<std::int32_t>,
    std::vector<std::int16_t>,
    std::vector<std::int8_t>,
    std::vector<std::uint32_t>,
    std::vector<std::uint16_t>,
    std::vector<std::uint8_t>>;

struct Column {
    std::string name;
    semantic_type type = semantic_type::text_;
    column_values values = std::vector<std::string>{};
    std::vector<std::uint8_t> missing; // 1 = null, one entry per row

    std::size_t size() const { return missing.size(); }
    bool is_null(std::size_t row) const { return missing[row] != 0; }
    storage_type storage() const { return static_cast<storage_type>(values.index()); }
    bool is_categorical() const { return storage() == storage_type::categorical_; }

    std::size_t null_count() const {
        std::size_t n = 0;
        for (auto m : missing) n += m ? 1 : 0;
        return n;
    }

    std::size_t value_count() const {
        return std::visit([](const auto& v) -> std::size_t {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, categorical_values>) return v.codes.size();
            else return v.size();
        }, values);
    }
};

inline Column make_text_column(std::string name, std::vector<std::string> cells, std::vector<std::uint8_t> missing) {
    if (cells.size() != missing.size())
        throw std::invalid_argument(fmt::format("column '{}': {} values but {} mask entries",
                                                name, cells.size(), missing.size()));
    Column c;
    c.name = std::move(name);
    c.values = std::move(cells);
    c.missing = std::move(missing);
    return c;
}

// Numeric view of a non-null cell; nullopt for non-numeric storage.
inline std::optional<double> numeric_at(const Column& c, std::size_t row) {
    if (c.is_null(row)) return std::nullopt;
    return std::visit([row](const auto& v) -> std::optional<double> {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, std::vector<double>>) {
            return v[row];
        } else if constexpr (std::is_same_v<V, std::vector<std::string>> ||
                             std::is_same_v<V, categorical_values> ||
                             std::is_same_v<V, std::vector<bool>> ||
                             std::is_same_v<V, std::vector<timestamp>>) {
            return std::nullopt;
        } else {
            return static_cast<double>(v[row]);
        }
    }, c.values);
}

// Min/max of the non-null cells of integer storage, without a round trip through double.
inline std::optional<integer_range> integer_bounds(const Column& c) {
    return std::visit([&c](const auto& v) -> std::optional<integer_range> {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, categorical_values>) {
            return std::nullopt;
        } else if constexpr (std::is_integral_v<typename V::value_type> &&
                             !std::is_same_v<typename V::value_type, bool>) {
            std::optional<integer_range> r;
            for (std::size_t i = 0; i < v.size(); ++i) {
                if (c.is_null(i)) continue;
                const auto x = static_cast<std::int64_t>(v[i]);
                if (!r) r = integer_range{x, x};
                else if (x < r->min) r->min = x;
                else if (x > r->max) r->max = x;
            }
            return r;
        } else {
            return std::nullopt;
        }
    }, c.values);
}

// Stringified cell; empty for nulls.
inline std::string render_value(const Column& c, std::size_t row) {
    if (c.is_null(row)) return {};
    return std::visit([row](const auto& v) -> std::string {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, std::vector<std::string>>) {
            return v[row];
        } else if constexpr (std::is_same_v<V, categorical_values>) {
            return v.categories[v.codes[row]];
        } else if constexpr (std::is_same_v<V, std::vector<bool>>) {
            return v[row] ? "true" : "false";
        } else if constexpr (std::is_same_v<V, std::vector<timestamp>>) {
            return format_timestamp(v[row]);
        } else if constexpr (std::is_same_v<V, std::vector<double>>) {
            return fmt::format("{}", v[row]);
        } else {
            return fmt::format("{}", static_cast<std::int64_t>(v[row]));
        }
    }, c.values);
}

// Text view for text/categorical storage; empty view otherwise.
inline std::string_view text_at(const Column& c, std::size_t row) {
    if (const auto* s = std::get_if<std::vector<std::string>>(&c.values)) return (*s)[row];
    if (const auto* cat = std::get_if<categorical_values>(&c.values)) return cat->categories[cat->codes[row]];
    return {};
}

// ---------- table ----------
class ColumnarTable {
public:
    ColumnarTable() = default;

    // Rejects length mismatches and duplicate names.
    void add_column(Column c) {
        if (c.value_count() != c.size())
            throw std::invalid_argument(fmt::format("column '{}': values/mask length mismatch", c.name));
        if (!columns_.empty() && c.size() != rows_)
            throw std::invalid_argument(fmt::format("column '{}' has {} rows, table has {}",
                                                    c.name, c.size(), rows_));
        if (index_.count(c.name))
            throw std::invalid_argument(fmt::format("duplicate column name '{}'", c.name));
        if (columns_.empty()) rows_ = c.size();
        index_.emplace(c.name, columns_.size());
        columns_.push_back(std::move(c));
    }

    std::size_t row_count() const { return rows_; }
    std::size_t column_count() const { return columns_.size(); }

    const Column& column(std::size_t i) const { return columns_.at(i); }
    // Mutable access for in-place rewrites; callers must keep the name and row count.
    Column& column(std::size_t i) { return columns_.at(i); }
    const std::vector<Column>& columns() const { return columns_; }

    std::optional<std::size_t> find(std::string_view name) const {
        auto it = index_.find(std::string(name));
        if (it == index_.end()) return std::nullopt;
        return it->second;
    }

    // Re-checks the invariants after in-place rewrites.
    void verify() const {
        for (const auto& c : columns_) {
            if (c.size() != rows_ || c.value_count() != rows_)
                throw std::logic_error(fmt::format("column '{}' lost row alignment", c.name));
        }
    }

private:
    std::vector<Column> columns_;
    std::unordered_map<std::string, std::size_t> index_;
    std::size_t rows_ = 0;
};

}
