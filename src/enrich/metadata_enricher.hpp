#pragma once
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../core/profile.hpp"
#include "../core/types.hpp"
#include "../util/strings.hpp"

namespace dsprof {

struct ColumnAnnotations {
    std::map<std::string, std::vector<std::string>> synonyms;
    std::map<std::string, std::string> value_mappings;
    std::vector<std::string> example_queries;
    std::string description;
};

struct DatasetAnnotations {
    std::vector<std::string> example_queries; // SQL
    std::map<std::string, std::string> query_hints;
    std::string schema_summary;
};

namespace detail {

// ---------- lookup tables ----------
inline const std::map<std::string_view, std::string_view>& abbreviations() {
    static const std::map<std::string_view, std::string_view> kAbbrev = {
        {"addr", "address"}, {"amt", "amount"}, {"avg", "average"}, {"cat", "category"},
        {"cnt", "count"}, {"cust", "customer"}, {"dept", "department"}, {"desc", "description"},
        {"dob", "date of birth"}, {"emp", "employee"}, {"id", "identifier"}, {"num", "number"},
        {"pct", "percent"}, {"prod", "product"}, {"qty", "quantity"}, {"yr", "year"},
    };
    return kAbbrev;
}

inline const std::map<std::string_view, std::vector<std::string_view>>& word_synonyms() {
    static const std::map<std::string_view, std::vector<std::string_view>> kSynonyms = {
        {"age", {"years old"}},
        {"amount", {"total", "sum"}},
        {"city", {"town"}},
        {"cost", {"price", "expense"}},
        {"count", {"number"}},
        {"country", {"nation"}},
        {"customer", {"client", "buyer"}},
        {"date", {"day", "when"}},
        {"email", {"e-mail", "mail address"}},
        {"employee", {"staff", "worker"}},
        {"gender", {"sex"}},
        {"name", {"title", "label"}},
        {"phone", {"telephone", "contact number"}},
        {"price", {"cost", "rate"}},
        {"quantity", {"units", "count"}},
        {"revenue", {"sales", "income"}},
        {"salary", {"pay", "wage", "income"}},
        {"sales", {"revenue", "turnover"}},
        {"sex", {"gender"}},
        {"status", {"state"}},
        {"total", {"sum", "amount"}},
    };
    return kSynonyms;
}

inline const std::map<std::string_view, std::string_view>& short_code_labels() {
    static const std::map<std::string_view, std::string_view> kCodes = {
        {"F", "F (possibly female, false, or other)"},
        {"M", "M (possibly male, medium, or other)"},
        {"N", "N (possibly no or number)"},
        {"U", "U (possibly unknown or unspecified)"},
        {"Y", "Y (possibly yes or year)"},
    };
    return kCodes;
}

inline void push_unique(std::vector<std::string>& v, std::string s, std::string_view exclude) {
    if (s.empty() || s == exclude) return;
    if (std::find(v.begin(), v.end(), s) == v.end()) v.push_back(std::move(s));
}

inline std::string sql_literal(std::string_view v) {
    std::string out = "'";
    for (char c : v) {
        if (c == '\'') out += "''";
        else out.push_back(c);
    }
    return out + "'";
}

inline std::string format_number(double v) {
    return fmt::format("{}", v);
}

} // namespace detail

// "order_date" -> "order date"
inline std::string display_name(std::string_view column) {
    const auto words = split_words(column);
    return words.empty() ? std::string(column) : join(words, " ");
}

inline std::string describe_column(const ColumnProfile& p) {
    std::string out = fmt::format("{}: {} column.", p.name, to_string(p.type));
    std::vector<std::string> facts;
    if (p.null_count > 0) facts.push_back(fmt::format("Contains {} null values", p.null_count));
    if (p.enum_values) facts.push_back(fmt::format("Has {} unique values", p.unique_count));
    if (p.numeric && p.numeric->exact)
        facts.push_back(fmt::format("Range: {} to {}", p.numeric->exact->min, p.numeric->exact->max));
    else if (p.numeric)
        facts.push_back(fmt::format("Range: {} to {}", detail::format_number(p.numeric->min),
                                    detail::format_number(p.numeric->max)));
    if (!facts.empty()) out += " " + join(facts, ". ") + ".";
    return out;
}

inline std::map<std::string, std::vector<std::string>> column_synonyms(const ColumnProfile& p) {
    std::map<std::string, std::vector<std::string>> out;
    const auto words = split_words(p.name);

    std::vector<std::string> expanded;
    for (const auto& w : words) {
        auto it = detail::abbreviations().find(w);
        expanded.push_back(it != detail::abbreviations().end() ? std::string(it->second) : w);
    }

    std::vector<std::string> phrases;
    detail::push_unique(phrases, join(words, " "), p.name);
    detail::push_unique(phrases, join(expanded, " "), p.name);
    for (std::size_t i = 0; i < expanded.size() && phrases.size() < 8; ++i) {
        auto it = detail::word_synonyms().find(expanded[i]);
        if (it == detail::word_synonyms().end()) continue;
        for (auto alt : it->second) {
            auto variant = expanded;
            variant[i] = std::string(alt);
            detail::push_unique(phrases, join(variant, " "), p.name);
        }
    }
    if (!phrases.empty()) out[p.name] = std::move(phrases);

    if (p.type == semantic_type::boolean_) {
        const std::string yes = p.name + " = TRUE";
        const std::string no = p.name + " = FALSE";
        out["true"] = {yes};
        out["yes"] = {yes};
        out["false"] = {no};
        out["no"] = {no};
    }
    return out;
}

inline std::map<std::string, std::string> column_value_mappings(const ColumnProfile& p) {
    std::map<std::string, std::string> out;
    if (p.type == semantic_type::boolean_) {
        for (const char* t : {"true", "yes", "y", "1", "t", "on"}) out[t] = "TRUE";
        for (const char* f : {"false", "no", "n", "0", "f", "off"}) out[f] = "FALSE";
        return out;
    }
    if (!p.enum_values) return out;
    for (const auto& v : *p.enum_values) {
        std::string code = trim(v);
        for (auto& c : code) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        auto it = detail::short_code_labels().find(code);
        if (it != detail::short_code_labels().end()) out[v] = std::string(it->second);
    }
    return out;
}

inline std::vector<std::string> column_example_queries(const ColumnProfile& p) {
    const std::string d = display_name(p.name);
    std::vector<std::string> q;
    if (p.type == semantic_type::boolean_) {
        q.push_back(fmt::format("How many records have {} as true?", d));
        q.push_back(fmt::format("Show me all data where {} is false", d));
    } else if (p.enum_values && !p.top_values.empty()) {
        q.push_back(fmt::format("How many records have {} equal to '{}'?", d, p.top_values.front().value));
        q.push_back(fmt::format("Show distribution of {}", d));
    } else if (is_numeric(p.type)) {
        q.push_back(fmt::format("What is the average {}?", d));
        if (p.numeric)
            q.push_back(fmt::format("Show records where {} is greater than {:.1f}", d,
                                    (p.numeric->min + p.numeric->max) / 2.0));
    } else if (p.type == semantic_type::date_) {
        q.push_back(fmt::format("Show records from the latest {}", d));
        q.push_back(fmt::format("Group by {} and count", d));
    } else if (!p.top_values.empty()) {
        q.push_back(fmt::format("Which {} values appear most often?", d));
    }
    return q;
}

// Pure lookup; misses give empty annotations.
inline ColumnAnnotations enrich_column(const ColumnProfile& p) {
    ColumnAnnotations a;
    a.synonyms = column_synonyms(p);
    a.value_mappings = column_value_mappings(p);
    a.example_queries = column_example_queries(p);
    a.description = describe_column(p);
    return a;
}

inline std::string column_query_hint(const ColumnProfile& p) {
    const std::string& c = p.name;
    if (p.type == semantic_type::boolean_) return fmt::format("Use {0} = TRUE or {0} = FALSE", c);
    if (p.enum_values) {
        std::vector<std::string> shown;
        for (std::size_t i = 0; i < p.enum_values->size() && i < 5; ++i) shown.push_back((*p.enum_values)[i]);
        return fmt::format("Filter with {} = '<value>'; known values: {}", c, join(shown, ", "));
    }
    if (is_numeric(p.type)) return fmt::format("Aggregate {} with AVG, SUM, MIN or MAX", c);
    if (p.type == semantic_type::date_) return fmt::format("Filter {0} with ranges such as {0} >= '2024-01-01'", c);
    return fmt::format("Match {} with ILIKE '%term%'", c);
}

inline std::string schema_summary(std::string_view table, const std::vector<ColumnProfile>& columns) {
    std::string out = fmt::format("Table {} has {} columns:\n", table, columns.size());
    for (const auto& p : columns) {
        out += fmt::format("- {} ({}): {}", p.name, to_string(p.type), p.description);
        if (p.enum_values && !p.enum_values->empty()) {
            const std::size_t n = std::min<std::size_t>(10, p.enum_values->size());
            std::vector<std::string> shown(p.enum_values->begin(),
                                           p.enum_values->begin() + static_cast<std::ptrdiff_t>(n));
            out += fmt::format(" [Categories: {}]", join(shown, ", "));
        }
        out += "\n";
    }
    return out;
}

// Table-level SQL examples built from the first column of each kind.
inline std::vector<std::string> table_example_queries(std::string_view table, const std::vector<ColumnProfile>& columns) {
    const ColumnProfile* categorical = nullptr;
    const ColumnProfile* numeric = nullptr;
    const ColumnProfile* boolean = nullptr;
    const ColumnProfile* date = nullptr;
    for (const auto& p : columns) {
        if (!categorical && p.enum_values && !p.top_values.empty() && !is_numeric(p.type)) categorical = &p;
        if (!numeric && is_numeric(p.type) && p.numeric) numeric = &p;
        if (!boolean && p.type == semantic_type::boolean_) boolean = &p;
        if (!date && p.type == semantic_type::date_) date = &p;
    }

    std::vector<std::string> q;
    q.push_back(fmt::format("SELECT COUNT(*) FROM {};", table));
    if (categorical) {
        const auto& c = categorical->name;
        q.push_back(fmt::format("SELECT * FROM {} WHERE {} = {} LIMIT 10;", table, c,
                                detail::sql_literal(categorical->top_values.front().value)));
        q.push_back(fmt::format("SELECT {0}, COUNT(*) AS count FROM {1} GROUP BY {0} ORDER BY count DESC;", c, table));
    }
    if (numeric) {
        const auto& n = numeric->name;
        q.push_back(fmt::format("SELECT AVG({}) FROM {};", n, table));
        q.push_back(fmt::format("SELECT MAX({0}), MIN({0}) FROM {1};", n, table));
        q.push_back(fmt::format("SELECT * FROM {} WHERE {} > {} LIMIT 10;", table, n,
                                detail::format_number((numeric->numeric->min + numeric->numeric->max) / 2.0)));
    }
    if (boolean) {
        q.push_back(fmt::format("SELECT COUNT(*) FROM {} WHERE {} = TRUE;", table, boolean->name));
        q.push_back(fmt::format("SELECT * FROM {} WHERE {} = FALSE LIMIT 10;", table, boolean->name));
    }
    if (categorical && numeric) {
        q.push_back(fmt::format("SELECT {0}, AVG({1}) FROM {2} GROUP BY {0};", categorical->name, numeric->name, table));
    }
    if (date) {
        q.push_back(fmt::format("SELECT * FROM {} ORDER BY {} DESC LIMIT 10;", table, date->name));
    }
    return q;
}

inline DatasetAnnotations enrich_dataset(std::string_view table, const std::vector<ColumnProfile>& columns) {
    DatasetAnnotations a;
    a.example_queries = table_example_queries(table, columns);
    for (const auto& p : columns) a.query_hints[p.name] = column_query_hint(p);
    a.schema_summary = schema_summary(table, columns);
    return a;
}

}
