#pragma once
#include <fmt/format.h>
#include <array>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "../config/profiler_config.hpp"
#include "../util/strings.hpp"

namespace dsprof {

enum class identifier_kind { column, table };

inline bool is_reserved_word(std::string_view s) {
    static const std::array<std::string_view, 11> kReserved = {
        "order", "group", "table", "select", "where", "from",
        "insert", "update", "delete", "user", "index"};
    for (auto r : kReserved) {
        if (s == r) return true;
    }
    return false;
}

inline constexpr std::string_view kReservedSuffix = "_col";

// The whole name or its first '_'-separated word is reserved ("order", "order_date").
// "<word>_<digit>..." is the digit-prefix form and is left alone; a name already
// ending in "_col" is final.
inline bool needs_reserved_suffix(std::string_view s) {
    if (s.size() > kReservedSuffix.size() &&
        s.compare(s.size() - kReservedSuffix.size(), kReservedSuffix.size(), kReservedSuffix) == 0)
        return false;
    const std::size_t cut = s.find('_');
    if (cut == std::string_view::npos) return is_reserved_word(s);
    if (cut + 1 < s.size() && std::isdigit(static_cast<unsigned char>(s[cut + 1]))) return false;
    return is_reserved_word(s.substr(0, cut));
}

// Fixed rule order:
//   1. every code point outside [A-Za-z0-9_] -> '_'
//   2. lower-case
//   3. strip leading/trailing '_'
//   4. empty -> placeholder ("unnamed_<position>" / "dataset")
//   5. leading digit -> "col_" / "table_" prefix
//   6. truncate to `limit`, strip trailing '_' again
//   7. reserved leading word -> "_col" suffix, cutting further so the result still fits
// Output only holds [a-z0-9_], never starts with '_' and is stable under re-sanitization.
inline std::string sanitize_identifier(std::string_view raw,
                                       identifier_kind kind,
                                       std::size_t position,
                                       std::size_t limit)
{
    std::string s;
    s.reserve(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i) {
        const auto c = static_cast<unsigned char>(raw[i]);
        if (c < 0x80) {
            s.push_back(std::isalnum(c) || c == '_' ? static_cast<char>(std::tolower(c)) : '_');
        } else if ((c & 0xC0) != 0x80) {
            s.push_back('_'); // one per multi-byte code point
        }
    }

    auto strip = [](std::string& v) {
        const std::size_t b = v.find_first_not_of('_');
        if (b == std::string::npos) { v.clear(); return; }
        const std::size_t e = v.find_last_not_of('_');
        v = v.substr(b, e - b + 1);
    };
    strip(s);

    if (s.empty())
        s = kind == identifier_kind::column ? fmt::format("unnamed_{}", position) : std::string("dataset");
    if (std::isdigit(static_cast<unsigned char>(s[0])))
        s = (kind == identifier_kind::column ? "col_" : "table_") + s;
    if (s.size() > limit) {
        s.resize(limit);
        strip(s);
    }
    if (needs_reserved_suffix(s)) {
        if (limit > kReservedSuffix.size() && s.size() + kReservedSuffix.size() > limit) {
            s.resize(limit - kReservedSuffix.size());
            strip(s);
        }
        s += kReservedSuffix;
    }
    return s;
}

// Appends _1, _2, ... to repeats, in column order.
inline std::vector<std::string> deduplicate_identifiers(const std::vector<std::string>& names) {
    std::vector<std::string> out;
    std::unordered_set<std::string> used;
    out.reserve(names.size());
    for (const auto& n : names) {
        std::string candidate = n;
        for (std::size_t k = 1; used.count(candidate); ++k) candidate = fmt::format("{}_{}", n, k);
        used.insert(candidate);
        out.push_back(std::move(candidate));
    }
    return out;
}

inline std::vector<std::string> sanitize_column_names(const std::vector<std::string>& raw, const ProfilerConfig& cfg) {
    std::vector<std::string> names;
    names.reserve(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i)
        names.push_back(sanitize_identifier(raw[i], identifier_kind::column, i + 1, cfg.column_name_limit()));
    return deduplicate_identifiers(names);
}

// Known extensions are stripped before sanitizing; the optional prefix is joined with '_'.
inline std::string table_name_for(std::string_view filename, const ProfilerConfig& cfg) {
    std::string base = std::filesystem::path(std::string(filename)).filename().string();
    for (std::string_view ext : {".csv", ".tsv", ".txt", ".xlsx", ".xls"}) {
        if (base.size() > ext.size() && iequals(std::string_view(base).substr(base.size() - ext.size()), ext)) {
            base.resize(base.size() - ext.size());
            break;
        }
    }
    const std::string raw = cfg.table_prefix.empty() ? base : cfg.table_prefix + "_" + base;
    return sanitize_identifier(raw, identifier_kind::table, 0, cfg.table_name_limit());
}

inline std::string quote_identifier(std::string_view name) {
    return fmt::format("\"{}\"", name);
}

}
