#pragma once
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "../util/strings.hpp"

namespace dsprof {

// Optional sign then digits; the whole (trimmed) token must be consumed.
inline std::optional<std::int64_t> try_parse_int64(std::string_view raw) {
    std::string_view s = trim_view(raw);
    if (s.empty()) return std::nullopt;
    if (s.front() == '+') {
        s.remove_prefix(1);
        if (s.empty() || s.front() == '+' || s.front() == '-') return std::nullopt;
    }
    std::int64_t v = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

// Decimal or scientific notation; finite values only ("inf"/"nan" are not numbers here).
inline std::optional<double> try_parse_float64(std::string_view raw) {
    std::string_view s = trim_view(raw);
    if (s.empty()) return std::nullopt;
    if (s.front() == '+') {
        s.remove_prefix(1);
        if (s.empty() || s.front() == '+' || s.front() == '-') return std::nullopt;
    }

    bool digit = false, dot = false, exp = false;
    for (std::size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (std::isdigit(static_cast<unsigned char>(c))) { digit = true; continue; }
        if (c == '-' && i == 0) continue;
        if (c == '.' && !dot && !exp) { dot = true; continue; }
        if ((c == 'e' || c == 'E') && !exp && digit) {
            exp = true;
            if (i + 1 < s.size() && (s[i + 1] == '+' || s[i + 1] == '-')) ++i;
            if (i + 1 >= s.size()) return std::nullopt;
            continue;
        }
        return std::nullopt;
    }
    if (!digit) return std::nullopt;

    double v = 0.0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size() || !std::isfinite(v)) return std::nullopt;
    return v;
}

// Accepted boolean vocabularies; a column must stay within one of them.
struct bool_vocabulary {
    const char* true_token;
    const char* false_token;
};

inline const std::array<bool_vocabulary, 4>& bool_vocabularies() {
    static const std::array<bool_vocabulary, 4> kVocab = {{
        {"true", "false"}, {"1", "0"}, {"yes", "no"}, {"y", "n"}}};
    return kVocab;
}

// true/false for a token of the given vocabulary, nullopt otherwise.
inline std::optional<bool> try_parse_bool(std::string_view raw, const bool_vocabulary& vocab) {
    const std::string s = to_lower(trim_view(raw));
    if (s == vocab.true_token) return true;
    if (s == vocab.false_token) return false;
    return std::nullopt;
}

}
