#pragma once
#include <fmt/format.h>
#include <cmath>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dsprof {

// JSON string escaper for hand-assembled documents.
// Escapes quote, backslash and control chars; UTF-8 passes through untouched.
inline std::string json_escape(std::string_view in) {
    std::string out;
    out.reserve(in.size() + 16);
    for (unsigned char c : in) {
        switch (c) {
            case '\"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (c < 0x20) out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                else          out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

inline std::string json_string(std::string_view s) { return "\"" + json_escape(s) + "\""; }

// JSON has no NaN/Inf; those become null.
inline std::string json_number(double v) {
    return std::isfinite(v) ? fmt::format("{}", v) : std::string("null");
}

inline std::string json_number(const std::optional<double>& v) {
    return v ? json_number(*v) : std::string("null");
}

inline std::string json_string_array(const std::vector<std::string>& items) {
    std::string out = "[";
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i) out += ",";
        out += json_string(items[i]);
    }
    out += "]";
    return out;
}

}
