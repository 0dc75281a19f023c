#pragma once
#include <string_view>
#include <string>
#include <vector>

#include "strings.hpp"

namespace dsprof {

// Tokens read as missing by common dataframe readers.
inline std::vector<std::string> default_null_tokens() {
    return {"", "#N/A", "#N/A N/A", "#NA", "-1.#IND", "-1.#QNAN", "-NaN", "-nan",
            "1.#IND", "1.#QNAN", "<NA>", "N/A", "NA", "NULL", "NaN", "None", "n/a", "nan", "null"};
}

// Trimmed, case-insensitive match against the configured tokens.
inline bool is_null_like(std::string_view s, const std::vector<std::string>& nulls) {
    const std::string_view t = trim_view(s);
    for (const auto& n : nulls) {
        if (iequals(t, n)) return true;
    }
    return false;
}

}
