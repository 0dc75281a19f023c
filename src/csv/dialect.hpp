#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "tokenizer.hpp"

namespace dsprof {

// Delimiter sniffing for extensionless / .txt input.
// Each candidate parses the first few records; the candidate with the most
// rows agreeing on the most frequent column count (>1) wins, ties going to
// more columns and then to candidate order.
inline char sniff_delimiter(std::string_view text,
                            char quote = '"',
                            std::size_t sample_records = 20,
                            std::string_view candidates = ",\t;|")
{
    char best = ',';
    std::size_t best_consistent = 0;
    std::size_t best_columns = 1;

    for (char cand : candidates) {
        record_parser parser(text, CsvDialect{cand, quote});
        std::vector<std::string> fields;
        std::map<std::size_t, std::size_t> freq;
        std::size_t read = 0;
        try {
            while (read < sample_records && parser.next(fields)) {
                ++freq[fields.size()];
                ++read;
            }
        } catch (const csv_parse_error&) {
            // sample cut mid-quote; score what was read
        }
        std::size_t columns = 1, consistent = 0;
        for (const auto& [cols, n] : freq) {
            if (n > consistent || (n == consistent && cols > columns)) { columns = cols; consistent = n; }
        }
        if (columns < 2) continue;
        if (consistent > best_consistent || (consistent == best_consistent && columns > best_columns)) {
            best = cand;
            best_consistent = consistent;
            best_columns = columns;
        }
    }
    return best;
}

}
