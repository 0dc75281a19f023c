#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

// Quote-parity partitioning for parallel parsing of one decoded buffer.
// Pass 1 counts quotes and line feeds per raw chunk (in parallel).
// Pass 2 starts at each raw boundary knowing whether it sits inside quotes
// (odd number of quotes before it) and walks forward to the first line break
// outside quotes; the record after it starts the partition.
//
// A literal quote inside an unquoted field flips parity; partitions built from
// such input fail to parse cleanly and the caller falls back to a single pass.

namespace dsprof {

struct CsvCounts {
    std::uint64_t quotes = 0;
    std::uint64_t line_feeds = 0;
};

struct CsvPartition {
    std::size_t begin = 0;
    std::size_t end = 0;
    std::uint64_t first_line = 1;
};

inline CsvCounts csv_count_range(std::string_view text, std::size_t begin, std::size_t end, char quote) {
    CsvCounts c;
    for (std::size_t i = begin; i < end; ++i) {
        if (text[i] == quote) ++c.quotes;
        else if (text[i] == '\n') ++c.line_feeds;
    }
    return c;
}

// First record start at or after `from` given the quote state at `from`.
inline std::size_t next_record_start(std::string_view text, std::size_t from, bool in_quotes, char quote) {
    for (std::size_t i = from; i < text.size(); ++i) {
        const char c = text[i];
        if (c == quote) {
            in_quotes = !in_quotes;
        } else if (!in_quotes && (c == '\n' || c == '\r')) {
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') ++i;
            return i + 1;
        }
    }
    return text.size();
}

inline std::vector<CsvPartition> split_partitions(std::string_view body,
                                                  char quote,
                                                  std::size_t parts,
                                                  std::uint64_t first_line = 1)
{
    std::vector<CsvPartition> out;
    if (body.empty()) return out;
    if (parts < 2 || body.size() < parts * 64) {
        out.push_back(CsvPartition{0, body.size(), first_line});
        return out;
    }

    const std::size_t chunk = body.size() / parts;
    std::vector<std::size_t> raw(parts + 1);
    for (std::size_t k = 0; k < parts; ++k) raw[k] = k * chunk;
    raw[parts] = body.size();

    std::vector<CsvCounts> counts(parts);
    const long long n = static_cast<long long>(parts);
#pragma omp parallel for schedule(static)
    for (long long k = 0; k < n; ++k) {
        const auto i = static_cast<std::size_t>(k);
        counts[i] = csv_count_range(body, raw[i], raw[i + 1], quote);
    }

    std::vector<std::size_t> starts{0};
    std::vector<std::uint64_t> lines{first_line};
    std::uint64_t quotes_before = 0;
    std::uint64_t lf_before = 0;
    for (std::size_t k = 1; k < parts; ++k) {
        quotes_before += counts[k - 1].quotes;
        lf_before += counts[k - 1].line_feeds;
        const bool in_quotes = (quotes_before % 2) == 1;
        std::size_t s = next_record_start(body, raw[k], in_quotes, quote);
        s = std::max(s, starts.back());
        if (s >= body.size() || s == starts.back()) continue;
        starts.push_back(s);
        lines.push_back(first_line + lf_before + csv_count_range(body, raw[k], s, quote).line_feeds);
    }

    for (std::size_t i = 0; i < starts.size(); ++i) {
        const std::size_t end = i + 1 < starts.size() ? starts[i + 1] : body.size();
        out.push_back(CsvPartition{starts[i], end, lines[i]});
    }
    return out;
}

}
