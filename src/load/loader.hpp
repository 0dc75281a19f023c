#pragma once
#include <fmt/format.h>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include "../config/profiler_config.hpp"
#include "../core/errors.hpp"
#include "../core/table.hpp"
#include "../csv/csv_count.hpp"
#include "../csv/dialect.hpp"
#include "../csv/tokenizer.hpp"
#include "../io/encoding.hpp"
#include "../io/file_stats.hpp"
#include "../io/spreadsheet.hpp"
#include "../pipeline/worker_pool.hpp"
#include "../util/log.hpp"
#include "../util/nulls.hpp"

namespace dsprof {

inline bool is_supported_extension(std::string_view filename) {
    const std::string ext = lower_extension(filename);
    return ext == ".csv" || ext == ".tsv" || ext == ".txt" || ext == ".xlsx" || ext == ".xls";
}

struct LoadedTable {
    ColumnarTable table;
    std::string encoding;
    char delimiter = ',';
    bool partitioned = false;
};

namespace detail {

// Empty header cells become "Unnamed: i"; repeats become "name.1", "name.2", ...
inline std::vector<std::string> header_names(const std::vector<std::string>& raw) {
    std::vector<std::string> names;
    std::unordered_set<std::string> seen;
    for (std::size_t i = 0; i < raw.size(); ++i) {
        std::string base = trim(raw[i]);
        if (base.empty()) base = fmt::format("Unnamed: {}", i);
        std::string name = base;
        for (std::size_t k = 1; seen.count(name); ++k) name = fmt::format("{}.{}", base, k);
        seen.insert(name);
        names.push_back(std::move(name));
    }
    return names;
}

// Accumulates parsed records column by column.
struct column_builder {
    std::vector<std::vector<std::string>> cells;
    std::vector<std::vector<std::uint8_t>> missing;

    explicit column_builder(std::size_t ncols) : cells(ncols), missing(ncols) {}

    void append(std::vector<std::string>& fields, std::uint64_t line, const std::vector<std::string>& null_tokens) {
        const std::size_t ncols = cells.size();
        if (fields.size() > ncols)
            throw csv_parse_error(line, fmt::format("expected {} fields, saw {}", ncols, fields.size()));
        for (std::size_t i = 0; i < ncols; ++i) {
            if (i < fields.size() && !is_null_like(fields[i], null_tokens)) {
                cells[i].push_back(std::move(fields[i]));
                missing[i].push_back(0);
            } else {
                cells[i].emplace_back();
                missing[i].push_back(1);
            }
        }
    }

    void absorb(column_builder&& other) {
        for (std::size_t i = 0; i < cells.size(); ++i) {
            cells[i].insert(cells[i].end(), std::make_move_iterator(other.cells[i].begin()),
                            std::make_move_iterator(other.cells[i].end()));
            missing[i].insert(missing[i].end(), other.missing[i].begin(), other.missing[i].end());
        }
    }

    ColumnarTable finish(const std::vector<std::string>& names) {
        ColumnarTable t;
        for (std::size_t i = 0; i < names.size(); ++i)
            t.add_column(make_text_column(names[i], std::move(cells[i]), std::move(missing[i])));
        return t;
    }
};

inline void parse_records(record_parser& parser, column_builder& out, const std::vector<std::string>& null_tokens) {
    std::vector<std::string> fields;
    while (parser.next(fields)) out.append(fields, parser.record_line(), null_tokens);
}

inline std::vector<std::string> read_header(record_parser& parser) {
    std::vector<std::string> header;
    if (!parser.next(header)) throw LoadError("no columns to parse from file");
    return header_names(header);
}

inline ColumnarTable parse_single_pass(std::string_view text, CsvDialect d, const ProfilerConfig& cfg) {
    record_parser parser(text, d);
    const auto names = read_header(parser);
    column_builder builder(names.size());
    parse_records(parser, builder, cfg.null_tokens);
    return builder.finish(names);
}

// Partitions split at record boundaries are parsed concurrently, then concatenated in order.
inline ColumnarTable parse_partitioned(std::string_view text, CsvDialect d, const ProfilerConfig& cfg, int workers) {
    record_parser header_parser(text, d);
    const auto names = read_header(header_parser);
    const std::size_t body_begin = header_parser.offset();
    const std::string_view body = text.substr(body_begin);

    const std::size_t parts = cfg.partition_count ? cfg.partition_count : static_cast<std::size_t>(workers);
    const auto partitions = split_partitions(body, d.quote, parts, header_parser.record_line() + 1);
    log_debug("partitioned parse: {} partitions over {} bytes", partitions.size(), body.size());

    std::vector<column_builder> builders(partitions.size(), column_builder(names.size()));
    const auto errors = fan_out(partitions.size(), workers, [&](std::size_t k) {
        const auto& p = partitions[k];
        record_parser parser(body.substr(p.begin, p.end - p.begin), d, p.first_line);
        parse_records(parser, builders[k], cfg.null_tokens);
    });
    rethrow_first(errors);

    column_builder merged(names.size());
    for (auto& b : builders) merged.absorb(std::move(b));
    return merged.finish(names);
}

inline char delimiter_for(std::string_view ext, std::string_view text, const ProfilerConfig& cfg) {
    if (cfg.delimiter != '\0') return cfg.delimiter;
    if (ext == ".tsv") return '\t';
    if (ext == ".txt") return sniff_delimiter(text.substr(0, 64 * 1024), cfg.quote);
    return ',';
}

} // namespace detail

// bytes + filename -> untyped table (every column is text with a null mask).
inline LoadedTable load_dataset(std::string_view bytes, std::string_view filename, const ProfilerConfig& cfg) {
    const std::string ext = lower_extension(filename);
    if (!is_supported_extension(filename))
        throw LoadError(fmt::format("unsupported file type '{}' for {}", ext.empty() ? "(none)" : ext, filename));

    LoadedTable out;
    try {
        if (ext == ".xlsx" || ext == ".xls") {
            const std::string csv = convert_spreadsheet_to_csv(bytes, ext, ext == ".xlsx" ? cfg.xlsx_converter
                                                                                          : cfg.xls_converter);
            DecodedText decoded = decode_with_fallback(csv, {"UTF-8"});
            out.encoding = decoded.encoding;
            out.delimiter = ',';
            out.table = detail::parse_single_pass(decoded.text, CsvDialect{',', cfg.quote}, cfg);
            return out;
        }

        if (bytes.size() > cfg.partition_threshold_bytes) {
            try {
                auto text = decode_to_utf8(bytes, "UTF-8", decode_mode::strict);
                if (!text) throw LoadError("input is not valid UTF-8");
                strip_utf8_bom(*text);
                out.delimiter = detail::delimiter_for(ext, *text, cfg);
                out.table = detail::parse_partitioned(*text, CsvDialect{out.delimiter, cfg.quote}, cfg,
                                                      resolve_workers(cfg.workers));
                out.encoding = "UTF-8";
                out.partitioned = true;
                return out;
            } catch (const std::exception& e) {
                log_warn("partitioned load of {} failed ({}); retrying single-pass", filename, describe(e));
            }
        }

        DecodedText decoded = decode_with_fallback(bytes, cfg.encodings);
        if (decoded.lossy) log_warn("{}: decoded with invalid bytes dropped", filename);
        out.encoding = decoded.encoding;
        out.delimiter = detail::delimiter_for(ext, decoded.text, cfg);
        out.table = detail::parse_single_pass(decoded.text, CsvDialect{out.delimiter, cfg.quote}, cfg);
        return out;
    } catch (const LoadError&) {
        throw;
    } catch (const std::exception&) {
        std::throw_with_nested(LoadError(fmt::format("cannot read {}", filename)));
    }
}

inline ColumnarTable load_table(std::string_view bytes, std::string_view filename, const ProfilerConfig& cfg) {
    return load_dataset(bytes, filename, cfg).table;
}

}
