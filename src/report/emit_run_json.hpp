#pragma once
#include <fmt/format.h>
#include <cstdint>
#include <fstream>
#include <string>

#include "../core/errors.hpp"
#include "../pipeline/orchestrator.hpp"
#include "../util/json_escape.hpp"

namespace dsprof {

// run.json (schema v1)
inline std::string run_to_json(const RunReport& r,
                               const std::string& started_iso,
                               const std::string& ended_iso,
                               const std::string& final_state)
{
    const double mb   = static_cast<double>(r.input_bytes) / (1024.0 * 1024.0);
    const double secs = r.wall_ms / 1000.0;
    const double mbps = secs > 0.0 ? (mb / secs) : 0.0;
    const std::size_t lookups = r.pattern_cache_hits + r.pattern_cache_misses;

    std::string out;
    out += "{\n";
    out += R"(  "version":"1",)";
    out += "\n  " + fmt::format(R"("source":{},)", json_string(r.source_filename));
    out += "\n  " + fmt::format(R"("state":{},)", json_string(final_state));
    out += "\n  " + fmt::format(R"("started_at":"{}",)", started_iso);
    out += "\n  " + fmt::format(R"("ended_at":"{}",)", ended_iso);
    out += "\n  " + fmt::format(R"("wall_time_ms":{},)", json_number(r.wall_ms));
    out += "\n  " + fmt::format(R"("rows":{},)", r.rows);
    out += "\n  " + fmt::format(R"("columns":{},)", r.columns);
    out += "\n  " + fmt::format(R"("input_bytes":{},)", r.input_bytes);
    out += "\n  " + fmt::format(R"("throughput_input_mb_s":{},)", json_number(mbps));
    out += "\n  " + fmt::format(R"("rss_peak_mb":{},)", json_number(r.rss_peak_mb));
    out += "\n  " + fmt::format(R"("encoding":{},)", json_string(r.encoding));
    out += "\n  " + fmt::format(R"("delimiter":{},)", json_string(std::string(1, r.delimiter)));
    out += "\n  " + fmt::format(R"("partitioned":{},)", r.partitioned ? "true" : "false");
    out += "\n  " + fmt::format(R"("workers":{},)", r.workers);
    if (lookups > 0)
        out += "\n  " + fmt::format(R"("cache_hit_pct":{},)",
                                    json_number(100.0 * static_cast<double>(r.pattern_cache_hits) / static_cast<double>(lookups)));
    else
        out += "\n  " + std::string(R"("cache_hit_pct":null,)");
    out += "\n  " + fmt::format(R"("batch_size":{},"batches":{},)", r.batch_size, r.batches);

    out += "\n  \"stages\":[\n";
    for (std::size_t i = 0; i < r.stages.size(); ++i) {
        const auto& s = r.stages[i];
        out += "    " + fmt::format(R"({{"name":{},"calls":{},"total_ms":{}}})",
                                    json_string(s.name), s.calls, json_number(s.total_ms));
        if (i + 1 < r.stages.size()) out += ",";
        out += "\n";
    }
    out += "  ]\n}\n";
    return out;
}

inline void emit_run_json(const std::string& out_path,
                          const RunReport& r,
                          const std::string& started_iso,
                          const std::string& ended_iso,
                          const std::string& final_state)
{
    std::ofstream f(out_path, std::ios::binary);
    if (!f) throw Error("failed to open for write: " + out_path);
    f << run_to_json(r, started_iso, ended_iso, final_state);
}

}
