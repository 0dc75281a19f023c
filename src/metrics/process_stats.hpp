#pragma once
#include <unistd.h>
#include <cstdint>
#include <fstream>
#include <optional>
#include <string>

namespace dsprof {

// Peak resident set (VmHWM) in MB; 0 when /proc is unavailable.
inline double process_peak_rss_mb() {
    std::ifstream f("/proc/self/status");
    std::string key;
    while (f >> key) {
        if (key == "VmHWM:") {
            double kb = 0.0;
            f >> kb;
            return kb / 1024.0;
        }
        f.ignore(4096, '\n');
    }
    return 0.0;
}

// MemAvailable from /proc/meminfo, falling back to free physical pages.
inline std::optional<std::uint64_t> available_memory_bytes() {
    std::ifstream f("/proc/meminfo");
    std::string key;
    while (f >> key) {
        if (key == "MemAvailable:") {
            std::uint64_t kb = 0;
            if (f >> kb) return kb * 1024;
            break;
        }
        f.ignore(4096, '\n');
    }
    const long pages = sysconf(_SC_AVPHYS_PAGES);
    const long page = sysconf(_SC_PAGESIZE);
    if (pages > 0 && page > 0) return static_cast<std::uint64_t>(pages) * static_cast<std::uint64_t>(page);
    return std::nullopt;
}

}
