#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>

#include "../config/profiler_config.hpp"
#include "../core/profile.hpp"
#include "../core/table.hpp"
#include "../quality/quality_analyzer.hpp"

namespace dsprof {

// Receives one dataset with create-or-replace semantics.
// Call order: begin_dataset, write_rows (one or more), write_profiles, commit.
// rollback() discards everything since begin_dataset and must not throw.
class PersistenceSink {
public:
    virtual ~PersistenceSink() = default;

    virtual void begin_dataset(const SchemaDocument& schema) = 0;
    // Rows [first_row, first_row + row_count) of the optimized table, columns in schema order.
    virtual void write_rows(const ColumnarTable& table, std::size_t first_row, std::size_t row_count) = 0;
    virtual void write_profiles(const DatasetProfile& profile) = 0;
    virtual void commit() = 0;
    virtual void rollback() noexcept = 0;
};

inline std::uint64_t per_row_byte_estimate(const ColumnarTable& t) {
    if (t.row_count() == 0) return 1;
    return std::max<std::uint64_t>(1, estimate_table_bytes(t) / t.row_count());
}

// min(max_rows, max(min_rows, available * fraction / per_row))
inline std::size_t optimal_batch_size(std::uint64_t available_bytes,
                                      std::uint64_t per_row_bytes,
                                      const ProfilerConfig& cfg)
{
    const double budget = static_cast<double>(available_bytes) * cfg.batch_memory_fraction;
    const double rows = budget / static_cast<double>(std::max<std::uint64_t>(1, per_row_bytes));
    const double clamped = std::min(static_cast<double>(cfg.max_batch_rows),
                                    std::max(static_cast<double>(cfg.min_batch_rows), rows));
    return static_cast<std::size_t>(clamped);
}

}
