#pragma once
#include <cmath>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "../core/profile.hpp"
#include "../core/table.hpp"

namespace dsprof {

// Pearson r over rows where both columns are non-null.
// nullopt with fewer than two such rows or zero variance on either side.
inline std::optional<double> pearson(const Column& a, const Column& b) {
    std::size_t n = 0;
    double mean_x = 0.0, mean_y = 0.0, cxy = 0.0, m2x = 0.0, m2y = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        const auto x = numeric_at(a, i);
        const auto y = numeric_at(b, i);
        if (!x || !y) continue;
        ++n;
        const double dx = *x - mean_x;
        mean_x += dx / static_cast<double>(n);
        const double dy = *y - mean_y;
        mean_y += dy / static_cast<double>(n);
        cxy += dx * (*y - mean_y);
        m2x += dx * (*x - mean_x);
        m2y += dy * (*y - mean_y);
    }
    if (n < 2 || !(m2x > 0.0) || !(m2y > 0.0)) return std::nullopt;
    double r = cxy / std::sqrt(m2x * m2y);
    if (r > 1.0) r = 1.0;
    if (r < -1.0) r = -1.0;
    return r;
}

// Full symmetric matrix over the given numeric columns, computed once per dataset.
inline CorrelationMatrix correlation_matrix(const ColumnarTable& t,
                                            const std::vector<std::size_t>& numeric_columns,
                                            const std::vector<std::string>& names)
{
    const std::size_t k = numeric_columns.size();
    CorrelationMatrix m;
    m.columns = names;
    m.values.assign(k, std::vector<std::optional<double>>(k));

    const long long rows = static_cast<long long>(k);
    #pragma omp parallel for schedule(dynamic)
    for (long long ii = 0; ii < rows; ++ii) {
        const auto i = static_cast<std::size_t>(ii);
        for (std::size_t j = i; j < k; ++j) {
            m.values[i][j] = pearson(t.column(numeric_columns[i]), t.column(numeric_columns[j]));
        }
    }
    // mirror after the join; each task only wrote its own row
    for (std::size_t i = 0; i < k; ++i)
        for (std::size_t j = 0; j < i; ++j) m.values[i][j] = m.values[j][i];
    return m;
}

}
