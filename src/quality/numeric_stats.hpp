#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "../config/profiler_config.hpp"
#include "../core/profile.hpp"

namespace dsprof {

struct numeric_stats {
    std::size_t non_null_count{0};
    double min{0.0}, max{0.0};
    double mean{0.0}, m2{0.0}; // Welford
    std::vector<double> sample; // every value; median and outliers need them all

    void add(double x) {
        ++non_null_count;
        if (non_null_count == 1) { min = max = x; mean = x; m2 = 0.0; }
        else {
            if (x < min) min = x;
            if (x > max) max = x;
            double delta = x - mean;
            mean += delta / static_cast<double>(non_null_count);
            m2 += delta * (x - mean);
        }
        sample.push_back(x);
    }
    double variance() const { return non_null_count > 1 ? m2 / static_cast<double>(non_null_count - 1) : 0.0; }
    double stddev() const { return std::sqrt(variance()); }
    double population_stddev() const {
        return non_null_count > 0 ? std::sqrt(m2 / static_cast<double>(non_null_count)) : 0.0;
    }

    // Linear interpolation between closest ranks.
    double quantile(double q) const {
        if (sample.empty()) return 0.0;
        auto v = sample;
        const double pos = q * static_cast<double>(v.size() - 1);
        const auto i = static_cast<std::size_t>(pos);
        const double frac = pos - static_cast<double>(i);
        std::nth_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(i), v.end());
        const double lo = v[i];
        if (frac == 0.0 || i + 1 >= v.size()) return lo;
        const double hi = *std::min_element(v.begin() + static_cast<std::ptrdiff_t>(i) + 1, v.end());
        return lo * (1.0 - frac) + hi * frac;
    }
    double median() const { return quantile(0.5); }

    NumericSummary summary() const { return NumericSummary{min, max, mean, median(), stddev(), std::nullopt}; }

    // Values whose |z| exceeds `threshold`.
    // robust: modified z = 0.6745 * (x - median) / MAD, with 1.253314 * mean absolute
    // deviation standing in when MAD is 0; no spread at all means no outliers.
    // standard: (x - mean) / population std.
    std::size_t count_outliers(outlier_method method, double threshold) const {
        if (non_null_count < 2) return 0;
        std::size_t n = 0;
        if (method == outlier_method::standard) {
            const double sd = population_stddev();
            if (!(sd > 0.0)) return 0;
            for (double x : sample) n += std::fabs((x - mean) / sd) > threshold ? 1 : 0;
            return n;
        }

        const double med = median();
        std::vector<double> dev;
        dev.reserve(sample.size());
        for (double x : sample) dev.push_back(std::fabs(x - med));
        const auto mid = dev.begin() + static_cast<std::ptrdiff_t>(dev.size() / 2);
        std::nth_element(dev.begin(), mid, dev.end());
        double mad = *mid;
        if (dev.size() % 2 == 0) mad = (mad + *std::max_element(dev.begin(), mid)) / 2.0;

        double scale = 0.0;
        if (mad > 0.0) {
            scale = mad / 0.6745;
        } else {
            double sum = 0.0;
            for (double x : sample) sum += std::fabs(x - med);
            scale = 1.253314 * (sum / static_cast<double>(sample.size()));
        }
        if (!(scale > 0.0)) return 0;
        for (double x : sample) n += std::fabs(x - med) / scale > threshold ? 1 : 0;
        return n;
    }
};

// Frequencies of stringified non-null values, remembering first-seen order.
struct value_counter {
    std::unordered_map<std::string, std::size_t> index;
    std::vector<ValueCount> entries; // first-seen order

    void add(const std::string& s) {
        auto it = index.find(s);
        if (it == index.end()) {
            index.emplace(s, entries.size());
            entries.push_back(ValueCount{s, 1});
        } else {
            ++entries[it->second].count;
        }
    }
    std::size_t distinct() const { return entries.size(); }

    // Count descending, ties by first appearance.
    std::vector<ValueCount> top(std::size_t k) const {
        std::vector<ValueCount> out = entries;
        std::stable_sort(out.begin(), out.end(),
                         [](const ValueCount& a, const ValueCount& b) { return a.count > b.count; });
        if (out.size() > k) out.resize(k);
        return out;
    }

    std::vector<std::string> values() const {
        std::vector<std::string> out;
        out.reserve(entries.size());
        for (const auto& e : entries) out.push_back(e.value);
        return out;
    }
};

}
