#pragma once
#include <omp.h>
#include <algorithm>
#include <cstddef>
#include <exception>
#include <vector>

namespace dsprof {

inline int resolve_workers(int requested) {
    return requested > 0 ? requested : std::max(1, omp_get_num_procs());
}

// Runs task(i) for every i in [0, n) on up to `workers` threads and joins.
// Each task's exception is captured in its own slot; nothing escapes the region.
template <typename Fn>
std::vector<std::exception_ptr> fan_out(std::size_t n, int workers, Fn&& task) {
    std::vector<std::exception_ptr> errors(n);
    const long long count = static_cast<long long>(n);
    const int threads = std::max(1, std::min<int>(workers, static_cast<int>(std::max<std::size_t>(n, 1))));
    #pragma omp parallel for schedule(dynamic) num_threads(threads)
    for (long long i = 0; i < count; ++i) {
        const auto slot = static_cast<std::size_t>(i);
        try {
            task(slot);
        } catch (...) {
            errors[slot] = std::current_exception();
        }
    }
    return errors;
}

inline void rethrow_first(const std::vector<std::exception_ptr>& errors) {
    for (const auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }
}

}
