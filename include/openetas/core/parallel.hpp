#pragma once

#include <algorithm>
#include <cstddef>
#include <exception>
#include <thread>
#include <vector>

namespace openetas {

// Worker count for a requested value (0 = hardware concurrency)
inline int resolveThreadCount(int requested, size_t work_items) {
    int n = requested > 0 ? requested
                          : static_cast<int>(std::thread::hardware_concurrency());
    n = std::max(1, n);
    if (work_items < static_cast<size_t>(n)) n = std::max<int>(1, static_cast<int>(work_items));
    return n;
}

/**
 * Run fn(begin, end, worker) over contiguous slices of [0, count)
 *
 * Each worker owns one slice, so results written by index need no
 * locking. The first exception thrown by a worker is rethrown on the
 * calling thread after all workers have joined.
 */
template <typename Fn>
void parallelFor(size_t count, int n_threads, Fn fn) {
    if (count == 0) return;

    const int workers = resolveThreadCount(n_threads, count);
    if (workers == 1) {
        fn(size_t(0), count, 0);
        return;
    }

    std::vector<std::thread> threads;
    std::vector<std::exception_ptr> errors(workers);
    const size_t chunk = (count + workers - 1) / workers;

    for (int w = 0; w < workers; w++) {
        size_t begin = static_cast<size_t>(w) * chunk;
        size_t end = std::min(count, begin + chunk);
        if (begin >= end) break;
        threads.emplace_back([&fn, &errors, begin, end, w]() {
            try {
                fn(begin, end, w);
            } catch (...) {
                errors[w] = std::current_exception();
            }
        });
    }

    for (auto& t : threads) t.join();

    for (const auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }
}

} // namespace openetas
