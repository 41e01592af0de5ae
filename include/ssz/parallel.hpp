#pragma once

/// @file include/ssz/parallel.hpp
/// @brief Contiguous-slice fork/join used by the parallel batch.
///
/// Guarantees:
///   - `fn(begin, end)` is called once per non-empty slice; slices cover
///     [0, n) without overlap.
///   - Every started worker is joined before return, including when thread
///     creation itself throws.
///   - The first exception escaping a worker is rethrown on the calling
///     thread after all workers have joined.

#include <algorithm>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace ssz::core {

template <typename Fn>
void parallel_for(std::size_t n, std::size_t workers, Fn&& fn) {
    workers = std::clamp<std::size_t>(workers, 1, std::max<std::size_t>(n, 1));
    if (n == 0) {
        return;
    }

    const std::size_t chunk = (n + workers - 1) / workers;
    std::exception_ptr first_error;
    std::mutex error_mutex;

    {
        // jthread joins on destruction, so an exception from emplace_back
        // still waits for the slices already running.
        std::vector<std::jthread> pool;
        pool.reserve(workers);
        for (std::size_t begin = 0; begin < n; begin += chunk) {
            const std::size_t end = std::min(n, begin + chunk);
            pool.emplace_back([&fn, &first_error, &error_mutex, begin, end]() {
                try {
                    fn(begin, end);
                } catch (...) {
                    const std::lock_guard<std::mutex> lock{error_mutex};
                    if (!first_error) {
                        first_error = std::current_exception();
                    }
                }
            });
        }
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

} // namespace ssz::core
