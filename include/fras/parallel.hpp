#pragma once

/// @file include/fras/parallel.hpp
/// @brief Contiguous-chunk fan-out over std::jthread workers.
///
/// # Module: Parallel
///
/// ## Responsibility
/// Split [0, n) into at most `workers` contiguous chunks and run each on its
/// own thread. Used by pipeline scoring and by per-batch gradient
/// accumulation.
///
/// ## Guarantees
/// - Every index in [0, n) is visited exactly once
/// - Chunk boundaries depend only on (n, workers), never on scheduling
/// - A chunk whose thread cannot be started (`std::system_error`) runs on the
///   calling thread, with its own chunk index, after the started ones join
/// - Never throws `std::system_error` from thread creation

#include <algorithm>
#include <cstddef>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace fras {

/// Starts each chunk on a fresh std::jthread.
struct JthreadSpawner {
    template <typename F>
    std::jthread operator()(F&& f) const {
        return std::jthread(std::forward<F>(f));
    }
};

/// Run `body(chunk, begin, end)` for each contiguous chunk of [0, n).
///
/// With `workers` ≤ 1 (or n ≤ 1) the whole range is one chunk run inline.
/// Returns the number of threads actually started.
template <typename Body, typename Spawn = JthreadSpawner>
std::size_t for_each_chunk(std::size_t n, std::size_t workers, Body&& body,
                           Spawn spawn = {}) {
    workers = std::min(workers, n);
    if (workers <= 1) {
        if (n > 0) body(std::size_t{0}, std::size_t{0}, n);
        return 0;
    }

    const std::size_t chunk = (n + workers - 1) / workers;
    std::size_t started = 0;
    {
        std::vector<std::jthread> pool;
        pool.reserve(workers);
        for (std::size_t w = 0; w < workers; ++w) {
            const std::size_t begin = w * chunk;
            const std::size_t end   = std::min(n, begin + chunk);
            if (begin >= end) break;
            try {
                pool.push_back(spawn([&body, w, begin, end] { body(w, begin, end); }));
            } catch (const std::system_error&) {
                break;
            }
            ++started;
        }
    }

    for (std::size_t w = started; w < workers; ++w) {
        const std::size_t begin = w * chunk;
        const std::size_t end   = std::min(n, begin + chunk);
        if (begin >= end) break;
        body(w, begin, end);
    }
    return started;
}

} // namespace fras
