#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <system_error>
#include <thread>
#include <vector>

namespace kiln {

/**
 * @brief Runs `task(i)` for every `i` in `[0, count)` on a bounded set of threads.
 *
 * At most `jobs` threads work at once, or one per hardware thread when `jobs`
 * is zero. The calling thread takes part, so every index is handled even when
 * no extra thread can be started. Tasks must not throw; each should write its
 * outcome into a slot of its own.
 */
template<typename Task>
void run_parallel(size_t count, Task &&task, size_t jobs = 0) {
    if (count == 0) {
        return;
    }
    if (jobs == 0) {
        jobs = std::thread::hardware_concurrency();
    }
    if (jobs == 0) {
        jobs = 1;
    }
    jobs = std::min(jobs, count);

    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
            task(i);
        }
    };

    std::vector<std::jthread> pool;
    pool.reserve(jobs - 1);
    for (size_t i = 1; i < jobs; ++i) {
        try {
            pool.emplace_back(worker);
        } catch (const std::system_error &) {
            // Out of threads: the ones already running share the rest.
            break;
        }
    }
    worker();
    pool.clear(); // Join all threads
}

} // namespace kiln
