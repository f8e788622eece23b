#ifndef WORKER_POOL_HPP
#define WORKER_POOL_HPP

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>

// Clamp a requested worker count to [1, jobs]; zero means one worker per hardware thread.
inline unsigned int resolveWorkerCount(unsigned int requested, std::size_t jobs) {
    unsigned int count = requested;
    if (count == 0) {
        count = std::max(1u, std::thread::hardware_concurrency());
    }
    if (jobs < count) {
        count = static_cast<unsigned int>(std::max<std::size_t>(1, jobs));
    }
    return count;
}

// Run job(i) for every i in [0, count) on at most `threads` workers.
// A job may only write state owned by its index; the caller aggregates once this returns.
// Jobs report failures through their result slot and must not throw.
template <typename Job>
void runBounded(std::size_t count, unsigned int threads, Job job) {
    if (count == 0) {
        return;
    }

    const unsigned int workerCount = resolveWorkerCount(threads, count);
    if (workerCount == 1) {
        for (std::size_t index = 0; index < count; ++index) {
            job(index);
        }
        return;
    }

    std::atomic<std::size_t> nextIndex{0};
    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (unsigned int i = 0; i < workerCount; ++i) {
        workers.emplace_back([&]() {
            for (;;) {
                const std::size_t index = nextIndex.fetch_add(1);
                if (index >= count) {
                    break;
                }
                job(index);
            }
        });
    }

    for (auto& worker : workers) {
        worker.join();
    }
}

#endif
