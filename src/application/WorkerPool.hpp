/**
 * @file WorkerPool.hpp
 * @brief Bounded pool that spreads indexed jobs over a fixed number of threads.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace tariffharvest::application {

/**
 * @class WorkerPool
 * @brief Runs job(i) for i in [0, count) on at most `workers` threads and joins them.
 *
 * Workers take indices in ascending order. A raised stop flag is observed
 * before an index is taken, never while a job runs. The first exception that
 * escapes a job is rethrown from forEachIndex after every worker has finished.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t workers) : m_workers(std::max<size_t>(1, workers)) {}

    size_t workers() const { return m_workers; }

    /** @return Number of indices that were started. */
    template <typename Job>
    size_t forEachIndex(size_t count, Job&& job, const std::atomic<bool>* stopFlag = nullptr) {
        std::atomic<size_t> next{0};
        std::atomic<size_t> started{0};
        std::exception_ptr firstError;
        std::mutex errorMutex;

        auto worker = [&]() {
            while (true) {
                if (stopFlag && stopFlag->load()) return;
                size_t index = next.fetch_add(1);
                if (index >= count) return;
                ++started;
                try {
                    job(index);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(errorMutex);
                    if (!firstError) firstError = std::current_exception();
                }
            }
        };

        size_t threadCount = std::min(m_workers, count);
        if (threadCount <= 1) {
            worker();
        } else {
            std::vector<std::thread> threads;
            threads.reserve(threadCount);
            for (size_t i = 0; i < threadCount; ++i) {
                threads.emplace_back(worker);
            }
            for (auto& t : threads) {
                if (t.joinable()) t.join();
            }
        }

        if (firstError) std::rethrow_exception(firstError);
        return started.load();
    }

private:
    size_t m_workers;
};

} // namespace tariffharvest::application
