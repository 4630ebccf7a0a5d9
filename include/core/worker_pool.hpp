// SPDX-License-Identifier: MIT
/**
 * @file worker_pool.hpp
 * @brief Small fixed-size thread pool for per-item enrichment work.
 */

#ifndef TRACKER_CORE_WORKER_POOL_HPP
#define TRACKER_CORE_WORKER_POOL_HPP

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace tracker
{
    /**
     * @struct TaskOutcome
     * @brief Result of one item processed by the pool.
     */
    template <typename T>
    struct TaskOutcome
    {
        bool success = false;
        std::string message; ///< Exception text when success is false
        T value{};
    };

    /**
     * @class WorkerPool
     * @brief Runs a function over a list of items on a bounded number of threads.
     *
     * Each item writes only its own output slot, so results are merged after
     * every worker has joined. An exception thrown for one item is recorded in
     * that item's outcome and does not stop the other items.
     */
    class WorkerPool
    {
    public:
        explicit WorkerPool(size_t workers) : workers_(workers)
        {
            if (workers_ == 0)
            {
                throw std::invalid_argument("Expected positive value for parameter 'workers', got: 0");
            }
        }

        size_t size() const { return workers_; }

        template <typename In, typename Fn>
        auto map(const std::vector<In> &items, Fn fn) const
            -> std::vector<TaskOutcome<decltype(fn(items.front()))>>
        {
            using Out = decltype(fn(items.front()));
            std::vector<TaskOutcome<Out>> outcomes(items.size());
            if (items.empty())
            {
                return outcomes;
            }

            std::atomic<size_t> next{0};
            auto run = [&]()
            {
                for (size_t i = next.fetch_add(1); i < items.size(); i = next.fetch_add(1))
                {
                    try
                    {
                        outcomes[i].value = fn(items[i]);
                        outcomes[i].success = true;
                    }
                    catch (const std::exception &e)
                    {
                        outcomes[i].success = false;
                        outcomes[i].message = e.what();
                    }
                }
            };

            const size_t count = std::min(workers_, items.size());
            std::vector<std::thread> threads;
            threads.reserve(count);
            for (size_t t = 0; t < count; ++t)
            {
                threads.emplace_back(run);
            }
            for (auto &thread : threads)
            {
                thread.join();
            }
            return outcomes;
        }

    private:
        size_t workers_;
    };

} // namespace tracker

#endif // TRACKER_CORE_WORKER_POOL_HPP
