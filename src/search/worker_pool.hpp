#pragma once

/// @file worker_pool.hpp
/// @brief Fixed-size thread pool scoped to one request; tasks return futures.

#include "core/types.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace hilal::search
{
    /// @brief Pool sizing and instrumentation.
    struct WorkerPoolConfig
    {
        usize worker_count = 4;

        /// Incremented when a worker thread starts and decremented when it exits.
        /// Lets a caller confirm that no worker outlives its request.
        std::shared_ptr<std::atomic<i32>> live_worker_gauge;
    };

    /// @brief Hardware parallelism clamped to [@p min_workers, @p max_workers].
    [[nodiscard]] usize clamped_parallelism(usize min_workers, usize max_workers);

    /// @brief Request-scoped pool of worker threads.
    ///
    /// Each submit() returns a std::future carrying the task's value or the
    /// exception it threw. The destructor drains the queue and joins every
    /// worker, so a pool never outlives the scope that created it, whether
    /// that scope completes, fails or is cancelled.
    class WorkerPool
    {
    public:
        explicit WorkerPool(const WorkerPoolConfig& config);
        ~WorkerPool();

        WorkerPool(const WorkerPool&) = delete;
        WorkerPool& operator=(const WorkerPool&) = delete;
        WorkerPool(WorkerPool&&) = delete;
        WorkerPool& operator=(WorkerPool&&) = delete;

        /// @brief Queue a callable; its result (or exception) arrives through the future.
        template <typename Function>
        [[nodiscard]] auto submit(Function&& function)
            -> std::future<std::invoke_result_t<std::decay_t<Function>>>
        {
            using return_type = std::invoke_result_t<std::decay_t<Function>>;
            auto task = std::make_shared<std::packaged_task<return_type()>>(
                std::forward<Function>(function));
            std::future<return_type> result = task->get_future();

            {
                std::lock_guard lock(m_mutex);
                m_tasks.emplace([task]() { (*task)(); });
            }
            m_condition.notify_one();
            return result;
        }

        [[nodiscard]] usize size() const { return m_workers.size(); }

    private:
        void worker_loop();

        std::vector<std::thread> m_workers;
        std::queue<std::function<void()>> m_tasks;
        std::mutex m_mutex;
        std::condition_variable m_condition;
        bool m_stopping = false;
        std::shared_ptr<std::atomic<i32>> m_live_gauge;
    };

} // namespace hilal::search
