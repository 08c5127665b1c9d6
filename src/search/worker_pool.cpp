/// @file worker_pool.cpp
/// @brief Worker thread lifecycle.

#include "search/worker_pool.hpp"

#include "core/logger.hpp"

#include <algorithm>

namespace hilal::search
{

usize clamped_parallelism(usize min_workers, usize max_workers)
{
    // hardware_concurrency() may report 0 when unknown
    const usize hardware = std::thread::hardware_concurrency();
    return std::clamp(hardware, min_workers, std::max(min_workers, max_workers));
}

WorkerPool::WorkerPool(const WorkerPoolConfig& config)
    : m_live_gauge(config.live_worker_gauge)
{
    const usize count = std::max<usize>(config.worker_count, 1);
    m_workers.reserve(count);
    for (usize i = 0; i < count; ++i)
    {
        if (m_live_gauge)
        {
            m_live_gauge->fetch_add(1);
        }
        m_workers.emplace_back(&WorkerPool::worker_loop, this);
    }

    HLL_CORE_DEBUG("Worker pool started with {} threads", count);
}

WorkerPool::~WorkerPool()
{
    {
        std::lock_guard lock(m_mutex);
        m_stopping = true;
    }
    m_condition.notify_all();

    for (auto& worker : m_workers)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }

    HLL_CORE_DEBUG("Worker pool stopped ({} threads joined)", m_workers.size());
}

void WorkerPool::worker_loop()
{
    while (true)
    {
        std::function<void()> task;
        {
            std::unique_lock lock(m_mutex);
            m_condition.wait(lock, [this] { return m_stopping || !m_tasks.empty(); });
            if (m_stopping && m_tasks.empty())
            {
                break;
            }
            task = std::move(m_tasks.front());
            m_tasks.pop();
        }

        // packaged_task stores any exception in its future
        task();
    }

    if (m_live_gauge)
    {
        m_live_gauge->fetch_sub(1);
    }
}

} // namespace hilal::search
