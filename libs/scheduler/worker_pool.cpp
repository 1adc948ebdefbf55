/**
 * @file worker_pool.cpp
 * @brief WorkerPool implementation
 */

#include "evmverify/worker_pool.hpp"

#include <algorithm>
#include <utility>

namespace evmverify::scheduler {

WorkerPool::WorkerPool(std::size_t threads)
{
    const std::size_t count = std::max<std::size_t>(threads, 1);
    m_workers.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        m_workers.emplace_back([this] { worker_loop(); });
    }
}

WorkerPool::~WorkerPool()
{
    {
        std::lock_guard lock(m_mutex);
        m_stop = true;
    }
    m_task_cv.notify_all();
    for (auto& worker : m_workers) {
        worker.join();
    }
}

void WorkerPool::submit(std::function<void()> task)
{
    {
        std::lock_guard lock(m_mutex);
        m_tasks.push(std::move(task));
    }
    m_task_cv.notify_one();
}

void WorkerPool::wait_idle()
{
    std::unique_lock lock(m_mutex);
    m_idle_cv.wait(lock, [this] { return m_tasks.empty() && m_active == 0; });
    if (m_failure) {
        std::rethrow_exception(std::exchange(m_failure, nullptr));
    }
}

void WorkerPool::worker_loop()
{
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock lock(m_mutex);
            m_task_cv.wait(lock, [this] { return m_stop || !m_tasks.empty(); });
            if (m_stop && m_tasks.empty()) {
                return;
            }
            task = std::move(m_tasks.front());
            m_tasks.pop();
            ++m_active;
        }
        std::exception_ptr failure;
        try {
            task();
        } catch (...) {
            failure = std::current_exception();
        }
        {
            std::lock_guard lock(m_mutex);
            --m_active;
            if (failure && !m_failure) {
                m_failure = failure;
            }
        }
        m_idle_cv.notify_all();
    }
}

}  // namespace evmverify::scheduler
