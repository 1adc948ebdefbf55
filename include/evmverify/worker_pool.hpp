#pragma once

/**
 * @file worker_pool.hpp
 * @brief Fixed-size thread pool with bounded concurrency
 */

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace evmverify::scheduler {

/**
 * @brief Runs queued tasks on at most N threads
 *
 * The first exception thrown by a task is rethrown from wait_idle().
 */
class WorkerPool
{
public:
    explicit WorkerPool(std::size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(std::function<void()> task);

    /// Block until the queue is empty and no task is running
    void wait_idle();

    [[nodiscard]] std::size_t size() const noexcept { return m_workers.size(); }

private:
    void worker_loop();

    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_tasks;
    std::mutex m_mutex;
    std::condition_variable m_task_cv;
    std::condition_variable m_idle_cv;
    std::size_t m_active = 0;
    bool m_stop = false;
    std::exception_ptr m_failure;
};

/**
 * @brief Invoke fn(i) for every i in [0, count) on at most @p jobs threads
 */
template <typename Fn>
void parallel_for(std::size_t count, std::size_t jobs, Fn&& fn)
{
    if (count == 0) {
        return;
    }
    WorkerPool pool(std::min(std::max<std::size_t>(jobs, 1), count));
    for (std::size_t i = 0; i < count; ++i) {
        pool.submit([&fn, i] { fn(i); });
    }
    pool.wait_idle();
}

}  // namespace evmverify::scheduler
