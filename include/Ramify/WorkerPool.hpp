// =================================================================
// include/Ramify/WorkerPool.hpp
// =================================================================
// Bounded set of worker threads draining a queue of work item tasks.

#pragma once

#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace Ramify {

/**
 * @brief Runs submitted tasks on at most N threads at a time
 *
 * Tasks return nothing. A task that throws does not take its worker down:
 * the exception is handed to the failure handler and the worker moves on to
 * the next task. The destructor runs every task still queued, then joins.
 */
class WorkerPool {
public:
    using FailureHandler = std::function<void(std::exception_ptr)>;

    WorkerPool(size_t thread_count, FailureHandler on_failure);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @throws DelegationError if the pool is already shutting down
     */
    void submit(std::function<void()> task);

    size_t getThreadCount() const { return m_threads.size(); }

private:
    std::vector<std::thread> m_threads;
    std::deque<std::function<void()>> m_pending;
    FailureHandler m_on_failure;

    std::mutex m_mutex;
    std::condition_variable m_work_available;
    bool m_shutting_down = false;

    void workerLoop();
    bool takeNext(std::function<void()>& task);
};

} // namespace Ramify
