// =================================================================
// src/Ramify/WorkerPool.cpp
// =================================================================
// Implementation of the bounded worker pool.

#include "Ramify/WorkerPool.hpp"
#include "Ramify/Errors.hpp"
#include <utility>

namespace Ramify {

WorkerPool::WorkerPool(size_t thread_count, FailureHandler on_failure)
    : m_on_failure(std::move(on_failure)) {
    if (!m_on_failure) {
        throw DelegationError("WorkerPool requires a failure handler");
    }

    size_t count = thread_count == 0 ? 1 : thread_count;
    m_threads.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        m_threads.emplace_back(&WorkerPool::workerLoop, this);
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shutting_down = true;
    }
    m_work_available.notify_all();

    for (auto& thread : m_threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void WorkerPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutting_down) {
            throw DelegationError("Cannot submit work to a worker pool that is shutting down");
        }
        m_pending.push_back(std::move(task));
    }
    m_work_available.notify_one();
}

bool WorkerPool::takeNext(std::function<void()>& task) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_work_available.wait(lock, [this]() { return m_shutting_down || !m_pending.empty(); });

    if (m_pending.empty()) {
        return false;
    }
    task = std::move(m_pending.front());
    m_pending.pop_front();
    return true;
}

void WorkerPool::workerLoop() {
    std::function<void()> task;
    while (takeNext(task)) {
        try {
            task();
        } catch (...) {
            // The owner decides what a failed task means
            m_on_failure(std::current_exception());
        }
        task = nullptr;
    }
}

} // namespace Ramify
