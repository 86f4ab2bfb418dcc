// =================================================================
// include/Ramify/ParallelOrchestrator.hpp
// =================================================================
// Fans work items out to child coordinators under a bounded worker pool
// and folds their results into one AggregateOutcome.

#pragma once

#include "Ramify/Cancellation.hpp"
#include "Ramify/DelegationConfig.hpp"
#include "Ramify/Host.hpp"
#include "Ramify/ParallelTypes.hpp"
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Ramify {

/**
 * @brief Runs one work item to a ChildResult, observing the given token
 *
 * In production this creates a child session and drives a
 * ChildSessionCoordinator; tests substitute plain functions.
 */
using WorkItemRunner = std::function<ChildResult(const WorkItem&, const CancellationToken&)>;

/**
 * @brief Wait group for fire-and-forget notification tasks
 */
class NotificationGroup {
public:
    NotificationGroup() = default;
    ~NotificationGroup();

    NotificationGroup(const NotificationGroup&) = delete;
    NotificationGroup& operator=(const NotificationGroup&) = delete;

    /**
     * @brief Start a tracked task; exceptions it throws are logged
     */
    void spawn(std::function<void()> task);

    /**
     * @brief Block until every spawned task has finished
     */
    void wait();

    size_t getSpawnedCount() const;

private:
    mutable std::mutex m_mutex;
    std::vector<std::future<void>> m_tasks;
};

/**
 * @brief Parallel execution engine for delegation requests
 *
 * Supports three result strategies:
 * - WAIT_FOR_ALL collects every outcome
 * - STREAM_INDIVIDUAL additionally notifies the parent session per outcome
 * - FIRST_RESULT_WINS returns at the first success and cancels the rest
 *
 * Each work item runs under its own cancellation source linked to the
 * caller's token and bounded by the configured session timeout.
 */
class ParallelOrchestrator {
public:
    /**
     * @brief Constructor
     * @param config Parallel settings
     * @param parent_session Session that receives streamed notifications
     */
    explicit ParallelOrchestrator(const ParallelConfig& config,
                                  std::shared_ptr<HostSession> parent_session = nullptr);

    /**
     * @brief Run all work items
     * @param sources Work items, in the order outcomes are reported
     * @param runner Function executing a single item
     * @param token Caller cancellation
     * @return Aggregate of the individual outcomes
     * @throws ConfigurationError for an empty source list or unsupported strategy
     * @throws DanglingExhaustedError if any item exhausted its reminders
     * @throws OperationCancelledError if the caller cancelled the run
     */
    AggregateOutcome run(const std::vector<WorkItem>& sources, const WorkItemRunner& runner,
                         const CancellationToken& token = CancellationToken());

    /**
     * @brief Number of items allowed to run at once
     * @param configured Configured limit; values <= 0 select the CPU count
     * @param source_count Number of work items
     */
    static int effectiveConcurrency(int configured, size_t source_count);

    /**
     * @brief Text streamed to the parent session for one outcome
     */
    static std::string formatNotification(const WorkItemOutcome& outcome);

    const ParallelConfig& getConfig() const { return m_config; }

private:
    ParallelConfig m_config;
    std::shared_ptr<HostSession> m_parent_session;

    void notifyParent(NotificationGroup& group, const WorkItemOutcome& outcome);
};

} // namespace Ramify
