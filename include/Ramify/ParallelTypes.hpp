// =================================================================
// include/Ramify/ParallelTypes.hpp
// =================================================================
// Work items and the outcomes of running them.

#pragma once

#include "Ramify/CompletionGate.hpp"
#include "Ramify/DelegationConfig.hpp"
#include "Ramify/Value.hpp"
#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace Ramify {

/**
 * @brief One unit of parallel execution
 */
struct WorkItem {
    std::string name;
    Value value;
};

/**
 * @brief Result of running a single work item
 */
struct WorkItemOutcome {
    std::string name;
    Value value;
    std::optional<ChildResult> child_result;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::exception_ptr exception;
    std::string exception_message;

    std::chrono::milliseconds getDuration() const;

    bool isSuccess() const;

    /**
     * @brief Best available failure description: exception, then child error, then "Unknown error"
     */
    std::string getErrorText() const;
};

/**
 * @brief Combined result of a parallel run
 *
 * success is true whenever at least one item succeeded.
 */
struct AggregateOutcome {
    bool success = false;
    std::optional<std::string> error_message;
    std::vector<WorkItemOutcome> outcomes;
    ResultStrategy strategy = ResultStrategy::WAIT_FOR_ALL;
    int total_count = 0;
    int completed_count = 0;
    int failed_count = 0;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;

    std::chrono::milliseconds getDuration() const;
};

} // namespace Ramify
