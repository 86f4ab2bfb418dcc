// =================================================================
// src/Ramify/ParallelTypes.cpp
// =================================================================
// Implementation of work item outcome helpers.

#include "Ramify/ParallelTypes.hpp"

namespace Ramify {

std::chrono::milliseconds WorkItemOutcome::getDuration() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
}

bool WorkItemOutcome::isSuccess() const {
    return child_result.has_value() && child_result->success;
}

std::string WorkItemOutcome::getErrorText() const {
    if (exception) {
        return exception_message.empty() ? "Unknown error" : exception_message;
    }
    if (child_result && child_result->error_message && !child_result->error_message->empty()) {
        return *child_result->error_message;
    }
    return "Unknown error";
}

std::chrono::milliseconds AggregateOutcome::getDuration() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
}

} // namespace Ramify
