// =================================================================
// include/Ramify/ResultFormatter.hpp
// =================================================================
// Renders child and parallel results as the text returned to the caller.

#pragma once

#include "Ramify/CompletionGate.hpp"
#include "Ramify/ParallelTypes.hpp"
#include <string>
#include <vector>

namespace Ramify {

class ResultFormatter {
public:
    /**
     * @brief "Succeeded" or "Failed: <message>" for a single child
     */
    static std::string formatChildResult(const ChildResult& result);

    /**
     * @brief Multi-line summary of a parallel run, trimmed of trailing whitespace
     */
    static std::string formatAggregate(const AggregateOutcome& outcome);

    /**
     * @brief Numbered list of successful results for WAIT_FOR_ALL
     */
    static std::string formatResultSummary(const std::vector<WorkItemOutcome>& outcomes);

    /**
     * @brief One "- [name=value]: message" line per failed outcome
     */
    static std::string formatErrors(const std::vector<WorkItemOutcome>& outcomes);
};

} // namespace Ramify
