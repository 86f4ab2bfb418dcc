// =================================================================
// src/Ramify/ResultFormatter.cpp
// =================================================================
// Implementation of result text rendering.

#include "Ramify/ResultFormatter.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace Ramify {

namespace {

std::string trimRight(std::string text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.pop_back();
    }
    return text;
}

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

} // namespace

std::string ResultFormatter::formatChildResult(const ChildResult& result) {
    if (result.success) {
        return "Succeeded";
    }
    std::string message = result.error_message.value_or("");
    if (isBlank(message)) {
        message = "Child session reported a failure.";
    }
    return "Failed: " + message;
}

std::string ResultFormatter::formatAggregate(const AggregateOutcome& outcome) {
    std::ostringstream out;
    std::string errors = formatErrors(outcome.outcomes);

    if (outcome.success) {
        const std::string counts = std::to_string(outcome.completed_count) + "/" +
                                   std::to_string(outcome.total_count);
        switch (outcome.strategy) {
            case ResultStrategy::STREAM_INDIVIDUAL:
                out << "Parallel execution completed: " << counts << " sessions streamed individually\n";
                break;
            case ResultStrategy::WAIT_FOR_ALL:
                out << "Parallel execution completed: " << counts << " sessions.\nResults:\n"
                    << formatResultSummary(outcome.outcomes) << "\nSucceeded\n";
                break;
            case ResultStrategy::FIRST_RESULT_WINS: {
                auto winner = std::find_if(outcome.outcomes.begin(), outcome.outcomes.end(),
                                           [](const WorkItemOutcome& o) { return o.isSuccess(); });
                std::string result = "No result";
                if (winner != outcome.outcomes.end() && winner->child_result->result) {
                    result = *winner->child_result->result;
                }
                out << "First result: " << result << "\n";
                break;
            }
            default:
                out << "Succeeded\n";
                break;
        }

        if (outcome.failed_count > 0 && !isBlank(errors)) {
            out << "\nErrors (" << outcome.failed_count << " failed):\n" << errors;
        }
    } else {
        std::string details = outcome.error_message.value_or("");
        if (details.empty()) {
            details = std::to_string(outcome.completed_count) + "/" + std::to_string(outcome.total_count) +
                      " completed, " + std::to_string(outcome.failed_count) + " failed";
        }
        out << "Parallel execution failed: " << details << "\n";

        if (!isBlank(errors)) {
            out << "\n" << errors;
        }
    }

    return trimRight(out.str());
}

std::string ResultFormatter::formatResultSummary(const std::vector<WorkItemOutcome>& outcomes) {
    if (outcomes.empty()) {
        return "No results";
    }

    std::vector<std::string> lines;
    for (const auto& outcome : outcomes) {
        if (outcome.isSuccess() && outcome.child_result->result && !outcome.child_result->result->empty()) {
            lines.push_back(std::to_string(lines.size() + 1) + ". " + *outcome.child_result->result);
        }
    }

    if (lines.empty()) {
        return "No successful results";
    }

    std::string summary;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            summary += "\n";
        }
        summary += lines[i];
    }
    return summary;
}

std::string ResultFormatter::formatErrors(const std::vector<WorkItemOutcome>& outcomes) {
    std::string errors;
    for (const auto& outcome : outcomes) {
        if (outcome.isSuccess()) {
            continue;
        }
        std::string label = outcome.name.empty()
            ? "[Unknown]"
            : "[" + outcome.name + "=" + outcome.value.toDisplayString() + "]";
        if (!errors.empty()) {
            errors += "\n";
        }
        errors += "- " + label + ": " + outcome.getErrorText();
    }
    return errors;
}

} // namespace Ramify
