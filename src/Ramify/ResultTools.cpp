// =================================================================
// src/Ramify/ResultTools.cpp
// =================================================================
// Implementation of the child session result tools.

#include "Ramify/ResultTools.hpp"
#include "Ramify/Errors.hpp"
#include "Ramify/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace Ramify {

namespace {

void replaceAll(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string formatIsoTimestamp(std::chrono::system_clock::time_point timestamp) {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm utc{};
    gmtime_r(&time_t, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

// Shared rejection handling for both tools
std::string rejectCall(const ValidationReport& report, ValidationFailureCounter& failures,
                       CompletionGate& gate, const std::string& session_id, const std::string& tool_name) {
    std::string description = report.describe();

    if (failures.recordFailure(report)) {
        std::string message = "Validation failed after " + std::to_string(ValidationFailureCounter::MAX_FAILURES) +
                              " attempts: " + description;
        gate.trySetFault(std::make_exception_ptr(ValidationExhaustedError(message)));
        LOG_ERROR("ResultTools", tool_name + " exhausted its validation attempts", "Session: " + session_id);
        return "Validation failed: " + description + ". Session " + session_id +
               " will now close due to exceeded retry attempts.";
    }

    LOG_DEBUG("ResultTools", tool_name + " rejected a call: " + description);
    return "Validation failed: " + description + ".";
}

} // namespace

ReturnResultTool::ReturnResultTool(const std::string& session_id, const ToolSchema& schema,
                                   std::shared_ptr<EventSignal> signal)
    : m_session_id(session_id), m_schema(schema), m_gate(std::move(signal)) {}

std::string ReturnResultTool::setResult(const ArgumentMap& args) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_gate.isSettled()) {
        return "Result for session " + m_session_id + " was already set. This call was ignored.";
    }

    ValidationReport report = ParameterValidator::validate(m_schema.parameters, args);
    if (!report.isValid()) {
        return rejectCall(report, m_failures, m_gate, m_session_id, m_schema.name);
    }

    // Only declared parameters travel back to the parent
    nlohmann::json filtered = nlohmann::json::object();
    for (const auto& parameter : m_schema.parameters) {
        auto it = args.find(parameter.name);
        if (it == args.end()) {
            continue;
        }
        filtered[parameter.name] = it->second.isData()
            ? it->second.getData()
            : nlohmann::json(it->second.toDisplayString());
    }

    if (!m_gate.trySet(ChildResult::succeeded(filtered.dump(2)))) {
        return "Result for session " + m_session_id + " was already set. This call was ignored.";
    }

    LOG_INFO("ResultTools", "Result received", "Session: " + m_session_id);
    return "Custom result set and returned to parent session. Session " + m_session_id + " will now close.";
}

ToolFunction ReturnResultTool::toToolFunction() {
    auto self = shared_from_this();
    ToolFunction function;
    function.schema = m_schema;
    function.handler = [self](const ArgumentMap& args) {
        return makeReadyReply(self->setResult(args));
    };
    return function;
}

int ReturnResultTool::getMissingRequiredFailures() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_failures.getMissingRequiredCount();
}

int ReturnResultTool::getTypeErrorFailures() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_failures.getTypeErrorCount();
}

ErrorReportingTool::ErrorReportingTool(const std::string& session_id, const std::string& function_name,
                                       const std::string& tool_name, const ErrorReportingConfig& config,
                                       std::shared_ptr<EventSignal> signal)
    : m_session_id(session_id), m_function_name(function_name), m_config(config),
      m_gate(signal), m_signal(signal) {
    m_schema.name = tool_name;
    m_schema.description = config.tool_description;
    m_schema.parameters = config.getEffectiveParameters();
}

std::string ErrorReportingTool::reportError(const ArgumentMap& args) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_gate.isSettled()) {
        return "An error for session " + m_session_id + " was already reported. This call was ignored.";
    }

    ValidationReport report = ParameterValidator::validate(m_schema.parameters, args);
    if (!report.isValid()) {
        return rejectCall(report, m_failures, m_gate, m_session_id, m_schema.name);
    }

    std::string error_message;
    auto it = args.find("error_message");
    if (it != args.end() && !it->second.isNull()) {
        error_message = it->second.toDisplayString();
    }
    if (isBlank(error_message)) {
        error_message = "An error was reported.";
    }

    if (m_config.behavior == ErrorReportingBehavior::REPORT_ERROR) {
        std::string parent_message = buildParentMessage(m_config.custom_parent_message, m_function_name,
                                                        m_session_id, std::chrono::system_clock::now(),
                                                        error_message, m_schema.name);
        m_gate.trySet(ChildResult::failed(parent_message));
        LOG_WARNING("ResultTools", "Child reported an error: " + error_message, "Session: " + m_session_id);
        return "Error reported to parent session. Session " + m_session_id + " will now close.";
    }

    m_pause_activated.store(true);
    if (m_signal) {
        m_signal->notify();
    }
    LOG_WARNING("ResultTools", "Child reported an error and is paused: " + error_message, "Session: " + m_session_id);
    return "Error recorded. Session " + m_session_id + " is paused until a user intervenes.";
}

ToolFunction ErrorReportingTool::toToolFunction() {
    auto self = shared_from_this();
    ToolFunction function;
    function.schema = m_schema;
    function.handler = [self](const ArgumentMap& args) {
        return makeReadyReply(self->reportError(args));
    };
    return function;
}

std::string ErrorReportingTool::buildParentMessage(const std::string& tmpl, const std::string& function_name,
                                                   const std::string& session_id,
                                                   std::chrono::system_clock::time_point timestamp,
                                                   const std::string& error_message, const std::string& tool_name) {
    if (isBlank(tmpl)) {
        return isBlank(error_message) ? getDefaultParentMessage() : error_message;
    }

    std::string message = tmpl;
    replaceAll(message, "{FunctionName}", function_name);
    replaceAll(message, "{SessionId}", session_id);
    replaceAll(message, "{Timestamp}", formatIsoTimestamp(timestamp));
    replaceAll(message, "{ErrorToolName}", tool_name);
    // Last, so text inside the model's message is never treated as a placeholder
    replaceAll(message, "{ErrorMessage}", error_message);
    return isBlank(message) ? getDefaultParentMessage() : message;
}

std::string ErrorReportingTool::getDefaultParentMessage() {
    return "The child session reported an error without further details.";
}

} // namespace Ramify
