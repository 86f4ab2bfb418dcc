// =================================================================
// include/Ramify/ResultTools.hpp
// =================================================================
// The return and error reporting tools registered on every child session.

#pragma once

#include "Ramify/CompletionGate.hpp"
#include "Ramify/DelegationConfig.hpp"
#include "Ramify/ParameterValidator.hpp"
#include "Ramify/ToolFunction.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace Ramify {

/**
 * @brief Tool the child calls to hand its result back to the parent
 *
 * Valid calls settle the completion gate with the declared parameters
 * serialized as indented JSON. Invalid calls are rejected with a textual
 * explanation so the model can retry; the fifth failure of the same kind
 * faults the gate with ValidationExhaustedError.
 */
class ReturnResultTool : public std::enable_shared_from_this<ReturnResultTool> {
public:
    ReturnResultTool(const std::string& session_id, const ToolSchema& schema,
                     std::shared_ptr<EventSignal> signal = nullptr);

    /**
     * @brief Handle one call from the model
     * @param args Arguments supplied by the model
     * @return Reply text shown to the model
     */
    std::string setResult(const ArgumentMap& args);

    /**
     * @brief Bind this tool into a callable ToolFunction
     */
    ToolFunction toToolFunction();

    CompletionGate& getGate() { return m_gate; }
    const CompletionGate& getGate() const { return m_gate; }
    const ToolSchema& getSchema() const { return m_schema; }
    int getMissingRequiredFailures() const;
    int getTypeErrorFailures() const;

private:
    std::string m_session_id;
    ToolSchema m_schema;
    CompletionGate m_gate;
    mutable std::mutex m_mutex;
    ValidationFailureCounter m_failures;
};

/**
 * @brief Tool the child calls to actively report that it cannot finish
 *
 * With REPORT_ERROR behavior a valid call settles the gate with a failure
 * carrying the parent-facing message. With PAUSE behavior the gate stays
 * open and the pause flag is raised instead.
 */
class ErrorReportingTool : public std::enable_shared_from_this<ErrorReportingTool> {
public:
    ErrorReportingTool(const std::string& session_id, const std::string& function_name,
                       const std::string& tool_name, const ErrorReportingConfig& config,
                       std::shared_ptr<EventSignal> signal = nullptr);

    /**
     * @brief Handle one call from the model
     * @param args Arguments supplied by the model
     * @return Reply text shown to the model
     */
    std::string reportError(const ArgumentMap& args);

    ToolFunction toToolFunction();

    CompletionGate& getGate() { return m_gate; }
    const CompletionGate& getGate() const { return m_gate; }
    const ToolSchema& getSchema() const { return m_schema; }

    /**
     * @brief Whether a valid report arrived under PAUSE behavior
     */
    bool isPauseActivated() const { return m_pause_activated.load(); }

    /**
     * @brief Build the message delivered to the parent
     *
     * Substitutes {FunctionName}, {SessionId}, {Timestamp}, {ErrorMessage}
     * and {ErrorToolName}. Without a template the child's own message is
     * passed on; the default message is used only when that is blank too.
     */
    static std::string buildParentMessage(const std::string& tmpl, const std::string& function_name,
                                          const std::string& session_id,
                                          std::chrono::system_clock::time_point timestamp,
                                          const std::string& error_message, const std::string& tool_name);

    static std::string getDefaultParentMessage();

private:
    std::string m_session_id;
    std::string m_function_name;
    ErrorReportingConfig m_config;
    ToolSchema m_schema;
    CompletionGate m_gate;
    std::shared_ptr<EventSignal> m_signal;
    std::atomic<bool> m_pause_activated{false};
    mutable std::mutex m_mutex;
    ValidationFailureCounter m_failures;
};

} // namespace Ramify
