// =================================================================
// include/Ramify/DelegationConfig.hpp
// =================================================================
// Configuration of the delegation tool, its child result tools and
// parallel execution.

#pragma once

#include "Ramify/ParameterSpec.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace Ramify {

/**
 * @brief What to do when a child turn ends without calling a result tool
 */
enum class DanglingBehavior {
    URGE,           ///< Send reminder messages, then fail fatally
    REPORT_ERROR,   ///< Fail the child immediately with the configured message
    PAUSE           ///< Keep waiting for manual intervention
};

/**
 * @brief What to do when the child calls the error reporting tool
 */
enum class ErrorReportingBehavior {
    PAUSE,          ///< Keep the child alive and wait
    REPORT_ERROR    ///< Fail the child with a parent-facing message
};

/**
 * @brief How work items are derived for parallel execution
 */
enum class ParallelExecutionType {
    NONE,
    PARAMETER_BASED,
    LIST_BASED,
    EXTERNAL_LIST
};

/**
 * @brief How parallel outcomes are combined
 */
enum class ResultStrategy {
    STREAM_INDIVIDUAL,
    WAIT_FOR_ALL,
    FIRST_RESULT_WINS
};

/**
 * @brief Settings of the optional error reporting tool
 */
struct ErrorReportingConfig {
    std::string tool_description = "Report an error or issue encountered during task execution";
    std::vector<ParameterSpec> parameters;      ///< Empty means error_message + error_type
    ErrorReportingBehavior behavior = ErrorReportingBehavior::PAUSE;
    std::string custom_parent_message;          ///< Template with {FunctionName}, {SessionId}, {Timestamp}, {ErrorMessage}, {ErrorToolName}

    /**
     * @brief Configured parameters, or the defaults when none are configured
     */
    std::vector<ParameterSpec> getEffectiveParameters() const;

    static std::vector<ParameterSpec> getDefaultParameters();
};

/**
 * @brief Settings for fanning a request out to several child sessions
 */
struct ParallelConfig {
    ParallelExecutionType execution_type = ParallelExecutionType::NONE;
    int max_concurrency = static_cast<int>(std::thread::hardware_concurrency());  ///< <= 0 means CPU count
    ResultStrategy result_strategy = ResultStrategy::WAIT_FOR_ALL;
    std::string list_parameter_name;                    ///< Required for LIST_BASED
    std::vector<std::string> external_list;             ///< Required for EXTERNAL_LIST
    std::vector<std::string> excluded_parameter_names;  ///< Only used by PARAMETER_BASED
    long session_timeout_ms = 30 * 60 * 1000;           ///< Per work item
};

/**
 * @brief Assistant configured to run child sessions
 */
struct ExecutivePerson {
    std::string name;
    std::string description;
};

/**
 * @brief Complete configuration of one delegation tool
 */
struct DelegationConfig {
    std::string function_name = "create_subtask";
    std::string function_description = "Arbitrarily redefining a concept and acting on the new definition";
    int max_recursion_level = 1;
    std::vector<ParameterSpec> input_parameters;

    std::string return_tool_name = "set_result";
    std::string return_tool_description = "Report back with the result after completion";
    std::vector<ParameterSpec> return_parameters;       ///< Empty means success + message + data

    std::string prompt_message = getDefaultPromptMessage();
    std::string urging_message = getDefaultUrgingMessage();

    DanglingBehavior dangling_behavior = DanglingBehavior::URGE;
    std::string error_message;                          ///< Used by DanglingBehavior::REPORT_ERROR

    std::string error_reporting_tool_name = "report_error";
    std::optional<ErrorReportingConfig> error_reporting;
    std::optional<ParallelConfig> parallel;
    std::optional<ExecutivePerson> executive_person;

    /**
     * @brief Validate all settings
     * @throws ConfigurationError describing the first problem found
     */
    void validate() const;

    /**
     * @brief Validate the error reporting tool settings
     * @return Empty string if valid, otherwise a description of the problem
     */
    std::string validateErrorReporting() const;

    /**
     * @brief Whether requests fan out to several child sessions
     */
    bool isParallel() const;

    std::vector<ParameterSpec> getEffectiveReturnParameters() const;

    ToolSchema getDelegationToolSchema() const;
    ToolSchema getReturnToolSchema() const;

    /**
     * @brief Schema of the error reporting tool, if one is configured
     */
    std::optional<ToolSchema> getErrorToolSchema() const;

    /**
     * @brief JSON view exposed to prompt templates as _Config
     */
    nlohmann::json toJson() const;

    static std::vector<ParameterSpec> getDefaultReturnParameters();
    static std::string getDefaultPromptMessage();
    static std::string getDefaultUrgingMessage();
};

std::string danglingBehaviorToString(DanglingBehavior behavior);
std::string errorReportingBehaviorToString(ErrorReportingBehavior behavior);
std::string parallelExecutionTypeToString(ParallelExecutionType type);
std::string resultStrategyToString(ResultStrategy strategy);

/**
 * @brief Parse a dangling behavior; unknown names fall back to URGE with a warning
 */
DanglingBehavior danglingBehaviorFromString(const std::string& name);

/**
 * @throws ConfigurationError for unknown names
 */
ErrorReportingBehavior errorReportingBehaviorFromString(const std::string& name);
ParallelExecutionType parallelExecutionTypeFromString(const std::string& name);
ResultStrategy resultStrategyFromString(const std::string& name);

} // namespace Ramify
