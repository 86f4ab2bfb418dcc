// =================================================================
// src/Ramify/DelegationConfig.cpp
// =================================================================
// Implementation of delegation configuration defaults and validation.

#include "Ramify/DelegationConfig.hpp"
#include "Ramify/Errors.hpp"
#include "Ramify/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace Ramify {

namespace {

std::string toLower(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower;
}

// Lowercase and drop separators so "ReportError", "report_error" and "report-error" match
std::string normalizeEnumName(const std::string& name) {
    std::string normalized;
    for (unsigned char c : name) {
        if (c == '_' || c == '-' || c == ' ') {
            continue;
        }
        normalized.push_back(static_cast<char>(std::tolower(c)));
    }
    return normalized;
}

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

nlohmann::json parametersToJson(const std::vector<ParameterSpec>& parameters) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& parameter : parameters) {
        nlohmann::json entry;
        entry["name"] = parameter.name;
        entry["description"] = parameter.description;
        entry["type"] = parameterTypeToString(parameter.type);
        entry["required"] = parameter.required;
        list.push_back(entry);
    }
    return list;
}

} // namespace

std::vector<ParameterSpec> ErrorReportingConfig::getEffectiveParameters() const {
    return parameters.empty() ? getDefaultParameters() : parameters;
}

std::vector<ParameterSpec> ErrorReportingConfig::getDefaultParameters() {
    return {
        ParameterSpec::make("error_message", ParameterType::STRING, "Human readable description of the issue", true),
        ParameterSpec::make("error_type", ParameterType::STRING, "Optional classification or category for the error", false)
    };
}

void DelegationConfig::validate() const {
    if (max_recursion_level < 0) {
        throw ConfigurationError("max_recursion_level must not be negative (got " +
                                 std::to_string(max_recursion_level) + ")");
    }
    if (isBlank(function_name)) {
        throw ConfigurationError("function_name cannot be empty");
    }
    if (isBlank(return_tool_name)) {
        throw ConfigurationError("return_tool_name cannot be empty");
    }
    if (dangling_behavior == DanglingBehavior::URGE && isBlank(urging_message)) {
        throw ConfigurationError("urging_message cannot be empty when dangling_behavior is urge");
    }

    std::string error_reporting_problem = validateErrorReporting();
    if (!error_reporting_problem.empty()) {
        throw ConfigurationError(error_reporting_problem);
    }

    if (parallel) {
        if (parallel->execution_type == ParallelExecutionType::LIST_BASED &&
            isBlank(parallel->list_parameter_name)) {
            throw ConfigurationError("list_parameter_name is required for list_based parallel execution");
        }
        if (parallel->execution_type == ParallelExecutionType::EXTERNAL_LIST &&
            parallel->external_list.empty()) {
            throw ConfigurationError("external_list cannot be empty for external_list parallel execution");
        }
        if (parallel->session_timeout_ms <= 0) {
            throw ConfigurationError("session_timeout_ms must be greater than 0");
        }
    }
}

std::string DelegationConfig::validateErrorReporting() const {
    if (!error_reporting) {
        return "";
    }

    if (isBlank(error_reporting_tool_name)) {
        return "Error reporting tool name is required when error reporting is enabled";
    }

    if (toLower(error_reporting_tool_name) == toLower(return_tool_name)) {
        return "Error reporting tool name '" + error_reporting_tool_name +
               "' conflicts with the return tool name";
    }

    std::set<std::string> seen;
    std::vector<std::string> duplicates;
    for (const auto& parameter : error_reporting->parameters) {
        if (isBlank(parameter.name)) {
            return "Error reporting tool parameters must have non-empty names";
        }
        std::string key = toLower(parameter.name);
        if (!seen.insert(key).second &&
            std::find(duplicates.begin(), duplicates.end(), parameter.name) == duplicates.end()) {
            duplicates.push_back(parameter.name);
        }
    }

    if (!duplicates.empty()) {
        std::string names;
        for (size_t i = 0; i < duplicates.size(); ++i) {
            if (i > 0) names += ", ";
            names += duplicates[i];
        }
        return "Error reporting tool has duplicate parameter names: " + names;
    }

    return "";
}

bool DelegationConfig::isParallel() const {
    return parallel && parallel->execution_type != ParallelExecutionType::NONE;
}

std::vector<ParameterSpec> DelegationConfig::getEffectiveReturnParameters() const {
    return return_parameters.empty() ? getDefaultReturnParameters() : return_parameters;
}

ToolSchema DelegationConfig::getDelegationToolSchema() const {
    ToolSchema schema;
    schema.name = function_name;
    schema.description = function_description;
    schema.parameters = input_parameters;
    return schema;
}

ToolSchema DelegationConfig::getReturnToolSchema() const {
    ToolSchema schema;
    schema.name = return_tool_name;
    schema.description = return_tool_description;
    schema.parameters = getEffectiveReturnParameters();
    return schema;
}

std::optional<ToolSchema> DelegationConfig::getErrorToolSchema() const {
    if (!error_reporting) {
        return std::nullopt;
    }

    ToolSchema schema;
    schema.name = error_reporting_tool_name;
    schema.description = error_reporting->tool_description;
    schema.parameters = error_reporting->getEffectiveParameters();
    return schema;
}

nlohmann::json DelegationConfig::toJson() const {
    nlohmann::json view;
    view["function_name"] = function_name;
    view["function_description"] = function_description;
    view["max_recursion_level"] = max_recursion_level;
    view["input_parameters"] = parametersToJson(input_parameters);
    view["return_tool_name"] = return_tool_name;
    view["return_tool_description"] = return_tool_description;
    view["return_parameters"] = parametersToJson(getEffectiveReturnParameters());
    view["dangling_behavior"] = danglingBehaviorToString(dangling_behavior);
    view["error_message"] = error_message;
    view["error_reporting_tool_name"] = error_reporting_tool_name;

    if (error_reporting) {
        nlohmann::json reporting;
        reporting["tool_description"] = error_reporting->tool_description;
        reporting["parameters"] = parametersToJson(error_reporting->getEffectiveParameters());
        reporting["behavior"] = errorReportingBehaviorToString(error_reporting->behavior);
        reporting["custom_parent_message"] = error_reporting->custom_parent_message;
        view["error_reporting"] = reporting;
    } else {
        view["error_reporting"] = nullptr;
    }

    if (parallel) {
        nlohmann::json parallel_view;
        parallel_view["execution_type"] = parallelExecutionTypeToString(parallel->execution_type);
        parallel_view["max_concurrency"] = parallel->max_concurrency;
        parallel_view["result_strategy"] = resultStrategyToString(parallel->result_strategy);
        parallel_view["list_parameter_name"] = parallel->list_parameter_name;
        parallel_view["external_list"] = parallel->external_list;
        parallel_view["excluded_parameter_names"] = parallel->excluded_parameter_names;
        parallel_view["session_timeout_ms"] = parallel->session_timeout_ms;
        view["parallel"] = parallel_view;
    } else {
        view["parallel"] = nullptr;
    }

    if (executive_person) {
        view["executive_person"] = {
            {"name", executive_person->name},
            {"description", executive_person->description}
        };
    } else {
        view["executive_person"] = nullptr;
    }

    return view;
}

std::vector<ParameterSpec> DelegationConfig::getDefaultReturnParameters() {
    return {
        ParameterSpec::make("success", ParameterType::BOOL, "Whether the operation completed successfully", true),
        ParameterSpec::make("message", ParameterType::STRING, "A message describing the result or any errors", false),
        ParameterSpec::make("data", ParameterType::STRING, "Any additional data from the operation", false)
    };
}

std::string DelegationConfig::getDefaultPromptMessage() {
    return "Complete the delegated task described by the request parameters. "
           "When you are done, report the outcome by calling the {{ _Config.return_tool_name }} tool.";
}

std::string DelegationConfig::getDefaultUrgingMessage() {
    return "Please finalize the task now and report the outcome by calling the "
           "{{ _Config.return_tool_name }} tool.";
}

std::string danglingBehaviorToString(DanglingBehavior behavior) {
    switch (behavior) {
        case DanglingBehavior::URGE: return "urge";
        case DanglingBehavior::REPORT_ERROR: return "report_error";
        case DanglingBehavior::PAUSE: return "pause";
        default: return "unknown";
    }
}

std::string errorReportingBehaviorToString(ErrorReportingBehavior behavior) {
    switch (behavior) {
        case ErrorReportingBehavior::PAUSE: return "pause";
        case ErrorReportingBehavior::REPORT_ERROR: return "report_error";
        default: return "unknown";
    }
}

std::string parallelExecutionTypeToString(ParallelExecutionType type) {
    switch (type) {
        case ParallelExecutionType::NONE: return "none";
        case ParallelExecutionType::PARAMETER_BASED: return "parameter_based";
        case ParallelExecutionType::LIST_BASED: return "list_based";
        case ParallelExecutionType::EXTERNAL_LIST: return "external_list";
        default: return "unknown";
    }
}

std::string resultStrategyToString(ResultStrategy strategy) {
    switch (strategy) {
        case ResultStrategy::STREAM_INDIVIDUAL: return "stream_individual";
        case ResultStrategy::WAIT_FOR_ALL: return "wait_for_all";
        case ResultStrategy::FIRST_RESULT_WINS: return "first_result_wins";
        default: return "unknown";
    }
}

DanglingBehavior danglingBehaviorFromString(const std::string& name) {
    std::string normalized = normalizeEnumName(name);
    if (normalized == "urge") return DanglingBehavior::URGE;
    if (normalized == "reporterror") return DanglingBehavior::REPORT_ERROR;
    if (normalized == "pause") return DanglingBehavior::PAUSE;

    LOG_WARNING("DelegationConfig", "Unknown dangling behavior '" + name + "', falling back to urge");
    return DanglingBehavior::URGE;
}

ErrorReportingBehavior errorReportingBehaviorFromString(const std::string& name) {
    std::string normalized = normalizeEnumName(name);
    if (normalized == "pause") return ErrorReportingBehavior::PAUSE;
    if (normalized == "reporterror") return ErrorReportingBehavior::REPORT_ERROR;
    throw ConfigurationError("Unknown error reporting behavior: " + name);
}

ParallelExecutionType parallelExecutionTypeFromString(const std::string& name) {
    std::string normalized = normalizeEnumName(name);
    if (normalized == "none") return ParallelExecutionType::NONE;
    if (normalized == "parameterbased") return ParallelExecutionType::PARAMETER_BASED;
    if (normalized == "listbased") return ParallelExecutionType::LIST_BASED;
    if (normalized == "externallist") return ParallelExecutionType::EXTERNAL_LIST;
    throw ConfigurationError("Unknown parallel execution type: " + name);
}

ResultStrategy resultStrategyFromString(const std::string& name) {
    std::string normalized = normalizeEnumName(name);
    if (normalized == "streamindividual") return ResultStrategy::STREAM_INDIVIDUAL;
    if (normalized == "waitforall") return ResultStrategy::WAIT_FOR_ALL;
    if (normalized == "firstresultwins") return ResultStrategy::FIRST_RESULT_WINS;
    throw ConfigurationError("Unknown result strategy: " + name);
}

} // namespace Ramify
