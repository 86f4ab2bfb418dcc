// =================================================================
// src/Ramify/DelegationConfigLoader.cpp
// =================================================================
// Implementation of YAML configuration loading.

#include "Ramify/DelegationConfigLoader.hpp"
#include "Ramify/Errors.hpp"
#include "Ramify/Logger.hpp"
#include <yaml-cpp/yaml.h>

namespace Ramify {

DelegationConfig DelegationConfigLoader::loadFromFile(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Failed to load configuration file " + path + ": " + e.what());
    }

    DelegationConfig config = parse(root);
    LOG_INFO("DelegationConfigLoader", "Loaded configuration " + config.function_name, "File: " + path);
    return config;
}

DelegationConfig DelegationConfigLoader::loadFromString(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("Failed to parse configuration: ") + e.what());
    }
    return parse(root);
}

DelegationConfig DelegationConfigLoader::parse(const YAML::Node& root) {
    if (!root.IsMap()) {
        throw ConfigurationError("Configuration root must be a mapping");
    }

    DelegationConfig config;

    try {
        if (root["function_name"]) {
            config.function_name = root["function_name"].as<std::string>();
        }
        if (root["function_description"]) {
            config.function_description = root["function_description"].as<std::string>();
        }
        if (root["max_recursion_level"]) {
            config.max_recursion_level = root["max_recursion_level"].as<int>();
        }
        config.input_parameters = parseParameters(root, "input_parameters");

        if (root["return_tool_name"]) {
            config.return_tool_name = root["return_tool_name"].as<std::string>();
        }
        if (root["return_tool_description"]) {
            config.return_tool_description = root["return_tool_description"].as<std::string>();
        }
        config.return_parameters = parseParameters(root, "return_parameters");

        if (root["prompt_message"]) {
            config.prompt_message = root["prompt_message"].as<std::string>();
        }
        if (root["urging_message"]) {
            config.urging_message = root["urging_message"].as<std::string>();
        }
        if (root["dangling_behavior"]) {
            config.dangling_behavior = danglingBehaviorFromString(root["dangling_behavior"].as<std::string>());
        }
        if (root["error_message"]) {
            config.error_message = root["error_message"].as<std::string>();
        }
        if (root["error_reporting_tool_name"]) {
            config.error_reporting_tool_name = root["error_reporting_tool_name"].as<std::string>();
        }

        // Error reporting
        if (root["error_reporting"] && !root["error_reporting"].IsNull()) {
            YAML::Node node = root["error_reporting"];
            ErrorReportingConfig reporting;
            if (node["tool_description"]) {
                reporting.tool_description = node["tool_description"].as<std::string>();
            }
            reporting.parameters = parseParameters(node, "parameters");
            if (node["behavior"]) {
                reporting.behavior = errorReportingBehaviorFromString(node["behavior"].as<std::string>());
            }
            if (node["custom_parent_message"]) {
                reporting.custom_parent_message = node["custom_parent_message"].as<std::string>();
            }
            config.error_reporting = reporting;
        }

        // Parallel execution
        if (root["parallel"] && !root["parallel"].IsNull()) {
            YAML::Node node = root["parallel"];
            ParallelConfig parallel;
            if (node["execution_type"]) {
                parallel.execution_type = parallelExecutionTypeFromString(node["execution_type"].as<std::string>());
            }
            if (node["max_concurrency"]) {
                parallel.max_concurrency = node["max_concurrency"].as<int>();
            }
            if (node["result_strategy"]) {
                parallel.result_strategy = resultStrategyFromString(node["result_strategy"].as<std::string>());
            }
            if (node["list_parameter_name"]) {
                parallel.list_parameter_name = node["list_parameter_name"].as<std::string>();
            }
            if (node["external_list"]) {
                for (const auto& entry : node["external_list"]) {
                    parallel.external_list.push_back(entry.as<std::string>());
                }
            }
            if (node["excluded_parameter_names"]) {
                for (const auto& entry : node["excluded_parameter_names"]) {
                    parallel.excluded_parameter_names.push_back(entry.as<std::string>());
                }
            }
            if (node["session_timeout_ms"]) {
                parallel.session_timeout_ms = node["session_timeout_ms"].as<long>();
            }
            config.parallel = parallel;
        }

        if (root["executive_person"] && !root["executive_person"].IsNull()) {
            YAML::Node node = root["executive_person"];
            ExecutivePerson person;
            if (node.IsScalar()) {
                person.name = node.as<std::string>();
            } else {
                if (node["name"]) {
                    person.name = node["name"].as<std::string>();
                }
                if (node["description"]) {
                    person.description = node["description"].as<std::string>();
                }
            }
            config.executive_person = person;
        }

    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("Invalid configuration value: ") + e.what());
    }

    config.validate();
    return config;
}

std::vector<ParameterSpec> DelegationConfigLoader::parseParameters(const YAML::Node& node, const std::string& key) {
    std::vector<ParameterSpec> parameters;
    if (!node[key] || node[key].IsNull()) {
        return parameters;
    }
    if (!node[key].IsSequence()) {
        throw ConfigurationError("'" + key + "' must be a list of parameters");
    }

    for (const auto& entry : node[key]) {
        parameters.push_back(parseParameter(entry));
    }
    return parameters;
}

ParameterSpec DelegationConfigLoader::parseParameter(const YAML::Node& node) {
    if (!node.IsMap() || !node["name"]) {
        throw ConfigurationError("Every parameter needs a name");
    }

    ParameterSpec parameter;
    parameter.name = node["name"].as<std::string>();
    if (node["type"]) {
        parameter.type = parameterTypeFromString(node["type"].as<std::string>());
    }
    if (node["description"]) {
        parameter.description = node["description"].as<std::string>();
    }
    if (node["required"]) {
        parameter.required = node["required"].as<bool>();
    }
    if (node["element"]) {
        parameter.element = std::make_shared<const ParameterSpec>(parseParameter(node["element"]));
    }
    parameter.properties = parseParameters(node, "properties");
    return parameter;
}

void DelegationConfigLoader::emitParameter(YAML::Emitter& out, const ParameterSpec& parameter) {
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << parameter.name;
    out << YAML::Key << "type" << YAML::Value << parameterTypeToString(parameter.type);
    if (!parameter.description.empty()) {
        out << YAML::Key << "description" << YAML::Value << parameter.description;
    }
    out << YAML::Key << "required" << YAML::Value << parameter.required;
    if (parameter.element) {
        out << YAML::Key << "element" << YAML::Value;
        emitParameter(out, *parameter.element);
    }
    if (!parameter.properties.empty()) {
        out << YAML::Key << "properties" << YAML::Value << YAML::BeginSeq;
        for (const auto& property : parameter.properties) {
            emitParameter(out, property);
        }
        out << YAML::EndSeq;
    }
    out << YAML::EndMap;
}

std::string DelegationConfigLoader::toYaml(const DelegationConfig& config) {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "function_name" << YAML::Value << config.function_name;
    out << YAML::Key << "function_description" << YAML::Value << config.function_description;
    out << YAML::Key << "max_recursion_level" << YAML::Value << config.max_recursion_level;

    out << YAML::Key << "input_parameters" << YAML::Value << YAML::BeginSeq;
    for (const auto& parameter : config.input_parameters) {
        emitParameter(out, parameter);
    }
    out << YAML::EndSeq;

    out << YAML::Key << "return_tool_name" << YAML::Value << config.return_tool_name;
    out << YAML::Key << "return_tool_description" << YAML::Value << config.return_tool_description;
    out << YAML::Key << "return_parameters" << YAML::Value << YAML::BeginSeq;
    for (const auto& parameter : config.return_parameters) {
        emitParameter(out, parameter);
    }
    out << YAML::EndSeq;

    out << YAML::Key << "prompt_message" << YAML::Value << config.prompt_message;
    out << YAML::Key << "urging_message" << YAML::Value << config.urging_message;
    out << YAML::Key << "dangling_behavior" << YAML::Value << danglingBehaviorToString(config.dangling_behavior);
    out << YAML::Key << "error_message" << YAML::Value << config.error_message;
    out << YAML::Key << "error_reporting_tool_name" << YAML::Value << config.error_reporting_tool_name;

    if (config.error_reporting) {
        const ErrorReportingConfig& reporting = *config.error_reporting;
        out << YAML::Key << "error_reporting" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "tool_description" << YAML::Value << reporting.tool_description;
        out << YAML::Key << "parameters" << YAML::Value << YAML::BeginSeq;
        for (const auto& parameter : reporting.parameters) {
            emitParameter(out, parameter);
        }
        out << YAML::EndSeq;
        out << YAML::Key << "behavior" << YAML::Value << errorReportingBehaviorToString(reporting.behavior);
        out << YAML::Key << "custom_parent_message" << YAML::Value << reporting.custom_parent_message;
        out << YAML::EndMap;
    }

    if (config.parallel) {
        const ParallelConfig& parallel = *config.parallel;
        out << YAML::Key << "parallel" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "execution_type" << YAML::Value << parallelExecutionTypeToString(parallel.execution_type);
        out << YAML::Key << "max_concurrency" << YAML::Value << parallel.max_concurrency;
        out << YAML::Key << "result_strategy" << YAML::Value << resultStrategyToString(parallel.result_strategy);
        out << YAML::Key << "list_parameter_name" << YAML::Value << parallel.list_parameter_name;
        out << YAML::Key << "external_list" << YAML::Value << YAML::Flow << parallel.external_list;
        out << YAML::Key << "excluded_parameter_names" << YAML::Value << YAML::Flow
            << parallel.excluded_parameter_names;
        out << YAML::Key << "session_timeout_ms" << YAML::Value << parallel.session_timeout_ms;
        out << YAML::EndMap;
    }

    if (config.executive_person) {
        out << YAML::Key << "executive_person" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << config.executive_person->name;
        out << YAML::Key << "description" << YAML::Value << config.executive_person->description;
        out << YAML::EndMap;
    }

    out << YAML::EndMap;
    return out.c_str();
}

} // namespace Ramify
