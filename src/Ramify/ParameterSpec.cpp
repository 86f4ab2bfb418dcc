// =================================================================
// src/Ramify/ParameterSpec.cpp
// =================================================================
// Implementation of parameter and tool schemas.

#include "Ramify/ParameterSpec.hpp"
#include "Ramify/Errors.hpp"
#include <algorithm>
#include <cctype>

namespace Ramify {

nlohmann::json ParameterSpec::toJsonSchema() const {
    nlohmann::json schema;

    switch (type) {
        case ParameterType::STRING:
            schema["type"] = "string";
            break;
        case ParameterType::INTEGER:
            schema["type"] = "integer";
            break;
        case ParameterType::NUMBER:
            schema["type"] = "number";
            break;
        case ParameterType::BOOL:
            schema["type"] = "boolean";
            break;
        case ParameterType::DATETIME:
            schema["type"] = "string";
            schema["format"] = "date-time";
            break;
        case ParameterType::OBJECT: {
            schema["type"] = "object";
            nlohmann::json props = nlohmann::json::object();
            nlohmann::json required_names = nlohmann::json::array();
            for (const auto& property : properties) {
                props[property.name] = property.toJsonSchema();
                if (property.required) {
                    required_names.push_back(property.name);
                }
            }
            schema["properties"] = props;
            if (!required_names.empty()) {
                schema["required"] = required_names;
            }
            break;
        }
        case ParameterType::ARRAY:
            schema["type"] = "array";
            if (element) {
                schema["items"] = element->toJsonSchema();
            }
            break;
    }

    if (!description.empty()) {
        schema["description"] = description;
    }

    return schema;
}

ParameterSpec ParameterSpec::make(const std::string& name, ParameterType type,
                                  const std::string& description, bool required) {
    ParameterSpec spec;
    spec.name = name;
    spec.type = type;
    spec.description = description;
    spec.required = required;
    return spec;
}

nlohmann::json ToolSchema::parametersSchema() const {
    nlohmann::json schema;
    schema["type"] = "object";

    nlohmann::json props = nlohmann::json::object();
    nlohmann::json required_names = nlohmann::json::array();
    for (const auto& parameter : parameters) {
        props[parameter.name] = parameter.toJsonSchema();
        if (parameter.required) {
            required_names.push_back(parameter.name);
        }
    }

    schema["properties"] = props;
    schema["required"] = required_names;
    return schema;
}

nlohmann::json ToolSchema::toJson() const {
    nlohmann::json tool;
    tool["name"] = name;
    tool["description"] = description;
    tool["parameters"] = parametersSchema();
    return tool;
}

std::string parameterTypeToString(ParameterType type) {
    switch (type) {
        case ParameterType::STRING: return "string";
        case ParameterType::INTEGER: return "integer";
        case ParameterType::NUMBER: return "number";
        case ParameterType::BOOL: return "bool";
        case ParameterType::DATETIME: return "datetime";
        case ParameterType::OBJECT: return "object";
        case ParameterType::ARRAY: return "array";
        default: return "unknown";
    }
}

ParameterType parameterTypeFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "string" || lower == "str") return ParameterType::STRING;
    if (lower == "integer" || lower == "int" || lower == "long") return ParameterType::INTEGER;
    if (lower == "number" || lower == "double" || lower == "float") return ParameterType::NUMBER;
    if (lower == "bool" || lower == "boolean") return ParameterType::BOOL;
    if (lower == "datetime" || lower == "date-time") return ParameterType::DATETIME;
    if (lower == "object") return ParameterType::OBJECT;
    if (lower == "array" || lower == "list") return ParameterType::ARRAY;

    throw ConfigurationError("Unknown parameter type: " + name);
}

std::string parameterTypeDisplayName(ParameterType type) {
    switch (type) {
        case ParameterType::STRING: return "String";
        case ParameterType::INTEGER: return "Integer";
        case ParameterType::NUMBER: return "Number";
        case ParameterType::BOOL: return "Boolean";
        case ParameterType::DATETIME: return "DateTime";
        case ParameterType::OBJECT: return "Object";
        case ParameterType::ARRAY: return "Array";
        default: return "Unknown";
    }
}

} // namespace Ramify
