// =================================================================
// include/Ramify/ParameterSpec.hpp
// =================================================================
// Parameter and tool schemas with JSON Schema rendering.

#pragma once

#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace Ramify {

/**
 * @brief Declared type of a tool or delegation parameter
 */
enum class ParameterType {
    STRING,
    INTEGER,
    NUMBER,
    BOOL,
    DATETIME,
    OBJECT,
    ARRAY
};

/**
 * @brief Schema of a single named parameter
 */
struct ParameterSpec {
    std::string name;
    std::string description;
    ParameterType type = ParameterType::STRING;
    bool required = true;

    std::shared_ptr<const ParameterSpec> element;  ///< Element schema when type is ARRAY
    std::vector<ParameterSpec> properties;          ///< Member schemas when type is OBJECT

    /**
     * @brief Render this parameter as a JSON Schema property
     */
    nlohmann::json toJsonSchema() const;

    static ParameterSpec make(const std::string& name, ParameterType type,
                              const std::string& description = "", bool required = true);
};

/**
 * @brief Name, description and parameters of a callable tool
 */
struct ToolSchema {
    std::string name;
    std::string description;
    std::vector<ParameterSpec> parameters;

    /**
     * @brief Render as a function declaration with a JSON Schema "parameters" object
     */
    nlohmann::json toJson() const;

    /**
     * @brief Render only the {type: object, properties, required} parameters object
     */
    nlohmann::json parametersSchema() const;
};

std::string parameterTypeToString(ParameterType type);

/**
 * @brief Parse a type name such as "string", "int", "number", "bool", "datetime", "object" or "array"
 * @throws ConfigurationError for unknown names
 */
ParameterType parameterTypeFromString(const std::string& name);

/**
 * @brief Display name used in type validation messages ("String", "Integer", ...)
 */
std::string parameterTypeDisplayName(ParameterType type);

} // namespace Ramify
