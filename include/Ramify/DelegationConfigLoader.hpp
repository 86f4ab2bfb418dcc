// =================================================================
// include/Ramify/DelegationConfigLoader.hpp
// =================================================================
// Reads and writes delegation configurations as YAML.

#pragma once

#include "Ramify/DelegationConfig.hpp"
#include <string>
#include <vector>

namespace YAML {
class Node;
class Emitter;
}

namespace Ramify {

/**
 * @brief YAML front end for DelegationConfig
 *
 * Example:
 * @code
 * function_name: research_topics
 * max_recursion_level: 2
 * input_parameters:
 *   - name: topics
 *     type: array
 *     element: { name: topic, type: string }
 * dangling_behavior: urge
 * parallel:
 *   execution_type: list_based
 *   list_parameter_name: topics
 *   result_strategy: wait_for_all
 * @endcode
 *
 * Keys missing from the document keep the DelegationConfig defaults.
 */
class DelegationConfigLoader {
public:
    /**
     * @brief Load and validate a configuration file
     * @throws ConfigurationError if the file cannot be read or is invalid
     */
    static DelegationConfig loadFromFile(const std::string& path);

    /**
     * @brief Load and validate a configuration from YAML text
     * @throws ConfigurationError if the text cannot be parsed or is invalid
     */
    static DelegationConfig loadFromString(const std::string& yaml);

    /**
     * @brief Serialize a configuration; loadFromString() reads it back
     */
    static std::string toYaml(const DelegationConfig& config);

private:
    static DelegationConfig parse(const YAML::Node& root);
    static ParameterSpec parseParameter(const YAML::Node& node);
    static std::vector<ParameterSpec> parseParameters(const YAML::Node& node, const std::string& key);
    static void emitParameter(YAML::Emitter& out, const ParameterSpec& parameter);
};

} // namespace Ramify
