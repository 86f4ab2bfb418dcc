// =================================================================
// include/Ramify/ParameterValidator.hpp
// =================================================================
// Required-presence and type compatibility checks for argument maps.

#pragma once

#include "Ramify/ParameterSpec.hpp"
#include "Ramify/Value.hpp"
#include <string>
#include <vector>

namespace Ramify {

/**
 * @brief Result of validating one argument map against a schema
 */
struct ValidationReport {
    std::vector<std::string> missing_required;  ///< Names of absent required parameters
    std::vector<std::string> type_errors;       ///< One message per incompatible value

    bool isValid() const { return missing_required.empty() && type_errors.empty(); }

    /**
     * @brief Combined description, e.g.
     *        "Missing required parameters: a, b AND Type validation errors: ..."
     */
    std::string describe() const;
};

/**
 * @brief Stateless schema validation
 */
class ParameterValidator {
public:
    /**
     * @brief Validate arguments against a parameter schema
     *
     * A required parameter is missing only when its key is absent; an
     * explicit null counts as present. Null values are never type errors.
     *
     * @param schema Declared parameters
     * @param args Arguments to check
     * @return Missing names and type error messages
     */
    static ValidationReport validate(const std::vector<ParameterSpec>& schema, const ArgumentMap& args);

    /**
     * @brief Whether a value is assignable or losslessly convertible to a declared type
     */
    static bool isCompatible(const Value& value, ParameterType type);

    /**
     * @brief Describe missing required parameters with their descriptions
     * @return Text such as "'topic' (What to research), 'depth'" or empty when nothing is missing
     */
    static std::string describeMissing(const std::vector<ParameterSpec>& schema, const ArgumentMap& args);
};

/**
 * @brief Per-tool count of rejected calls
 *
 * Missing-parameter failures and type failures are counted separately.
 * The tool escalates once either count reaches MAX_FAILURES.
 */
class ValidationFailureCounter {
public:
    static const int MAX_FAILURES = 5;

    /**
     * @brief Record a rejected call
     * @param report The failing validation report
     * @return True if the failure threshold has been reached
     */
    bool recordFailure(const ValidationReport& report);

    int getMissingRequiredCount() const { return m_missing_required_count; }
    int getTypeErrorCount() const { return m_type_error_count; }

private:
    int m_missing_required_count = 0;
    int m_type_error_count = 0;
};

} // namespace Ramify
