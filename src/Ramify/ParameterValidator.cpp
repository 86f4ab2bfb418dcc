// =================================================================
// src/Ramify/ParameterValidator.cpp
// =================================================================
// Implementation of argument validation.

#include "Ramify/ParameterValidator.hpp"
#include <sstream>

namespace Ramify {

namespace {

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::ostringstream out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out << separator;
        out << items[i];
    }
    return out.str();
}

} // namespace

std::string ValidationReport::describe() const {
    std::vector<std::string> parts;
    if (!missing_required.empty()) {
        parts.push_back("Missing required parameters: " + join(missing_required, ", "));
    }
    if (!type_errors.empty()) {
        parts.push_back("Type validation errors: " + join(type_errors, "; "));
    }
    return join(parts, " AND ");
}

ValidationReport ParameterValidator::validate(const std::vector<ParameterSpec>& schema, const ArgumentMap& args) {
    ValidationReport report;

    for (const auto& parameter : schema) {
        auto it = args.find(parameter.name);
        if (it == args.end()) {
            if (parameter.required) {
                report.missing_required.push_back(parameter.name);
            }
            continue;
        }

        const Value& value = it->second;
        if (value.isNull()) {
            continue;
        }

        if (!isCompatible(value, parameter.type)) {
            report.type_errors.push_back("Parameter '" + parameter.name + "' expected type " +
                                         parameterTypeDisplayName(parameter.type) +
                                         " but got " + value.getTypeName());
        }
    }

    return report;
}

bool ParameterValidator::isCompatible(const Value& value, ParameterType type) {
    // Anything converts to a string
    if (type == ParameterType::STRING) {
        return true;
    }

    if (!value.isData()) {
        return false;
    }

    const auto& data = value.getData();
    switch (type) {
        case ParameterType::INTEGER:
        case ParameterType::NUMBER:
            return data.is_number() || data.is_string();
        case ParameterType::BOOL:
            return data.is_boolean() || data.is_string();
        case ParameterType::DATETIME:
            return data.is_string();
        case ParameterType::OBJECT:
            return data.is_object();
        case ParameterType::ARRAY:
            return data.is_array();
        default:
            return false;
    }
}

std::string ParameterValidator::describeMissing(const std::vector<ParameterSpec>& schema, const ArgumentMap& args) {
    std::vector<std::string> details;
    for (const auto& parameter : schema) {
        if (!parameter.required || args.count(parameter.name) > 0) {
            continue;
        }
        if (parameter.description.empty()) {
            details.push_back("'" + parameter.name + "'");
        } else {
            details.push_back("'" + parameter.name + "' (" + parameter.description + ")");
        }
    }
    return join(details, ", ");
}

bool ValidationFailureCounter::recordFailure(const ValidationReport& report) {
    bool has_missing = !report.missing_required.empty();
    bool has_type_errors = !report.type_errors.empty();

    if (has_missing) {
        ++m_missing_required_count;
    }
    if (has_type_errors) {
        ++m_type_error_count;
    }

    return (has_missing && m_missing_required_count >= MAX_FAILURES) ||
           (has_type_errors && m_type_error_count >= MAX_FAILURES);
}

} // namespace Ramify
