// =================================================================
// include/Ramify/Errors.hpp
// =================================================================
// Exception hierarchy raised by the delegation engine.

#pragma once

#include <stdexcept>
#include <string>

namespace Ramify {

/**
 * @brief Base class for all errors raised by the delegation engine
 */
class DelegationError : public std::runtime_error {
public:
    explicit DelegationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid or conflicting configuration, detected before any child session starts
 */
class ConfigurationError : public DelegationError {
public:
    explicit ConfigurationError(const std::string& message)
        : DelegationError(message) {}
};

/**
 * @brief Missing required parameters or type mismatches
 */
class ValidationError : public DelegationError {
public:
    explicit ValidationError(const std::string& message)
        : DelegationError(message) {}
};

/**
 * @brief Delegation attempted at or beyond the configured recursion depth
 */
class RecursionLimitExceeded : public DelegationError {
public:
    RecursionLimitExceeded(int max_level, int current_level)
        : DelegationError("Maximum recursion level reached (max: " + std::to_string(max_level) +
                          ", current: " + std::to_string(current_level) + ")"),
          m_max_level(max_level), m_current_level(current_level) {}

    int getMaxLevel() const { return m_max_level; }
    int getCurrentLevel() const { return m_current_level; }

private:
    int m_max_level;
    int m_current_level;
};

/**
 * @brief A child session ignored every reminder to report its result
 */
class DanglingExhaustedError : public DelegationError {
public:
    explicit DanglingExhaustedError(const std::string& message)
        : DelegationError(message) {}
};

/**
 * @brief A result tool rejected too many invalid calls in a row
 */
class ValidationExhaustedError : public ValidationError {
public:
    explicit ValidationExhaustedError(const std::string& message)
        : ValidationError(message) {}
};

/**
 * @brief The operation was cancelled by its caller or a sibling
 */
class OperationCancelledError : public DelegationError {
public:
    explicit OperationCancelledError(const std::string& message = "The operation was cancelled")
        : DelegationError(message) {}
};

/**
 * @brief A single work item exceeded its session timeout
 */
class WorkItemTimeoutError : public DelegationError {
public:
    explicit WorkItemTimeoutError(const std::string& message)
        : DelegationError(message) {}
};

} // namespace Ramify
