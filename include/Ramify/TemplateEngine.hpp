// =================================================================
// include/Ramify/TemplateEngine.hpp
// =================================================================
// Prompt rendering interface and the built-in placeholder engine.

#pragma once

#include "Ramify/DelegationConfig.hpp"
#include "Ramify/ParallelTypes.hpp"
#include "Ramify/Value.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace Ramify {

/**
 * @brief Renders prompt templates against JSON bindings
 *
 * Implementations must not throw. When rendering fails they return the
 * template unmodified.
 */
class TemplateEngine {
public:
    virtual ~TemplateEngine() = default;

    /**
     * @brief Render a template
     * @param tmpl Template text
     * @param bindings JSON object of named values
     * @return Rendered text, or tmpl itself on failure
     */
    virtual std::string render(const std::string& tmpl, const nlohmann::json& bindings) const = 0;
};

/**
 * @brief Substitutes {{ name }} and {{ dotted.path }} placeholders
 *
 * String values are inserted as-is, other values as compact JSON, and
 * unresolved paths as an empty string. Array elements are addressed with
 * numeric segments ("items.0").
 */
class PlaceholderTemplateEngine : public TemplateEngine {
public:
    std::string render(const std::string& tmpl, const nlohmann::json& bindings) const override;

private:
    static const nlohmann::json* resolvePath(const nlohmann::json& bindings, const std::string& path);
};

/**
 * @brief Build the bindings used to render prompt and urging messages
 *
 * Contains every plain-data request argument, null for declared required
 * inputs that are absent, "_Config" with the configuration view, and
 * "_Parameter" with the Name and Value of the current work item (both
 * null outside parallel execution).
 */
nlohmann::json buildTemplateBindings(const ArgumentMap& args, const DelegationConfig& config,
                                     const std::optional<WorkItem>& item);

} // namespace Ramify
