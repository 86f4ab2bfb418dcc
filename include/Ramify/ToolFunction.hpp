// =================================================================
// include/Ramify/ToolFunction.hpp
// =================================================================
// Explicit registration table of tools a model may call.

#pragma once

#include "Ramify/ParameterSpec.hpp"
#include "Ramify/Value.hpp"
#include <functional>
#include <future>
#include <map>
#include <string>

namespace Ramify {

/**
 * @brief Closure invoked when the model calls a tool
 */
using ToolHandler = std::function<std::future<std::string>(const ArgumentMap&)>;

/**
 * @brief A tool schema bound to its handler
 */
struct ToolFunction {
    ToolSchema schema;
    ToolHandler handler;

    /**
     * @brief Invoke the handler
     * @throws DelegationError if no handler is bound
     */
    std::future<std::string> invoke(const ArgumentMap& args) const;
};

/**
 * @brief Tools keyed by the name the model uses to call them
 */
using ToolMap = std::map<std::string, ToolFunction>;

/**
 * @brief Wrap an already computed tool reply in a ready future
 */
std::future<std::string> makeReadyReply(const std::string& reply);

/**
 * @brief Invoke a tool from a map by name and wait for its reply
 * @throws DelegationError if the tool is not registered
 */
std::string invokeTool(const ToolMap& tools, const std::string& name, const ArgumentMap& args);

} // namespace Ramify
