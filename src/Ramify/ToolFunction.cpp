// =================================================================
// src/Ramify/ToolFunction.cpp
// =================================================================
// Implementation of tool invocation helpers.

#include "Ramify/ToolFunction.hpp"
#include "Ramify/Errors.hpp"

namespace Ramify {

std::future<std::string> ToolFunction::invoke(const ArgumentMap& args) const {
    if (!handler) {
        throw DelegationError("Tool '" + schema.name + "' has no handler");
    }
    return handler(args);
}

std::future<std::string> makeReadyReply(const std::string& reply) {
    std::promise<std::string> promise;
    promise.set_value(reply);
    return promise.get_future();
}

std::string invokeTool(const ToolMap& tools, const std::string& name, const ArgumentMap& args) {
    auto it = tools.find(name);
    if (it == tools.end()) {
        throw DelegationError("Unknown tool: " + name);
    }
    return it->second.invoke(args).get();
}

} // namespace Ramify
