// =================================================================
// src/Ramify/DelegationService.cpp
// =================================================================
// Implementation of the live handler registry.

#include "Ramify/DelegationService.hpp"
#include "Ramify/Errors.hpp"
#include "Ramify/Logger.hpp"
#include "Ramify/RecursionGuard.hpp"

namespace Ramify {

DelegationService::DelegationService(std::shared_ptr<Host> host, const DelegationConfig& config,
                                     std::shared_ptr<const TemplateEngine> engine)
    : m_host(std::move(host)), m_config(config), m_engine(std::move(engine)) {
    if (!m_host) {
        throw DelegationError("DelegationService requires a host");
    }
    m_config.validate();
}

ToolMap DelegationService::registerTools(const std::shared_ptr<HostSession>& session) {
    DelegationConfig config = getConfig();

    if (session) {
        int level = RecursionGuard(m_host).currentLevel(session);
        if (level >= config.max_recursion_level) {
            LOG_INFO("DelegationService", "Not registering " + config.function_name + " at recursion level " +
                     std::to_string(level), "Session: " + session->getId());
            return {};
        }
    }

    auto handler = std::make_shared<DelegationHandler>(m_host, config, session, m_engine);
    ToolMap tools;
    tools[config.function_name] = handler->toToolFunction();

    std::string key = session ? session->getId() : "";
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_handlers[key] = handler;
    }

    LOG_DEBUG("DelegationService", "Registered " + config.function_name, "Session: " + key);
    return tools;
}

void DelegationService::updateConfig(const DelegationConfig& config) {
    config.validate();

    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = config;
    for (auto& [session_id, handler] : m_handlers) {
        handler->updateConfig(config);
    }

    LOG_INFO("DelegationService", "Configuration updated for " + std::to_string(m_handlers.size()) +
             " live handlers");
}

void DelegationService::closeSession(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_handlers.erase(session_id) > 0) {
        LOG_DEBUG("DelegationService", "Unregistered handler", "Session: " + session_id);
    }
}

size_t DelegationService::activeHandlerCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_handlers.size();
}

std::shared_ptr<DelegationHandler> DelegationService::getHandler(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_handlers.find(session_id);
    return it == m_handlers.end() ? nullptr : it->second;
}

DelegationConfig DelegationService::getConfig() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config;
}

} // namespace Ramify
