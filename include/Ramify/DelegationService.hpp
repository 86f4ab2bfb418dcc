// =================================================================
// include/Ramify/DelegationService.hpp
// =================================================================
// Registry of live delegation handlers, one per host session.

#pragma once

#include "Ramify/DelegationConfig.hpp"
#include "Ramify/DelegationHandler.hpp"
#include "Ramify/Host.hpp"
#include "Ramify/TemplateEngine.hpp"
#include "Ramify/ToolFunction.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace Ramify {

/**
 * @brief Hands out delegation tools to sessions and keeps them in sync
 *
 * Configuration updates reach every handler registered so far. Handlers
 * are dropped explicitly through closeSession().
 */
class DelegationService {
public:
    /**
     * @brief Constructor
     * @throws ConfigurationError if the configuration is invalid
     */
    DelegationService(std::shared_ptr<Host> host, const DelegationConfig& config,
                      std::shared_ptr<const TemplateEngine> engine = nullptr);

    /**
     * @brief Build the delegation tool for a session
     * @param session Session the tool will be registered on
     * @return Tool map with the delegation tool; empty when the session is at the recursion limit
     */
    ToolMap registerTools(const std::shared_ptr<HostSession>& session);

    /**
     * @brief Apply a new configuration to live and future handlers
     * @throws ConfigurationError if the configuration is invalid
     */
    void updateConfig(const DelegationConfig& config);

    /**
     * @brief Forget the handler of a closed session
     */
    void closeSession(const std::string& session_id);

    size_t activeHandlerCount() const;
    std::shared_ptr<DelegationHandler> getHandler(const std::string& session_id) const;
    DelegationConfig getConfig() const;

private:
    std::shared_ptr<Host> m_host;
    DelegationConfig m_config;
    std::shared_ptr<const TemplateEngine> m_engine;
    std::map<std::string, std::shared_ptr<DelegationHandler>> m_handlers;
    mutable std::mutex m_mutex;
};

} // namespace Ramify
