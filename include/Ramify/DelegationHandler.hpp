// =================================================================
// include/Ramify/DelegationHandler.hpp
// =================================================================
// Entry point of a delegation request: checks, assistant selection, and
// dispatch to a single child or a parallel fan-out.

#pragma once

#include "Ramify/Cancellation.hpp"
#include "Ramify/CompletionGate.hpp"
#include "Ramify/DelegationConfig.hpp"
#include "Ramify/Host.hpp"
#include "Ramify/ParallelTypes.hpp"
#include "Ramify/TemplateEngine.hpp"
#include "Ramify/ToolFunction.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace Ramify {

/**
 * @brief Handles calls of one delegation tool
 *
 * Expected failures (recursion limit, missing inputs, unusable parallel
 * sources) come back as descriptive text for the calling model. Dangling
 * exhaustion, cancellation and configuration errors are thrown.
 */
class DelegationHandler : public std::enable_shared_from_this<DelegationHandler> {
public:
    /**
     * @brief Constructor
     * @param host Hosting application
     * @param config Delegation configuration
     * @param context_session Session the tool is registered on, if any
     * @param engine Template engine for prompts; nullptr selects PlaceholderTemplateEngine
     */
    DelegationHandler(std::shared_ptr<Host> host, const DelegationConfig& config,
                      std::shared_ptr<HostSession> context_session = nullptr,
                      std::shared_ptr<const TemplateEngine> engine = nullptr);

    /**
     * @brief Run one delegation request
     * @param args Arguments of the tool call
     * @return Status text for the caller
     * @throws ConfigurationError for invalid settings
     * @throws DanglingExhaustedError when a child ignored every reminder
     * @throws OperationCancelledError when the context session was cancelled
     */
    std::string delegate(const ArgumentMap& args);

    /**
     * @brief Replace the configuration used by later calls
     */
    void updateConfig(const DelegationConfig& config);

    DelegationConfig getConfig() const;
    std::shared_ptr<HostSession> getContextSession() const { return m_context_session; }

    /**
     * @brief Expose delegate() as an asynchronous tool
     *
     * The returned function keeps this handler alive.
     */
    ToolFunction toToolFunction();

    /**
     * @brief Pick the assistant that runs the child sessions
     * @return Assistant name, or empty when none is available
     * @throws ConfigurationError if the configured executive person is unavailable
     */
    std::string selectExecutivePerson(const std::shared_ptr<HostSession>& context,
                                      const DelegationConfig& config) const;

private:
    std::shared_ptr<Host> m_host;
    DelegationConfig m_config;
    std::shared_ptr<HostSession> m_context_session;
    std::shared_ptr<const TemplateEngine> m_engine;
    mutable std::mutex m_config_mutex;

    ChildResult runChild(const ArgumentMap& args, const DelegationConfig& config,
                         const std::shared_ptr<HostSession>& context, const std::string& person,
                         const std::optional<WorkItem>& item, const CancellationToken& token);

    std::string runParallel(const ArgumentMap& args, const DelegationConfig& config,
                            const std::shared_ptr<HostSession>& context, const std::string& person,
                            const CancellationToken& token);
};

} // namespace Ramify
