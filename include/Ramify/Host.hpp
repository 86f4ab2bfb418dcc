// =================================================================
// include/Ramify/Host.hpp
// =================================================================
// Interfaces the delegation engine consumes from the hosting application.

#pragma once

#include "Ramify/Cancellation.hpp"
#include "Ramify/ToolFunction.hpp"
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Ramify {

/**
 * @brief How a message is delivered to a session
 */
enum class MessageKind {
    INFO_ONLY,      ///< Shown to the user, does not start a model turn
    STATUS_UPDATE,  ///< Progress information
    MESSAGE         ///< A user message that starts a model turn
};

/**
 * @brief Whether the model may, must, or must not call tools
 */
enum class ToolExecutionMode {
    AUTO,
    REQUIRE_ANY,
    NONE
};

/**
 * @brief An assistant persona the host can run a session with
 */
struct Assistant {
    std::string name;
    std::string description;
};

/**
 * @brief Abstract handle to a live host session
 *
 * Implementations must make cancel() and dispose() idempotent.
 */
class HostSession {
public:
    virtual ~HostSession() = default;

    virtual std::string getId() const = 0;

    /**
     * @brief Id of the session that created this one, if any
     */
    virtual std::optional<std::string> getParentId() const = 0;

    /**
     * @brief Names of the assistants taking part in this session
     */
    virtual std::vector<std::string> getPersonNames() const = 0;

    /**
     * @brief Send a message to the session
     * @param kind Delivery kind
     * @param text Message text
     * @return Future that becomes ready when the resulting model turn ends
     */
    virtual std::future<void> sendMessage(MessageKind kind, const std::string& text) = 0;

    /**
     * @brief Make tools callable by the model in this session
     */
    virtual void registerTools(const ToolMap& tools) = 0;

    virtual void setToolExecutionMode(ToolExecutionMode mode) = 0;

    /**
     * @brief Token cancelled when this session's activity is cancelled
     */
    virtual CancellationToken getCancellationToken() const = 0;

    /**
     * @brief Cancel in-flight activity of the session
     */
    virtual void cancel() = 0;

    virtual void dispose() = 0;
};

/**
 * @brief Abstract hosting application
 */
class Host {
public:
    virtual ~Host() = default;

    /**
     * @brief Start a new session under a parent
     * @param parent Parent session, or nullptr for a root session
     * @param person_name Assistant that runs the new session
     * @return The created session
     */
    virtual std::shared_ptr<HostSession> createChildSession(const std::shared_ptr<HostSession>& parent,
                                                            const std::string& person_name) = 0;

    /**
     * @brief List the available assistants
     * @param name Optional name filter
     */
    virtual std::vector<Assistant> listAssistants(const std::optional<std::string>& name = std::nullopt) = 0;

    /**
     * @brief Open an existing session by id
     * @return The session, or nullptr if it does not exist
     */
    virtual std::shared_ptr<HostSession> openSession(const std::string& session_id) = 0;
};

std::string messageKindToString(MessageKind kind);
std::string toolExecutionModeToString(ToolExecutionMode mode);

} // namespace Ramify
