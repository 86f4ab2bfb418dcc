// =================================================================
// include/Ramify/ChildSessionCoordinator.hpp
// =================================================================
// State machine driving one child session from dispatch to its result.

#pragma once

#include "Ramify/Cancellation.hpp"
#include "Ramify/CompletionGate.hpp"
#include "Ramify/DelegationConfig.hpp"
#include "Ramify/Host.hpp"
#include "Ramify/ResultTools.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace Ramify {

/**
 * @brief Lifecycle states of a child session
 */
enum class ChildState {
    DISPATCHED,         ///< Tools registered, initial message being sent
    AWAITING_TOOL,      ///< Waiting for a result tool call or the end of a turn
    SUCCEEDED,          ///< The return tool delivered a result
    FAILED_DANGLING,    ///< No usable result: ignored reminders, report_error dangling, or validation exhaustion
    FAILED_REPORTED,    ///< The child reported an error with REPORT_ERROR behavior
    PAUSED,             ///< The child reported an error with PAUSE behavior; still waiting
    CANCELLED           ///< Cancelled by the caller, a sibling, or a timeout
};

std::string childStateToString(ChildState state);

/**
 * @brief Drives a single child session until it yields a ChildResult
 *
 * The coordinator registers the return tool (and the error tool when
 * configured), sends the initial message, then races three events on every
 * loop iteration: the return gate, the error gate, and the end of the
 * current model turn. Turns that end without a tool call are handled per
 * DanglingBehavior. Every terminal state cancels the child session.
 */
class ChildSessionCoordinator {
public:
    static const int MAX_URGE_ATTEMPTS = 3;

    /**
     * @brief Construct a coordinator for a freshly created child session
     * @param session The child session to drive
     * @param config Delegation configuration
     */
    ChildSessionCoordinator(std::shared_ptr<HostSession> session, const DelegationConfig& config);

    /**
     * @brief Run the child session to completion
     * @param initial_message Rendered prompt for the child
     * @param urging_message Rendered reminder sent for dangling turns
     * @param token Cancellation observed throughout the run
     * @return The child's result
     * @throws OperationCancelledError if the token is cancelled
     * @throws DanglingExhaustedError if the reminders are used up under URGE
     */
    ChildResult run(const std::string& initial_message, const std::string& urging_message,
                    const CancellationToken& token = CancellationToken());

    ChildState getState() const { return m_state.load(); }
    int getUrgeAttempts() const { return m_urge_attempts.load(); }
    const std::string& getSessionId() const { return m_session_id; }

    std::shared_ptr<ReturnResultTool> getReturnTool() const { return m_return_tool; }
    std::shared_ptr<ErrorReportingTool> getErrorTool() const { return m_error_tool; }

private:
    std::shared_ptr<HostSession> m_session;
    DelegationConfig m_config;
    std::string m_session_id;
    std::shared_ptr<EventSignal> m_signal;
    std::shared_ptr<ReturnResultTool> m_return_tool;
    std::shared_ptr<ErrorReportingTool> m_error_tool;
    std::future<void> m_pending_turn;
    std::atomic<ChildState> m_state{ChildState::DISPATCHED};
    std::atomic<int> m_urge_attempts{0};

    void dispatch(const std::string& initial_message);

    /**
     * @brief Produce the final result if either gate has settled
     */
    std::optional<ChildResult> checkGates();

    /**
     * @brief React to a model turn that ended without a result
     */
    void handleDanglingTurn(const std::string& urging_message);

    void urge(const std::string& urging_message);
    void transitionTo(ChildState state);

    /**
     * @brief Cancel the child session; failures are logged, never thrown
     */
    void cancelSession();
};

} // namespace Ramify
