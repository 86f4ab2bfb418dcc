// =================================================================
// src/Ramify/ChildSessionCoordinator.cpp
// =================================================================
// Implementation of the child session state machine.

#include "Ramify/ChildSessionCoordinator.hpp"
#include "Ramify/Errors.hpp"
#include "Ramify/Logger.hpp"
#include <algorithm>
#include <cctype>

namespace Ramify {

namespace {

// Upper bound on a single sleep between checks of the watched events
constexpr std::chrono::milliseconds POLL_INTERVAL(10);

const char* const DEFAULT_DANGLING_ERROR =
    "Child session ended its turn without reporting a result.";

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

} // namespace

std::string childStateToString(ChildState state) {
    switch (state) {
        case ChildState::DISPATCHED: return "Dispatched";
        case ChildState::AWAITING_TOOL: return "AwaitingTool";
        case ChildState::SUCCEEDED: return "Succeeded";
        case ChildState::FAILED_DANGLING: return "FailedDangling";
        case ChildState::FAILED_REPORTED: return "FailedReported";
        case ChildState::PAUSED: return "Paused";
        case ChildState::CANCELLED: return "Cancelled";
        default: return "Unknown";
    }
}

ChildSessionCoordinator::ChildSessionCoordinator(std::shared_ptr<HostSession> session, const DelegationConfig& config)
    : m_session(std::move(session)), m_config(config), m_signal(std::make_shared<EventSignal>()) {
    if (!m_session) {
        throw DelegationError("ChildSessionCoordinator requires a child session");
    }

    m_session_id = m_session->getId();
    m_return_tool = std::make_shared<ReturnResultTool>(m_session_id, m_config.getReturnToolSchema(), m_signal);

    if (m_config.error_reporting) {
        m_error_tool = std::make_shared<ErrorReportingTool>(m_session_id, m_config.function_name,
                                                            m_config.error_reporting_tool_name,
                                                            *m_config.error_reporting, m_signal);
    }
}

ChildResult ChildSessionCoordinator::run(const std::string& initial_message, const std::string& urging_message,
                                         const CancellationToken& token) {
    try {
        dispatch(initial_message);
        transitionTo(ChildState::AWAITING_TOOL);

        while (true) {
            if (token.isCancellationRequested()) {
                transitionTo(ChildState::CANCELLED);
                throw OperationCancelledError("Child session " + m_session_id + " was cancelled");
            }

            if (auto result = checkGates()) {
                cancelSession();
                return *result;
            }

            if (m_error_tool && m_error_tool->isPauseActivated() &&
                getState() == ChildState::AWAITING_TOOL) {
                transitionTo(ChildState::PAUSED);
            }

            if (m_pending_turn.valid() &&
                m_pending_turn.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
                m_pending_turn.get();

                // A tool may have been called during the turn that just ended
                if (auto result = checkGates()) {
                    cancelSession();
                    return *result;
                }

                handleDanglingTurn(urging_message);
                continue;
            }

            m_signal->waitFor(POLL_INTERVAL);
        }

    } catch (const std::exception& e) {
        LOG_DEBUG("ChildSessionCoordinator", "Session " + m_session_id + " aborted: " + e.what());
        cancelSession();
        throw;
    }
}

void ChildSessionCoordinator::dispatch(const std::string& initial_message) {
    ToolMap tools;
    tools[m_config.return_tool_name] = m_return_tool->toToolFunction();
    if (m_error_tool) {
        tools[m_config.error_reporting_tool_name] = m_error_tool->toToolFunction();
    }

    m_session->registerTools(tools);
    m_session->setToolExecutionMode(ToolExecutionMode::REQUIRE_ANY);
    m_pending_turn = m_session->sendMessage(MessageKind::MESSAGE, initial_message);

    LOG_DEBUG("ChildSessionCoordinator", "Dispatched child session " + m_session_id,
              std::to_string(tools.size()) + " tools registered, " + messageKindToString(MessageKind::MESSAGE) +
              " sent with tool mode " + toolExecutionModeToString(ToolExecutionMode::REQUIRE_ANY));
}

std::optional<ChildResult> ChildSessionCoordinator::checkGates() {
    CompletionGate& return_gate = m_return_tool->getGate();
    if (return_gate.isSettled()) {
        try {
            ChildResult result = return_gate.get();
            transitionTo(result.success ? ChildState::SUCCEEDED : ChildState::FAILED_DANGLING);
            return result;
        } catch (const ValidationExhaustedError& e) {
            transitionTo(ChildState::FAILED_DANGLING);
            return ChildResult::failed(e.what());
        }
    }

    if (m_error_tool && m_error_tool->getGate().isSettled()) {
        try {
            ChildResult result = m_error_tool->getGate().get();
            transitionTo(ChildState::FAILED_REPORTED);
            return result;
        } catch (const ValidationExhaustedError& e) {
            transitionTo(ChildState::FAILED_DANGLING);
            return ChildResult::failed(e.what());
        }
    }

    return std::nullopt;
}

void ChildSessionCoordinator::handleDanglingTurn(const std::string& urging_message) {
    if (m_error_tool && m_error_tool->isPauseActivated()) {
        // Paused children are never urged; go back to waiting for a tool call
        LOG_DEBUG("ChildSessionCoordinator", "Turn ended while paused", "Session: " + m_session_id);
        transitionTo(ChildState::AWAITING_TOOL);
        return;
    }

    switch (m_config.dangling_behavior) {
        case DanglingBehavior::PAUSE:
            LOG_INFO("ChildSessionCoordinator", "Turn ended without a result, waiting for manual intervention",
                     "Session: " + m_session_id);
            return;

        case DanglingBehavior::REPORT_ERROR: {
            std::string message = isBlank(m_config.error_message) ? DEFAULT_DANGLING_ERROR : m_config.error_message;
            m_return_tool->getGate().trySet(ChildResult::failed(message));
            return;
        }

        case DanglingBehavior::URGE:
            urge(urging_message);
            return;

        default:
            LOG_WARNING("ChildSessionCoordinator", "Unknown dangling behavior " +
                        std::to_string(static_cast<int>(m_config.dangling_behavior)) + ", falling back to urge");
            urge(urging_message);
            return;
    }
}

void ChildSessionCoordinator::urge(const std::string& urging_message) {
    if (m_urge_attempts >= MAX_URGE_ATTEMPTS) {
        transitionTo(ChildState::FAILED_DANGLING);
        throw DanglingExhaustedError("Child session failed to provide result after " +
                                     std::to_string(MAX_URGE_ATTEMPTS) + " reminder attempts.");
    }

    ++m_urge_attempts;
    m_session->setToolExecutionMode(ToolExecutionMode::REQUIRE_ANY);
    m_pending_turn = m_session->sendMessage(MessageKind::MESSAGE, urging_message);

    LOG_INFO("ChildSessionCoordinator", "Sent reminder " + std::to_string(m_urge_attempts) + "/" +
             std::to_string(MAX_URGE_ATTEMPTS), "Session: " + m_session_id);
}

void ChildSessionCoordinator::transitionTo(ChildState state) {
    ChildState previous = m_state.exchange(state);
    if (previous != state) {
        Logger::getInstance().logChildTransition(m_session_id, childStateToString(previous),
                                                 childStateToString(state));
    }
}

void ChildSessionCoordinator::cancelSession() {
    try {
        m_session->cancel();
    } catch (const std::exception& e) {
        LOG_WARNING("ChildSessionCoordinator", "Cancelling session " + m_session_id + " failed: " + e.what());
    }
}

} // namespace Ramify
