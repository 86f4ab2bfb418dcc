// =================================================================
// include/Ramify/CompletionGate.hpp
// =================================================================
// One-shot result slot for a child unit of work, and the wake-up signal
// a coordinator sleeps on.

#pragma once

#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace Ramify {

/**
 * @brief Final result of one child session
 */
struct ChildResult {
    bool success = false;
    std::optional<std::string> error_message;
    std::optional<std::string> result;

    static ChildResult succeeded(const std::string& result);
    static ChildResult failed(const std::string& error_message);
};

/**
 * @brief Auto-reset wake-up signal with a single intended waiter
 *
 * notify() latches until the next wait returns, so a notification sent
 * before the waiter sleeps is never lost.
 */
class EventSignal {
public:
    void notify();

    /**
     * @brief Wait until notified or the timeout elapses
     * @return True if a notification was consumed
     */
    bool waitFor(std::chrono::milliseconds timeout);

private:
    std::mutex m_mutex;
    std::condition_variable m_condition;
    bool m_pending = false;
};

/**
 * @brief Thread-safe settable-once slot holding a ChildResult or a fault
 */
class CompletionGate {
public:
    explicit CompletionGate(std::shared_ptr<EventSignal> signal = nullptr);

    /**
     * @brief Settle the gate with a result
     * @return True only for the first successful settle; later calls change nothing
     */
    bool trySet(const ChildResult& result);

    /**
     * @brief Settle the gate with an error
     * @return True only if the gate was still unsettled
     */
    bool trySetFault(std::exception_ptr error);

    bool isSettled() const;
    bool isFaulted() const;

    /**
     * @brief Retrieve the settled result
     * @throws The stored fault, or DelegationError if the gate is unsettled
     */
    ChildResult get() const;

    /**
     * @brief Block until settled or the timeout elapses
     * @return True if the gate is settled
     */
    bool waitFor(std::chrono::milliseconds timeout) const;

private:
    std::shared_ptr<EventSignal> m_signal;
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_condition;
    std::optional<ChildResult> m_result;
    std::exception_ptr m_fault;
    bool m_settled = false;
};

} // namespace Ramify
