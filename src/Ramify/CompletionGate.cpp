// =================================================================
// src/Ramify/CompletionGate.cpp
// =================================================================
// Implementation of completion gates and wake-up signals.

#include "Ramify/CompletionGate.hpp"
#include "Ramify/Errors.hpp"

namespace Ramify {

ChildResult ChildResult::succeeded(const std::string& result) {
    ChildResult child;
    child.success = true;
    child.result = result;
    return child;
}

ChildResult ChildResult::failed(const std::string& error_message) {
    ChildResult child;
    child.success = false;
    child.error_message = error_message;
    return child;
}

void EventSignal::notify() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pending = true;
    }
    m_condition.notify_all();
}

bool EventSignal::waitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    bool notified = m_condition.wait_for(lock, timeout, [this] { return m_pending; });
    m_pending = false;
    return notified;
}

CompletionGate::CompletionGate(std::shared_ptr<EventSignal> signal)
    : m_signal(std::move(signal)) {}

bool CompletionGate::trySet(const ChildResult& result) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_settled) {
            return false;
        }
        m_result = result;
        m_settled = true;
    }

    m_condition.notify_all();
    if (m_signal) {
        m_signal->notify();
    }
    return true;
}

bool CompletionGate::trySetFault(std::exception_ptr error) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_settled) {
            return false;
        }
        m_fault = error;
        m_settled = true;
    }

    m_condition.notify_all();
    if (m_signal) {
        m_signal->notify();
    }
    return true;
}

bool CompletionGate::isSettled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_settled;
}

bool CompletionGate::isFaulted() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_fault != nullptr;
}

ChildResult CompletionGate::get() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_settled) {
        throw DelegationError("Completion gate has not been settled");
    }
    if (m_fault) {
        std::rethrow_exception(m_fault);
    }
    return *m_result;
}

bool CompletionGate::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_condition.wait_for(lock, timeout, [this] { return m_settled; });
}

} // namespace Ramify
