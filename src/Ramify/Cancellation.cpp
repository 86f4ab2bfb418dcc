// =================================================================
// src/Ramify/Cancellation.cpp
// =================================================================
// Implementation of cancellation sources and tokens.

#include "Ramify/Cancellation.hpp"
#include "Ramify/Errors.hpp"
#include <algorithm>
#include <atomic>
#include <thread>

namespace Ramify {

struct CancellationState {
    std::atomic<bool> cancelled{false};
    std::optional<std::chrono::steady_clock::time_point> deadline;
    std::shared_ptr<const CancellationState> parent;

    bool deadlineReached() const {
        return deadline && std::chrono::steady_clock::now() >= *deadline;
    }

    bool isCancelled() const {
        if (cancelled.load()) {
            return true;
        }
        if (deadlineReached()) {
            return true;
        }
        return parent && parent->isCancelled();
    }
};

namespace {
// Upper bound on a single sleep while polling for cancellation
constexpr std::chrono::milliseconds POLL_INTERVAL(10);
}

CancellationToken::CancellationToken(std::shared_ptr<const CancellationState> state)
    : m_state(std::move(state)) {}

bool CancellationToken::isCancellationRequested() const {
    return m_state && m_state->isCancelled();
}

bool CancellationToken::canBeCancelled() const {
    return m_state != nullptr;
}

void CancellationToken::throwIfCancellationRequested(const std::string& what) const {
    if (isCancellationRequested()) {
        throw OperationCancelledError("The " + what + " was cancelled");
    }
}

bool CancellationToken::waitFor(std::chrono::milliseconds timeout) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!isCancellationRequested()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, POLL_INTERVAL));
    }
    return true;
}

CancellationSource::CancellationSource()
    : m_state(std::make_shared<CancellationState>()) {}

CancellationSource::CancellationSource(const CancellationToken& parent,
                                       std::optional<std::chrono::milliseconds> timeout)
    : m_state(std::make_shared<CancellationState>()) {
    m_state->parent = parent.m_state;
    if (timeout) {
        m_state->deadline = std::chrono::steady_clock::now() + *timeout;
    }
}

void CancellationSource::cancel() {
    m_state->cancelled.store(true);
}

bool CancellationSource::isCancellationRequested() const {
    return m_state->isCancelled();
}

bool CancellationSource::hasTimedOut() const {
    return m_state->deadlineReached();
}

bool CancellationSource::wasCancelledDirectly() const {
    return m_state->cancelled.load();
}

CancellationToken CancellationSource::token() const {
    return CancellationToken(m_state);
}

} // namespace Ramify
