// =================================================================
// include/Ramify/Cancellation.hpp
// =================================================================
// Cooperative cancellation with optional deadlines and parent linking.

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace Ramify {

struct CancellationState;

/**
 * @brief Read-only view of a cancellation source
 *
 * A default-constructed token is never cancelled. Tokens are cheap to copy
 * and safe to observe from any thread.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    /**
     * @brief Check whether cancellation was requested or the deadline passed
     */
    bool isCancellationRequested() const;

    /**
     * @brief Whether this token is attached to a source at all
     */
    bool canBeCancelled() const;

    /**
     * @brief Throw OperationCancelledError if cancellation was requested
     * @param what Description used in the exception message
     */
    void throwIfCancellationRequested(const std::string& what = "operation") const;

    /**
     * @brief Block until cancelled or the timeout elapses
     * @param timeout Maximum time to wait
     * @return True if the token was cancelled
     */
    bool waitFor(std::chrono::milliseconds timeout) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<const CancellationState> state);

    std::shared_ptr<const CancellationState> m_state;
};

/**
 * @brief Owner side of a cancellation signal
 *
 * A source may be linked to a parent token and may carry a deadline. It
 * reports cancelled when cancel() was called, when the deadline passed,
 * or when the parent is cancelled.
 */
class CancellationSource {
public:
    CancellationSource();

    /**
     * @brief Create a source linked to a parent token
     * @param parent Token whose cancellation propagates to this source
     * @param timeout Optional deadline measured from construction
     */
    explicit CancellationSource(const CancellationToken& parent,
                                std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * @brief Request cancellation. Idempotent.
     */
    void cancel();

    bool isCancellationRequested() const;

    /**
     * @brief Whether this source's own deadline has passed
     */
    bool hasTimedOut() const;

    /**
     * @brief Whether cancel() was called on this source itself
     */
    bool wasCancelledDirectly() const;

    CancellationToken token() const;

private:
    std::shared_ptr<CancellationState> m_state;
};

} // namespace Ramify
