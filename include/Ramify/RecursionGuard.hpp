// =================================================================
// include/Ramify/RecursionGuard.hpp
// =================================================================
// Depth accounting for nested delegation.

#pragma once

#include "Ramify/Host.hpp"
#include <memory>

namespace Ramify {

/**
 * @brief Computes how deep a session sits in the delegation tree
 */
class RecursionGuard {
public:
    static const int MAX_WALK_DEPTH = 100;

    explicit RecursionGuard(std::shared_ptr<Host> host);

    /**
     * @brief Number of ancestors above the given session
     *
     * A parent that cannot be opened is still counted, and ends the walk.
     * Any other failure yields 0.
     */
    int currentLevel(const std::shared_ptr<HostSession>& session) const;

    /**
     * @brief Check a level against the configured maximum
     * @throws ConfigurationError if max_level is negative
     * @throws RecursionLimitExceeded if level >= max_level
     */
    static void validate(int level, int max_level);

private:
    std::shared_ptr<Host> m_host;
};

} // namespace Ramify
