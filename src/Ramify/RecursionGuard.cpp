// =================================================================
// src/Ramify/RecursionGuard.cpp
// =================================================================
// Implementation of recursion depth accounting.

#include "Ramify/RecursionGuard.hpp"
#include "Ramify/Errors.hpp"
#include "Ramify/Logger.hpp"

namespace Ramify {

RecursionGuard::RecursionGuard(std::shared_ptr<Host> host)
    : m_host(std::move(host)) {}

int RecursionGuard::currentLevel(const std::shared_ptr<HostSession>& session) const {
    if (!session) {
        return 0;
    }

    try {
        int level = 0;
        std::optional<std::string> parent_id = session->getParentId();

        while (parent_id && level < MAX_WALK_DEPTH) {
            ++level;

            std::shared_ptr<HostSession> parent;
            try {
                parent = m_host ? m_host->openSession(*parent_id) : nullptr;
            } catch (const std::exception& e) {
                LOG_WARNING("RecursionGuard", "Could not open parent session " + *parent_id, e.what());
                break;
            }

            if (!parent) {
                LOG_DEBUG("RecursionGuard", "Parent session " + *parent_id + " is gone, stopping walk");
                break;
            }
            parent_id = parent->getParentId();
        }

        return level;

    } catch (const std::exception& e) {
        LOG_WARNING("RecursionGuard", "Recursion level computation failed, assuming root", e.what());
        return 0;
    }
}

void RecursionGuard::validate(int level, int max_level) {
    if (max_level < 0) {
        throw ConfigurationError("max_recursion_level must not be negative (got " + std::to_string(max_level) + ")");
    }
    if (level >= max_level) {
        throw RecursionLimitExceeded(max_level, level);
    }
}

} // namespace Ramify
