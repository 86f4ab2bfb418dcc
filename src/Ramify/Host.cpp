// =================================================================
// src/Ramify/Host.cpp
// =================================================================
// Helpers for host interface enums.

#include "Ramify/Host.hpp"

namespace Ramify {

std::string messageKindToString(MessageKind kind) {
    switch (kind) {
        case MessageKind::INFO_ONLY: return "info_only";
        case MessageKind::STATUS_UPDATE: return "status_update";
        case MessageKind::MESSAGE: return "message";
        default: return "unknown";
    }
}

std::string toolExecutionModeToString(ToolExecutionMode mode) {
    switch (mode) {
        case ToolExecutionMode::AUTO: return "auto";
        case ToolExecutionMode::REQUIRE_ANY: return "require_any";
        case ToolExecutionMode::NONE: return "none";
        default: return "unknown";
    }
}

} // namespace Ramify
