// =================================================================
// include/Ramify/Core.hpp
// =================================================================
// Defines the command dispatcher behind the ramify executable.

#pragma once

#include "Ramify/CliParser.hpp"
#include <string>

namespace Ramify {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Runs the command selected on the command line.
     * @return An integer exit code (0 for success).
     */
    int run();

private:
    // Command Handlers
    int handleValidate();
    int handlePlan();

    const Commands& m_commands;
};

} // namespace Ramify
