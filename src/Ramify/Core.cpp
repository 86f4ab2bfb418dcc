// =================================================================
// src/Ramify/Core.cpp
// =================================================================
// Implementation of the command dispatcher.

#include "Ramify/Core.hpp"
#include "Ramify/DelegationConfigLoader.hpp"
#include "Ramify/Errors.hpp"
#include "Ramify/Logger.hpp"
#include "Ramify/ParallelOrchestrator.hpp"
#include "Ramify/ParallelSourceExtractor.hpp"
#include "Ramify/ParameterValidator.hpp"
#include <chrono>
#include <iostream>
#include <nlohmann/json.hpp>

namespace Ramify {

Core::Core(const Commands& commands) : m_commands(commands) {
    Logger& logger = Logger::getInstance();
    logger.setConsoleLogLevel(m_commands.verbose ? LogLevel::DEBUG : LogLevel::WARNING);
    if (!m_commands.log_dir.empty()) {
        logger.initialize(m_commands.log_dir);
    }
}

int Core::run() {
    if (m_commands.active_command.empty()) {
        return 0;
    }

    auto start = std::chrono::steady_clock::now();
    Logger::getInstance().logSessionStart(m_commands.active_command, m_commands.config_path);

    int exit_code = 1;
    if (m_commands.active_command == "validate") {
        exit_code = handleValidate();
    } else if (m_commands.active_command == "plan") {
        exit_code = handlePlan();
    } else {
        std::cerr << "Error: Unknown command '" << m_commands.active_command << "'." << std::endl;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    Logger::getInstance().logSessionEnd(m_commands.active_command, exit_code, static_cast<long>(duration.count()));
    Logger::getInstance().flush();
    return exit_code;
}

int Core::handleValidate() {
    DelegationConfig config;
    try {
        config = DelegationConfigLoader::loadFromFile(m_commands.config_path);
    } catch (const ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Configuration '" << config.function_name << "' is valid." << std::endl;
    std::cout << "Mode: " << (config.isParallel()
                                  ? "parallel (" + parallelExecutionTypeToString(config.parallel->execution_type) + ")"
                                  : std::string("single child session"))
              << std::endl;
    std::cout << "Dangling behavior: " << danglingBehaviorToString(config.dangling_behavior) << std::endl;
    std::cout << "Max recursion level: " << config.max_recursion_level << std::endl;

    nlohmann::json tools = nlohmann::json::array();
    tools.push_back(config.getDelegationToolSchema().toJson());
    tools.push_back(config.getReturnToolSchema().toJson());
    if (auto error_schema = config.getErrorToolSchema()) {
        tools.push_back(error_schema->toJson());
    }

    std::cout << "\n--- Tool Schemas ---" << std::endl;
    std::cout << tools.dump(2) << std::endl;
    return 0;
}

int Core::handlePlan() {
    DelegationConfig config;
    try {
        config = DelegationConfigLoader::loadFromFile(m_commands.config_path);
    } catch (const ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    ArgumentMap args;
    try {
        nlohmann::json parsed = m_commands.args_json.empty()
            ? nlohmann::json::object()
            : nlohmann::json::parse(m_commands.args_json);
        args = argumentsFromJson(parsed);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Error: --args is not valid JSON: " << e.what() << std::endl;
        return 1;
    } catch (const ValidationError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    ValidationReport report = ParameterValidator::validate(config.input_parameters, args);
    std::cout << "--- Validation ---" << std::endl;
    if (report.isValid()) {
        std::cout << "Arguments are valid." << std::endl;
    } else {
        std::cout << report.describe() << std::endl;
    }

    std::cout << "\n--- Execution Plan ---" << std::endl;
    if (!config.isParallel()) {
        std::cout << "A single child session receives the full request." << std::endl;
        return report.isValid() ? 0 : 1;
    }

    std::vector<WorkItem> items;
    try {
        items = ParallelSourceExtractor::extract(args, *config.parallel);
    } catch (const ConfigurationError& e) {
        std::cout << "Parallel execution error: " << e.what() << std::endl;
        return 1;
    }

    if (items.empty()) {
        std::cout << "No valid parameters for parallel execution" << std::endl;
        return 1;
    }

    std::cout << "Work items (" << items.size() << "):" << std::endl;
    for (size_t i = 0; i < items.size(); ++i) {
        std::cout << "  " << (i + 1) << ". " << items[i].name << "=" << items[i].value.toDisplayString()
                  << std::endl;
    }

    const ParallelConfig& parallel = *config.parallel;
    std::cout << "Effective concurrency: "
              << ParallelOrchestrator::effectiveConcurrency(parallel.max_concurrency, items.size()) << std::endl;
    std::cout << "Result strategy: " << resultStrategyToString(parallel.result_strategy) << std::endl;
    std::cout << "Session timeout: " << parallel.session_timeout_ms << " ms" << std::endl;

    return report.isValid() ? 0 : 1;
}

} // namespace Ramify
