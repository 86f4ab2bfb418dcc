// =================================================================
// src/Ramify/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Ramify/CliParser.hpp"

namespace Ramify {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Ramify: inspect task delegation configurations.");
    m_app->require_subcommand(0, 1);

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    m_app->add_option("--log-dir", m_commands.log_dir, "Write rotating log files to this directory");
    m_app->add_flag("-v,--verbose", m_commands.verbose, "Show debug output on the console");

    setupValidateCommand(*m_app);
    setupPlanCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupValidateCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("validate", "Loads a delegation configuration and prints its tool schemas.");
    sub->add_option("config", m_commands.config_path, "Path to the YAML configuration file.")
        ->required()->check(CLI::ExistingFile);
}

void CliParser::setupPlanCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("plan", "Shows how a request would be split without starting any session.");
    sub->add_option("config", m_commands.config_path, "Path to the YAML configuration file.")
        ->required()->check(CLI::ExistingFile);
    sub->add_option("-a,--args", m_commands.args_json, "Request arguments as a JSON object (default: {}).");
}

} // namespace Ramify
