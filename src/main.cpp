// =================================================================
// src/main.cpp
// =================================================================
// Entry point for the ramify command line tool.

#include "Ramify/CliParser.hpp"
#include "Ramify/Core.hpp"
#include <iostream>

int main(int argc, char** argv) {
    Ramify::CliParser parser;
    auto app = parser.setupCli();

    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }

    if (parser.getCommands().active_command.empty()) {
        std::cout << app->help() << std::endl;
        return 0;
    }

    Ramify::Core core(parser.getCommands());

    try {
        return core.run();
    } catch (const std::exception& e) {
        std::cerr << "Error during execution: " << e.what() << std::endl;
        return 1;
    }
}
