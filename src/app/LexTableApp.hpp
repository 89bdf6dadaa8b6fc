/**
 * @file LexTableApp.hpp
 * @brief Command-line entry point for LexTable.
 */

#pragma once

#include <string>
#include <vector>
#include "application/AppServices.hpp"

namespace lextable::app {

/**
 * @class LexTableApp
 * @brief Parses the command line, wires the services and runs one command.
 *
 * Usage: lextable [--config settings.json] <command>
 *   validate-template [path]
 *   run --mode quick|full [--template path] [--csv]
 *   serve
 */
class LexTableApp {
public:
    /** @return Process exit code. */
    int Run(const std::vector<std::string>& args);

private:
    /** @brief Composition root. */
    void Init(const std::string& configPath);
    void Shutdown();

    int ValidateTemplate(const std::vector<std::string>& args);
    int RunJob(const std::vector<std::string>& args);
    int Serve();

    static void PrintUsage();

    application::AppServices m_services;
};

} // namespace lextable::app
