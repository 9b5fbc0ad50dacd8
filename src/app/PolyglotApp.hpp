/**
 * @file PolyglotApp.hpp
 * @brief Command-line front end for the polyglot pipeline.
 */

#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace polyglot::app {

/**
 * @class PolyglotApp
 * @brief Composition root plus command dispatch.
 *
 * Exit codes: 0 success, 1 failed result, 2 usage or input error.
 */
class PolyglotApp {
public:
    /**
     * @brief Parses options, wires services, runs one command.
     * @return Process exit code.
     */
    int Run(int argc, char** argv);

private:
    /**
     * @brief Loads settings and builds the service graph.
     * @param configPath settings.json path; empty selects the XDG default.
     */
    void Init(const std::string& configPath);

    /** @brief Drains pending result writes. */
    void Shutdown();

    int dispatch(const std::string& command, const std::vector<std::string>& args);
    int runTranspile(const std::vector<std::string>& args);

    infrastructure::PipelineConfig m_config;
    application::AppServices m_services;
    std::ostream* m_out = nullptr;
};

} // namespace polyglot::app
