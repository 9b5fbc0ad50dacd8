/**
 * @file PosixProcessRunner.hpp
 * @brief fork/exec implementation of ProcessRunner with output capture and timeout.
 */

#pragma once
#include "domain/ProcessRunner.hpp"

namespace polyglot::infrastructure {

/**
 * @class PosixProcessRunner
 * @brief Runs each request in its own process group so a timeout kills the
 * whole tree (sh -c children included).
 */
class PosixProcessRunner : public domain::ProcessRunner {
public:
    PosixProcessRunner();

    std::optional<std::string> findExecutable(const std::string& tool) override;
    domain::ProcessOutcome run(const domain::ProcessRequest& request) override;
};

} // namespace polyglot::infrastructure
