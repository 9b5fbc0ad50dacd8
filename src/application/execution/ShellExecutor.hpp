/**
 * @file ShellExecutor.hpp
 * @brief Runs the document script with `bash -c`, falling back to `sh -c`.
 */

#pragma once
#include "application/execution/ExecutionSettings.hpp"
#include "domain/ExecutionResult.hpp"
#include "domain/PolyglotDocument.hpp"
#include "domain/ProcessRunner.hpp"

namespace polyglot::application::execution {

class ShellExecutor {
public:
    ShellExecutor(domain::ProcessRunner& runner, const ExecutionSettings& settings);

    /** @brief Success details: output, exit_code. */
    domain::ExecutionResult execute(const domain::PolyglotDocument& document);

private:
    domain::ProcessRunner& m_runner;
    const ExecutionSettings& m_settings;
};

} // namespace polyglot::application::execution
