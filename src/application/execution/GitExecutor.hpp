/**
 * @file GitExecutor.hpp
 * @brief Materializes file blocks in a workspace and runs the git init commands.
 */

#pragma once
#include "application/execution/ExecutionSettings.hpp"
#include "domain/ExecutionResult.hpp"
#include "domain/PolyglotDocument.hpp"
#include "domain/ProcessRunner.hpp"

namespace polyglot::application::execution {

/**
 * @class GitExecutor
 * @brief Unsafe file paths are skipped and listed under skipped_files.
 */
class GitExecutor {
public:
    GitExecutor(domain::ProcessRunner& runner, const ExecutionSettings& settings);

    /** @brief Success details: repository, files_created, applied, failed, git_output. */
    domain::ExecutionResult execute(const domain::PolyglotDocument& document);

private:
    domain::ProcessRunner& m_runner;
    const ExecutionSettings& m_settings;
};

} // namespace polyglot::application::execution
