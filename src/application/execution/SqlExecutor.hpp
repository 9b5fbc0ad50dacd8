/**
 * @file SqlExecutor.hpp
 * @brief Runs SQL statements through a command-line client (psql by default).
 */

#pragma once
#include "application/execution/ExecutionSettings.hpp"
#include "domain/ExecutionResult.hpp"
#include "domain/PolyglotDocument.hpp"
#include "domain/ProcessRunner.hpp"

namespace polyglot::application::execution {

/**
 * @class SqlExecutor
 * @brief One client call per statement, statement on stdin. Failures are counted, not fatal.
 */
class SqlExecutor {
public:
    SqlExecutor(domain::ProcessRunner& runner, const ExecutionSettings& settings);

    /** @brief Success details: executed, applied, failed, results. */
    domain::ExecutionResult execute(const domain::PolyglotDocument& document);

private:
    domain::ProcessRunner& m_runner;
    const ExecutionSettings& m_settings;
};

} // namespace polyglot::application::execution
