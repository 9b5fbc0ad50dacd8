/**
 * @file ExecutorSupport.hpp
 * @brief Result shaping shared by the executors.
 */

#pragma once
#include <exception>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "application/execution/ExecutionSettings.hpp"
#include "domain/ExecutionResult.hpp"
#include "domain/ProcessRunner.hpp"

namespace polyglot::application::execution {

/** @brief UTC "YYYY-MM-DDTHH:MM:SSZ". */
std::string CurrentTimestampUtc();

/** @brief argv joined with spaces, for logs and mock notes. */
std::string DescribeCommand(const std::vector<std::string>& argv);

domain::ProcessRequest MakeRequest(std::vector<std::string> argv, const ExecutionSettings& settings,
                                   const std::string& workingDirectory);

/**
 * @brief Failure details for a run that did not exit 0:
 * {code, output}, plus reason "timeout" or "launch_failed".
 */
nlohmann::json FailureDetails(const domain::ProcessOutcome& outcome);

/** @brief Per-unit entry for multi-unit executors: {ok, output} or FailureDetails + ok:false. */
nlohmann::json UnitDetails(const domain::ProcessOutcome& outcome);

domain::ExecutionResult TranspileFailure(const std::string& executor, const domain::transpile::TranspileResult& result);

/** @brief Boundary conversion of an escaped exception into {code: -1, output}. */
domain::ExecutionResult ExceptionFailure(const std::string& executor, const std::exception& e);

} // namespace polyglot::application::execution
