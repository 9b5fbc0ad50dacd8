/**
 * @file TerraformExecutor.hpp
 * @brief Runs `terraform init` and `terraform plan` over the document's configuration.
 */

#pragma once
#include "application/execution/ExecutionSettings.hpp"
#include "domain/ExecutionResult.hpp"
#include "domain/PolyglotDocument.hpp"
#include "domain/ProcessRunner.hpp"

namespace polyglot::application::execution {

/**
 * @class TerraformExecutor
 * @brief Plans only; applying is left to the caller (next_step).
 */
class TerraformExecutor {
public:
    TerraformExecutor(domain::ProcessRunner& runner, const ExecutionSettings& settings);

    /** @brief Success details: plan, directory, next_step. */
    domain::ExecutionResult execute(const domain::PolyglotDocument& document);

private:
    domain::ProcessRunner& m_runner;
    const ExecutionSettings& m_settings;
};

} // namespace polyglot::application::execution
