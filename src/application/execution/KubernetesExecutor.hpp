/**
 * @file KubernetesExecutor.hpp
 * @brief Applies each manifest with `kubectl apply -f -`.
 */

#pragma once
#include "application/execution/ExecutionSettings.hpp"
#include "domain/ExecutionResult.hpp"
#include "domain/PolyglotDocument.hpp"
#include "domain/ProcessRunner.hpp"

namespace polyglot::application::execution {

/**
 * @class KubernetesExecutor
 * @brief One kubectl call per manifest; a failing manifest never stops the rest.
 */
class KubernetesExecutor {
public:
    KubernetesExecutor(domain::ProcessRunner& runner, const ExecutionSettings& settings);

    /** @brief Success details: applied, failed, results. */
    domain::ExecutionResult execute(const domain::PolyglotDocument& document);

private:
    domain::ProcessRunner& m_runner;
    const ExecutionSettings& m_settings;
};

} // namespace polyglot::application::execution
