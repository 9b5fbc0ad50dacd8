/**
 * @file Executors.hpp
 * @brief Language -> executor routing.
 */

#pragma once
#include "application/execution/ExecutionSettings.hpp"
#include "domain/ExecutionResult.hpp"
#include "domain/PolyglotDocument.hpp"
#include "domain/ProcessRunner.hpp"

namespace polyglot::application::execution {

enum class ExecutorKind {
    Docker,
    Terraform,
    Kubernetes,
    Shell,
    Git,
    Sql,
    Noop
};

const char* ExecutorKindToString(ExecutorKind kind);

/** @brief Total over Language; None routes to Noop. */
ExecutorKind ExecutorKindFor(domain::Language language);

/**
 * @brief Runs the document through the executor of its language.
 * Never throws.
 */
domain::ExecutionResult ExecuteDocument(const domain::PolyglotDocument& document,
                                        domain::ProcessRunner& runner,
                                        const ExecutionSettings& settings);

/** @brief Documentation-only documents: no side effects. */
domain::ExecutionResult ExecuteNoop(const domain::PolyglotDocument& document);

} // namespace polyglot::application::execution
