/**
 * @file DockerExecutor.hpp
 * @brief Builds the document's Dockerfile with `docker build`.
 */

#pragma once
#include "application/execution/ExecutionSettings.hpp"
#include "domain/ExecutionResult.hpp"
#include "domain/PolyglotDocument.hpp"
#include "domain/ProcessRunner.hpp"

namespace polyglot::application::execution {

class DockerExecutor {
public:
    DockerExecutor(domain::ProcessRunner& runner, const ExecutionSettings& settings);

    /** @brief Success details: image, output, built_at. */
    domain::ExecutionResult execute(const domain::PolyglotDocument& document);

private:
    domain::ProcessRunner& m_runner;
    const ExecutionSettings& m_settings;
};

} // namespace polyglot::application::execution
