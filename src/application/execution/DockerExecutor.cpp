#include "application/execution/DockerExecutor.hpp"
#include "application/execution/ExecutorSupport.hpp"
#include "infrastructure/ScopedWorkspace.hpp"
#include <iostream>

namespace polyglot::application::execution {

namespace tp = domain::transpile;
using domain::ExecutionResult;

namespace {
const char* kExecutor = "docker";
}

DockerExecutor::DockerExecutor(domain::ProcessRunner& runner, const ExecutionSettings& settings)
    : m_runner(runner), m_settings(settings) {}

ExecutionResult DockerExecutor::execute(const domain::PolyglotDocument& document) {
    try {
        const auto transpiled = tp::Transpilers::Docker(document.artifacts, document.metadata, m_settings.transpile);
        const auto* config = transpiled.as<tp::DockerConfig>();
        if (!config) return TranspileFailure(kExecutor, transpiled);

        infrastructure::ScopedWorkspace workspace(m_settings.workspaceRoot, "polyglot_docker");
        workspace.writeFile("Dockerfile", config->dockerfile);

        const std::vector<std::string> argv = {
            "docker", "build", "-f", (workspace.path() / "Dockerfile").string(),
            "-t", config->imageTag, m_settings.dockerBuildContext
        };

        if (!m_runner.findExecutable("docker")) {
            std::cout << "[DockerExecutor] docker not found, mocking build of " << config->imageTag << std::endl;
            return ExecutionResult::Success(kExecutor, {
                {"mock", true},
                {"image", config->imageTag},
                {"output", "docker not installed - would execute: " + DescribeCommand(argv)},
                {"built_at", CurrentTimestampUtc()}
            });
        }

        std::cout << "[DockerExecutor] Running: " << DescribeCommand(argv) << std::endl;
        const auto outcome = m_runner.run(MakeRequest(argv, m_settings, ""));
        if (!outcome.succeeded()) {
            return ExecutionResult::Failure(kExecutor, FailureDetails(outcome));
        }

        return ExecutionResult::Success(kExecutor, {
            {"image", config->imageTag},
            {"output", outcome.output},
            {"built_at", CurrentTimestampUtc()}
        });
    } catch (const std::exception& e) {
        return ExceptionFailure(kExecutor, e);
    }
}

} // namespace polyglot::application::execution
