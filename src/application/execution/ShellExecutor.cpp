#include "application/execution/ShellExecutor.hpp"
#include "application/execution/ExecutorSupport.hpp"
#include "infrastructure/ScopedWorkspace.hpp"
#include <iostream>

namespace polyglot::application::execution {

namespace tp = domain::transpile;
using domain::ExecutionResult;

namespace {
const char* kExecutor = "shell";
}

ShellExecutor::ShellExecutor(domain::ProcessRunner& runner, const ExecutionSettings& settings)
    : m_runner(runner), m_settings(settings) {}

ExecutionResult ShellExecutor::execute(const domain::PolyglotDocument& document) {
    try {
        const auto transpiled = tp::Transpilers::Bash(document.artifacts, document.metadata, m_settings.transpile);
        const auto* config = transpiled.as<tp::BashConfig>();
        if (!config) return TranspileFailure(kExecutor, transpiled);

        infrastructure::ScopedWorkspace workspace(m_settings.workspaceRoot, "polyglot_sh");

        std::string shell;
        if (m_runner.findExecutable("bash")) {
            shell = "bash";
        } else if (m_runner.findExecutable("sh")) {
            shell = "sh";
        } else {
            std::cout << "[ShellExecutor] No shell found, mocking script run" << std::endl;
            return ExecutionResult::Success(kExecutor, {
                {"mock", true},
                {"output", "No shell found (bash/sh) - would execute " +
                           std::to_string(config->script.size()) + " byte script"},
                {"exit_code", 0}
            });
        }

        auto request = MakeRequest({shell, "-c", config->script}, m_settings, workspace.path().string());
        request.environment = config->environment;

        std::cout << "[ShellExecutor] Running script with " << shell << std::endl;
        const auto outcome = m_runner.run(request);
        if (!outcome.succeeded()) {
            auto details = FailureDetails(outcome);
            details["exit_code"] = details["code"];
            return ExecutionResult::Failure(kExecutor, details);
        }

        return ExecutionResult::Success(kExecutor, {
            {"output", outcome.output},
            {"exit_code", outcome.exitCode}
        });
    } catch (const std::exception& e) {
        return ExceptionFailure(kExecutor, e);
    }
}

} // namespace polyglot::application::execution
