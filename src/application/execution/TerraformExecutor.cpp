#include "application/execution/TerraformExecutor.hpp"
#include "application/execution/ExecutorSupport.hpp"
#include "infrastructure/ScopedWorkspace.hpp"
#include <iostream>

namespace polyglot::application::execution {

namespace tp = domain::transpile;
using domain::ExecutionResult;

namespace {
const char* kExecutor = "terraform";
}

TerraformExecutor::TerraformExecutor(domain::ProcessRunner& runner, const ExecutionSettings& settings)
    : m_runner(runner), m_settings(settings) {}

ExecutionResult TerraformExecutor::execute(const domain::PolyglotDocument& document) {
    try {
        const auto transpiled = tp::Transpilers::Terraform(document.artifacts, document.metadata, m_settings.transpile);
        const auto* config = transpiled.as<tp::TerraformConfig>();
        if (!config) return TranspileFailure(kExecutor, transpiled);

        infrastructure::ScopedWorkspace workspace(m_settings.workspaceRoot, "polyglot_tf");
        workspace.writeFile("main.tf", config->configuration);
        const std::string dir = workspace.path().string();

        if (!m_runner.findExecutable("terraform")) {
            std::cout << "[TerraformExecutor] terraform not found, mocking plan" << std::endl;
            return ExecutionResult::Success(kExecutor, {
                {"mock", true},
                {"plan", "Terraform not installed - would execute: terraform plan"},
                {"workspace", "mock"},
                {"next_step", "Install terraform to execute"}
            });
        }

        std::cout << "[TerraformExecutor] Running: terraform init in " << dir << std::endl;
        const auto init = m_runner.run(MakeRequest({"terraform", "init", "-input=false"}, m_settings, dir));
        if (!init.succeeded()) {
            auto details = FailureDetails(init);
            details["stage"] = "init";
            return ExecutionResult::Failure(kExecutor, details);
        }

        std::vector<std::string> plan = {"terraform", "plan", "-input=false"};
        for (const auto& [key, value] : config->variables) {
            plan.push_back("-var");
            plan.push_back(key + "=" + value);
        }

        std::cout << "[TerraformExecutor] Running: " << DescribeCommand(plan) << std::endl;
        const auto outcome = m_runner.run(MakeRequest(plan, m_settings, dir));
        if (!outcome.succeeded()) {
            auto details = FailureDetails(outcome);
            details["stage"] = "plan";
            return ExecutionResult::Failure(kExecutor, details);
        }

        return ExecutionResult::Success(kExecutor, {
            {"plan", outcome.output},
            {"workspace", dir},
            {"workspace_removed", true},
            {"next_step", "terraform apply"}
        });
    } catch (const std::exception& e) {
        return ExceptionFailure(kExecutor, e);
    }
}

} // namespace polyglot::application::execution
