#include "application/execution/KubernetesExecutor.hpp"
#include "application/execution/ExecutorSupport.hpp"
#include "infrastructure/ScopedWorkspace.hpp"
#include <iostream>

namespace polyglot::application::execution {

namespace tp = domain::transpile;
using domain::ExecutionResult;
using json = nlohmann::json;

namespace {
const char* kExecutor = "kubernetes";
}

KubernetesExecutor::KubernetesExecutor(domain::ProcessRunner& runner, const ExecutionSettings& settings)
    : m_runner(runner), m_settings(settings) {}

ExecutionResult KubernetesExecutor::execute(const domain::PolyglotDocument& document) {
    try {
        const auto transpiled = tp::Transpilers::Kubernetes(document.artifacts, document.metadata, m_settings.transpile);
        const auto* config = transpiled.as<tp::KubernetesConfig>();
        if (!config) return TranspileFailure(kExecutor, transpiled);

        infrastructure::ScopedWorkspace workspace(m_settings.workspaceRoot, "polyglot_k8s");
        const int total = static_cast<int>(config->manifests.size());

        if (!m_runner.findExecutable("kubectl")) {
            std::cout << "[KubernetesExecutor] kubectl not found, mocking " << total << " manifest(s)" << std::endl;
            json results = json::array();
            for (int i = 0; i < total; ++i) {
                results.push_back({{"ok", true}, {"output", "kubectl not installed - mock execution"}});
            }
            return ExecutionResult::Success(kExecutor, {
                {"mock", true},
                {"applied", total},
                {"failed", 0},
                {"namespace", config->namespaceName},
                {"results", results}
            });
        }

        json results = json::array();
        int failed = 0;
        for (const auto& manifest : config->manifests) {
            auto request = MakeRequest({"kubectl", "apply", "-f", "-"}, m_settings, workspace.path().string());
            request.standardInput = manifest;

            std::cout << "[KubernetesExecutor] Running: kubectl apply -f - (manifest "
                      << results.size() + 1 << "/" << total << ")" << std::endl;
            const auto outcome = m_runner.run(request);
            if (!outcome.succeeded()) {
                ++failed;
                std::cerr << "[KubernetesExecutor] Manifest " << results.size() + 1 << " failed" << std::endl;
            }
            results.push_back(UnitDetails(outcome));
        }

        return ExecutionResult::Success(kExecutor, {
            {"applied", total - failed},
            {"failed", failed},
            {"namespace", config->namespaceName},
            {"results", results}
        });
    } catch (const std::exception& e) {
        return ExceptionFailure(kExecutor, e);
    }
}

} // namespace polyglot::application::execution
