#include "application/execution/SqlExecutor.hpp"
#include "application/execution/ExecutorSupport.hpp"
#include "infrastructure/ScopedWorkspace.hpp"
#include <iostream>

namespace polyglot::application::execution {

namespace tp = domain::transpile;
using domain::ExecutionResult;
using json = nlohmann::json;

namespace {
const char* kExecutor = "sql";
constexpr size_t kPreviewLength = 50;

std::string preview(const std::string& statement) {
    if (statement.size() <= kPreviewLength) return statement;
    return statement.substr(0, kPreviewLength) + "...";
}
}

SqlExecutor::SqlExecutor(domain::ProcessRunner& runner, const ExecutionSettings& settings)
    : m_runner(runner), m_settings(settings) {}

ExecutionResult SqlExecutor::execute(const domain::PolyglotDocument& document) {
    try {
        const auto transpiled = tp::Transpilers::Sql(document.artifacts, document.metadata, m_settings.transpile);
        const auto* config = transpiled.as<tp::SqlConfig>();
        if (!config) return TranspileFailure(kExecutor, transpiled);

        infrastructure::ScopedWorkspace workspace(m_settings.workspaceRoot, "polyglot_sql");
        const int total = static_cast<int>(config->statements.size());

        if (!m_runner.findExecutable(config->client)) {
            std::cout << "[SqlExecutor] " << config->client << " not found, mocking "
                      << total << " statement(s)" << std::endl;
            json results = json::array();
            for (const auto& statement : config->statements) {
                results.push_back({{"ok", true},
                                   {"output", config->client + " not installed - would execute: " + preview(statement)}});
            }
            return ExecutionResult::Success(kExecutor, {
                {"mock", true},
                {"database", config->database},
                {"executed", total},
                {"applied", total},
                {"failed", 0},
                {"results", results}
            });
        }

        const std::vector<std::string> argv = {
            config->client, "-X", "-q", "-v", "ON_ERROR_STOP=1", "-d", config->database, "-f", "-"
        };

        json results = json::array();
        int failed = 0;
        for (const auto& statement : config->statements) {
            auto request = MakeRequest(argv, m_settings, workspace.path().string());
            request.standardInput = statement + "\n";

            std::cout << "[SqlExecutor] Running: " << preview(statement) << std::endl;
            const auto outcome = m_runner.run(request);
            if (!outcome.succeeded()) ++failed;

            auto entry = UnitDetails(outcome);
            entry["statement"] = statement;
            results.push_back(entry);
        }

        return ExecutionResult::Success(kExecutor, {
            {"database", config->database},
            {"executed", total},
            {"applied", total - failed},
            {"failed", failed},
            {"results", results}
        });
    } catch (const std::exception& e) {
        return ExceptionFailure(kExecutor, e);
    }
}

} // namespace polyglot::application::execution
