#include "application/execution/GitExecutor.hpp"
#include "application/execution/ExecutorSupport.hpp"
#include "infrastructure/ScopedWorkspace.hpp"
#include <cstdlib>
#include <iostream>

namespace polyglot::application::execution {

namespace tp = domain::transpile;
using domain::ExecutionResult;
using json = nlohmann::json;

namespace {
const char* kExecutor = "git";

// A fresh repository has no identity; commit would fail without one.
std::map<std::string, std::string> commitIdentity() {
    std::map<std::string, std::string> env;
    for (const char* key : {"GIT_AUTHOR_NAME", "GIT_COMMITTER_NAME"}) {
        if (!std::getenv(key)) env[key] = "polyglot";
    }
    for (const char* key : {"GIT_AUTHOR_EMAIL", "GIT_COMMITTER_EMAIL"}) {
        if (!std::getenv(key)) env[key] = "polyglot@localhost";
    }
    return env;
}
}

GitExecutor::GitExecutor(domain::ProcessRunner& runner, const ExecutionSettings& settings)
    : m_runner(runner), m_settings(settings) {}

ExecutionResult GitExecutor::execute(const domain::PolyglotDocument& document) {
    try {
        const auto transpiled = tp::Transpilers::Git(document.artifacts, document.metadata, m_settings.transpile);
        const auto* config = transpiled.as<tp::GitConfig>();
        if (!config) return TranspileFailure(kExecutor, transpiled);

        infrastructure::ScopedWorkspace workspace(m_settings.workspaceRoot, "polyglot_repo");
        const std::string dir = workspace.path().string();

        int created = 0;
        json skipped = json::array();
        for (const auto& [path, content] : config->files) {
            if (workspace.writeFile(path, content)) {
                ++created;
            } else {
                std::cerr << "[GitExecutor] Skipping unsafe path: " << path << std::endl;
                skipped.push_back(path);
            }
        }

        const int total = static_cast<int>(config->initCommands.size());
        if (!m_runner.findExecutable("git") || !m_runner.findExecutable("sh")) {
            std::cout << "[GitExecutor] git not found, listing commands only" << std::endl;
            json output = json::array();
            for (const auto& command : config->initCommands) {
                output.push_back({{"command", command}, {"ok", true}, {"output", "git not installed - would execute: " + command}});
            }
            return ExecutionResult::Success(kExecutor, {
                {"mock", true},
                {"repository", dir},
                {"files_created", created},
                {"skipped_files", skipped},
                {"applied", total},
                {"failed", 0},
                {"git_output", output}
            });
        }

        const auto identity = commitIdentity();
        json output = json::array();
        int failed = 0;
        for (const auto& command : config->initCommands) {
            auto request = MakeRequest({"sh", "-c", command}, m_settings, dir);
            request.environment = identity;

            std::cout << "[GitExecutor] Running: " << command << std::endl;
            const auto outcome = m_runner.run(request);
            if (!outcome.succeeded()) ++failed;

            auto entry = UnitDetails(outcome);
            entry["command"] = command;
            output.push_back(entry);
        }

        return ExecutionResult::Success(kExecutor, {
            {"repository", dir},
            {"workspace_removed", true},
            {"files_created", created},
            {"skipped_files", skipped},
            {"applied", total - failed},
            {"failed", failed},
            {"git_output", output}
        });
    } catch (const std::exception& e) {
        return ExceptionFailure(kExecutor, e);
    }
}

} // namespace polyglot::application::execution
