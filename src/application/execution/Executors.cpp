#include "application/execution/Executors.hpp"
#include "application/execution/DockerExecutor.hpp"
#include "application/execution/GitExecutor.hpp"
#include "application/execution/KubernetesExecutor.hpp"
#include "application/execution/ShellExecutor.hpp"
#include "application/execution/SqlExecutor.hpp"
#include "application/execution/TerraformExecutor.hpp"

namespace polyglot::application::execution {

using domain::Language;

const char* ExecutorKindToString(ExecutorKind kind) {
    switch (kind) {
        case ExecutorKind::Docker: return "docker";
        case ExecutorKind::Terraform: return "terraform";
        case ExecutorKind::Kubernetes: return "kubernetes";
        case ExecutorKind::Shell: return "shell";
        case ExecutorKind::Git: return "git";
        case ExecutorKind::Sql: return "sql";
        case ExecutorKind::Noop: return "noop";
    }
    return "noop";
}

ExecutorKind ExecutorKindFor(Language language) {
    switch (language) {
        case Language::Dockerfile: return ExecutorKind::Docker;
        case Language::Terraform: return ExecutorKind::Terraform;
        case Language::Kubernetes: return ExecutorKind::Kubernetes;
        case Language::Executable: return ExecutorKind::Shell;
        case Language::Git: return ExecutorKind::Git;
        case Language::Sql: return ExecutorKind::Sql;
        case Language::None: return ExecutorKind::Noop;
    }
    return ExecutorKind::Noop;
}

domain::ExecutionResult ExecuteNoop(const domain::PolyglotDocument&) {
    return domain::ExecutionResult::Success("noop", {{"message", "documentation only"}});
}

domain::ExecutionResult ExecuteDocument(const domain::PolyglotDocument& document,
                                        domain::ProcessRunner& runner,
                                        const ExecutionSettings& settings) {
    switch (ExecutorKindFor(document.language)) {
        case ExecutorKind::Docker: return DockerExecutor(runner, settings).execute(document);
        case ExecutorKind::Terraform: return TerraformExecutor(runner, settings).execute(document);
        case ExecutorKind::Kubernetes: return KubernetesExecutor(runner, settings).execute(document);
        case ExecutorKind::Shell: return ShellExecutor(runner, settings).execute(document);
        case ExecutorKind::Git: return GitExecutor(runner, settings).execute(document);
        case ExecutorKind::Sql: return SqlExecutor(runner, settings).execute(document);
        case ExecutorKind::Noop: return ExecuteNoop(document);
    }
    return ExecuteNoop(document);
}

} // namespace polyglot::application::execution
