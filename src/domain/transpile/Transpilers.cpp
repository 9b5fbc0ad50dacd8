#include "domain/transpile/Transpilers.hpp"
#include "domain/markdown/ManifestInspector.hpp"
#include "domain/markdown/TextUtils.hpp"

namespace polyglot::domain::transpile {

using markdown::Trim;

namespace {
    std::string JoinContents(const ArtifactList& artifacts, const std::string& separator) {
        std::string out;
        for (size_t i = 0; i < artifacts.size(); ++i) {
            if (i > 0) out += separator;
            out += Trim(artifacts[i].content);
        }
        return out;
    }
}

TranspileResult Transpilers::Transpile(Target target, const ArtifactList& artifacts, const Metadata& metadata,
                                       const TranspileOptions& options) {
    switch (target) {
        case Target::Docker: return Docker(artifacts, metadata, options);
        case Target::Terraform: return Terraform(artifacts, metadata, options);
        case Target::Kubernetes: return Kubernetes(artifacts, metadata, options);
        case Target::Git: return Git(artifacts, metadata, options);
        case Target::Bash: return Bash(artifacts, metadata, options);
        case Target::Sql: return Sql(artifacts, metadata, options);
    }
    return TranspileResult::Failure("unknown_target", "Unknown transpile target");
}

TranspileResult Transpilers::Docker(const ArtifactList& artifacts, const Metadata& metadata, const TranspileOptions& options) {
    const auto dockerfiles = FilterArtifacts(artifacts, {ArtifactType::Dockerfile});
    if (dockerfiles.empty()) {
        return TranspileResult::Failure("no_dockerfile_found", "Document has no dockerfile block");
    }
    DockerConfig config;
    config.dockerfile = dockerfiles.front().content;
    if (!config.dockerfile.empty() && config.dockerfile.back() != '\n') config.dockerfile += '\n';
    config.imageTag = LookupDirective(metadata, "image").value_or(options.imageTag);
    config.buildCommand = "docker build -t " + config.imageTag + " .";
    return TranspileResult::Success(config);
}

TranspileResult Transpilers::Terraform(const ArtifactList& artifacts, const Metadata& metadata, const TranspileOptions&) {
    const auto blocks = FilterArtifacts(artifacts, {ArtifactType::Terraform});
    if (blocks.empty()) {
        return TranspileResult::Failure("no_terraform_found", "Document has no terraform block");
    }
    TerraformConfig config;
    config.configuration = JoinContents(blocks, "\n\n") + "\n";
    config.variables = CollectDirectiveParams(metadata, "terraform_vars");
    config.planCommand = "terraform plan";
    config.applyCommand = "terraform apply -auto-approve";
    return TranspileResult::Success(config);
}

TranspileResult Transpilers::Kubernetes(const ArtifactList& artifacts, const Metadata&, const TranspileOptions&) {
    const auto manifests = FilterArtifacts(artifacts, {ArtifactType::Kubernetes});
    if (manifests.empty()) {
        return TranspileResult::Failure("no_manifests_found", "Document has no kubernetes manifest");
    }
    KubernetesConfig config;
    for (const auto& m : manifests) config.manifests.push_back(Trim(m.content) + "\n");
    config.namespaceName = markdown::ManifestInspector::NamespaceOf(manifests.front().content).value_or("default");
    config.applyCommand = "kubectl apply -f -";
    return TranspileResult::Success(config);
}

TranspileResult Transpilers::Git(const ArtifactList& artifacts, const Metadata& metadata, const TranspileOptions& options) {
    const auto files = FilterArtifacts(artifacts, {ArtifactType::File});
    if (files.empty()) {
        return TranspileResult::Failure("no_files_found", "Document has no file:<path> blocks");
    }
    GitConfig config;
    for (const auto& f : files) {
        std::string content = f.content;
        if (!content.empty() && content.back() != '\n') content += '\n';
        config.files[f.location.value_or("")] = content;
    }
    const std::string message = LookupDirective(metadata, "commit_message").value_or(options.commitMessage);
    config.initCommands = {
        "git init",
        "git add .",
        "git commit -m " + ShellQuote(message)
    };
    return TranspileResult::Success(config);
}

TranspileResult Transpilers::Bash(const ArtifactList& artifacts, const Metadata& metadata, const TranspileOptions&) {
    const auto scripts = FilterArtifacts(artifacts, {ArtifactType::Bash, ArtifactType::Executable});
    if (scripts.empty()) {
        return TranspileResult::Failure("no_executable_found", "Document has no executable script block");
    }
    BashConfig config;
    config.script = JoinContents(scripts, "\n\n");
    config.shebang = "#!/bin/bash";
    config.environment = CollectDirectiveParams(metadata, "environment");
    return TranspileResult::Success(config);
}

TranspileResult Transpilers::Sql(const ArtifactList& artifacts, const Metadata& metadata, const TranspileOptions& options) {
    const auto blocks = FilterArtifacts(artifacts, {ArtifactType::Sql});
    if (blocks.empty()) {
        return TranspileResult::Failure("no_sql_found", "Document has no sql block");
    }
    SqlConfig config;
    for (const auto& block : blocks) {
        for (auto& statement : SplitSqlStatements(block.content)) config.statements.push_back(std::move(statement));
    }
    config.database = LookupDirective(metadata, "database").value_or(options.database);
    config.client = options.sqlClient;
    return TranspileResult::Success(config);
}

std::vector<std::string> Transpilers::SplitSqlStatements(const std::string& sql) {
    std::vector<std::string> statements;
    std::string current;
    char quote = 0;
    bool lineComment = false;
    bool blockComment = false;

    auto flush = [&]() {
        const std::string trimmed = Trim(current);
        if (!trimmed.empty()) statements.push_back(trimmed + ";");
        current.clear();
    };

    for (size_t i = 0; i < sql.size(); ++i) {
        const char c = sql[i];
        const char next = i + 1 < sql.size() ? sql[i + 1] : '\0';

        if (lineComment) {
            if (c == '\n') { lineComment = false; current += c; }
            continue;
        }
        if (blockComment) {
            if (c == '*' && next == '/') { blockComment = false; ++i; }
            continue;
        }
        if (quote) {
            current += c;
            if (c == quote) quote = 0;
            continue;
        }
        if (c == '-' && next == '-') { lineComment = true; ++i; continue; }
        if (c == '/' && next == '*') { blockComment = true; ++i; continue; }
        if (c == '\'' || c == '"') { quote = c; current += c; continue; }
        if (c == ';') { flush(); continue; }
        current += c;
    }
    flush();
    return statements;
}

std::string Transpilers::ShellQuote(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

} // namespace polyglot::domain::transpile
