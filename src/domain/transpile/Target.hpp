/**
 * @file Target.hpp
 * @brief Closed set of transpilation targets.
 */

#pragma once
#include <array>
#include <optional>
#include <string>
#include "domain/Artifact.hpp"
#include "domain/Language.hpp"

namespace polyglot::domain::transpile {

enum class Target {
    Docker,
    Terraform,
    Kubernetes,
    Git,
    Bash,
    Sql
};

inline constexpr std::array<Target, 6> kAllTargets = {
    Target::Docker, Target::Terraform, Target::Kubernetes,
    Target::Git,    Target::Bash,      Target::Sql
};

inline const char* TargetToString(Target target) {
    switch (target) {
        case Target::Docker: return "docker";
        case Target::Terraform: return "terraform";
        case Target::Kubernetes: return "kubernetes";
        case Target::Git: return "git";
        case Target::Bash: return "bash";
        case Target::Sql: return "sql";
    }
    return "docker";
}

inline std::optional<Target> TargetFromString(const std::string& name) {
    for (Target target : kAllTargets) {
        if (name == TargetToString(target)) return target;
    }
    return std::nullopt;
}

/** @brief Target that executes a document of the given language; none for plain Markdown. */
inline std::optional<Target> TargetForLanguage(Language language) {
    switch (language) {
        case Language::Dockerfile: return Target::Docker;
        case Language::Terraform: return Target::Terraform;
        case Language::Kubernetes: return Target::Kubernetes;
        case Language::Executable: return Target::Bash;
        case Language::Git: return Target::Git;
        case Language::Sql: return Target::Sql;
        case Language::None: return std::nullopt;
    }
    return std::nullopt;
}

/** @brief Target consuming an artifact type. */
inline Target TargetForArtifact(ArtifactType type) {
    switch (type) {
        case ArtifactType::Dockerfile: return Target::Docker;
        case ArtifactType::Terraform: return Target::Terraform;
        case ArtifactType::Kubernetes: return Target::Kubernetes;
        case ArtifactType::Sql: return Target::Sql;
        case ArtifactType::File: return Target::Git;
        case ArtifactType::Bash:
        case ArtifactType::Executable: return Target::Bash;
    }
    return Target::Bash;
}

} // namespace polyglot::domain::transpile
