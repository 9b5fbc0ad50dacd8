/**
 * @file Artifact.hpp
 * @brief Typed payload extracted from a polyglot document.
 */

#pragma once
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace polyglot::domain {

/**
 * @enum ArtifactType
 * @brief Categorization of extracted payloads.
 */
enum class ArtifactType {
    Dockerfile,
    Terraform,
    Kubernetes,
    Sql,
    File,
    Bash,
    Executable
};

inline const char* ArtifactTypeToString(ArtifactType type) {
    switch (type) {
        case ArtifactType::Dockerfile: return "dockerfile";
        case ArtifactType::Terraform: return "terraform";
        case ArtifactType::Kubernetes: return "kubernetes";
        case ArtifactType::Sql: return "sql";
        case ArtifactType::File: return "file";
        case ArtifactType::Bash: return "bash";
        case ArtifactType::Executable: return "executable";
    }
    return "file";
}

/**
 * @struct Artifact
 * @brief Immutable once produced by the metadata extractor.
 */
struct Artifact {
    ArtifactType type = ArtifactType::File;
    std::string content;
    std::optional<std::string> location;  ///< Target path for file artifacts.
    bool executable = false;
    int sourceLine = 0;                   ///< Line of the opening fence.
    std::string fenceLanguage;            ///< Tag as written in the document.
    std::optional<std::string> kind;      ///< Manifest kind (kubernetes) or leading statement keyword (sql).
};

using ArtifactList = std::vector<Artifact>;

/** @brief Artifacts of the given types, in document order. */
inline ArtifactList FilterArtifacts(const ArtifactList& artifacts, std::initializer_list<ArtifactType> types) {
    ArtifactList result;
    for (const auto& artifact : artifacts) {
        for (ArtifactType t : types) {
            if (artifact.type == t) {
                result.push_back(artifact);
                break;
            }
        }
    }
    return result;
}

} // namespace polyglot::domain
