#include "domain/markdown/MetadataExtractor.hpp"
#include "domain/markdown/DirectiveScanner.hpp"
#include "domain/markdown/LinkScanner.hpp"
#include "domain/markdown/ManifestInspector.hpp"
#include "domain/markdown/TextUtils.hpp"
#include "domain/markdown/ZeroWidthScanner.hpp"
#include <algorithm>
#include <cctype>

namespace polyglot::domain::markdown {

namespace {
    bool IsShellTag(const std::string& lower) {
        return lower == "bash" || lower == "sh" || lower == "shell" || lower == "zsh";
    }

    bool HasExecutableDirective(const std::vector<Directive>& directives) {
        return std::any_of(directives.begin(), directives.end(), [](const Directive& d) {
            return d.ns == "polyglot" && d.name == "executable";
        });
    }

    // Blocks whose tag names no other artifact type are tried as YAML.
    bool IsManifestCandidate(const FencedBlock& block) {
        return !MetadataExtractor::ArtifactTypeForFence(block).has_value() &&
               !IsShellTag(ToLower(block.lang));
    }

    Artifact MakeArtifact(ArtifactType type, const FencedBlock& block) {
        Artifact artifact;
        artifact.type = type;
        artifact.content = block.content;
        artifact.sourceLine = block.startLine;
        artifact.fenceLanguage = block.lang;
        return artifact;
    }

    // "<ns>:<key>=<value>" declares metadata[<key>] directly; later declarations win.
    // Value-less directives only name the document type when none was declared.
    void MergeDirectives(const std::vector<Directive>& directives, Metadata& metadata) {
        const Directive* firstBare = nullptr;
        for (const auto& d : directives) {
            if (d.jsonPayload) {
                for (const auto& [k, v] : d.params) metadata[d.ns + "." + k] = v;
                continue;
            }
            const std::string key = d.ns + "." + d.name;
            metadata[key] = d.value.value_or("true");
            for (const auto& [k, v] : d.params) metadata[key + "." + k] = v;

            if (d.value) {
                metadata[d.name] = *d.value;
            } else if (!firstBare) {
                firstBare = &d;
            }
        }

        if (firstBare && metadata.find("type") == metadata.end()) {
            metadata["type"] = firstBare->ns;
            if (metadata.find("subtype") == metadata.end()) metadata["subtype"] = firstBare->name;
        }
    }
}

std::optional<ArtifactType> MetadataExtractor::ArtifactTypeForFence(const FencedBlock& block) {
    const std::string lower = ToLower(block.lang);
    if (lower == "dockerfile") return ArtifactType::Dockerfile;
    if (lower == "terraform" || lower == "hcl" || lower == "tf") return ArtifactType::Terraform;
    if (lower == "sql") return ArtifactType::Sql;
    if (!FilePathOfFence(block.info).empty()) return ArtifactType::File;
    return std::nullopt;
}

std::string MetadataExtractor::FilePathOfFence(const std::string& info) {
    if (!StartsWith(info, "file:")) return "";
    return Trim(info.substr(5));
}

std::string MetadataExtractor::SqlOperationOf(const std::string& sql) {
    const std::string trimmed = Trim(sql);
    std::string::size_type end = 0;
    while (end < trimmed.size() && std::isalpha(static_cast<unsigned char>(trimmed[end]))) ++end;
    const std::string keyword = ToLower(trimmed.substr(0, end));
    for (const char* op : {"create", "alter", "drop", "insert", "update", "delete", "select"}) {
        if (keyword == op) return keyword;
    }
    return "unknown";
}

Extraction MetadataExtractor::Extract(const std::string& text) {
    Extraction result;
    const auto blocks = FenceScanner::Scan(text);
    result.directives = DirectiveScanner::Scan(text);
    result.contentLinks = LinkScanner::Scan(text);

    const bool executableDeclared = HasExecutableDirective(result.directives);
    bool hasDocker = false, hasTerraform = false, hasKubernetes = false;
    bool hasExecutable = false, hasFiles = false, hasSql = false;

    for (const auto& block : blocks) {
        const std::string lower = ToLower(block.lang);
        const auto type = ArtifactTypeForFence(block);

        if (type) {
            Artifact artifact = MakeArtifact(*type, block);
            switch (*type) {
                case ArtifactType::Dockerfile: hasDocker = true; break;
                case ArtifactType::Terraform: hasTerraform = true; break;
                case ArtifactType::Sql:
                    hasSql = true;
                    artifact.kind = SqlOperationOf(block.content);
                    break;
                case ArtifactType::File:
                    hasFiles = true;
                    artifact.location = FilePathOfFence(block.info);
                    break;
                case ArtifactType::Kubernetes:
                case ArtifactType::Bash:
                case ArtifactType::Executable:
                    break;
            }
            result.artifacts.push_back(std::move(artifact));
        } else if (IsShellTag(lower)) {
            if (!executableDeclared) continue;
            Artifact artifact = MakeArtifact(lower == "bash" ? ArtifactType::Bash : ArtifactType::Executable, block);
            artifact.executable = true;
            result.artifacts.push_back(std::move(artifact));
            hasExecutable = true;
        } else if (IsManifestCandidate(block) && ManifestInspector::IsKubernetesManifest(block.content)) {
            Artifact artifact = MakeArtifact(ArtifactType::Kubernetes, block);
            artifact.kind = ManifestInspector::KindOf(block.content).value_or("unknown");
            result.artifacts.push_back(std::move(artifact));
            hasKubernetes = true;
        }
    }

    if (hasDocker) result.language = Language::Dockerfile;
    else if (hasTerraform) result.language = Language::Terraform;
    else if (hasKubernetes) result.language = Language::Kubernetes;
    else if (hasExecutable) result.language = Language::Executable;
    else if (hasFiles) result.language = Language::Git;
    else if (hasSql) result.language = Language::Sql;

    MergeDirectives(result.directives, result.metadata);

    const auto runs = ZeroWidthScanner::Scan(text);
    if (!runs.empty()) {
        const HiddenPayload payload = ZeroWidthScanner::DecodeAll(runs);
        size_t count = 0;
        for (const auto& run : runs) count += run.chars.size();
        result.metadata["hidden.encoding"] = payload.encoding;
        result.metadata["hidden.payload"] = payload.content;
        result.metadata["hidden.count"] = std::to_string(count);
        if (result.language == Language::None && result.metadata.find("type") == result.metadata.end()) {
            result.metadata["type"] = payload.encoding;
        }
    }

    return result;
}

bool MetadataExtractor::IsPolyglot(const std::string& text) {
    if (ZeroWidthScanner::Contains(text)) return true;

    const auto directives = DirectiveScanner::Scan(text);
    if (!directives.empty()) return true;

    const auto blocks = FenceScanner::Scan(text);
    for (const auto& block : blocks) {
        if (ArtifactTypeForFence(block)) return true;
    }
    for (const auto& block : blocks) {
        if (IsManifestCandidate(block) && ManifestInspector::IsKubernetesManifest(block.content)) return true;
    }
    return false;
}

} // namespace polyglot::domain::markdown
