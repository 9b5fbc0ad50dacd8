#include "domain/markdown/ManifestInspector.hpp"
#include "domain/markdown/TextUtils.hpp"
#include <vector>
#include <yaml-cpp/yaml.h>

namespace polyglot::domain::markdown {

namespace {
    std::vector<YAML::Node> LoadDocuments(const std::string& yaml) {
        try {
            return YAML::LoadAll(yaml);
        } catch (const YAML::Exception&) {
            return {};
        }
    }

    bool IsManifestNode(const YAML::Node& node) {
        return node.IsMap() && node["apiVersion"] && node["kind"];
    }

    std::optional<std::string> ScalarAt(const YAML::Node& node) {
        if (!node || !node.IsScalar()) return std::nullopt;
        return node.as<std::string>();
    }
}

bool ManifestInspector::IsKubernetesManifest(const std::string& yaml) {
    for (const auto& doc : LoadDocuments(yaml)) {
        if (IsManifestNode(doc)) return true;
    }
    return false;
}

std::optional<std::string> ManifestInspector::KindOf(const std::string& yaml) {
    for (const auto& doc : LoadDocuments(yaml)) {
        if (!IsManifestNode(doc)) continue;
        if (auto kind = ScalarAt(doc["kind"])) return ToLower(*kind);
    }
    return std::nullopt;
}

std::optional<std::string> ManifestInspector::NamespaceOf(const std::string& yaml) {
    for (const auto& doc : LoadDocuments(yaml)) {
        if (!IsManifestNode(doc)) continue;
        const YAML::Node metadata = doc["metadata"];
        if (metadata && metadata.IsMap()) {
            if (auto ns = ScalarAt(metadata["namespace"])) return ns;
        }
    }
    return std::nullopt;
}

} // namespace polyglot::domain::markdown
