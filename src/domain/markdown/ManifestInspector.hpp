/**
 * @file ManifestInspector.hpp
 * @brief YAML checks for Kubernetes manifests.
 */

#pragma once
#include <optional>
#include <string>

namespace polyglot::domain::markdown {

class ManifestInspector {
public:
    /**
     * @brief True if the text parses as YAML and one of its documents is a
     * mapping holding both "apiVersion" and "kind". Parse errors yield false.
     */
    static bool IsKubernetesManifest(const std::string& yaml);

    /** @brief "kind" of the first manifest document, lower-cased. */
    static std::optional<std::string> KindOf(const std::string& yaml);

    /** @brief metadata.namespace of the first manifest document that declares one. */
    static std::optional<std::string> NamespaceOf(const std::string& yaml);
};

} // namespace polyglot::domain::markdown
