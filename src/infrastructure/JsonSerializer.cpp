#include "infrastructure/JsonSerializer.hpp"
#include <type_traits>

namespace polyglot::infrastructure {

using json = nlohmann::json;
using namespace polyglot::domain;
namespace tp = polyglot::domain::transpile;

namespace {

json pointToJson(const Point& p) {
    return {{"line", p.line}, {"column", p.column}};
}

json dataToJson(const NodeData& data) {
    json j = json::object();
    for (const auto& [key, value] : data.attributes) {
        j[key] = value;
    }
    if (data.kyozo) {
        const auto& k = *data.kyozo;
        j["kyozo"] = {
            {"executable", k.executable},
            {"enlightened", k.enlightened},
            {"hidden", k.hidden},
            {"executor", k.executor.empty() ? json(nullptr) : json(k.executor)},
            {"metadata", k.metadata},
            {"dependencies", k.dependencies}
        };
    }
    return j;
}

json configToJson(const tp::TranspiledConfig& config) {
    return std::visit([](const auto& c) -> json {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, tp::DockerConfig>) {
            return {{"dockerfile", c.dockerfile}, {"image_tag", c.imageTag}, {"build_command", c.buildCommand}};
        } else if constexpr (std::is_same_v<T, tp::TerraformConfig>) {
            return {{"configuration", c.configuration}, {"variables", c.variables},
                    {"plan_command", c.planCommand}, {"apply_command", c.applyCommand}};
        } else if constexpr (std::is_same_v<T, tp::KubernetesConfig>) {
            return {{"manifests", c.manifests}, {"namespace", c.namespaceName}, {"apply_command", c.applyCommand}};
        } else if constexpr (std::is_same_v<T, tp::GitConfig>) {
            return {{"files", c.files}, {"init_commands", c.initCommands}};
        } else if constexpr (std::is_same_v<T, tp::BashConfig>) {
            return {{"script", c.script}, {"shebang", c.shebang}, {"environment", c.environment}};
        } else {
            return {{"statements", c.statements}, {"database", c.database}, {"client", c.client}};
        }
    }, config);
}

} // namespace

json JsonSerializer::AstToJson(const AstNode& node) {
    json j;
    j["type"] = NodeTypeToString(node.type);

    switch (node.type) {
        case NodeType::Heading:
            j["depth"] = node.depth;
            break;
        case NodeType::Code:
            j["lang"] = node.lang.empty() ? json(nullptr) : json(node.lang);
            j["meta"] = node.meta.empty() ? json(nullptr) : json(node.meta);
            break;
        case NodeType::List:
            j["ordered"] = node.ordered;
            break;
        case NodeType::Link:
        case NodeType::Image:
            j["url"] = node.url;
            j["title"] = node.title.empty() ? json(nullptr) : json(node.title);
            break;
        default:
            break;
    }

    if (node.isLeaf()) {
        j["value"] = node.value;
    } else {
        j["children"] = json::array();
        for (const auto& child : node.children) {
            j["children"].push_back(AstToJson(child));
        }
    }

    if (node.position) {
        j["position"] = {{"start", pointToJson(node.position->start)}, {"end", pointToJson(node.position->end)}};
    }
    if (!node.data.empty()) {
        j["data"] = dataToJson(node.data);
    }
    return j;
}

json JsonSerializer::ArtifactToJson(const Artifact& artifact) {
    json j = {
        {"type", ArtifactTypeToString(artifact.type)},
        {"content", artifact.content},
        {"executable", artifact.executable},
        {"line", artifact.sourceLine},
        {"lang", artifact.fenceLanguage}
    };
    if (artifact.location) j["location"] = *artifact.location;
    if (artifact.kind) {
        j[artifact.type == ArtifactType::Sql ? "operation" : "manifest_type"] = *artifact.kind;
    }
    return j;
}

json JsonSerializer::DirectiveToJson(const Directive& directive) {
    json j = {
        {"namespace", directive.ns},
        {"name", directive.name},
        {"params", directive.params},
        {"start_line", directive.startLine},
        {"end_line", directive.endLine}
    };
    if (directive.value) j["value"] = *directive.value;
    if (directive.jsonPayload) j["json"] = *directive.jsonPayload;
    return j;
}

json JsonSerializer::DocumentToJson(const PolyglotDocument& document, bool includeAst) {
    json j;
    j["language"] = LanguageToString(document.language);
    j["metadata"] = document.metadata;

    j["artifacts"] = json::array();
    for (const auto& a : document.artifacts) j["artifacts"].push_back(ArtifactToJson(a));

    j["directives"] = json::array();
    for (const auto& d : document.directives) j["directives"].push_back(DirectiveToJson(d));

    j["content_links"] = json::array();
    for (const auto& link : document.contentLinks) {
        j["content_links"].push_back({{"text", link.text}, {"hash", link.hash}, {"line", link.line}});
    }

    if (includeAst) j["ast"] = AstToJson(document.ast);
    return j;
}

json JsonSerializer::TranspileResultToJson(const tp::TranspileResult& result) {
    if (result.ok()) {
        json j = configToJson(*result.config);
        j["ok"] = true;
        return j;
    }
    json j = {{"ok", false}};
    if (result.error) {
        j["error"] = result.error->code;
        j["message"] = result.error->message;
    }
    return j;
}

} // namespace polyglot::infrastructure
