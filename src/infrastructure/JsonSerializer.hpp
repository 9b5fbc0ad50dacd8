/**
 * @file JsonSerializer.hpp
 * @brief nlohmann::json views of the domain types (mdast-compatible AST).
 */

#pragma once
#include <nlohmann/json.hpp>
#include "domain/PolyglotDocument.hpp"
#include "domain/transpile/TranspiledConfig.hpp"

namespace polyglot::infrastructure {

class JsonSerializer {
public:
    /** @brief mdast field names: type, children, value, depth, lang, meta, ordered, url, position, data. */
    static nlohmann::json AstToJson(const domain::AstNode& node);

    static nlohmann::json ArtifactToJson(const domain::Artifact& artifact);

    static nlohmann::json DirectiveToJson(const domain::Directive& directive);

    /** @brief Classification view; the AST is included only on request. */
    static nlohmann::json DocumentToJson(const domain::PolyglotDocument& document, bool includeAst = false);

    static nlohmann::json TranspileResultToJson(const domain::transpile::TranspileResult& result);
};

} // namespace polyglot::infrastructure
