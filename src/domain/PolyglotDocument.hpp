/**
 * @file PolyglotDocument.hpp
 * @brief Top-level classification result of a Markdown document.
 */

#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "domain/Artifact.hpp"
#include "domain/AstNode.hpp"
#include "domain/Directive.hpp"
#include "domain/Language.hpp"

namespace polyglot::domain {

/** @brief Flat metadata map ("type", "subtype", "polyglot.<name>", ...). */
using Metadata = std::map<std::string, std::string>;

/**
 * @brief Value of a directive by name, polyglot namespace first, then kyozo.
 */
inline std::optional<std::string> LookupDirective(const Metadata& metadata, const std::string& name) {
    for (const char* ns : {"polyglot", "kyozo"}) {
        auto it = metadata.find(std::string(ns) + "." + name);
        if (it != metadata.end()) return it->second;
    }
    return std::nullopt;
}

/**
 * @brief Parameters of a directive ("polyglot.environment.FOO" -> "FOO").
 * Polyglot entries override kyozo entries with the same key.
 */
inline std::map<std::string, std::string> CollectDirectiveParams(const Metadata& metadata, const std::string& name) {
    std::map<std::string, std::string> params;
    for (const char* ns : {"kyozo", "polyglot"}) {
        const std::string prefix = std::string(ns) + "." + name + ".";
        for (auto it = metadata.lower_bound(prefix); it != metadata.end(); ++it) {
            if (it->first.compare(0, prefix.size(), prefix) != 0) break;
            params[it->first.substr(prefix.size())] = it->second;
        }
    }
    return params;
}

/**
 * @struct PolyglotDocument
 * @brief Language drives execution routing; artifacts of other types may coexist.
 */
struct PolyglotDocument {
    std::string source;
    Language language = Language::None;
    ArtifactList artifacts;
    AstNode ast;
    Metadata metadata;
    std::vector<Directive> directives;
    std::vector<ContentLink> contentLinks;
};

} // namespace polyglot::domain
