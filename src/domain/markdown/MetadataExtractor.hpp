/**
 * @file MetadataExtractor.hpp
 * @brief Classifies a document and extracts its artifacts and metadata.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/PolyglotDocument.hpp"
#include "domain/markdown/FenceScanner.hpp"

namespace polyglot::domain::markdown {

/**
 * @struct Extraction
 * @brief Everything the extractor derives from raw text.
 */
struct Extraction {
    Language language = Language::None;
    ArtifactList artifacts;
    Metadata metadata;
    std::vector<Directive> directives;
    std::vector<ContentLink> contentLinks;
};

/**
 * @brief Works on raw text, not on the AST, so it sees content the builder simplifies away.
 *
 * Language priority, first match wins (every match still contributes artifacts):
 *   1. dockerfile fence
 *   2. terraform / hcl / tf fence
 *   3. fence whose YAML has apiVersion and kind
 *   4. polyglot:executable directive together with a bash/sh/shell/zsh fence
 *   5. file:<path> fences
 *   6. sql fences
 *   7. none
 * Zero-width payloads only set metadata["type"] when nothing above fired.
 *
 * Directives: "<ns>:<key>=<value>" sets metadata[<key>] plus the namespaced
 * "<ns>.<key>" copy. Without any declared type, the first value-less
 * directive sets type (its namespace) and subtype (its name).
 */
class MetadataExtractor {
public:
    static Extraction Extract(const std::string& text);

    /** @brief Cheap pre-check: true if extraction would find anything polyglot. */
    static bool IsPolyglot(const std::string& text);

    /** @brief Artifact type implied by the fence info string alone (kubernetes needs the content). */
    static std::optional<ArtifactType> ArtifactTypeForFence(const FencedBlock& block);

    /** @brief Path after "file:" in a fence info string (spaces kept), empty if it is not one. */
    static std::string FilePathOfFence(const std::string& info);

    /**
     * @brief Leading statement keyword of a SQL block: create, alter, drop,
     * insert, update, delete or select; "unknown" otherwise.
     */
    static std::string SqlOperationOf(const std::string& sql);
};

} // namespace polyglot::domain::markdown
