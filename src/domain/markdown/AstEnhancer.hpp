/**
 * @file AstEnhancer.hpp
 * @brief Merges extracted metadata onto code nodes through data.kyozo.
 */

#pragma once
#include "domain/AstNode.hpp"
#include "domain/markdown/MetadataExtractor.hpp"

namespace polyglot::domain::markdown {

/**
 * @brief Annotates the tree without changing its shape.
 *
 * A code node receives:
 *  - the directives of the html node(s) directly preceding it,
 *  - the executor and executable flag of the artifact extracted from the same fence,
 *  - a "path" attribute for file:<path> blocks,
 *  - hidden = true when its body carries zero-width characters.
 * Values already present on the node are kept.
 */
class AstEnhancer {
public:
    static AstNode Enhance(AstNode root, const Extraction& extraction);
};

} // namespace polyglot::domain::markdown
