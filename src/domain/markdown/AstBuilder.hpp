/**
 * @file AstBuilder.hpp
 * @brief Builds an mdast-compatible tree from the token stream.
 */

#pragma once
#include "domain/AstNode.hpp"
#include "domain/Token.hpp"

namespace polyglot::domain::markdown {

/**
 * @brief Consumes tokens linearly and emits a root node.
 *
 * Inline parsing is shallow: every block holds a single text child.
 * Blank tokens only terminate paragraphs and lists; they produce no node.
 */
class AstBuilder {
public:
    static AstNode Build(const TokenList& tokens);
};

} // namespace polyglot::domain::markdown
