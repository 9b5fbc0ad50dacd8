/**
 * @file Tokenizer.hpp
 * @brief Splits raw Markdown into a line-oriented token stream.
 */

#pragma once
#include <string>
#include "domain/Token.hpp"

namespace polyglot::domain::markdown {

/**
 * @brief Stateless single-pass tokenizer.
 *
 * Carries a small state flag (none, code block, html comment) across lines.
 * Inside a fenced block the state wins over any line-level pattern, so a
 * "# heading" line inside code stays code content. Never fails: unknown
 * lines become Text tokens.
 */
class Tokenizer {
public:
    static TokenList Tokenize(const std::string& text);
};

} // namespace polyglot::domain::markdown
