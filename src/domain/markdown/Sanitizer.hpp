/**
 * @file Sanitizer.hpp
 * @brief Produces a redacted copy of a document with every hidden channel neutralized.
 */

#pragma once
#include <string>

namespace polyglot::domain::markdown {

/**
 * @brief Removes zero-width characters and polyglot:/kyozo: comments,
 * normalizes whitespace and rewrites content-hash links to "(#)".
 *
 * The passes run until the text stops changing, so Sanitize(Sanitize(x)) == Sanitize(x).
 */
class Sanitizer {
public:
    static std::string Sanitize(const std::string& text);

    static std::string RemoveDirectiveComments(const std::string& text);
    static std::string NormalizeWhitespace(const std::string& text);
    static std::string NeutralizeContentLinks(const std::string& text);
};

} // namespace polyglot::domain::markdown
