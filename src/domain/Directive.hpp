/**
 * @file Directive.hpp
 * @brief HTML-comment directives (<!-- polyglot:... -->, <!-- kyozo:... -->).
 */

#pragma once
#include <map>
#include <optional>
#include <string>

namespace polyglot::domain {

/**
 * @struct Directive
 * @brief A parsed directive comment.
 *
 * "<!-- polyglot:commit_message=\"Init repo\" -->" yields namespace "polyglot",
 * name "commit_message" and value "Init repo". Trailing "k=v" words land in params.
 * "<!-- kyozo:{...} -->" keeps the raw JSON text in jsonPayload.
 */
struct Directive {
    std::string ns;     ///< "polyglot" or "kyozo".
    std::string name;
    std::optional<std::string> value;
    std::map<std::string, std::string> params;
    std::optional<std::string> jsonPayload;
    int startLine = 0;
    int endLine = 0;
};

/**
 * @struct ContentLink
 * @brief Markdown link whose target is a content hash ([text](<40+ hex>)).
 */
struct ContentLink {
    std::string text;
    std::string hash;
    int line = 0;
};

} // namespace polyglot::domain
