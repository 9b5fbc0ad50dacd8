/**
 * @file DirectiveScanner.hpp
 * @brief Raw-text pass parsing polyglot: and kyozo: HTML comments.
 */

#pragma once
#include <map>
#include <string>
#include <vector>
#include "domain/Directive.hpp"

namespace polyglot::domain::markdown {

class DirectiveScanner {
public:
    /**
     * @brief Finds every directive comment, single or multi-line, in document order.
     * Comments that are not polyglot/kyozo directives are ignored.
     */
    static std::vector<Directive> Scan(const std::string& text);

    /**
     * @brief Parses the body of a comment ("polyglot:env FOO=bar").
     * @return false if the body is not a directive.
     */
    static bool ParseBody(const std::string& body, Directive& out);

    /** @brief Splits "a=1 b=\"two words\" flag" into {a:1, b:two words, flag:true}. */
    static std::map<std::string, std::string> ParseParams(const std::string& text);
};

} // namespace polyglot::domain::markdown
