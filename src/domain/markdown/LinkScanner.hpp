/**
 * @file LinkScanner.hpp
 * @brief Finds content-addressed links: [text](<40 or more hex characters>).
 */

#pragma once
#include <string>
#include <vector>
#include "domain/Directive.hpp"

namespace polyglot::domain::markdown {

/**
 * @struct LinkSpan
 * @brief A content link located in the raw text. [begin, end) covers "[text](hash)".
 */
struct LinkSpan {
    std::string::size_type begin = 0;
    std::string::size_type end = 0;
    ContentLink link;
};

/**
 * @class LinkScanner
 * @brief Single forward pass; link text never spans a newline or contains ']'.
 */
class LinkScanner {
public:
    static constexpr std::string::size_type kMinHashLength = 40;

    static std::vector<LinkSpan> FindSpans(const std::string& text);
    static std::vector<ContentLink> Scan(const std::string& text);
};

} // namespace polyglot::domain::markdown
