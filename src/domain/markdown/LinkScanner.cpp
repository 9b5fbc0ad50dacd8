#include "domain/markdown/LinkScanner.hpp"

namespace polyglot::domain::markdown {

namespace {
    bool IsHexDigit(char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    }

    // Length of "(<hex>)" starting at pos, or 0 if the target is not a content hash.
    std::string::size_type HashTargetLength(const std::string& text, std::string::size_type pos) {
        if (pos >= text.size() || text[pos] != '(') return 0;
        auto end = pos + 1;
        while (end < text.size() && IsHexDigit(text[end])) ++end;
        const auto digits = end - pos - 1;
        if (digits < LinkScanner::kMinHashLength || end >= text.size() || text[end] != ')') return 0;
        return end + 1 - pos;
    }
}

std::vector<LinkSpan> LinkScanner::FindSpans(const std::string& text) {
    std::vector<LinkSpan> spans;
    auto open = std::string::npos;
    int line = 1;

    std::string::size_type i = 0;
    while (i < text.size()) {
        const char c = text[i];
        if (c == '\n') {
            ++line;
            open = std::string::npos;
        } else if (c == '[') {
            // Leftmost opener wins; text may contain further '['.
            if (open == std::string::npos) open = i;
        } else if (c == ']') {
            const auto target = HashTargetLength(text, i + 1);
            if (open != std::string::npos && target > 0) {
                LinkSpan span;
                span.begin = open;
                span.end = i + 1 + target;
                span.link.text = text.substr(open + 1, i - open - 1);
                span.link.hash = text.substr(i + 2, target - 2);
                span.link.line = line;
                spans.push_back(std::move(span));
                open = std::string::npos;
                i = spans.back().end;
                continue;
            }
            open = std::string::npos;
        }
        ++i;
    }
    return spans;
}

std::vector<ContentLink> LinkScanner::Scan(const std::string& text) {
    std::vector<ContentLink> links;
    for (auto& span : FindSpans(text)) links.push_back(std::move(span.link));
    return links;
}

} // namespace polyglot::domain::markdown
