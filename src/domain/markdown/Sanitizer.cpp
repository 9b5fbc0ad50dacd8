#include "domain/markdown/Sanitizer.hpp"
#include "domain/markdown/LinkScanner.hpp"
#include "domain/markdown/TextUtils.hpp"
#include "domain/markdown/ZeroWidthScanner.hpp"

namespace polyglot::domain::markdown {

namespace {
    constexpr int kMaxPasses = 16;

    bool IsDirectiveBody(const std::string& text, std::string::size_type bodyStart) {
        auto pos = text.find_first_not_of(" \t\r\n", bodyStart);
        if (pos == std::string::npos) return false;
        return text.compare(pos, 9, "polyglot:") == 0 || text.compare(pos, 6, "kyozo:") == 0;
    }

    bool OnlyBlanks(const std::string& text, std::string::size_type from, std::string::size_type to) {
        for (auto i = from; i < to; ++i) {
            if (text[i] != ' ' && text[i] != '\t' && text[i] != '\r') return false;
        }
        return true;
    }
}

std::string Sanitizer::RemoveDirectiveComments(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    std::string::size_type pos = 0;

    while (pos < text.size()) {
        const auto close = text.find("-->", pos);
        if (close == std::string::npos) break;

        // Innermost opener, so "<!-- note <!-- kyozo:x -->" still loses its directive.
        const auto open = text.rfind("<!--", close);
        if (open == std::string::npos || open < pos || open + 4 > close || !IsDirectiveBody(text, open + 4)) {
            out.append(text, pos, close + 3 - pos);
            pos = close + 3;
            continue;
        }

        auto spanStart = open;
        auto spanEnd = close + 3;

        // A comment that filled its whole line takes the line with it.
        std::string::size_type lineBegin = 0;
        if (open > 0) {
            const auto nl = text.rfind('\n', open - 1);
            if (nl != std::string::npos) lineBegin = nl + 1;
        }
        auto lineEnd = text.find('\n', spanEnd);
        if (lineEnd == std::string::npos) lineEnd = text.size();
        if (lineBegin >= pos && OnlyBlanks(text, lineBegin, open) && OnlyBlanks(text, spanEnd, lineEnd)) {
            spanStart = lineBegin;
            spanEnd = lineEnd < text.size() ? lineEnd + 1 : lineEnd;
        }

        out.append(text, pos, spanStart - pos);
        pos = spanEnd;
    }
    if (pos < text.size()) out.append(text, pos, std::string::npos);
    return out;
}

std::string Sanitizer::NormalizeWhitespace(const std::string& text) {
    std::string unified;
    unified.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '\r') {
            unified += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
        } else if (c == '\t') {
            unified += "    ";
        } else {
            unified += c;
        }
    }

    std::string out;
    out.reserve(unified.size());
    int newlineRun = 0;
    for (char c : unified) {
        if (c == '\n') {
            while (!out.empty() && out.back() == ' ') out.pop_back();
            if (++newlineRun > 2) continue;
        } else {
            newlineRun = 0;
        }
        out += c;
    }
    return out;
}

std::string Sanitizer::NeutralizeContentLinks(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    std::string::size_type pos = 0;
    for (const auto& span : LinkScanner::FindSpans(text)) {
        out.append(text, pos, span.begin - pos);
        out += "[" + span.link.text + "](#)";
        pos = span.end;
    }
    out.append(text, pos, std::string::npos);
    return out;
}

std::string Sanitizer::Sanitize(const std::string& text) {
    std::string current = text;
    for (int pass = 0; pass < kMaxPasses; ++pass) {
        std::string next = ZeroWidthScanner::Strip(current);
        next = RemoveDirectiveComments(next);
        next = NormalizeWhitespace(next);
        next = NeutralizeContentLinks(next);
        if (next == current) break;
        current = std::move(next);
    }
    return current;
}

} // namespace polyglot::domain::markdown
