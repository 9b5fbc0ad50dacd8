#include "domain/markdown/DirectiveScanner.hpp"
#include "domain/markdown/TextUtils.hpp"
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

namespace polyglot::domain::markdown {

namespace {
    int LineOfOffset(const std::string& text, std::string::size_type offset) {
        return 1 + static_cast<int>(std::count(text.begin(), text.begin() + static_cast<std::ptrdiff_t>(offset), '\n'));
    }

    bool IsNameChar(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
    }

    std::string Unquote(const std::string& s) {
        if (s.size() >= 2 && s.front() == '"' && s.back() == '"') return s.substr(1, s.size() - 2);
        return s;
    }

    // Reads one whitespace-delimited word, keeping double-quoted spans intact.
    std::string ReadWord(const std::string& text, std::string::size_type& pos) {
        std::string word;
        bool quoted = false;
        while (pos < text.size()) {
            const char c = text[pos];
            if (c == '"') quoted = !quoted;
            else if (!quoted && (c == ' ' || c == '\t' || c == '\n' || c == '\r')) break;
            word += c;
            ++pos;
        }
        return word;
    }

    void ApplyJsonPayload(const std::string& payload, Directive& out) {
        out.jsonPayload = payload;
        nlohmann::json j = nlohmann::json::parse(payload, nullptr, false);
        if (j.is_discarded() || !j.is_object()) return;

        for (auto it = j.begin(); it != j.end(); ++it) {
            const auto& v = it.value();
            if (v.is_string()) {
                out.params[it.key()] = v.get<std::string>();
            } else if (v.is_array()) {
                std::string joined;
                for (const auto& item : v) {
                    if (!joined.empty()) joined += ',';
                    joined += item.is_string() ? item.get<std::string>() : item.dump();
                }
                out.params[it.key()] = joined;
            } else {
                out.params[it.key()] = v.dump();
            }
        }
    }
}

std::map<std::string, std::string> DirectiveScanner::ParseParams(const std::string& text) {
    std::map<std::string, std::string> params;
    std::string::size_type pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
        if (pos >= text.size()) break;
        const std::string word = ReadWord(text, pos);
        const auto eq = word.find('=');
        if (eq == std::string::npos) {
            params[Unquote(word)] = "true";
        } else if (eq > 0) {
            params[word.substr(0, eq)] = Unquote(word.substr(eq + 1));
        }
    }
    return params;
}

bool DirectiveScanner::ParseBody(const std::string& body, Directive& out) {
    const std::string trimmed = Trim(body);
    std::string rest;
    if (StartsWith(trimmed, "polyglot:")) {
        out.ns = "polyglot";
        rest = trimmed.substr(9);
    } else if (StartsWith(trimmed, "kyozo:")) {
        out.ns = "kyozo";
        rest = trimmed.substr(6);
    } else {
        return false;
    }

    rest = Trim(rest);
    if (!rest.empty() && rest.front() == '{') {
        out.name = "json";
        ApplyJsonPayload(rest, out);
        return true;
    }

    std::string::size_type pos = 0;
    while (pos < rest.size() && IsNameChar(rest[pos])) ++pos;
    if (pos == 0) return false;
    out.name = rest.substr(0, pos);

    // "name=value" and "name:value" both carry an inline value.
    if (pos < rest.size() && (rest[pos] == '=' || rest[pos] == ':')) {
        ++pos;
        out.value = Unquote(ReadWord(rest, pos));
    }
    out.params = ParseParams(rest.substr(pos));
    return true;
}

std::vector<Directive> DirectiveScanner::Scan(const std::string& text) {
    std::vector<Directive> directives;
    std::string::size_type pos = 0;

    while ((pos = text.find("<!--", pos)) != std::string::npos) {
        const auto bodyStart = pos + 4;
        const auto close = text.find("-->", bodyStart);
        if (close == std::string::npos) break;

        Directive directive;
        if (ParseBody(text.substr(bodyStart, close - bodyStart), directive)) {
            directive.startLine = LineOfOffset(text, pos);
            directive.endLine = LineOfOffset(text, close);
            directives.push_back(std::move(directive));
        }
        pos = close + 3;
    }
    return directives;
}

} // namespace polyglot::domain::markdown
