/**
 * @file TextUtils.hpp
 * @brief Small string helpers shared by the Markdown passes.
 */

#pragma once
#include <string>
#include <vector>

namespace polyglot::domain::markdown {

inline bool StartsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.length(), prefix) == 0;
}

inline std::string Trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

inline std::string ToLower(std::string s) {
    for (auto& c : s) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return s;
}

/** @brief Splits on '\n', dropping a trailing '\r' from each line. */
inline std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string::size_type start = 0;
    while (true) {
        const auto nl = text.find('\n', start);
        std::string line = text.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return lines;
}

/** @brief True for a line made only of three or more backticks (plus whitespace). */
inline bool IsClosingFence(const std::string& line) {
    const std::string trimmed = Trim(line);
    if (trimmed.size() < 3) return false;
    return trimmed.find_first_not_of('`') == std::string::npos;
}

/**
 * @brief Parses an opening fence ("```lang meta").
 * @return false if the line does not open a fence.
 */
inline bool ParseOpeningFence(const std::string& line, std::string& langOut, std::string& infoOut) {
    if (!StartsWith(line, "```")) return false;
    std::string::size_type i = 0;
    while (i < line.size() && line[i] == '`') ++i;
    infoOut = Trim(line.substr(i));
    const auto space = infoOut.find_first_of(" \t");
    langOut = space == std::string::npos ? infoOut : infoOut.substr(0, space);
    return true;
}

/** @brief Strict UTF-8 validation (no overlongs, no surrogates). */
inline bool IsValidUtf8(const std::string& bytes) {
    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        const auto c = static_cast<unsigned char>(bytes[i]);
        size_t extra = 0;
        unsigned int cp = 0;
        if (c < 0x80) { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { extra = 1; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; }
        else return false;
        if (i + extra >= n) return false;
        for (size_t k = 1; k <= extra; ++k) {
            const auto cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += extra + 1;
    }
    return true;
}

} // namespace polyglot::domain::markdown
