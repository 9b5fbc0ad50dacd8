#include "domain/markdown/ZeroWidthScanner.hpp"
#include "domain/markdown/TextUtils.hpp"
#include <iomanip>
#include <sstream>

namespace polyglot::domain::markdown {

namespace {
    // Returns the code point of a zero-width sequence at pos (0 if none) and its byte length.
    char32_t MatchZeroWidth(const std::string& text, size_t pos, size_t& length) {
        if (pos + 2 >= text.size()) return 0;
        const auto b0 = static_cast<unsigned char>(text[pos]);
        const auto b1 = static_cast<unsigned char>(text[pos + 1]);
        const auto b2 = static_cast<unsigned char>(text[pos + 2]);
        length = 3;
        if (b0 == 0xE2 && b1 == 0x80 && b2 == 0x8B) return 0x200B;
        if (b0 == 0xE2 && b1 == 0x80 && b2 == 0x8C) return 0x200C;
        if (b0 == 0xE2 && b1 == 0x80 && b2 == 0x8D) return 0x200D;
        if (b0 == 0xE2 && b1 == 0x81 && b2 == 0xA0) return 0x2060;
        if (b0 == 0xEF && b1 == 0xBB && b2 == 0xBF) return 0xFEFF;
        return 0;
    }

    const char* BitsFor(char32_t c) {
        switch (c) {
            case 0x200B: return "0";
            case 0x200C: return "1";
            case 0x200D: return "01";
            case 0x2060: return "10";
            case 0xFEFF: return "11";
            default: return "0";
        }
    }

    std::string ToHex(const std::string& bytes) {
        std::ostringstream out;
        for (unsigned char b : bytes) {
            out << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
        }
        return out.str();
    }
}

std::vector<ZeroWidthRun> ZeroWidthScanner::Scan(const std::string& text) {
    std::vector<ZeroWidthRun> runs;
    ZeroWidthRun current;
    int line = 1;

    size_t i = 0;
    while (i < text.size()) {
        size_t len = 0;
        const char32_t c = MatchZeroWidth(text, i, len);
        if (c != 0) {
            if (current.chars.empty()) current.line = line;
            current.chars.push_back(c);
            i += len;
            continue;
        }
        if (!current.chars.empty()) {
            runs.push_back(std::move(current));
            current = ZeroWidthRun{};
        }
        if (text[i] == '\n') ++line;
        ++i;
    }
    if (!current.chars.empty()) runs.push_back(std::move(current));
    return runs;
}

bool ZeroWidthScanner::Contains(const std::string& text) {
    for (size_t i = 0; i < text.size(); ++i) {
        size_t len = 0;
        if (MatchZeroWidth(text, i, len) != 0) return true;
    }
    return false;
}

std::string ZeroWidthScanner::Strip(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        size_t len = 0;
        if (MatchZeroWidth(text, i, len) != 0) {
            i += len;
            continue;
        }
        out += text[i];
        ++i;
    }
    return out;
}

HiddenPayload ZeroWidthScanner::Decode(const ZeroWidthRun& run) {
    std::string bits;
    for (char32_t c : run.chars) bits += BitsFor(c);

    // Minimal big-endian encoding of the integer value; zero is a single 0x00 byte.
    const auto firstOne = bits.find('1');
    std::string significant = firstOne == std::string::npos ? "0" : bits.substr(firstOne);
    const size_t pad = (8 - significant.size() % 8) % 8;
    significant.insert(0, pad, '0');

    std::string bytes;
    for (size_t i = 0; i < significant.size(); i += 8) {
        unsigned int value = 0;
        for (size_t k = 0; k < 8; ++k) value = (value << 1) | (significant[i + k] == '1' ? 1u : 0u);
        bytes += static_cast<char>(value);
    }

    if (IsValidUtf8(bytes)) return {"hidden_data", bytes};
    return {"hidden_binary", ToHex(bytes)};
}

HiddenPayload ZeroWidthScanner::DecodeAll(const std::vector<ZeroWidthRun>& runs) {
    std::string data;
    std::string raw;
    bool binary = false;
    for (const auto& run : runs) {
        const HiddenPayload payload = Decode(run);
        if (payload.encoding == "hidden_binary") binary = true;
        data += payload.content;
    }
    if (!binary) return {"hidden_data", data};

    // Re-decode so every run is reported in hex when any of them is binary.
    for (const auto& run : runs) {
        const HiddenPayload payload = Decode(run);
        raw += payload.encoding == "hidden_data" ? ToHex(payload.content) : payload.content;
    }
    return {"hidden_binary", raw};
}

} // namespace polyglot::domain::markdown
