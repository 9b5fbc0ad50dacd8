#include "domain/markdown/FenceScanner.hpp"
#include "domain/markdown/TextUtils.hpp"

namespace polyglot::domain::markdown {

std::vector<FencedBlock> FenceScanner::Scan(const std::string& text) {
    std::vector<FencedBlock> blocks;
    const auto lines = SplitLines(text);

    FencedBlock current;
    bool inFence = false;
    bool firstBodyLine = true;

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        const int lineNo = static_cast<int>(i) + 1;

        if (inFence) {
            if (IsClosingFence(line)) {
                current.endLine = lineNo;
                current.closed = true;
                blocks.push_back(std::move(current));
                current = FencedBlock{};
                inFence = false;
                continue;
            }
            if (!firstBodyLine) current.content += '\n';
            current.content += line;
            current.endLine = lineNo;
            firstBodyLine = false;
            continue;
        }

        std::string lang, info;
        if (ParseOpeningFence(line, lang, info)) {
            current.lang = lang;
            current.info = info;
            current.startLine = lineNo;
            current.endLine = lineNo;
            inFence = true;
            firstBodyLine = true;
        }
    }

    if (inFence) {
        blocks.push_back(std::move(current));
    }
    return blocks;
}

} // namespace polyglot::domain::markdown
