/**
 * @file FenceScanner.hpp
 * @brief Raw-text pass collecting every fenced code block.
 */

#pragma once
#include <string>
#include <vector>

namespace polyglot::domain::markdown {

struct FencedBlock {
    std::string lang;      ///< First word of the info string, as written.
    std::string info;      ///< Full info string.
    std::string content;   ///< Body lines joined with '\n'.
    int startLine = 0;
    int endLine = 0;
    bool closed = false;   ///< False when the fence runs to end of input.
};

class FenceScanner {
public:
    static std::vector<FencedBlock> Scan(const std::string& text);
};

} // namespace polyglot::domain::markdown
