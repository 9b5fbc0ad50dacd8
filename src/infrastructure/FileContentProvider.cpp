/**
 * @file FileContentProvider.cpp
 * @brief Implementation of the FileContentProvider.
 */

#include "infrastructure/FileContentProvider.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace polyglot::infrastructure {

FileContentProvider::FileContentProvider(const std::string& rootPath)
    : m_rootPath(rootPath) {}

std::optional<std::string> FileContentProvider::getDocument(const std::string& id) {
    if (!PathUtils::IsContainedRelativePath(id)) {
        std::cerr << "[FileContentProvider] Rejected id: " << id << std::endl;
        return std::nullopt;
    }

    const fs::path base = fs::path(m_rootPath) / fs::path(id).lexically_normal();
    fs::path withExtension = base;
    withExtension += ".md";

    for (const auto& candidate : {base, withExtension}) {
        std::error_code ec;
        if (!fs::is_regular_file(candidate, ec)) continue;

        std::ifstream file(candidate, std::ios::binary);
        if (!file.is_open()) {
            std::cerr << "[FileContentProvider] Failed to open " << candidate << std::endl;
            return std::nullopt;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }
    return std::nullopt;
}

} // namespace polyglot::infrastructure
