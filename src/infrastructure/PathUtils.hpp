// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace polyglot::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetSettingsPath();
    static std::filesystem::path GetDocumentsDir();
    static std::filesystem::path GetResultsDir();

    /** @brief Relative, non-empty, and never climbs above its base via "..". */
    static bool IsContainedRelativePath(const std::string& relativePath);
};

} // namespace polyglot::infrastructure
