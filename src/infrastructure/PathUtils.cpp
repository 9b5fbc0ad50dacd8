#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace polyglot::infrastructure {

namespace fs = std::filesystem;

namespace {
fs::path xdgDir(const char* variable, const fs::path& homeRelative) {
    const char* value = std::getenv(variable);
    if (value && *value) {
        return fs::path(value);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / homeRelative;
    }
    return fs::current_path(); // Fallback
}
}

fs::path PathUtils::GetDataHome() {
    return xdgDir("XDG_DATA_HOME", fs::path(".local") / "share");
}

fs::path PathUtils::GetConfigHome() {
    return xdgDir("XDG_CONFIG_HOME", ".config");
}

fs::path PathUtils::GetSettingsPath() {
    return GetConfigHome() / "polyglot" / "settings.json";
}

// Not created here; FileContentProvider reads, PersistenceService creates on write.
fs::path PathUtils::GetDocumentsDir() {
    return GetDataHome() / "polyglot" / "documents";
}

fs::path PathUtils::GetResultsDir() {
    return GetDataHome() / "polyglot" / "results";
}

bool PathUtils::IsContainedRelativePath(const std::string& relativePath) {
    if (relativePath.empty()) return false;
    const fs::path p(relativePath);
    if (p.is_absolute() || p.has_root_name() || p.has_root_directory()) return false;

    int depth = 0;
    for (const auto& part : p.lexically_normal()) {
        const std::string s = part.string();
        if (s == "..") {
            if (--depth < 0) return false;
        } else if (!s.empty() && s != ".") {
            ++depth;
        }
    }
    return depth > 0;
}

} // namespace polyglot::infrastructure
