/**
 * @file ScopedWorkspace.hpp
 * @brief RAII temporary directory for one executor run.
 */

#pragma once
#include <atomic>
#include <filesystem>
#include <string>

namespace polyglot::infrastructure {

/**
 * @class ScopedWorkspace
 * @brief Creates <root>/<prefix>_<pid>_<n> on construction, removes it on destruction.
 *
 * Throws std::runtime_error if the directory cannot be created.
 */
class ScopedWorkspace {
public:
    ScopedWorkspace(const std::filesystem::path& root, const std::string& prefix);
    ~ScopedWorkspace();

    ScopedWorkspace(const ScopedWorkspace&) = delete;
    ScopedWorkspace& operator=(const ScopedWorkspace&) = delete;

    const std::filesystem::path& path() const { return m_path; }

    /**
     * @brief Writes a file below the workspace, creating parent directories.
     * @return False if the relative path is absolute or escapes the workspace.
     * Throws std::runtime_error on I/O failure.
     */
    bool writeFile(const std::string& relativePath, const std::string& content) const;

private:
    std::filesystem::path m_path;
    static std::atomic<unsigned long> s_counter;
};

} // namespace polyglot::infrastructure
