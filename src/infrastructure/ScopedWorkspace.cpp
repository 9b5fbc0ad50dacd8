#include "infrastructure/ScopedWorkspace.hpp"
#include "infrastructure/PathUtils.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <unistd.h>

namespace polyglot::infrastructure {

namespace fs = std::filesystem;

std::atomic<unsigned long> ScopedWorkspace::s_counter{0};

ScopedWorkspace::ScopedWorkspace(const fs::path& root, const std::string& prefix) {
    const fs::path base = root.empty() ? fs::temp_directory_path() : root;
    const unsigned long n = ++s_counter;
    m_path = base / (prefix + "_" + std::to_string(::getpid()) + "_" + std::to_string(n));

    std::error_code ec;
    fs::create_directories(m_path, ec);
    if (ec) {
        throw std::runtime_error("failed to create workspace " + m_path.string() + ": " + ec.message());
    }
}

ScopedWorkspace::~ScopedWorkspace() {
    std::error_code ec;
    fs::remove_all(m_path, ec);
    if (ec) {
        std::cerr << "[ScopedWorkspace] Failed to remove " << m_path << ": " << ec.message() << std::endl;
    }
}

bool ScopedWorkspace::writeFile(const std::string& relativePath, const std::string& content) const {
    if (!PathUtils::IsContainedRelativePath(relativePath)) return false;

    const fs::path target = m_path / fs::path(relativePath).lexically_normal();
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("failed to create " + target.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream ofs(target, std::ios::binary);
    if (!ofs.is_open()) {
        throw std::runtime_error("failed to open " + target.string());
    }
    ofs << content;
    if (ofs.fail()) {
        throw std::runtime_error("write failed: " + target.string());
    }
    return true;
}

} // namespace polyglot::infrastructure
