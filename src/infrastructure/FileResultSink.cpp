#include "infrastructure/FileResultSink.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <iostream>

namespace polyglot::infrastructure {

FileResultSink::FileResultSink(const std::string& rootPath, std::shared_ptr<PersistenceService> persistence)
    : m_rootPath(rootPath), m_persistence(std::move(persistence)) {}

bool FileResultSink::storeResult(const std::string& id, const domain::ExecutionResult& result) {
    if (!PathUtils::IsContainedRelativePath(id)) {
        std::cerr << "[FileResultSink] Rejected id: " << id << std::endl;
        return false;
    }

    std::filesystem::path target = std::filesystem::path(m_rootPath) / std::filesystem::path(id).lexically_normal();
    target += ".json";

    const std::string path = target.string();
    return m_persistence->saveTextAsync(path, result.serialize(2), [path](bool ok) {
        if (!ok) std::cerr << "[FileResultSink] Failed to write " << path << std::endl;
    });
}

} // namespace polyglot::infrastructure
