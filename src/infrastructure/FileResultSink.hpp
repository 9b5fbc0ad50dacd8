/**
 * @file FileResultSink.hpp
 * @brief Results written as <root>/<id>.json through the PersistenceService.
 */

#pragma once
#include <memory>
#include <string>
#include "domain/ResultSink.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace polyglot::infrastructure {

class FileResultSink : public domain::ResultSink {
public:
    FileResultSink(const std::string& rootPath, std::shared_ptr<PersistenceService> persistence);

    /** @brief Queues the write; returns false for unsafe ids or a stopped writer. */
    bool storeResult(const std::string& id, const domain::ExecutionResult& result) override;

private:
    std::string m_rootPath;
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace polyglot::infrastructure
