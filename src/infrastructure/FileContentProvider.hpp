/**
 * @file FileContentProvider.hpp
 * @brief Documents read from a root directory.
 */

#pragma once
#include <string>
#include "domain/ContentProvider.hpp"

namespace polyglot::infrastructure {

/**
 * @class FileContentProvider
 * @brief Resolves an id to <root>/<id>, then <root>/<id>.md.
 * Ids that are absolute or climb out of the root are not found.
 */
class FileContentProvider : public domain::ContentProvider {
public:
    explicit FileContentProvider(const std::string& rootPath);

    std::optional<std::string> getDocument(const std::string& id) override;

private:
    std::string m_rootPath;
};

} // namespace polyglot::infrastructure
