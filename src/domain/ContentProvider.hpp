/**
 * @file ContentProvider.hpp
 * @brief Interface for fetching Markdown documents by identifier.
 */

#pragma once
#include <optional>
#include <string>

namespace polyglot::domain {

class ContentProvider {
public:
    virtual ~ContentProvider() = default;

    /** @brief Document text, or nullopt when the id is unknown or unreachable. */
    virtual std::optional<std::string> getDocument(const std::string& id) = 0;
};

} // namespace polyglot::domain
