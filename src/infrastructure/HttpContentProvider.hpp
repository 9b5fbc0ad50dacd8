/**
 * @file HttpContentProvider.hpp
 * @brief Documents fetched from a remote store over HTTP.
 */

#pragma once
#include <string>
#include "domain/ContentProvider.hpp"

namespace polyglot::infrastructure {

/**
 * @class HttpContentProvider
 * @brief GET /documents/<id>; 200 yields the body, anything else is not found.
 */
class HttpContentProvider : public domain::ContentProvider {
public:
    HttpContentProvider(const std::string& host, int port);

    std::optional<std::string> getDocument(const std::string& id) override;

    /** @brief Percent-encodes everything but unreserved characters and '/'. */
    static std::string EncodePathSegment(const std::string& id);

private:
    std::string m_host;
    int m_port;
};

} // namespace polyglot::infrastructure
