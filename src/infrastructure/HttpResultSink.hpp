/**
 * @file HttpResultSink.hpp
 * @brief Results posted as JSON to a remote store.
 */

#pragma once
#include <string>
#include "domain/ResultSink.hpp"

namespace polyglot::infrastructure {

/**
 * @class HttpResultSink
 * @brief POST /results/<id>; any 2xx status counts as stored.
 */
class HttpResultSink : public domain::ResultSink {
public:
    HttpResultSink(const std::string& host, int port);

    bool storeResult(const std::string& id, const domain::ExecutionResult& result) override;

private:
    std::string m_host;
    int m_port;
};

} // namespace polyglot::infrastructure
