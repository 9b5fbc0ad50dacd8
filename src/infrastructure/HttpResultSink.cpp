#include "infrastructure/HttpResultSink.hpp"
#include "infrastructure/HttpContentProvider.hpp"
#include <httplib.h>
#include <iostream>

namespace polyglot::infrastructure {

HttpResultSink::HttpResultSink(const std::string& host, int port)
    : m_host(host), m_port(port) {}

bool HttpResultSink::storeResult(const std::string& id, const domain::ExecutionResult& result) {
    if (id.empty()) return false;

    httplib::Client cli(m_host, m_port);
    cli.set_write_timeout(30);

    auto res = cli.Post("/results/" + HttpContentProvider::EncodePathSegment(id),
                        result.serialize(), "application/json");
    if (res && res->status >= 200 && res->status < 300) {
        return true;
    }
    if (res) {
        std::cerr << "[HttpResultSink] HTTP Error " << res->status << ": " << res->body << std::endl;
    } else {
        std::cerr << "[HttpResultSink] Connection failed: " << static_cast<int>(res.error()) << std::endl;
    }
    return false;
}

} // namespace polyglot::infrastructure
