#include "infrastructure/HttpContentProvider.hpp"
#include <httplib.h>
#include <iostream>

namespace polyglot::infrastructure {

HttpContentProvider::HttpContentProvider(const std::string& host, int port)
    : m_host(host), m_port(port) {}

std::string HttpContentProvider::EncodePathSegment(const std::string& id) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : id) {
        const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                                c == '-' || c == '_' || c == '.' || c == '~' || c == '/';
        if (unreserved) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

std::optional<std::string> HttpContentProvider::getDocument(const std::string& id) {
    if (id.empty()) return std::nullopt;

    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(30);

    auto res = cli.Get("/documents/" + EncodePathSegment(id));
    if (res && res->status == 200) {
        return res->body;
    }
    if (res) {
        if (res->status != 404) {
            std::cerr << "[HttpContentProvider] HTTP Error " << res->status << ": " << res->body << std::endl;
        }
    } else {
        std::cerr << "[HttpContentProvider] Connection failed: " << static_cast<int>(res.error()) << std::endl;
    }
    return std::nullopt;
}

} // namespace polyglot::infrastructure
