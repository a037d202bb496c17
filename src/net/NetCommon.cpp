#include "NetCommon.hpp"
#include <algorithm>
#include <cctype>

namespace {

std::string trimmed(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

} // namespace

Endpoint Endpoint::fromFields(const std::string& host, const std::string& port) {
    Endpoint ep;
    const std::string h = trimmed(host);
    const std::string p = trimmed(port);
    if (!h.empty()) ep.host = h;
    if (!p.empty()) ep.port = p;
    return ep;
}

std::string makeBaseUrl(const Endpoint& ep) {
    return "http://" + ep.host + ":" + ep.port;
}

std::string makeWebSocketUrl(const Endpoint& ep) {
    return "ws://" + ep.host + ":" + ep.port + "/api/ws";
}

bool parseUrl(const std::string& url, UrlParts& out) {
    const auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) return false;

    UrlParts parts;
    parts.scheme = url.substr(0, schemeEnd);
    std::transform(parts.scheme.begin(), parts.scheme.end(), parts.scheme.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (parts.scheme != "http" && parts.scheme != "ws") return false;

    const auto authStart = schemeEnd + 3;
    const auto pathStart = url.find('/', authStart);
    const std::string authority = url.substr(authStart,
        pathStart == std::string::npos ? std::string::npos : pathStart - authStart);
    if (authority.empty()) return false;

    const auto colon = authority.rfind(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = "80";
    }
    else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
        if (parts.port.empty() ||
            !std::all_of(parts.port.begin(), parts.port.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return false;
        }
    }
    if (parts.host.empty()) return false;

    if (pathStart != std::string::npos) parts.target = url.substr(pathStart);

    out = std::move(parts);
    return true;
}
