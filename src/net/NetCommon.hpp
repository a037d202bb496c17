#pragma once
#include <string>

#include "GameProtocol.hpp"

static constexpr const char* kDefaultServerHost = "127.0.0.1";
static constexpr const char* kDefaultServerPort = "3000";

struct Endpoint {
    std::string host = kDefaultServerHost;
    std::string port = kDefaultServerPort;

    // Blank fields fall back to the defaults.
    static Endpoint fromFields(const std::string& host, const std::string& port);
};

// Produced once by a successful login, then handed to the game by value.
struct Session {
    game::PlayerId userId{ 0 };
    std::string login;
    std::string token;
    std::string serverBaseUrl;   // http://host:port
    std::string websocketUrl;    // ws://host:port/api/ws
};

std::string makeBaseUrl(const Endpoint& ep);
std::string makeWebSocketUrl(const Endpoint& ep);

struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target{ "/" };
};

// Accepts http:// and ws:// URLs. Port defaults to 80 when absent.
bool parseUrl(const std::string& url, UrlParts& out);
