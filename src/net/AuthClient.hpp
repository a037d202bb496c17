#pragma once
#include <chrono>
#include <cstdint>
#include <string>

#include "NetCommon.hpp"

enum class AuthStatus : uint8_t {
    Ok,
    InvalidInput,  // empty login or password, nothing sent
    Rejected,      // server answered non-200
    Unreachable,   // resolve/connect/io failure
    BadToken,      // 200 but no usable token
};

struct AuthResult {
    AuthStatus status{ AuthStatus::Ok };
    std::string message;

    bool ok() const { return status == AuthStatus::Ok; }
};

// Blocking HTTP exchange against the game server's /api endpoints. Each step
// (connect, write, read) is bounded by the request timeout.
class AuthClient {
public:
    static constexpr std::chrono::seconds kRequestTimeout{ 5 };

    explicit AuthClient(Endpoint ep, std::chrono::milliseconds timeout = kRequestTimeout);

    AuthResult registerUser(const std::string& login, const std::string& password);
    AuthResult login(const std::string& login, const std::string& password, Session& out);

    const Endpoint& endpoint() const { return m_endpoint; }

    // Builds the session from a /api/login response body. Exposed for tests.
    static AuthResult sessionFromLoginBody(const std::string& body, const std::string& login,
        const Endpoint& ep, Session& out);

private:
    struct HttpReply {
        unsigned status{ 0 };
        std::string body;
    };

    bool postJson(const std::string& target, const std::string& body, HttpReply& reply, std::string& error);

private:
    Endpoint m_endpoint;
    std::chrono::milliseconds m_timeout;
};
