#include "AuthClient.hpp"
#include <iostream>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "Token.hpp"

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;
using json = nlohmann::json;

namespace {

// Runs whatever was queued on ioc until it completes. Stream deadlines bound it.
void runToCompletion(net::io_context& ioc) {
    ioc.restart();
    ioc.run();
}

std::string describe(const char* step, beast::error_code ec) {
    if (ec == beast::error::timeout) return std::string(step) + ": timed out";
    return std::string(step) + ": " + ec.message();
}

} // namespace

AuthClient::AuthClient(Endpoint ep, std::chrono::milliseconds timeout)
    : m_endpoint(std::move(ep))
    , m_timeout(timeout)
{
}

bool AuthClient::postJson(const std::string& target, const std::string& body, HttpReply& reply, std::string& error) {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    beast::error_code ec;

    // bounded by the system resolver's own timeout
    tcp::resolver::results_type results;
    resolver.async_resolve(m_endpoint.host, m_endpoint.port,
        [&](beast::error_code e, tcp::resolver::results_type r) {
            ec = e;
            results = std::move(r);
        });
    runToCompletion(ioc);
    if (ec) {
        error = "resolve " + m_endpoint.host + ": " + ec.message();
        return false;
    }

    stream.expires_after(m_timeout);
    stream.async_connect(results, [&](beast::error_code e, tcp::endpoint) { ec = e; });
    runToCompletion(ioc);
    if (ec) {
        error = describe("connect", ec);
        return false;
    }

    http::request<http::string_body> req{ http::verb::post, target, 11 };
    req.set(http::field::host, m_endpoint.host + ":" + m_endpoint.port);
    req.set(http::field::user_agent, "GridLink");
    req.set(http::field::content_type, "application/json");
    req.body() = body;
    req.prepare_payload();

    stream.expires_after(m_timeout);
    http::async_write(stream, req, [&](beast::error_code e, std::size_t) { ec = e; });
    runToCompletion(ioc);
    if (ec) {
        error = describe("write", ec);
        return false;
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    stream.expires_after(m_timeout);
    http::async_read(stream, buffer, res, [&](beast::error_code e, std::size_t) { ec = e; });
    runToCompletion(ioc);
    if (ec) {
        error = describe("read", ec);
        return false;
    }

    reply.status = res.result_int();
    reply.body = std::move(res.body());

    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
        std::cerr << "[Auth] shutdown: " << ec.message() << "\n";
    }
    return true;
}

AuthResult AuthClient::registerUser(const std::string& login, const std::string& password) {
    if (login.empty() || password.empty()) {
        return { AuthStatus::InvalidInput, "Login and password must not be empty." };
    }

    const json body{ { "login", login }, { "password", password } };
    HttpReply reply;
    std::string err;
    if (!postJson("/api/register", body.dump(), reply, err)) {
        std::cerr << "[Auth] register: " << err << "\n";
        return { AuthStatus::Unreachable, "Could not connect to the server (" + err + ")." };
    }
    if (reply.status != 200) {
        std::cerr << "[Auth] register rejected (" << reply.status << "): " << reply.body << "\n";
        return { AuthStatus::Rejected, "Registration failed: " + reply.body };
    }

    std::cout << "[Auth] Registered \"" << login << "\"\n";
    return { AuthStatus::Ok, "Registration successful!" };
}

AuthResult AuthClient::login(const std::string& login, const std::string& password, Session& out) {
    if (login.empty() || password.empty()) {
        return { AuthStatus::InvalidInput, "Login and password must not be empty." };
    }

    const json body{ { "login", login }, { "password", password } };
    HttpReply reply;
    std::string err;
    if (!postJson("/api/login", body.dump(), reply, err)) {
        std::cerr << "[Auth] login: " << err << "\n";
        return { AuthStatus::Unreachable, "Could not connect to the server (" + err + ")." };
    }
    if (reply.status != 200) {
        std::cerr << "[Auth] login rejected (" << reply.status << "): " << reply.body << "\n";
        return { AuthStatus::Rejected, "Login failed: " + reply.body };
    }

    const AuthResult r = sessionFromLoginBody(reply.body, login, m_endpoint, out);
    if (r.ok()) {
        std::cout << "[Auth] Logged in: user_id=" << out.userId << " server=" << out.serverBaseUrl << "\n";
    }
    else {
        std::cerr << "[Auth] " << r.message << "\n";
    }
    return r;
}

AuthResult AuthClient::sessionFromLoginBody(const std::string& body, const std::string& login,
    const Endpoint& ep, Session& out) {
    json doc;
    try {
        doc = json::parse(body);
    }
    catch (const json::parse_error& e) {
        return { AuthStatus::BadToken, std::string("Unexpected login response: ") + e.what() };
    }

    const auto tok = doc.is_object() ? doc.find("token") : doc.end();
    if (!doc.is_object() || tok == doc.end() || !tok->is_string() || tok->get<std::string>().empty()) {
        return { AuthStatus::BadToken, "No token received." };
    }

    const std::string token = tok->get<std::string>();
    std::string err;
    const auto userId = auth::decodeSubject(token, err);
    if (!userId) {
        return { AuthStatus::BadToken, "Could not decode token: " + err };
    }

    Session s;
    s.userId = *userId;
    s.login = login;
    s.token = token;
    s.serverBaseUrl = makeBaseUrl(ep);
    s.websocketUrl = makeWebSocketUrl(ep);
    out = std::move(s);
    return { AuthStatus::Ok, {} };
}
