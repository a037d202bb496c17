#include <catch2/catch_test_macros.hpp>

#include "net/NetCommon.hpp"

TEST_CASE("Endpoint::fromFields falls back to defaults", "[net]")
{
    const Endpoint blank = Endpoint::fromFields("", "  ");
    REQUIRE(blank.host == kDefaultServerHost);
    REQUIRE(blank.port == kDefaultServerPort);

    const Endpoint ep = Endpoint::fromFields(" 10.0.0.5 ", "8080");
    REQUIRE(ep.host == "10.0.0.5");
    REQUIRE(ep.port == "8080");
}

TEST_CASE("Session URLs are derived from the endpoint", "[net]")
{
    const Endpoint ep = Endpoint::fromFields("example.org", "3000");
    REQUIRE(makeBaseUrl(ep) == "http://example.org:3000");
    REQUIRE(makeWebSocketUrl(ep) == "ws://example.org:3000/api/ws");
}

TEST_CASE("parseUrl splits a websocket url", "[net]")
{
    UrlParts parts;
    REQUIRE(parseUrl("ws://127.0.0.1:3000/api/ws", parts));
    REQUIRE(parts.scheme == "ws");
    REQUIRE(parts.host == "127.0.0.1");
    REQUIRE(parts.port == "3000");
    REQUIRE(parts.target == "/api/ws");
}

TEST_CASE("parseUrl defaults port and target", "[net]")
{
    UrlParts parts;
    REQUIRE(parseUrl("HTTP://example.org", parts));
    REQUIRE(parts.scheme == "http");
    REQUIRE(parts.host == "example.org");
    REQUIRE(parts.port == "80");
    REQUIRE(parts.target == "/");
}

TEST_CASE("parseUrl rejects malformed urls", "[net]")
{
    UrlParts parts;
    parts.host = "untouched";

    REQUIRE_FALSE(parseUrl("127.0.0.1:3000", parts));
    REQUIRE_FALSE(parseUrl("ftp://host/file", parts));
    REQUIRE_FALSE(parseUrl("ws://", parts));
    REQUIRE_FALSE(parseUrl("ws://:3000/api/ws", parts));
    REQUIRE_FALSE(parseUrl("ws://host:abc/api/ws", parts));
    REQUIRE_FALSE(parseUrl("ws://host:/api/ws", parts));
    REQUIRE(parts.host == "untouched");
}
