#include <catch2/catch_test_macros.hpp>

#include "net/Token.hpp"

namespace {

// header {"alg":"HS256","typ":"JWT"}
const std::string kHeader = "eyJhbGciOiJIUzI1NiIsInR5cCI6IkpXVCJ9";

std::string jwt(const std::string& claims) {
    return kHeader + "." + claims + ".sig";
}

} // namespace

TEST_CASE("base64UrlDecode handles unpadded url-safe input", "[token]")
{
    REQUIRE(auth::base64UrlDecode("aGVsbG8") == std::string("hello"));
    REQUIRE(auth::base64UrlDecode("aGk_") == std::string("hi?"));
    REQUIRE(auth::base64UrlDecode("Pj4-Pw") == std::string(">>>?"));
    REQUIRE(auth::base64UrlDecode("Pj4-Pw==") == std::string(">>>?"));
    REQUIRE(auth::base64UrlDecode("") == std::string());
}

TEST_CASE("base64UrlDecode rejects invalid input", "[token]")
{
    REQUIRE_FALSE(auth::base64UrlDecode("a").has_value());
    REQUIRE_FALSE(auth::base64UrlDecode("a$b!").has_value());
}

TEST_CASE("decodeSubject reads a string sub claim", "[token]")
{
    std::string err;
    // {"sub":"42"}
    const auto id = auth::decodeSubject(jwt("eyJzdWIiOiI0MiJ9"), err);
    REQUIRE(id.has_value());
    REQUIRE(*id == 42);
}

TEST_CASE("decodeSubject reads an integer sub claim", "[token]")
{
    std::string err;
    // {"sub":7}
    const auto id = auth::decodeSubject(jwt("eyJzdWIiOjd9"), err);
    REQUIRE(id.has_value());
    REQUIRE(*id == 7);
}

TEST_CASE("decodeSubject rejects unusable tokens", "[token]")
{
    std::string err;

    REQUIRE_FALSE(auth::decodeSubject("not-a-token", err).has_value());
    REQUIRE(err == "token is not a JWT");

    REQUIRE_FALSE(auth::decodeSubject("a.b.c.d", err).has_value());

    // "not json"
    REQUIRE_FALSE(auth::decodeSubject(jwt("bm90IGpzb24"), err).has_value());

    // {"name":"x"}
    REQUIRE_FALSE(auth::decodeSubject(jwt("eyJuYW1lIjoieCJ9"), err).has_value());
    REQUIRE(err == "token has no sub claim");

    // {"sub":"abc"}
    REQUIRE_FALSE(auth::decodeSubject(jwt("eyJzdWIiOiJhYmMifQ"), err).has_value());

    // {"sub":"-"}
    REQUIRE_FALSE(auth::decodeSubject(jwt("eyJzdWIiOiItIn0"), err).has_value());
}

TEST_CASE("decodeSubject rejects a sub beyond the id range", "[token]")
{
    std::string err;
    // {"sub":18446744073709551615}
    REQUIRE_FALSE(auth::decodeSubject(jwt("eyJzdWIiOjE4NDQ2NzQ0MDczNzA5NTUxNjE1fQ"), err).has_value());
    REQUIRE(err.rfind("sub claim out of range", 0) == 0);
}
