#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include "net/GameProtocol.hpp"

using namespace game;

TEST_CASE("decode reads a PlayerPosition with default z", "[protocol]")
{
    InboundMessage msg;
    REQUIRE(decode(R"({"type":"PlayerPosition","payload":{"user_id":5,"x":3,"y":4}})", msg) == DecodeStatus::Ok);

    const auto* p = std::get_if<PlayerPosition>(&msg);
    REQUIRE(p != nullptr);
    REQUIRE(p->userId == 5);
    REQUIRE(p->pos == Position{ 3.0, 4.0, 0.0 });
}

TEST_CASE("decode keeps an explicit z", "[protocol]")
{
    InboundMessage msg;
    REQUIRE(decode(R"({"type":"PlayerPosition","payload":{"user_id":5,"x":1.5,"y":2,"z":-1}})", msg) == DecodeStatus::Ok);
    REQUIRE(std::get<PlayerPosition>(msg).pos == Position{ 1.5, 2.0, -1.0 });
}

TEST_CASE("decode reads PlayerDisconnected", "[protocol]")
{
    InboundMessage msg;
    REQUIRE(decode(R"({"type":"PlayerDisconnected","payload":{"user_id":9}})", msg) == DecodeStatus::Ok);
    REQUIRE(std::get<PlayerDisconnected>(msg).userId == 9);
}

TEST_CASE("decode reads an InitialPlayers roster", "[protocol]")
{
    InboundMessage msg;
    const std::string raw = R"({"type":"InitialPlayers","payload":[
        {"user_id":1,"x":2,"y":3},
        {"user_id":2,"x":10,"y":11,"z":1}
    ]})";
    REQUIRE(decode(raw, msg) == DecodeStatus::Ok);

    const auto& roster = std::get<InitialPlayers>(msg);
    REQUIRE(roster.players.size() == 2);
    REQUIRE(roster.players[0].userId == 1);
    REQUIRE(roster.players[0].pos == Position{ 2.0, 3.0, 0.0 });
    REQUIRE(roster.players[1].pos == Position{ 10.0, 11.0, 1.0 });
}

TEST_CASE("decode treats a null roster as empty", "[protocol]")
{
    InboundMessage msg;
    REQUIRE(decode(R"({"type":"InitialPlayers","payload":null})", msg) == DecodeStatus::Ok);
    REQUIRE(std::get<InitialPlayers>(msg).players.empty());
}

TEST_CASE("decode rejects a roster with one bad entry", "[protocol]")
{
    InboundMessage msg;
    const std::string raw = R"({"type":"InitialPlayers","payload":[
        {"user_id":1,"x":2,"y":3},
        {"user_id":"two","x":0,"y":0}
    ]})";
    REQUIRE(decode(raw, msg) == DecodeStatus::MalformedPayload);
}

TEST_CASE("decode reports non-JSON input as DecodeError", "[protocol]")
{
    InboundMessage msg;
    std::string detail;
    REQUIRE(decode("{not json", msg, &detail) == DecodeStatus::DecodeError);
    REQUIRE_FALSE(detail.empty());

    REQUIRE(decode("[1,2,3]", msg) == DecodeStatus::DecodeError);
    REQUIRE(decode("", msg) == DecodeStatus::DecodeError);
}

TEST_CASE("decode reports missing or unknown type as UnknownMessage", "[protocol]")
{
    InboundMessage msg;
    std::string detail;
    REQUIRE(decode(R"({"payload":{}})", msg) == DecodeStatus::UnknownMessage);
    REQUIRE(decode(R"({"type":42,"payload":{}})", msg) == DecodeStatus::UnknownMessage);
    REQUIRE(decode(R"({"type":"Chat","payload":{"text":"hi"}})", msg, &detail) == DecodeStatus::UnknownMessage);
    REQUIRE(detail == "Chat");

    // outbound-only kind
    REQUIRE(decode(R"({"type":"PlayerLogout","payload":{"user_id":1}})", msg) == DecodeStatus::UnknownMessage);
}

TEST_CASE("decode reports mistyped fields as MalformedPayload", "[protocol]")
{
    InboundMessage msg;
    REQUIRE(decode(R"({"type":"PlayerPosition","payload":{"user_id":5,"x":"3","y":4}})", msg) == DecodeStatus::MalformedPayload);
    REQUIRE(decode(R"({"type":"PlayerPosition","payload":{"user_id":5,"x":3}})", msg) == DecodeStatus::MalformedPayload);
    REQUIRE(decode(R"({"type":"PlayerPosition","payload":{"user_id":5.5,"x":3,"y":4}})", msg) == DecodeStatus::MalformedPayload);
    REQUIRE(decode(R"({"type":"PlayerPosition","payload":{"user_id":5,"x":3,"y":4,"z":null}})", msg) == DecodeStatus::MalformedPayload);
    REQUIRE(decode(R"({"type":"PlayerPosition"})", msg) == DecodeStatus::MalformedPayload);
    REQUIRE(decode(R"({"type":"PlayerDisconnected","payload":{}})", msg) == DecodeStatus::MalformedPayload);
    REQUIRE(decode(R"({"type":"InitialPlayers","payload":{"user_id":1}})", msg) == DecodeStatus::MalformedPayload);
}

TEST_CASE("Decoded coordinates are echoed back unchanged", "[protocol]")
{
    InboundMessage msg;
    REQUIRE(decode(R"({"type":"PlayerPosition","payload":{"user_id":1,"x":0.1,"y":2.7,"z":1e300}})", msg) == DecodeStatus::Ok);

    const Position pos = std::get<PlayerPosition>(msg).pos;
    REQUIRE(pos.x == 0.1);
    REQUIRE(pos.y == 2.7);
    REQUIRE(pos.z == 1e300);

    const std::string frame = encodePosition(1, pos);
    REQUIRE(frame.find(R"("x":0.1,)") != std::string::npos);
    REQUIRE(frame.find(R"("y":2.7,)") != std::string::npos);

    const auto j = nlohmann::json::parse(frame);
    REQUIRE(j.at("payload").at("x").get<double>() == 0.1);
    REQUIRE(j.at("payload").at("z").get<double>() == 1e300);
}

TEST_CASE("decode rejects a user_id beyond the id range", "[protocol]")
{
    InboundMessage msg;
    REQUIRE(decode(R"({"type":"PlayerDisconnected","payload":{"user_id":18446744073709551615}})", msg) == DecodeStatus::MalformedPayload);
    REQUIRE(decode(R"({"type":"PlayerPosition","payload":{"user_id":9223372036854775808,"x":1,"y":1}})", msg) == DecodeStatus::MalformedPayload);

    REQUIRE(decode(R"({"type":"PlayerDisconnected","payload":{"user_id":9223372036854775807}})", msg) == DecodeStatus::Ok);
    REQUIRE(std::get<PlayerDisconnected>(msg).userId == 9223372036854775807LL);

    REQUIRE(decode(R"({"type":"PlayerDisconnected","payload":{"user_id":-3}})", msg) == DecodeStatus::Ok);
    REQUIRE(std::get<PlayerDisconnected>(msg).userId == -3);
}

TEST_CASE("encodePosition builds a PlayerPosition envelope", "[protocol]")
{
    const auto j = nlohmann::json::parse(encodePosition(1, Position{ 2.0, 3.0, 0.0 }));

    REQUIRE(j.at("type").get<std::string>() == "PlayerPosition");
    REQUIRE(j.at("payload").at("user_id").get<PlayerId>() == 1);
    REQUIRE(j.at("payload").at("x").get<double>() == 2.0);
    REQUIRE(j.at("payload").at("y").get<double>() == 3.0);
    REQUIRE(j.at("payload").at("z").get<double>() == 0.0);
}

TEST_CASE("encodeLogout builds a PlayerLogout envelope", "[protocol]")
{
    const auto j = nlohmann::json::parse(encodeLogout(77));

    REQUIRE(j.at("type").get<std::string>() == "PlayerLogout");
    REQUIRE(j.at("payload").at("user_id").get<PlayerId>() == 77);
    REQUIRE(j.at("payload").size() == 1);
}

TEST_CASE("toString names every DecodeStatus", "[protocol]")
{
    REQUIRE(std::string(toString(DecodeStatus::Ok)) == "Ok");
    REQUIRE(std::string(toString(DecodeStatus::DecodeError)) == "DecodeError");
    REQUIRE(std::string(toString(DecodeStatus::UnknownMessage)) == "UnknownMessage");
    REQUIRE(std::string(toString(DecodeStatus::MalformedPayload)) == "MalformedPayload");
}
