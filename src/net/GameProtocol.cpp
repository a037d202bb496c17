#include "GameProtocol.hpp"

#include <cstdint>
#include <limits>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace game {

namespace {

// Integral and within PlayerId range; unsigned values above INT64_MAX are rejected.
bool readPlayerId(const json& j, PlayerId& out) {
    if (!j.is_number_integer()) return false;
    if (j.is_number_unsigned() &&
        j.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<PlayerId>::max())) {
        return false;
    }
    out = j.get<PlayerId>();
    return true;
}

bool readPlayerPosition(const json& j, PlayerPosition& out) {
    if (!j.is_object()) return false;

    const auto id = j.find("user_id");
    const auto x = j.find("x");
    const auto y = j.find("y");
    PlayerId userId = 0;
    if (id == j.end() || !readPlayerId(*id, userId)) return false;
    if (x == j.end() || !x->is_number()) return false;
    if (y == j.end() || !y->is_number()) return false;

    double z = 0.0;
    const auto zIt = j.find("z");
    if (zIt != j.end()) {
        if (!zIt->is_number()) return false;
        z = zIt->get<double>();
    }

    out.userId = userId;
    out.pos = { x->get<double>(), y->get<double>(), z };
    return true;
}

} // namespace

const char* toString(DecodeStatus s) {
    switch (s) {
    case DecodeStatus::Ok: return "Ok";
    case DecodeStatus::DecodeError: return "DecodeError";
    case DecodeStatus::UnknownMessage: return "UnknownMessage";
    case DecodeStatus::MalformedPayload: return "MalformedPayload";
    }
    return "?";
}

DecodeStatus decode(const std::string& raw, InboundMessage& out, std::string* detail) {
    json doc;
    try {
        doc = json::parse(raw);
    }
    catch (const json::parse_error& e) {
        if (detail) *detail = e.what();
        return DecodeStatus::DecodeError;
    }

    if (!doc.is_object()) {
        if (detail) *detail = "envelope is not an object";
        return DecodeStatus::DecodeError;
    }

    const auto typeIt = doc.find("type");
    if (typeIt == doc.end() || !typeIt->is_string()) {
        if (detail) *detail = "missing type";
        return DecodeStatus::UnknownMessage;
    }

    const std::string kind = typeIt->get<std::string>();
    if (detail) *detail = kind;

    static const json kNull;
    const auto payloadIt = doc.find("payload");
    const json& payload = (payloadIt != doc.end()) ? *payloadIt : kNull;

    if (kind == type::PlayerPosition) {
        PlayerPosition p{};
        if (!readPlayerPosition(payload, p)) return DecodeStatus::MalformedPayload;
        out = p;
        return DecodeStatus::Ok;
    }

    if (kind == type::PlayerDisconnected) {
        if (!payload.is_object()) return DecodeStatus::MalformedPayload;
        const auto id = payload.find("user_id");
        PlayerId userId = 0;
        if (id == payload.end() || !readPlayerId(*id, userId)) return DecodeStatus::MalformedPayload;
        out = PlayerDisconnected{ userId };
        return DecodeStatus::Ok;
    }

    if (kind == type::InitialPlayers) {
        InitialPlayers roster{};
        if (payload.is_null()) {
            out = roster;
            return DecodeStatus::Ok;
        }
        if (!payload.is_array()) return DecodeStatus::MalformedPayload;

        roster.players.reserve(payload.size());
        for (const auto& entry : payload) {
            PlayerPosition p{};
            // one bad entry rejects the whole roster
            if (!readPlayerPosition(entry, p)) return DecodeStatus::MalformedPayload;
            roster.players.push_back(p);
        }
        out = std::move(roster);
        return DecodeStatus::Ok;
    }

    return DecodeStatus::UnknownMessage;
}

std::string encodePosition(PlayerId userId, const Position& pos) {
    const json msg{
        { "type", type::PlayerPosition },
        { "payload", { { "user_id", userId }, { "x", pos.x }, { "y", pos.y }, { "z", pos.z } } },
    };
    return msg.dump();
}

std::string encodeLogout(PlayerId userId) {
    const json msg{
        { "type", type::PlayerLogout },
        { "payload", { { "user_id", userId } } },
    };
    return msg.dump();
}

} // namespace game
