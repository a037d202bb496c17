#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace game {

    // Must match the server's map.
    static constexpr int kGridWidth = 40;
    static constexpr int kGridHeight = 20;

    using PlayerId = std::int64_t;

    struct Position {
        double x{ 0.0 };
        double y{ 0.0 };
        double z{ 0.0 };
    };

    inline bool operator==(const Position& a, const Position& b) {
        return a.x == b.x && a.y == b.y && a.z == b.z;
    }
    inline bool operator!=(const Position& a, const Position& b) { return !(a == b); }

    // Envelope "type" values.
    namespace type {
        static constexpr const char* PlayerPosition = "PlayerPosition";
        static constexpr const char* PlayerDisconnected = "PlayerDisconnected";
        static constexpr const char* InitialPlayers = "InitialPlayers";
        static constexpr const char* PlayerLogout = "PlayerLogout";
    }

    struct PlayerPosition {
        PlayerId userId{ 0 };
        Position pos{};
    };

    struct PlayerDisconnected {
        PlayerId userId{ 0 };
    };

    struct InitialPlayers {
        std::vector<PlayerPosition> players;
    };

    using InboundMessage = std::variant<PlayerPosition, PlayerDisconnected, InitialPlayers>;

    enum class DecodeStatus : uint8_t {
        Ok = 0,
        DecodeError,       // not JSON / not an envelope object
        UnknownMessage,    // type missing or not an inbound kind
        MalformedPayload,  // known type, required field missing or mistyped
    };

    const char* toString(DecodeStatus s);

    // detail (optional) receives the parser cause or the offending kind.
    DecodeStatus decode(const std::string& raw, InboundMessage& out, std::string* detail = nullptr);

    std::string encodePosition(PlayerId userId, const Position& pos);
    std::string encodeLogout(PlayerId userId);

} // namespace game
