#pragma once
#include <optional>
#include <string>
#include <unordered_map>

#include "PeriodicTask.hpp"
#include "PlayerView.hpp"
#include "net/EventQueue.hpp"
#include "net/FrameSink.hpp"
#include "net/GameProtocol.hpp"
#include "net/NetCommon.hpp"

struct PlayerState {
    game::PlayerId id{ 0 };
    game::Position position{};
    bool isLocal{ false };
};

struct GridBounds {
    int width{ game::kGridWidth };
    int height{ game::kGridHeight };
};

// True when nothing was sent yet or any coordinate changed.
bool shouldSend(const game::Position& current, const std::optional<game::Position>& lastSent);

// Applies server events to the visible player-set and decides what the local
// client transmits. UI thread only.
class Reconciler {
public:
    static constexpr float kBroadcastInterval = 0.1f; // seconds

    Reconciler(Session session, FrameSink& sink, PlayerView& view, GridBounds bounds = {});

    // Transport -> state
    void onTransportEvent(const TransportEvent& ev);
    game::DecodeStatus handleText(const std::string& raw);
    void apply(const game::InboundMessage& msg);

    // Input -> state -> wire
    void moveLocal(int dx, int dy);
    void setLocalPosition(double x, double y);
    bool sendLocalPosition();
    void tick(float dt);
    bool logout();

    const std::unordered_map<game::PlayerId, PlayerState>& players() const { return m_players; }
    const PlayerState* find(game::PlayerId id) const;

    const Session& session() const { return m_session; }
    game::PlayerId localId() const { return m_session.userId; }
    const game::Position& localPosition() const { return m_localPos; }
    const std::optional<game::Position>& lastSentPosition() const { return m_lastSent; }
    bool broadcastActive() const { return m_broadcastActive; }
    bool connected() const { return m_connected; }

private:
    void applyRoster(const game::InitialPlayers& roster);
    void applyPosition(const game::PlayerPosition& p);
    void applyDisconnect(game::PlayerId id);
    void upsertPlayer(game::PlayerId id, const game::Position& pos);

private:
    Session m_session;
    FrameSink& m_sink;
    PlayerView& m_view;
    GridBounds m_bounds;

    std::unordered_map<game::PlayerId, PlayerState> m_players;

    game::Position m_localPos{};
    std::optional<game::Position> m_lastSent;

    bool m_broadcastActive{ false };
    PeriodicTask m_broadcast;

    bool m_connected{ false };
};
