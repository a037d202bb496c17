#include "Reconciler.hpp"
#include <algorithm>
#include <iostream>

bool shouldSend(const game::Position& current, const std::optional<game::Position>& lastSent) {
    return !lastSent || *lastSent != current;
}

Reconciler::Reconciler(Session session, FrameSink& sink, PlayerView& view, GridBounds bounds)
    : m_session(std::move(session))
    , m_sink(sink)
    , m_view(view)
    , m_bounds(bounds)
{
}

const PlayerState* Reconciler::find(game::PlayerId id) const {
    const auto it = m_players.find(id);
    return it == m_players.end() ? nullptr : &it->second;
}

void Reconciler::onTransportEvent(const TransportEvent& ev) {
    switch (ev.kind) {
    case TransportEvent::Kind::MessageReceived:
        handleText(ev.text);
        break;

    case TransportEvent::Kind::Opened:
        m_connected = true;
        std::cout << "[Reconciler] Connection open, awaiting InitialPlayers\n";
        break;

    case TransportEvent::Kind::Closed:
        m_connected = false;
        if (m_broadcastActive) {
            // re-armed by the roster that follows a reconnect
            m_broadcast.stop();
            m_broadcastActive = false;
            std::cout << "[Reconciler] Position broadcast stopped\n";
        }
        break;

    case TransportEvent::Kind::Error:
        std::cerr << "[Reconciler] Transport error: " << ev.text << "\n";
        break;

    case TransportEvent::Kind::SendFailed:
        std::cerr << "[Reconciler] Send failed: " << ev.text << "\n";
        break;
    }
}

game::DecodeStatus Reconciler::handleText(const std::string& raw) {
    game::InboundMessage msg;
    std::string detail;
    const auto status = game::decode(raw, msg, &detail);

    switch (status) {
    case game::DecodeStatus::Ok:
        apply(msg);
        break;
    case game::DecodeStatus::DecodeError:
        std::cerr << "[Reconciler] JSON decode error: " << detail << ", message: " << raw << "\n";
        break;
    case game::DecodeStatus::UnknownMessage:
        std::cerr << "[Reconciler] Unknown message type (" << detail << "): " << raw << "\n";
        break;
    case game::DecodeStatus::MalformedPayload:
        std::cerr << "[Reconciler] Malformed " << detail << " payload: " << raw << "\n";
        break;
    }
    return status;
}

void Reconciler::apply(const game::InboundMessage& msg) {
    if (const auto* p = std::get_if<game::PlayerPosition>(&msg)) {
        applyPosition(*p);
    }
    else if (const auto* d = std::get_if<game::PlayerDisconnected>(&msg)) {
        applyDisconnect(d->userId);
    }
    else if (const auto* r = std::get_if<game::InitialPlayers>(&msg)) {
        applyRoster(*r);
    }
}

void Reconciler::applyRoster(const game::InitialPlayers& roster) {
    std::cout << "[Reconciler] InitialPlayers: " << roster.players.size() << " player(s)\n";

    for (const auto& p : roster.players) {
        upsertPlayer(p.userId, p.pos);

        if (p.userId != localId()) continue;

        m_localPos = p.pos;
        std::cout << "[Reconciler] Local position set to (" << m_localPos.x << ", " << m_localPos.y
            << ", " << m_localPos.z << ")\n";

        if (!m_broadcastActive) {
            m_broadcastActive = true;
            m_broadcast.start(kBroadcastInterval);
            std::cout << "[Reconciler] Position broadcast started\n";
            sendLocalPosition();
        }
    }
}

void Reconciler::applyPosition(const game::PlayerPosition& p) {
    if (p.userId == localId()) {
        m_localPos = p.pos;
    }
    upsertPlayer(p.userId, p.pos);
}

void Reconciler::applyDisconnect(game::PlayerId id) {
    if (id == localId()) {
        std::cout << "[Reconciler] Ignoring PlayerDisconnected for self (user_id " << id << ")\n";
        return;
    }

    if (m_players.erase(id) == 0) {
        std::cout << "[Reconciler] PlayerDisconnected for unknown player " << id << "\n";
        return;
    }
    m_view.remove(id);
    std::cout << "[Reconciler] Player " << id << " left (" << m_players.size() << " visible)\n";
}

void Reconciler::upsertPlayer(game::PlayerId id, const game::Position& pos) {
    PlayerState& st = m_players[id];
    st.id = id;
    st.position = pos;
    st.isLocal = (id == localId());
    m_view.upsert(id, pos, st.isLocal);
}

void Reconciler::moveLocal(int dx, int dy) {
    setLocalPosition(m_localPos.x + dx, m_localPos.y + dy);
}

void Reconciler::setLocalPosition(double x, double y) {
    m_localPos.x = std::clamp(x, 0.0, (double)(m_bounds.width - 1));
    m_localPos.y = std::clamp(y, 0.0, (double)(m_bounds.height - 1));

    upsertPlayer(localId(), m_localPos);
    sendLocalPosition();
}

bool Reconciler::sendLocalPosition() {
    if (!shouldSend(m_localPos, m_lastSent)) return false;

    if (!m_sink.send(game::encodePosition(localId(), m_localPos))) return false;

    m_lastSent = m_localPos;
    return true;
}

void Reconciler::tick(float dt) {
    if (m_broadcast.advance(dt) > 0) {
        sendLocalPosition();
    }
}

bool Reconciler::logout() {
    m_broadcast.stop();

    const bool sent = m_sink.send(game::encodeLogout(localId()));
    if (sent) std::cout << "[Reconciler] Sent PlayerLogout for user " << localId() << "\n";
    else std::cerr << "[Reconciler] PlayerLogout for user " << localId() << " was dropped\n";
    return sent;
}
