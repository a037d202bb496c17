#pragma once
#include <cstdint>
#include <deque>
#include <iterator>
#include <mutex>
#include <string>
#include <vector>

struct TransportEvent {
    enum class Kind : uint8_t {
        Opened,
        Closed,
        MessageReceived,
        Error,
        SendFailed,
    };

    Kind kind{ Kind::Closed };
    std::string text; // frame payload or error description
};

inline const char* toString(TransportEvent::Kind k) {
    switch (k) {
    case TransportEvent::Kind::Opened: return "Opened";
    case TransportEvent::Kind::Closed: return "Closed";
    case TransportEvent::Kind::MessageReceived: return "MessageReceived";
    case TransportEvent::Kind::Error: return "Error";
    case TransportEvent::Kind::SendFailed: return "SendFailed";
    }
    return "?";
}

// Worker thread pushes, UI thread drains once per frame.
class EventQueue {
public:
    void push(TransportEvent ev) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_events.push_back(std::move(ev));
    }

    void push(TransportEvent::Kind kind, std::string text = {}) {
        push(TransportEvent{ kind, std::move(text) });
    }

    bool pop(TransportEvent& out) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_events.empty()) return false;
        out = std::move(m_events.front());
        m_events.pop_front();
        return true;
    }

    // Takes everything queued so far, in arrival order.
    std::vector<TransportEvent> drain() {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<TransportEvent> out(std::make_move_iterator(m_events.begin()),
            std::make_move_iterator(m_events.end()));
        m_events.clear();
        return out;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_events.size();
    }

private:
    mutable std::mutex m_mutex;
    std::deque<TransportEvent> m_events;
};
