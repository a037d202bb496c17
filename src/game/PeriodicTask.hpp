#pragma once

// Fixed-interval task advanced by the frame loop (no thread of its own).
class PeriodicTask {
public:
    void start(float intervalSeconds) {
        m_interval = intervalSeconds;
        m_accum = 0.f;
        m_active = true;
    }

    void stop() {
        m_active = false;
        m_accum = 0.f;
    }

    bool active() const { return m_active; }
    float interval() const { return m_interval; }

    // Returns how many intervals elapsed during dt (0 if stopped).
    int advance(float dt) {
        if (!m_active || m_interval <= 0.f) return 0;

        m_accum += dt;
        int fired = 0;
        while (m_accum >= m_interval) {
            m_accum -= m_interval;
            ++fired;
        }
        return fired;
    }

private:
    float m_interval{ 0.f };
    float m_accum{ 0.f };
    bool m_active{ false };
};
