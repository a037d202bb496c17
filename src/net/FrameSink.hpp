#pragma once
#include <string>

// Outbound text-frame channel. TransportWorker in the app, a recorder in tests.
class FrameSink {
public:
    virtual ~FrameSink() = default;

    // Best effort. false = dropped, never throws.
    virtual bool send(const std::string& text) = 0;
};
