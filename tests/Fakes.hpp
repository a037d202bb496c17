#pragma once
#include <string>
#include <unordered_map>
#include <vector>

#include "game/PlayerView.hpp"
#include "net/FrameSink.hpp"

// Captures every frame; accept toggles whether send() succeeds.
class RecordingSink : public FrameSink {
public:
    bool send(const std::string& text) override {
        ++attempts;
        if (!accept) return false;
        frames.push_back(text);
        return true;
    }

    bool accept{ true };
    int attempts{ 0 };
    std::vector<std::string> frames;
};

class RecordingView : public PlayerView {
public:
    struct Entry {
        game::Position pos{};
        bool isLocal{ false };
    };

    void upsert(game::PlayerId id, const game::Position& pos, bool isLocal) override {
        entries[id] = Entry{ pos, isLocal };
        ++upserts;
    }

    void remove(game::PlayerId id) override {
        entries.erase(id);
        ++removals;
    }

    bool has(game::PlayerId id) const { return entries.count(id) != 0; }

    std::unordered_map<game::PlayerId, Entry> entries;
    int upserts{ 0 };
    int removals{ 0 };
};
