#pragma once
#include "net/GameProtocol.hpp"

// What the reconciler drives on screen. Calls are idempotent.
class PlayerView {
public:
    virtual ~PlayerView() = default;

    virtual void upsert(game::PlayerId id, const game::Position& pos, bool isLocal) = 0;
    virtual void remove(game::PlayerId id) = 0;
};
