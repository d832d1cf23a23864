#pragma once

#include <string>
#include <vector>

#include "rummi/core/Json.hpp"

namespace rummi::session {

enum class GameEventType {
    StateChanged,
    TurnTimedOut,
    Paused,
    Resumed,
    GracePeriodStarted,
    GracePeriodEnded,
    VoteOpened,
    VoteProgress,
    VoteCancelled,
    ContinuationDecided,
    PlayerReconnected,
    GameOver,
    Chat,
    Redirect,
};

const char* EventTypeName(GameEventType type) noexcept;

// recipient empty means every participant of the game.
struct GameEvent {
    GameEventType type = GameEventType::StateChanged;
    std::string recipient;
    core::Json payload = core::Json::object();
};

using EventQueue = std::vector<GameEvent>;

inline void Emit(EventQueue& events, GameEventType type, core::Json payload = core::Json::object(),
                 std::string recipient = {}) {
    events.push_back(GameEvent{type, std::move(recipient), std::move(payload)});
}

}  // namespace rummi::session
