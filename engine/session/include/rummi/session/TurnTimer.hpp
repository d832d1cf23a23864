#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "rummi/core/Clock.hpp"
#include "rummi/session/Continuation.hpp"

namespace rummi::session {

struct TurnTimerState {
    std::string player_id;
    // Remaining time as of running_since_ms, or as of the pause.
    std::int64_t remaining_ms = 0;
    std::int64_t original_duration_ms = 0;
    std::int64_t running_since_ms = 0;
    std::optional<std::int64_t> paused_at_ms;
    std::int64_t grace_duration_ms = 0;
    bool preserved = false;
    bool active = false;
    // Bumped on every start and clear; deadlines from older generations are stale.
    std::uint64_t generation = 0;

    bool operator==(const TurnTimerState& other) const {
        return player_id == other.player_id && remaining_ms == other.remaining_ms &&
               original_duration_ms == other.original_duration_ms &&
               running_since_ms == other.running_since_ms && paused_at_ms == other.paused_at_ms &&
               grace_duration_ms == other.grace_duration_ms && preserved == other.preserved &&
               active == other.active && generation == other.generation;
    }
};

class TurnTimer {
public:
    explicit TurnTimer(core::Millis default_duration) : default_duration_(default_duration) {}

    void start(const std::string& player_id, core::Millis duration, core::TimePoint now);
    void startDefault(const std::string& player_id, core::TimePoint now) {
        start(player_id, default_duration_, now);
    }
    void restore(const std::string& player_id, core::Millis remaining, core::TimePoint now);

    bool pauseForGracePeriod(core::Millis grace_duration, core::TimePoint now);
    bool resume(core::TimePoint now);
    bool continueForBot(const std::string& bot_id, core::TimePoint now);
    void handleGracePeriodExpiration(ContinuationDecision decision, const std::string& player_id,
                                     core::TimePoint now);
    void clear() noexcept;

    core::Millis remaining(core::TimePoint now) const;
    bool expired(core::TimePoint now) const;

    bool active() const noexcept { return state_.active; }
    bool paused() const noexcept { return state_.paused_at_ms.has_value(); }
    bool preserved() const noexcept { return state_.preserved; }
    std::uint64_t generation() const noexcept { return state_.generation; }
    const std::string& playerId() const noexcept { return state_.player_id; }
    core::Millis defaultDuration() const noexcept { return default_duration_; }

    const TurnTimerState& state() const noexcept { return state_; }
    void restoreState(TurnTimerState state) { state_ = std::move(state); }

private:
    core::Millis default_duration_;
    TurnTimerState state_;
};

}  // namespace rummi::session
