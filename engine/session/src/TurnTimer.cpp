#include "rummi/session/TurnTimer.hpp"

#include <algorithm>
#include <initializer_list>

namespace rummi::session {

const char* DecisionName(ContinuationDecision decision) noexcept {
    switch (decision) {
    case ContinuationDecision::SkipTurn:
        return "skip_turn";
    case ContinuationDecision::AddBot:
        return "add_bot";
    case ContinuationDecision::EndGame:
        return "end_game";
    }
    return "skip_turn";
}

std::optional<ContinuationDecision> ParseDecision(const std::string& name) noexcept {
    for (auto decision : {ContinuationDecision::SkipTurn, ContinuationDecision::AddBot,
                          ContinuationDecision::EndGame}) {
        if (name == DecisionName(decision)) {
            return decision;
        }
    }
    return std::nullopt;
}

void TurnTimer::start(const std::string& player_id, core::Millis duration, core::TimePoint now) {
    const auto generation = state_.generation + 1;
    state_ = TurnTimerState{};
    state_.player_id = player_id;
    state_.remaining_ms = std::max<std::int64_t>(0, duration.count());
    state_.original_duration_ms = state_.remaining_ms;
    state_.running_since_ms = core::ToEpochMs(now);
    state_.active = true;
    state_.generation = generation;
}

void TurnTimer::restore(const std::string& player_id, core::Millis remaining, core::TimePoint now) {
    const auto original = default_duration_;
    start(player_id, remaining, now);
    state_.original_duration_ms = original.count();
}

bool TurnTimer::pauseForGracePeriod(core::Millis grace_duration, core::TimePoint now) {
    if (!state_.active || paused()) {
        return false;
    }
    state_.remaining_ms = remaining(now).count();
    state_.paused_at_ms = core::ToEpochMs(now);
    state_.grace_duration_ms = grace_duration.count();
    state_.preserved = true;
    return true;
}

bool TurnTimer::resume(core::TimePoint now) {
    if (!state_.active || !paused()) {
        return false;
    }
    state_.paused_at_ms.reset();
    state_.running_since_ms = core::ToEpochMs(now);
    state_.grace_duration_ms = 0;
    state_.preserved = false;
    return true;
}

bool TurnTimer::continueForBot(const std::string& bot_id, core::TimePoint now) {
    if (!state_.active) {
        return false;
    }
    if (paused()) {
        resume(now);
    }
    state_.player_id = bot_id;
    return true;
}

void TurnTimer::handleGracePeriodExpiration(ContinuationDecision decision,
                                            const std::string& player_id, core::TimePoint now) {
    switch (decision) {
    case ContinuationDecision::SkipTurn:
        startDefault(player_id, now);
        break;
    case ContinuationDecision::AddBot:
        if (!continueForBot(player_id, now)) {
            startDefault(player_id, now);
        }
        break;
    case ContinuationDecision::EndGame:
        clear();
        break;
    }
}

void TurnTimer::clear() noexcept {
    const auto generation = state_.generation + 1;
    state_ = TurnTimerState{};
    state_.generation = generation;
}

core::Millis TurnTimer::remaining(core::TimePoint now) const {
    if (!state_.active) {
        return core::Millis(0);
    }
    if (paused()) {
        return core::Millis(state_.remaining_ms);
    }
    const auto elapsed = core::ToEpochMs(now) - state_.running_since_ms;
    return core::Millis(std::max<std::int64_t>(0, state_.remaining_ms - std::max<std::int64_t>(0, elapsed)));
}

bool TurnTimer::expired(core::TimePoint now) const {
    return state_.active && !paused() && remaining(now).count() == 0;
}

}  // namespace rummi::session
