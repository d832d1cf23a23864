#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "rummi/core/ActionResult.hpp"
#include "rummi/core/Clock.hpp"
#include "rummi/core/GameSession.hpp"
#include "rummi/session/ConnectionTracker.hpp"
#include "rummi/session/ContinuationVote.hpp"
#include "rummi/session/GameEvents.hpp"
#include "rummi/session/ReconnectionAnalytics.hpp"
#include "rummi/session/Recovery.hpp"
#include "rummi/session/TurnTimer.hpp"

namespace rummi::session {

enum class PauseReason {
    CurrentPlayerDisconnect,
    MultipleDisconnects,
    NetworkInstability,
    AllPlayersDisconnect,
    ManualPause,
};

const char* PauseReasonName(PauseReason reason) noexcept;
std::optional<PauseReason> ParsePauseReason(const std::string& name) noexcept;

struct PauseState {
    bool is_paused = false;
    PauseReason reason = PauseReason::CurrentPlayerDisconnect;
    std::optional<std::int64_t> paused_at_ms;
    std::string paused_by;

    bool operator==(const PauseState& other) const {
        return is_paused == other.is_paused && reason == other.reason &&
               paused_at_ms == other.paused_at_ms && paused_by == other.paused_by;
    }
};

struct GracePeriod {
    bool is_active = false;
    std::int64_t start_ms = 0;
    std::int64_t duration_ms = 0;
    std::string target_player_id;

    bool operator==(const GracePeriod& other) const {
        return is_active == other.is_active && start_ms == other.start_ms &&
               duration_ms == other.duration_ms && target_player_id == other.target_player_id;
    }
};

struct ReconnectionSettings {
    GraceDurations grace;
    core::Millis vote_timeout{30000};
    core::Millis concurrent_window{5000};
};

inline constexpr int kMaxReconnectAttempts = 5;

// 2 s doubled per attempt, capped at 30 s.
core::Millis ReconnectBackoff(int attempt) noexcept;

enum class ReconnectStatus { Restored, AlreadyConnected, NotInGame, GameMovedOn, TooManyAttempts };

struct ReconnectResult {
    ReconnectStatus status = ReconnectStatus::Restored;
    std::string reason;
    core::Millis retry_after{0};

    bool ok() const noexcept {
        return status == ReconnectStatus::Restored || status == ReconnectStatus::AlreadyConnected;
    }
};

class ReconnectionManager {
public:
    ReconnectionManager(core::GameSession& session, TurnTimer& timer, ConnectionTracker& connections,
                        RecoveryCoordinator& recovery, ReconnectionSettings settings);

    void handleDisconnect(const std::string& player_id, core::TimePoint now, EventQueue& events);
    ReconnectResult handleReconnect(const std::string& player_id, core::TimePoint now,
                                    EventQueue& events);
    core::ActionResult castVote(const std::string& voter_id, ContinuationDecision decision,
                                core::TimePoint now, EventQueue& events);

    // Expires grace periods and resolves timed out votes.
    void tick(core::TimePoint now, EventQueue& events);
    // Re-evaluates the pause after the turn moved to another player.
    void onTurnChanged(core::TimePoint now, EventQueue& events);
    // Skips the grace period of a player and applies the default continuation.
    bool forceDecision(const std::string& player_id, core::TimePoint now, EventQueue& events);
    // Grace periods whose target is gone, abandoned, a bot, or connected again.
    std::vector<std::string> staleGracePeriods() const;
    // Discards a grace period without deciding anything about its player.
    bool dropGracePeriod(const std::string& player_id, core::TimePoint now, EventQueue& events);

    core::ActionResult pauseManually(const std::string& player_id, core::TimePoint now,
                                     EventQueue& events);
    core::ActionResult resumeManually(const std::string& player_id, core::TimePoint now,
                                      EventQueue& events);

    const PauseState& pauseState() const noexcept { return pause_; }
    std::vector<GracePeriod> gracePeriods() const;
    const std::optional<ContinuationVote>& vote() const noexcept { return vote_; }
    bool wasDecided(const std::string& player_id) const { return decided_.count(player_id) > 0; }
    const ReconnectionAnalytics& analytics() const noexcept { return analytics_; }

    void restore(const PauseState& pause, const std::vector<GracePeriod>& grace_periods);

private:
    std::vector<std::string> connectedHumans(const std::string& except = {}) const;
    bool humansRemain() const;
    void openVote(const std::string& target, core::TimePoint now, EventQueue& events);
    void resolveVote(core::TimePoint now, EventQueue& events);
    void applyDecision(const std::string& target, ContinuationDecision decision, core::TimePoint now,
                       EventQueue& events);
    void evaluatePause(const std::string& trigger, core::TimePoint now, EventQueue& events);
    void enterPause(PauseReason reason, const std::string& by, core::TimePoint now,
                    EventQueue& events);
    void leavePause(core::TimePoint now, EventQueue& events);
    void holdTimer(core::TimePoint now);
    core::Json pauseJson() const;

    core::GameSession& session_;
    TurnTimer& timer_;
    ConnectionTracker& connections_;
    RecoveryCoordinator& recovery_;
    ReconnectionSettings settings_;

    PauseState pause_;
    std::map<std::string, GracePeriod> grace_;
    std::optional<ContinuationVote> vote_;
    std::deque<std::string> pending_decisions_;
    std::set<std::string> decided_;
    std::deque<core::TimePoint> recent_disconnects_;
    ReconnectionAnalytics analytics_;
};

}  // namespace rummi::session
