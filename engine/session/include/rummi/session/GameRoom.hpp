#pragma once

#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "rummi/core/GameSession.hpp"
#include "rummi/core/ServerConfig.hpp"
#include "rummi/session/ConnectionTracker.hpp"
#include "rummi/session/GameEvents.hpp"
#include "rummi/session/ReconnectionManager.hpp"
#include "rummi/session/Recovery.hpp"
#include "rummi/session/TurnTimer.hpp"

namespace rummi::session {

struct RoomSettings {
    core::GameOptions options;
    ReconnectionSettings reconnection;
    core::Millis bot_move_delay{1500};
};

RoomSettings RoomSettingsFrom(const core::ServerConfig& config);

// Everything that is persisted for one game.
struct RoomSnapshot {
    core::SessionState session;
    TurnTimerState timer;
    PauseState pause;
    std::vector<GracePeriod> grace_periods;
    std::vector<ConnectionStatus> connections;
};

// Per-game context. Every call locks the room so plays, draws, timer expiry and
// connection changes on one game never interleave.
class GameRoom {
public:
    GameRoom(std::string game_id, RoomSettings settings, std::uint32_t seed = std::random_device{}());
    GameRoom(RoomSnapshot snapshot, RoomSettings settings);

    GameRoom(const GameRoom&) = delete;
    GameRoom& operator=(const GameRoom&) = delete;

    const std::string& id() const noexcept { return id_; }

    core::ActionResult join(const std::string& player_id, const std::string& name,
                            core::TimePoint now, EventQueue& events);
    core::ActionResult addBot(core::TimePoint now, EventQueue& events);
    core::ActionResult start(const std::string& player_id, core::TimePoint now, EventQueue& events);

    core::ActionResult playSet(const std::string& player_id, const std::vector<std::string>& tile_ids,
                               core::SetTarget target, core::TimePoint now, EventQueue& events);
    core::ActionResult playMultipleSets(const std::string& player_id,
                                        const std::vector<std::vector<std::string>>& sets,
                                        core::TimePoint now, EventQueue& events);
    core::ActionResult stageTiles(const std::string& player_id,
                                  const std::vector<std::string>& tile_ids, core::SetTarget target,
                                  core::TimePoint now, EventQueue& events);
    core::ActionResult returnTile(const std::string& player_id, const std::string& tile_id,
                                  core::TimePoint now, EventQueue& events);
    core::ActionResult revertTurn(const std::string& player_id, core::TimePoint now,
                                  EventQueue& events);
    core::ActionResult drawTile(const std::string& player_id, core::TimePoint now, EventQueue& events);
    core::ActionResult endTurn(const std::string& player_id, core::TimePoint now, EventQueue& events);

    core::ActionResult vote(const std::string& player_id, ContinuationDecision decision,
                            core::TimePoint now, EventQueue& events);
    core::ActionResult pause(const std::string& player_id, core::TimePoint now, EventQueue& events);
    core::ActionResult resume(const std::string& player_id, core::TimePoint now, EventQueue& events);
    core::ActionResult chat(const std::string& player_id, const std::string& text,
                            core::TimePoint now, EventQueue& events);
    core::ActionResult leave(const std::string& player_id, core::TimePoint now, EventQueue& events);

    ReconnectResult reconnect(const std::string& player_id, core::TimePoint now, EventQueue& events);
    void disconnect(const std::string& player_id, core::TimePoint now, EventQueue& events);
    bool heartbeat(const std::string& player_id, const ConnectionMetrics& metrics,
                   core::TimePoint now, EventQueue& events);

    // Drives grace periods, votes, turn expiry and bot moves.
    void tick(core::TimePoint now, EventQueue& events);

    // Runs the recovery strategy for a failure seen outside the room, such as a failed send.
    RecoveryOutcome recover(FailureKind kind, const FailureContext& context, core::TimePoint now,
                            EventQueue& events);

    bool hasPlayer(const std::string& player_id) const;
    bool finished() const;
    std::vector<std::string> participantIds() const;
    RoomSnapshot snapshot() const;
    core::Json viewFor(const std::string& player_id, core::TimePoint now) const;

    template <typename Fn>
    auto inspect(Fn&& fn) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fn(session_, timer_, reconnection_);
    }

private:
    template <typename Fn>
    core::ActionResult mutate(core::TimePoint now, EventQueue& events, Fn&& fn);
    void afterChange(int previous_turn, bool was_started, core::TimePoint now, EventQueue& events);
    void startTurnTimer(core::TimePoint now);
    void checkConsistency(core::TimePoint now, EventQueue& events);
    bool tilesConsistent() const;
    RecoveryOutcome recoverLocked(FailureKind kind, const FailureContext& context,
                                  core::TimePoint now, EventQueue& events);
    bool execute(RecoveryAction action, const FailureContext& context, core::TimePoint now,
                 EventQueue& events);

    std::string id_;
    RoomSettings settings_;
    mutable std::mutex mutex_;
    core::GameSession session_;
    TurnTimer timer_;
    ConnectionTracker connections_;
    RecoveryCoordinator recovery_;
    ReconnectionManager reconnection_;
    std::optional<core::TimePoint> bot_ready_at_;
    bool game_over_sent_ = false;
};

}  // namespace rummi::session
