#include "rummi/session/ReconnectionManager.hpp"

#include <SDL2/SDL.h>

#include <algorithm>
#include <initializer_list>

namespace rummi::session {

const char* PauseReasonName(PauseReason reason) noexcept {
    switch (reason) {
    case PauseReason::CurrentPlayerDisconnect:
        return "CURRENT_PLAYER_DISCONNECT";
    case PauseReason::MultipleDisconnects:
        return "MULTIPLE_DISCONNECTS";
    case PauseReason::NetworkInstability:
        return "NETWORK_INSTABILITY";
    case PauseReason::AllPlayersDisconnect:
        return "ALL_PLAYERS_DISCONNECT";
    case PauseReason::ManualPause:
        return "MANUAL_PAUSE";
    }
    return "CURRENT_PLAYER_DISCONNECT";
}

std::optional<PauseReason> ParsePauseReason(const std::string& name) noexcept {
    for (auto reason : {PauseReason::CurrentPlayerDisconnect, PauseReason::MultipleDisconnects,
                        PauseReason::NetworkInstability, PauseReason::AllPlayersDisconnect,
                        PauseReason::ManualPause}) {
        if (name == PauseReasonName(reason)) {
            return reason;
        }
    }
    return std::nullopt;
}

ReconnectionManager::ReconnectionManager(core::GameSession& session, TurnTimer& timer,
                                         ConnectionTracker& connections,
                                         RecoveryCoordinator& recovery,
                                         ReconnectionSettings settings)
    : session_(session),
      timer_(timer),
      connections_(connections),
      recovery_(recovery),
      settings_(settings) {}

std::vector<std::string> ReconnectionManager::connectedHumans(const std::string& except) const {
    std::vector<std::string> ids;
    for (const auto& player : session_.players()) {
        if (player.is_bot || player.abandoned || player.id == except) {
            continue;
        }
        if (connections_.isConnected(player.id)) {
            ids.push_back(player.id);
        }
    }
    return ids;
}

bool ReconnectionManager::humansRemain() const {
    const auto& players = session_.players();
    return std::any_of(players.begin(), players.end(), [](const core::Player& player) {
        return !player.is_bot && !player.abandoned;
    });
}

std::vector<GracePeriod> ReconnectionManager::gracePeriods() const {
    std::vector<GracePeriod> periods;
    for (const auto& entry : grace_) {
        periods.push_back(entry.second);
    }
    return periods;
}

void ReconnectionManager::restore(const PauseState& pause,
                                  const std::vector<GracePeriod>& grace_periods) {
    pause_ = pause;
    grace_.clear();
    pending_decisions_.clear();
    for (const auto& period : grace_periods) {
        grace_[period.target_player_id] = period;
        if (!period.is_active) {
            pending_decisions_.push_back(period.target_player_id);
        }
    }
}

void ReconnectionManager::handleDisconnect(const std::string& player_id, core::TimePoint now,
                                           EventQueue& events) {
    const core::Player* player = session_.findPlayer(player_id);
    if (player == nullptr || player->is_bot || player->abandoned) {
        return;
    }
    const ConnectionStatus* status = connections_.find(player_id);
    if (status == nullptr || status->state == ConnectionState::Disconnected ||
        status->state == ConnectionState::Abandoned) {
        return;
    }
    connections_.transition(player_id, ConnectionState::Disconnecting, now);
    connections_.transition(player_id, ConnectionState::Disconnected, now);

    if (!session_.started()) {
        auto removed = session_.removePlayer(player_id);
        if (!removed) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Could not remove %s from lobby %s: %s",
                        player_id.c_str(), session_.id().c_str(), removed.reason.c_str());
        }
        connections_.forget(player_id);
        Emit(events, GameEventType::StateChanged);
        return;
    }
    if (session_.completed()) {
        return;
    }

    GracePeriod grace;
    grace.is_active = true;
    grace.start_ms = core::ToEpochMs(now);
    grace.duration_ms = GraceDurationFor(*connections_.find(player_id), settings_.grace).count();
    grace.target_player_id = player_id;
    grace_[player_id] = grace;
    analytics_.recordDisconnect(*connections_.find(player_id));
    analytics_.recordGracePeriodStarted();

    SDL_Log("Player %s disconnected from game %s, grace period %lld ms", player_id.c_str(),
            session_.id().c_str(), static_cast<long long>(grace.duration_ms));
    Emit(events, GameEventType::GracePeriodStarted,
         {{"playerId", player_id}, {"durationMs", grace.duration_ms}});

    recent_disconnects_.push_back(now);
    while (!recent_disconnects_.empty() &&
           now - recent_disconnects_.front() > settings_.concurrent_window) {
        recent_disconnects_.pop_front();
    }
    if (recent_disconnects_.size() >= 2) {
        FailureContext context{session_.id(), player_id, "players dropped together"};
        auto outcome = recovery_.handle(
            FailureKind::ConcurrentDisconnection, context, now,
            [](RecoveryAction action, const FailureContext&) {
                // The room lock already processes disconnects one at a time.
                return action == RecoveryAction::ProcessSequentially;
            });
        if (!outcome.success) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Concurrent disconnects in %s unresolved",
                        session_.id().c_str());
        }
    }

    evaluatePause(player_id, now, events);
}

core::Millis ReconnectBackoff(int attempt) noexcept {
    constexpr std::int64_t kBase = 2000;
    constexpr std::int64_t kCap = 30000;
    std::int64_t delay = kBase;
    for (int i = 1; i < attempt && delay < kCap; ++i) {
        delay *= 2;
    }
    return core::Millis(std::min(delay, kCap));
}

ReconnectResult ReconnectionManager::handleReconnect(const std::string& player_id,
                                                     core::TimePoint now, EventQueue& events) {
    const core::Player* player = session_.findPlayer(player_id);
    if (player == nullptr) {
        if (decided_.count(player_id) > 0) {
            return {ReconnectStatus::GameMovedOn, "The game continued without you"};
        }
        return {ReconnectStatus::NotInGame, "You are not part of this game"};
    }
    if (player->abandoned || decided_.count(player_id) > 0) {
        return {ReconnectStatus::GameMovedOn, "The game continued without you"};
    }
    if (session_.completed()) {
        return {ReconnectStatus::GameMovedOn, "The game has ended"};
    }

    const ConnectionStatus* status = connections_.find(player_id);
    if (status == nullptr || status->state == ConnectionState::Connected) {
        connections_.track(player_id, now);
        return {ReconnectStatus::AlreadyConnected, {}};
    }
    if (status->state == ConnectionState::Abandoned) {
        return {ReconnectStatus::GameMovedOn, "The game continued without you"};
    }

    if (status->reconnection_attempts >= kMaxReconnectAttempts) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Player %s exceeded %d reconnect attempts",
                    player_id.c_str(), kMaxReconnectAttempts);
        analytics_.recordReconnect(false, core::Millis(0));
        return {ReconnectStatus::TooManyAttempts, "Too many reconnection attempts",
                ReconnectBackoff(status->reconnection_attempts)};
    }
    const std::int64_t away_since = status->disconnected_at_ms.value_or(core::ToEpochMs(now));
    if (!connections_.transition(player_id, ConnectionState::Reconnecting, now) ||
        !connections_.transition(player_id, ConnectionState::Connected, now)) {
        analytics_.recordReconnect(false, core::Millis(0));
        const ConnectionStatus* failed = connections_.find(player_id);
        const int attempts = failed != nullptr ? failed->reconnection_attempts : 1;
        return {ReconnectStatus::TooManyAttempts, "Reconnection could not be completed",
                ReconnectBackoff(attempts)};
    }
    analytics_.recordReconnect(true, core::Millis(core::ToEpochMs(now) - away_since));
    auto grace = grace_.find(player_id);
    if (grace != grace_.end() && grace->second.is_active) {
        analytics_.recordGracePeriodRecovered();
    }
    grace_.erase(player_id);
    pending_decisions_.erase(
        std::remove(pending_decisions_.begin(), pending_decisions_.end(), player_id),
        pending_decisions_.end());
    if (vote_ && vote_->target() == player_id) {
        vote_.reset();
        Emit(events, GameEventType::VoteCancelled, {{"targetPlayerId", player_id}});
    }

    SDL_Log("Player %s reconnected to game %s", player_id.c_str(), session_.id().c_str());
    Emit(events, GameEventType::PlayerReconnected, {{"playerId", player_id}});
    evaluatePause(player_id, now, events);
    return {ReconnectStatus::Restored, {}};
}

core::ActionResult ReconnectionManager::castVote(const std::string& voter_id,
                                                 ContinuationDecision decision,
                                                 core::TimePoint now, EventQueue& events) {
    if (!vote_) {
        return core::ActionResult::Reject(core::RejectionKind::InvalidState, "No vote in progress");
    }
    switch (vote_->cast(voter_id, decision)) {
    case VoteStatus::NotEligible:
        return core::ActionResult::Reject(core::RejectionKind::InvalidPlayer,
                                          "You cannot vote on this decision");
    case VoteStatus::AlreadyVoted:
        return core::ActionResult::Reject(core::RejectionKind::InvalidState, "You already voted");
    case VoteStatus::Accepted:
        break;
    }

    core::Json counts = core::Json::object();
    for (const auto& entry : vote_->counts()) {
        counts[DecisionName(entry.first)] = entry.second;
    }
    Emit(events, GameEventType::VoteProgress,
         {{"targetPlayerId", vote_->target()},
          {"votes", vote_->votes().size()},
          {"needed", vote_->voters().size()},
          {"counts", counts}});

    if (vote_->complete()) {
        resolveVote(now, events);
        tick(now, events);
    }
    return core::ActionResult::Ok(DecisionName(decision));
}

void ReconnectionManager::tick(core::TimePoint now, EventQueue& events) {
    if (session_.completed()) {
        return;
    }
    const auto now_ms = core::ToEpochMs(now);
    for (auto& entry : grace_) {
        auto& grace = entry.second;
        if (grace.is_active && now_ms >= grace.start_ms + grace.duration_ms) {
            grace.is_active = false;
            pending_decisions_.push_back(entry.first);
            analytics_.recordGracePeriodExpired();
            SDL_Log("Grace period for %s in game %s expired", entry.first.c_str(),
                    session_.id().c_str());
            Emit(events, GameEventType::GracePeriodEnded, {{"playerId", entry.first}});
        }
    }

    if (vote_ && (vote_->complete() || vote_->timedOut(now))) {
        resolveVote(now, events);
    }
    while (!vote_ && !pending_decisions_.empty() && !session_.completed()) {
        const std::string target = pending_decisions_.front();
        pending_decisions_.pop_front();
        openVote(target, now, events);
    }
}

void ReconnectionManager::onTurnChanged(core::TimePoint now, EventQueue& events) {
    if (session_.started() && !session_.completed()) {
        evaluatePause({}, now, events);
    }
}

bool ReconnectionManager::forceDecision(const std::string& player_id, core::TimePoint now,
                                        EventQueue& events) {
    if (grace_.count(player_id) == 0) {
        return false;
    }
    if (vote_ && vote_->target() == player_id) {
        vote_.reset();
    }
    const bool others = !connectedHumans(player_id).empty();
    applyDecision(player_id, others ? ContinuationDecision::SkipTurn : ContinuationDecision::EndGame,
                  now, events);
    return true;
}

std::vector<std::string> ReconnectionManager::staleGracePeriods() const {
    std::vector<std::string> stale;
    for (const auto& entry : grace_) {
        const core::Player* player = session_.findPlayer(entry.first);
        if (player == nullptr || player->is_bot || player->abandoned ||
            connections_.isConnected(entry.first)) {
            stale.push_back(entry.first);
        }
    }
    return stale;
}

bool ReconnectionManager::dropGracePeriod(const std::string& player_id, core::TimePoint now,
                                          EventQueue& events) {
    if (grace_.erase(player_id) == 0) {
        return false;
    }
    pending_decisions_.erase(
        std::remove(pending_decisions_.begin(), pending_decisions_.end(), player_id),
        pending_decisions_.end());
    if (vote_ && vote_->target() == player_id) {
        vote_.reset();
        Emit(events, GameEventType::VoteCancelled, {{"targetPlayerId", player_id}});
    }
    SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Dropped grace period for %s in game %s",
                player_id.c_str(), session_.id().c_str());
    Emit(events, GameEventType::GracePeriodEnded, {{"playerId", player_id}});
    evaluatePause({}, now, events);
    return true;
}

core::ActionResult ReconnectionManager::pauseManually(const std::string& player_id,
                                                      core::TimePoint now, EventQueue& events) {
    const core::Player* player = session_.findPlayer(player_id);
    if (player == nullptr || player->is_bot) {
        return core::ActionResult::Reject(core::RejectionKind::InvalidPlayer,
                                          "Player is not in this game");
    }
    if (session_.phase() != core::GamePhase::InProgress || pause_.is_paused) {
        return core::ActionResult::Reject(core::RejectionKind::InvalidState,
                                          "Game cannot be paused now");
    }
    enterPause(PauseReason::ManualPause, player_id, now, events);
    return core::ActionResult::Ok();
}

core::ActionResult ReconnectionManager::resumeManually(const std::string& player_id,
                                                       core::TimePoint now, EventQueue& events) {
    if (!pause_.is_paused || pause_.reason != PauseReason::ManualPause) {
        return core::ActionResult::Reject(core::RejectionKind::InvalidState,
                                          "Game is not paused manually");
    }
    if (session_.findPlayer(player_id) == nullptr) {
        return core::ActionResult::Reject(core::RejectionKind::InvalidPlayer,
                                          "Player is not in this game");
    }
    leavePause(now, events);
    evaluatePause(player_id, now, events);
    return core::ActionResult::Ok();
}

void ReconnectionManager::openVote(const std::string& target, core::TimePoint now,
                                   EventQueue& events) {
    auto voters = connectedHumans(target);
    if (voters.empty()) {
        // Nobody to ask; skip while someone may still come back.
        bool others = false;
        for (const auto& player : session_.players()) {
            if (!player.is_bot && !player.abandoned && player.id != target) {
                others = true;
            }
        }
        applyDecision(target, others ? ContinuationDecision::SkipTurn : ContinuationDecision::EndGame,
                      now, events);
        return;
    }

    vote_.emplace(target, voters, now + settings_.vote_timeout);
    Emit(events, GameEventType::VoteOpened,
         {{"targetPlayerId", target},
          {"options", {"skip_turn", "add_bot", "end_game"}},
          {"voters", voters},
          {"timeoutMs", settings_.vote_timeout.count()}});
}

void ReconnectionManager::resolveVote(core::TimePoint now, EventQueue& events) {
    const ContinuationDecision decision = vote_->tally();
    const std::string target = vote_->target();
    vote_.reset();
    applyDecision(target, decision, now, events);
}

void ReconnectionManager::applyDecision(const std::string& target, ContinuationDecision decision,
                                        core::TimePoint now, EventQueue& events) {
    decided_.insert(target);
    grace_.erase(target);
    pending_decisions_.erase(
        std::remove(pending_decisions_.begin(), pending_decisions_.end(), target),
        pending_decisions_.end());

    const core::Player* current = session_.currentPlayer();
    const bool was_current = current != nullptr && current->id == target;
    std::string substitute;

    switch (decision) {
    case ContinuationDecision::AddBot: {
        auto bot_id = session_.replaceWithBot(target);
        connections_.transition(target, ConnectionState::Abandoned, now);
        if (bot_id) {
            substitute = *bot_id;
            if (was_current) {
                timer_.handleGracePeriodExpiration(decision, substitute, now);
            }
            break;
        }
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "No bot could replace %s, skipping instead",
                    target.c_str());
        decision = ContinuationDecision::SkipTurn;
        session_.markAbandoned(target);
        if (was_current && !session_.completed()) {
            timer_.handleGracePeriodExpiration(decision, session_.currentPlayer()->id, now);
        }
        break;
    }
    case ContinuationDecision::SkipTurn:
        connections_.transition(target, ConnectionState::Abandoned, now);
        session_.markAbandoned(target);
        if (was_current && !session_.completed()) {
            timer_.handleGracePeriodExpiration(decision, session_.currentPlayer()->id, now);
        }
        break;
    case ContinuationDecision::EndGame:
        connections_.transition(target, ConnectionState::Abandoned, now);
        session_.endWithoutWinner();
        timer_.handleGracePeriodExpiration(decision, {}, now);
        break;
    }

    if (!session_.completed() && !humansRemain()) {
        session_.endWithoutWinner();
    }
    analytics_.recordDecision(decision);
    if (pause_.is_paused && !session_.completed()) {
        holdTimer(now);
    }

    SDL_Log("Game %s continues without %s: %s", session_.id().c_str(), target.c_str(),
            DecisionName(decision));
    core::Json payload{{"targetPlayerId", target}, {"decision", DecisionName(decision)}};
    if (!substitute.empty()) {
        payload["botPlayerId"] = substitute;
    }
    Emit(events, GameEventType::ContinuationDecided, payload);

    if (session_.completed()) {
        timer_.clear();
        pause_ = PauseState{};
        vote_.reset();
        pending_decisions_.clear();
        grace_.clear();
        Emit(events, GameEventType::StateChanged);
        return;
    }
    Emit(events, GameEventType::StateChanged);
    evaluatePause(target, now, events);
}

void ReconnectionManager::evaluatePause(const std::string& trigger, core::TimePoint now,
                                        EventQueue& events) {
    if (session_.completed()) {
        pause_ = PauseState{};
        return;
    }
    if (pause_.is_paused && pause_.reason == PauseReason::ManualPause) {
        return;
    }
    if (grace_.empty()) {
        if (pause_.is_paused) {
            leavePause(now, events);
        }
        return;
    }

    const core::Player* current = session_.currentPlayer();
    const bool current_away = current != nullptr && grace_.count(current->id) > 0;
    PauseReason reason = PauseReason::CurrentPlayerDisconnect;
    if (connectedHumans().empty()) {
        reason = PauseReason::AllPlayersDisconnect;
    } else if (grace_.size() >= 2) {
        reason = PauseReason::MultipleDisconnects;
    } else if (!current_away) {
        if (pause_.is_paused) {
            leavePause(now, events);
        }
        return;
    }
    enterPause(reason, trigger.empty() && current != nullptr ? current->id : trigger, now, events);
}

void ReconnectionManager::enterPause(PauseReason reason, const std::string& by, core::TimePoint now,
                                     EventQueue& events) {
    if (!pause_.is_paused) {
        pause_.is_paused = true;
        pause_.reason = reason;
        pause_.paused_at_ms = core::ToEpochMs(now);
        pause_.paused_by = by;
        session_.pause();
        analytics_.recordPause(PauseReasonName(reason));
        SDL_Log("Game %s paused: %s", session_.id().c_str(), PauseReasonName(reason));
        Emit(events, GameEventType::Paused, pauseJson());
    } else if (pause_.reason != reason) {
        pause_.reason = reason;
        SDL_Log("Game %s pause escalated: %s", session_.id().c_str(), PauseReasonName(reason));
        Emit(events, GameEventType::Paused, pauseJson());
    }

    if (timer_.active() && !timer_.paused()) {
        auto grace = grace_.find(by);
        const core::Millis duration = grace != grace_.end()
                                          ? core::Millis(grace->second.duration_ms)
                                          : settings_.grace.standard;
        timer_.pauseForGracePeriod(duration, now);
    }
}

void ReconnectionManager::holdTimer(core::TimePoint now) {
    if (timer_.active() && !timer_.paused()) {
        timer_.pauseForGracePeriod(settings_.grace.standard, now);
    }
}

void ReconnectionManager::leavePause(core::TimePoint now, EventQueue& events) {
    if (pause_.paused_at_ms) {
        analytics_.recordResume(core::Millis(core::ToEpochMs(now) - *pause_.paused_at_ms));
    }
    pause_ = PauseState{};
    session_.resume();
    timer_.resume(now);
    SDL_Log("Game %s resumed", session_.id().c_str());
    Emit(events, GameEventType::Resumed, {{"remainingMs", timer_.remaining(now).count()}});
}

core::Json ReconnectionManager::pauseJson() const {
    core::Json json;
    json["isPaused"] = pause_.is_paused;
    json["reason"] = PauseReasonName(pause_.reason);
    json["pausedAt"] = pause_.paused_at_ms ? core::Json(*pause_.paused_at_ms) : core::Json(nullptr);
    json["pausedBy"] = pause_.paused_by;
    return json;
}

}  // namespace rummi::session
