#include "rummi/session/GameRoom.hpp"

#include <SDL2/SDL.h>

#include <algorithm>

#include "rummi/core/Bot.hpp"

namespace rummi::session {

const char* EventTypeName(GameEventType type) noexcept {
    switch (type) {
    case GameEventType::StateChanged:
        return "gameState";
    case GameEventType::TurnTimedOut:
        return "turnTimedOut";
    case GameEventType::Paused:
        return "paused";
    case GameEventType::Resumed:
        return "resumed";
    case GameEventType::GracePeriodStarted:
        return "gracePeriod";
    case GameEventType::GracePeriodEnded:
        return "gracePeriodEnded";
    case GameEventType::VoteOpened:
        return "continuationVote";
    case GameEventType::VoteProgress:
        return "voteProgress";
    case GameEventType::VoteCancelled:
        return "voteCancelled";
    case GameEventType::ContinuationDecided:
        return "continuationDecision";
    case GameEventType::PlayerReconnected:
        return "playerReconnected";
    case GameEventType::GameOver:
        return "gameOver";
    case GameEventType::Chat:
        return "chat";
    case GameEventType::Redirect:
        return "redirect";
    }
    return "gameState";
}

RoomSettings RoomSettingsFrom(const core::ServerConfig& config) {
    RoomSettings settings;
    settings.options.debug_hand = config.debug_hand;
    settings.options.timer_enabled = config.timer_enabled;
    settings.options.turn_duration_ms = config.turn_duration_ms;
    settings.reconnection.grace.standard = core::Millis(config.grace_period_ms);
    settings.reconnection.grace.mobile = core::Millis(config.grace_period_mobile_ms);
    settings.reconnection.grace.unstable = core::Millis(config.grace_period_unstable_ms);
    settings.reconnection.vote_timeout = core::Millis(config.vote_timeout_ms);
    settings.bot_move_delay = core::Millis(config.bot_move_delay_ms);
    return settings;
}

GameRoom::GameRoom(std::string game_id, RoomSettings settings, std::uint32_t seed)
    : id_(std::move(game_id)),
      settings_(std::move(settings)),
      session_(id_, settings_.options, seed),
      timer_(core::Millis(settings_.options.turn_duration_ms)),
      reconnection_(session_, timer_, connections_, recovery_, settings_.reconnection) {}

GameRoom::GameRoom(RoomSnapshot snapshot, RoomSettings settings)
    : id_(snapshot.session.id),
      settings_(std::move(settings)),
      session_(std::move(snapshot.session)),
      timer_(core::Millis(session_.options().turn_duration_ms)),
      reconnection_(session_, timer_, connections_, recovery_, settings_.reconnection) {
    settings_.options = session_.options();
    timer_.restoreState(std::move(snapshot.timer));
    connections_.restore(snapshot.connections);
    reconnection_.restore(snapshot.pause, snapshot.grace_periods);
    game_over_sent_ = session_.completed();
}

template <typename Fn>
core::ActionResult GameRoom::mutate(core::TimePoint now, EventQueue& events, Fn&& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    const int previous_turn = session_.turnNumber();
    const bool was_started = session_.started();
    core::ActionResult result = fn();
    if (result.ok || result.kind == core::RejectionKind::DeckEmpty) {
        afterChange(previous_turn, was_started, now, events);
    }
    return result;
}

void GameRoom::startTurnTimer(core::TimePoint now) {
    const core::Player* current = session_.currentPlayer();
    if (current == nullptr) {
        return;
    }
    if (session_.options().timer_enabled) {
        timer_.startDefault(current->id, now);
        if (session_.phase() == core::GamePhase::Paused) {
            timer_.pauseForGracePeriod(settings_.reconnection.grace.standard, now);
        }
    }
    bot_ready_at_.reset();
    if (current->is_bot) {
        bot_ready_at_ = now + settings_.bot_move_delay;
    }
}

void GameRoom::afterChange(int previous_turn, bool was_started, core::TimePoint now,
                           EventQueue& events) {
    if (session_.completed()) {
        timer_.clear();
        bot_ready_at_.reset();
        Emit(events, GameEventType::StateChanged);
        if (!game_over_sent_) {
            game_over_sent_ = true;
            core::Json scores = core::Json::object();
            for (const auto& player : session_.players()) {
                scores[player.id] = player.score;
            }
            const auto& winner = session_.winner();
            SDL_Log("Game %s over, winner %s", id_.c_str(), winner ? winner->c_str() : "none");
            SDL_Log("Game %s connection summary: %s", id_.c_str(),
                    reconnection_.analytics().summary().dump().c_str());
            Emit(events, GameEventType::GameOver,
                 {{"winner", winner ? core::Json(*winner) : core::Json(nullptr)}, {"scores", scores}});
        }
        return;
    }
    if (session_.started() && (!was_started || session_.turnNumber() != previous_turn)) {
        startTurnTimer(now);
        reconnection_.onTurnChanged(now, events);
    }
    Emit(events, GameEventType::StateChanged);
}

core::ActionResult GameRoom::join(const std::string& player_id, const std::string& name,
                                  core::TimePoint now, EventQueue& events) {
    return mutate(now, events, [&] {
        auto result = session_.addPlayer(player_id, name);
        if (result) {
            connections_.track(player_id, now);
            SDL_Log("Player %s joined game %s", player_id.c_str(), id_.c_str());
        }
        return result;
    });
}

core::ActionResult GameRoom::addBot(core::TimePoint now, EventQueue& events) {
    return mutate(now, events, [&] { return session_.addBotPlayer(); });
}

core::ActionResult GameRoom::start(const std::string& player_id, core::TimePoint now,
                                   EventQueue& events) {
    return mutate(now, events, [&] {
        if (session_.findPlayer(player_id) == nullptr) {
            return core::ActionResult::Reject(core::RejectionKind::InvalidPlayer,
                                              "Player is not in this game");
        }
        auto result = session_.startGame();
        if (result) {
            SDL_Log("Game %s started with %zu players", id_.c_str(), session_.players().size());
        }
        return result;
    });
}

core::ActionResult GameRoom::playSet(const std::string& player_id,
                                     const std::vector<std::string>& tile_ids,
                                     core::SetTarget target, core::TimePoint now,
                                     EventQueue& events) {
    return mutate(now, events, [&] { return session_.playSet(player_id, tile_ids, target); });
}

core::ActionResult GameRoom::playMultipleSets(const std::string& player_id,
                                              const std::vector<std::vector<std::string>>& sets,
                                              core::TimePoint now, EventQueue& events) {
    return mutate(now, events, [&] { return session_.playMultipleSets(player_id, sets); });
}

core::ActionResult GameRoom::stageTiles(const std::string& player_id,
                                        const std::vector<std::string>& tile_ids,
                                        core::SetTarget target, core::TimePoint now,
                                        EventQueue& events) {
    return mutate(now, events, [&] { return session_.stageTiles(player_id, tile_ids, target); });
}

core::ActionResult GameRoom::returnTile(const std::string& player_id, const std::string& tile_id,
                                        core::TimePoint now, EventQueue& events) {
    return mutate(now, events, [&] { return session_.returnToHand(player_id, tile_id); });
}

core::ActionResult GameRoom::revertTurn(const std::string& player_id, core::TimePoint now,
                                        EventQueue& events) {
    return mutate(now, events, [&] { return session_.revertTurn(player_id); });
}

core::ActionResult GameRoom::drawTile(const std::string& player_id, core::TimePoint now,
                                      EventQueue& events) {
    return mutate(now, events, [&] { return session_.drawTile(player_id); });
}

core::ActionResult GameRoom::endTurn(const std::string& player_id, core::TimePoint now,
                                     EventQueue& events) {
    return mutate(now, events, [&] { return session_.endTurn(player_id); });
}

core::ActionResult GameRoom::vote(const std::string& player_id, ContinuationDecision decision,
                                  core::TimePoint now, EventQueue& events) {
    return mutate(now, events,
                  [&] { return reconnection_.castVote(player_id, decision, now, events); });
}

core::ActionResult GameRoom::pause(const std::string& player_id, core::TimePoint now,
                                   EventQueue& events) {
    return mutate(now, events, [&] { return reconnection_.pauseManually(player_id, now, events); });
}

core::ActionResult GameRoom::resume(const std::string& player_id, core::TimePoint now,
                                    EventQueue& events) {
    return mutate(now, events, [&] { return reconnection_.resumeManually(player_id, now, events); });
}

core::ActionResult GameRoom::chat(const std::string& player_id, const std::string& text,
                                  core::TimePoint now, EventQueue& events) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto sent_at = core::ToEpochMs(now);
    auto result = session_.addChat(player_id, text, sent_at);
    if (result) {
        const auto& message = session_.chat().back();
        Emit(events, GameEventType::Chat,
             {{"playerId", message.player_id},
              {"playerName", message.player_name},
              {"text", message.text},
              {"sentAt", message.sent_at_ms}});
    }
    return result;
}

core::ActionResult GameRoom::leave(const std::string& player_id, core::TimePoint now,
                                   EventQueue& events) {
    return mutate(now, events, [&] {
        if (!session_.started()) {
            auto result = session_.removePlayer(player_id);
            if (result) {
                connections_.forget(player_id);
            }
            return result;
        }
        if (!session_.markAbandoned(player_id)) {
            return core::ActionResult::Reject(core::RejectionKind::InvalidPlayer,
                                              "Player is not active in this game");
        }
        connections_.transition(player_id, ConnectionState::Abandoned, now);
        const auto& players = session_.players();
        const bool humans = std::any_of(players.begin(), players.end(), [](const core::Player& p) {
            return !p.is_bot && !p.abandoned;
        });
        if (!humans) {
            session_.endWithoutWinner();
        }
        SDL_Log("Player %s left game %s", player_id.c_str(), id_.c_str());
        return core::ActionResult::Ok();
    });
}

ReconnectResult GameRoom::reconnect(const std::string& player_id, core::TimePoint now,
                                    EventQueue& events) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = reconnection_.handleReconnect(player_id, now, events);
    if (result.ok()) {
        Emit(events, GameEventType::StateChanged);
    }
    return result;
}

void GameRoom::disconnect(const std::string& player_id, core::TimePoint now, EventQueue& events) {
    std::lock_guard<std::mutex> lock(mutex_);
    reconnection_.handleDisconnect(player_id, now, events);
}

bool GameRoom::heartbeat(const std::string& player_id, const ConnectionMetrics& metrics,
                         core::TimePoint now, EventQueue& events) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connections_.updateMetrics(player_id, metrics, now)) {
        return false;
    }
    const ConnectionStatus* status = connections_.find(player_id);
    if (metrics.is_mobile && status->quality == ConnectionQuality::Poor) {
        auto outcome = recoverLocked(FailureKind::MobileSpecific,
                                     FailureContext{id_, player_id, "poor mobile link"}, now, events);
        return outcome.success;
    }
    return true;
}

void GameRoom::tick(core::TimePoint now, EventQueue& events) {
    std::lock_guard<std::mutex> lock(mutex_);
    const int previous_turn = session_.turnNumber();
    const bool was_started = session_.started();
    const bool was_completed = session_.completed();

    reconnection_.tick(now, events);

    if (session_.phase() == core::GamePhase::InProgress && timer_.expired(now)) {
        const std::string timed_out = timer_.playerId();
        auto result = session_.handleTurnTimeout();
        if (result) {
            SDL_Log("Turn of %s in game %s timed out", timed_out.c_str(), id_.c_str());
            Emit(events, GameEventType::TurnTimedOut, {{"playerId", timed_out}});
        }
    }

    if (session_.phase() == core::GamePhase::InProgress) {
        const core::Player* current = session_.currentPlayer();
        if (current != nullptr && current->is_bot) {
            if (!bot_ready_at_) {
                bot_ready_at_ = now + settings_.bot_move_delay;
            } else if (now >= *bot_ready_at_) {
                bot_ready_at_.reset();
                const auto difficulty = core::bot::ParseDifficulty(session_.options().bot_difficulty);
                auto result = core::bot::PlayBotTurn(session_, difficulty);
                if (!result && result.kind != core::RejectionKind::DeckEmpty) {
                    SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Bot move failed in %s: %s",
                                id_.c_str(), result.reason.c_str());
                }
            }
        }
    }

    if (session_.turnNumber() != previous_turn || was_completed != session_.completed()) {
        afterChange(previous_turn, was_started, now, events);
    }
    checkConsistency(now, events);
}

void GameRoom::checkConsistency(core::TimePoint now, EventQueue& events) {
    if (!session_.started() || session_.completed()) {
        return;
    }
    for (const auto& player_id : reconnection_.staleGracePeriods()) {
        recoverLocked(FailureKind::GracePeriodError,
                      FailureContext{id_, player_id, "grace period without a missing player"}, now,
                      events);
    }
    if (session_.completed()) {
        return;
    }
    if (!tilesConsistent()) {
        recoverLocked(FailureKind::InvalidGameState,
                      FailureContext{id_, {}, "tile count " + std::to_string(session_.totalTileCount())},
                      now, events);
        return;
    }
    const core::Player* current = session_.currentPlayer();
    if (session_.phase() == core::GamePhase::InProgress && session_.options().timer_enabled &&
        timer_.active() && current != nullptr && timer_.playerId() != current->id) {
        recoverLocked(FailureKind::TimerSyncError,
                      FailureContext{id_, current->id, "timer runs for " + timer_.playerId()}, now,
                      events);
    }
}

bool GameRoom::tilesConsistent() const {
    return !session_.started() || session_.totalTileCount() == core::kFullDeckSize;
}

RecoveryOutcome GameRoom::recover(FailureKind kind, const FailureContext& context,
                                  core::TimePoint now, EventQueue& events) {
    std::lock_guard<std::mutex> lock(mutex_);
    return recoverLocked(kind, context, now, events);
}

RecoveryOutcome GameRoom::recoverLocked(FailureKind kind, const FailureContext& context,
                                        core::TimePoint now, EventQueue& events) {
    const int previous_turn = session_.turnNumber();
    const bool was_started = session_.started();
    auto outcome = recovery_.handle(kind, context, now,
                                    [&](RecoveryAction action, const FailureContext& failure) {
                                        return execute(action, failure, now, events);
                                    });
    if (session_.turnNumber() != previous_turn || session_.completed()) {
        afterChange(previous_turn, was_started, now, events);
    }
    return outcome;
}

bool GameRoom::execute(RecoveryAction action, const FailureContext& context, core::TimePoint now,
                       EventQueue& events) {
    switch (action) {
    case RecoveryAction::RedirectToLobby:
        Emit(events, GameEventType::Redirect, {{"to", "lobby"}, {"gameId", id_}}, context.player_id);
        return true;
    case RecoveryAction::CreateNewGame:
        // The game cannot be trusted any more; everyone starts over.
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Abandoning game %s: %s", id_.c_str(),
                     context.message.c_str());
        Emit(events, GameEventType::Redirect, {{"to", "new_game"}, {"gameId", id_}},
             context.player_id);
        session_.endWithoutWinner();
        return true;
    case RecoveryAction::ValidateState:
        return tilesConsistent();
    case RecoveryAction::RepairState:
        if (const auto restored = session_.restoreMissingTiles(); restored > 0) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Returned %zu lost tiles to the deck of %s",
                        restored, id_.c_str());
        }
        return tilesConsistent();
    case RecoveryAction::ResetState:
        if (!session_.resetTurn()) {
            return false;
        }
        startTurnTimer(now);
        Emit(events, GameEventType::StateChanged);
        return tilesConsistent();
    case RecoveryAction::SyncWithServer:
        Emit(events, GameEventType::StateChanged);
        return true;
    case RecoveryAction::ResetTimer:
    case RecoveryAction::UseDefaultTimer:
        if (session_.currentPlayer() == nullptr || !session_.options().timer_enabled) {
            return false;
        }
        startTurnTimer(now);
        return true;
    case RecoveryAction::RetryConnection:
        return connections_.isConnected(context.player_id);
    case RecoveryAction::SkipGracePeriod:
        return reconnection_.dropGracePeriod(context.player_id, now, events);
    case RecoveryAction::DefaultContinuation:
        return reconnection_.forceDecision(context.player_id, now, events);
    case RecoveryAction::EndGame:
        session_.endWithoutWinner();
        return true;
    case RecoveryAction::ExtendTimeouts: {
        const ConnectionStatus* status = connections_.find(context.player_id);
        return status != nullptr &&
               GraceDurationFor(*status, settings_.reconnection.grace) >
                   settings_.reconnection.grace.standard;
    }
    default:
        // Lobby, storage and transport remedies belong to the net and persistence layers.
        return false;
    }
}

bool GameRoom::hasPlayer(const std::string& player_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.findPlayer(player_id) != nullptr;
}

bool GameRoom::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.completed();
}

std::vector<std::string> GameRoom::participantIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& player : session_.players()) {
        if (!player.is_bot) {
            ids.push_back(player.id);
        }
    }
    return ids;
}

RoomSnapshot GameRoom::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    RoomSnapshot snapshot;
    snapshot.session = session_.state();
    snapshot.timer = timer_.state();
    snapshot.pause = reconnection_.pauseState();
    snapshot.grace_periods = reconnection_.gracePeriods();
    snapshot.connections = connections_.statuses();
    return snapshot;
}

core::Json GameRoom::viewFor(const std::string& player_id, core::TimePoint now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    core::Json view;
    view["gameId"] = id_;
    view["phase"] = core::PhaseName(session_.phase());
    view["started"] = session_.started();
    view["turnNumber"] = session_.turnNumber();
    view["deckCount"] = session_.deck().size();

    core::Json board = core::Json::array();
    for (const auto& set : session_.board()) {
        board.push_back(core::TileSetToJson(set));
    }
    view["board"] = board;

    core::Json players = core::Json::array();
    for (const auto& player : session_.players()) {
        const ConnectionStatus* status = connections_.find(player.id);
        players.push_back({{"id", player.id},
                           {"name", player.name},
                           {"handCount", player.hand.size()},
                           {"score", player.score},
                           {"isBot", player.is_bot},
                           {"hasPlayedInitial", player.has_played_initial},
                           {"abandoned", player.abandoned},
                           {"connection", status != nullptr ? ConnectionStateName(status->state)
                                                            : "CONNECTED"}});
    }
    view["players"] = players;

    const core::Player* current = session_.currentPlayer();
    view["currentPlayerId"] = current != nullptr ? core::Json(current->id) : core::Json(nullptr);
    view["currentPlayerIndex"] = session_.currentPlayerIndex();
    const core::Player* self = session_.findPlayer(player_id);
    view["hand"] = self != nullptr ? core::TileSetToJson(self->hand) : core::Json::array();
    view["canDraw"] = session_.canDraw(player_id);
    view["hasUncommittedChanges"] = session_.hasUncommittedChanges();
    view["winner"] = session_.winner() ? core::Json(*session_.winner()) : core::Json(nullptr);

    view["timer"] = {{"active", timer_.active()},
                     {"remainingMs", timer_.remaining(now).count()},
                     {"durationMs", timer_.state().original_duration_ms},
                     {"paused", timer_.paused()}};

    const auto& pause = reconnection_.pauseState();
    view["pause"] = {{"isPaused", pause.is_paused},
                     {"reason", PauseReasonName(pause.reason)},
                     {"pausedBy", pause.paused_by}};

    core::Json grace = core::Json::array();
    const auto now_ms = core::ToEpochMs(now);
    for (const auto& period : reconnection_.gracePeriods()) {
        const auto left = std::max<std::int64_t>(0, period.start_ms + period.duration_ms - now_ms);
        grace.push_back({{"playerId", period.target_player_id},
                         {"active", period.is_active},
                         {"remainingMs", period.is_active ? left : 0}});
    }
    view["gracePeriods"] = grace;

    if (const auto& vote = reconnection_.vote()) {
        const auto left = std::chrono::duration_cast<core::Millis>(vote->deadline() - now).count();
        view["vote"] = {{"targetPlayerId", vote->target()},
                        {"votes", vote->votes().size()},
                        {"needed", vote->voters().size()},
                        {"remainingMs", std::max<std::int64_t>(0, left)}};
    } else {
        view["vote"] = nullptr;
    }

    core::Json log = core::Json::array();
    for (const auto& entry : session_.log()) {
        log.push_back({{"turn", entry.turn}, {"playerId", entry.player_id}, {"text", entry.text}});
    }
    view["log"] = log;
    return view;
}

}  // namespace rummi::session
