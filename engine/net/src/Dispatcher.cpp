#include "rummi/net/Dispatcher.hpp"

#include <SDL2/SDL.h>

#include <stdexcept>

namespace rummi::net {

namespace {

bool Mutated(const core::ActionResult& result, const session::EventQueue& events) {
    return result.ok || !events.empty();
}

std::vector<std::vector<std::string>> ReadSets(const core::Json& body) {
    if (!body["sets"].is_array()) {
        throw std::invalid_argument("sets must be an array of tile lists");
    }
    std::vector<std::vector<std::string>> sets;
    for (const auto& entry : body["sets"]) {
        core::Json wrapper = {{"tileIds", entry}};
        sets.push_back(ReadTileIds(wrapper, "tileIds"));
    }
    return sets;
}

}  // namespace

Dispatcher::Dispatcher(session::GameRegistry& registry,
                       persistence::GameStatePersistence* persistence,
                       core::Millis heartbeat_timeout)
    : registry_(registry), persistence_(persistence), heartbeat_timeout_(heartbeat_timeout) {}

std::optional<std::string> Dispatcher::playerOf(const std::string& client_key) const {
    auto it = client_players_.find(client_key);
    if (it == client_players_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> Dispatcher::clientOf(const std::string& player_id) const {
    auto it = player_clients_.find(player_id);
    if (it == player_clients_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Dispatcher::bind(const std::string& client_key, const std::string& player_id) {
    auto previous_client = player_clients_.find(player_id);
    if (previous_client != player_clients_.end() && previous_client->second != client_key) {
        client_players_.erase(previous_client->second);
    }
    auto previous_player = client_players_.find(client_key);
    if (previous_player != client_players_.end() && previous_player->second != player_id) {
        player_clients_.erase(previous_player->second);
    }
    client_players_[client_key] = player_id;
    player_clients_[player_id] = client_key;
}

void Dispatcher::unbind(const std::string& client_key) {
    auto it = client_players_.find(client_key);
    if (it == client_players_.end()) {
        return;
    }
    auto player = player_clients_.find(it->second);
    if (player != player_clients_.end() && player->second == client_key) {
        player_clients_.erase(player);
    }
    client_players_.erase(it);
}

void Dispatcher::sendTo(const std::string& player_id, core::Json body, Outbox& out) const {
    if (auto client = clientOf(player_id)) {
        out.push_back(OutboundMessage{*client, std::move(body)});
    }
}

void Dispatcher::deliver(const Room& room, const session::EventQueue& events, core::TimePoint now,
                         Outbox& out) const {
    if (events.empty()) {
        return;
    }
    const auto participants = room->participantIds();
    bool state_sent = false;
    for (const auto& event : events) {
        if (event.type == session::GameEventType::StateChanged) {
            // One snapshot per batch is enough; it reflects every change before it.
            if (state_sent) {
                continue;
            }
            state_sent = true;
            for (const auto& player_id : participants) {
                if (clientOf(player_id)) {
                    sendTo(player_id, {{"type", "gameState"}, {"state", room->viewFor(player_id, now)}},
                           out);
                }
            }
            continue;
        }
        core::Json body = event.payload.is_object() ? event.payload : core::Json::object();
        body["type"] = session::EventTypeName(event.type);
        body["gameId"] = room->id();
        if (!event.recipient.empty()) {
            sendTo(event.recipient, body, out);
            continue;
        }
        for (const auto& player_id : participants) {
            sendTo(player_id, body, out);
        }
    }
}

void Dispatcher::persist(const Room& room, core::TimePoint now) {
    if (persistence_ == nullptr) {
        return;
    }
    if (room->finished()) {
        persistence_->removeGameState(room->id());
        return;
    }
    persistence_->saveGameState(room->id(), room->snapshot(), now);
}

void Dispatcher::recoverForClient(session::FailureKind kind, const session::FailureContext& context,
                                  const std::string& client_key, core::TimePoint now, Outbox& out) {
    bool redirected = false;
    auto outcome = recovery_.handle(
        kind, context, now, [&](session::RecoveryAction action, const session::FailureContext& failure) {
            switch (action) {
            case session::RecoveryAction::RedirectToLobby:
            case session::RecoveryAction::CreateNewGame:
                out.push_back(OutboundMessage{client_key, RedirectMessage(failure.message)});
                redirected = true;
                return true;
            case session::RecoveryAction::ClearGameData:
                if (persistence_ != nullptr && !failure.game_id.empty()) {
                    persistence_->removeGameState(failure.game_id);
                }
                return true;
            default:
                return false;
            }
        });
    if (!outcome.success) {
        out.push_back(OutboundMessage{
            client_key, ErrorMessage(outcome.critical ? "critical" : "recovery_failed",
                                     outcome.user_message)});
        if (!redirected) {
            out.push_back(OutboundMessage{client_key, RedirectMessage(outcome.user_message)});
        }
    }
}

Dispatcher::Room Dispatcher::findOrRestore(const std::string& game_id, const std::string& client_key,
                                           const std::string& player_id, core::TimePoint now,
                                           Outbox& out) {
    if (auto room = registry_.find(game_id)) {
        return room;
    }
    if (persistence_ != nullptr) {
        auto loaded = persistence_->loadGameState(game_id);
        if (loaded.ok()) {
            return registry_.adopt(std::move(*loaded.state));
        }
        if (loaded.status == persistence::LoadStatus::Corrupted) {
            recoverForClient(session::FailureKind::StateRestorationFailed,
                             {game_id, player_id, loaded.error}, client_key, now, out);
            return nullptr;
        }
    }
    recoverForClient(session::FailureKind::GameNotFound, {game_id, player_id, "Game not found"},
                     client_key, now, out);
    return nullptr;
}

Outbox Dispatcher::handle(const std::string& client_key, const std::string& text,
                          core::TimePoint now) {
    last_seen_[client_key] = now;
    std::string error;
    auto message = ParseInbound(text, error);
    if (!message) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Dropping message from %s: %s",
                    client_key.c_str(), error.c_str());
        return {OutboundMessage{client_key, ErrorMessage("invalid_format", error)}};
    }
    return handleMessage(client_key, *message, now);
}

Outbox Dispatcher::handleMessage(const std::string& client_key, const InboundMessage& message,
                                 core::TimePoint now) {
    SDL_LogVerbose(SDL_LOG_CATEGORY_APPLICATION, "%s -> %s", client_key.c_str(),
                   message.type.c_str());
    try {
        if (message.type == "createGame") {
            return createGame(client_key, message.body, now);
        }
        if (message.type == "joinGame") {
            return joinGame(client_key, message.body, now);
        }
        if (message.type == "reconnect") {
            return reconnect(client_key, message.body, now);
        }

        auto player_id = playerOf(client_key);
        if (!player_id) {
            if (message.type == "heartbeat") {
                return {};
            }
            return {OutboundMessage{client_key, ErrorMessage(core::RejectionKind::InvalidPlayer,
                                                             "Join or reconnect first")}};
        }
        auto room = registry_.roomOf(*player_id);
        if (!room) {
            Outbox out;
            unbind(client_key);
            recoverForClient(session::FailureKind::GameNotFound,
                             {registry_.gameOf(*player_id).value_or(""), *player_id, "Game not found"},
                             client_key, now, out);
            return out;
        }
        if (message.type == "leave") {
            return leave(client_key, *player_id, room, now);
        }
        return roomAction(client_key, message, *player_id, room, now);
    } catch (const std::exception& e) {
        return {OutboundMessage{client_key, ErrorMessage("malformed_message", e.what())}};
    }
}

Outbox Dispatcher::createGame(const std::string& client_key, const core::Json& body,
                              core::TimePoint now) {
    const std::string player_id = ReadString(body, "playerId");
    const std::string name = ReadString(body, "name");
    if (auto existing = registry_.roomOf(player_id); existing && !existing->finished()) {
        return {OutboundMessage{client_key, ErrorMessage(core::RejectionKind::InvalidState,
                                                         "Already seated in game " + existing->id())}};
    }

    auto room = registry_.create(ReadGameOptions(body, registry_.defaults().options));
    session::EventQueue events;
    auto result = room->join(player_id, name, now, events);
    if (!result) {
        registry_.remove(room->id());
        return {OutboundMessage{client_key, ErrorMessage(result.kind, result.reason)}};
    }
    bind(client_key, player_id);
    registry_.bindPlayer(player_id, room->id());
    Outbox out;
    deliver(room, events, now, out);
    persist(room, now);
    return out;
}

Outbox Dispatcher::joinGame(const std::string& client_key, const core::Json& body,
                            core::TimePoint now) {
    const std::string game_id = ReadString(body, "gameId");
    const std::string player_id = ReadString(body, "playerId");
    const std::string name = ReadString(body, "name");
    Outbox out;
    auto room = findOrRestore(game_id, client_key, player_id, now, out);
    if (!room) {
        return out;
    }
    session::EventQueue events;
    auto result = room->join(player_id, name, now, events);
    if (!result) {
        out.push_back(OutboundMessage{client_key, ErrorMessage(result.kind, result.reason)});
        return out;
    }
    bind(client_key, player_id);
    registry_.bindPlayer(player_id, room->id());
    deliver(room, events, now, out);
    persist(room, now);
    return out;
}

Outbox Dispatcher::reconnect(const std::string& client_key, const core::Json& body,
                             core::TimePoint now) {
    const std::string game_id = ReadString(body, "gameId");
    const std::string player_id = ReadString(body, "playerId");
    Outbox out;
    auto room = findOrRestore(game_id, client_key, player_id, now, out);
    if (!room) {
        return out;
    }

    session::EventQueue events;
    auto result = room->reconnect(player_id, now, events);
    switch (result.status) {
    case session::ReconnectStatus::Restored:
    case session::ReconnectStatus::AlreadyConnected:
        bind(client_key, player_id);
        registry_.bindPlayer(player_id, room->id());
        deliver(room, events, now, out);
        persist(room, now);
        break;
    case session::ReconnectStatus::NotInGame:
        out.push_back(OutboundMessage{client_key, ErrorMessage("not_in_game", result.reason)});
        recoverForClient(session::FailureKind::PlayerNotInGame, {game_id, player_id, result.reason},
                         client_key, now, out);
        break;
    case session::ReconnectStatus::GameMovedOn:
        SDL_Log("Rejected late reconnect of %s to game %s", player_id.c_str(), game_id.c_str());
        out.push_back(OutboundMessage{client_key, ErrorMessage("game_moved_on", result.reason)});
        out.push_back(OutboundMessage{client_key, RedirectMessage(result.reason)});
        break;
    case session::ReconnectStatus::TooManyAttempts: {
        auto error = ErrorMessage("too_many_attempts", result.reason);
        error["retryAfterMs"] = result.retry_after.count();
        out.push_back(OutboundMessage{client_key, std::move(error)});
        break;
    }
    }
    return out;
}

Outbox Dispatcher::leave(const std::string& client_key, const std::string& player_id,
                         const Room& room, core::TimePoint now) {
    session::EventQueue events;
    auto result = room->leave(player_id, now, events);
    Outbox out;
    if (!result) {
        out.push_back(OutboundMessage{client_key, ErrorMessage(result.kind, result.reason)});
        return out;
    }
    deliver(room, events, now, out);
    unbind(client_key);
    registry_.unbindPlayer(player_id);
    persist(room, now);
    return out;
}

Outbox Dispatcher::roomAction(const std::string& client_key, const InboundMessage& message,
                              const std::string& player_id, const Room& room, core::TimePoint now) {
    const auto& body = message.body;
    const auto& type = message.type;
    session::EventQueue events;
    core::ActionResult result;

    if (type == "addBot") {
        result = room->addBot(now, events);
    } else if (type == "startGame") {
        result = room->start(player_id, now, events);
    } else if (type == "playSet") {
        if (body.contains("sets")) {
            result = room->playMultipleSets(player_id, ReadSets(body), now, events);
        } else {
            result = room->playSet(player_id, ReadTileIds(body, "tileIds"), ReadTarget(body), now,
                                   events);
        }
    } else if (type == "stageTiles") {
        result = room->stageTiles(player_id, ReadTileIds(body, "tileIds"), ReadTarget(body), now,
                                  events);
    } else if (type == "returnTile") {
        result = room->returnTile(player_id, ReadString(body, "tileId"), now, events);
    } else if (type == "revertTurn") {
        result = room->revertTurn(player_id, now, events);
    } else if (type == "drawTile") {
        result = room->drawTile(player_id, now, events);
    } else if (type == "endTurn") {
        result = room->endTurn(player_id, now, events);
    } else if (type == "continuationVote") {
        auto decision = session::ParseDecision(ReadString(body, "decision"));
        if (!decision) {
            return {OutboundMessage{client_key, ErrorMessage("malformed_message",
                                                             "Unknown continuation decision")}};
        }
        result = room->vote(player_id, *decision, now, events);
    } else if (type == "pause") {
        result = room->pause(player_id, now, events);
    } else if (type == "resume") {
        result = room->resume(player_id, now, events);
    } else if (type == "chat") {
        result = room->chat(player_id, ReadString(body, "text"), now, events);
    } else if (type == "heartbeat") {
        result.ok = room->heartbeat(player_id, ReadMetrics(body), now, events);
        Outbox out;
        deliver(room, events, now, out);
        if (!events.empty()) {
            persist(room, now);
        }
        return out;
    } else {
        return {OutboundMessage{client_key, ErrorMessage("unknown_message",
                                                         "Unknown message type " + type)}};
    }

    Outbox out;
    if (!result) {
        out.push_back(OutboundMessage{client_key, ErrorMessage(result.kind, result.reason)});
    }
    deliver(room, events, now, out);
    if (Mutated(result, events)) {
        persist(room, now);
    }
    return out;
}

Outbox Dispatcher::onTransportClosed(const std::string& client_key, core::TimePoint now) {
    last_seen_.erase(client_key);
    auto player_id = playerOf(client_key);
    unbind(client_key);
    if (!player_id) {
        return {};
    }
    Outbox out;
    auto room = registry_.roomOf(*player_id);
    if (!room) {
        return out;
    }
    SDL_Log("Transport of %s closed", player_id->c_str());
    session::EventQueue events;
    room->disconnect(*player_id, now, events);
    if (!room->hasPlayer(*player_id)) {
        registry_.unbindPlayer(*player_id);
    }
    deliver(room, events, now, out);
    persist(room, now);
    return out;
}

Outbox Dispatcher::onSendFailed(const std::string& client_key, core::TimePoint now) {
    auto player_id = playerOf(client_key);
    if (!player_id) {
        return {};
    }
    auto room = registry_.roomOf(*player_id);
    if (!room) {
        return {};
    }
    session::EventQueue events;
    const auto outcome =
        room->recover(session::FailureKind::NetworkError,
                      {room->id(), *player_id, "send to " + client_key + " failed"}, now, events);
    Outbox out;
    deliver(room, events, now, out);
    if (!outcome.success || outcome.final_fallback) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Giving up on transport %s of %s",
                    client_key.c_str(), player_id->c_str());
        auto closed = onTransportClosed(client_key, now);
        out.insert(out.end(), closed.begin(), closed.end());
    }
    return out;
}

Outbox Dispatcher::tick(core::TimePoint now) {
    Outbox out;
    std::vector<std::string> silent;
    for (const auto& [client_key, seen] : last_seen_) {
        if (now - seen > heartbeat_timeout_) {
            silent.push_back(client_key);
        }
    }
    for (const auto& client_key : silent) {
        SDL_Log("Client %s timed out", client_key.c_str());
        auto closed = onTransportClosed(client_key, now);
        out.insert(out.end(), closed.begin(), closed.end());
    }

    for (const auto& room : registry_.rooms()) {
        session::EventQueue events;
        room->tick(now, events);
        deliver(room, events, now, out);
        if (!events.empty()) {
            persist(room, now);
        }
        if (room->finished()) {
            for (const auto& player_id : room->participantIds()) {
                registry_.unbindPlayer(player_id);
            }
            registry_.remove(room->id());
            if (persistence_ != nullptr) {
                persistence_->removeGameState(room->id());
            }
        }
    }
    return out;
}

std::size_t Dispatcher::restoreSavedGames(core::TimePoint now) {
    if (persistence_ == nullptr) {
        return 0;
    }
    std::size_t restored = 0;
    for (const auto& game_id : persistence_->storedGameIds()) {
        if (registry_.find(game_id)) {
            continue;
        }
        auto loaded = persistence_->loadGameState(game_id);
        if (!loaded.ok()) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Skipping stored game %s: %s", game_id.c_str(),
                        persistence::LoadStatusName(loaded.status));
            continue;
        }
        auto room = registry_.adopt(std::move(*loaded.state));
        // Nobody holds a transport after a restart; everyone gets a grace period.
        session::EventQueue events;
        for (const auto& player_id : room->participantIds()) {
            room->disconnect(player_id, now, events);
        }
        persist(room, now);
        ++restored;
    }
    if (restored > 0) {
        SDL_Log("Restored %zu stored games", restored);
    }
    return restored;
}

}  // namespace rummi::net
