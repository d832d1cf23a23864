#include "rummi/persistence/GameStateCodec.hpp"

#include <set>
#include <sstream>
#include <stdexcept>

#include "rummi/core/Deck.hpp"

namespace rummi::persistence {

namespace {

using core::Json;

Json OptionalMs(const std::optional<std::int64_t>& value) {
    return value ? Json(*value) : Json(nullptr);
}

std::optional<std::int64_t> ReadOptionalMs(const Json& json, const char* key) {
    if (!json.contains(key) || json[key].is_null()) {
        return std::nullopt;
    }
    return json[key].get<std::int64_t>();
}

Json PlayerToJson(const core::Player& player) {
    Json json;
    json["id"] = player.id;
    json["name"] = player.name;
    json["hand"] = core::TileSetToJson(player.hand);
    json["has_played_initial"] = player.has_played_initial;
    json["score"] = player.score;
    json["is_bot"] = player.is_bot;
    json["abandoned"] = player.abandoned;
    json["consecutive_draws"] = player.consecutive_draws;
    return json;
}

core::Player PlayerFromJson(const Json& json) {
    core::Player player;
    player.id = json.at("id").get<std::string>();
    player.name = json.at("name").get<std::string>();
    player.hand = core::TileSetFromJson(json.at("hand"));
    player.has_played_initial = json.at("has_played_initial").get<bool>();
    player.score = json.at("score").get<int>();
    player.is_bot = json.at("is_bot").get<bool>();
    player.abandoned = json.at("abandoned").get<bool>();
    player.consecutive_draws = json.value("consecutive_draws", 0);
    return player;
}

Json BoardToJson(const core::BoardSets& board) {
    Json json = Json::array();
    for (const auto& set : board) {
        json.push_back(core::TileSetToJson(set));
    }
    return json;
}

core::BoardSets BoardFromJson(const Json& json) {
    if (!json.is_array()) {
        throw std::invalid_argument("board must be an array of sets");
    }
    core::BoardSets board;
    for (const auto& set : json) {
        board.push_back(core::TileSetFromJson(set));
    }
    return board;
}

Json OptionsToJson(const core::GameOptions& options) {
    Json json;
    json["debug_hand"] = options.debug_hand;
    json["timer_enabled"] = options.timer_enabled;
    json["turn_duration_ms"] = options.turn_duration_ms;
    json["bot_difficulty"] = options.bot_difficulty;
    return json;
}

core::GameOptions OptionsFromJson(const Json& json) {
    core::GameOptions options;
    options.debug_hand = json.value("debug_hand", options.debug_hand);
    options.timer_enabled = json.value("timer_enabled", options.timer_enabled);
    options.turn_duration_ms = json.value("turn_duration_ms", options.turn_duration_ms);
    options.bot_difficulty = json.value("bot_difficulty", options.bot_difficulty);
    return options;
}

Json TimerToJson(const session::TurnTimerState& timer) {
    Json json;
    json["player_id"] = timer.player_id;
    json["remaining_ms"] = timer.remaining_ms;
    json["original_duration_ms"] = timer.original_duration_ms;
    json["running_since_ms"] = timer.running_since_ms;
    json["paused_at_ms"] = OptionalMs(timer.paused_at_ms);
    json["grace_duration_ms"] = timer.grace_duration_ms;
    json["preserved"] = timer.preserved;
    json["active"] = timer.active;
    json["generation"] = timer.generation;
    return json;
}

session::TurnTimerState TimerFromJson(const Json& json) {
    session::TurnTimerState timer;
    timer.player_id = json.at("player_id").get<std::string>();
    timer.remaining_ms = json.at("remaining_ms").get<std::int64_t>();
    timer.original_duration_ms = json.at("original_duration_ms").get<std::int64_t>();
    timer.running_since_ms = json.at("running_since_ms").get<std::int64_t>();
    timer.paused_at_ms = ReadOptionalMs(json, "paused_at_ms");
    timer.grace_duration_ms = json.at("grace_duration_ms").get<std::int64_t>();
    timer.preserved = json.at("preserved").get<bool>();
    timer.active = json.at("active").get<bool>();
    timer.generation = json.at("generation").get<std::uint64_t>();
    return timer;
}

Json ConnectionToJson(const session::ConnectionStatus& status) {
    Json json;
    json["player_id"] = status.player_id;
    json["state"] = session::ConnectionStateName(status.state);
    json["last_seen_ms"] = status.last_seen_ms;
    json["disconnected_at_ms"] = OptionalMs(status.disconnected_at_ms);
    json["reconnection_attempts"] = status.reconnection_attempts;
    json["disconnection_count"] = status.disconnection_count;
    json["latency_ms"] = status.metrics.latency_ms;
    json["packet_loss"] = status.metrics.packet_loss;
    json["is_mobile"] = status.metrics.is_mobile;
    json["network_type"] = status.metrics.network_type;
    json["quality"] = session::QualityName(status.quality);
    return json;
}

session::ConnectionStatus ConnectionFromJson(const Json& json) {
    session::ConnectionStatus status;
    status.player_id = json.at("player_id").get<std::string>();
    auto state = session::ParseConnectionState(json.at("state").get<std::string>());
    auto quality = session::ParseQuality(json.at("quality").get<std::string>());
    if (!state || !quality) {
        throw std::invalid_argument("unknown connection state or quality for " + status.player_id);
    }
    status.state = *state;
    status.quality = *quality;
    status.last_seen_ms = json.at("last_seen_ms").get<std::int64_t>();
    status.disconnected_at_ms = ReadOptionalMs(json, "disconnected_at_ms");
    status.reconnection_attempts = json.at("reconnection_attempts").get<int>();
    status.disconnection_count = json.at("disconnection_count").get<int>();
    status.metrics.latency_ms = json.at("latency_ms").get<int>();
    status.metrics.packet_loss = json.at("packet_loss").get<double>();
    status.metrics.is_mobile = json.at("is_mobile").get<bool>();
    status.metrics.network_type = json.at("network_type").get<std::string>();
    return status;
}

Json PauseToJson(const session::PauseState& pause) {
    Json json;
    json["is_paused"] = pause.is_paused;
    json["reason"] = session::PauseReasonName(pause.reason);
    json["paused_at_ms"] = OptionalMs(pause.paused_at_ms);
    json["paused_by"] = pause.paused_by;
    return json;
}

session::PauseState PauseFromJson(const Json& json) {
    session::PauseState pause;
    pause.is_paused = json.at("is_paused").get<bool>();
    auto reason = session::ParsePauseReason(json.at("reason").get<std::string>());
    if (!reason) {
        throw std::invalid_argument("unknown pause reason");
    }
    pause.reason = *reason;
    pause.paused_at_ms = ReadOptionalMs(json, "paused_at_ms");
    pause.paused_by = json.at("paused_by").get<std::string>();
    return pause;
}

Json GraceToJson(const session::GracePeriod& grace) {
    Json json;
    json["is_active"] = grace.is_active;
    json["start_ms"] = grace.start_ms;
    json["duration_ms"] = grace.duration_ms;
    json["target_player_id"] = grace.target_player_id;
    return json;
}

session::GracePeriod GraceFromJson(const Json& json) {
    session::GracePeriod grace;
    grace.is_active = json.at("is_active").get<bool>();
    grace.start_ms = json.at("start_ms").get<std::int64_t>();
    grace.duration_ms = json.at("duration_ms").get<std::int64_t>();
    grace.target_player_id = json.at("target_player_id").get<std::string>();
    return grace;
}

bool CollectTileIds(const core::TileSet& tiles, std::set<std::string>& seen, std::string& duplicate) {
    for (const auto& tile : tiles) {
        if (!seen.insert(tile.id()).second) {
            duplicate = tile.id();
            return false;
        }
    }
    return true;
}

}  // namespace

Json SessionToJson(const core::SessionState& state) {
    Json json;
    json["id"] = state.id;
    json["options"] = OptionsToJson(state.options);
    json["phase"] = core::PhaseName(state.phase);
    json["players"] = Json::array();
    for (const auto& player : state.players) {
        json["players"].push_back(PlayerToJson(player));
    }
    json["current_player_index"] = state.current_player_index;
    json["deck"] = core::TileSetToJson(state.deck.tiles());
    std::ostringstream rng;
    rng << state.deck.rng();
    json["deck_rng"] = rng.str();
    json["board"] = BoardToJson(state.board);
    json["turn"] = {{"board", BoardToJson(state.turn.board)},
                    {"hand", core::TileSetToJson(state.turn.hand)},
                    {"committed_play", state.turn.committed_play}};
    json["winner"] = state.winner ? Json(*state.winner) : Json(nullptr);
    json["created_at_ms"] = state.created_at_ms;
    json["turn_number"] = state.turn_number;
    json["log"] = Json::array();
    for (const auto& entry : state.log) {
        json["log"].push_back({{"turn", entry.turn}, {"player_id", entry.player_id}, {"text", entry.text}});
    }
    json["chat"] = Json::array();
    for (const auto& message : state.chat) {
        json["chat"].push_back({{"player_id", message.player_id},
                                {"player_name", message.player_name},
                                {"text", message.text},
                                {"sent_at_ms", message.sent_at_ms}});
    }
    return json;
}

core::SessionState SessionFromJson(const Json& json) {
    core::SessionState state;
    state.id = json.at("id").get<std::string>();
    state.options = OptionsFromJson(json.at("options"));
    auto phase = core::ParsePhase(json.at("phase").get<std::string>());
    if (!phase) {
        throw std::invalid_argument("unknown game phase");
    }
    state.phase = *phase;
    for (const auto& player : json.at("players")) {
        state.players.push_back(PlayerFromJson(player));
    }
    state.current_player_index = json.at("current_player_index").get<std::size_t>();
    state.deck.assign(core::TileSetFromJson(json.at("deck")));
    if (json.contains("deck_rng") && json["deck_rng"].is_string()) {
        std::istringstream rng(json["deck_rng"].get<std::string>());
        rng >> state.deck.rng();
        if (rng.fail()) {
            throw std::invalid_argument("deck random state is unreadable");
        }
    }
    state.board = BoardFromJson(json.at("board"));
    const auto& turn = json.at("turn");
    state.turn.board = BoardFromJson(turn.at("board"));
    state.turn.hand = core::TileSetFromJson(turn.at("hand"));
    state.turn.committed_play = turn.at("committed_play").get<bool>();
    if (json.contains("winner") && !json["winner"].is_null()) {
        state.winner = json["winner"].get<std::string>();
    }
    state.created_at_ms = json.at("created_at_ms").get<std::int64_t>();
    state.turn_number = json.at("turn_number").get<int>();
    for (const auto& entry : json.value("log", Json::array())) {
        state.log.push_back(core::GameLogEntry{entry.at("turn").get<int>(),
                                               entry.at("player_id").get<std::string>(),
                                               entry.at("text").get<std::string>()});
    }
    for (const auto& message : json.value("chat", Json::array())) {
        state.chat.push_back(core::ChatMessage{message.at("player_id").get<std::string>(),
                                               message.at("player_name").get<std::string>(),
                                               message.at("text").get<std::string>(),
                                               message.at("sent_at_ms").get<std::int64_t>()});
    }
    return state;
}

Json SnapshotToJson(const session::RoomSnapshot& snapshot) {
    Json json;
    json["session"] = SessionToJson(snapshot.session);
    json["timer"] = TimerToJson(snapshot.timer);
    json["pause"] = PauseToJson(snapshot.pause);
    json["grace_periods"] = Json::array();
    for (const auto& grace : snapshot.grace_periods) {
        json["grace_periods"].push_back(GraceToJson(grace));
    }
    json["connections"] = Json::array();
    for (const auto& status : snapshot.connections) {
        json["connections"].push_back(ConnectionToJson(status));
    }
    return json;
}

session::RoomSnapshot SnapshotFromJson(const Json& json) {
    session::RoomSnapshot snapshot;
    snapshot.session = SessionFromJson(json.at("session"));
    snapshot.timer = TimerFromJson(json.at("timer"));
    snapshot.pause = PauseFromJson(json.at("pause"));
    for (const auto& grace : json.at("grace_periods")) {
        snapshot.grace_periods.push_back(GraceFromJson(grace));
    }
    for (const auto& status : json.at("connections")) {
        snapshot.connections.push_back(ConnectionFromJson(status));
    }
    return snapshot;
}

std::optional<std::string> ValidateSnapshot(const session::RoomSnapshot& snapshot) {
    const auto& state = snapshot.session;
    if (state.id.empty()) {
        return std::string("game id is missing");
    }
    if (state.players.size() > core::kMaxPlayers) {
        return std::string("too many players");
    }

    std::set<std::string> player_ids;
    for (const auto& player : state.players) {
        if (player.id.empty() || player.name.empty()) {
            return std::string("player id or name is missing");
        }
        if (!player_ids.insert(player.id).second) {
            return "duplicate player " + player.id;
        }
    }
    if (state.winner && player_ids.count(*state.winner) == 0) {
        return "winner " + *state.winner + " is not a player";
    }
    if (state.phase != core::GamePhase::WaitingForPlayers &&
        state.current_player_index >= state.players.size()) {
        return std::string("current player index out of range");
    }

    std::set<std::string> tile_ids;
    std::string duplicate;
    bool unique = CollectTileIds(state.deck.tiles(), tile_ids, duplicate);
    for (const auto& player : state.players) {
        unique = unique && CollectTileIds(player.hand, tile_ids, duplicate);
    }
    for (const auto& set : state.board) {
        unique = unique && CollectTileIds(set, tile_ids, duplicate);
    }
    if (!unique) {
        return "tile " + duplicate + " appears more than once";
    }
    if (state.phase != core::GamePhase::WaitingForPlayers && tile_ids.size() != core::kFullDeckSize) {
        return "tile count is " + std::to_string(tile_ids.size()) + ", expected " +
               std::to_string(core::kFullDeckSize);
    }

    if (state.options.turn_duration_ms <= 0) {
        return std::string("turn duration must be positive");
    }
    const auto& timer = snapshot.timer;
    if (timer.remaining_ms < 0 || timer.original_duration_ms < 0 || timer.grace_duration_ms < 0 ||
        timer.running_since_ms < 0 || (timer.paused_at_ms && *timer.paused_at_ms < 0)) {
        return std::string("timer values must not be negative");
    }
    if (timer.active && player_ids.count(timer.player_id) == 0) {
        return "timer belongs to unknown player " + timer.player_id;
    }
    for (const auto& grace : snapshot.grace_periods) {
        if (grace.target_player_id.empty() || grace.duration_ms < 0 || grace.start_ms < 0) {
            return std::string("grace period is malformed");
        }
    }
    for (const auto& status : snapshot.connections) {
        if (status.player_id.empty() || status.reconnection_attempts < 0 ||
            status.disconnection_count < 0) {
            return std::string("connection status is malformed");
        }
    }
    return std::nullopt;
}

core::SavePayload EncodeRecord(const session::RoomSnapshot& snapshot, std::int64_t saved_at_ms,
                               int save_version) {
    core::SavePayload payload;
    payload.version = kGameStateVersion;
    payload.mode = kGameStateMode;
    payload.meta["game_id"] = snapshot.session.id;
    payload.meta["saved_at_ms"] = saved_at_ms;
    payload.meta["save_version"] = save_version;
    payload.data = SnapshotToJson(snapshot);
    payload.Seal();
    return payload;
}

DecodedRecord DecodeRecord(const core::SavePayload& payload) {
    DecodedRecord record;
    record.meta = payload.meta;
    if (payload.mode != kGameStateMode) {
        record.error = "unexpected record mode '" + payload.mode + "'";
        return record;
    }
    if (payload.version > kGameStateVersion) {
        record.error = "record version " + std::to_string(payload.version) + " is newer than supported";
        return record;
    }
    if (!payload.Verify()) {
        record.error = "checksum mismatch";
        return record;
    }
    try {
        auto snapshot = SnapshotFromJson(payload.data);
        if (auto problem = ValidateSnapshot(snapshot)) {
            record.error = *problem;
            return record;
        }
        record.snapshot = std::move(snapshot);
    } catch (const std::exception& e) {
        record.error = e.what();
    }
    return record;
}

}  // namespace rummi::persistence
