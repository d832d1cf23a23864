#include "rummi/core/GameSession.hpp"

#include <algorithm>
#include <chrono>
#include <initializer_list>
#include <set>

#include "rummi/core/SetValidator.hpp"

namespace rummi::core {

namespace {

std::int64_t WallClockMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

bool ContainsTile(const TileSet& tiles, const std::string& tile_id) {
    return std::any_of(tiles.begin(), tiles.end(),
                       [&](const Tile& tile) { return tile.id() == tile_id; });
}

std::optional<Tile> ExtractTile(TileSet& tiles, const std::string& tile_id) {
    auto it = std::find_if(tiles.begin(), tiles.end(),
                           [&](const Tile& tile) { return tile.id() == tile_id; });
    if (it == tiles.end()) {
        return std::nullopt;
    }
    Tile tile = *it;
    tiles.erase(it);
    return tile;
}

std::optional<Tile> ExtractFromBoard(BoardSets& board, const std::string& tile_id) {
    for (auto& set : board) {
        if (auto tile = ExtractTile(set, tile_id)) {
            return tile;
        }
    }
    return std::nullopt;
}

void PruneEmptySets(BoardSets& board) {
    board.erase(std::remove_if(board.begin(), board.end(),
                               [](const TileSet& set) { return set.empty(); }),
                board.end());
}

std::string DescribeSet(const TileSet& tiles) {
    std::string text;
    for (const auto& tile : tiles) {
        if (!text.empty()) {
            text += ", ";
        }
        text += tile.id();
    }
    return text;
}

}  // namespace

const char* PhaseName(GamePhase phase) noexcept {
    switch (phase) {
    case GamePhase::WaitingForPlayers:
        return "waiting_for_players";
    case GamePhase::InProgress:
        return "in_progress";
    case GamePhase::Paused:
        return "paused";
    case GamePhase::Completed:
        return "completed";
    }
    return "waiting_for_players";
}

std::optional<GamePhase> ParsePhase(const std::string& name) noexcept {
    for (GamePhase phase : {GamePhase::WaitingForPlayers, GamePhase::InProgress,
                            GamePhase::Paused, GamePhase::Completed}) {
        if (name == PhaseName(phase)) {
            return phase;
        }
    }
    return std::nullopt;
}

const std::vector<std::string>& BotNamePool() {
    static const std::vector<std::string> names{"Dogman-do", "Turdburg", "Babyman", "Bot_D"};
    return names;
}

GameSession::GameSession(std::string id, GameOptions options, std::uint32_t seed) {
    state_.id = std::move(id);
    state_.options = std::move(options);
    state_.deck = Deck(seed);
    state_.created_at_ms = WallClockMs();
}

GameSession::GameSession(SessionState state) : state_(std::move(state)) {}

const Player* GameSession::currentPlayer() const noexcept {
    if (!started() || state_.current_player_index >= state_.players.size()) {
        return nullptr;
    }
    return &state_.players[state_.current_player_index];
}

const Player* GameSession::findPlayer(const std::string& player_id) const noexcept {
    for (const auto& player : state_.players) {
        if (player.id == player_id) {
            return &player;
        }
    }
    return nullptr;
}

Player* GameSession::mutablePlayer(const std::string& player_id) noexcept {
    for (auto& player : state_.players) {
        if (player.id == player_id) {
            return &player;
        }
    }
    return nullptr;
}

std::optional<std::size_t> GameSession::playerIndex(const std::string& player_id) const noexcept {
    for (std::size_t i = 0; i < state_.players.size(); ++i) {
        if (state_.players[i].id == player_id) {
            return i;
        }
    }
    return std::nullopt;
}

std::size_t GameSession::activePlayerCount() const noexcept {
    return static_cast<std::size_t>(std::count_if(
        state_.players.begin(), state_.players.end(),
        [](const Player& player) { return !player.abandoned; }));
}

std::size_t GameSession::totalTileCount() const noexcept {
    std::size_t total = state_.deck.size() + CountTiles(state_.board);
    for (const auto& player : state_.players) {
        total += player.hand.size();
    }
    return total;
}

ActionResult GameSession::addPlayer(const std::string& player_id, const std::string& name) {
    if (state_.phase != GamePhase::WaitingForPlayers) {
        return ActionResult::Reject(RejectionKind::InvalidState, "Game has already started");
    }
    if (player_id.empty() || name.empty()) {
        return ActionResult::Reject(RejectionKind::InvalidPlayer, "Player id and name are required");
    }
    if (findPlayer(player_id) != nullptr) {
        return ActionResult::Reject(RejectionKind::InvalidPlayer, "Player is already in this game");
    }
    if (state_.players.size() >= kMaxPlayers) {
        return ActionResult::Reject(RejectionKind::SessionFull, "Game is full");
    }
    Player player;
    player.id = player_id;
    player.name = name;
    state_.players.push_back(std::move(player));
    appendLog(player_id, name + " joined");
    return ActionResult::Ok(player_id);
}

std::optional<std::string> GameSession::nextBotName() const {
    for (const auto& name : BotNamePool()) {
        auto used = std::any_of(state_.players.begin(), state_.players.end(),
                                [&](const Player& player) { return player.name == name; });
        if (!used) {
            return name;
        }
    }
    return std::nullopt;
}

std::string GameSession::nextBotId() {
    static const char kAlphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(kAlphabet) - 2);
    std::string id;
    do {
        id = "bot_";
        for (int i = 0; i < 8; ++i) {
            id += kAlphabet[pick(state_.deck.rng())];
        }
    } while (findPlayer(id) != nullptr);
    return id;
}

ActionResult GameSession::addBotPlayer() {
    if (state_.phase != GamePhase::WaitingForPlayers) {
        return ActionResult::Reject(RejectionKind::InvalidState, "Game has already started");
    }
    if (state_.players.size() >= kMaxPlayers) {
        return ActionResult::Reject(RejectionKind::SessionFull, "Game is full");
    }
    auto name = nextBotName();
    if (!name) {
        return ActionResult::Reject(RejectionKind::BotPoolExhausted, "No bot names left");
    }
    Player bot;
    bot.id = nextBotId();
    bot.name = *name;
    bot.is_bot = true;
    const std::string bot_id = bot.id;
    state_.players.push_back(std::move(bot));
    appendLog(bot_id, *name + " joined");
    return ActionResult::Ok(bot_id);
}

ActionResult GameSession::removePlayer(const std::string& player_id) {
    if (state_.phase != GamePhase::WaitingForPlayers) {
        return ActionResult::Reject(RejectionKind::InvalidState, "Game has already started");
    }
    auto index = playerIndex(player_id);
    if (!index) {
        return ActionResult::Reject(RejectionKind::InvalidPlayer, "Player is not in this game");
    }
    state_.players.erase(state_.players.begin() + static_cast<std::ptrdiff_t>(*index));
    return ActionResult::Ok(player_id);
}

ActionResult GameSession::startGame() {
    if (state_.phase != GamePhase::WaitingForPlayers) {
        return ActionResult::Reject(RejectionKind::InvalidState, "Game has already started");
    }
    if (state_.players.size() < kMinPlayers) {
        return ActionResult::Reject(RejectionKind::InvalidState, "At least two players are required");
    }

    state_.deck.reset();
    state_.board.clear();

    std::optional<std::string> debug_player;
    if (state_.options.debug_hand) {
        for (const auto& player : state_.players) {
            if (!player.is_bot) {
                debug_player = player.id;
                break;
            }
        }
    }

    for (auto& player : state_.players) {
        player.hand.clear();
        player.has_played_initial = false;
        player.consecutive_draws = 0;
        if (debug_player && player.id == *debug_player) {
            for (const auto& tile_id : DebugHandTileIds()) {
                if (auto tile = state_.deck.take(tile_id)) {
                    player.hand.push_back(*tile);
                }
            }
        }
    }
    for (auto& player : state_.players) {
        if (debug_player && player.id == *debug_player) {
            continue;
        }
        for (std::size_t i = 0; i < kInitialHandSize; ++i) {
            if (auto tile = state_.deck.draw()) {
                player.hand.push_back(*tile);
            }
        }
    }

    state_.phase = GamePhase::InProgress;
    state_.current_player_index = 0;
    state_.turn_number = 1;
    state_.winner.reset();
    beginTurn();
    appendLog({}, "Game started");
    return ActionResult::Ok();
}

ActionResult GameSession::checkActing(const std::string& player_id) const {
    switch (state_.phase) {
    case GamePhase::WaitingForPlayers:
        return ActionResult::Reject(RejectionKind::InvalidState, "Game has not started");
    case GamePhase::Paused:
        return ActionResult::Reject(RejectionKind::InvalidState, "Game is paused");
    case GamePhase::Completed:
        return ActionResult::Reject(RejectionKind::InvalidState, "Game is over");
    case GamePhase::InProgress:
        break;
    }
    if (findPlayer(player_id) == nullptr) {
        return ActionResult::Reject(RejectionKind::InvalidPlayer, "Player is not in this game");
    }
    if (state_.players[state_.current_player_index].id != player_id) {
        return ActionResult::Reject(RejectionKind::NotYourTurn, "It is not your turn");
    }
    return ActionResult::Ok();
}

ActionResult GameSession::playSet(const std::string& player_id,
                                  const std::vector<std::string>& tile_ids, SetTarget target) {
    return commitPlay(player_id, {PlannedSet{tile_ids, target}});
}

ActionResult GameSession::playMultipleSets(const std::string& player_id,
                                           const std::vector<std::vector<std::string>>& sets) {
    std::vector<PlannedSet> plan;
    plan.reserve(sets.size());
    for (const auto& ids : sets) {
        plan.push_back(PlannedSet{ids, kNewSet});
    }
    return commitPlay(player_id, plan);
}

ActionResult GameSession::commitPlay(const std::string& player_id,
                                     const std::vector<PlannedSet>& plan) {
    if (auto check = checkActing(player_id); !check) {
        return check;
    }
    if (plan.empty()) {
        return ActionResult::Reject(RejectionKind::MalformedTile, "No tiles given");
    }

    std::set<std::string> seen;
    for (const auto& planned : plan) {
        if (planned.tile_ids.empty()) {
            return ActionResult::Reject(RejectionKind::MalformedTile, "A set needs tiles");
        }
        if (planned.target && *planned.target >= state_.board.size()) {
            return ActionResult::Reject(RejectionKind::MalformedTile,
                                        "Board set " + std::to_string(*planned.target) +
                                            " does not exist");
        }
        for (const auto& tile_id : planned.tile_ids) {
            if (!seen.insert(tile_id).second) {
                return ActionResult::Reject(RejectionKind::MalformedTile,
                                            "Tile " + tile_id + " is listed twice");
            }
        }
    }

    Player* player = mutablePlayer(player_id);
    const bool initial = !player->has_played_initial;
    BoardSets board = state_.board;
    TileSet hand = player->hand;

    std::vector<TileSet> placed(plan.size());
    for (std::size_t i = 0; i < plan.size(); ++i) {
        if (initial && plan[i].target) {
            return ActionResult::Reject(RejectionKind::InvalidSet,
                                        "Initial play must form new sets");
        }
        for (const auto& tile_id : plan[i].tile_ids) {
            auto tile = ExtractTile(hand, tile_id);
            if (!tile) {
                tile = ExtractFromBoard(board, tile_id);
            }
            if (!tile) {
                return ActionResult::Reject(RejectionKind::MalformedTile,
                                            "Tile " + tile_id + " is not in your hand or on the board");
            }
            if (initial && !ContainsTile(state_.turn.hand, tile_id)) {
                return ActionResult::Reject(RejectionKind::InvalidSet,
                                            "Initial play must use only tiles from your hand");
            }
            placed[i].push_back(*tile);
        }
    }

    BoardSets new_sets;
    for (std::size_t i = 0; i < plan.size(); ++i) {
        if (plan[i].target) {
            auto& existing = board[*plan[i].target];
            existing.insert(existing.end(), placed[i].begin(), placed[i].end());
        } else {
            new_sets.push_back(placed[i]);
        }
    }
    PruneEmptySets(board);

    if (initial && board != state_.turn.board) {
        return ActionResult::Reject(RejectionKind::InvalidSet,
                                    "Initial play cannot rearrange existing sets");
    }
    board.insert(board.end(), new_sets.begin(), new_sets.end());

    for (std::size_t i = 0; i < board.size(); ++i) {
        if (!IsValidSet(board[i])) {
            return ActionResult::Reject(RejectionKind::InvalidSet,
                                        "Set " + std::to_string(i + 1) + " [" +
                                            DescribeSet(board[i]) + "] is not a valid group or run");
        }
    }

    int points = 0;
    for (const auto& set : new_sets) {
        points += SetValue(set);
    }
    if (initial && points < kInitialPlayThreshold) {
        return ActionResult::Reject(RejectionKind::InitialPlayTooLow,
                                    "Initial play must total at least " +
                                        std::to_string(kInitialPlayThreshold) + " points, got " +
                                        std::to_string(points));
    }

    state_.board = std::move(board);
    player->hand = std::move(hand);
    player->has_played_initial = true;
    player->consecutive_draws = 0;
    state_.turn.board = state_.board;
    state_.turn.hand = player->hand;
    state_.turn.committed_play = true;
    appendLog(player_id, player->name + " played " + std::to_string(seen.size()) + " tiles");

    if (player->hand.empty()) {
        finishWithWinner(player_id);
    }
    return ActionResult::Ok();
}

ActionResult GameSession::stageTiles(const std::string& player_id,
                                     const std::vector<std::string>& tile_ids, SetTarget target) {
    if (auto check = checkActing(player_id); !check) {
        return check;
    }
    if (tile_ids.empty()) {
        return ActionResult::Reject(RejectionKind::MalformedTile, "No tiles given");
    }
    if (target && *target >= state_.board.size()) {
        return ActionResult::Reject(RejectionKind::MalformedTile,
                                    "Board set " + std::to_string(*target) + " does not exist");
    }
    Player* player = mutablePlayer(player_id);
    TileSet hand = player->hand;
    TileSet moved;
    for (const auto& tile_id : tile_ids) {
        auto tile = ExtractTile(hand, tile_id);
        if (!tile) {
            return ActionResult::Reject(RejectionKind::MalformedTile,
                                        "Tile " + tile_id + " is not in your hand");
        }
        moved.push_back(*tile);
    }
    if (target) {
        auto& existing = state_.board[*target];
        existing.insert(existing.end(), moved.begin(), moved.end());
    } else {
        state_.board.push_back(std::move(moved));
    }
    player->hand = std::move(hand);
    return ActionResult::Ok();
}

ActionResult GameSession::returnToHand(const std::string& player_id, const std::string& tile_id) {
    if (auto check = checkActing(player_id); !check) {
        return check;
    }
    if (!ContainsTile(state_.turn.hand, tile_id)) {
        return ActionResult::Reject(RejectionKind::MalformedTile,
                                    "Only tiles placed this turn can be taken back");
    }
    auto tile = ExtractFromBoard(state_.board, tile_id);
    if (!tile) {
        return ActionResult::Reject(RejectionKind::MalformedTile,
                                    "Tile " + tile_id + " is not on the board");
    }
    PruneEmptySets(state_.board);
    mutablePlayer(player_id)->hand.push_back(*tile);
    return ActionResult::Ok();
}

ActionResult GameSession::revertTurn(const std::string& player_id) {
    if (auto check = checkActing(player_id); !check) {
        return check;
    }
    restoreTurnSnapshot();
    return ActionResult::Ok();
}

bool GameSession::canDraw(const std::string& player_id) const {
    return checkActing(player_id).ok && !state_.turn.committed_play && !hasUncommittedChanges();
}

ActionResult GameSession::drawTile(const std::string& player_id) {
    if (auto check = checkActing(player_id); !check) {
        return check;
    }
    if (state_.turn.committed_play) {
        return ActionResult::Reject(RejectionKind::DrawNotAllowed,
                                    "You already played this turn, end your turn instead");
    }
    restoreTurnSnapshot();

    Player* player = mutablePlayer(player_id);
    auto tile = state_.deck.draw();
    if (!tile) {
        appendLog(player_id, player->name + " passed, the deck is empty");
        advanceTurn();
        return ActionResult::Reject(RejectionKind::DeckEmpty, "The deck is empty, turn passed");
    }
    const std::string tile_id = tile->id();
    player->hand.push_back(*tile);
    ++player->consecutive_draws;
    appendLog(player_id, player->name + " drew a tile");
    advanceTurn();
    return ActionResult::Ok(tile_id);
}

ActionResult GameSession::endTurn(const std::string& player_id) {
    if (auto check = checkActing(player_id); !check) {
        return check;
    }
    if (hasUncommittedChanges()) {
        return ActionResult::Reject(RejectionKind::UncommittedChanges,
                                    "Play or take back the tiles you moved first");
    }
    advanceTurn();
    return ActionResult::Ok(state_.players[state_.current_player_index].id);
}

ActionResult GameSession::handleTurnTimeout() {
    if (state_.phase != GamePhase::InProgress) {
        return ActionResult::Reject(RejectionKind::InvalidState, "Game is not in progress");
    }
    restoreTurnSnapshot();
    Player& player = state_.players[state_.current_player_index];
    if (!state_.turn.committed_play) {
        if (auto tile = state_.deck.draw()) {
            player.hand.push_back(*tile);
        }
    }
    appendLog(player.id, player.name + " ran out of time");
    advanceTurn();
    return ActionResult::Ok(state_.players[state_.current_player_index].id);
}

bool GameSession::resetTurn() {
    if (!started() || completed() || state_.players.empty()) {
        return false;
    }
    restoreTurnSnapshot();
    return true;
}

std::size_t GameSession::restoreMissingTiles() {
    std::set<std::string> present;
    for (const auto& tile : state_.deck.tiles()) {
        present.insert(tile.id());
    }
    for (const auto& player : state_.players) {
        for (const auto& tile : player.hand) {
            present.insert(tile.id());
        }
    }
    for (const auto& set : state_.board) {
        for (const auto& tile : set) {
            present.insert(tile.id());
        }
    }

    std::vector<Tile> tiles = state_.deck.tiles();
    std::size_t restored = 0;
    for (const auto& tile : BuildFullDeck()) {
        if (present.count(tile.id()) == 0) {
            tiles.push_back(tile);
            ++restored;
        }
    }
    if (restored > 0) {
        state_.deck.assign(std::move(tiles));
        state_.deck.shuffle();
        appendLog({}, std::to_string(restored) + " missing tiles returned to the deck");
    }
    return restored;
}

bool GameSession::markAbandoned(const std::string& player_id) {
    auto index = playerIndex(player_id);
    if (!index || state_.players[*index].abandoned) {
        return false;
    }
    if (state_.phase == GamePhase::WaitingForPlayers) {
        return removePlayer(player_id).ok;
    }
    state_.players[*index].abandoned = true;
    appendLog(player_id, state_.players[*index].name + " left the game");
    if (!completed() && *index == state_.current_player_index) {
        restoreTurnSnapshot();
        advanceTurn();
    }
    checkRemainingPlayers();
    return true;
}

std::optional<std::string> GameSession::replaceWithBot(const std::string& player_id) {
    auto index = playerIndex(player_id);
    if (!index || completed()) {
        return std::nullopt;
    }
    Player& seat = state_.players[*index];
    if (seat.is_bot || seat.abandoned) {
        return std::nullopt;
    }
    if (*index == state_.current_player_index && started()) {
        restoreTurnSnapshot();
    }
    const std::string previous_name = seat.name;
    auto name = nextBotName();
    seat.id = nextBotId();
    seat.name = name ? *name : "Bot_" + previous_name;
    seat.is_bot = true;
    seat.consecutive_draws = 0;
    appendLog(seat.id, seat.name + " took over for " + previous_name);
    return seat.id;
}

void GameSession::endWithoutWinner() {
    if (completed()) {
        return;
    }
    state_.phase = GamePhase::Completed;
    state_.winner.reset();
    appendLog({}, "Game ended without a winner");
}

bool GameSession::pause() noexcept {
    if (state_.phase != GamePhase::InProgress) {
        return false;
    }
    state_.phase = GamePhase::Paused;
    return true;
}

bool GameSession::resume() noexcept {
    if (state_.phase != GamePhase::Paused) {
        return false;
    }
    state_.phase = GamePhase::InProgress;
    return true;
}

ActionResult GameSession::addChat(const std::string& player_id, const std::string& text,
                                  std::int64_t sent_at_ms) {
    const Player* player = findPlayer(player_id);
    if (player == nullptr) {
        return ActionResult::Reject(RejectionKind::InvalidPlayer, "Player is not in this game");
    }
    if (text.empty()) {
        return ActionResult::Reject(RejectionKind::InvalidState, "Message is empty");
    }
    ChatMessage message;
    message.player_id = player_id;
    message.player_name = player->name;
    message.text = text.substr(0, kChatMaxLength);
    message.sent_at_ms = sent_at_ms;
    state_.chat.push_back(std::move(message));
    while (state_.chat.size() > kChatCapacity) {
        state_.chat.pop_front();
    }
    return ActionResult::Ok();
}

void GameSession::restoreTurnSnapshot() {
    state_.board = state_.turn.board;
    state_.players[state_.current_player_index].hand = state_.turn.hand;
}

void GameSession::beginTurn() {
    state_.turn.board = state_.board;
    state_.turn.hand = state_.players[state_.current_player_index].hand;
    state_.turn.committed_play = false;
}

void GameSession::advanceTurn() {
    const std::size_t count = state_.players.size();
    for (std::size_t step = 1; step <= count; ++step) {
        const std::size_t candidate = (state_.current_player_index + step) % count;
        if (!state_.players[candidate].abandoned) {
            state_.current_player_index = candidate;
            break;
        }
    }
    ++state_.turn_number;
    beginTurn();
}

void GameSession::finishWithWinner(const std::string& player_id) {
    if (state_.winner) {
        return;
    }
    int collected = 0;
    for (auto& player : state_.players) {
        if (player.id == player_id) {
            continue;
        }
        int penalty = 0;
        for (const auto& tile : player.hand) {
            penalty += tile.penaltyValue();
        }
        player.score -= penalty;
        collected += penalty;
    }
    Player* winner = mutablePlayer(player_id);
    winner->score += collected;
    state_.winner = player_id;
    state_.phase = GamePhase::Completed;
    appendLog(player_id, winner->name + " won the game");
}

void GameSession::checkRemainingPlayers() {
    if (completed() || !started()) {
        return;
    }
    const std::size_t active = activePlayerCount();
    if (active >= kMinPlayers) {
        return;
    }
    if (active == 1) {
        for (const auto& player : state_.players) {
            if (!player.abandoned) {
                finishWithWinner(player.id);
                return;
            }
        }
    }
    endWithoutWinner();
}

void GameSession::appendLog(const std::string& player_id, std::string text) {
    state_.log.push_back(GameLogEntry{state_.turn_number, player_id, std::move(text)});
    while (state_.log.size() > kGameLogCapacity) {
        state_.log.pop_front();
    }
}

}  // namespace rummi::core
