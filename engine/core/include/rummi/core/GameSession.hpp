#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "rummi/core/ActionResult.hpp"
#include "rummi/core/Deck.hpp"
#include "rummi/core/Types.hpp"

namespace rummi::core {

enum class GamePhase { WaitingForPlayers, InProgress, Paused, Completed };

const char* PhaseName(GamePhase phase) noexcept;
std::optional<GamePhase> ParsePhase(const std::string& name) noexcept;

inline constexpr std::size_t kMinPlayers = 2;
inline constexpr std::size_t kMaxPlayers = 4;
inline constexpr std::size_t kGameLogCapacity = 50;
inline constexpr std::size_t kChatCapacity = 100;
inline constexpr std::size_t kChatMaxLength = 500;

const std::vector<std::string>& BotNamePool();

struct Player {
    std::string id;
    std::string name;
    TileSet hand;
    bool has_played_initial = false;
    int score = 0;
    bool is_bot = false;
    bool abandoned = false;
    int consecutive_draws = 0;

    bool operator==(const Player& other) const {
        return id == other.id && name == other.name && hand == other.hand &&
               has_played_initial == other.has_played_initial && score == other.score &&
               is_bot == other.is_bot && abandoned == other.abandoned &&
               consecutive_draws == other.consecutive_draws;
    }
};

struct GameOptions {
    bool debug_hand = false;
    bool timer_enabled = true;
    std::int64_t turn_duration_ms = 120000;
    std::string bot_difficulty = "medium";

    bool operator==(const GameOptions& other) const {
        return debug_hand == other.debug_hand && timer_enabled == other.timer_enabled &&
               turn_duration_ms == other.turn_duration_ms &&
               bot_difficulty == other.bot_difficulty;
    }
};

// Committed board and the acting player's hand at the start of the turn, or
// after their last committed play.
struct TurnSnapshot {
    BoardSets board;
    TileSet hand;
    bool committed_play = false;

    bool operator==(const TurnSnapshot& other) const {
        return board == other.board && hand == other.hand &&
               committed_play == other.committed_play;
    }
};

struct GameLogEntry {
    int turn = 0;
    std::string player_id;
    std::string text;

    bool operator==(const GameLogEntry& other) const {
        return turn == other.turn && player_id == other.player_id && text == other.text;
    }
};

struct ChatMessage {
    std::string player_id;
    std::string player_name;
    std::string text;
    std::int64_t sent_at_ms = 0;

    bool operator==(const ChatMessage& other) const {
        return player_id == other.player_id && player_name == other.player_name &&
               text == other.text && sent_at_ms == other.sent_at_ms;
    }
};

struct SessionState {
    std::string id;
    GameOptions options;
    GamePhase phase = GamePhase::WaitingForPlayers;
    std::vector<Player> players;
    std::size_t current_player_index = 0;
    Deck deck;
    BoardSets board;
    TurnSnapshot turn;
    std::optional<std::string> winner;
    std::int64_t created_at_ms = 0;
    int turn_number = 0;
    std::deque<GameLogEntry> log;
    std::deque<ChatMessage> chat;
};

using SetTarget = std::optional<std::size_t>;
inline const SetTarget kNewSet = std::nullopt;

class GameSession {
public:
    GameSession(std::string id, GameOptions options, std::uint32_t seed = std::random_device{}());
    explicit GameSession(SessionState state);

    const std::string& id() const noexcept { return state_.id; }
    GamePhase phase() const noexcept { return state_.phase; }
    bool started() const noexcept { return state_.phase != GamePhase::WaitingForPlayers; }
    bool completed() const noexcept { return state_.phase == GamePhase::Completed; }
    const GameOptions& options() const noexcept { return state_.options; }
    const std::vector<Player>& players() const noexcept { return state_.players; }
    std::size_t currentPlayerIndex() const noexcept { return state_.current_player_index; }
    const Player* currentPlayer() const noexcept;
    const Player* findPlayer(const std::string& player_id) const noexcept;
    std::optional<std::size_t> playerIndex(const std::string& player_id) const noexcept;
    const Deck& deck() const noexcept { return state_.deck; }
    const BoardSets& board() const noexcept { return state_.board; }
    const TurnSnapshot& turnSnapshot() const noexcept { return state_.turn; }
    const std::optional<std::string>& winner() const noexcept { return state_.winner; }
    int turnNumber() const noexcept { return state_.turn_number; }
    const std::deque<GameLogEntry>& log() const noexcept { return state_.log; }
    const std::deque<ChatMessage>& chat() const noexcept { return state_.chat; }
    const SessionState& state() const noexcept { return state_; }

    std::size_t activePlayerCount() const noexcept;
    std::size_t totalTileCount() const noexcept;
    bool hasUncommittedChanges() const noexcept { return state_.board != state_.turn.board; }

    ActionResult addPlayer(const std::string& player_id, const std::string& name);
    ActionResult addBotPlayer();
    ActionResult removePlayer(const std::string& player_id);
    ActionResult startGame();

    ActionResult playSet(const std::string& player_id, const std::vector<std::string>& tile_ids,
                         SetTarget target);
    ActionResult playMultipleSets(const std::string& player_id,
                                  const std::vector<std::vector<std::string>>& sets);
    ActionResult stageTiles(const std::string& player_id, const std::vector<std::string>& tile_ids,
                            SetTarget target);
    ActionResult returnToHand(const std::string& player_id, const std::string& tile_id);
    ActionResult revertTurn(const std::string& player_id);
    bool canDraw(const std::string& player_id) const;
    ActionResult drawTile(const std::string& player_id);
    ActionResult endTurn(const std::string& player_id);
    ActionResult handleTurnTimeout();

    // Puts the acting player's staged tiles back regardless of the phase.
    bool resetTurn();
    // Returns tiles missing from deck, hands and board to the deck.
    std::size_t restoreMissingTiles();

    bool markAbandoned(const std::string& player_id);
    std::optional<std::string> replaceWithBot(const std::string& player_id);
    void endWithoutWinner();
    bool pause() noexcept;
    bool resume() noexcept;

    ActionResult addChat(const std::string& player_id, const std::string& text,
                         std::int64_t sent_at_ms);

private:
    struct PlannedSet {
        std::vector<std::string> tile_ids;
        SetTarget target;
    };

    Player* mutablePlayer(const std::string& player_id) noexcept;
    ActionResult checkActing(const std::string& player_id) const;
    ActionResult commitPlay(const std::string& player_id, const std::vector<PlannedSet>& plan);
    void restoreTurnSnapshot();
    void beginTurn();
    void advanceTurn();
    void finishWithWinner(const std::string& player_id);
    void checkRemainingPlayers();
    std::string nextBotId();
    std::optional<std::string> nextBotName() const;
    void appendLog(const std::string& player_id, std::string text);

    SessionState state_;
};

}  // namespace rummi::core
