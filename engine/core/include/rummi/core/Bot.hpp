#pragma once

#include <optional>
#include <random>
#include <string>
#include <vector>

#include "rummi/core/GameSession.hpp"

namespace rummi::core::bot {

enum class Difficulty { Easy, Medium, Hard };

Difficulty ParseDifficulty(const std::string& name) noexcept;

// Draws in a row after which every difficulty plays as much as it can.
inline constexpr int kAggressiveAfterDraws = 3;

struct Extension {
    std::string tile_id;
    std::size_t target = 0;
};

struct BotPlan {
    std::vector<TileSet> new_sets;
    std::vector<Extension> extensions;

    bool draws() const noexcept { return new_sets.empty() && extensions.empty(); }
};

// Candidate sets formed only from hand tiles, best value first. Sets may share tiles.
std::vector<TileSet> FindPossibleSets(const TileSet& hand);

std::vector<Extension> FindExtensions(const TileSet& hand, const BoardSets& board);

BotPlan ChooseBotPlay(const GameSession& session, const std::string& bot_id, Difficulty difficulty);

// Plays the current bot's turn to completion.
ActionResult PlayBotTurn(GameSession& session, Difficulty difficulty);

}  // namespace rummi::core::bot
