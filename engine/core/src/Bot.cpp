#include "rummi/core/Bot.hpp"

#include <algorithm>
#include <map>
#include <set>

#include "rummi/core/SetValidator.hpp"

namespace rummi::core::bot {

namespace {

std::vector<std::string> TileIds(const TileSet& tiles) {
    std::vector<std::string> ids;
    ids.reserve(tiles.size());
    for (const auto& tile : tiles) {
        ids.push_back(tile.id());
    }
    return ids;
}

std::size_t SetBudget(Difficulty difficulty) {
    switch (difficulty) {
    case Difficulty::Easy:
        return 1;
    case Difficulty::Medium:
        return 2;
    case Difficulty::Hard:
        break;
    }
    return kFullDeckSize;
}

void AddGroups(const TileSet& hand, const TileSet& jokers, std::vector<TileSet>& out) {
    std::map<int, std::map<TileColor, Tile>> by_number;
    for (const auto& tile : hand) {
        if (!tile.isJoker()) {
            by_number[*tile.number()].emplace(*tile.color(), tile);
        }
    }
    for (const auto& [number, colors] : by_number) {
        TileSet group;
        for (const auto& entry : colors) {
            group.push_back(entry.second);
        }
        if (group.size() >= kMinSetSize) {
            out.push_back(group);
        } else if (group.size() == 2 && !jokers.empty()) {
            group.push_back(jokers.front());
            out.push_back(group);
        }
    }
}

void AddRuns(const TileSet& hand, const TileSet& jokers, std::vector<TileSet>& out) {
    std::map<TileColor, std::map<int, Tile>> by_color;
    for (const auto& tile : hand) {
        if (!tile.isJoker()) {
            by_color[*tile.color()].emplace(*tile.number(), tile);
        }
    }
    for (const auto& [color, numbers] : by_color) {
        TileSet run;
        int previous = 0;
        auto flush = [&]() {
            if (run.size() >= kMinSetSize) {
                out.push_back(run);
            } else if (run.size() == 2 && !jokers.empty()) {
                TileSet extended = run;
                extended.push_back(jokers.front());
                if (IsValidRun(extended)) {
                    out.push_back(extended);
                }
            }
            run.clear();
        };
        for (const auto& [number, tile] : numbers) {
            if (!run.empty() && number != previous + 1) {
                // A single gap can be bridged with one joker.
                if (number == previous + 2 && !jokers.empty()) {
                    TileSet bridged = run;
                    bridged.push_back(jokers.front());
                    bridged.push_back(tile);
                    if (IsValidRun(bridged)) {
                        out.push_back(bridged);
                    }
                }
                flush();
            }
            run.push_back(tile);
            previous = number;
        }
        flush();
    }
}

}  // namespace

Difficulty ParseDifficulty(const std::string& name) noexcept {
    if (name == "easy") {
        return Difficulty::Easy;
    }
    if (name == "hard") {
        return Difficulty::Hard;
    }
    return Difficulty::Medium;
}

std::vector<TileSet> FindPossibleSets(const TileSet& hand) {
    TileSet jokers;
    for (const auto& tile : hand) {
        if (tile.isJoker()) {
            jokers.push_back(tile);
        }
    }

    std::vector<TileSet> sets;
    AddGroups(hand, jokers, sets);
    AddRuns(hand, jokers, sets);

    sets.erase(std::remove_if(sets.begin(), sets.end(),
                              [](const TileSet& set) { return !IsValidSet(set); }),
               sets.end());
    std::stable_sort(sets.begin(), sets.end(), [](const TileSet& a, const TileSet& b) {
        return SetValue(a) > SetValue(b);
    });
    return sets;
}

std::vector<Extension> FindExtensions(const TileSet& hand, const BoardSets& board) {
    std::vector<Extension> extensions;
    std::set<std::string> used;
    for (const auto& tile : hand) {
        for (std::size_t i = 0; i < board.size(); ++i) {
            TileSet extended = board[i];
            extended.push_back(tile);
            if (IsValidSet(extended) && used.insert(tile.id()).second) {
                extensions.push_back(Extension{tile.id(), i});
                break;
            }
        }
    }
    return extensions;
}

BotPlan ChooseBotPlay(const GameSession& session, const std::string& bot_id, Difficulty difficulty) {
    BotPlan plan;
    const Player* bot = session.findPlayer(bot_id);
    if (bot == nullptr) {
        return plan;
    }
    if (bot->consecutive_draws >= kAggressiveAfterDraws) {
        difficulty = Difficulty::Hard;
    }
    const std::size_t budget = SetBudget(difficulty);

    std::set<std::string> used;
    int points = 0;
    for (const auto& candidate : FindPossibleSets(bot->hand)) {
        if (plan.new_sets.size() >= budget) {
            break;
        }
        const bool overlaps = std::any_of(candidate.begin(), candidate.end(), [&](const Tile& tile) {
            return used.count(tile.id()) > 0;
        });
        if (overlaps) {
            continue;
        }
        for (const auto& tile : candidate) {
            used.insert(tile.id());
        }
        points += SetValue(candidate);
        plan.new_sets.push_back(candidate);
    }

    if (!bot->has_played_initial) {
        if (points < kInitialPlayThreshold) {
            plan.new_sets.clear();
        }
        return plan;
    }

    TileSet remaining;
    for (const auto& tile : bot->hand) {
        if (used.count(tile.id()) == 0) {
            remaining.push_back(tile);
        }
    }
    plan.extensions = FindExtensions(remaining, session.board());
    if (difficulty == Difficulty::Easy && plan.extensions.size() > 1) {
        plan.extensions.resize(1);
    }
    return plan;
}

ActionResult PlayBotTurn(GameSession& session, Difficulty difficulty) {
    const Player* current = session.currentPlayer();
    if (current == nullptr || !current->is_bot) {
        return ActionResult::Reject(RejectionKind::InvalidPlayer, "Current player is not a bot");
    }
    const std::string bot_id = current->id;
    const BotPlan plan = ChooseBotPlay(session, bot_id, difficulty);
    if (plan.draws()) {
        return session.drawTile(bot_id);
    }

    bool played = false;
    if (!plan.new_sets.empty()) {
        std::vector<std::vector<std::string>> sets;
        for (const auto& set : plan.new_sets) {
            sets.push_back(TileIds(set));
        }
        auto result = session.playMultipleSets(bot_id, sets);
        if (!result) {
            return session.drawTile(bot_id);
        }
        played = true;
    }
    // Extensions target sets that existed before the new sets were appended.
    for (const auto& extension : plan.extensions) {
        if (session.completed()) {
            return ActionResult::Ok();
        }
        auto result = session.playSet(bot_id, {extension.tile_id}, extension.target);
        if (!result) {
            break;
        }
        played = true;
    }

    if (session.completed()) {
        return ActionResult::Ok();
    }
    if (!played) {
        return session.drawTile(bot_id);
    }
    return session.endTurn(bot_id);
}

}  // namespace rummi::core::bot
