#include "rummi/session/GameRegistry.hpp"

#include <SDL2/SDL.h>

namespace rummi::session {

GameRegistry::GameRegistry(RoomSettings defaults, std::uint32_t seed)
    : defaults_(std::move(defaults)), rng_(seed) {}

std::string GameRegistry::nextGameId() {
    static const char kAlphabet[] = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(kAlphabet) - 2);
    std::string id;
    do {
        id.clear();
        for (int i = 0; i < 6; ++i) {
            id += kAlphabet[pick(rng_)];
        }
    } while (rooms_.count(id) > 0);
    return id;
}

std::shared_ptr<GameRoom> GameRegistry::create(const core::GameOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    RoomSettings settings = defaults_;
    settings.options = options;
    const std::string game_id = nextGameId();
    auto room = std::make_shared<GameRoom>(game_id, settings, static_cast<std::uint32_t>(rng_()));
    rooms_.emplace(game_id, room);
    SDL_Log("Created game %s", game_id.c_str());
    return room;
}

std::shared_ptr<GameRoom> GameRegistry::adopt(RoomSnapshot snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string game_id = snapshot.session.id;
    std::vector<std::string> players;
    for (const auto& player : snapshot.session.players) {
        if (!player.is_bot && !player.abandoned) {
            players.push_back(player.id);
        }
    }
    auto room = std::make_shared<GameRoom>(std::move(snapshot), defaults_);
    rooms_[game_id] = room;
    for (const auto& player_id : players) {
        player_games_[player_id] = game_id;
    }
    SDL_Log("Restored game %s", game_id.c_str());
    return room;
}

std::shared_ptr<GameRoom> GameRegistry::find(const std::string& game_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(game_id);
    return it == rooms_.end() ? nullptr : it->second;
}

std::shared_ptr<GameRoom> GameRegistry::roomOf(const std::string& player_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto binding = player_games_.find(player_id);
    if (binding == player_games_.end()) {
        return nullptr;
    }
    auto it = rooms_.find(binding->second);
    return it == rooms_.end() ? nullptr : it->second;
}

bool GameRegistry::remove(const std::string& game_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (rooms_.erase(game_id) == 0) {
        return false;
    }
    for (auto it = player_games_.begin(); it != player_games_.end();) {
        if (it->second == game_id) {
            it = player_games_.erase(it);
        } else {
            ++it;
        }
    }
    SDL_Log("Removed game %s", game_id.c_str());
    return true;
}

void GameRegistry::bindPlayer(const std::string& player_id, const std::string& game_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    player_games_[player_id] = game_id;
}

void GameRegistry::unbindPlayer(const std::string& player_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    player_games_.erase(player_id);
}

std::optional<std::string> GameRegistry::gameOf(const std::string& player_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = player_games_.find(player_id);
    if (it == player_games_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::shared_ptr<GameRoom>> GameRegistry::rooms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<GameRoom>> out;
    out.reserve(rooms_.size());
    for (const auto& entry : rooms_) {
        out.push_back(entry.second);
    }
    return out;
}

std::size_t GameRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rooms_.size();
}

}  // namespace rummi::session
