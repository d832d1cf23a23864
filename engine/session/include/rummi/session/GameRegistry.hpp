#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

#include "rummi/session/GameRoom.hpp"

namespace rummi::session {

// Owns every live game and remembers which game each player sits in.
class GameRegistry {
public:
    explicit GameRegistry(RoomSettings defaults, std::uint32_t seed = std::random_device{}());

    std::shared_ptr<GameRoom> create(const core::GameOptions& options);
    std::shared_ptr<GameRoom> adopt(RoomSnapshot snapshot);
    std::shared_ptr<GameRoom> find(const std::string& game_id) const;
    std::shared_ptr<GameRoom> roomOf(const std::string& player_id) const;
    bool remove(const std::string& game_id);

    void bindPlayer(const std::string& player_id, const std::string& game_id);
    void unbindPlayer(const std::string& player_id);
    std::optional<std::string> gameOf(const std::string& player_id) const;

    std::vector<std::shared_ptr<GameRoom>> rooms() const;
    std::size_t size() const;
    const RoomSettings& defaults() const noexcept { return defaults_; }

private:
    std::string nextGameId();

    RoomSettings defaults_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<GameRoom>> rooms_;
    std::unordered_map<std::string, std::string> player_games_;
    std::mt19937 rng_;
};

}  // namespace rummi::session
