#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "rummi/core/Clock.hpp"
#include "rummi/core/Json.hpp"
#include "rummi/persistence/GameStateStore.hpp"
#include "rummi/session/GameRoom.hpp"
#include "rummi/session/Recovery.hpp"

namespace rummi::persistence {

enum class LoadStatus { Ok, NotFound, Corrupted };

const char* LoadStatusName(LoadStatus status) noexcept;

struct LoadResult {
    LoadStatus status = LoadStatus::NotFound;
    std::optional<session::RoomSnapshot> state;
    core::Json meta = core::Json::object();
    std::string error;

    bool ok() const noexcept { return status == LoadStatus::Ok; }
};

// Save/restore adapter in front of a byte store. When the primary store
// refuses a write the record is kept in memory and the primary is retried on
// the next save.
class GameStatePersistence {
public:
    GameStatePersistence(std::unique_ptr<GameStateStore> primary,
                         session::RecoveryCoordinator& recovery);

    bool saveGameState(const std::string& game_id, const session::RoomSnapshot& snapshot,
                       core::TimePoint now);
    LoadResult loadGameState(const std::string& game_id);
    bool removeGameState(const std::string& game_id);
    std::vector<std::string> storedGameIds() const;

    bool degraded() const;
    int saveVersion(const std::string& game_id) const;

private:
    void syncFallback();

    std::unique_ptr<GameStateStore> primary_;
    MemoryStateStore fallback_;
    session::RecoveryCoordinator& recovery_;
    std::map<std::string, int> versions_;
    bool degraded_ = false;
    mutable std::mutex mutex_;
};

}  // namespace rummi::persistence
