#include "rummi/persistence/GameStatePersistence.hpp"

#include <SDL2/SDL.h>

#include <algorithm>
#include <set>

#include "rummi/core/SavePayload.hpp"
#include "rummi/persistence/GameStateCodec.hpp"

namespace rummi::persistence {

const char* LoadStatusName(LoadStatus status) noexcept {
    switch (status) {
    case LoadStatus::Ok:
        return "ok";
    case LoadStatus::NotFound:
        return "not_found";
    case LoadStatus::Corrupted:
        return "corrupted";
    }
    return "not_found";
}

GameStatePersistence::GameStatePersistence(std::unique_ptr<GameStateStore> primary,
                                           session::RecoveryCoordinator& recovery)
    : primary_(std::move(primary)), recovery_(recovery) {}

void GameStatePersistence::syncFallback() {
    for (const auto& game_id : fallback_.List()) {
        std::vector<std::uint8_t> bytes;
        if (fallback_.Load(game_id, bytes) && primary_->Save(game_id, bytes)) {
            fallback_.Remove(game_id);
        }
    }
}

bool GameStatePersistence::saveGameState(const std::string& game_id,
                                         const session::RoomSnapshot& snapshot,
                                         core::TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    const int version = ++versions_[game_id];
    const auto bytes = EncodeRecord(snapshot, core::ToEpochMs(now), version).SerializeBinary();

    if (primary_->Save(game_id, bytes)) {
        fallback_.Remove(game_id);
        if (degraded_) {
            syncFallback();
            degraded_ = !fallback_.List().empty();
            if (!degraded_) {
                SDL_Log("Game store available again, memory records flushed");
            }
        }
        return true;
    }

    SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Saving game %s (version %d) failed",
                 game_id.c_str(), version);
    // The newest record always lands in memory, whatever the retry budget says.
    const bool kept = fallback_.Save(game_id, bytes);
    degraded_ = degraded_ || kept;
    bool stored = false;

    session::FailureContext context{game_id, {}, "game store write failed"};
    auto outcome = recovery_.handle(
        session::FailureKind::DatabaseError, context, now,
        [&](session::RecoveryAction action, const session::FailureContext&) {
            switch (action) {
            case session::RecoveryAction::UseMemoryStorage:
                return kept;
            case session::RecoveryAction::RetryDatabase:
                stored = primary_->Save(game_id, bytes);
                return stored;
            case session::RecoveryAction::SyncWhenAvailable:
                return degraded_;
            default:
                return false;
            }
        });
    if (stored) {
        fallback_.Remove(game_id);
        degraded_ = !fallback_.List().empty();
    }
    if (kept || stored) {
        if (degraded_) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                        "Game %s kept in memory until the store recovers", game_id.c_str());
        }
        return true;
    }
    SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Game %s could not be kept: %s", game_id.c_str(),
                 outcome.user_message.c_str());
    return false;
}

LoadResult GameStatePersistence::loadGameState(const std::string& game_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    LoadResult result;
    std::vector<std::uint8_t> bytes;
    // A memory record only exists while it is newer than the primary copy.
    if (!fallback_.Load(game_id, bytes) && !primary_->Load(game_id, bytes)) {
        result.status = LoadStatus::NotFound;
        return result;
    }

    DecodedRecord record;
    try {
        record = DecodeRecord(core::SavePayload::DeserializeBinary(bytes));
    } catch (const std::exception& e) {
        record.error = e.what();
    }
    result.meta = record.meta;
    if (!record.snapshot) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Record for game %s is corrupted: %s",
                    game_id.c_str(), record.error.c_str());
        result.status = LoadStatus::Corrupted;
        result.error = record.error;
        return result;
    }

    if (result.meta.contains("save_version") && result.meta["save_version"].is_number_integer()) {
        auto& known = versions_[game_id];
        known = std::max(known, result.meta["save_version"].get<int>());
    }
    result.status = LoadStatus::Ok;
    result.state = std::move(record.snapshot);
    return result;
}

bool GameStatePersistence::removeGameState(const std::string& game_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    versions_.erase(game_id);
    const bool from_memory = fallback_.Remove(game_id);
    const bool from_store = primary_->Remove(game_id);
    return from_memory || from_store;
}

std::vector<std::string> GameStatePersistence::storedGameIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> ids;
    for (auto& id : primary_->List()) {
        ids.insert(std::move(id));
    }
    for (auto& id : fallback_.List()) {
        ids.insert(std::move(id));
    }
    return {ids.begin(), ids.end()};
}

bool GameStatePersistence::degraded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return degraded_;
}

int GameStatePersistence::saveVersion(const std::string& game_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = versions_.find(game_id);
    return it == versions_.end() ? 0 : it->second;
}

}  // namespace rummi::persistence
