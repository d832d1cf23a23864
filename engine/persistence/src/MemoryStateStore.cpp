#include "rummi/persistence/GameStateStore.hpp"

namespace rummi::persistence {

bool MemoryStateStore::Save(const std::string& game_id, const std::vector<std::uint8_t>& bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[game_id] = bytes;
    return true;
}

bool MemoryStateStore::Load(const std::string& game_id, std::vector<std::uint8_t>& out_bytes) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(game_id);
    if (it == records_.end()) {
        return false;
    }
    out_bytes = it->second;
    return true;
}

bool MemoryStateStore::Remove(const std::string& game_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.erase(game_id) > 0;
}

std::vector<std::string> MemoryStateStore::List() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(records_.size());
    for (const auto& entry : records_) {
        ids.push_back(entry.first);
    }
    return ids;
}

}  // namespace rummi::persistence
