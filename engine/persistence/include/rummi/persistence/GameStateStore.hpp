#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace rummi::persistence {

// Byte storage for game records, one record per game id. Writes replace the
// whole record.
class GameStateStore {
public:
    virtual ~GameStateStore() = default;

    virtual bool Save(const std::string& game_id, const std::vector<std::uint8_t>& bytes) = 0;
    virtual bool Load(const std::string& game_id, std::vector<std::uint8_t>& out_bytes) const = 0;
    virtual bool Remove(const std::string& game_id) = 0;
    virtual std::vector<std::string> List() const = 0;
};

class MemoryStateStore : public GameStateStore {
public:
    bool Save(const std::string& game_id, const std::vector<std::uint8_t>& bytes) override;
    bool Load(const std::string& game_id, std::vector<std::uint8_t>& out_bytes) const override;
    bool Remove(const std::string& game_id) override;
    std::vector<std::string> List() const override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<std::uint8_t>> records_;
};

}  // namespace rummi::persistence
