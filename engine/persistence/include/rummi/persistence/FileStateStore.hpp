#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "rummi/persistence/GameStateStore.hpp"

namespace rummi::persistence {

// One MessagePack file per game under the save root. An empty root resolves to
// the SDL preference directory.
class FileStateStore : public GameStateStore {
public:
    explicit FileStateStore(std::filesystem::path root);

    bool Initialize();
    bool Save(const std::string& game_id, const std::vector<std::uint8_t>& bytes) override;
    bool Load(const std::string& game_id, std::vector<std::uint8_t>& out_bytes) const override;
    bool Remove(const std::string& game_id) override;
    std::vector<std::string> List() const override;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path ResolvePath(const std::string& game_id) const;
    bool EnsureRootExists() const;

    std::filesystem::path root_;
};

}  // namespace rummi::persistence
