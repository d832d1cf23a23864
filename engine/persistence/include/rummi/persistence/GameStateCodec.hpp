#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "rummi/core/Json.hpp"
#include "rummi/core/SavePayload.hpp"
#include "rummi/session/GameRoom.hpp"

namespace rummi::persistence {

inline constexpr const char* kGameStateMode = "game_state";
inline constexpr int kGameStateVersion = 1;

core::Json SessionToJson(const core::SessionState& state);
// Throws std::invalid_argument or nlohmann::json exceptions on malformed records.
core::SessionState SessionFromJson(const core::Json& json);

core::Json SnapshotToJson(const session::RoomSnapshot& snapshot);
session::RoomSnapshot SnapshotFromJson(const core::Json& json);

// Structural checks that decoding alone does not cover. Returns the first problem found.
std::optional<std::string> ValidateSnapshot(const session::RoomSnapshot& snapshot);

// Builds a sealed record; meta gets saved_at_ms and save_version.
core::SavePayload EncodeRecord(const session::RoomSnapshot& snapshot, std::int64_t saved_at_ms,
                               int save_version);

struct DecodedRecord {
    std::optional<session::RoomSnapshot> snapshot;
    core::Json meta = core::Json::object();
    std::string error;
};

// Never throws; a corrupted record comes back without a snapshot and with an error.
DecodedRecord DecodeRecord(const core::SavePayload& payload);

}  // namespace rummi::persistence
