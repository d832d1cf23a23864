#pragma once

#include <optional>

#include "rummi/core/Types.hpp"

namespace rummi::core {

inline constexpr std::size_t kMinSetSize = 3;
inline constexpr std::size_t kMaxGroupSize = 4;
inline constexpr int kInitialPlayThreshold = 30;

enum class SetKind { Invalid, Group, Run };

bool IsValidGroup(const TileSet& tiles);
bool IsValidRun(const TileSet& tiles);
bool IsValidSet(const TileSet& tiles);

SetKind ClassifySet(const TileSet& tiles);

// Lowest starting number of a window that fits the run, if any.
std::optional<int> RunWindowStart(const TileSet& tiles);

// Points for a valid set with jokers valued in context; 0 for invalid sets.
int SetValue(const TileSet& tiles);

bool IsValidBoard(const BoardSets& board);

}  // namespace rummi::core
