#include "rummi/core/SetValidator.hpp"

#include <algorithm>
#include <set>

namespace rummi::core {

namespace {

std::size_t CountJokers(const TileSet& tiles) {
    return static_cast<std::size_t>(
        std::count_if(tiles.begin(), tiles.end(), [](const Tile& tile) { return tile.isJoker(); }));
}

std::vector<int> SortedNumbers(const TileSet& tiles) {
    std::vector<int> numbers;
    for (const auto& tile : tiles) {
        if (!tile.isJoker()) {
            numbers.push_back(*tile.number());
        }
    }
    std::sort(numbers.begin(), numbers.end());
    return numbers;
}

}  // namespace

bool IsValidGroup(const TileSet& tiles) {
    if (tiles.size() < kMinSetSize || tiles.size() > kMaxGroupSize) {
        return false;
    }
    const std::size_t jokers = CountJokers(tiles);
    if (jokers == tiles.size()) {
        return true;
    }

    std::optional<int> number;
    std::set<TileColor> used_colors;
    for (const auto& tile : tiles) {
        if (tile.isJoker()) {
            continue;
        }
        if (number && *number != *tile.number()) {
            return false;
        }
        number = tile.number();
        if (!used_colors.insert(*tile.color()).second) {
            return false;
        }
    }
    return jokers <= kAllColors.size() - used_colors.size();
}

std::optional<int> RunWindowStart(const TileSet& tiles) {
    const int length = static_cast<int>(tiles.size());
    if (tiles.size() < kMinSetSize || length > kMaxTileNumber) {
        return std::nullopt;
    }

    std::optional<TileColor> color;
    for (const auto& tile : tiles) {
        if (tile.isJoker()) {
            continue;
        }
        if (color && *color != *tile.color()) {
            return std::nullopt;
        }
        color = tile.color();
    }

    const auto numbers = SortedNumbers(tiles);
    if (std::adjacent_find(numbers.begin(), numbers.end()) != numbers.end()) {
        return std::nullopt;
    }
    const int jokers = static_cast<int>(CountJokers(tiles));

    for (int base = kMinTileNumber; base + length - 1 <= kMaxTileNumber; ++base) {
        const int top = base + length - 1;
        if (!numbers.empty() && (numbers.front() < base || numbers.back() > top)) {
            continue;
        }
        // Every slot of the window not held by a numbered tile takes a joker.
        const int gaps = length - static_cast<int>(numbers.size());
        if (gaps == jokers) {
            return base;
        }
    }
    return std::nullopt;
}

bool IsValidRun(const TileSet& tiles) {
    return RunWindowStart(tiles).has_value();
}

bool IsValidSet(const TileSet& tiles) {
    return IsValidGroup(tiles) || IsValidRun(tiles);
}

SetKind ClassifySet(const TileSet& tiles) {
    if (IsValidGroup(tiles)) {
        return SetKind::Group;
    }
    if (IsValidRun(tiles)) {
        return SetKind::Run;
    }
    return SetKind::Invalid;
}

int SetValue(const TileSet& tiles) {
    const std::size_t jokers = CountJokers(tiles);
    if (jokers == tiles.size()) {
        return 0;
    }
    switch (ClassifySet(tiles)) {
    case SetKind::Group: {
        const auto numbers = SortedNumbers(tiles);
        return numbers.front() * static_cast<int>(tiles.size());
    }
    case SetKind::Run: {
        const int base = *RunWindowStart(tiles);
        int total = 0;
        for (int offset = 0; offset < static_cast<int>(tiles.size()); ++offset) {
            total += base + offset;
        }
        return total;
    }
    case SetKind::Invalid:
        break;
    }
    return 0;
}

bool IsValidBoard(const BoardSets& board) {
    return std::all_of(board.begin(), board.end(), [](const TileSet& set) { return IsValidSet(set); });
}

}  // namespace rummi::core
