#include "rummi/core/Deck.hpp"

#include <algorithm>

namespace rummi::core {

std::string NumberedTileId(TileColor color, int number, int copy) {
    return std::string(ColorName(color)) + "_" + std::to_string(number) + "_" +
           std::to_string(copy);
}

std::vector<Tile> BuildFullDeck() {
    std::vector<Tile> tiles;
    tiles.reserve(kFullDeckSize);
    for (TileColor color : kAllColors) {
        for (int number = kMinTileNumber; number <= kMaxTileNumber; ++number) {
            for (int copy = 0; copy < kCopiesPerTile; ++copy) {
                tiles.push_back(Tile::Numbered(NumberedTileId(color, number, copy), color, number));
            }
        }
    }
    for (int joker = 1; joker <= kJokerCount; ++joker) {
        tiles.push_back(Tile::Joker("joker_" + std::to_string(joker)));
    }
    return tiles;
}

void Deck::reset() {
    tiles_ = BuildFullDeck();
    shuffle();
}

void Deck::shuffle() {
    std::shuffle(tiles_.begin(), tiles_.end(), rng_);
}

std::optional<Tile> Deck::draw() {
    if (tiles_.empty()) {
        return std::nullopt;
    }
    Tile tile = tiles_.back();
    tiles_.pop_back();
    return tile;
}

std::optional<Tile> Deck::take(const std::string& tile_id) {
    auto it = std::find_if(tiles_.begin(), tiles_.end(),
                           [&](const Tile& tile) { return tile.id() == tile_id; });
    if (it == tiles_.end()) {
        return std::nullopt;
    }
    Tile tile = *it;
    tiles_.erase(it);
    return tile;
}

std::vector<std::string> DebugHandTileIds() {
    return {
        // Group of 13s.
        "red_13_0", "blue_13_0", "yellow_13_0",
        // Red run 1-3.
        "red_1_0", "red_2_0", "red_3_0",
        // Blue run 4-6.
        "blue_4_0", "blue_5_0", "blue_6_0",
        // Group of 7s.
        "red_7_0", "blue_7_0", "yellow_7_0",
        // Group of 10s completed by a joker.
        "red_10_0", "blue_10_0", "joker_1",
    };
}

}  // namespace rummi::core
