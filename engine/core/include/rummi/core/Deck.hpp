#pragma once

#include <optional>
#include <random>
#include <string>
#include <vector>

#include "rummi/core/Types.hpp"

namespace rummi::core {

inline constexpr int kCopiesPerTile = 2;
inline constexpr int kJokerCount = 2;
inline constexpr std::size_t kFullDeckSize = 106;
inline constexpr std::size_t kInitialHandSize = 14;

// Ordered deck: copies of every (color, number) pair followed by the jokers.
std::vector<Tile> BuildFullDeck();

std::string NumberedTileId(TileColor color, int number, int copy);

class Deck {
public:
    Deck() = default;
    explicit Deck(std::uint32_t seed) : rng_(seed) {}

    void reset();
    void shuffle();

    std::optional<Tile> draw();
    std::optional<Tile> take(const std::string& tile_id);

    void assign(std::vector<Tile> tiles) { tiles_ = std::move(tiles); }
    void clear() noexcept { tiles_.clear(); }

    std::size_t size() const noexcept { return tiles_.size(); }
    bool empty() const noexcept { return tiles_.empty(); }
    const std::vector<Tile>& tiles() const noexcept { return tiles_; }

    std::mt19937& rng() noexcept { return rng_; }
    const std::mt19937& rng() const noexcept { return rng_; }

private:
    std::vector<Tile> tiles_;
    std::mt19937 rng_{std::random_device{}()};
};

// Fifteen tiles forming five valid sets, used by the debug deal.
std::vector<std::string> DebugHandTileIds();

}  // namespace rummi::core
