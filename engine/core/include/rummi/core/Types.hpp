#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "rummi/core/Json.hpp"

namespace rummi::core {

enum class TileColor : std::uint8_t { Red, Blue, Yellow, Black };

inline constexpr std::array<TileColor, 4> kAllColors{
    {TileColor::Red, TileColor::Blue, TileColor::Yellow, TileColor::Black}};

inline constexpr int kMinTileNumber = 1;
inline constexpr int kMaxTileNumber = 13;
inline constexpr int kJokerPenalty = 30;

const char* ColorName(TileColor color) noexcept;
std::optional<TileColor> ParseColor(const std::string& name) noexcept;

// A tile is either a joker or a numbered tile with a color. The two shapes can
// only be produced through the factories below.
class Tile {
public:
    static Tile Joker(std::string id);
    static Tile Numbered(std::string id, TileColor color, int number);

    const std::string& id() const noexcept { return id_; }
    bool isJoker() const noexcept { return joker_; }
    std::optional<TileColor> color() const noexcept;
    std::optional<int> number() const noexcept;

    // Face value; jokers count as a penalty when left in hand.
    int penaltyValue() const noexcept { return joker_ ? kJokerPenalty : number_; }

    bool operator==(const Tile& other) const noexcept {
        return id_ == other.id_ && joker_ == other.joker_ && color_ == other.color_ &&
               number_ == other.number_;
    }
    bool operator!=(const Tile& other) const noexcept { return !(*this == other); }

private:
    Tile() = default;

    std::string id_;
    bool joker_ = false;
    TileColor color_ = TileColor::Red;
    int number_ = 0;
};

using TileSet = std::vector<Tile>;
using BoardSets = std::vector<TileSet>;

Json TileToJson(const Tile& tile);
// Throws std::invalid_argument when the record breaks the joker/numbered shape.
Tile TileFromJson(const Json& json);

Json TileSetToJson(const TileSet& tiles);
TileSet TileSetFromJson(const Json& json);

std::size_t CountTiles(const BoardSets& board) noexcept;

}  // namespace rummi::core
