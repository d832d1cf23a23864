#include "rummi/core/Types.hpp"

#include <cstdint>
#include <stdexcept>

namespace rummi::core {

const char* ColorName(TileColor color) noexcept {
    switch (color) {
    case TileColor::Red:
        return "red";
    case TileColor::Blue:
        return "blue";
    case TileColor::Yellow:
        return "yellow";
    case TileColor::Black:
        return "black";
    }
    return "red";
}

std::optional<TileColor> ParseColor(const std::string& name) noexcept {
    for (TileColor color : kAllColors) {
        if (name == ColorName(color)) {
            return color;
        }
    }
    return std::nullopt;
}

Tile Tile::Joker(std::string id) {
    if (id.empty()) {
        throw std::invalid_argument("tile id must not be empty");
    }
    Tile tile;
    tile.id_ = std::move(id);
    tile.joker_ = true;
    return tile;
}

Tile Tile::Numbered(std::string id, TileColor color, int number) {
    if (id.empty()) {
        throw std::invalid_argument("tile id must not be empty");
    }
    if (number < kMinTileNumber || number > kMaxTileNumber) {
        throw std::invalid_argument("tile number out of range: " + std::to_string(number));
    }
    Tile tile;
    tile.id_ = std::move(id);
    tile.color_ = color;
    tile.number_ = number;
    return tile;
}

std::optional<TileColor> Tile::color() const noexcept {
    if (joker_) {
        return std::nullopt;
    }
    return color_;
}

std::optional<int> Tile::number() const noexcept {
    if (joker_) {
        return std::nullopt;
    }
    return number_;
}

Json TileToJson(const Tile& tile) {
    Json json;
    json["id"] = tile.id();
    json["isJoker"] = tile.isJoker();
    if (tile.isJoker()) {
        json["color"] = nullptr;
        json["number"] = nullptr;
    } else {
        json["color"] = ColorName(*tile.color());
        json["number"] = *tile.number();
    }
    return json;
}

Tile TileFromJson(const Json& json) {
    if (!json.is_object() || !json.contains("id") || !json["id"].is_string()) {
        throw std::invalid_argument("tile record without id");
    }
    auto id = json["id"].get<std::string>();
    const bool joker = json.value("isJoker", false);
    const bool has_color = json.contains("color") && !json["color"].is_null();
    const bool has_number = json.contains("number") && !json["number"].is_null();

    if (joker) {
        if (has_color || has_number) {
            throw std::invalid_argument("joker " + id + " carries a color or number");
        }
        return Tile::Joker(std::move(id));
    }
    if (!has_color || !has_number || !json["color"].is_string() ||
        !json["number"].is_number_integer()) {
        throw std::invalid_argument("tile " + id + " is missing color or number");
    }
    auto color = ParseColor(json["color"].get<std::string>());
    if (!color) {
        throw std::invalid_argument("tile " + id + " has unknown color");
    }
    const auto number = json["number"].get<std::int64_t>();
    if (number < kMinTileNumber || number > kMaxTileNumber) {
        throw std::invalid_argument("tile " + id + " has number out of range");
    }
    return Tile::Numbered(std::move(id), *color, static_cast<int>(number));
}

Json TileSetToJson(const TileSet& tiles) {
    Json json = Json::array();
    for (const auto& tile : tiles) {
        json.push_back(TileToJson(tile));
    }
    return json;
}

TileSet TileSetFromJson(const Json& json) {
    if (!json.is_array()) {
        throw std::invalid_argument("tile list must be an array");
    }
    TileSet tiles;
    tiles.reserve(json.size());
    for (const auto& entry : json) {
        tiles.push_back(TileFromJson(entry));
    }
    return tiles;
}

std::size_t CountTiles(const BoardSets& board) noexcept {
    std::size_t total = 0;
    for (const auto& set : board) {
        total += set.size();
    }
    return total;
}

}  // namespace rummi::core
