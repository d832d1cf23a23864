#undef NDEBUG
#include <cassert>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>

#include "rummi/core/Deck.hpp"
#include "rummi/core/SetValidator.hpp"

using namespace rummi::core;

namespace {

void TestFullDeckComposition() {
    const auto tiles = BuildFullDeck();
    assert(tiles.size() == kFullDeckSize);

    std::set<std::string> ids;
    std::map<std::pair<TileColor, int>, int> copies;
    int jokers = 0;
    for (const auto& tile : tiles) {
        assert(ids.insert(tile.id()).second);
        if (tile.isJoker()) {
            ++jokers;
            assert(!tile.color().has_value());
            assert(!tile.number().has_value());
        } else {
            ++copies[{*tile.color(), *tile.number()}];
        }
    }
    assert(jokers == kJokerCount);
    assert(copies.size() == 52);
    for (const auto& entry : copies) {
        assert(entry.second == kCopiesPerTile);
    }
    assert(ids.count("red_1_0") == 1);
    assert(ids.count("black_13_1") == 1);
    assert(ids.count("joker_2") == 1);
}

void TestShuffleIsSeeded() {
    Deck a(42);
    Deck b(42);
    Deck c(7);
    a.reset();
    b.reset();
    c.reset();
    assert(a.size() == kFullDeckSize);
    assert(a.tiles() == b.tiles());
    assert(a.tiles() != c.tiles());
}

void TestDrawAndTake() {
    Deck deck(3);
    deck.reset();
    const Tile last = deck.tiles().back();
    auto drawn = deck.draw();
    assert(drawn && *drawn == last);
    assert(deck.size() == kFullDeckSize - 1);

    auto taken = deck.take("joker_1");
    if (last.id() != "joker_1") {
        assert(taken && taken->isJoker());
        assert(!deck.take("joker_1").has_value());
    }

    deck.clear();
    assert(deck.empty());
    assert(!deck.draw().has_value());
}

void TestDebugHandFormsFiveSets() {
    const auto ids = DebugHandTileIds();
    assert(ids.size() == 15);

    Deck deck(1);
    deck.reset();
    TileSet hand;
    for (const auto& id : ids) {
        auto tile = deck.take(id);
        assert(tile.has_value());
        hand.push_back(*tile);
    }
    assert(deck.size() == kFullDeckSize - 15);
    for (std::size_t i = 0; i < hand.size(); i += 3) {
        TileSet set(hand.begin() + static_cast<std::ptrdiff_t>(i),
                     hand.begin() + static_cast<std::ptrdiff_t>(i + 3));
        assert(IsValidSet(set));
    }
}

void TestTileFactoriesAndJson() {
    bool threw = false;
    try {
        Tile::Numbered("red_14_0", TileColor::Red, 14);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    const Tile tile = Tile::Numbered("blue_7_1", TileColor::Blue, 7);
    assert(tile.penaltyValue() == 7);
    assert(Tile::Joker("joker_1").penaltyValue() == kJokerPenalty);

    const auto json = TileToJson(tile);
    assert(json["color"] == "blue");
    assert(json["isJoker"] == false);
    assert(TileFromJson(json) == tile);

    Json bad = TileToJson(Tile::Joker("joker_2"));
    bad["color"] = "red";
    threw = false;
    try {
        TileFromJson(bad);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    Json unknown = json;
    unknown["color"] = "green";
    threw = false;
    try {
        TileFromJson(unknown);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // 4294967301 would read as 5 once truncated to 32 bits.
    Json wide = json;
    wide["number"] = 4294967301LL;
    threw = false;
    try {
        TileFromJson(wide);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

}  // namespace

int main() {
    TestFullDeckComposition();
    TestShuffleIsSeeded();
    TestDrawAndTake();
    TestDebugHandFormsFiveSets();
    TestTileFactoriesAndJson();
    std::cout << "All deck tests passed." << std::endl;
    return 0;
}
