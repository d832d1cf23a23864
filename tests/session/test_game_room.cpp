#undef NDEBUG
#include <algorithm>
#include <cassert>
#include <iostream>

#include "rummi/core/Deck.hpp"
#include "rummi/session/GameRoom.hpp"

using namespace rummi;
using namespace rummi::session;

namespace {

const core::TimePoint T0 = core::FromEpochMs(1700000000000);

core::TimePoint At(std::int64_t ms) {
    return T0 + core::Millis(ms);
}

RoomSettings Settings() {
    RoomSettings settings;
    settings.options.timer_enabled = true;
    settings.options.turn_duration_ms = 60000;
    settings.bot_move_delay = core::Millis(1500);
    return settings;
}

std::size_t Count(const EventQueue& events, GameEventType type) {
    return static_cast<std::size_t>(std::count_if(
        events.begin(), events.end(), [type](const GameEvent& event) { return event.type == type; }));
}

struct Glance {
    std::string current;
    int turn = 0;
    core::GamePhase phase = core::GamePhase::WaitingForPlayers;
    std::size_t hand = 0;
};

Glance Look(const GameRoom& room, const std::string& player_id) {
    return room.inspect([&](const core::GameSession& session, const TurnTimer&,
                            const ReconnectionManager&) {
        Glance glance;
        if (const auto* current = session.currentPlayer()) {
            glance.current = current->id;
        }
        glance.turn = session.turnNumber();
        glance.phase = session.phase();
        if (const auto* player = session.findPlayer(player_id)) {
            glance.hand = player->hand.size();
        }
        return glance;
    });
}

void TestStartRunsTurnTimer() {
    GameRoom room("ROOM01", Settings(), 5u);
    EventQueue events;
    assert(room.join("alice", "Alice", T0, events));
    assert(room.start("alice", T0, events).kind == core::RejectionKind::InvalidState);
    assert(room.join("bob", "Bob", T0, events));
    assert(room.start("mallory", T0, events).kind == core::RejectionKind::InvalidPlayer);

    events.clear();
    assert(room.start("alice", T0, events));
    assert(Count(events, GameEventType::StateChanged) == 1);
    room.inspect([](const core::GameSession& session, const TurnTimer& timer,
                    const ReconnectionManager&) {
        assert(session.phase() == core::GamePhase::InProgress);
        assert(timer.active());
        assert(timer.playerId() == "alice");
        assert(timer.remaining(At(1000)).count() == 59000);
        assert(session.totalTileCount() == core::kFullDeckSize);
        return 0;
    });
}

void TestTimerExpiryPenalisesAndAdvances() {
    GameRoom room("ROOM02", Settings(), 6u);
    EventQueue events;
    assert(room.join("alice", "Alice", T0, events));
    assert(room.join("bob", "Bob", T0, events));
    assert(room.start("alice", T0, events));

    events.clear();
    room.tick(At(59999), events);
    assert(Count(events, GameEventType::TurnTimedOut) == 0);
    assert(Look(room, "alice").current == "alice");

    room.tick(At(60000), events);
    assert(Count(events, GameEventType::TurnTimedOut) == 1);
    const auto glance = Look(room, "alice");
    assert(glance.current == "bob");
    assert(glance.hand == 15);
    assert(glance.turn == 2);
    room.inspect([](const core::GameSession&, const TurnTimer& timer, const ReconnectionManager&) {
        assert(timer.playerId() == "bob");
        assert(timer.remaining(At(60000)).count() == 60000);
        return 0;
    });
}

void TestBotMovesAfterDelay() {
    GameRoom room("ROOM03", Settings(), 8u);
    EventQueue events;
    assert(room.join("alice", "Alice", T0, events));
    assert(room.addBot(T0, events));
    assert(room.start("alice", T0, events));
    assert(room.participantIds().size() == 1);

    assert(room.drawTile("alice", At(1000), events));
    const auto bot_turn = Look(room, "alice");
    assert(bot_turn.current != "alice");
    assert(bot_turn.turn == 2);

    room.tick(At(2000), events);
    assert(Look(room, "alice").turn == 2);

    room.tick(At(2500), events);
    const auto after = Look(room, "alice");
    assert(after.current == "alice");
    assert(after.turn == 3);
}

void TestGameOverIsAnnouncedOnce() {
    RoomSnapshot snapshot;
    auto& state = snapshot.session;
    state.id = "ROOM04";
    state.phase = core::GamePhase::InProgress;
    core::Player alice;
    alice.id = "alice";
    alice.name = "Alice";
    alice.has_played_initial = true;
    alice.hand = {core::Tile::Numbered(core::NumberedTileId(core::TileColor::Red, 7, 0), core::TileColor::Red, 7),
                  core::Tile::Numbered(core::NumberedTileId(core::TileColor::Blue, 7, 0), core::TileColor::Blue, 7),
                  core::Tile::Numbered(core::NumberedTileId(core::TileColor::Yellow, 7, 0), core::TileColor::Yellow, 7)};
    core::Player bob;
    bob.id = "bob";
    bob.name = "Bob";
    bob.hand = {core::Tile::Numbered(core::NumberedTileId(core::TileColor::Black, 1, 0), core::TileColor::Black, 1)};
    state.players = {alice, bob};
    state.turn.hand = alice.hand;
    state.turn_number = 4;

    GameRoom room(std::move(snapshot), Settings());
    EventQueue events;
    assert(room.playMultipleSets("alice", {{"red_7_0", "blue_7_0", "yellow_7_0"}}, At(0), events));
    assert(Count(events, GameEventType::GameOver) == 1);
    const auto over = std::find_if(events.begin(), events.end(), [](const GameEvent& event) {
        return event.type == GameEventType::GameOver;
    });
    assert(over->payload["winner"] == "alice");
    assert(over->payload["scores"]["alice"] == 1);
    assert(over->payload["scores"]["bob"] == -1);
    assert(room.finished());

    events.clear();
    room.tick(At(1000), events);
    room.tick(At(200000), events);
    assert(Count(events, GameEventType::GameOver) == 0);
    assert(room.endTurn("bob", At(1000), events).kind == core::RejectionKind::InvalidState);
}

void TestLeavingEndsGameWithLastPlayer() {
    GameRoom room("ROOM05", Settings(), 9u);
    EventQueue events;
    assert(room.join("alice", "Alice", T0, events));
    assert(room.join("bob", "Bob", T0, events));
    assert(room.join("carol", "Carol", T0, events));
    assert(room.start("alice", T0, events));

    events.clear();
    assert(room.leave("bob", At(100), events));
    assert(!room.finished());
    assert(room.leave("bob", At(100), events).kind == core::RejectionKind::InvalidPlayer);
    assert(room.leave("carol", At(200), events));
    assert(room.finished());
    assert(Count(events, GameEventType::GameOver) == 1);
    room.inspect([](const core::GameSession& session, const TurnTimer& timer,
                    const ReconnectionManager&) {
        assert(session.winner() == std::optional<std::string>("alice"));
        assert(!timer.active());
        return 0;
    });
}

void TestManualPauseFreezesTimer() {
    GameRoom room("ROOM06", Settings(), 10u);
    EventQueue events;
    assert(room.join("alice", "Alice", T0, events));
    assert(room.join("bob", "Bob", T0, events));
    assert(room.resume("bob", At(0), events).kind == core::RejectionKind::InvalidState);
    assert(room.start("alice", T0, events));

    events.clear();
    assert(room.pause("alice", At(10000), events));
    assert(Count(events, GameEventType::Paused) == 1);
    assert(room.pause("bob", At(11000), events).kind == core::RejectionKind::InvalidState);
    assert(room.drawTile("alice", At(12000), events).kind == core::RejectionKind::InvalidState);
    room.tick(At(30000), events);
    assert(Look(room, "alice").current == "alice");

    assert(room.resume("bob", At(40000), events));
    assert(Count(events, GameEventType::Resumed) == 1);
    room.inspect([](const core::GameSession& session, const TurnTimer& timer,
                    const ReconnectionManager&) {
        assert(session.phase() == core::GamePhase::InProgress);
        assert(timer.remaining(At(50000)).count() == 40000);
        return 0;
    });
}

void TestChatAndViews() {
    GameRoom room("ROOM07", Settings(), 12u);
    EventQueue events;
    assert(room.join("alice", "Alice", T0, events));
    assert(room.join("bob", "Bob", T0, events));
    assert(room.start("alice", T0, events));

    events.clear();
    assert(room.chat("alice", "good luck", At(5), events));
    assert(events.size() == 1);
    assert(events[0].type == GameEventType::Chat);
    assert(events[0].payload["playerName"] == "Alice");
    assert(events[0].recipient.empty());
    assert(room.chat("zed", "hi", At(5), events).kind == core::RejectionKind::InvalidPlayer);

    const auto alice_view = room.viewFor("alice", At(1000));
    const auto bob_view = room.viewFor("bob", At(1000));
    assert(alice_view["gameId"] == "ROOM07");
    assert(alice_view["currentPlayerId"] == "alice");
    assert(alice_view["hand"].size() == 14);
    assert(bob_view["hand"].size() == 14);
    assert(alice_view["hand"] != bob_view["hand"]);
    assert(alice_view["canDraw"] == true);
    assert(bob_view["canDraw"] == false);
    assert(alice_view["players"][1]["handCount"] == 14);
    assert(alice_view["timer"]["remainingMs"] == 59000);
    assert(alice_view["deckCount"] == core::kFullDeckSize - 28);
    assert(alice_view["vote"].is_null());
}

void TestSnapshotRestoresRoom() {
    GameRoom room("ROOM08", Settings(), 13u);
    EventQueue events;
    assert(room.join("alice", "Alice", T0, events));
    assert(room.join("bob", "Bob", T0, events));
    assert(room.start("alice", T0, events));
    assert(room.drawTile("alice", At(1000), events));

    GameRoom restored(room.snapshot(), Settings());
    assert(restored.id() == "ROOM08");
    assert(Look(restored, "alice").current == "bob");
    assert(Look(restored, "alice").hand == 15);
    assert(restored.viewFor("bob", At(2000)) == room.viewFor("bob", At(2000)));
    assert(restored.drawTile("bob", At(3000), events));
    assert(Look(restored, "alice").current == "alice");
}

void TestLostTileIsReturnedToDeck() {
    GameRoom room("ROOM09", Settings(), 14u);
    EventQueue events;
    assert(room.join("alice", "Alice", T0, events));
    assert(room.join("bob", "Bob", T0, events));
    assert(room.start("alice", T0, events));

    auto snapshot = room.snapshot();
    auto tiles = snapshot.session.deck.tiles();
    tiles.pop_back();
    snapshot.session.deck.assign(std::move(tiles));

    GameRoom damaged(std::move(snapshot), Settings());
    events.clear();
    damaged.tick(At(1000), events);
    assert(Count(events, GameEventType::Redirect) == 0);
    assert(!damaged.finished());
    damaged.inspect([](const core::GameSession& session, const TurnTimer&,
                       const ReconnectionManager&) {
        assert(session.totalTileCount() == core::kFullDeckSize);
        assert(session.phase() == core::GamePhase::InProgress);
        return 0;
    });
}

void TestDuplicateTileEndsGameOnce() {
    GameRoom room("ROOM10", Settings(), 15u);
    EventQueue events;
    assert(room.join("alice", "Alice", T0, events));
    assert(room.join("bob", "Bob", T0, events));
    assert(room.start("alice", T0, events));

    auto snapshot = room.snapshot();
    auto& players = snapshot.session.players;
    players[1].hand.push_back(players[0].hand.front());

    GameRoom damaged(std::move(snapshot), Settings());
    events.clear();
    damaged.tick(At(1000), events);
    assert(Count(events, GameEventType::Redirect) == 1);
    assert(Count(events, GameEventType::GameOver) == 1);
    assert(damaged.finished());

    events.clear();
    damaged.tick(At(1250), events);
    damaged.tick(At(1500), events);
    assert(Count(events, GameEventType::Redirect) == 0);
    assert(Count(events, GameEventType::GameOver) == 0);
}

void TestGracePeriodOfConnectedPlayerIsDropped() {
    GameRoom room("ROOM11", Settings(), 16u);
    EventQueue events;
    assert(room.join("alice", "Alice", T0, events));
    assert(room.join("bob", "Bob", T0, events));
    assert(room.join("carol", "Carol", T0, events));
    assert(room.start("alice", T0, events));
    room.disconnect("carol", At(1000), events);

    auto snapshot = room.snapshot();
    assert(snapshot.grace_periods.size() == 1);
    for (auto& status : snapshot.connections) {
        if (status.player_id == "carol") {
            status.state = ConnectionState::Connected;
            status.disconnected_at_ms.reset();
        }
    }

    GameRoom restored(std::move(snapshot), Settings());
    events.clear();
    restored.tick(At(2000), events);
    assert(Count(events, GameEventType::GracePeriodEnded) == 1);
    assert(Count(events, GameEventType::Redirect) == 0);
    assert(!restored.finished());
    restored.inspect([](const core::GameSession& session, const TurnTimer&,
                        const ReconnectionManager& reconnection) {
        assert(reconnection.gracePeriods().empty());
        assert(!session.findPlayer("carol")->abandoned);
        return 0;
    });
}

}  // namespace

int main() {
    TestStartRunsTurnTimer();
    TestTimerExpiryPenalisesAndAdvances();
    TestBotMovesAfterDelay();
    TestGameOverIsAnnouncedOnce();
    TestLeavingEndsGameWithLastPlayer();
    TestManualPauseFreezesTimer();
    TestChatAndViews();
    TestSnapshotRestoresRoom();
    TestLostTileIsReturnedToDeck();
    TestDuplicateTileEndsGameOnce();
    TestGracePeriodOfConnectedPlayerIsDropped();
    std::cout << "All game room tests passed." << std::endl;
    return 0;
}
