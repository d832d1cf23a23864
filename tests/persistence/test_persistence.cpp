#undef NDEBUG
#include <algorithm>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <random>

#include "rummi/persistence/FileStateStore.hpp"
#include "rummi/persistence/GameStateCodec.hpp"
#include "rummi/persistence/GameStatePersistence.hpp"

using namespace rummi;
using namespace rummi::persistence;

namespace {

const core::TimePoint T0 = core::FromEpochMs(1700000000000);

core::TimePoint At(std::int64_t ms) {
    return T0 + core::Millis(ms);
}

// Store whose writes can be switched off.
class FlakyStore : public MemoryStateStore {
public:
    bool Save(const std::string& game_id, const std::vector<std::uint8_t>& bytes) override {
        if (failing) {
            return false;
        }
        return MemoryStateStore::Save(game_id, bytes);
    }

    bool failing = false;
};

session::RoomSnapshot PlayedSnapshot(const std::string& game_id) {
    session::RoomSettings settings;
    settings.options.turn_duration_ms = 60000;
    session::GameRoom room(game_id, settings, 21u);
    session::EventQueue events;
    assert(room.join("alice", "Alice", T0, events));
    assert(room.join("bob", "Bob", T0, events));
    assert(room.join("carol", "Carol", T0, events));
    assert(room.start("alice", T0, events));
    assert(room.drawTile("alice", At(1000), events));
    assert(room.chat("carol", "hurry up", At(1500), events));
    room.disconnect("bob", At(2000), events);
    return room.snapshot();
}

void TestRoundTripIsExact() {
    session::RecoveryCoordinator recovery;
    GameStatePersistence persistence(std::make_unique<MemoryStateStore>(), recovery);
    const auto snapshot = PlayedSnapshot("SAVE01");
    assert(snapshot.session.phase == core::GamePhase::Paused);
    assert(snapshot.grace_periods.size() == 1);

    assert(persistence.saveGameState("SAVE01", snapshot, At(3000)));
    assert(persistence.saveVersion("SAVE01") == 1);

    const auto loaded = persistence.loadGameState("SAVE01");
    assert(loaded.ok());
    assert(loaded.meta["game_id"] == "SAVE01");
    assert(loaded.meta["saved_at_ms"] == core::ToEpochMs(At(3000)));
    assert(loaded.meta["save_version"] == 1);
    assert(SnapshotToJson(*loaded.state) == SnapshotToJson(snapshot));
    assert(loaded.state->session.deck.rng() == snapshot.session.deck.rng());
    assert(loaded.state->timer == snapshot.timer);
    assert(loaded.state->connections == snapshot.connections);

    assert(persistence.saveGameState("SAVE01", snapshot, At(4000)));
    assert(persistence.saveVersion("SAVE01") == 2);
    assert(persistence.loadGameState("SAVE01").meta["save_version"] == 2);
}

void TestRestoredRoomPlaysOn() {
    session::RecoveryCoordinator recovery;
    GameStatePersistence persistence(std::make_unique<MemoryStateStore>(), recovery);
    assert(persistence.saveGameState("SAVE02", PlayedSnapshot("SAVE02"), At(3000)));

    auto loaded = persistence.loadGameState("SAVE02");
    assert(loaded.ok());
    session::GameRoom room(std::move(*loaded.state), session::RoomSettings{});
    session::EventQueue events;
    assert(room.reconnect("bob", At(5000), events).status == session::ReconnectStatus::Restored);
    assert(room.drawTile("bob", At(6000), events));
    assert(room.viewFor("carol", At(6000))["currentPlayerId"] == "carol");
}

void TestMissingRecord() {
    session::RecoveryCoordinator recovery;
    GameStatePersistence persistence(std::make_unique<MemoryStateStore>(), recovery);
    const auto loaded = persistence.loadGameState("NOPE00");
    assert(loaded.status == LoadStatus::NotFound);
    assert(!loaded.state);
    assert(std::string(LoadStatusName(loaded.status)) == "not_found");
    assert(!persistence.removeGameState("NOPE00"));
}

void TestCorruptedRecordsAreDetected() {
    auto store = std::make_unique<MemoryStateStore>();
    MemoryStateStore* raw = store.get();
    session::RecoveryCoordinator recovery;
    GameStatePersistence persistence(std::move(store), recovery);
    const auto snapshot = PlayedSnapshot("BAD001");

    auto tampered = EncodeRecord(snapshot, 1, 1);
    tampered.data["session"]["players"][0]["score"] = 500;
    assert(raw->Save("BAD001", tampered.SerializeBinary()));
    auto loaded = persistence.loadGameState("BAD001");
    assert(loaded.status == LoadStatus::Corrupted);
    assert(loaded.error == "checksum mismatch");
    assert(!loaded.state);

    auto bad_tile = EncodeRecord(snapshot, 1, 1);
    bad_tile.data["session"]["players"][0]["hand"][0] = {{"id", "red_99_0"}, {"isJoker", false}, {"color", "red"}, {"number", 99}};
    bad_tile.Seal();
    assert(raw->Save("BAD002", bad_tile.SerializeBinary()));
    assert(persistence.loadGameState("BAD002").status == LoadStatus::Corrupted);

    auto lost_tile = EncodeRecord(snapshot, 1, 1);
    lost_tile.data["session"]["deck"].erase(0);
    lost_tile.Seal();
    assert(raw->Save("BAD003", lost_tile.SerializeBinary()));
    loaded = persistence.loadGameState("BAD003");
    assert(loaded.status == LoadStatus::Corrupted);
    assert(loaded.error.find("tile count is 105") == 0);

    auto duplicate = EncodeRecord(snapshot, 1, 1);
    duplicate.data["session"]["deck"].push_back(duplicate.data["session"]["players"][0]["hand"][0]);
    duplicate.Seal();
    assert(raw->Save("BAD004", duplicate.SerializeBinary()));
    loaded = persistence.loadGameState("BAD004");
    assert(loaded.status == LoadStatus::Corrupted);
    assert(loaded.error.find("appears more than once") != std::string::npos);

    auto wrong_mode = EncodeRecord(snapshot, 1, 1);
    wrong_mode.mode = "settings";
    assert(raw->Save("BAD005", wrong_mode.SerializeBinary()));
    assert(persistence.loadGameState("BAD005").status == LoadStatus::Corrupted);

    assert(raw->Save("BAD006", {0xc1, 0xff, 0x00}));
    assert(persistence.loadGameState("BAD006").status == LoadStatus::Corrupted);

    const auto direct = DecodeRecord(EncodeRecord(snapshot, 1, 7));
    assert(direct.snapshot);
    assert(direct.error.empty());
    assert(direct.meta["save_version"] == 7);
}

void TestValidationRules() {
    auto snapshot = PlayedSnapshot("RULES1");
    assert(!ValidateSnapshot(snapshot));

    auto no_id = snapshot;
    no_id.session.id.clear();
    assert(ValidateSnapshot(no_id));

    auto ghost_winner = snapshot;
    ghost_winner.session.winner = "mallory";
    assert(ValidateSnapshot(ghost_winner));

    auto ghost_timer = snapshot;
    ghost_timer.timer.player_id = "mallory";
    assert(ValidateSnapshot(ghost_timer));

    auto negative = snapshot;
    negative.timer.remaining_ms = -1;
    assert(ValidateSnapshot(negative));

    auto twins = snapshot;
    twins.session.players[1].id = twins.session.players[0].id;
    assert(ValidateSnapshot(twins));
}

void TestDegradedModeKeepsGamesInMemory() {
    auto store = std::make_unique<FlakyStore>();
    FlakyStore* raw = store.get();
    session::RecoveryCoordinator recovery;
    GameStatePersistence persistence(std::move(store), recovery);
    const auto first = PlayedSnapshot("DEG001");
    const auto second = PlayedSnapshot("DEG002");

    raw->failing = true;
    assert(persistence.saveGameState("DEG001", first, At(1000)));
    assert(persistence.saveGameState("DEG002", second, At(1000)));
    assert(persistence.degraded());
    std::vector<std::uint8_t> bytes;
    assert(!raw->Load("DEG001", bytes));

    auto loaded = persistence.loadGameState("DEG001");
    assert(loaded.ok());
    assert(SnapshotToJson(*loaded.state) == SnapshotToJson(first));
    const auto ids = persistence.storedGameIds();
    assert(ids.size() == 2);

    raw->failing = false;
    assert(persistence.saveGameState("DEG001", first, At(2000)));
    assert(!persistence.degraded());
    assert(raw->Load("DEG001", bytes));
    assert(raw->Load("DEG002", bytes));
    assert(persistence.saveVersion("DEG001") == 2);
    assert(persistence.loadGameState("DEG002").ok());

    assert(persistence.removeGameState("DEG001"));
    assert(persistence.loadGameState("DEG001").status == LoadStatus::NotFound);
    assert(persistence.saveVersion("DEG001") == 0);
}

void TestLongOutageKeepsNewestRecord() {
    auto store = std::make_unique<FlakyStore>();
    store->failing = true;
    session::RecoveryCoordinator recovery;
    GameStatePersistence persistence(std::move(store), recovery);

    session::RoomSettings settings;
    settings.options.turn_duration_ms = 60000;
    session::GameRoom room("DEG003", settings, 8u);
    session::EventQueue events;
    assert(room.join("alice", "Alice", T0, events));
    assert(room.join("bob", "Bob", T0, events));
    assert(room.start("alice", T0, events));

    // Well past the three retries the database strategy allows.
    for (int turn = 1; turn <= 6; ++turn) {
        const std::string current = turn % 2 == 1 ? "alice" : "bob";
        assert(room.drawTile(current, At(turn * 1000), events));
        const auto snapshot = room.snapshot();
        assert(persistence.saveGameState("DEG003", snapshot, At(turn * 1000)));
        auto loaded = persistence.loadGameState("DEG003");
        assert(loaded.ok());
        assert(loaded.state->session.turn_number == snapshot.session.turn_number);
        assert(SnapshotToJson(*loaded.state) == SnapshotToJson(snapshot));
    }
    assert(persistence.degraded());
    assert(persistence.saveVersion("DEG003") == 6);
}

void TestFileStore() {
    std::mt19937 rng(std::random_device{}());
    const auto root = std::filesystem::temp_directory_path() /
                      ("rummi_store_test_" + std::to_string(rng()));
    {
        FileStateStore store(root);
        assert(store.Initialize());
        assert(store.List().empty());
        assert(store.Save("FILE01", {1, 2, 3}));
        assert(store.Save("FILE02", {4}));
        assert(!store.Save("", {5}));

        std::vector<std::uint8_t> bytes;
        assert(store.Load("FILE01", bytes));
        assert((bytes == std::vector<std::uint8_t>{1, 2, 3}));
        assert(store.Save("FILE01", {9}));
        assert(store.Load("FILE01", bytes));
        assert(bytes.size() == 1 && bytes[0] == 9);

        auto ids = store.List();
        std::sort(ids.begin(), ids.end());
        assert((ids == std::vector<std::string>{"FILE01", "FILE02"}));

        assert(store.Remove("FILE02"));
        assert(!store.Remove("FILE02"));
        assert(!store.Load("FILE02", bytes));

        session::RecoveryCoordinator recovery;
        GameStatePersistence persistence(std::make_unique<FileStateStore>(root), recovery);
        const auto snapshot = PlayedSnapshot("FILE03");
        assert(persistence.saveGameState("FILE03", snapshot, At(0)));
        const auto loaded = persistence.loadGameState("FILE03");
        assert(loaded.ok());
        assert(SnapshotToJson(*loaded.state) == SnapshotToJson(snapshot));
    }
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
}

}  // namespace

int main() {
    TestRoundTripIsExact();
    TestRestoredRoomPlaysOn();
    TestMissingRecord();
    TestCorruptedRecordsAreDetected();
    TestValidationRules();
    TestDegradedModeKeepsGamesInMemory();
    TestLongOutageKeepsNewestRecord();
    TestFileStore();
    std::cout << "All persistence tests passed." << std::endl;
    return 0;
}
