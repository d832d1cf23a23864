#undef NDEBUG
#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>

#include "rummi/session/ContinuationVote.hpp"
#include "rummi/session/GameRoom.hpp"
#include "rummi/session/ReconnectionManager.hpp"

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
    settings.reconnection.grace.standard = core::Millis(180000);
    settings.reconnection.vote_timeout = core::Millis(30000);
    settings.bot_move_delay = core::Millis(1500);
    return settings;
}

std::unique_ptr<GameRoom> StartedRoom(std::initializer_list<const char*> players) {
    auto room = std::make_unique<GameRoom>("RECON1", Settings(), 42u);
    EventQueue events;
    for (const char* id : players) {
        assert(room->join(id, id, T0, events));
    }
    assert(room->start(*players.begin(), T0, events));
    return room;
}

std::size_t Count(const EventQueue& events, GameEventType type) {
    return static_cast<std::size_t>(std::count_if(
        events.begin(), events.end(), [type](const GameEvent& event) { return event.type == type; }));
}

std::string CurrentId(const GameRoom& room) {
    return room.inspect([](const core::GameSession& session, const TurnTimer&,
                           const ReconnectionManager&) { return session.currentPlayer()->id; });
}

void TestCurrentPlayerDisconnectPreservesTimer() {
    auto room = StartedRoom({"alice", "bob", "carol"});
    assert(CurrentId(*room) == "alice");

    EventQueue events;
    room->disconnect("alice", At(20000), events);
    assert(Count(events, GameEventType::GracePeriodStarted) == 1);
    assert(Count(events, GameEventType::Paused) == 1);
    room->inspect([](const core::GameSession& session, const TurnTimer& timer,
                     const ReconnectionManager& reconnection) {
        assert(session.phase() == core::GamePhase::Paused);
        assert(timer.paused());
        assert(timer.preserved());
        assert(timer.remaining(At(100000)).count() == 40000);
        assert(reconnection.pauseState().reason == PauseReason::CurrentPlayerDisconnect);
        assert(reconnection.pauseState().paused_by == "alice");
        assert(reconnection.gracePeriods().size() == 1);
        assert(reconnection.gracePeriods()[0].duration_ms == 180000);
        return 0;
    });

    events.clear();
    room->tick(At(100000), events);
    assert(CurrentId(*room) == "alice");
    assert(room->drawTile("alice", At(100000), events).kind == core::RejectionKind::InvalidState);

    events.clear();
    const auto result = room->reconnect("alice", At(100000), events);
    assert(result.status == ReconnectStatus::Restored);
    assert(Count(events, GameEventType::PlayerReconnected) == 1);
    assert(Count(events, GameEventType::Resumed) == 1);
    room->inspect([](const core::GameSession& session, const TurnTimer& timer,
                     const ReconnectionManager& reconnection) {
        assert(session.phase() == core::GamePhase::InProgress);
        assert(!timer.paused());
        assert(timer.playerId() == "alice");
        assert(timer.remaining(At(110000)).count() == 30000);
        assert(!reconnection.pauseState().is_paused);
        assert(reconnection.gracePeriods().empty());
        return 0;
    });

    events.clear();
    assert(room->reconnect("alice", At(110000), events).status == ReconnectStatus::AlreadyConnected);
}

void TestOtherPlayerDisconnectDoesNotPause() {
    auto room = StartedRoom({"alice", "bob", "carol"});
    EventQueue events;
    room->disconnect("carol", At(1000), events);
    assert(Count(events, GameEventType::GracePeriodStarted) == 1);
    assert(Count(events, GameEventType::Paused) == 0);
    assert(room->drawTile("alice", At(2000), events));
    assert(CurrentId(*room) == "bob");
}

void TestVoteAddsBotAndRejectsLateReconnect() {
    auto room = StartedRoom({"alice", "bob", "carol"});
    EventQueue events;
    room->disconnect("alice", At(20000), events);

    events.clear();
    room->tick(At(200000), events);
    assert(Count(events, GameEventType::GracePeriodEnded) == 1);
    assert(Count(events, GameEventType::VoteOpened) == 1);
    assert(room->vote("alice", ContinuationDecision::EndGame, At(200000), events).kind ==
           core::RejectionKind::InvalidPlayer);

    events.clear();
    assert(room->vote("bob", ContinuationDecision::AddBot, At(201000), events));
    assert(room->vote("bob", ContinuationDecision::AddBot, At(201000), events).kind ==
           core::RejectionKind::InvalidState);
    assert(room->vote("carol", ContinuationDecision::EndGame, At(202000), events));
    assert(Count(events, GameEventType::ContinuationDecided) == 1);

    const std::string bot_id = CurrentId(*room);
    assert(bot_id != "alice");
    room->inspect([&](const core::GameSession& session, const TurnTimer& timer,
                      const ReconnectionManager& reconnection) {
        assert(session.phase() == core::GamePhase::InProgress);
        assert(session.currentPlayer()->is_bot);
        assert(session.findPlayer("alice") == nullptr);
        assert(timer.playerId() == bot_id);
        assert(!timer.paused());
        assert(timer.remaining(At(202000)).count() == 40000);
        assert(!reconnection.vote());
        assert(reconnection.wasDecided("alice"));
        return 0;
    });

    events.clear();
    const auto late = room->reconnect("alice", At(203000), events);
    assert(late.status == ReconnectStatus::GameMovedOn);
    assert(!late.ok());

    // The substitute bot takes its turn once the move delay has passed.
    room->tick(At(203000), events);
    room->tick(At(206000), events);
    assert(CurrentId(*room) == "bob");
}

void TestVoteTimeoutSkipsPlayer() {
    auto room = StartedRoom({"alice", "bob", "carol"});
    EventQueue events;
    room->disconnect("alice", At(0), events);
    room->tick(At(180000), events);
    assert(room->inspect([](const core::GameSession&, const TurnTimer&,
                            const ReconnectionManager& reconnection) {
        return reconnection.vote().has_value();
    }));

    events.clear();
    room->tick(At(210000), events);
    assert(Count(events, GameEventType::ContinuationDecided) == 1);
    room->inspect([](const core::GameSession& session, const TurnTimer& timer,
                     const ReconnectionManager&) {
        assert(session.findPlayer("alice")->abandoned);
        assert(session.currentPlayer()->id == "bob");
        assert(session.phase() == core::GamePhase::InProgress);
        assert(timer.playerId() == "bob");
        assert(timer.remaining(At(210000)).count() == 60000);
        return 0;
    });
}

void TestReconnectDuringVoteCancelsIt() {
    auto room = StartedRoom({"alice", "bob", "carol"});
    EventQueue events;
    room->disconnect("alice", At(0), events);
    room->tick(At(180000), events);

    events.clear();
    assert(room->reconnect("alice", At(185000), events).status == ReconnectStatus::Restored);
    assert(Count(events, GameEventType::VoteCancelled) == 1);
    room->inspect([](const core::GameSession& session, const TurnTimer& timer,
                     const ReconnectionManager& reconnection) {
        assert(!reconnection.vote());
        assert(!reconnection.wasDecided("alice"));
        assert(session.phase() == core::GamePhase::InProgress);
        assert(timer.remaining(At(185000)).count() == 60000);
        return 0;
    });
}

void TestDecisionDuringManualPauseKeepsTimerFrozen() {
    auto room = StartedRoom({"alice", "bob", "carol"});
    EventQueue events;
    assert(room->pause("bob", At(10000), events));
    room->disconnect("alice", At(10000), events);
    room->tick(At(190000), events);
    assert(room->vote("bob", ContinuationDecision::SkipTurn, At(190000), events));
    assert(room->vote("carol", ContinuationDecision::SkipTurn, At(190000), events));
    assert(CurrentId(*room) == "bob");

    events.clear();
    room->tick(At(230000), events);
    room->inspect([](const core::GameSession& session, const TurnTimer& timer,
                     const ReconnectionManager& reconnection) {
        assert(session.phase() == core::GamePhase::Paused);
        assert(reconnection.pauseState().reason == PauseReason::ManualPause);
        assert(timer.playerId() == "bob");
        assert(timer.paused());
        assert(timer.remaining(At(190000)).count() == 60000);
        assert(timer.remaining(At(230000)).count() == 60000);
        assert(reconnection.analytics().metrics().expired_grace_periods == 1);
        assert(reconnection.analytics().metrics().decisions_by_type.at("skip_turn") == 1);
        return 0;
    });
    assert(Count(events, GameEventType::TurnTimedOut) == 0);

    assert(room->resume("carol", At(240000), events));
    room->inspect([](const core::GameSession& session, const TurnTimer& timer,
                     const ReconnectionManager&) {
        assert(session.phase() == core::GamePhase::InProgress);
        assert(!timer.paused());
        assert(timer.remaining(At(250000)).count() == 50000);
        return 0;
    });
}

void TestPauseReasonEscalates() {
    auto room = StartedRoom({"alice", "bob", "carol"});
    EventQueue events;
    room->disconnect("alice", At(1000), events);
    assert(Count(events, GameEventType::Paused) == 1);

    // Second drop inside the concurrent window.
    events.clear();
    room->disconnect("bob", At(3000), events);
    assert(Count(events, GameEventType::Paused) == 1);
    room->inspect([](const core::GameSession& session, const TurnTimer& timer,
                     const ReconnectionManager& reconnection) {
        assert(session.phase() == core::GamePhase::Paused);
        assert(reconnection.pauseState().reason == PauseReason::MultipleDisconnects);
        assert(reconnection.pauseState().paused_by == "alice");
        assert(reconnection.gracePeriods().size() == 2);
        assert(timer.remaining(At(50000)).count() == 59000);
        return 0;
    });

    events.clear();
    room->disconnect("carol", At(4000), events);
    assert(Count(events, GameEventType::Paused) == 1);
    room->inspect([](const core::GameSession&, const TurnTimer&,
                     const ReconnectionManager& reconnection) {
        assert(reconnection.pauseState().reason == PauseReason::AllPlayersDisconnect);
        return 0;
    });

    events.clear();
    assert(room->reconnect("alice", At(13000), events).status == ReconnectStatus::Restored);
    room->inspect([](const core::GameSession& session, const TurnTimer& timer,
                     const ReconnectionManager& reconnection) {
        assert(session.phase() == core::GamePhase::Paused);
        assert(reconnection.pauseState().reason == PauseReason::MultipleDisconnects);
        assert(timer.paused());

        const auto& analytics = reconnection.analytics();
        assert(analytics.metrics().total_disconnections == 3);
        assert(analytics.metrics().total_grace_periods == 3);
        assert(analytics.metrics().successful_reconnections == 1);
        assert(analytics.metrics().total_pauses == 1);
        assert(analytics.metrics().pauses_by_reason.at("CURRENT_PLAYER_DISCONNECT") == 1);
        assert(analytics.averageReconnectionMs() == 12000.0);
        assert(analytics.reconnectionSuccessRate() == 100.0);
        assert(analytics.summary()["gracePeriods"]["successful"] == 1);
        return 0;
    });
}

void TestLastConnectedPlayerDropping() {
    auto room = StartedRoom({"alice", "bob"});
    EventQueue events;
    room->disconnect("bob", At(1000), events);
    assert(Count(events, GameEventType::Paused) == 0);

    room->disconnect("alice", At(2000), events);
    assert(Count(events, GameEventType::Paused) == 1);
    room->inspect([](const core::GameSession& session, const TurnTimer& timer,
                     const ReconnectionManager& reconnection) {
        assert(session.phase() == core::GamePhase::Paused);
        assert(reconnection.pauseState().reason == PauseReason::AllPlayersDisconnect);
        assert(reconnection.pauseState().paused_by == "alice");
        assert(timer.paused());
        return 0;
    });
}

void TestLobbyDisconnectRemovesPlayer() {
    GameRoom room("LOBBY1", Settings(), 7u);
    EventQueue events;
    assert(room.join("alice", "Alice", T0, events));
    assert(room.join("bob", "Bob", T0, events));
    room.disconnect("bob", At(10), events);
    assert(!room.hasPlayer("bob"));
    assert(room.participantIds().size() == 1);
}

void TestTooManyAttempts() {
    core::GameOptions options;
    core::GameSession session("TRIES1", options, 3u);
    assert(session.addPlayer("alice", "Alice"));
    assert(session.addPlayer("bob", "Bob"));
    assert(session.startGame());
    TurnTimer timer(core::Millis(60000));
    ConnectionTracker connections;
    RecoveryCoordinator recovery;
    ReconnectionManager manager(session, timer, connections, recovery, ReconnectionSettings{});
    connections.track("alice", T0);
    connections.track("bob", T0);

    assert(connections.transition("alice", ConnectionState::Disconnecting, T0));
    assert(connections.transition("alice", ConnectionState::Disconnected, T0));
    for (int i = 0; i < kMaxReconnectAttempts; ++i) {
        assert(connections.transition("alice", ConnectionState::Reconnecting, T0));
        assert(connections.transition("alice", ConnectionState::Disconnected, T0));
    }

    EventQueue events;
    const auto result = manager.handleReconnect("alice", At(1000), events);
    assert(result.status == ReconnectStatus::TooManyAttempts);
    assert(result.retry_after.count() == 30000);
    assert(events.empty());

    assert(manager.handleReconnect("nobody", At(1000), events).status == ReconnectStatus::NotInGame);
}

void TestBackoff() {
    assert(ReconnectBackoff(0).count() == 2000);
    assert(ReconnectBackoff(1).count() == 2000);
    assert(ReconnectBackoff(2).count() == 4000);
    assert(ReconnectBackoff(4).count() == 16000);
    assert(ReconnectBackoff(5).count() == 30000);
    assert(ReconnectBackoff(40).count() == 30000);
}

void TestVoteTally() {
    ContinuationVote empty("alice", {"bob", "carol"}, At(30000));
    assert(empty.tally() == ContinuationDecision::SkipTurn);
    assert(!empty.complete());
    assert(!empty.timedOut(At(29999)));
    assert(empty.timedOut(At(30000)));

    ContinuationVote tied("alice", {"bob", "carol"}, At(30000));
    assert(tied.cast("bob", ContinuationDecision::AddBot) == VoteStatus::Accepted);
    assert(tied.cast("carol", ContinuationDecision::SkipTurn) == VoteStatus::Accepted);
    assert(tied.complete());
    assert(tied.tally() == ContinuationDecision::SkipTurn);

    ContinuationVote later_tie("alice", {"bob", "carol"}, At(30000));
    later_tie.cast("bob", ContinuationDecision::AddBot);
    later_tie.cast("carol", ContinuationDecision::EndGame);
    assert(later_tie.tally() == ContinuationDecision::AddBot);

    ContinuationVote majority("alice", {"bob", "carol", "dave"}, At(30000));
    majority.cast("bob", ContinuationDecision::EndGame);
    majority.cast("carol", ContinuationDecision::EndGame);
    majority.cast("dave", ContinuationDecision::SkipTurn);
    assert(majority.tally() == ContinuationDecision::EndGame);
    assert(majority.counts().at(ContinuationDecision::EndGame) == 2);
    assert(majority.counts().at(ContinuationDecision::AddBot) == 0);

    assert(majority.cast("alice", ContinuationDecision::AddBot) == VoteStatus::NotEligible);
    assert(majority.cast("bob", ContinuationDecision::AddBot) == VoteStatus::AlreadyVoted);
}

}  // namespace

int main() {
    TestCurrentPlayerDisconnectPreservesTimer();
    TestOtherPlayerDisconnectDoesNotPause();
    TestVoteAddsBotAndRejectsLateReconnect();
    TestVoteTimeoutSkipsPlayer();
    TestReconnectDuringVoteCancelsIt();
    TestDecisionDuringManualPauseKeepsTimerFrozen();
    TestPauseReasonEscalates();
    TestLastConnectedPlayerDropping();
    TestLobbyDisconnectRemovesPlayer();
    TestTooManyAttempts();
    TestBackoff();
    TestVoteTally();
    std::cout << "All reconnection tests passed." << std::endl;
    return 0;
}
