#undef NDEBUG
#include <cassert>
#include <iostream>

#include "rummi/session/ConnectionTracker.hpp"

using namespace rummi;
using namespace rummi::session;

namespace {

const core::TimePoint T0 = core::FromEpochMs(1700000000000);

void TestTransitionTable() {
    using S = ConnectionState;
    assert(IsValidTransition(S::Connected, S::Disconnecting));
    assert(IsValidTransition(S::Connected, S::Reconnecting));
    assert(!IsValidTransition(S::Connected, S::Disconnected));
    assert(IsValidTransition(S::Disconnecting, S::Disconnected));
    assert(IsValidTransition(S::Disconnected, S::Reconnecting));
    assert(IsValidTransition(S::Reconnecting, S::Connected));
    assert(IsValidTransition(S::Disconnected, S::Abandoned));
    assert(IsValidTransition(S::Connected, S::Abandoned));
    assert(!IsValidTransition(S::Abandoned, S::Connected));
    assert(!IsValidTransition(S::Abandoned, S::Reconnecting));
}

void TestTrackerCountsDisconnects() {
    ConnectionTracker tracker;
    assert(!tracker.transition("ghost", ConnectionState::Disconnecting, T0));

    tracker.track("alice", T0);
    assert(tracker.isConnected("alice"));
    assert(!tracker.transition("alice", ConnectionState::Disconnected, T0));
    assert(tracker.isConnected("alice"));

    assert(tracker.transition("alice", ConnectionState::Disconnecting, T0));
    assert(tracker.transition("alice", ConnectionState::Disconnected, T0 + core::Millis(5)));
    const auto* status = tracker.find("alice");
    assert(status->disconnection_count == 1);
    assert(status->disconnected_at_ms == core::ToEpochMs(T0) + 5);

    assert(tracker.transition("alice", ConnectionState::Reconnecting, T0 + core::Millis(10)));
    assert(tracker.find("alice")->reconnection_attempts == 1);
    assert(tracker.transition("alice", ConnectionState::Connected, T0 + core::Millis(20)));
    status = tracker.find("alice");
    assert(status->reconnection_attempts == 0);
    assert(!status->disconnected_at_ms);
    assert(status->disconnection_count == 1);

    assert(tracker.transition("alice", ConnectionState::Abandoned, T0));
    assert(!tracker.transition("alice", ConnectionState::Connected, T0));
    assert(tracker.find("alice")->state == ConnectionState::Abandoned);

    tracker.forget("alice");
    assert(tracker.find("alice") == nullptr);
}

void TestQualityAssessment() {
    ConnectionMetrics metrics;
    metrics.latency_ms = 20;
    assert(AssessQuality(metrics) == ConnectionQuality::Excellent);
    metrics.latency_ms = 100;
    assert(AssessQuality(metrics) == ConnectionQuality::Good);
    metrics.latency_ms = 200;
    assert(AssessQuality(metrics) == ConnectionQuality::Fair);
    metrics.latency_ms = 400;
    assert(AssessQuality(metrics) == ConnectionQuality::Poor);

    metrics.latency_ms = 20;
    metrics.packet_loss = 3.0;
    assert(AssessQuality(metrics) == ConnectionQuality::Fair);
    metrics.packet_loss = 6.0;
    assert(AssessQuality(metrics) == ConnectionQuality::Poor);
}

void TestGraceDurations() {
    const GraceDurations durations;
    ConnectionStatus status;
    status.player_id = "alice";
    assert(GraceDurationFor(status, durations) == durations.standard);

    status.metrics.is_mobile = true;
    assert(GraceDurationFor(status, durations) == durations.mobile);
    status.disconnection_count = 2;
    assert(GraceDurationFor(status, durations) == durations.unstable);

    ConnectionStatus cellular;
    cellular.metrics.network_type = "cellular";
    assert(GraceDurationFor(cellular, durations) == durations.unstable);

    ConnectionStatus fair;
    fair.quality = ConnectionQuality::Fair;
    assert(GraceDurationFor(fair, durations) == durations.mobile);
}

void TestMetricsUpdateQuality() {
    ConnectionTracker tracker;
    tracker.track("bob", T0);
    ConnectionMetrics metrics;
    metrics.latency_ms = 600;
    assert(tracker.updateMetrics("bob", metrics, T0));
    assert(tracker.find("bob")->quality == ConnectionQuality::Poor);
    assert(IsUnstable(*tracker.find("bob")));
    assert(!tracker.updateMetrics("nobody", metrics, T0));

    const auto saved = tracker.statuses();
    ConnectionTracker restored;
    restored.restore(saved);
    assert(*restored.find("bob") == *tracker.find("bob"));
}

void TestNames() {
    assert(ParseConnectionState("DISCONNECTED") == ConnectionState::Disconnected);
    assert(!ParseConnectionState("gone"));
    assert(ParseQuality("fair") == ConnectionQuality::Fair);
}

}  // namespace

int main() {
    TestTransitionTable();
    TestTrackerCountsDisconnects();
    TestQualityAssessment();
    TestGraceDurations();
    TestMetricsUpdateQuality();
    TestNames();
    std::cout << "All connection tracker tests passed." << std::endl;
    return 0;
}
