#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "rummi/core/Clock.hpp"
#include "rummi/core/Json.hpp"
#include "rummi/session/Continuation.hpp"
#include "rummi/session/ConnectionTracker.hpp"

namespace rummi::session {

struct AnalyticsMetrics {
    int total_disconnections = 0;
    int mobile_disconnections = 0;
    std::map<std::string, int> disconnections_by_quality;
    std::map<std::string, int> disconnections_by_network;

    int reconnection_attempts = 0;
    int successful_reconnections = 0;
    int failed_reconnections = 0;
    std::int64_t total_reconnection_ms = 0;

    int total_pauses = 0;
    std::map<std::string, int> pauses_by_reason;
    int finished_pauses = 0;
    std::int64_t total_pause_ms = 0;

    int total_grace_periods = 0;
    int expired_grace_periods = 0;
    int successful_grace_periods = 0;

    int continuation_decisions = 0;
    std::map<std::string, int> decisions_by_type;
};

// Per-game disconnect and recovery statistics. Kept in memory only.
class ReconnectionAnalytics {
public:
    void recordDisconnect(const ConnectionStatus& status);
    // disconnected_for is how long the player was away; ignored for failures.
    void recordReconnect(bool success, core::Millis disconnected_for);
    void recordPause(const std::string& reason);
    void recordResume(core::Millis paused_for);
    void recordGracePeriodStarted();
    void recordGracePeriodExpired();
    void recordGracePeriodRecovered();
    void recordDecision(ContinuationDecision decision);

    // Percentages in [0, 100]; zero when nothing was recorded.
    double reconnectionSuccessRate() const noexcept;
    double gracePeriodSuccessRate() const noexcept;
    double mobileDisconnectionRate() const noexcept;
    double averageReconnectionMs() const noexcept;
    double averagePauseMs() const noexcept;

    const AnalyticsMetrics& metrics() const noexcept { return metrics_; }
    core::Json summary() const;

private:
    AnalyticsMetrics metrics_;
};

}  // namespace rummi::session
