#include "rummi/session/ReconnectionAnalytics.hpp"

#include <algorithm>

namespace rummi::session {

namespace {

double Percent(int part, int total) noexcept {
    return total == 0 ? 0.0 : 100.0 * part / total;
}

core::Json CountsJson(const std::map<std::string, int>& counts) {
    core::Json json = core::Json::object();
    for (const auto& entry : counts) {
        json[entry.first] = entry.second;
    }
    return json;
}

}  // namespace

void ReconnectionAnalytics::recordDisconnect(const ConnectionStatus& status) {
    ++metrics_.total_disconnections;
    if (status.metrics.is_mobile) {
        ++metrics_.mobile_disconnections;
    }
    ++metrics_.disconnections_by_quality[QualityName(status.quality)];
    const std::string network =
        status.metrics.network_type.empty() ? "unknown" : status.metrics.network_type;
    ++metrics_.disconnections_by_network[network];
}

void ReconnectionAnalytics::recordReconnect(bool success, core::Millis disconnected_for) {
    ++metrics_.reconnection_attempts;
    if (!success) {
        ++metrics_.failed_reconnections;
        return;
    }
    ++metrics_.successful_reconnections;
    metrics_.total_reconnection_ms += std::max<std::int64_t>(0, disconnected_for.count());
}

void ReconnectionAnalytics::recordPause(const std::string& reason) {
    ++metrics_.total_pauses;
    ++metrics_.pauses_by_reason[reason];
}

void ReconnectionAnalytics::recordResume(core::Millis paused_for) {
    ++metrics_.finished_pauses;
    metrics_.total_pause_ms += std::max<std::int64_t>(0, paused_for.count());
}

void ReconnectionAnalytics::recordGracePeriodStarted() {
    ++metrics_.total_grace_periods;
}

void ReconnectionAnalytics::recordGracePeriodExpired() {
    ++metrics_.expired_grace_periods;
}

void ReconnectionAnalytics::recordGracePeriodRecovered() {
    ++metrics_.successful_grace_periods;
}

void ReconnectionAnalytics::recordDecision(ContinuationDecision decision) {
    ++metrics_.continuation_decisions;
    ++metrics_.decisions_by_type[DecisionName(decision)];
}

double ReconnectionAnalytics::reconnectionSuccessRate() const noexcept {
    return Percent(metrics_.successful_reconnections, metrics_.reconnection_attempts);
}

double ReconnectionAnalytics::gracePeriodSuccessRate() const noexcept {
    return Percent(metrics_.successful_grace_periods, metrics_.total_grace_periods);
}

double ReconnectionAnalytics::mobileDisconnectionRate() const noexcept {
    return Percent(metrics_.mobile_disconnections, metrics_.total_disconnections);
}

double ReconnectionAnalytics::averageReconnectionMs() const noexcept {
    if (metrics_.successful_reconnections == 0) {
        return 0.0;
    }
    return static_cast<double>(metrics_.total_reconnection_ms) / metrics_.successful_reconnections;
}

double ReconnectionAnalytics::averagePauseMs() const noexcept {
    if (metrics_.finished_pauses == 0) {
        return 0.0;
    }
    return static_cast<double>(metrics_.total_pause_ms) / metrics_.finished_pauses;
}

core::Json ReconnectionAnalytics::summary() const {
    core::Json json;
    json["overview"] = {{"totalDisconnections", metrics_.total_disconnections},
                        {"totalReconnectionAttempts", metrics_.reconnection_attempts},
                        {"reconnectionSuccessRate", reconnectionSuccessRate()},
                        {"totalPauses", metrics_.total_pauses},
                        {"totalGracePeriods", metrics_.total_grace_periods},
                        {"gracePeriodSuccessRate", gracePeriodSuccessRate()}};
    json["disconnections"] = {{"byConnectionQuality", CountsJson(metrics_.disconnections_by_quality)},
                              {"byNetworkType", CountsJson(metrics_.disconnections_by_network)},
                              {"mobileDisconnectionRate", mobileDisconnectionRate()}};
    json["reconnections"] = {{"successfulReconnections", metrics_.successful_reconnections},
                             {"failedReconnections", metrics_.failed_reconnections},
                             {"averageReconnectionTime", averageReconnectionMs()}};
    json["pauses"] = {{"totalPauses", metrics_.total_pauses},
                      {"byReason", CountsJson(metrics_.pauses_by_reason)},
                      {"averagePauseDuration", averagePauseMs()}};
    json["gracePeriods"] = {{"total", metrics_.total_grace_periods},
                            {"expired", metrics_.expired_grace_periods},
                            {"successful", metrics_.successful_grace_periods}};
    json["continuations"] = {{"total", metrics_.continuation_decisions},
                             {"byType", CountsJson(metrics_.decisions_by_type)}};
    return json;
}

}  // namespace rummi::session
