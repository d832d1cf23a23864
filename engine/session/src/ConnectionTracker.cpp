#include "rummi/session/ConnectionTracker.hpp"

#include <SDL2/SDL.h>

#include <initializer_list>

namespace rummi::session {

const char* ConnectionStateName(ConnectionState state) noexcept {
    switch (state) {
    case ConnectionState::Connected:
        return "CONNECTED";
    case ConnectionState::Disconnecting:
        return "DISCONNECTING";
    case ConnectionState::Reconnecting:
        return "RECONNECTING";
    case ConnectionState::Disconnected:
        return "DISCONNECTED";
    case ConnectionState::Abandoned:
        return "ABANDONED";
    }
    return "CONNECTED";
}

std::optional<ConnectionState> ParseConnectionState(const std::string& name) noexcept {
    for (auto state : {ConnectionState::Connected, ConnectionState::Disconnecting,
                       ConnectionState::Reconnecting, ConnectionState::Disconnected,
                       ConnectionState::Abandoned}) {
        if (name == ConnectionStateName(state)) {
            return state;
        }
    }
    return std::nullopt;
}

const char* QualityName(ConnectionQuality quality) noexcept {
    switch (quality) {
    case ConnectionQuality::Excellent:
        return "excellent";
    case ConnectionQuality::Good:
        return "good";
    case ConnectionQuality::Fair:
        return "fair";
    case ConnectionQuality::Poor:
        return "poor";
    }
    return "good";
}

std::optional<ConnectionQuality> ParseQuality(const std::string& name) noexcept {
    for (auto quality : {ConnectionQuality::Excellent, ConnectionQuality::Good,
                         ConnectionQuality::Fair, ConnectionQuality::Poor}) {
        if (name == QualityName(quality)) {
            return quality;
        }
    }
    return std::nullopt;
}

bool IsValidTransition(ConnectionState from, ConnectionState to) noexcept {
    if (from == ConnectionState::Abandoned) {
        return false;
    }
    if (to == ConnectionState::Abandoned) {
        return true;
    }
    switch (from) {
    case ConnectionState::Connected:
        return to == ConnectionState::Disconnecting || to == ConnectionState::Reconnecting;
    case ConnectionState::Disconnecting:
        return to == ConnectionState::Disconnected || to == ConnectionState::Connected ||
               to == ConnectionState::Reconnecting;
    case ConnectionState::Reconnecting:
        return to == ConnectionState::Connected || to == ConnectionState::Disconnected ||
               to == ConnectionState::Disconnecting;
    case ConnectionState::Disconnected:
        return to == ConnectionState::Reconnecting || to == ConnectionState::Connected;
    case ConnectionState::Abandoned:
        break;
    }
    return false;
}

ConnectionQuality AssessQuality(const ConnectionMetrics& metrics) noexcept {
    ConnectionQuality quality = ConnectionQuality::Poor;
    if (metrics.latency_ms < 50) {
        quality = ConnectionQuality::Excellent;
    } else if (metrics.latency_ms < 150) {
        quality = ConnectionQuality::Good;
    } else if (metrics.latency_ms < 300) {
        quality = ConnectionQuality::Fair;
    }
    if (metrics.packet_loss > 5.0) {
        return ConnectionQuality::Poor;
    }
    if (metrics.packet_loss > 2.0 &&
        (quality == ConnectionQuality::Excellent || quality == ConnectionQuality::Good)) {
        return ConnectionQuality::Fair;
    }
    return quality;
}

bool IsUnstable(const ConnectionStatus& status) noexcept {
    return status.quality == ConnectionQuality::Poor || status.metrics.packet_loss > 5.0 ||
           status.metrics.latency_ms > 500 || status.metrics.network_type == "cellular";
}

core::Millis GraceDurationFor(const ConnectionStatus& status, const GraceDurations& durations) noexcept {
    if (IsUnstable(status) || (status.metrics.is_mobile && status.disconnection_count > 1)) {
        return durations.unstable;
    }
    if (status.metrics.is_mobile || status.quality == ConnectionQuality::Fair) {
        return durations.mobile;
    }
    return durations.standard;
}

ConnectionStatus& ConnectionTracker::track(const std::string& player_id, core::TimePoint now) {
    auto it = statuses_.find(player_id);
    if (it != statuses_.end()) {
        it->second.last_seen_ms = core::ToEpochMs(now);
        return it->second;
    }
    ConnectionStatus status;
    status.player_id = player_id;
    status.last_seen_ms = core::ToEpochMs(now);
    return statuses_.emplace(player_id, std::move(status)).first->second;
}

bool ConnectionTracker::transition(const std::string& player_id, ConnectionState to,
                                   core::TimePoint now) {
    auto it = statuses_.find(player_id);
    if (it == statuses_.end()) {
        return false;
    }
    auto& status = it->second;
    if (status.state == to) {
        return true;
    }
    if (!IsValidTransition(status.state, to)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Refused connection transition %s -> %s for %s",
                    ConnectionStateName(status.state), ConnectionStateName(to), player_id.c_str());
        return false;
    }
    const auto now_ms = core::ToEpochMs(now);
    switch (to) {
    case ConnectionState::Disconnected:
        status.disconnected_at_ms = now_ms;
        ++status.disconnection_count;
        break;
    case ConnectionState::Reconnecting:
        ++status.reconnection_attempts;
        break;
    case ConnectionState::Connected:
        status.disconnected_at_ms.reset();
        status.reconnection_attempts = 0;
        status.last_seen_ms = now_ms;
        break;
    case ConnectionState::Disconnecting:
    case ConnectionState::Abandoned:
        break;
    }
    SDL_LogVerbose(SDL_LOG_CATEGORY_APPLICATION, "Connection %s: %s -> %s", player_id.c_str(),
                   ConnectionStateName(status.state), ConnectionStateName(to));
    status.state = to;
    return true;
}

bool ConnectionTracker::updateMetrics(const std::string& player_id, const ConnectionMetrics& metrics,
                                      core::TimePoint now) {
    auto it = statuses_.find(player_id);
    if (it == statuses_.end()) {
        return false;
    }
    it->second.metrics = metrics;
    it->second.quality = AssessQuality(metrics);
    it->second.last_seen_ms = core::ToEpochMs(now);
    return true;
}

void ConnectionTracker::forget(const std::string& player_id) {
    statuses_.erase(player_id);
}

const ConnectionStatus* ConnectionTracker::find(const std::string& player_id) const {
    auto it = statuses_.find(player_id);
    return it == statuses_.end() ? nullptr : &it->second;
}

bool ConnectionTracker::isConnected(const std::string& player_id) const {
    const auto* status = find(player_id);
    return status != nullptr && status->state == ConnectionState::Connected;
}

std::vector<ConnectionStatus> ConnectionTracker::statuses() const {
    std::vector<ConnectionStatus> out;
    out.reserve(statuses_.size());
    for (const auto& entry : statuses_) {
        out.push_back(entry.second);
    }
    return out;
}

void ConnectionTracker::restore(const std::vector<ConnectionStatus>& statuses) {
    statuses_.clear();
    for (const auto& status : statuses) {
        statuses_[status.player_id] = status;
    }
}

}  // namespace rummi::session
