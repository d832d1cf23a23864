#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "rummi/core/Clock.hpp"

namespace rummi::session {

enum class ConnectionState { Connected, Disconnecting, Reconnecting, Disconnected, Abandoned };
enum class ConnectionQuality { Excellent, Good, Fair, Poor };

const char* ConnectionStateName(ConnectionState state) noexcept;
std::optional<ConnectionState> ParseConnectionState(const std::string& name) noexcept;
const char* QualityName(ConnectionQuality quality) noexcept;
std::optional<ConnectionQuality> ParseQuality(const std::string& name) noexcept;

struct ConnectionMetrics {
    int latency_ms = 0;
    double packet_loss = 0.0;
    bool is_mobile = false;
    std::string network_type;

    bool operator==(const ConnectionMetrics& other) const {
        return latency_ms == other.latency_ms && packet_loss == other.packet_loss &&
               is_mobile == other.is_mobile && network_type == other.network_type;
    }
};

struct ConnectionStatus {
    std::string player_id;
    ConnectionState state = ConnectionState::Connected;
    std::int64_t last_seen_ms = 0;
    std::optional<std::int64_t> disconnected_at_ms;
    int reconnection_attempts = 0;
    int disconnection_count = 0;
    ConnectionMetrics metrics;
    ConnectionQuality quality = ConnectionQuality::Good;

    bool operator==(const ConnectionStatus& other) const {
        return player_id == other.player_id && state == other.state &&
               last_seen_ms == other.last_seen_ms &&
               disconnected_at_ms == other.disconnected_at_ms &&
               reconnection_attempts == other.reconnection_attempts &&
               disconnection_count == other.disconnection_count && metrics == other.metrics &&
               quality == other.quality;
    }
};

struct GraceDurations {
    core::Millis standard{180000};
    core::Millis mobile{240000};
    core::Millis unstable{300000};
};

bool IsValidTransition(ConnectionState from, ConnectionState to) noexcept;
ConnectionQuality AssessQuality(const ConnectionMetrics& metrics) noexcept;
bool IsUnstable(const ConnectionStatus& status) noexcept;
core::Millis GraceDurationFor(const ConnectionStatus& status, const GraceDurations& durations) noexcept;

class ConnectionTracker {
public:
    ConnectionStatus& track(const std::string& player_id, core::TimePoint now);
    bool transition(const std::string& player_id, ConnectionState to, core::TimePoint now);
    bool updateMetrics(const std::string& player_id, const ConnectionMetrics& metrics,
                       core::TimePoint now);
    void forget(const std::string& player_id);

    const ConnectionStatus* find(const std::string& player_id) const;
    bool isConnected(const std::string& player_id) const;

    std::vector<ConnectionStatus> statuses() const;
    void restore(const std::vector<ConnectionStatus>& statuses);

private:
    std::map<std::string, ConnectionStatus> statuses_;
};

}  // namespace rummi::session
