#pragma once

#include <cstdint>
#include <string>

#include "rummi/core/Json.hpp"

namespace rummi::core {

struct ServerConfig {
    int port = 7777;
    std::int64_t turn_duration_ms = 120000;
    bool timer_enabled = true;
    std::int64_t grace_period_ms = 180000;
    std::int64_t grace_period_mobile_ms = 240000;
    std::int64_t grace_period_unstable_ms = 300000;
    std::int64_t vote_timeout_ms = 30000;
    std::int64_t heartbeat_timeout_ms = 15000;
    std::int64_t bot_move_delay_ms = 1500;
    std::int64_t tick_interval_ms = 250;
    std::string save_root;
    bool debug_hand = false;
    bool log_verbose = false;

    Json ToJson() const;
    static ServerConfig FromJson(const Json& json);

    std::string Serialize() const;
    static ServerConfig Deserialize(const std::string& json_string);
};

}  // namespace rummi::core
