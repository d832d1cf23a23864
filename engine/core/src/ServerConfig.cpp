#include "rummi/core/ServerConfig.hpp"

namespace rummi::core {

namespace {

void ReadPositive(const Json& json, const char* key, std::int64_t& out) {
    if (json.contains(key) && json[key].is_number_integer() && json[key].get<std::int64_t>() > 0) {
        out = json[key].get<std::int64_t>();
    }
}

void ReadBool(const Json& json, const char* key, bool& out) {
    if (json.contains(key) && json[key].is_boolean()) {
        out = json[key].get<bool>();
    }
}

}  // namespace

Json ServerConfig::ToJson() const {
    Json json;
    json["port"] = port;
    json["turn_duration_ms"] = turn_duration_ms;
    json["timer_enabled"] = timer_enabled;
    json["grace_period_ms"] = grace_period_ms;
    json["grace_period_mobile_ms"] = grace_period_mobile_ms;
    json["grace_period_unstable_ms"] = grace_period_unstable_ms;
    json["vote_timeout_ms"] = vote_timeout_ms;
    json["heartbeat_timeout_ms"] = heartbeat_timeout_ms;
    json["bot_move_delay_ms"] = bot_move_delay_ms;
    json["tick_interval_ms"] = tick_interval_ms;
    json["save_root"] = save_root;
    json["debug_hand"] = debug_hand;
    json["log_verbose"] = log_verbose;
    return json;
}

ServerConfig ServerConfig::FromJson(const Json& json) {
    ServerConfig config;
    if (json.contains("port") && json["port"].is_number_integer()) {
        const int port = json["port"].get<int>();
        if (port > 0 && port <= 65535) {
            config.port = port;
        }
    }
    ReadPositive(json, "turn_duration_ms", config.turn_duration_ms);
    ReadBool(json, "timer_enabled", config.timer_enabled);
    ReadPositive(json, "grace_period_ms", config.grace_period_ms);
    ReadPositive(json, "grace_period_mobile_ms", config.grace_period_mobile_ms);
    ReadPositive(json, "grace_period_unstable_ms", config.grace_period_unstable_ms);
    ReadPositive(json, "vote_timeout_ms", config.vote_timeout_ms);
    ReadPositive(json, "heartbeat_timeout_ms", config.heartbeat_timeout_ms);
    ReadPositive(json, "bot_move_delay_ms", config.bot_move_delay_ms);
    ReadPositive(json, "tick_interval_ms", config.tick_interval_ms);
    if (json.contains("save_root") && json["save_root"].is_string()) {
        config.save_root = json["save_root"].get<std::string>();
    }
    ReadBool(json, "debug_hand", config.debug_hand);
    ReadBool(json, "log_verbose", config.log_verbose);
    return config;
}

std::string ServerConfig::Serialize() const {
    return ToJson().dump(2);
}

ServerConfig ServerConfig::Deserialize(const std::string& json_string) {
    auto json = Json::parse(json_string);
    return FromJson(json);
}

}  // namespace rummi::core
