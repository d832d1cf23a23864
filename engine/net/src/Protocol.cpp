#include "rummi/net/Protocol.hpp"

#include <stdexcept>

namespace rummi::net {

std::optional<InboundMessage> ParseInbound(const std::string& text, std::string& error) {
    if (text.size() > kMaxMessageSize) {
        error = "Message too long";
        return std::nullopt;
    }
    core::Json json = core::Json::parse(text, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        error = "Cannot parse message";
        return std::nullopt;
    }
    if (!json.contains("type") || !json["type"].is_string()) {
        error = "Message has no type";
        return std::nullopt;
    }
    InboundMessage message;
    message.type = json["type"].get<std::string>();
    message.body = std::move(json);
    return message;
}

std::string EncodeOutbound(const core::Json& body) {
    return body.dump();
}

core::Json ErrorMessage(core::RejectionKind kind, const std::string& reason) {
    return ErrorMessage(core::RejectionKindName(kind), reason);
}

core::Json ErrorMessage(const std::string& kind, const std::string& reason) {
    return {{"type", "error"}, {"kind", kind}, {"reason", reason}};
}

core::Json RedirectMessage(const std::string& reason, const std::string& destination) {
    return {{"type", "redirect"}, {"to", destination}, {"reason", reason}};
}

std::string ReadString(const core::Json& body, const char* key) {
    if (!body.contains(key) || !body[key].is_string() || body[key].get<std::string>().empty()) {
        throw std::invalid_argument(std::string("missing field ") + key);
    }
    return body[key].get<std::string>();
}

std::vector<std::string> ReadTileIds(const core::Json& body, const char* key) {
    if (!body.contains(key) || !body[key].is_array()) {
        throw std::invalid_argument(std::string("missing tile list ") + key);
    }
    std::vector<std::string> ids;
    for (const auto& entry : body[key]) {
        if (!entry.is_string()) {
            throw std::invalid_argument("tile ids must be strings");
        }
        ids.push_back(entry.get<std::string>());
    }
    return ids;
}

core::SetTarget ReadTarget(const core::Json& body) {
    if (!body.contains("target") || body["target"].is_null()) {
        return core::kNewSet;
    }
    const auto& target = body["target"];
    if (target.is_string() && target.get<std::string>() == "new") {
        return core::kNewSet;
    }
    if (target.is_number_unsigned() ||
        (target.is_number_integer() && target.get<std::int64_t>() >= 0)) {
        return target.get<std::size_t>();
    }
    throw std::invalid_argument("target must be \"new\" or a set index");
}

core::GameOptions ReadGameOptions(const core::Json& body, core::GameOptions defaults) {
    if (!body.contains("options") || !body["options"].is_object()) {
        return defaults;
    }
    const auto& options = body["options"];
    defaults.debug_hand = options.value("debugHand", defaults.debug_hand);
    defaults.timer_enabled = options.value("timerEnabled", defaults.timer_enabled);
    defaults.turn_duration_ms = options.value("turnDurationMs", defaults.turn_duration_ms);
    defaults.bot_difficulty = options.value("botDifficulty", defaults.bot_difficulty);
    if (defaults.turn_duration_ms <= 0) {
        throw std::invalid_argument("turnDurationMs must be positive");
    }
    return defaults;
}

session::ConnectionMetrics ReadMetrics(const core::Json& body) {
    session::ConnectionMetrics metrics;
    metrics.latency_ms = body.value("latency", 0);
    metrics.packet_loss = body.value("packetLoss", 0.0);
    metrics.is_mobile = body.value("isMobile", false);
    metrics.network_type = body.value("networkType", std::string());
    return metrics;
}

}  // namespace rummi::net
