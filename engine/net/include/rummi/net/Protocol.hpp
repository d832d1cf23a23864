#pragma once

#include <optional>
#include <string>
#include <vector>

#include "rummi/core/ActionResult.hpp"
#include "rummi/core/GameSession.hpp"
#include "rummi/core/Json.hpp"
#include "rummi/session/ConnectionTracker.hpp"

namespace rummi::net {

// Upper bound for one datagram, in either direction.
inline constexpr std::size_t kMaxMessageSize = 65000;

struct InboundMessage {
    std::string type;
    core::Json body = core::Json::object();
};

struct OutboundMessage {
    std::string client_key;
    core::Json body;
};

// Returns nullopt and fills error when the text is not a JSON object with a string type.
std::optional<InboundMessage> ParseInbound(const std::string& text, std::string& error);
std::string EncodeOutbound(const core::Json& body);

core::Json ErrorMessage(core::RejectionKind kind, const std::string& reason);
core::Json ErrorMessage(const std::string& kind, const std::string& reason);
core::Json RedirectMessage(const std::string& reason, const std::string& destination = "lobby");

// Field readers. They throw std::invalid_argument when a required field is missing or mistyped.
std::string ReadString(const core::Json& body, const char* key);
std::vector<std::string> ReadTileIds(const core::Json& body, const char* key);
// "new" or a missing target means a new set; otherwise a board index.
core::SetTarget ReadTarget(const core::Json& body);
core::GameOptions ReadGameOptions(const core::Json& body, core::GameOptions defaults);
session::ConnectionMetrics ReadMetrics(const core::Json& body);

}  // namespace rummi::net
