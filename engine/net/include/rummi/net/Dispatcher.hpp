#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "rummi/core/Clock.hpp"
#include "rummi/net/Protocol.hpp"
#include "rummi/persistence/GameStatePersistence.hpp"
#include "rummi/session/GameRegistry.hpp"
#include "rummi/session/Recovery.hpp"

namespace rummi::net {

using Outbox = std::vector<OutboundMessage>;

// Maps client transports to players, turns inbound messages into room
// operations and room events into per-client outbound messages.
class Dispatcher {
public:
    Dispatcher(session::GameRegistry& registry, persistence::GameStatePersistence* persistence,
               core::Millis heartbeat_timeout);

    Outbox handle(const std::string& client_key, const std::string& text, core::TimePoint now);
    Outbox handleMessage(const std::string& client_key, const InboundMessage& message,
                         core::TimePoint now);

    // Transport gone: the bound player enters the disconnect flow.
    Outbox onTransportClosed(const std::string& client_key, core::TimePoint now);
    // A datagram to the client could not be sent. Repeated failures close the transport.
    Outbox onSendFailed(const std::string& client_key, core::TimePoint now);

    // Ticks every room, closes silent clients and drops finished games.
    Outbox tick(core::TimePoint now);

    // Loads every stored game into the registry. Returns the number restored.
    std::size_t restoreSavedGames(core::TimePoint now);

    std::optional<std::string> playerOf(const std::string& client_key) const;
    std::optional<std::string> clientOf(const std::string& player_id) const;

private:
    using Room = std::shared_ptr<session::GameRoom>;

    Outbox createGame(const std::string& client_key, const core::Json& body, core::TimePoint now);
    Outbox joinGame(const std::string& client_key, const core::Json& body, core::TimePoint now);
    Outbox reconnect(const std::string& client_key, const core::Json& body, core::TimePoint now);
    Outbox leave(const std::string& client_key, const std::string& player_id, const Room& room,
                 core::TimePoint now);
    Outbox roomAction(const std::string& client_key, const InboundMessage& message,
                      const std::string& player_id, const Room& room, core::TimePoint now);

    Room findOrRestore(const std::string& game_id, const std::string& client_key,
                       const std::string& player_id, core::TimePoint now, Outbox& out);
    void recoverForClient(session::FailureKind kind, const session::FailureContext& context,
                          const std::string& client_key, core::TimePoint now, Outbox& out);

    void bind(const std::string& client_key, const std::string& player_id);
    void unbind(const std::string& client_key);
    void deliver(const Room& room, const session::EventQueue& events, core::TimePoint now,
                 Outbox& out) const;
    void sendTo(const std::string& player_id, core::Json body, Outbox& out) const;
    void persist(const Room& room, core::TimePoint now);

    session::GameRegistry& registry_;
    persistence::GameStatePersistence* persistence_;
    core::Millis heartbeat_timeout_;
    session::RecoveryCoordinator recovery_;
    std::map<std::string, std::string> client_players_;
    std::map<std::string, std::string> player_clients_;
    std::map<std::string, core::TimePoint> last_seen_;
};

}  // namespace rummi::net
