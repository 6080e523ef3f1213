#pragma once

#include "fwd.hpp"
#include "protocol.hpp"
#include "registry.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace roomlink {

// Relay coordinator: owns room membership and forwards signaling and
// location messages between connected participants. Not thread safe; the
// server calls every method from its Loop.
class Router {
public:
    explicit Router(std::shared_ptr<Registry> registry);

    ParticipantId Connect(std::shared_ptr<Channel> channel);
    void Disconnect(const ParticipantId& clientId);

    // Decodes one inbound frame and dispatches it. Malformed frames are
    // logged and dropped.
    void HandleMessage(const ParticipantId& clientId, const std::string& text);

    void Join(const ParticipantId& clientId, const RoomId& roomId);
    void Leave(const ParticipantId& clientId);
    void Relay(const ParticipantId& clientId, SignalMessage message);
    void UpdateLocation(const ParticipantId& clientId, const LocationUpdate& update);

    std::optional<RoomId> RoomOf(const ParticipantId& clientId) const;

    // Empty for a room that does not exist.
    std::vector<ParticipantId> Members(const RoomId& roomId) const;
    std::vector<LocationEntry> Locations(const RoomId& roomId) const;

    size_t RoomCount() const {
        return Registry_->RoomCount();
    }

    size_t ClientCount() const {
        return Clients_.size();
    }

private:
    struct Client {
        ParticipantId id;
        std::optional<RoomId> roomId;
        std::shared_ptr<Channel> channel;
    };

    Client* FindClient(const ParticipantId& clientId);
    void Send(const ParticipantId& to, const Message& message);
    void SendAll(const std::vector<ParticipantId>& targets, const Message& message);

private:
    std::atomic_uint64_t IdGenerator_{1};
    std::unordered_map<ParticipantId, Client> Clients_;
    std::shared_ptr<Registry> Registry_;
};

} // namespace roomlink
