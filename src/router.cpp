#include "router.hpp"

#include "channel.hpp"
#include "overloaded.hpp"

#include <iostream>

namespace roomlink {

Router::Router(std::shared_ptr<Registry> registry)
    : Registry_(std::move(registry))
{ }

ParticipantId Router::Connect(std::shared_ptr<Channel> channel) {
    auto id = std::to_string(IdGenerator_++);
    Clients_.emplace(id, Client{id, std::nullopt, std::move(channel)});

    std::cout << "[Client " << id << "] Connected" << std::endl;
    Send(id, Hello{id});
    return id;
}

void Router::Disconnect(const ParticipantId& clientId) {
    if (!FindClient(clientId)) {
        return;
    }

    std::cout << "[Client " << clientId << "] Disconnected" << std::endl;
    Leave(clientId);
    Clients_.erase(clientId);
}

void Router::HandleMessage(const ParticipantId& clientId, const std::string& text) {
    Message message;
    try {
        message = Decode(text);
    } catch (const ProtocolError& e) {
        std::cerr << "[Client " << clientId << "] Invalid signaling message: " << e.what() << std::endl;
        return;
    }

    std::visit(Overloaded{
        [&](JoinRoom& m) {
            Join(clientId, m.roomId);
        },
        [&](LeaveRoom&) {
            Leave(clientId);
        },
        [&](SignalMessage& m) {
            Relay(clientId, std::move(m));
        },
        [&](LocationUpdate& m) {
            UpdateLocation(clientId, m);
        },
        [&](auto& m) {
            std::cerr << "[Client " << clientId << "] Unexpected event from client: "
                      << EventName(Message{m}) << std::endl;
        },
    }, message);
}

void Router::Join(const ParticipantId& clientId, const RoomId& roomId) {
    auto client = FindClient(clientId);
    if (!client) {
        return;
    }
    if (roomId.empty()) {
        std::cerr << "[Client " << clientId << "] Join rejected: empty room id" << std::endl;
        return;
    }

    if (client->roomId) {
        Leave(clientId);
    }

    auto& room = Registry_->Join(roomId, clientId);
    client->roomId = roomId;

    // Others learn about the newcomer first; the snapshot to the newcomer
    // never lists itself.
    SendAll(room.ParticipantsExcept(clientId), UserJoined{clientId});
    Send(clientId, RoomState{room.ParticipantsExcept(clientId), room.Locations()});
}

void Router::Leave(const ParticipantId& clientId) {
    auto client = FindClient(clientId);
    if (!client || !client->roomId) {
        return;
    }

    // Cleared before the broadcast so a repeated leave is a no-op.
    RoomId roomId = std::move(*client->roomId);
    client->roomId.reset();

    auto remaining = Registry_->Leave(roomId, clientId);
    SendAll(remaining, UserLeft{clientId});
}

void Router::Relay(const ParticipantId& clientId, SignalMessage message) {
    auto client = FindClient(clientId);
    if (!client) {
        return;
    }

    if (client->roomId != message.roomId) {
        std::cerr << "[Client " << clientId << "] Signal for room " << message.roomId
                  << " rejected, client is in " << client->roomId.value_or("<none>") << std::endl;
        return;
    }

    message.from = clientId;
    auto to = std::move(message.to);
    message.to.reset();

    if (to) {
        if (!FindClient(*to)) {
            std::cerr << "[Client " << clientId << "] Signal target " << *to << " not connected" << std::endl;
            return;
        }
        Send(*to, message);
        return;
    }

    auto room = Registry_->Find(message.roomId);
    if (!room) {
        std::cerr << "[Client " << clientId << "] Signal for missing room " << message.roomId << std::endl;
        return;
    }
    SendAll(room->ParticipantsExcept(clientId), message);
}

void Router::UpdateLocation(const ParticipantId& clientId, const LocationUpdate& update) {
    auto client = FindClient(clientId);
    if (!client || client->roomId != update.roomId) {
        return;
    }

    auto room = Registry_->Find(update.roomId);
    if (!room) {
        return;
    }

    room->SetLocation(clientId, update.position);
    SendAll(room->ParticipantsExcept(clientId),
            LocationUpdate{update.roomId, clientId, update.position});
}

std::optional<RoomId> Router::RoomOf(const ParticipantId& clientId) const {
    auto it = Clients_.find(clientId);
    if (it == Clients_.end()) {
        return std::nullopt;
    }
    return it->second.roomId;
}

std::vector<ParticipantId> Router::Members(const RoomId& roomId) const {
    auto room = Registry_->Find(roomId);
    return room ? room->Participants() : std::vector<ParticipantId>{};
}

std::vector<LocationEntry> Router::Locations(const RoomId& roomId) const {
    auto room = Registry_->Find(roomId);
    return room ? room->Locations() : std::vector<LocationEntry>{};
}

Router::Client* Router::FindClient(const ParticipantId& clientId) {
    auto it = Clients_.find(clientId);
    return it == Clients_.end() ? nullptr : &it->second;
}

void Router::Send(const ParticipantId& to, const Message& message) {
    auto client = FindClient(to);
    if (!client) {
        return;
    }
    client->channel->Send(Encode(message));
}

void Router::SendAll(const std::vector<ParticipantId>& targets, const Message& message) {
    if (targets.empty()) {
        return;
    }

    auto text = Encode(message);
    for (const auto& id : targets) {
        if (auto client = FindClient(id)) {
            client->channel->Send(text);
        }
    }
}

} // namespace roomlink
