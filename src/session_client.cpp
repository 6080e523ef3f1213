#include "session_client.hpp"

#include "channel.hpp"
#include "display.hpp"
#include "overloaded.hpp"

#include <iostream>
#include <iterator>

namespace roomlink {

namespace {

constexpr size_t MaxQueuedSignalsPerPeer = 64;

std::string TrimRoomName(const std::string& name) {
    auto begin = name.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = name.find_last_not_of(" \t\r\n");
    return name.substr(begin, end - begin + 1);
}

} // namespace

SessionClient::SessionClient(Loop& loop, std::shared_ptr<Channel> channel, TransportFactory transportFactory,
                             Collaborators collaborators, LinkConfig linkConfig)
    : Loop_(loop)
    , Channel_(std::move(channel))
    , TransportFactory_(std::move(transportFactory))
    , Collaborators_(collaborators)
    , LinkConfig_(linkConfig)
{ }

SessionClient::~SessionClient() {
    for (auto& [id, link] : Peers_) {
        link->Close();
    }
}

void SessionClient::HandleMessage(const std::string& text) {
    Message message;
    try {
        message = Decode(text);
    } catch (const ProtocolError& e) {
        std::cerr << "Invalid message from server: " << e.what() << std::endl;
        return;
    }

    std::visit(Overloaded{
        [&](const Hello& m) {
            LocalId_ = m.userId;
            std::cout << "Connected as " << LocalId_ << std::endl;
        },
        [&](const RoomState& m) {
            HandleRoomState(m);
        },
        [&](const UserJoined& m) {
            HandleUserJoined(m.userId);
        },
        [&](const UserLeft& m) {
            HandleUserLeft(m.userId);
        },
        [&](const SignalMessage& m) {
            HandleSignal(m);
        },
        [&](const LocationUpdate& m) {
            HandleLocation(m);
        },
        [&](const auto& m) {
            std::cerr << "Unexpected event from server: " << EventName(Message{m}) << std::endl;
        },
    }, message);
}

void SessionClient::HandleDisconnect() {
    std::cout << "Disconnected from server" << std::endl;
    ResetRoom();
    RoomId_.reset();
}

bool SessionClient::JoinRoom(const std::string& name) {
    auto roomId = TrimRoomName(name);
    if (roomId.empty()) {
        std::cerr << "Please enter a room name" << std::endl;
        return false;
    }

    if (RoomId_) {
        ResetRoom();
    }

    RoomId_ = roomId;
    Send(roomlink::JoinRoom{roomId});
    std::cout << "Joining room: " << roomId << std::endl;
    return true;
}

void SessionClient::LeaveRoom() {
    if (!RoomId_) {
        return;
    }

    ResetRoom();
    Send(roomlink::LeaveRoom{});
    std::cout << "Left room: " << *RoomId_ << std::endl;
    RoomId_.reset();
}

bool SessionClient::StartLocalMedia() {
    if (LocalStream_) {
        return true;
    }
    if (!Collaborators_.media) {
        std::cerr << "No local media source configured" << std::endl;
        return false;
    }

    try {
        LocalStream_ = Collaborators_.media->Acquire();
    } catch (const MediaAcquisitionError& e) {
        std::cerr << "Error accessing local media: " << e.what() << std::endl;
        return false;
    }
    if (!LocalStream_) {
        std::cerr << "Local media source returned no stream" << std::endl;
        return false;
    }

    std::cout << "Local media ready (" << LocalStream_->tracks.size() << " tracks)" << std::endl;

    // Peers that reached us first get their link now, then every member
    // still without a negotiated link is offered to.
    if (RoomId_) {
        ReplayQueuedSignals();
        for (const auto& member : Members_) {
            if (member != LocalId_) {
                OfferTo(member);
            }
        }
    }
    return true;
}

void SessionClient::PublishLocation(LatLng position) {
    if (!RoomId_) {
        return;
    }

    Send(LocationUpdate{*RoomId_, std::nullopt, position});
}

std::shared_ptr<PeerLink> SessionClient::Link(const ParticipantId& remoteId) const {
    auto it = Peers_.find(remoteId);
    return it == Peers_.end() ? nullptr : it->second;
}

size_t SessionClient::QueuedSignalCount(const ParticipantId& remoteId) const {
    auto it = QueuedSignals_.find(remoteId);
    return it == QueuedSignals_.end() ? 0 : it->second.size();
}

void SessionClient::HandleRoomState(const RoomState& state) {
    if (!RoomId_) {
        std::cerr << "Room state received outside of a room" << std::endl;
        return;
    }

    std::cout << "Room state: " << state.users.size() << " other users, "
              << state.locations.size() << " locations" << std::endl;

    Members_.clear();
    for (const auto& user : state.users) {
        if (user != LocalId_) {
            Members_.insert(user);
        }
    }
    if (!LocalId_.empty()) {
        Members_.insert(LocalId_);
    }

    for (auto it = Peers_.begin(); it != Peers_.end();) {
        if (Members_.count(it->first)) {
            ++it;
            continue;
        }
        it->second->Close();
        it = Peers_.erase(it);
    }
    for (auto it = QueuedSignals_.begin(); it != QueuedSignals_.end();) {
        it = Members_.count(it->first) ? std::next(it) : QueuedSignals_.erase(it);
    }

    if (MediaReady()) {
        for (const auto& user : state.users) {
            if (user != LocalId_) {
                OfferTo(user);
            }
        }
    }

    if (Collaborators_.locations) {
        for (const auto& entry : state.locations) {
            Collaborators_.locations->Upsert(entry.userId, entry.position);
        }
    }
}

void SessionClient::HandleUserJoined(const ParticipantId& userId) {
    if (userId == LocalId_) {
        return;
    }

    std::cout << "User joined: " << userId << std::endl;
    Members_.insert(userId);

    if (MediaReady()) {
        OfferTo(userId);
    } else {
        std::cout << "[Peer " << userId << "] Pending until local media is ready" << std::endl;
    }
}

void SessionClient::HandleUserLeft(const ParticipantId& userId) {
    std::cout << "User left: " << userId << std::endl;
    Members_.erase(userId);
    QueuedSignals_.erase(userId);
    RemovePeer(userId);

    if (Collaborators_.locations) {
        Collaborators_.locations->Remove(userId);
    }
    if (Collaborators_.videos) {
        Collaborators_.videos->Remove(userId);
    }
}

void SessionClient::HandleSignal(const SignalMessage& message) {
    if (!RoomId_ || message.roomId != *RoomId_) {
        std::cerr << "Dropping signal for room " << message.roomId << std::endl;
        return;
    }
    if (message.from.empty() || message.from == LocalId_) {
        std::cerr << "Dropping signal with bad sender '" << message.from << "'" << std::endl;
        return;
    }

    Signal signal;
    try {
        signal = DecodeSignal(message.signal);
    } catch (const ProtocolError& e) {
        std::cerr << "[Peer " << message.from << "] Invalid signal: " << e.what() << std::endl;
        return;
    }

    // The router only forwards signals from members of our room.
    auto link = Link(message.from);
    if (!link) {
        Members_.insert(message.from);
        if (!MediaReady()) {
            QueueSignal(message.from, signal);
            return;
        }
        link = EnsureLink(message.from);
        if (!link) {
            return;
        }
    }

    link->HandleSignal(signal);
}

void SessionClient::HandleLocation(const LocationUpdate& update) {
    if (!update.userId || !RoomId_ || update.roomId != *RoomId_) {
        return;
    }

    if (Collaborators_.locations) {
        Collaborators_.locations->Upsert(*update.userId, update.position);
    }
}

std::shared_ptr<PeerLink> SessionClient::EnsureLink(const ParticipantId& remoteId) {
    if (remoteId == LocalId_) {
        std::cerr << "Refusing peer link to self" << std::endl;
        return nullptr;
    }
    if (auto existing = Link(remoteId)) {
        return existing;
    }

    PeerLink::Callbacks callbacks;
    callbacks.sendSignal = [this](const ParticipantId& to, const Signal& signal) {
        SendSignal(to, signal);
    };
    callbacks.remoteTrack = [this](const ParticipantId& remote, const RemoteTrack& track) {
        if (Collaborators_.videos) {
            Collaborators_.videos->Upsert(remote, track);
        }
    };
    callbacks.stateChanged = [this](const ParticipantId& remote, LinkState state) {
        if (LinkStateCallback_) {
            LinkStateCallback_(remote, state);
        }
    };

    std::shared_ptr<PeerLink> link;
    try {
        link = PeerLink::Create(LocalId_, remoteId, TransportFactory_(), LocalStream_, Loop_, LinkConfig_,
                                std::move(callbacks));
    } catch (const std::exception& e) {
        std::cerr << "[Peer " << remoteId << "] Failed to create peer link: " << e.what() << std::endl;
        return nullptr;
    }

    Peers_.emplace(remoteId, link);
    return link;
}

void SessionClient::OfferTo(const ParticipantId& remoteId) {
    auto link = EnsureLink(remoteId);
    if (link && !link->Negotiated() && link->State() == LinkState::Idle) {
        link->Offer();
    }
}

void SessionClient::RemovePeer(const ParticipantId& remoteId) {
    auto it = Peers_.find(remoteId);
    if (it == Peers_.end()) {
        return;
    }

    it->second->Close();
    Peers_.erase(it);
}

void SessionClient::QueueSignal(const ParticipantId& from, const Signal& signal) {
    auto& queue = QueuedSignals_[from];
    if (queue.size() >= MaxQueuedSignalsPerPeer) {
        std::cerr << "[Peer " << from << "] Too many signals before local media, dropping "
                  << SignalTypeName(signal.type) << std::endl;
        return;
    }

    queue.push_back(signal);
    std::cout << "[Peer " << from << "] Holding " << SignalTypeName(signal.type)
              << " until local media is ready" << std::endl;
}

void SessionClient::ReplayQueuedSignals() {
    auto queued = std::move(QueuedSignals_);
    QueuedSignals_.clear();

    for (auto& [remoteId, signals] : queued) {
        auto link = EnsureLink(remoteId);
        if (!link) {
            continue;
        }
        std::cout << "[Peer " << remoteId << "] Replaying " << signals.size() << " held signals" << std::endl;
        for (const auto& signal : signals) {
            link->HandleSignal(signal);
        }
    }
}

void SessionClient::ResetRoom() {
    for (auto& [id, link] : Peers_) {
        link->Close();
    }
    Peers_.clear();
    QueuedSignals_.clear();

    for (const auto& member : Members_) {
        if (member == LocalId_) {
            continue;
        }
        if (Collaborators_.locations) {
            Collaborators_.locations->Remove(member);
        }
        if (Collaborators_.videos) {
            Collaborators_.videos->Remove(member);
        }
    }
    Members_.clear();
}

void SessionClient::SendSignal(const ParticipantId& to, const Signal& signal) {
    if (!RoomId_) {
        return;
    }

    Send(SignalMessage{*RoomId_, LocalId_, to, EncodeSignal(signal)});
}

void SessionClient::Send(const Message& message) {
    Channel_->Send(Encode(message));
}

} // namespace roomlink
