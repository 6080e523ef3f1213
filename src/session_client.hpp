#pragma once

#include "fwd.hpp"
#include "media.hpp"
#include "peer_link.hpp"
#include "protocol.hpp"
#include "transport.hpp"

#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace roomlink {

class LocationDisplay;
class VideoDisplay;

// Per-participant controller: tracks room membership as reported by the
// router and keeps one PeerLink per other member. Not thread safe; every
// call, including those from signaling, media and geolocation producers,
// must be posted onto the Loop given at construction.
class SessionClient {
public:
    struct Collaborators {
        LocalMediaSource* media = nullptr;
        LocationDisplay* locations = nullptr;
        VideoDisplay* videos = nullptr;
    };

    using LinkStateCallback = std::function<void(const ParticipantId& remoteId, LinkState state)>;

    SessionClient(Loop& loop, std::shared_ptr<Channel> channel, TransportFactory transportFactory,
                  Collaborators collaborators, LinkConfig linkConfig = {});
    ~SessionClient();

    SessionClient(const SessionClient&) = delete;
    SessionClient& operator=(const SessionClient&) = delete;

    void HandleMessage(const std::string& text);
    // The signaling connection is gone: every link is torn down.
    void HandleDisconnect();

    // Trims the name; returns false for an empty one.
    bool JoinRoom(const std::string& name);
    void LeaveRoom();

    // Returns false when the media source cannot deliver.
    bool StartLocalMedia();

    void PublishLocation(LatLng position);

    void OnLinkStateChange(LinkStateCallback callback) {
        LinkStateCallback_ = std::move(callback);
    }

    const ParticipantId& LocalId() const {
        return LocalId_;
    }

    const std::optional<RoomId>& CurrentRoom() const {
        return RoomId_;
    }

    const std::set<ParticipantId>& Members() const {
        return Members_;
    }

    bool MediaReady() const {
        return static_cast<bool>(LocalStream_);
    }

    std::shared_ptr<PeerLink> Link(const ParticipantId& remoteId) const;

    size_t LinkCount() const {
        return Peers_.size();
    }

    size_t QueuedSignalCount(const ParticipantId& remoteId) const;

private:
    void HandleRoomState(const RoomState& state);
    void HandleUserJoined(const ParticipantId& userId);
    void HandleUserLeft(const ParticipantId& userId);
    void HandleSignal(const SignalMessage& message);
    void HandleLocation(const LocationUpdate& update);

    std::shared_ptr<PeerLink> EnsureLink(const ParticipantId& remoteId);
    void OfferTo(const ParticipantId& remoteId);
    void RemovePeer(const ParticipantId& remoteId);
    void ResetRoom();
    void QueueSignal(const ParticipantId& from, const Signal& signal);
    void ReplayQueuedSignals();

    void SendSignal(const ParticipantId& to, const Signal& signal);
    void Send(const Message& message);

private:
    Loop& Loop_;
    std::shared_ptr<Channel> Channel_;
    TransportFactory TransportFactory_;
    Collaborators Collaborators_;
    LinkConfig LinkConfig_;
    LinkStateCallback LinkStateCallback_;

    ParticipantId LocalId_;
    std::optional<RoomId> RoomId_;
    std::set<ParticipantId> Members_;
    std::map<ParticipantId, std::shared_ptr<PeerLink>> Peers_;
    // Signals from peers that reached us before local media was ready.
    std::map<ParticipantId, std::deque<Signal>> QueuedSignals_;
    std::shared_ptr<MediaStream> LocalStream_;
};

} // namespace roomlink
