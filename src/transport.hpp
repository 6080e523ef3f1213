#pragma once

#include "fwd.hpp"
#include "media.hpp"
#include "protocol.hpp"

#include <functional>
#include <memory>
#include <string>

namespace roomlink {

enum class TransportState {
    New,
    Connecting,
    Connected,
    Disconnected,
    Failed,
    Closed,
};

const char* TransportStateName(TransportState state);

struct RemoteTrack {
    std::string mid;
    std::string kind;
    // Null for transports that do not carry real media.
    std::shared_ptr<rtc::Track> track;
};

// Media channel to one remote participant. Description and candidate
// operations throw std::exception subclasses on failure. Callbacks may be
// invoked from transport-owned threads.
class PeerTransport {
public:
    using TrackCallback = std::function<void(RemoteTrack)>;
    using CandidateCallback = std::function<void(IceCandidate)>;
    using StateCallback = std::function<void(TransportState)>;

    virtual ~PeerTransport() = default;

    virtual void AttachLocalTracks(const MediaStream& stream) = 0;

    virtual SessionDescription CreateOffer() = 0;
    virtual SessionDescription CreateAnswer() = 0;
    // Applies a description from CreateOffer/CreateAnswer and returns the
    // one actually in effect, which is what the remote side must receive.
    virtual SessionDescription SetLocalDescription(const SessionDescription& desc) = 0;
    virtual void SetRemoteDescription(const SessionDescription& desc) = 0;
    virtual void AddIceCandidate(const IceCandidate& candidate) = 0;

    // Discards an applied local offer that has not been answered yet.
    virtual void Rollback() = 0;
    // Starts over with fresh ICE credentials; a new offer is needed after.
    virtual void RestartIce() = 0;
    virtual void Close() = 0;

    void OnTrack(TrackCallback callback) {
        TrackCallback_ = std::move(callback);
    }

    void OnLocalCandidate(CandidateCallback callback) {
        CandidateCallback_ = std::move(callback);
    }

    void OnStateChange(StateCallback callback) {
        StateCallback_ = std::move(callback);
    }

protected:
    TrackCallback TrackCallback_;
    CandidateCallback CandidateCallback_;
    StateCallback StateCallback_;
};

using TransportFactory = std::function<std::unique_ptr<PeerTransport>()>;

} // namespace roomlink
