#pragma once

#include "fwd.hpp"
#include "media.hpp"
#include "protocol.hpp"
#include "transport.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>

namespace roomlink {

enum class LinkState {
    Idle,
    Offering,
    AwaitingAnswer,
    Connected,
    Failed,
    Closed,
};

const char* LinkStateName(LinkState state);

struct LinkConfig {
    // Time allowed from sending an offer or answer until the transport
    // reports Connected. Zero disables the timeout.
    std::chrono::milliseconds negotiationTimeout{30000};
};

// Negotiation state machine for one (local, remote) pair. Owns the
// transport. Every method must run on the owning session's Loop; transport
// callbacks are re-posted onto that Loop.
class PeerLink : public std::enable_shared_from_this<PeerLink> {
    // Restricts construction to Create while allowing make_shared.
    struct Token {
        explicit Token() = default;
    };

public:
    struct Callbacks {
        std::function<void(const ParticipantId& to, const Signal& signal)> sendSignal;
        std::function<void(const ParticipantId& remoteId, const RemoteTrack& track)> remoteTrack;
        std::function<void(const ParticipantId& remoteId, LinkState state)> stateChanged;
    };

    // Throws std::invalid_argument for a link to oneself.
    static std::shared_ptr<PeerLink> Create(
        ParticipantId localId,
        ParticipantId remoteId,
        std::unique_ptr<PeerTransport> transport,
        const std::shared_ptr<MediaStream>& localStream,
        Loop& loop,
        LinkConfig config,
        Callbacks callbacks);

    PeerLink(Token, ParticipantId localId, ParticipantId remoteId, std::unique_ptr<PeerTransport> transport,
             Loop& loop, LinkConfig config, Callbacks callbacks);
    ~PeerLink();

    PeerLink(const PeerLink&) = delete;
    PeerLink& operator=(const PeerLink&) = delete;

    void Offer();
    void HandleSignal(const Signal& signal);
    void Close();

    LinkState State() const {
        return State_;
    }

    const ParticipantId& RemoteId() const {
        return RemoteId_;
    }

    // True once this side has sent an offer or an answer.
    bool Negotiated() const {
        return Negotiated_;
    }

    bool HasRemoteDescription() const {
        return HasRemoteDescription_;
    }

    size_t PendingCandidates() const {
        return PendingCandidates_.size();
    }

    // The side with the smaller id yields when both offer at once.
    bool Polite() const {
        return LocalId_ < RemoteId_;
    }

private:
    void BindTransport();
    void HandleOffer(const SessionDescription& offer);
    void HandleAnswer(const SessionDescription& answer);
    void HandleCandidate(const IceCandidate& candidate);
    void HandleTransportState(TransportState state);
    void HandleLocalCandidate(const IceCandidate& candidate);
    void HandleRemoteTrack(const RemoteTrack& track);

    void ApplyRemoteDescription(const SessionDescription& desc);
    void AddCandidate(const IceCandidate& candidate);
    void ArmNegotiationTimeout();
    void HandleNegotiationTimeout(uint64_t generation);
    void Fail(const std::string& reason);
    void SetState(LinkState state);

    bool Active() const {
        return State_ != LinkState::Failed && State_ != LinkState::Closed;
    }

private:
    ParticipantId LocalId_;
    ParticipantId RemoteId_;
    std::unique_ptr<PeerTransport> Transport_;
    Loop& Loop_;
    LinkConfig Config_;
    Callbacks Callbacks_;

    LinkState State_ = LinkState::Idle;
    bool Negotiated_ = false;
    bool Initiator_ = false;
    bool HasLocalOffer_ = false;
    bool HasRemoteDescription_ = false;
    bool IceRestarted_ = false;
    uint64_t NegotiationGeneration_ = 0;
    std::deque<IceCandidate> PendingCandidates_;
};

} // namespace roomlink
