#include "peer_link.hpp"

#include "loop.hpp"

#include <iostream>
#include <stdexcept>

namespace roomlink {

const char* LinkStateName(LinkState state) {
    switch (state) {
        case LinkState::Idle: return "Idle";
        case LinkState::Offering: return "Offering";
        case LinkState::AwaitingAnswer: return "AwaitingAnswer";
        case LinkState::Connected: return "Connected";
        case LinkState::Failed: return "Failed";
        case LinkState::Closed: return "Closed";
    }
    return "Unknown";
}

std::shared_ptr<PeerLink> PeerLink::Create(
    ParticipantId localId,
    ParticipantId remoteId,
    std::unique_ptr<PeerTransport> transport,
    const std::shared_ptr<MediaStream>& localStream,
    Loop& loop,
    LinkConfig config,
    Callbacks callbacks)
{
    if (localId == remoteId) {
        throw std::invalid_argument("peer link to self (" + localId + ")");
    }
    if (!transport) {
        throw std::invalid_argument("peer link without transport");
    }

    auto link = std::make_shared<PeerLink>(Token{}, std::move(localId), std::move(remoteId), std::move(transport),
                                           loop, config, std::move(callbacks));
    link->BindTransport();
    if (localStream) {
        link->Transport_->AttachLocalTracks(*localStream);
    }

    std::cout << "[Peer " << link->RemoteId_ << "] Link created" << std::endl;
    return link;
}

PeerLink::PeerLink(Token, ParticipantId localId, ParticipantId remoteId, std::unique_ptr<PeerTransport> transport,
                   Loop& loop, LinkConfig config, Callbacks callbacks)
    : LocalId_(std::move(localId))
    , RemoteId_(std::move(remoteId))
    , Transport_(std::move(transport))
    , Loop_(loop)
    , Config_(config)
    , Callbacks_(std::move(callbacks))
{ }

PeerLink::~PeerLink() {
    if (State_ == LinkState::Closed || State_ == LinkState::Failed) {
        return;
    }

    try {
        Transport_->Close();
    } catch (const std::exception& e) {
        std::cerr << "[Peer " << RemoteId_ << "] Failed to close transport: " << e.what() << std::endl;
    }
}

void PeerLink::BindTransport() {
    std::weak_ptr<PeerLink> weak = weak_from_this();
    Loop* loop = &Loop_;

    Transport_->OnLocalCandidate([weak, loop](IceCandidate candidate) {
        loop->EnqueueTask([weak, candidate = std::move(candidate)] {
            if (auto self = weak.lock()) {
                self->HandleLocalCandidate(candidate);
            }
        });
    });

    Transport_->OnTrack([weak, loop](RemoteTrack track) {
        loop->EnqueueTask([weak, track = std::move(track)] {
            if (auto self = weak.lock()) {
                self->HandleRemoteTrack(track);
            }
        });
    });

    Transport_->OnStateChange([weak, loop](TransportState state) {
        loop->EnqueueTask([weak, state] {
            if (auto self = weak.lock()) {
                self->HandleTransportState(state);
            }
        });
    });
}

void PeerLink::Offer() {
    if (State_ != LinkState::Idle) {
        std::cout << "[Peer " << RemoteId_ << "] Offer skipped in state " << LinkStateName(State_) << std::endl;
        return;
    }

    SetState(LinkState::Offering);

    SessionDescription offer;
    try {
        offer = Transport_->SetLocalDescription(Transport_->CreateOffer());
    } catch (const std::exception& e) {
        Fail(std::string("creating offer failed: ") + e.what());
        return;
    }

    HasLocalOffer_ = true;
    Negotiated_ = true;
    Initiator_ = true;

    Callbacks_.sendSignal(RemoteId_, Signal::FromDescription(offer));
    std::cout << "[Peer " << RemoteId_ << "] Offer sent" << std::endl;

    SetState(LinkState::AwaitingAnswer);
    ArmNegotiationTimeout();
}

void PeerLink::HandleSignal(const Signal& signal) {
    if (!Active()) {
        std::cout << "[Peer " << RemoteId_ << "] Ignoring " << SignalTypeName(signal.type)
                  << " in state " << LinkStateName(State_) << std::endl;
        return;
    }

    switch (signal.type) {
        case SignalType::Offer:
            HandleOffer(signal.Description());
            break;
        case SignalType::Answer:
            HandleAnswer(signal.Description());
            break;
        case SignalType::Candidate:
            HandleCandidate(signal.candidate);
            break;
    }
}

void PeerLink::HandleOffer(const SessionDescription& offer) {
    if (HasLocalOffer_) {
        if (!Polite()) {
            std::cout << "[Peer " << RemoteId_ << "] Ignoring colliding offer, ours takes precedence" << std::endl;
            return;
        }

        std::cout << "[Peer " << RemoteId_ << "] Colliding offer, rolling back our own" << std::endl;
        try {
            Transport_->Rollback();
        } catch (const std::exception& e) {
            std::cerr << "[Peer " << RemoteId_ << "] Rollback failed: " << e.what() << std::endl;
            return;
        }
        HasLocalOffer_ = false;
    }

    SessionDescription answer;
    try {
        ApplyRemoteDescription(offer);
        answer = Transport_->SetLocalDescription(Transport_->CreateAnswer());
    } catch (const std::exception& e) {
        std::cerr << "[Peer " << RemoteId_ << "] Failed to answer offer: " << e.what() << std::endl;
        return;
    }

    Negotiated_ = true;
    Initiator_ = false;

    Callbacks_.sendSignal(RemoteId_, Signal::FromDescription(answer));
    std::cout << "[Peer " << RemoteId_ << "] Answer sent" << std::endl;

    if (State_ != LinkState::Connected) {
        // Nothing more to receive; waiting on the transport to connect.
        SetState(LinkState::AwaitingAnswer);
        ArmNegotiationTimeout();
    }
}

void PeerLink::HandleAnswer(const SessionDescription& answer) {
    if (State_ != LinkState::AwaitingAnswer || !HasLocalOffer_) {
        std::cout << "[Peer " << RemoteId_ << "] Answer received in state " << LinkStateName(State_)
                  << ", applying anyway" << std::endl;
    }

    try {
        ApplyRemoteDescription(answer);
    } catch (const std::exception& e) {
        std::cerr << "[Peer " << RemoteId_ << "] Failed to apply answer: " << e.what() << std::endl;
        return;
    }

    HasLocalOffer_ = false;
    std::cout << "[Peer " << RemoteId_ << "] Answer applied" << std::endl;
}

void PeerLink::HandleCandidate(const IceCandidate& candidate) {
    if (!HasRemoteDescription_) {
        PendingCandidates_.push_back(candidate);
        std::cout << "[Peer " << RemoteId_ << "] Queued candidate (" << PendingCandidates_.size()
                  << " pending)" << std::endl;
        return;
    }

    AddCandidate(candidate);
}

void PeerLink::ApplyRemoteDescription(const SessionDescription& desc) {
    Transport_->SetRemoteDescription(desc);
    HasRemoteDescription_ = true;

    while (!PendingCandidates_.empty()) {
        auto candidate = std::move(PendingCandidates_.front());
        PendingCandidates_.pop_front();
        AddCandidate(candidate);
    }
}

void PeerLink::AddCandidate(const IceCandidate& candidate) {
    try {
        Transport_->AddIceCandidate(candidate);
    } catch (const std::exception& e) {
        std::cerr << "[Peer " << RemoteId_ << "] Failed to add candidate: " << e.what() << std::endl;
    }
}

void PeerLink::HandleTransportState(TransportState state) {
    std::cout << "[Peer " << RemoteId_ << "] Transport state: " << TransportStateName(state) << std::endl;
    if (!Active()) {
        return;
    }

    switch (state) {
        case TransportState::Connected:
            ++NegotiationGeneration_;
            SetState(LinkState::Connected);
            break;

        case TransportState::Failed:
            if (IceRestarted_) {
                Fail("ICE failed again after restart");
                return;
            }

            IceRestarted_ = true;
            std::cout << "[Peer " << RemoteId_ << "] ICE failed, restarting" << std::endl;
            try {
                Transport_->RestartIce();
            } catch (const std::exception& e) {
                Fail(std::string("ICE restart failed: ") + e.what());
                return;
            }

            HasLocalOffer_ = false;
            HasRemoteDescription_ = false;
            PendingCandidates_.clear();
            SetState(LinkState::Idle);

            // The side whose offer was accepted drives the renegotiation.
            if (Initiator_) {
                Offer();
            } else {
                ArmNegotiationTimeout();
            }
            break;

        default:
            break;
    }
}

void PeerLink::HandleLocalCandidate(const IceCandidate& candidate) {
    if (!Active()) {
        return;
    }

    Callbacks_.sendSignal(RemoteId_, Signal::FromCandidate(candidate));
}

void PeerLink::HandleRemoteTrack(const RemoteTrack& track) {
    if (!Active()) {
        return;
    }

    std::cout << "[Peer " << RemoteId_ << "] Remote " << track.kind << " track received" << std::endl;
    if (Callbacks_.remoteTrack) {
        Callbacks_.remoteTrack(RemoteId_, track);
    }
}

void PeerLink::ArmNegotiationTimeout() {
    auto generation = ++NegotiationGeneration_;
    if (Config_.negotiationTimeout.count() <= 0) {
        return;
    }

    std::weak_ptr<PeerLink> weak = weak_from_this();
    Loop_.EnqueueDelayedTask(Config_.negotiationTimeout, [weak, generation] {
        if (auto self = weak.lock()) {
            self->HandleNegotiationTimeout(generation);
        }
    });
}

void PeerLink::HandleNegotiationTimeout(uint64_t generation) {
    if (generation != NegotiationGeneration_ || !Active() || State_ == LinkState::Connected) {
        return;
    }

    Fail("negotiation timed out after " + std::to_string(Config_.negotiationTimeout.count()) + " ms");
}

void PeerLink::Fail(const std::string& reason) {
    std::cerr << "[Peer " << RemoteId_ << "] Link failed: " << reason << std::endl;

    ++NegotiationGeneration_;
    PendingCandidates_.clear();
    try {
        Transport_->Close();
    } catch (const std::exception& e) {
        std::cerr << "[Peer " << RemoteId_ << "] Failed to close transport: " << e.what() << std::endl;
    }
    SetState(LinkState::Failed);
}

void PeerLink::Close() {
    if (State_ == LinkState::Closed) {
        return;
    }

    ++NegotiationGeneration_;
    PendingCandidates_.clear();
    if (State_ != LinkState::Failed) {
        try {
            Transport_->Close();
        } catch (const std::exception& e) {
            std::cerr << "[Peer " << RemoteId_ << "] Failed to close transport: " << e.what() << std::endl;
        }
    }
    SetState(LinkState::Closed);
}

void PeerLink::SetState(LinkState state) {
    if (State_ == state) {
        return;
    }

    std::cout << "[Peer " << RemoteId_ << "] " << LinkStateName(State_) << " -> " << LinkStateName(state) << std::endl;
    State_ = state;
    if (Callbacks_.stateChanged) {
        Callbacks_.stateChanged(RemoteId_, state);
    }
}

} // namespace roomlink
