#include "rtc_transport.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace roomlink {

namespace {

constexpr int kOpusPayloadType = 111;
constexpr int kH264PayloadType = 96;

rtc::Description::Type ToRtcType(SignalType type) {
    return type == SignalType::Offer ? rtc::Description::Type::Offer : rtc::Description::Type::Answer;
}

SessionDescription FromRtc(SignalType type, const rtc::Description& desc) {
    return SessionDescription{type, std::string(desc)};
}

TransportState FromRtc(rtc::PeerConnection::State state) {
    switch (state) {
        case rtc::PeerConnection::State::New: return TransportState::New;
        case rtc::PeerConnection::State::Connecting: return TransportState::Connecting;
        case rtc::PeerConnection::State::Connected: return TransportState::Connected;
        case rtc::PeerConnection::State::Disconnected: return TransportState::Disconnected;
        case rtc::PeerConnection::State::Failed: return TransportState::Failed;
        case rtc::PeerConnection::State::Closed: return TransportState::Closed;
    }
    return TransportState::Failed;
}

} // namespace

RtcTransport::RtcTransport(rtc::Configuration config)
    : Config_(std::move(config))
{
    Config_.disableAutoNegotiation = true;
    CreatePeerConnection();
}

RtcTransport::~RtcTransport() {
    Close();
}

void RtcTransport::CreatePeerConnection() {
    PeerConnection_ = std::make_shared<rtc::PeerConnection>(Config_);

    PeerConnection_->onLocalCandidate([this](rtc::Candidate cand) {
        if (cand.candidate().empty()) {
            return;
        }
        if (CandidateCallback_) {
            CandidateCallback_(IceCandidate{cand.candidate(), cand.mid()});
        }
    });

    PeerConnection_->onTrack([this](std::shared_ptr<rtc::Track> track) {
        if (TrackCallback_) {
            TrackCallback_(RemoteTrack{track->mid(), track->description().type(), track});
        }
    });

    PeerConnection_->onStateChange([this](rtc::PeerConnection::State state) {
        if (StateCallback_) {
            StateCallback_(FromRtc(state));
        }
    });
}

rtc::PeerConnection& RtcTransport::Connection() {
    if (!PeerConnection_) {
        throw std::logic_error("transport is closed");
    }
    return *PeerConnection_;
}

void RtcTransport::AttachLocalTracks(const MediaStream& stream) {
    LocalStream_ = stream;
    AddTracks(stream);
}

void RtcTransport::AddTracks(const MediaStream& stream) {
    LocalTracks_.clear();

    for (const auto& track : stream.tracks) {
        if (track.kind == "audio") {
            rtc::Description::Audio media(track.mid, rtc::Description::Direction::SendRecv);
            media.addOpusCodec(kOpusPayloadType);
            media.addSSRC(track.ssrc, stream.id, stream.id, track.mid);
            LocalTracks_.push_back(Connection().addTrack(std::move(media)));
        } else if (track.kind == "video") {
            rtc::Description::Video media(track.mid, rtc::Description::Direction::SendRecv);
            media.addH264Codec(kH264PayloadType);
            media.addSSRC(track.ssrc, stream.id, stream.id, track.mid);
            LocalTracks_.push_back(Connection().addTrack(std::move(media)));
        } else {
            std::cerr << "Skipping local track with unknown kind " << track.kind << std::endl;
        }
    }
}

SessionDescription RtcTransport::CreateOffer() {
    return FromRtc(SignalType::Offer, Connection().createOffer());
}

SessionDescription RtcTransport::CreateAnswer() {
    return FromRtc(SignalType::Answer, Connection().createAnswer());
}

SessionDescription RtcTransport::SetLocalDescription(const SessionDescription& desc) {
    // libdatachannel generates the local description itself, from the same
    // ICE and DTLS parameters CreateOffer/CreateAnswer used.
    auto& connection = Connection();
    connection.setLocalDescription(ToRtcType(desc.type));

    auto local = connection.localDescription();
    if (!local) {
        throw std::runtime_error("no local description after applying " + std::string(SignalTypeName(desc.type)));
    }
    return FromRtc(desc.type, *local);
}

void RtcTransport::SetRemoteDescription(const SessionDescription& desc) {
    Connection().setRemoteDescription(rtc::Description(desc.sdp, SignalTypeName(desc.type)));
}

void RtcTransport::AddIceCandidate(const IceCandidate& candidate) {
    Connection().addRemoteCandidate(rtc::Candidate(candidate.candidate, candidate.mid));
}

void RtcTransport::Rollback() {
    Connection().setLocalDescription(rtc::Description::Type::Rollback);
}

void RtcTransport::RestartIce() {
    // No in-place ICE restart in libdatachannel: replace the connection and
    // carry the local tracks over.
    auto& old = Connection();
    old.resetCallbacks();
    old.close();
    CreatePeerConnection();
    if (LocalStream_) {
        AddTracks(*LocalStream_);
    }
}

void RtcTransport::Close() {
    if (!PeerConnection_) {
        return;
    }

    PeerConnection_->resetCallbacks();
    PeerConnection_->close();
    PeerConnection_.reset();
    LocalTracks_.clear();
}

TransportFactory MakeRtcTransportFactory(const std::vector<std::string>& iceServers) {
    return [iceServers]() -> std::unique_ptr<PeerTransport> {
        rtc::Configuration config;
        for (const auto& server : iceServers) {
            config.iceServers.emplace_back(server);
        }
        return std::make_unique<RtcTransport>(std::move(config));
    };
}

} // namespace roomlink
