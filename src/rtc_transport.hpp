#pragma once

#include "fwd.hpp"
#include "transport.hpp"

#include <rtc/rtc.hpp>

#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

namespace roomlink {

// PeerTransport over a libdatachannel PeerConnection with automatic
// negotiation disabled, so offers and answers are driven by the PeerLink.
class RtcTransport : public PeerTransport {
public:
    explicit RtcTransport(rtc::Configuration config);
    ~RtcTransport() override;

    void AttachLocalTracks(const MediaStream& stream) override;

    SessionDescription CreateOffer() override;
    SessionDescription CreateAnswer() override;
    SessionDescription SetLocalDescription(const SessionDescription& desc) override;
    void SetRemoteDescription(const SessionDescription& desc) override;
    void AddIceCandidate(const IceCandidate& candidate) override;

    void Rollback() override;
    void RestartIce() override;
    void Close() override;

private:
    rtc::PeerConnection& Connection();
    void CreatePeerConnection();
    void AddTracks(const MediaStream& stream);

    rtc::Configuration Config_;
    std::shared_ptr<rtc::PeerConnection> PeerConnection_;
    std::optional<MediaStream> LocalStream_;
    std::vector<std::shared_ptr<rtc::Track>> LocalTracks_;
};

// Builds RtcTransports sharing one ICE server configuration.
TransportFactory MakeRtcTransportFactory(const std::vector<std::string>& iceServers);

} // namespace roomlink
