#pragma once

#include "protocol.hpp"
#include "transport.hpp"

namespace roomlink {

// Map markers, one per participant with a known position.
class LocationDisplay {
public:
    virtual ~LocationDisplay() = default;

    virtual void Upsert(const ParticipantId& participantId, LatLng position) = 0;
    virtual void Remove(const ParticipantId& participantId) = 0;
};

// Remote video tiles, one per participant with a received track.
class VideoDisplay {
public:
    virtual ~VideoDisplay() = default;

    virtual void Upsert(const ParticipantId& participantId, const RemoteTrack& track) = 0;
    virtual void Remove(const ParticipantId& participantId) = 0;
};

class ConsoleLocationDisplay : public LocationDisplay {
public:
    void Upsert(const ParticipantId& participantId, LatLng position) override;
    void Remove(const ParticipantId& participantId) override;
};

class ConsoleVideoDisplay : public VideoDisplay {
public:
    void Upsert(const ParticipantId& participantId, const RemoteTrack& track) override;
    void Remove(const ParticipantId& participantId) override;
};

} // namespace roomlink
