#pragma once

#include "fwd.hpp"
#include "protocol.hpp"

#include <map>
#include <set>
#include <vector>

namespace roomlink {

class Room {
public:
    explicit Room(RoomId id);

    const RoomId& Id() const {
        return Id_;
    }

    void AddParticipant(const ParticipantId& participantId);
    // Also forgets the participant's location.
    void RemoveParticipant(const ParticipantId& participantId);

    bool HasParticipant(const ParticipantId& participantId) const {
        return Participants_.count(participantId);
    }

    bool Empty() const {
        return Participants_.empty();
    }

    size_t Size() const {
        return Participants_.size();
    }

    void SetLocation(const ParticipantId& participantId, LatLng position);

    std::vector<ParticipantId> Participants() const;
    std::vector<ParticipantId> ParticipantsExcept(const ParticipantId& participantId) const;
    std::vector<LocationEntry> Locations() const;

private:
    RoomId Id_;
    std::set<ParticipantId> Participants_;
    std::map<ParticipantId, LatLng> Locations_;
};

} // namespace roomlink
