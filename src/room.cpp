#include "room.hpp"

#include <iostream>

namespace roomlink {

Room::Room(RoomId id)
    : Id_(std::move(id))
{ }

void Room::AddParticipant(const ParticipantId& participantId) {
    if (!Participants_.insert(participantId).second) {
        return;
    }

    std::cout << "[Room " << Id_ << "] Participant " << participantId << " joined ("
              << Participants_.size() << " present)" << std::endl;
}

void Room::RemoveParticipant(const ParticipantId& participantId) {
    if (!Participants_.erase(participantId)) {
        return;
    }

    Locations_.erase(participantId);
    std::cout << "[Room " << Id_ << "] Participant " << participantId << " left ("
              << Participants_.size() << " present)" << std::endl;
}

void Room::SetLocation(const ParticipantId& participantId, LatLng position) {
    Locations_[participantId] = position;
}

std::vector<ParticipantId> Room::Participants() const {
    return {Participants_.begin(), Participants_.end()};
}

std::vector<ParticipantId> Room::ParticipantsExcept(const ParticipantId& participantId) const {
    std::vector<ParticipantId> result;
    result.reserve(Participants_.size());
    for (const auto& id : Participants_) {
        if (id == participantId) {
            continue;
        }
        result.push_back(id);
    }
    return result;
}

std::vector<LocationEntry> Room::Locations() const {
    std::vector<LocationEntry> result;
    result.reserve(Locations_.size());
    for (const auto& [id, position] : Locations_) {
        result.push_back(LocationEntry{id, position});
    }
    return result;
}

} // namespace roomlink
