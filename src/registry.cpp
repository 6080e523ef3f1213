#include "registry.hpp"

#include <iostream>

namespace roomlink {

Room& Registry::Join(const RoomId& roomId, const ParticipantId& participantId) {
    auto it = Rooms_.find(roomId);
    if (it == Rooms_.end()) {
        it = Rooms_.emplace(roomId, Room(roomId)).first;
        std::cout << "[Room " << roomId << "] Created" << std::endl;
    }

    it->second.AddParticipant(participantId);
    return it->second;
}

std::vector<ParticipantId> Registry::Leave(const RoomId& roomId, const ParticipantId& participantId) {
    auto it = Rooms_.find(roomId);
    if (it == Rooms_.end()) {
        return {};
    }

    it->second.RemoveParticipant(participantId);
    if (it->second.Empty()) {
        Rooms_.erase(it);
        std::cout << "[Room " << roomId << "] Deleted (empty)" << std::endl;
        return {};
    }

    return it->second.Participants();
}

Room* Registry::Find(const RoomId& roomId) {
    auto it = Rooms_.find(roomId);
    return it == Rooms_.end() ? nullptr : &it->second;
}

const Room* Registry::Find(const RoomId& roomId) const {
    auto it = Rooms_.find(roomId);
    return it == Rooms_.end() ? nullptr : &it->second;
}

} // namespace roomlink
