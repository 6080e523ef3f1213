#include "display.hpp"

#include <iostream>

namespace roomlink {

void ConsoleLocationDisplay::Upsert(const ParticipantId& participantId, LatLng position) {
    std::cout << "[Peer " << participantId << "] Location " << position.lat << ", " << position.lng << std::endl;
}

void ConsoleLocationDisplay::Remove(const ParticipantId& participantId) {
    std::cout << "[Peer " << participantId << "] Location removed" << std::endl;
}

void ConsoleVideoDisplay::Upsert(const ParticipantId& participantId, const RemoteTrack& track) {
    std::cout << "[Peer " << participantId << "] Receiving " << track.kind << " track, mid=" << track.mid << std::endl;
}

void ConsoleVideoDisplay::Remove(const ParticipantId& participantId) {
    std::cout << "[Peer " << participantId << "] Remote media removed" << std::endl;
}

} // namespace roomlink
