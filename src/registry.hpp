#pragma once

#include "fwd.hpp"
#include "room.hpp"

#include <unordered_map>
#include <vector>

namespace roomlink {

// Process-scoped set of live rooms. A room is present iff it has at least
// one participant: Join creates it, the Leave that empties it erases it.
class Registry {
public:
    Registry() = default;

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    Room& Join(const RoomId& roomId, const ParticipantId& participantId);

    // Returns the participants still in the room afterwards.
    std::vector<ParticipantId> Leave(const RoomId& roomId, const ParticipantId& participantId);

    Room* Find(const RoomId& roomId);
    const Room* Find(const RoomId& roomId) const;

    size_t RoomCount() const {
        return Rooms_.size();
    }

private:
    std::unordered_map<RoomId, Room> Rooms_;
};

} // namespace roomlink
