#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace roomlink {

using ParticipantId = std::string;
using RoomId = std::string;

struct LatLng {
    double lat = 0.0;
    double lng = 0.0;
};

class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Signal payloads carried inside webrtc-signal. The relay never looks at
// them; only the session client decodes them.
enum class SignalType {
    Offer,
    Answer,
    Candidate,
};

struct SessionDescription {
    SignalType type = SignalType::Offer;
    std::string sdp;
};

struct IceCandidate {
    std::string candidate;
    std::string mid;
};

struct Signal {
    SignalType type = SignalType::Offer;
    std::string sdp;
    IceCandidate candidate;

    static Signal FromDescription(const SessionDescription& desc);
    static Signal FromCandidate(const IceCandidate& candidate);
    SessionDescription Description() const;
};

// Coordinator <-> client events.
struct Hello {
    ParticipantId userId;
};

struct JoinRoom {
    RoomId roomId;
};

struct LeaveRoom {};

struct LocationEntry {
    ParticipantId userId;
    LatLng position;
};

struct RoomState {
    std::vector<ParticipantId> users;
    std::vector<LocationEntry> locations;
};

struct UserJoined {
    ParticipantId userId;
};

struct UserLeft {
    ParticipantId userId;
};

struct SignalMessage {
    RoomId roomId;
    ParticipantId from;
    std::optional<ParticipantId> to;
    nlohmann::json signal;
};

struct LocationUpdate {
    RoomId roomId;
    std::optional<ParticipantId> userId;
    LatLng position;
};

using Message = std::variant<
    Hello,
    JoinRoom,
    LeaveRoom,
    RoomState,
    UserJoined,
    UserLeft,
    SignalMessage,
    LocationUpdate>;

const char* EventName(const Message& message);
const char* SignalTypeName(SignalType type);

std::string Encode(const Message& message);

// Throws ProtocolError on malformed JSON, unknown events or missing fields.
Message Decode(const std::string& text);

nlohmann::json EncodeSignal(const Signal& signal);
Signal DecodeSignal(const nlohmann::json& j);

} // namespace roomlink
