#include "protocol.hpp"

#include "overloaded.hpp"

namespace roomlink {

namespace {

using json = nlohmann::json;

const json& Require(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) {
        throw ProtocolError(std::string("missing field '") + key + "'");
    }
    return *it;
}

std::string RequireString(const json& j, const char* key) {
    const auto& value = Require(j, key);
    if (!value.is_string()) {
        throw ProtocolError(std::string("field '") + key + "' is not a string");
    }
    return value.get<std::string>();
}

double RequireNumber(const json& j, const char* key) {
    const auto& value = Require(j, key);
    if (!value.is_number()) {
        throw ProtocolError(std::string("field '") + key + "' is not a number");
    }
    return value.get<double>();
}

std::optional<std::string> OptionalString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw ProtocolError(std::string("field '") + key + "' is not a string");
    }
    return it->get<std::string>();
}

const json& RequireObject(const json& j) {
    if (!j.is_object()) {
        throw ProtocolError("payload is not an object");
    }
    return j;
}

json PayloadOf(const Message& message) {
    return std::visit(Overloaded{
        [](const Hello& m) -> json {
            return {{"userId", m.userId}};
        },
        [](const JoinRoom& m) -> json {
            return m.roomId;
        },
        [](const LeaveRoom&) -> json {
            return json::object();
        },
        [](const RoomState& m) -> json {
            json locations = json::array();
            for (const auto& entry : m.locations) {
                locations.push_back({
                    {"userId", entry.userId},
                    {"lat", entry.position.lat},
                    {"lng", entry.position.lng}
                });
            }
            return {{"users", m.users}, {"locations", locations}};
        },
        [](const UserJoined& m) -> json {
            return {{"userId", m.userId}};
        },
        [](const UserLeft& m) -> json {
            return {{"userId", m.userId}};
        },
        [](const SignalMessage& m) -> json {
            json j = {
                {"roomId", m.roomId},
                {"from", m.from},
                {"signal", m.signal}
            };
            if (m.to) {
                j["to"] = *m.to;
            }
            return j;
        },
        [](const LocationUpdate& m) -> json {
            json j = {
                {"roomId", m.roomId},
                {"lat", m.position.lat},
                {"lng", m.position.lng}
            };
            if (m.userId) {
                j["userId"] = *m.userId;
            }
            return j;
        },
    }, message);
}

} // namespace

const char* EventName(const Message& message) {
    return std::visit(Overloaded{
        [](const Hello&) { return "hello"; },
        [](const JoinRoom&) { return "join-room"; },
        [](const LeaveRoom&) { return "leave-room"; },
        [](const RoomState&) { return "room-state"; },
        [](const UserJoined&) { return "user-joined"; },
        [](const UserLeft&) { return "user-left"; },
        [](const SignalMessage&) { return "webrtc-signal"; },
        [](const LocationUpdate&) { return "location-update"; },
    }, message);
}

const char* SignalTypeName(SignalType type) {
    switch (type) {
        case SignalType::Offer: return "offer";
        case SignalType::Answer: return "answer";
        case SignalType::Candidate: return "candidate";
    }
    return "unknown";
}

Signal Signal::FromDescription(const SessionDescription& desc) {
    Signal signal;
    signal.type = desc.type;
    signal.sdp = desc.sdp;
    return signal;
}

Signal Signal::FromCandidate(const IceCandidate& candidate) {
    Signal signal;
    signal.type = SignalType::Candidate;
    signal.candidate = candidate;
    return signal;
}

SessionDescription Signal::Description() const {
    return SessionDescription{type, sdp};
}

std::string Encode(const Message& message) {
    json frame = {
        {"event", EventName(message)},
        {"data", PayloadOf(message)}
    };
    return frame.dump();
}

Message Decode(const std::string& text) {
    json frame;
    try {
        frame = json::parse(text);
    } catch (const json::exception& e) {
        // Syntax errors and out-of-range numbers alike.
        throw ProtocolError(std::string("invalid JSON: ") + e.what());
    }

    RequireObject(frame);
    const std::string event = RequireString(frame, "event");
    const json& data = Require(frame, "data");

    if (event == "join-room") {
        if (!data.is_string()) {
            throw ProtocolError("join-room payload is not a string");
        }
        return JoinRoom{data.get<std::string>()};
    }

    if (event == "leave-room") {
        return LeaveRoom{};
    }

    RequireObject(data);

    if (event == "hello") {
        return Hello{RequireString(data, "userId")};
    }
    if (event == "user-joined") {
        return UserJoined{RequireString(data, "userId")};
    }
    if (event == "user-left") {
        return UserLeft{RequireString(data, "userId")};
    }
    if (event == "room-state") {
        RoomState state;
        const auto& users = Require(data, "users");
        const auto& locations = Require(data, "locations");
        if (!users.is_array() || !locations.is_array()) {
            throw ProtocolError("room-state users/locations must be arrays");
        }
        for (const auto& user : users) {
            if (!user.is_string()) {
                throw ProtocolError("room-state user id is not a string");
            }
            state.users.push_back(user.get<std::string>());
        }
        for (const auto& location : locations) {
            RequireObject(location);
            state.locations.push_back(LocationEntry{
                RequireString(location, "userId"),
                LatLng{RequireNumber(location, "lat"), RequireNumber(location, "lng")}
            });
        }
        return state;
    }
    if (event == "webrtc-signal") {
        SignalMessage message;
        message.roomId = RequireString(data, "roomId");
        message.from = OptionalString(data, "from").value_or("");
        message.to = OptionalString(data, "to");
        message.signal = Require(data, "signal");
        return message;
    }
    if (event == "location-update") {
        LocationUpdate update;
        update.roomId = RequireString(data, "roomId");
        update.userId = OptionalString(data, "userId");
        update.position = LatLng{RequireNumber(data, "lat"), RequireNumber(data, "lng")};
        return update;
    }

    throw ProtocolError("unknown event '" + event + "'");
}

json EncodeSignal(const Signal& signal) {
    if (signal.type == SignalType::Candidate) {
        json candidate = {{"candidate", signal.candidate.candidate}};
        if (!signal.candidate.mid.empty()) {
            candidate["sdpMid"] = signal.candidate.mid;
        }
        return {{"type", "candidate"}, {"candidate", candidate}};
    }

    return {{"type", SignalTypeName(signal.type)}, {"sdp", signal.sdp}};
}

Signal DecodeSignal(const json& j) {
    RequireObject(j);
    const std::string type = RequireString(j, "type");

    Signal signal;
    if (type == "offer" || type == "answer") {
        signal.type = type == "offer" ? SignalType::Offer : SignalType::Answer;
        signal.sdp = RequireString(j, "sdp");
        return signal;
    }

    if (type == "candidate") {
        signal.type = SignalType::Candidate;
        const auto& candidate = Require(j, "candidate");
        // Browsers send the RTCIceCandidate object, older peers a bare string.
        if (candidate.is_string()) {
            signal.candidate.candidate = candidate.get<std::string>();
            signal.candidate.mid = OptionalString(j, "sdpMid").value_or("");
        } else {
            RequireObject(candidate);
            signal.candidate.candidate = RequireString(candidate, "candidate");
            signal.candidate.mid = OptionalString(candidate, "sdpMid").value_or("");
        }
        return signal;
    }

    throw ProtocolError("unknown signal type '" + type + "'");
}

} // namespace roomlink
