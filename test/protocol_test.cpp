#include "protocol.hpp"

#include <gtest/gtest.h>

using namespace roomlink;
using json = nlohmann::json;

TEST(Protocol, JoinRoomCarriesBareRoomId) {
    auto text = Encode(JoinRoom{"lobby"});
    auto frame = json::parse(text);
    EXPECT_EQ("join-room", frame["event"]);
    EXPECT_EQ("lobby", frame["data"]);

    auto decoded = Decode(text);
    ASSERT_TRUE(std::holds_alternative<JoinRoom>(decoded));
    EXPECT_EQ("lobby", std::get<JoinRoom>(decoded).roomId);
}

TEST(Protocol, DecodeRoomState) {
    auto decoded = Decode(R"({"event":"room-state","data":{
        "users":["2","3"],
        "locations":[{"userId":"2","lat":48.85,"lng":2.35}]}})");
    ASSERT_TRUE(std::holds_alternative<RoomState>(decoded));

    const auto& state = std::get<RoomState>(decoded);
    EXPECT_EQ((std::vector<ParticipantId>{"2", "3"}), state.users);
    ASSERT_EQ(1u, state.locations.size());
    EXPECT_EQ("2", state.locations[0].userId);
    EXPECT_DOUBLE_EQ(48.85, state.locations[0].position.lat);
    EXPECT_DOUBLE_EQ(2.35, state.locations[0].position.lng);
}

TEST(Protocol, SignalTargetIsOptional) {
    SignalMessage broadcast{"room", "1", std::nullopt, json{{"type", "offer"}, {"sdp", "v=0"}}};
    auto frame = json::parse(Encode(broadcast));
    EXPECT_FALSE(frame["data"].contains("to"));

    auto decoded = Decode(R"({"event":"webrtc-signal","data":{
        "roomId":"room","to":"2","signal":{"type":"answer","sdp":"v=0"}}})");
    ASSERT_TRUE(std::holds_alternative<SignalMessage>(decoded));

    const auto& message = std::get<SignalMessage>(decoded);
    EXPECT_EQ("room", message.roomId);
    EXPECT_EQ("", message.from);
    ASSERT_TRUE(message.to);
    EXPECT_EQ("2", *message.to);
    EXPECT_EQ("answer", message.signal["type"]);
}

TEST(Protocol, LocationUpdateFromClientHasNoUserId) {
    auto decoded = Decode(R"({"event":"location-update","data":{"roomId":"r","lat":1.5,"lng":-2}})");
    ASSERT_TRUE(std::holds_alternative<LocationUpdate>(decoded));

    const auto& update = std::get<LocationUpdate>(decoded);
    EXPECT_FALSE(update.userId);
    EXPECT_DOUBLE_EQ(1.5, update.position.lat);
    EXPECT_DOUBLE_EQ(-2.0, update.position.lng);
}

TEST(Protocol, LeaveRoomIgnoresPayload) {
    EXPECT_TRUE(std::holds_alternative<LeaveRoom>(Decode(R"({"event":"leave-room","data":null})")));
}

TEST(Protocol, MalformedFramesAreRejected) {
    EXPECT_THROW(Decode("not json"), ProtocolError);
    EXPECT_THROW(Decode("[1,2]"), ProtocolError);
    EXPECT_THROW(Decode(R"({"data":{}})"), ProtocolError);
    EXPECT_THROW(Decode(R"({"event":"join-room","data":{"roomId":"x"}})"), ProtocolError);
    EXPECT_THROW(Decode(R"({"event":"user-joined","data":{}})"), ProtocolError);
    EXPECT_THROW(Decode(R"({"event":"location-update","data":{"roomId":"r","lat":"north","lng":0}})"),
                 ProtocolError);
    EXPECT_THROW(Decode(R"({"event":"teleport","data":{}})"), ProtocolError);
    EXPECT_THROW(Decode(R"({"event":"location-update","data":{"roomId":"r","lat":1e400,"lng":0}})"),
                 ProtocolError);
}

TEST(Protocol, DescriptionSignals) {
    auto j = EncodeSignal(Signal::FromDescription({SignalType::Offer, "v=0\r\n"}));
    EXPECT_EQ(json({{"type", "offer"}, {"sdp", "v=0\r\n"}}), j);

    auto signal = DecodeSignal(json{{"type", "answer"}, {"sdp", "v=0"}});
    EXPECT_EQ(SignalType::Answer, signal.type);
    EXPECT_EQ("v=0", signal.Description().sdp);
}

TEST(Protocol, CandidateSignalAcceptsObjectAndString) {
    auto j = EncodeSignal(Signal::FromCandidate({"candidate:1 1 UDP 1 10.0.0.1 5000 typ host", "0"}));
    EXPECT_EQ("candidate", j["type"]);
    EXPECT_EQ("0", j["candidate"]["sdpMid"]);

    auto fromObject = DecodeSignal(j);
    EXPECT_EQ(SignalType::Candidate, fromObject.type);
    EXPECT_EQ("candidate:1 1 UDP 1 10.0.0.1 5000 typ host", fromObject.candidate.candidate);
    EXPECT_EQ("0", fromObject.candidate.mid);

    auto fromString = DecodeSignal(json{{"type", "candidate"}, {"candidate", "candidate:2"}, {"sdpMid", "video"}});
    EXPECT_EQ("candidate:2", fromString.candidate.candidate);
    EXPECT_EQ("video", fromString.candidate.mid);
}

TEST(Protocol, BadSignalsAreRejected) {
    EXPECT_THROW(DecodeSignal(json("offer")), ProtocolError);
    EXPECT_THROW(DecodeSignal(json{{"type", "pranswer"}, {"sdp", ""}}), ProtocolError);
    EXPECT_THROW(DecodeSignal(json{{"type", "offer"}}), ProtocolError);
    EXPECT_THROW(DecodeSignal(json{{"type", "candidate"}, {"candidate", 5}}), ProtocolError);
}
