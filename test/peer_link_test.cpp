#include "fakes.hpp"
#include "peer_link.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace roomlink;
using namespace roomlink::test;
using namespace std::chrono_literals;

namespace {

class PeerLinkTest : public ::testing::Test {
protected:
    std::shared_ptr<PeerLink> MakeLink(const ParticipantId& local, const ParticipantId& remote,
                                       std::chrono::milliseconds timeout = 0ms) {
        Transport_ = std::make_shared<FakeTransportState>();
        Transport_->name = local + remote;

        PeerLink::Callbacks callbacks;
        callbacks.sendSignal = [this](const ParticipantId& to, const Signal& signal) {
            Sent_.emplace_back(to, signal);
        };
        callbacks.remoteTrack = [this](const ParticipantId& remoteId, const RemoteTrack& track) {
            Tracks_.emplace_back(remoteId, track.kind);
        };
        callbacks.stateChanged = [this](const ParticipantId&, LinkState state) {
            States_.push_back(state);
        };

        return PeerLink::Create(local, remote, std::make_unique<FakeTransport>(Transport_),
                                Stream_, Loop_, LinkConfig{timeout}, std::move(callbacks));
    }

    std::vector<Signal> SentOfType(SignalType type) const {
        std::vector<Signal> result;
        for (const auto& [to, signal] : Sent_) {
            if (signal.type == type) {
                result.push_back(signal);
            }
        }
        return result;
    }

    static Signal RemoteOffer() {
        return Signal::FromDescription({SignalType::Offer, "remote-offer"});
    }

    static Signal RemoteAnswer() {
        return Signal::FromDescription({SignalType::Answer, "remote-answer"});
    }

    static Signal RemoteCandidate(const std::string& candidate) {
        return Signal::FromCandidate({candidate, "0"});
    }

    void EmitTransportState(TransportState state) {
        ASSERT_NE(nullptr, Transport_->transport);
        Transport_->transport->EmitState(state);
        Pump(Loop_);
    }

    Loop Loop_;
    std::shared_ptr<MediaStream> Stream_ = FakeMediaSource().Acquire();
    std::shared_ptr<FakeTransportState> Transport_;
    std::vector<std::pair<ParticipantId, Signal>> Sent_;
    std::vector<std::pair<ParticipantId, std::string>> Tracks_;
    std::vector<LinkState> States_;
};

} // namespace

TEST_F(PeerLinkTest, LinkToSelfIsRejected) {
    EXPECT_THROW(MakeLink("a", "a"), std::invalid_argument);
}

TEST_F(PeerLinkTest, LocalTracksAreAttachedOnCreate) {
    auto link = MakeLink("a", "b");
    EXPECT_EQ(2u, Transport_->attachedTracks);
    EXPECT_EQ(LinkState::Idle, link->State());
    EXPECT_FALSE(link->Negotiated());
}

TEST_F(PeerLinkTest, OfferMovesToAwaitingAnswer) {
    auto link = MakeLink("a", "b");
    link->Offer();

    EXPECT_EQ(LinkState::AwaitingAnswer, link->State());
    EXPECT_TRUE(link->Negotiated());
    EXPECT_TRUE(Transport_->hasLocalOffer);
    EXPECT_EQ((std::vector<LinkState>{LinkState::Offering, LinkState::AwaitingAnswer}), States_);

    ASSERT_EQ(1u, Sent_.size());
    EXPECT_EQ("b", Sent_[0].first);
    EXPECT_EQ(SignalType::Offer, Sent_[0].second.type);
    EXPECT_EQ(Transport_->local->sdp, Sent_[0].second.sdp);

    // A second offer while one is outstanding is a no-op.
    link->Offer();
    EXPECT_EQ(1u, Sent_.size());
}

TEST_F(PeerLinkTest, AnswerThenConnected) {
    auto link = MakeLink("a", "b");
    link->Offer();
    link->HandleSignal(RemoteAnswer());

    EXPECT_TRUE(link->HasRemoteDescription());
    EXPECT_EQ("remote-answer", Transport_->remote->sdp);
    EXPECT_EQ(LinkState::AwaitingAnswer, link->State());

    EmitTransportState(TransportState::Connected);
    EXPECT_EQ(LinkState::Connected, link->State());
}

TEST_F(PeerLinkTest, IncomingOfferIsAnswered) {
    auto link = MakeLink("b", "a");
    link->HandleSignal(RemoteOffer());

    auto answers = SentOfType(SignalType::Answer);
    ASSERT_EQ(1u, answers.size());
    EXPECT_EQ(Transport_->local->sdp, answers[0].sdp);
    EXPECT_TRUE(link->Negotiated());
    EXPECT_EQ(LinkState::AwaitingAnswer, link->State());

    EmitTransportState(TransportState::Connected);
    EXPECT_EQ(LinkState::Connected, link->State());
}

// What goes on the wire is the description the transport applied, not the
// one it first created.
TEST_F(PeerLinkTest, SentDescriptionsAreTheAppliedOnes) {
    auto offerer = MakeLink("a", "b");
    offerer->Offer();

    auto offers = SentOfType(SignalType::Offer);
    ASSERT_EQ(1u, offers.size());
    EXPECT_EQ("offer-ab-1 applied", offers[0].sdp);
    EXPECT_EQ(Transport_->local->sdp, offers[0].sdp);

    auto answerer = MakeLink("b", "a");
    answerer->HandleSignal(RemoteOffer());

    auto answers = SentOfType(SignalType::Answer);
    ASSERT_EQ(1u, answers.size());
    EXPECT_EQ("answer-ba-1 applied", answers[0].sdp);
    EXPECT_EQ(Transport_->local->sdp, answers[0].sdp);
}

// Candidates that arrive before the remote description are held and then
// applied in arrival order, none lost.
TEST_F(PeerLinkTest, EarlyCandidatesAreBufferedInOrder) {
    auto link = MakeLink("a", "b");
    link->Offer();
    link->HandleSignal(RemoteCandidate("c1"));
    link->HandleSignal(RemoteCandidate("c2"));
    link->HandleSignal(RemoteCandidate("c3"));

    EXPECT_EQ(3u, link->PendingCandidates());
    EXPECT_TRUE(Transport_->added.empty());

    link->HandleSignal(RemoteAnswer());
    link->HandleSignal(RemoteCandidate("c4"));

    EXPECT_EQ(0u, link->PendingCandidates());
    ASSERT_EQ(4u, Transport_->added.size());
    EXPECT_EQ("c1", Transport_->added[0].candidate);
    EXPECT_EQ("c2", Transport_->added[1].candidate);
    EXPECT_EQ("c3", Transport_->added[2].candidate);
    EXPECT_EQ("c4", Transport_->added[3].candidate);
}

TEST_F(PeerLinkTest, RejectedCandidateDoesNotStopTheRest) {
    auto link = MakeLink("b", "a");
    Transport_->rejectedCandidates.insert("bad");
    link->HandleSignal(RemoteCandidate("c1"));
    link->HandleSignal(RemoteCandidate("bad"));
    link->HandleSignal(RemoteOffer());
    link->HandleSignal(RemoteCandidate("c2"));

    ASSERT_EQ(2u, Transport_->added.size());
    EXPECT_EQ("c1", Transport_->added[0].candidate);
    EXPECT_EQ("c2", Transport_->added[1].candidate);
    EXPECT_EQ(LinkState::AwaitingAnswer, link->State());
}

TEST_F(PeerLinkTest, PoliteSideYieldsToCollidingOffer) {
    auto link = MakeLink("1", "2");
    ASSERT_TRUE(link->Polite());
    link->Offer();
    link->HandleSignal(RemoteOffer());

    EXPECT_EQ(1, Transport_->rollbacks);
    EXPECT_EQ("remote-offer", Transport_->remote->sdp);
    EXPECT_EQ(1u, SentOfType(SignalType::Answer).size());
}

TEST_F(PeerLinkTest, ImpoliteSideIgnoresCollidingOffer) {
    auto link = MakeLink("2", "1");
    ASSERT_FALSE(link->Polite());
    link->Offer();
    link->HandleSignal(RemoteOffer());

    EXPECT_EQ(0, Transport_->rollbacks);
    EXPECT_FALSE(Transport_->remote);
    EXPECT_TRUE(SentOfType(SignalType::Answer).empty());

    // Its own offer is still answered normally.
    link->HandleSignal(RemoteAnswer());
    EXPECT_TRUE(link->HasRemoteDescription());
}

TEST_F(PeerLinkTest, UnexpectedAnswerDoesNotBreakLink) {
    auto link = MakeLink("a", "b");
    link->HandleSignal(RemoteAnswer());

    EXPECT_EQ(LinkState::Idle, link->State());
    EXPECT_FALSE(link->HasRemoteDescription());

    link->Offer();
    EXPECT_EQ(LinkState::AwaitingAnswer, link->State());
}

TEST_F(PeerLinkTest, BadRemoteOfferIsNotAnswered) {
    auto link = MakeLink("b", "a");
    Transport_->failSetRemote = true;
    link->HandleSignal(RemoteOffer());

    EXPECT_TRUE(Sent_.empty());
    EXPECT_EQ(LinkState::Idle, link->State());
}

TEST_F(PeerLinkTest, LocalCandidatesAreSignalled) {
    auto link = MakeLink("a", "b");
    link->Offer();
    Transport_->transport->EmitCandidate({"local-1", "0"});
    EXPECT_TRUE(SentOfType(SignalType::Candidate).empty());

    Pump(Loop_);
    auto candidates = SentOfType(SignalType::Candidate);
    ASSERT_EQ(1u, candidates.size());
    EXPECT_EQ("local-1", candidates[0].candidate.candidate);
    EXPECT_EQ("0", candidates[0].candidate.mid);
}

TEST_F(PeerLinkTest, RemoteTracksAreReported) {
    auto link = MakeLink("b", "a");
    link->HandleSignal(RemoteOffer());
    Transport_->transport->EmitTrack({"video", "video", nullptr});
    Pump(Loop_);

    ASSERT_EQ(1u, Tracks_.size());
    EXPECT_EQ("a", Tracks_[0].first);
    EXPECT_EQ("video", Tracks_[0].second);
}

TEST_F(PeerLinkTest, IceFailureRestartsOnceThenFails) {
    auto link = MakeLink("a", "b");
    link->Offer();
    link->HandleSignal(RemoteAnswer());

    EmitTransportState(TransportState::Failed);
    EXPECT_EQ(1, Transport_->restarts);
    EXPECT_EQ(LinkState::AwaitingAnswer, link->State());
    EXPECT_FALSE(link->HasRemoteDescription());
    EXPECT_EQ(2u, SentOfType(SignalType::Offer).size());

    EmitTransportState(TransportState::Failed);
    EXPECT_EQ(1, Transport_->restarts);
    EXPECT_EQ(LinkState::Failed, link->State());
    EXPECT_TRUE(Transport_->closed);
}

TEST_F(PeerLinkTest, AnsweringSideWaitsForNewOfferAfterRestart) {
    auto link = MakeLink("b", "a");
    link->HandleSignal(RemoteOffer());
    Sent_.clear();

    EmitTransportState(TransportState::Failed);

    EXPECT_EQ(1, Transport_->restarts);
    EXPECT_EQ(LinkState::Idle, link->State());
    EXPECT_TRUE(Sent_.empty());

    link->HandleSignal(RemoteOffer());
    EXPECT_EQ(1u, SentOfType(SignalType::Answer).size());
}

TEST_F(PeerLinkTest, NegotiationTimesOut) {
    auto link = MakeLink("a", "b", 5ms);
    link->Offer();

    std::this_thread::sleep_for(20ms);
    Pump(Loop_);

    EXPECT_EQ(LinkState::Failed, link->State());
    EXPECT_TRUE(Transport_->closed);
}

TEST_F(PeerLinkTest, ConnectedLinkIgnoresStaleTimeout) {
    auto link = MakeLink("a", "b", 5ms);
    link->Offer();
    link->HandleSignal(RemoteAnswer());
    EmitTransportState(TransportState::Connected);

    std::this_thread::sleep_for(20ms);
    Pump(Loop_);

    EXPECT_EQ(LinkState::Connected, link->State());
    EXPECT_FALSE(Transport_->closed);
}

TEST_F(PeerLinkTest, CloseIsIdempotent) {
    auto link = MakeLink("a", "b");
    link->Offer();
    States_.clear();

    link->Close();
    link->Close();

    EXPECT_EQ(LinkState::Closed, link->State());
    EXPECT_TRUE(Transport_->closed);
    EXPECT_EQ(std::vector<LinkState>{LinkState::Closed}, States_);
}

TEST_F(PeerLinkTest, ClosedLinkIgnoresEverything) {
    auto link = MakeLink("a", "b");
    link->Close();
    Sent_.clear();

    link->HandleSignal(RemoteOffer());
    link->Offer();
    Transport_->transport->EmitCandidate({"late", "0"});
    Pump(Loop_);

    EXPECT_TRUE(Sent_.empty());
    EXPECT_EQ(LinkState::Closed, link->State());
}

TEST_F(PeerLinkTest, CallbacksAfterDestructionAreDropped) {
    auto link = MakeLink("a", "b");
    auto* transport = Transport_->transport;
    transport->EmitCandidate({"late", "0"});
    link.reset();

    EXPECT_TRUE(Transport_->closed);
    Pump(Loop_);
    EXPECT_TRUE(Sent_.empty());
}
