#include "client.hpp"

#include "channel.hpp"
#include "rtc_transport.hpp"

#include <iostream>

namespace roomlink {

namespace {

constexpr std::chrono::seconds kLocationInterval{10};

} // namespace

Client::Client(ClientOptions options)
    : Options_(std::move(options))
    , Media_(Options_.audio, Options_.video)
    , Ws_(std::make_shared<rtc::WebSocket>())
{
    SessionClient::Collaborators collaborators;
    collaborators.media = &Media_;
    collaborators.locations = &Locations_;
    collaborators.videos = &Videos_;

    LinkConfig linkConfig;
    linkConfig.negotiationTimeout = Options_.negotiationTimeout;

    Session_ = std::make_unique<SessionClient>(
        Loop_, std::make_shared<WebSocketChannel>(Ws_), MakeRtcTransportFactory(Options_.iceServers),
        collaborators, linkConfig);

    Session_->OnLinkStateChange([](const ParticipantId& remoteId, LinkState state) {
        if (state == LinkState::Connected) {
            std::cout << "Connected to " << remoteId << std::endl;
        } else if (state == LinkState::Failed) {
            std::cerr << "Connection failed with " << remoteId << std::endl;
        }
    });
}

Client::~Client() {
    Ws_->resetCallbacks();
    if (!Ws_->isClosed()) {
        Ws_->close();
    }
    // Links hold transports whose callbacks post into Loop_.
    Session_.reset();
}

void Client::WsOpenCallback() {
    Loop_.EnqueueTask([this] {
        std::cout << "Connected to server " << Options_.serverUrl << std::endl;
        if (!Session_->JoinRoom(Options_.room)) {
            Stop();
            return;
        }
        if (!Session_->StartLocalMedia()) {
            std::cerr << "Continuing without local media" << std::endl;
        }
        if (Options_.location) {
            SchedulePublishLocation();
        }
    });
}

void Client::WsClosedCallback() {
    Loop_.EnqueueTask([this] {
        Session_->HandleDisconnect();
        Stop();
    });
}

void Client::WsOnMessageCallback(rtc::message_variant&& message) {
    Loop_.EnqueueTask([this, message = std::move(message)] {
        auto pstr = std::get_if<std::string>(&message);
        if (!pstr) {
            return;
        }
        Session_->HandleMessage(*pstr);
    });
}

void Client::SchedulePublishLocation() {
    Session_->PublishLocation(*Options_.location);
    Loop_.EnqueueDelayedTask(kLocationInterval, [this] {
        if (Session_->CurrentRoom()) {
            SchedulePublishLocation();
        }
    });
}

void Client::Run() {
    Ws_->onOpen([this]() {
        WsOpenCallback();
    });

    Ws_->onClosed([this]() {
        WsClosedCallback();
    });

    Ws_->onError([](std::string error) {
        std::cerr << "WebSocket error: " << error << std::endl;
    });

    Ws_->onMessage([this](rtc::message_variant message) {
        WsOnMessageCallback(std::move(message));
    });

    std::cout << "Connecting to " << Options_.serverUrl << std::endl;
    Ws_->open(Options_.serverUrl);

    Loop_.Run();
}

void Client::Stop() {
    Loop_.Stop();
}

} // namespace roomlink
