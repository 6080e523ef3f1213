#pragma once

#include "display.hpp"
#include "fwd.hpp"
#include "loop.hpp"
#include "media.hpp"
#include "options.hpp"
#include "session_client.hpp"

#include <rtc/rtc.hpp>

#include <memory>

namespace roomlink {

// Headless participant: connects to the signaling server, joins one room,
// declares local media and keeps publishing a fixed position.
class Client {
public:
    explicit Client(ClientOptions options);
    ~Client();

    // Blocks until the signaling connection closes or Stop() is called.
    void Run();
    void Stop();

private:
    void WsOpenCallback();
    void WsClosedCallback();
    void WsOnMessageCallback(rtc::message_variant&& message);
    void SchedulePublishLocation();

private:
    ClientOptions Options_;
    Loop Loop_;
    StaticMediaSource Media_;
    ConsoleLocationDisplay Locations_;
    ConsoleVideoDisplay Videos_;
    std::shared_ptr<rtc::WebSocket> Ws_;
    std::unique_ptr<SessionClient> Session_;
};

} // namespace roomlink
