#pragma once

#include "fwd.hpp"
#include "options.hpp"
#include "router.hpp"

#include <rtc/rtc.hpp>

#include <memory>
#include <unordered_map>

namespace roomlink {

// Accepts signaling WebSockets and feeds every socket event into the
// router through a single Loop.
class Server {
public:
    explicit Server(ServerOptions options);

    void Run();
    void Stop();

private:
    void WsOpenCallback(std::shared_ptr<rtc::WebSocket>&& ws);
    void WsClosedCallback(std::shared_ptr<rtc::WebSocket>&& ws);
    void WsOnMessageCallback(std::shared_ptr<rtc::WebSocket>&& ws, rtc::message_variant&& message);

private:
    ServerOptions Options_;
    std::shared_ptr<Loop> Loop_;
    std::shared_ptr<Registry> Registry_;
    Router Router_;
    std::shared_ptr<rtc::WebSocketServer> WsServer_;

    // Loop thread only.
    std::unordered_map<std::shared_ptr<rtc::WebSocket>, ParticipantId> Connections_;
};

} // namespace roomlink
