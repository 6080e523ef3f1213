#include "channel.hpp"

#include <rtc/rtc.hpp>

#include <iostream>

namespace roomlink {

WebSocketChannel::WebSocketChannel(std::shared_ptr<rtc::WebSocket> ws)
    : Ws_(std::move(ws))
{ }

void WebSocketChannel::Send(const std::string& message) {
    if (!Ws_->isOpen()) {
        std::cerr << "Dropping message on closed WebSocket" << std::endl;
        return;
    }

    try {
        Ws_->send(message);
    } catch (const std::exception& e) {
        std::cerr << "WebSocket send failed: " << e.what() << std::endl;
    }
}

void WebSocketChannel::Close() {
    if (!Ws_->isClosed()) {
        Ws_->close();
    }
}

} // namespace roomlink
