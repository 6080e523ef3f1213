#include "server.hpp"

#include "channel.hpp"
#include "loop.hpp"

#include <functional>
#include <iostream>
#include <thread>

namespace roomlink {

Server::Server(ServerOptions options)
    : Options_(std::move(options))
    , Loop_(std::make_shared<Loop>())
    , Registry_(std::make_shared<Registry>())
    , Router_(Registry_)
{ }

void Server::WsOpenCallback(std::shared_ptr<rtc::WebSocket>&& ws) {
    Loop_->EnqueueTask([this, ws = std::move(ws)]
    {
        auto id = Router_.Connect(std::make_shared<WebSocketChannel>(ws));
        Connections_.emplace(ws, id);

        if (auto address = ws->remoteAddress()) {
            std::cout << "[Client " << id << "] WebSocket connected from " << *address << std::endl;
        }
    });
}

void Server::WsClosedCallback(std::shared_ptr<rtc::WebSocket>&& ws) {
    Loop_->EnqueueTask([this, ws = std::move(ws)]
    {
        auto it = Connections_.find(ws);
        if (it == Connections_.end()) {
            return;
        }

        auto id = it->second;
        Connections_.erase(it);
        Router_.Disconnect(id);
    });
}

void Server::WsOnMessageCallback(std::shared_ptr<rtc::WebSocket>&& ws, rtc::message_variant&& message) {
    Loop_->EnqueueTask([this, ws = std::move(ws), message = std::move(message)]
    {
        auto pstr = std::get_if<std::string>(&message);
        if (!pstr) {
            std::cerr << "Ignoring binary signaling frame" << std::endl;
            return;
        }

        auto it = Connections_.find(ws);
        if (it == Connections_.end()) {
            std::cerr << "Client not found for signaling message" << std::endl;
            return;
        }

        Router_.HandleMessage(it->second, *pstr);
    });
}

void Server::Run() {
    rtc::WebSocketServer::Configuration wsCfg;
    wsCfg.port = Options_.port;
    wsCfg.enableTls = false;
    if (!Options_.bindAddress.empty()) {
        wsCfg.bindAddress = Options_.bindAddress;
    }

    std::thread t{std::bind(&Loop::Run, Loop_)};

    WsServer_ = std::make_shared<rtc::WebSocketServer>(wsCfg);
    WsServer_->onClient([this](std::shared_ptr<rtc::WebSocket> ws) {
        ws->onOpen([this, ws]() mutable {
            WsOpenCallback(std::move(ws));
        });

        ws->onClosed([this, wws = std::weak_ptr<rtc::WebSocket>(ws)]() {
            if (auto ws = wws.lock()) {
                WsClosedCallback(std::move(ws));
            }
        });

        ws->onError([](std::string error) {
            std::cerr << "WebSocket error: " << error << std::endl;
        });

        ws->onMessage([this, wws = std::weak_ptr<rtc::WebSocket>(ws)](rtc::message_variant message) {
            if (auto ws = wws.lock()) {
                WsOnMessageCallback(std::move(ws), std::move(message));
            }
        });
    });

    std::cout << "Signaling server listening on ws://"
              << (Options_.bindAddress.empty() ? "0.0.0.0" : Options_.bindAddress)
              << ":" << WsServer_->port() << std::endl;
    t.join();

    WsServer_->stop();
}

void Server::Stop() {
    Loop_->Stop();
}

} // namespace roomlink
