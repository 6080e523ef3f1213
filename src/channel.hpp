#pragma once

#include "fwd.hpp"

#include <memory>
#include <string>

namespace roomlink {

// One end of a signaling connection: the router holds one per connected
// participant, the session client holds the one to the router.
class Channel {
public:
    virtual ~Channel() = default;

    virtual void Send(const std::string& message) = 0;
    virtual void Close() = 0;
};

class WebSocketChannel : public Channel {
public:
    explicit WebSocketChannel(std::shared_ptr<rtc::WebSocket> ws);

    void Send(const std::string& message) override;
    void Close() override;

private:
    std::shared_ptr<rtc::WebSocket> Ws_;
};

} // namespace roomlink
