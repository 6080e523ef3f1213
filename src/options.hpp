#pragma once

#include "protocol.hpp"

#include <rtc/rtc.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace roomlink {

class OptionsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ServerOptions {
    uint16_t port = 8000;
    std::string bindAddress;
    std::string logLevel = "info";
    bool help = false;
};

struct ClientOptions {
    std::string serverUrl = "ws://127.0.0.1:8000";
    std::string room;
    std::vector<std::string> iceServers = {"stun:stun.l.google.com:19302"};
    // Zero disables the negotiation timeout.
    std::chrono::milliseconds negotiationTimeout{30000};
    bool audio = true;
    bool video = true;
    std::optional<LatLng> location;
    std::string logLevel = "info";
    bool help = false;
};

// Precedence, lowest first: built-in defaults, --config=<file.json>, the
// PORT environment variable (server only), remaining command-line flags.
// Throws OptionsError on unknown flags or bad values.
ServerOptions ParseServerOptions(const std::vector<std::string>& args);
ClientOptions ParseClientOptions(const std::vector<std::string>& args);

std::string ServerUsage();
std::string ClientUsage();

rtc::LogLevel ParseLogLevel(const std::string& level);

} // namespace roomlink
