#include "options.hpp"
#include "server.hpp"

#include <rtc/rtc.hpp>

#include <iostream>

int main(int argc, char** argv) {
    roomlink::ServerOptions options;
    try {
        options = roomlink::ParseServerOptions({argv + 1, argv + argc});
    } catch (const roomlink::OptionsError& e) {
        std::cerr << e.what() << std::endl << roomlink::ServerUsage();
        return 1;
    }

    if (options.help) {
        std::cout << roomlink::ServerUsage();
        return 0;
    }

    rtc::InitLogger(roomlink::ParseLogLevel(options.logLevel));
    roomlink::Server server(options);
    server.Run();

    return 0;
}
