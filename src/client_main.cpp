#include "client.hpp"
#include "options.hpp"

#include <rtc/rtc.hpp>

#include <iostream>

int main(int argc, char** argv) {
    roomlink::ClientOptions options;
    try {
        options = roomlink::ParseClientOptions({argv + 1, argv + argc});
    } catch (const roomlink::OptionsError& e) {
        std::cerr << e.what() << std::endl << roomlink::ClientUsage();
        return 1;
    }

    if (options.help) {
        std::cout << roomlink::ClientUsage();
        return 0;
    }
    if (options.room.empty()) {
        std::cerr << "--room is required" << std::endl << roomlink::ClientUsage();
        return 1;
    }

    rtc::InitLogger(roomlink::ParseLogLevel(options.logLevel));
    roomlink::Client client(options);
    client.Run();

    return 0;
}
