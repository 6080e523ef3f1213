#include "options.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace roomlink;
using namespace std::chrono_literals;

namespace {

// Temporary JSON config file removed on scope exit.
class ConfigFile {
public:
    explicit ConfigFile(const std::string& contents)
        : Path_(::testing::TempDir() + "roomlink_options_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json")
    {
        std::ofstream(Path_) << contents;
    }

    ~ConfigFile() {
        std::remove(Path_.c_str());
    }

    const std::string& Path() const {
        return Path_;
    }

private:
    std::string Path_;
};

// Unsets PORT for the duration of a test.
class ScopedPort {
public:
    explicit ScopedPort(const char* value) {
        if (value) {
            setenv("PORT", value, 1);
        } else {
            unsetenv("PORT");
        }
    }

    ~ScopedPort() {
        unsetenv("PORT");
    }
};

} // namespace

TEST(ServerOptions, Defaults) {
    ScopedPort port(nullptr);
    auto opts = ParseServerOptions({});

    EXPECT_EQ(8000, opts.port);
    EXPECT_EQ("", opts.bindAddress);
    EXPECT_EQ("info", opts.logLevel);
    EXPECT_FALSE(opts.help);
}

TEST(ServerOptions, PortPrecedence) {
    ConfigFile config(R"({"port": 9000, "bind_address": "127.0.0.1"})");

    {
        ScopedPort port(nullptr);
        auto opts = ParseServerOptions({"--config=" + config.Path()});
        EXPECT_EQ(9000, opts.port);
        EXPECT_EQ("127.0.0.1", opts.bindAddress);
    }
    {
        ScopedPort port("9100");
        EXPECT_EQ(9100, ParseServerOptions({"--config=" + config.Path()}).port);
        EXPECT_EQ(9200, ParseServerOptions({"--config=" + config.Path(), "--port", "9200"}).port);
    }
}

TEST(ServerOptions, BadValuesAreRejected) {
    ScopedPort port(nullptr);
    EXPECT_THROW(ParseServerOptions({"--port=0"}), OptionsError);
    EXPECT_THROW(ParseServerOptions({"--port=70000"}), OptionsError);
    EXPECT_THROW(ParseServerOptions({"--port=80x"}), OptionsError);
    EXPECT_THROW(ParseServerOptions({"--log_level=loud"}), OptionsError);
    EXPECT_THROW(ParseServerOptions({"--room=r"}), OptionsError);
    EXPECT_THROW(ParseServerOptions({"positional"}), OptionsError);
    EXPECT_THROW(ParseServerOptions({"--port"}), OptionsError);
    EXPECT_THROW(ParseServerOptions({"--config=/nonexistent/roomlink.json"}), OptionsError);
}

TEST(ServerOptions, HelpFlag) {
    ScopedPort port(nullptr);
    EXPECT_TRUE(ParseServerOptions({"--help"}).help);
}

TEST(ClientOptions, Defaults) {
    auto opts = ParseClientOptions({});

    EXPECT_EQ("ws://127.0.0.1:8000", opts.serverUrl);
    EXPECT_EQ("", opts.room);
    EXPECT_EQ(std::vector<std::string>{"stun:stun.l.google.com:19302"}, opts.iceServers);
    EXPECT_EQ(30000ms, opts.negotiationTimeout);
    EXPECT_TRUE(opts.audio);
    EXPECT_TRUE(opts.video);
    EXPECT_FALSE(opts.location);
}

TEST(ClientOptions, CommandLineFlags) {
    auto opts = ParseClientOptions({
        "--server=ws://signal.example:9000",
        "--room", " standup ",
        "--timeout_ms=0",
        "--no-video",
        "--location=52.52,13.405",
    });

    EXPECT_EQ("ws://signal.example:9000", opts.serverUrl);
    EXPECT_EQ("standup", opts.room);
    EXPECT_EQ(0ms, opts.negotiationTimeout);
    EXPECT_TRUE(opts.audio);
    EXPECT_FALSE(opts.video);
    ASSERT_TRUE(opts.location);
    EXPECT_DOUBLE_EQ(52.52, opts.location->lat);
    EXPECT_DOUBLE_EQ(13.405, opts.location->lng);
}

TEST(ClientOptions, IceServersReplacePerLayer) {
    ConfigFile config(R"({"room": "from-config", "ice_servers": ["stun:a", "stun:b"], "audio": false})");

    auto fromConfig = ParseClientOptions({"--config=" + config.Path()});
    EXPECT_EQ((std::vector<std::string>{"stun:a", "stun:b"}), fromConfig.iceServers);
    EXPECT_EQ("from-config", fromConfig.room);
    EXPECT_FALSE(fromConfig.audio);

    auto overridden = ParseClientOptions({
        "--config=" + config.Path(),
        "--ice_server=turn:c",
        "--ice_server=turn:d",
        "--room=cli",
    });
    EXPECT_EQ((std::vector<std::string>{"turn:c", "turn:d"}), overridden.iceServers);
    EXPECT_EQ("cli", overridden.room);
}

TEST(ClientOptions, BadValuesAreRejected) {
    EXPECT_THROW(ParseClientOptions({"--location=91,0"}), OptionsError);
    EXPECT_THROW(ParseClientOptions({"--location=10"}), OptionsError);
    EXPECT_THROW(ParseClientOptions({"--location=north,east"}), OptionsError);
    EXPECT_THROW(ParseClientOptions({"--timeout_ms=-5"}), OptionsError);
    EXPECT_THROW(ParseClientOptions({"--audio=maybe"}), OptionsError);
    EXPECT_THROW(ParseClientOptions({"--port=8000"}), OptionsError);

    ConfigFile notAnObject("[1, 2]");
    EXPECT_THROW(ParseClientOptions({"--config=" + notAnObject.Path()}), OptionsError);
}

TEST(Options, ConfigNumberOverflowIsAnOptionsError) {
    ConfigFile config(R"({"port": 1e400})");
    EXPECT_THROW(ParseServerOptions({"--config=" + config.Path()}), OptionsError);
}

TEST(Options, LogLevels) {
    EXPECT_EQ(rtc::LogLevel::Warning, ParseLogLevel("warning"));
    EXPECT_EQ(rtc::LogLevel::Verbose, ParseLogLevel("verbose"));
    EXPECT_THROW(ParseLogLevel("chatty"), OptionsError);
}
