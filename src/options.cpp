#include "options.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <set>

namespace roomlink {

namespace {

using json = nlohmann::json;

struct Setting {
    std::string key;
    std::string value;
};

const std::set<std::string> kBooleanFlags = {
    "help", "audio", "no-audio", "video", "no-video"
};

std::string Trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

bool ParseBool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no") {
        return false;
    }
    throw OptionsError("invalid boolean for '" + key + "': " + value);
}

long long ParseInteger(const std::string& key, const std::string& value, long long min, long long max) {
    size_t consumed = 0;
    long long result = 0;
    try {
        result = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw OptionsError("invalid number for '" + key + "': " + value);
    }
    if (consumed != value.size() || result < min || result > max) {
        throw OptionsError("invalid number for '" + key + "': " + value);
    }
    return result;
}

LatLng ParseLatLng(const std::string& value) {
    auto comma = value.find(',');
    if (comma == std::string::npos) {
        throw OptionsError("location must be <lat>,<lng>: " + value);
    }

    LatLng position;
    try {
        size_t consumed = 0;
        auto lat = Trim(value.substr(0, comma));
        auto lng = Trim(value.substr(comma + 1));
        position.lat = std::stod(lat, &consumed);
        if (consumed != lat.size()) {
            throw OptionsError("bad latitude");
        }
        position.lng = std::stod(lng, &consumed);
        if (consumed != lng.size()) {
            throw OptionsError("bad longitude");
        }
    } catch (const std::exception&) {
        throw OptionsError("location must be <lat>,<lng>: " + value);
    }

    if (position.lat < -90.0 || position.lat > 90.0 || position.lng < -180.0 || position.lng > 180.0) {
        throw OptionsError("location out of range: " + value);
    }
    return position;
}

std::string ScalarToString(const std::string& key, const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    if (value.is_number()) {
        return value.dump();
    }
    throw OptionsError("config value for '" + key + "' must be a scalar");
}

// Splits "--key=value", "--key value" and boolean "--key" arguments.
// A "--config" entry is returned like any other setting.
std::vector<Setting> SplitArguments(const std::vector<std::string>& args) {
    std::vector<Setting> settings;
    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg.rfind("--", 0) != 0 || arg.size() == 2) {
            throw OptionsError("unexpected argument: " + arg);
        }

        auto body = arg.substr(2);
        auto eq = body.find('=');
        if (eq != std::string::npos) {
            settings.push_back({body.substr(0, eq), body.substr(eq + 1)});
        } else if (kBooleanFlags.count(body)) {
            settings.push_back({body, "true"});
        } else if (i + 1 < args.size()) {
            settings.push_back({body, args[++i]});
        } else {
            throw OptionsError("missing value for --" + body);
        }
    }
    return settings;
}

// Loads a flat JSON object of settings. Arrays are expanded to one setting
// per element under the singular key ("ice_servers" -> "ice_server").
std::vector<Setting> LoadConfigFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw OptionsError("cannot open config file: " + path);
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::exception& e) {
        throw OptionsError("invalid config file " + path + ": " + e.what());
    }
    if (!j.is_object()) {
        throw OptionsError("config file must hold a JSON object: " + path);
    }

    std::vector<Setting> settings;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.value().is_array()) {
            auto key = it.key();
            if (!key.empty() && key.back() == 's') {
                key.pop_back();
            }
            for (const auto& element : it.value()) {
                settings.push_back({key, ScalarToString(it.key(), element)});
            }
        } else {
            settings.push_back({it.key(), ScalarToString(it.key(), it.value())});
        }
    }
    return settings;
}

template <class Apply>
void ApplyLayers(const std::vector<std::string>& args, Apply&& apply, const char* env = nullptr) {
    auto settings = SplitArguments(args);

    auto config = std::find_if(settings.begin(), settings.end(),
                               [](const Setting& s) { return s.key == "config"; });
    if (config != settings.end()) {
        for (const auto& setting : LoadConfigFile(config->value)) {
            apply(setting, false);
        }
    }

    if (env) {
        if (const char* value = std::getenv(env)) {
            apply(Setting{"port", value}, false);
        }
    }

    for (const auto& setting : settings) {
        if (setting.key != "config") {
            apply(setting, true);
        }
    }
}

} // namespace

ServerOptions ParseServerOptions(const std::vector<std::string>& args) {
    ServerOptions opts;
    ApplyLayers(args, [&](const Setting& s, bool) {
        if (s.key == "port") {
            opts.port = static_cast<uint16_t>(ParseInteger(s.key, s.value, 1, 65535));
        } else if (s.key == "bind_address") {
            opts.bindAddress = s.value;
        } else if (s.key == "log_level") {
            ParseLogLevel(s.value);
            opts.logLevel = s.value;
        } else if (s.key == "help") {
            opts.help = ParseBool(s.key, s.value);
        } else {
            throw OptionsError("unknown server option: " + s.key);
        }
    }, "PORT");
    return opts;
}

ClientOptions ParseClientOptions(const std::vector<std::string>& args) {
    ClientOptions opts;
    bool iceServersFromConfig = false;
    bool iceServersFromCommandLine = false;

    ApplyLayers(args, [&](const Setting& s, bool commandLine) {
        if (s.key == "server") {
            opts.serverUrl = s.value;
        } else if (s.key == "room") {
            opts.room = Trim(s.value);
        } else if (s.key == "ice_server") {
            // The first setting from each layer replaces the inherited list.
            bool& seen = commandLine ? iceServersFromCommandLine : iceServersFromConfig;
            if (!seen) {
                opts.iceServers.clear();
                seen = true;
            }
            opts.iceServers.push_back(s.value);
        } else if (s.key == "timeout_ms") {
            opts.negotiationTimeout = std::chrono::milliseconds(
                ParseInteger(s.key, s.value, 0, 24LL * 60 * 60 * 1000));
        } else if (s.key == "audio" || s.key == "video") {
            (s.key == "audio" ? opts.audio : opts.video) = ParseBool(s.key, s.value);
        } else if (s.key == "no-audio") {
            opts.audio = !ParseBool(s.key, s.value);
        } else if (s.key == "no-video") {
            opts.video = !ParseBool(s.key, s.value);
        } else if (s.key == "location") {
            opts.location = ParseLatLng(s.value);
        } else if (s.key == "log_level") {
            ParseLogLevel(s.value);
            opts.logLevel = s.value;
        } else if (s.key == "help") {
            opts.help = ParseBool(s.key, s.value);
        } else {
            throw OptionsError("unknown client option: " + s.key);
        }
    });
    return opts;
}

std::string ServerUsage() {
    return
        "Usage: roomlink-server [options]\n"
        "  --config=<path>          Load options from a JSON config file\n"
        "  --port=<port>            Listening port (default: 8000, or $PORT)\n"
        "  --bind_address=<addr>    Address to bind (default: all interfaces)\n"
        "  --log_level=<level>      none|fatal|error|warning|info|debug|verbose (default: info)\n"
        "  --help                   Show this help message\n";
}

std::string ClientUsage() {
    return
        "Usage: roomlink-client --room=<name> [options]\n"
        "  --config=<path>          Load options from a JSON config file\n"
        "  --server=<url>           Signaling server (default: ws://127.0.0.1:8000)\n"
        "  --room=<name>            Room to join\n"
        "  --ice_server=<url>       STUN/TURN server, repeatable (default: stun:stun.l.google.com:19302)\n"
        "  --timeout_ms=<ms>        Offer/answer timeout per peer, 0 to disable (default: 30000)\n"
        "  --audio, --no-audio      Send an audio track (default: on)\n"
        "  --video, --no-video      Send a video track (default: on)\n"
        "  --location=<lat>,<lng>   Position to publish to the room\n"
        "  --log_level=<level>      none|fatal|error|warning|info|debug|verbose (default: info)\n"
        "  --help                   Show this help message\n";
}

rtc::LogLevel ParseLogLevel(const std::string& level) {
    if (level == "none") return rtc::LogLevel::None;
    if (level == "fatal") return rtc::LogLevel::Fatal;
    if (level == "error") return rtc::LogLevel::Error;
    if (level == "warning") return rtc::LogLevel::Warning;
    if (level == "info") return rtc::LogLevel::Info;
    if (level == "debug") return rtc::LogLevel::Debug;
    if (level == "verbose") return rtc::LogLevel::Verbose;
    throw OptionsError("unknown log level: " + level);
}

} // namespace roomlink
