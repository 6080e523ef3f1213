#include "transport.hpp"

namespace roomlink {

const char* TransportStateName(TransportState state) {
    switch (state) {
        case TransportState::New: return "New";
        case TransportState::Connecting: return "Connecting";
        case TransportState::Connected: return "Connected";
        case TransportState::Disconnected: return "Disconnected";
        case TransportState::Failed: return "Failed";
        case TransportState::Closed: return "Closed";
    }
    return "Unknown";
}

} // namespace roomlink
