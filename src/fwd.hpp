#pragma once

namespace rtc {

class PeerConnection;
class Track;
class WebSocket;
class WebSocketServer;

} // namespace rtc

namespace roomlink {

class Channel;
class Loop;
class PeerLink;
class PeerTransport;
class Registry;
class Room;
class Router;
class SessionClient;

} // namespace roomlink
