#pragma once

/// @file network_manager.hpp
/// @brief NetworkManager wrapping kcenon network_system servers.
///
/// Owns every listener of the gateway process (client-facing listeners and
/// the control port) and exposes accepted connections as raw byte streams.
/// Framing is left to the layer above: control connections run a
/// FrameDecoder, client connections run their ProtocolCodec.

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sgw/foundation/service_result.hpp"
#include "sgw/foundation/signal.hpp"
#include "sgw/foundation/types.hpp"

namespace sgw::foundation {

/// Stream transports a listener can be bound with.
enum class Transport : uint8_t {
    Tcp,
    WebSocket
};

constexpr std::string_view transportName(Transport transport) {
    switch (transport) {
        case Transport::Tcp:       return "tcp";
        case Transport::WebSocket: return "websocket";
    }
    return "unknown";
}

/// Parse "tcp" / "websocket" as written in configuration.
std::optional<Transport> parseTransport(std::string_view name);

/// Snapshot of an accepted connection.
struct ConnectionInfo {
    ConnectionId id;
    std::string listener;
    Transport transport = Transport::Tcp;
    std::string remoteAddress;
    std::chrono::steady_clock::time_point connectedAt;
};

/// Named-listener server manager.
///
/// Signals fire on kcenon I/O threads. Callbacks for one connection arrive
/// in order; callbacks for different connections may run concurrently.
///
/// @code
///   NetworkManager net;
///   net.onConnected.connect([](ConnectionId cid, const std::string& listener) { ... });
///   net.onData.connect([](ConnectionId cid, const std::vector<uint8_t>& bytes) { ... });
///   auto result = net.listen("telnet", 4000, Transport::Tcp);
/// @endcode
class NetworkManager {
public:
    NetworkManager();
    ~NetworkManager();

    NetworkManager(const NetworkManager&) = delete;
    NetworkManager& operator=(const NetworkManager&) = delete;
    NetworkManager(NetworkManager&&) noexcept;
    NetworkManager& operator=(NetworkManager&&) noexcept;

    // -- Listeners ------------------------------------------------------------

    /// Start a listener under a unique name.
    [[nodiscard]] ServiceResult<void> listen(const std::string& name, uint16_t port,
                                             Transport transport);

    /// Stop one listener and forget its connections.
    [[nodiscard]] ServiceResult<void> stop(const std::string& name);

    void stopAll();

    [[nodiscard]] bool isListening(const std::string& name) const;

    // -- Connection I/O -------------------------------------------------------

    /// Write raw bytes to a connection.
    [[nodiscard]] ServiceResult<void> send(ConnectionId conn, std::vector<uint8_t> bytes);

    /// Close a connection. onDisconnected fires once the transport reports it.
    void close(ConnectionId conn);

    // -- Queries --------------------------------------------------------------

    [[nodiscard]] std::optional<ConnectionInfo> connectionInfo(ConnectionId conn) const;

    [[nodiscard]] std::size_t connectionCount() const;

    // -- Signals --------------------------------------------------------------

    /// (connection, listener name)
    Signal<ConnectionId, const std::string&> onConnected;
    Signal<ConnectionId, const std::vector<uint8_t>&> onData;
    Signal<ConnectionId> onDisconnected;
    Signal<ConnectionId, ErrorCode> onError;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sgw::foundation
