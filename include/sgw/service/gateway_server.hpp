#pragma once

/// @file gateway_server.hpp
/// @brief Gateway Server: client sessions, the control channel and the
///        engine slot, wired together and driven by connection events.
///
/// GatewayServer is transport-free. The host feeds it connect, data and
/// disconnect events from the network layer and a periodic tick; it
/// answers through a GatewayTransport. Listener names decide what a
/// connection is: kControlListener is the control channel, every other
/// listener is a client-facing protocol from GatewayConfig::listeners.

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "sgw/control/control_message.hpp"
#include "sgw/foundation/process_spawner.hpp"
#include "sgw/foundation/service_result.hpp"
#include "sgw/foundation/signal.hpp"
#include "sgw/foundation/types.hpp"
#include "sgw/service/gateway_transport.hpp"
#include "sgw/service/gateway_types.hpp"
#include "sgw/service/protocol_codec.hpp"

namespace sgw::service {

class EngineSupervisor;
class SessionRegistry;

/// Gateway Server for client connection management and engine routing.
///
/// Usage:
/// @code
///   GatewayConfig config;
///   config.listeners.push_back({"telnet", 4000, Transport::Tcp, "line"});
///   GatewayServer gateway(config, transport, spawner);
///   auto r = gateway.start();
///
///   // From the network layer:
///   gateway.handleConnect(conn, "telnet", "192.168.1.10");
///   gateway.handleData(conn, bytes);
///   gateway.handleDisconnect(conn);
///
///   // From the scheduler:
///   gateway.tick();
/// @endcode
class GatewayServer {
public:
    using Clock = std::chrono::steady_clock;

    /// Listener name reserved for the control channel.
    static constexpr std::string_view kControlListener = "control";

    GatewayServer(GatewayConfig config, GatewayTransport& transport,
                  sgw::foundation::ProcessSpawner& spawner,
                  ProtocolRegistry protocols = ProtocolRegistry::withBuiltins());

    ~GatewayServer();

    GatewayServer(const GatewayServer&) = delete;
    GatewayServer& operator=(const GatewayServer&) = delete;
    GatewayServer(GatewayServer&&) noexcept;
    GatewayServer& operator=(GatewayServer&&) noexcept;

    // -- Lifecycle ------------------------------------------------------------

    /// Validate the listener table and, if configured, spawn the engine.
    [[nodiscard]] sgw::foundation::ServiceResult<void> start(Clock::time_point now = Clock::now());

    /// Stop accepting connection events. Sessions stay in the registry
    /// until their sockets close.
    void stop();

    [[nodiscard]] bool isRunning() const noexcept;

    // -- Connection handling --------------------------------------------------

    /// A connection was accepted on @p listener.
    void handleConnect(sgw::foundation::ConnectionId conn, const std::string& listener,
                       std::string remoteAddress, Clock::time_point now = Clock::now());

    /// Bytes arrived on a connection.
    void handleData(sgw::foundation::ConnectionId conn, std::span<const uint8_t> bytes,
                    Clock::time_point now = Clock::now());

    /// A connection closed, from either side.
    void handleDisconnect(sgw::foundation::ConnectionId conn, Clock::time_point now = Clock::now());

    // -- Maintenance ----------------------------------------------------------

    /// Engine timeouts, child reaping and idle-session cleanup.
    void tick(Clock::time_point now = Clock::now());

    /// Run a lifecycle command issued by the gateway itself (autostart,
    /// signal-driven shutdown). nullopt when the outcome is not known yet.
    std::optional<control::CommandResult> executeCommand(control::Command cmd,
                                                         Clock::time_point now = Clock::now());

    // -- Accessors ------------------------------------------------------------

    [[nodiscard]] SessionRegistry& sessions();
    [[nodiscard]] const SessionRegistry& sessions() const;

    [[nodiscard]] EngineSupervisor& supervisor();
    [[nodiscard]] const EngineSupervisor& supervisor() const;

    [[nodiscard]] GatewayStats stats() const;

    [[nodiscard]] const GatewayConfig& config() const noexcept;

    /// Emitted once a shutdown command has completed.
    sgw::foundation::Signal<>& onShutdownRequested();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sgw::service
