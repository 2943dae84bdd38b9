#pragma once

/// @file engine_supervisor.hpp
/// @brief The gateway's single engine slot: spawn, attach, stop, reload,
///        crash detection and lifecycle timeouts.

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "sgw/control/control_message.hpp"
#include "sgw/foundation/process_spawner.hpp"
#include "sgw/foundation/service_result.hpp"
#include "sgw/foundation/signal.hpp"
#include "sgw/foundation/types.hpp"
#include "sgw/service/gateway_transport.hpp"
#include "sgw/service/gateway_types.hpp"

namespace sgw::service {

class SessionRegistry;

/// Lifetime counters of the engine slot.
struct SupervisorStats {
    control::EngineState state = control::EngineState::Absent;
    std::optional<sgw::foundation::ProcessId> pid;
    /// Name announced in the current engine's HELLO.
    std::string engineName;
    uint64_t starts = 0;
    uint64_t crashes = 0;
    uint64_t cleanStops = 0;
    uint64_t forcedKills = 0;
    uint64_t spawnFailures = 0;
};

/// State machine for the one engine the gateway drives.
///
/// Absent -> Starting (spawned) -> Running (HELLO accepted) -> Stopping
/// (SHUTDOWN sent or STOPPING received) -> Absent (control connection
/// gone). A connection lost without a preceding STOPPING is a crash and is
/// never followed by an automatic respawn; only a pending reload spawns.
///
/// Lifecycle commands that need the engine to act reply later: they return
/// nullopt and the RESULT is sent to the requesting connection once the
/// transition completes or fails. Lock order is supervisor, then registry.
///
/// @code
///   EngineSupervisor supervisor(config, registry, transport, spawner);
///   auto reply = supervisor.handleCommand(launcherConn, Command::Reload, now);
///   // reply == nullopt: the launcher hears back after the new engine attaches.
///   supervisor.tick(now);   // drive timeouts and reap children
/// @endcode
class EngineSupervisor {
public:
    using Clock = std::chrono::steady_clock;

    EngineSupervisor(const GatewayConfig& config, SessionRegistry& registry,
                     GatewayTransport& transport, sgw::foundation::ProcessSpawner& spawner);
    ~EngineSupervisor();

    EngineSupervisor(const EngineSupervisor&) = delete;
    EngineSupervisor& operator=(const EngineSupervisor&) = delete;

    /// Run a launcher command.
    ///
    /// @param requester Connection to send the deferred RESULT to; an
    ///        invalid id marks a command issued by the gateway itself.
    /// @return The immediate result, or nullopt when the reply is deferred.
    std::optional<control::CommandResult> handleCommand(sgw::foundation::ConnectionId requester,
                                                        control::Command cmd,
                                                        Clock::time_point now);

    /// An engine sent HELLO. Sends it RESULT and, when accepted, resyncs
    /// every session through the registry. On error the caller closes
    /// @p conn.
    [[nodiscard]] sgw::foundation::ServiceResult<void> attach(sgw::foundation::ConnectionId conn,
                                                              const control::Hello& hello,
                                                              Clock::time_point now);

    /// The engine announced it is going away.
    void handleStopping(sgw::foundation::ConnectionId conn, bool clean, Clock::time_point now);

    /// A control connection closed (engine or launcher).
    void handleDisconnect(sgw::foundation::ConnectionId conn, Clock::time_point now);

    /// Reap children and enforce attach/stop deadlines.
    void tick(Clock::time_point now);

    [[nodiscard]] control::EngineState state() const;

    [[nodiscard]] std::optional<sgw::foundation::ConnectionId> engineConnection() const;

    [[nodiscard]] SupervisorStats stats() const;

    /// (from, to) on every state change, emitted outside the lock.
    sgw::foundation::Signal<control::EngineState, control::EngineState>& onStateChanged();

    /// A shutdown command has completed: the gateway should exit.
    sgw::foundation::Signal<>& onShutdownRequested();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sgw::service
