#pragma once

/// @file engine_interfaces.hpp
/// @brief Boundary between the engine runtime and the game logic it hosts.
///
/// The runtime owns sessions, ordering and the control channel. Game logic
/// plugs in as a CommandHandler and talks back through EngineContext;
/// world-state persistence plugs in as a PersistenceHook.

#include <string>
#include <string_view>
#include <vector>

#include "sgw/control/control_message.hpp"
#include "sgw/foundation/service_result.hpp"
#include "sgw/foundation/types.hpp"
#include "sgw/service/engine_types.hpp"

namespace sgw::service {

/// What game logic may do to sessions. Safe to call from handler threads.
class EngineContext {
public:
    virtual ~EngineContext() = default;

    /// Send text to a session's client.
    virtual void emit(sgw::foundation::SessionId sid, std::string_view text) = 0;

    /// Authenticate a session; the gateway is told so it survives restarts.
    virtual sgw::foundation::ServiceResult<SessionView> login(sgw::foundation::SessionId sid,
                                                              sgw::foundation::AccountId account) = 0;

    virtual sgw::foundation::ServiceResult<SessionView> logout(sgw::foundation::SessionId sid) = 0;

    /// Bind a puppet (an invalid id unbinds). A puppet has at most one session.
    virtual sgw::foundation::ServiceResult<SessionView> bindPuppet(
        sgw::foundation::SessionId sid, sgw::foundation::PuppetId puppet) = 0;

    /// Ask the gateway to close a client.
    virtual void disconnect(sgw::foundation::SessionId sid, std::string reason) = 0;

    /// Broadcast to every client through the gateway.
    virtual void announce(std::string text) = 0;

    [[nodiscard]] virtual std::vector<SessionView> sessions() const = 0;

    [[nodiscard]] virtual const EnginePolicy& policy() const = 0;

    [[nodiscard]] virtual const std::string& instanceName() const = 0;
};

/// Game logic entry point. Calls for one session never overlap and arrive
/// in the order the client sent them; different sessions run in parallel.
class CommandHandler {
public:
    virtual ~CommandHandler() = default;

    virtual void handleInput(EngineContext& ctx, const SessionView& session,
                             std::string_view input) = 0;

    /// A session was replayed by the gateway after this engine attached
    /// (or accepted while it was running).
    virtual void onSessionAttached(EngineContext& /*ctx*/, const SessionView& /*session*/) {}
};

/// World-state persistence, flushed once during shutdown.
class PersistenceHook {
public:
    virtual ~PersistenceHook() = default;

    virtual sgw::foundation::ServiceResult<void> flush() = 0;
};

/// Outbound half of the engine's control connection.
class ControlSink {
public:
    virtual ~ControlSink() = default;

    virtual sgw::foundation::ServiceResult<void> send(const control::ControlMessage& msg) = 0;

    virtual void close() = 0;
};

} // namespace sgw::service
