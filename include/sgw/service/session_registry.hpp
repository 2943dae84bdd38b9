#pragma once

/// @file session_registry.hpp
/// @brief Gateway-side record of every client session and the router
///        between client sockets and the attached engine.
///
/// The registry is the only owner of session state that must survive an
/// engine restart: identity, login, puppet binding, capabilities and the
/// inputs typed while no engine was there to read them.

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "sgw/control/control_message.hpp"
#include "sgw/foundation/service_result.hpp"
#include "sgw/foundation/types.hpp"
#include "sgw/service/gateway_transport.hpp"
#include "sgw/service/gateway_types.hpp"
#include "sgw/service/protocol_codec.hpp"

namespace sgw::service {

/// Thread-safe session table with inbound queueing and outbound budgets.
///
/// While an engine is attached every decoded client input is forwarded as
/// a DATA frame. While none is, inputs wait in a bounded per-session FIFO
/// and are flushed, in order, right after the next engine has been told
/// about every session.
///
/// Example:
/// @code
///   SessionRegistry registry(config, transport);
///   auto sid = registry.create(conn, "telnet", std::move(codec), "10.0.0.7", now);
///   registry.routeInbound(sid.value(), bytes, now);   // queued: no engine yet
///   registry.attachEngine(engineConn);                // resync, then flush
/// @endcode
class SessionRegistry {
public:
    using Clock = std::chrono::steady_clock;

    SessionRegistry(const GatewayConfig& config, GatewayTransport& transport);
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // -- Session lifecycle ----------------------------------------------------

    /// Register a freshly accepted client connection.
    ///
    /// Fails with ConnectionLimitReached when maxConnections sessions exist.
    /// If an engine is attached it is sent RESYNC_SESSION for the new id.
    /// The codec's greeting, if any, goes to the client.
    [[nodiscard]] sgw::foundation::ServiceResult<sgw::foundation::SessionId>
    create(sgw::foundation::ConnectionId conn, std::string listener,
           std::unique_ptr<ProtocolCodec> codec, std::string remoteAddress,
           Clock::time_point now);

    /// Forget a session whose socket closed. The attached engine, if any,
    /// is sent DISCONNECT. Returns false for an unknown id.
    bool remove(sgw::foundation::SessionId sid);

    [[nodiscard]] std::optional<sgw::foundation::SessionId>
    findByConnection(sgw::foundation::ConnectionId conn) const;

    // -- Routing --------------------------------------------------------------

    /// Decode client bytes and forward or queue every complete input.
    /// Negotiation replies go back to the client; capability changes are
    /// stored and sent to an attached engine as CAPABILITIES.
    InboundResult routeInbound(sgw::foundation::SessionId sid,
                               std::span<const uint8_t> bytes, Clock::time_point now);

    /// Deliver engine output to a client, subject to the unread-output cap
    /// and the output budget. Returns false if the output was not delivered.
    bool routeOutbound(sgw::foundation::SessionId sid, std::string_view text,
                       Clock::time_point now);

    // -- Engine link ----------------------------------------------------------

    /// Bind the engine connection: replay every session (RESYNC_SESSION in
    /// id order, then RESYNC_DONE) and flush queued inputs.
    /// Returns the number of sessions replayed.
    std::size_t attachEngine(sgw::foundation::ConnectionId engineConn);

    /// Drop the engine link; inputs queue from now on.
    void detachEngine();

    [[nodiscard]] bool engineAttached() const;

    // -- Engine-driven changes ------------------------------------------------

    /// Record a login or puppet change reported by the engine.
    bool applyUpdate(const control::SessionUpdate& update);

    /// The engine could not resume a session: flag it and reset it to
    /// anonymous with no account or puppet. The session stays connected.
    bool markResyncFailed(sgw::foundation::SessionId sid, std::string reason);

    /// Send @p reason to the client and close it.
    bool disconnect(sgw::foundation::SessionId sid, std::string_view reason);

    void disconnectAll(std::string_view reason);

    /// Send a line to every connected client.
    void announce(std::string_view text);

    /// Close sessions silent for longer than the idle timeout.
    std::vector<sgw::foundation::SessionId> expireIdle(Clock::time_point now);

    // -- Queries --------------------------------------------------------------

    [[nodiscard]] std::optional<SessionInfo> info(sgw::foundation::SessionId sid) const;

    /// Every session, ordered by id.
    [[nodiscard]] std::vector<SessionInfo> snapshot() const;

    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] GatewayStats stats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sgw::service
