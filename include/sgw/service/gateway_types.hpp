#pragma once

/// @file gateway_types.hpp
/// @brief Configuration and session records for the gateway process.

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sgw/control/control_message.hpp"
#include "sgw/foundation/network_manager.hpp"
#include "sgw/foundation/process_spawner.hpp"
#include "sgw/foundation/types.hpp"

namespace sgw::service {

// -- Policies -----------------------------------------------------------------

/// What happens to client input when the per-session queue is full while
/// no engine is attached.
enum class InputQueuePolicy : uint8_t {
    /// Discard the oldest queued line to make room.
    DropOldest,
    /// Refuse the new line and tell the client the server is unavailable.
    RejectNew
};

constexpr std::string_view inputQueuePolicyName(InputQueuePolicy policy) {
    switch (policy) {
        case InputQueuePolicy::DropOldest: return "drop_oldest";
        case InputQueuePolicy::RejectNew:  return "reject_new";
    }
    return "unknown";
}

std::optional<InputQueuePolicy> parseInputQueuePolicy(std::string_view name);

/// What happens to engine output for a client whose output budget is spent.
enum class OutputOverflowPolicy : uint8_t {
    Drop,
    Disconnect
};

constexpr std::string_view outputOverflowPolicyName(OutputOverflowPolicy policy) {
    switch (policy) {
        case OutputOverflowPolicy::Drop:       return "drop";
        case OutputOverflowPolicy::Disconnect: return "disconnect";
    }
    return "unknown";
}

std::optional<OutputOverflowPolicy> parseOutputOverflowPolicy(std::string_view name);

// -- Configuration ------------------------------------------------------------

/// One client-facing listener.
struct ListenerConfig {
    std::string name;
    uint16_t port = 0;
    sgw::foundation::Transport transport = sgw::foundation::Transport::Tcp;
    /// Name of the codec in the ProtocolRegistry ("line", "websocket").
    std::string codec = "line";
    /// Negotiate window size and terminal type with new clients.
    bool negotiate = false;
};

/// Configuration for the gateway process.
struct GatewayConfig {
    /// Control-channel port dialled by the engine and the launcher.
    uint16_t controlPort = 4005;

    std::vector<ListenerConfig> listeners;

    /// Maximum concurrent client sessions.
    uint32_t maxConnections = 1000;

    InputQueuePolicy inputQueuePolicy = InputQueuePolicy::DropOldest;

    /// Lines queued per session while no engine is attached.
    uint32_t inputQueueCapacity = 64;

    /// Token bucket on client commands: burst and refill per second.
    uint32_t commandRateCapacity = 20;
    uint32_t commandRateRefillPerSecond = 10;

    /// Longest accepted input line in bytes.
    uint32_t maxInputBytes = 8192;

    /// Output byte budget per session: burst and refill per second.
    uint32_t outputBudgetBytes = 1024 * 1024;
    uint32_t outputRefillBytesPerSecond = 256 * 1024;

    /// Output a client may leave unread before the overflow policy applies.
    /// Zero disables the check.
    uint32_t outputMaxPendingBytes = 4 * 1024 * 1024;

    OutputOverflowPolicy outputOverflowPolicy = OutputOverflowPolicy::Drop;

    /// Disconnect clients silent for this long. Zero disables.
    std::chrono::seconds idleTimeout{0};

    /// How long a spawned engine has to send HELLO.
    std::chrono::seconds attachTimeout{30};

    /// How long a stopping engine has to disconnect.
    std::chrono::seconds stopTimeout{15};

    /// Supervision tick: timeouts, child reaping, idle cleanup.
    std::chrono::milliseconds tickInterval{250};

    /// Spawn the engine as soon as the gateway is up.
    bool autostartEngine = false;

    /// How the gateway launches the engine.
    sgw::foundation::LaunchSpec engineLaunch;

    std::string restartingNotice = "The server is restarting, please wait...";
    std::string unavailableNotice = "The server is temporarily unavailable, try again shortly.";
    std::string rateLimitNotice = "You are sending commands too fast; input ignored.";
    std::string inputTooLargeNotice = "Input too long; ignored.";
};

// -- Session record -----------------------------------------------------------

/// Snapshot of one client session as held by the gateway.
struct SessionInfo {
    sgw::foundation::SessionId id;
    sgw::foundation::ConnectionId connection;
    std::string listener;
    control::ProtocolKind protocol = control::ProtocolKind::Line;
    std::string remoteAddress;

    control::AuthState auth = control::AuthState::Anonymous;
    sgw::foundation::AccountId account;
    /// May be stale while no engine is attached.
    sgw::foundation::PuppetId puppet;
    control::Capabilities capabilities;

    /// Set when the current engine could not resume this session.
    bool resyncError = false;
    std::string resyncErrorReason;

    std::size_t queuedInputs = 0;

    std::chrono::steady_clock::time_point connectedAt{};
    std::chrono::steady_clock::time_point lastActivity{};
};

/// Outcome of routing one chunk of client bytes.
struct InboundResult {
    std::size_t forwarded = 0;
    std::size_t queued = 0;
    /// Lines discarded: oldest-dropped, rejected, rate-limited or oversized.
    std::size_t dropped = 0;
};

/// Runtime statistics snapshot for the gateway.
struct GatewayStats {
    std::size_t sessions = 0;
    std::size_t queuedInputs = 0;
    uint64_t inputsForwarded = 0;
    uint64_t inputsQueued = 0;
    uint64_t inputsDropped = 0;
    uint64_t outputsDelivered = 0;
    uint64_t outputsDropped = 0;
    /// Outputs refused because the client stopped reading.
    uint64_t outputsStalled = 0;
    uint64_t rateLimitHits = 0;
    uint64_t connectionsRefused = 0;
};

} // namespace sgw::service
