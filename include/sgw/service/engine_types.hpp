#pragma once

/// @file engine_types.hpp
/// @brief Configuration and session records for the engine process.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "sgw/control/control_message.hpp"
#include "sgw/foundation/types.hpp"

namespace sgw::service {

/// Session policy axes. Each one is independent of the others.
struct EnginePolicy {
    /// Concurrent sessions one account may hold. Zero means unlimited.
    uint32_t maxSessionsPerAccount = 0;

    /// Bind the account's puppet to the session on login.
    bool autoBindPuppet = true;

    /// Create a puppet for an account that has none when binding on login.
    bool autoCreatePuppet = true;
};

/// Configuration for the engine process.
struct EngineConfig {
    std::string gatewayHost = "127.0.0.1";
    uint16_t gatewayPort = 4005;

    /// Instance name announced in HELLO and shown by the echo handler.
    std::string name = "engine";

    /// Reconnect backoff: doubles from initialBackoff up to maxBackoff
    /// until connectDeadline has passed.
    std::chrono::milliseconds initialBackoff{100};
    std::chrono::milliseconds maxBackoff{5000};
    std::chrono::seconds connectDeadline{30};

    std::size_t workerThreads = 4;

    /// How long shutdown waits for in-flight inputs.
    std::chrono::milliseconds drainTimeout{5000};

    EnginePolicy policy;
};

/// One session as the engine sees it.
struct SessionView {
    sgw::foundation::SessionId id;
    control::ProtocolKind protocol = control::ProtocolKind::Line;
    control::AuthState auth = control::AuthState::Anonymous;
    sgw::foundation::AccountId account;
    sgw::foundation::PuppetId puppet;
    control::Capabilities capabilities;

    /// Restored from a resync rather than created fresh.
    bool resumed = false;

    [[nodiscard]] bool authenticated() const noexcept {
        return auth == control::AuthState::Authenticated;
    }
};

} // namespace sgw::service
