#pragma once

/// @file launcher_client.hpp
/// @brief Operator-side client issuing lifecycle commands to the gateway.

#include <chrono>
#include <cstdint>
#include <string>

#include "sgw/control/control_message.hpp"
#include "sgw/foundation/service_result.hpp"

namespace sgw::service {

/// Process exit codes of sgw_launcher.
inline constexpr int kLauncherExitOk = 0;
inline constexpr int kLauncherExitFailed = 1;
inline constexpr int kLauncherExitRejected = 2;
inline constexpr int kLauncherExitTimeout = 3;
inline constexpr int kLauncherExitUnreachable = 4;

struct LauncherConfig {
    std::string gatewayHost = "127.0.0.1";
    uint16_t gatewayPort = 4005;

    /// How long to wait for the RESULT of a command.
    std::chrono::seconds timeout{60};

    std::chrono::milliseconds connectTimeout{2000};
};

/// One-shot control connection: HELLO, CMD, wait for RESULT.
///
/// @code
///   LauncherClient launcher(config);
///   auto result = launcher.execute(Command::Reload);
///   return LauncherClient::exitCodeFor(result);
/// @endcode
class LauncherClient {
public:
    explicit LauncherClient(LauncherConfig config);

    /// Errors: ConnectionFailed (gateway not running), Timeout (no RESULT
    /// in time; the transition may still complete), ConnectionLost,
    /// or a protocol error.
    [[nodiscard]] sgw::foundation::ServiceResult<control::CommandResult> execute(
        control::Command cmd);

    /// Map an outcome to the process exit code.
    static int exitCodeFor(const sgw::foundation::ServiceResult<control::CommandResult>& outcome);

    /// One-line summary for the operator.
    static std::string describe(const control::CommandResult& result);

private:
    LauncherConfig config_;
};

} // namespace sgw::service
