#pragma once

/// @file gateway_host.hpp
/// @brief Runs a GatewayServer on real sockets and real child processes.

#include <memory>

#include "sgw/foundation/service_result.hpp"
#include "sgw/service/gateway_types.hpp"

namespace sgw::service {

class GatewayServer;
class SignalHandler;

/// Binds the control port and every configured listener through the
/// NetworkManager, launches engines with PosixProcessSpawner and drives
/// the supervision tick from the JobScheduler.
///
/// @code
///   GatewayHost host(config);
///   if (auto r = host.start(); !r) { ... }
///   host.run(signals);      // returns on SIGINT/SIGTERM or a shutdown command
///   host.shutdown();        // stop the engine, then the listeners
/// @endcode
class GatewayHost {
public:
    explicit GatewayHost(GatewayConfig config);
    ~GatewayHost();

    GatewayHost(const GatewayHost&) = delete;
    GatewayHost& operator=(const GatewayHost&) = delete;

    [[nodiscard]] sgw::foundation::ServiceResult<void> start();

    /// Tick until a signal arrives or a shutdown command completes.
    void run(const SignalHandler& signals);

    /// Stop the engine (bounded by the stop timeout) and close every listener.
    void shutdown();

    [[nodiscard]] GatewayServer& gateway();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sgw::service
