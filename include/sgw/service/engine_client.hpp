#pragma once

/// @file engine_client.hpp
/// @brief The engine process's control connection to the gateway.

#include <memory>

#include "sgw/foundation/service_result.hpp"
#include "sgw/service/engine_interfaces.hpp"
#include "sgw/service/engine_types.hpp"

namespace sgw::service {

class EngineCore;
class SignalHandler;

/// Dials the gateway, announces the engine and pumps control frames into
/// an EngineCore until the gateway or a signal ends the process.
///
/// @code
///   BasicCommandHandler handler;
///   EngineClient client(config, handler);
///   if (auto r = client.connect(); !r) { return 4; }
///   return client.run(signals);
/// @endcode
class EngineClient {
public:
    EngineClient(EngineConfig config, CommandHandler& handler,
                 PersistenceHook* persistence = nullptr);
    ~EngineClient();

    EngineClient(const EngineClient&) = delete;
    EngineClient& operator=(const EngineClient&) = delete;

    /// Connect with exponential backoff until the connect deadline, then
    /// send HELLO. Fails with ConnectionFailed when the deadline passes.
    [[nodiscard]] sgw::foundation::ServiceResult<void> connect();

    /// Serve until SHUTDOWN, SIGINT/SIGTERM, rejection or loss of the
    /// gateway. Returns the process exit code.
    int run(const SignalHandler& signals);

    [[nodiscard]] EngineCore& core();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sgw::service
