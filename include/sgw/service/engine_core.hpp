#pragma once

/// @file engine_core.hpp
/// @brief Engine runtime: applies gateway control messages, dispatches
///        session input to game logic and runs the shutdown sequence.

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "sgw/control/control_message.hpp"
#include "sgw/foundation/service_result.hpp"
#include "sgw/foundation/signal.hpp"
#include "sgw/service/engine_interfaces.hpp"
#include "sgw/service/engine_session_table.hpp"
#include "sgw/service/engine_types.hpp"

namespace sgw::service {

/// Transport-free engine runtime.
///
/// Every session-scoped message runs on that session's strand of the
/// JobScheduler, so input, resync and disconnect for one session are
/// applied in arrival order while different sessions proceed in parallel.
///
/// @code
///   EngineCore core(config, sink, handler, &persistence);
///   core.handleMessage(msg);                  // from the control channel
///   core.onShutdownRequested().connect([&](ShutdownMode, const std::string&) { ... });
///   core.shutdown("gateway asked");           // drain, flush, STOPPING, close
/// @endcode
class EngineCore final : public EngineContext {
public:
    EngineCore(EngineConfig config, ControlSink& sink, CommandHandler& handler,
               PersistenceHook* persistence = nullptr);
    ~EngineCore() override;

    EngineCore(const EngineCore&) = delete;
    EngineCore& operator=(const EngineCore&) = delete;

    /// Apply one message received from the gateway.
    void handleMessage(const control::ControlMessage& msg);

    /// Stop accepting input, drain in-flight work, flush persistence, send
    /// STOPPING and close the connection. Runs once; returns whether the
    /// stop was clean (drained and flushed).
    bool shutdown(std::string_view reason);

    /// Wait until every queued session job has run.
    bool waitIdle(std::chrono::milliseconds timeout);

    [[nodiscard]] bool shuttingDown() const noexcept;

    /// The gateway refused this engine's HELLO.
    [[nodiscard]] bool rejected() const noexcept;

    /// The gateway accepted this engine's HELLO.
    [[nodiscard]] bool attached() const noexcept;

    [[nodiscard]] EngineSessionTable& table();

    /// SHUTDOWN received from the gateway: (mode, reason).
    sgw::foundation::Signal<control::ShutdownMode, const std::string&>& onShutdownRequested();

    // -- EngineContext --------------------------------------------------------

    void emit(sgw::foundation::SessionId sid, std::string_view text) override;

    sgw::foundation::ServiceResult<SessionView> login(sgw::foundation::SessionId sid,
                                                      sgw::foundation::AccountId account) override;

    sgw::foundation::ServiceResult<SessionView> logout(sgw::foundation::SessionId sid) override;

    sgw::foundation::ServiceResult<SessionView> bindPuppet(sgw::foundation::SessionId sid,
                                                           sgw::foundation::PuppetId puppet) override;

    void disconnect(sgw::foundation::SessionId sid, std::string reason) override;

    void announce(std::string text) override;

    [[nodiscard]] std::vector<SessionView> sessions() const override;

    [[nodiscard]] const EnginePolicy& policy() const override;

    [[nodiscard]] const std::string& instanceName() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sgw::service
