/// @file engine_supervisor.cpp
/// @brief EngineSupervisor implementation.

#include "sgw/service/engine_supervisor.hpp"

#include <algorithm>
#include <mutex>
#include <utility>
#include <vector>

#include "sgw/control/control_codec.hpp"
#include "sgw/foundation/service_logger.hpp"
#include "sgw/service/session_registry.hpp"
#include "sgw/version.hpp"

namespace sgw::service {

using control::Command;
using control::CommandResult;
using control::EngineState;
using control::ResultCode;
using sgw::foundation::ConnectionId;
using sgw::foundation::ErrorCode;
using sgw::foundation::LogCategory;
using sgw::foundation::ProcessId;
using sgw::foundation::ServiceError;
using sgw::foundation::ServiceResult;

namespace {

/// Lifecycle operation waiting for the engine to act.
enum class Operation : uint8_t {
    None,
    Start,
    Stop,
    Reload,
    Shutdown
};

struct Waiter {
    ConnectionId conn;
    Command command;
};

/// Side effects collected under the lock and applied after it is released.
struct Effects {
    std::vector<std::pair<EngineState, EngineState>> transitions;
    std::vector<ConnectionId> closes;
    bool shutdown = false;
};

std::string formatSeconds(std::chrono::seconds s) {
    return std::to_string(s.count()) + "s";
}

} // namespace

// -- Impl ---------------------------------------------------------------------

struct EngineSupervisor::Impl {
    const GatewayConfig& config;
    SessionRegistry& registry;
    GatewayTransport& transport;
    sgw::foundation::ProcessSpawner& spawner;

    mutable std::mutex mutex;
    EngineState state = EngineState::Absent;
    std::optional<ProcessId> pid;
    /// Children no longer tracked as the engine but not yet reaped.
    std::vector<ProcessId> orphans;
    std::optional<ConnectionId> engineConn;
    bool stoppingSeen = false;
    bool stoppingClean = false;
    bool pendingRestart = false;
    Clock::time_point deadline{};
    Operation op = Operation::None;
    std::vector<Waiter> waiters;
    SupervisorStats counters;

    sgw::foundation::Signal<EngineState, EngineState> stateChanged;
    sgw::foundation::Signal<> shutdownRequested;

    Impl(const GatewayConfig& cfg, SessionRegistry& reg, GatewayTransport& tx,
         sgw::foundation::ProcessSpawner& sp)
        : config(cfg), registry(reg), transport(tx), spawner(sp) {}

    // Everything below runs with the mutex held.

    void setState(EngineState next, Effects& fx) {
        if (next == state) {
            return;
        }
        SGW_LOG_DEBUG(LogCategory::Lifecycle,
                      "engine " + std::string(control::engineStateName(state)) + " -> " +
                          std::string(control::engineStateName(next)));
        fx.transitions.emplace_back(state, next);
        state = next;
    }

    CommandResult makeResult(bool ok, ResultCode code, std::string detail) const {
        CommandResult result;
        result.ok = ok;
        result.code = code;
        result.engineState = state;
        result.sessionCount = static_cast<uint32_t>(registry.size());
        result.detail = std::move(detail);
        return result;
    }

    void reply(ConnectionId conn, const CommandResult& result) {
        auto sent = transport.send(conn, control::encode(result));
        if (!sent) {
            SGW_LOG_WARN(LogCategory::Lifecycle,
                         "could not deliver result to connection " +
                             std::to_string(conn.value()) + ": " +
                             std::string(sent.error().message()));
        }
    }

    /// Answer every deferred command and clear the current operation.
    void complete(bool ok, ResultCode code, const std::string& detail) {
        auto result = makeResult(ok, code, detail);
        for (const auto& waiter : waiters) {
            reply(waiter.conn, result);
        }
        if (ok) {
            SGW_LOG_INFO(LogCategory::Lifecycle, detail);
        } else {
            SGW_LOG_ERROR(LogCategory::Lifecycle, detail);
        }
        waiters.clear();
        op = Operation::None;
    }

    void addWaiter(ConnectionId requester, Command cmd) {
        if (requester.isValid()) {
            waiters.push_back(Waiter{requester, cmd});
        }
    }

    ServiceResult<void> spawn(Clock::time_point now, Effects& fx) {
        if (config.engineLaunch.empty()) {
            ++counters.spawnFailures;
            return ServiceResult<void>::err(
                ServiceError(ErrorCode::NoLaunchCommand, "no engine launch command configured"));
        }

        auto spawned = spawner.spawn(config.engineLaunch);
        if (!spawned) {
            ++counters.spawnFailures;
            return ServiceResult<void>::err(spawned.error());
        }

        pid = spawned.value();
        stoppingSeen = false;
        stoppingClean = false;
        deadline = now + config.attachTimeout;
        setState(EngineState::Starting, fx);
        SGW_LOG_INFO(LogCategory::Process,
                     "spawned engine pid " + std::to_string(*pid) + ": " +
                         config.engineLaunch.describe());
        return ServiceResult<void>::ok();
    }

    void requestStop(control::ShutdownMode mode, std::string reason, Clock::time_point now,
                     Effects& fx) {
        if (engineConn) {
            auto sent = transport.send(*engineConn,
                                       control::encode(control::Shutdown{mode, std::move(reason)}));
            if (!sent) {
                SGW_LOG_WARN(LogCategory::Lifecycle,
                             "could not send SHUTDOWN: " + std::string(sent.error().message()));
            }
        }
        // From here on client input waits in the registry.
        registry.detachEngine();
        deadline = now + config.stopTimeout;
        setState(EngineState::Stopping, fx);
    }

    void retire(ProcessId child, bool forceful) {
        if (forceful) {
            auto killed = spawner.kill(child);
            if (!killed) {
                SGW_LOG_WARN(LogCategory::Process, std::string(killed.error().message()));
            }
        }
        orphans.push_back(child);
    }

    /// The engine's control connection is gone (or given up on).
    void engineLost(Clock::time_point now, Effects& fx) {
        registry.detachEngine();
        engineConn.reset();

        bool graceful = stoppingSeen;
        if (pid) {
            // A child that dropped its connection without announcing a stop
            // is not trusted to exit on its own.
            if (!graceful) {
                auto termed = spawner.terminate(*pid);
                if (!termed) {
                    SGW_LOG_DEBUG(LogCategory::Process, std::string(termed.error().message()));
                }
            }
            retire(*pid, false);
            pid.reset();
        }

        if (graceful) {
            ++counters.cleanStops;
            if (stoppingClean) {
                SGW_LOG_INFO(LogCategory::Lifecycle, "engine stopped cleanly");
            } else {
                SGW_LOG_WARN(LogCategory::Lifecycle,
                             "engine stopped without flushing all of its state");
            }
        } else {
            ++counters.crashes;
            SGW_LOG_ERROR(LogCategory::Lifecycle,
                          "engine control connection lost unexpectedly; " +
                              std::to_string(registry.size()) + " session(s) kept open");
        }
        stoppingSeen = false;
        stoppingClean = false;
        setState(EngineState::Absent, fx);

        if (pendingRestart) {
            pendingRestart = false;
            auto spawned = spawn(now, fx);
            if (!spawned) {
                complete(false, ResultCode::Failed,
                         "reload failed: " + std::string(spawned.error().message()));
            }
            return;
        }

        switch (op) {
            case Operation::Stop:
                complete(true, ResultCode::Ok, "engine stopped");
                break;
            case Operation::Shutdown:
                complete(true, ResultCode::Ok, "engine stopped, gateway shutting down");
                fx.shutdown = true;
                break;
            case Operation::Start:
            case Operation::Reload:
                complete(false, ResultCode::Failed, "engine lost before it finished starting");
                break;
            case Operation::None:
                break;
        }
    }

    std::string describeStatus() const {
        std::string text = "engine " + std::string(control::engineStateName(state));
        if (pid) {
            text += " (pid " + std::to_string(*pid) + ")";
        }
        if (!counters.engineName.empty() && engineConn) {
            text += " name " + counters.engineName;
        }
        text += ", " + std::to_string(registry.size()) + " session(s)";
        text += "; starts " + std::to_string(counters.starts) + ", crashes " +
                std::to_string(counters.crashes) + ", clean stops " +
                std::to_string(counters.cleanStops) + ", forced kills " +
                std::to_string(counters.forcedKills);
        return text;
    }

    void apply(Effects& fx) {
        for (auto [from, to] : fx.transitions) {
            stateChanged.emit(from, to);
        }
        for (auto conn : fx.closes) {
            transport.close(conn);
        }
        if (fx.shutdown) {
            shutdownRequested.emit();
        }
    }
};

// -- Construction -------------------------------------------------------------

EngineSupervisor::EngineSupervisor(const GatewayConfig& config, SessionRegistry& registry,
                                   GatewayTransport& transport,
                                   sgw::foundation::ProcessSpawner& spawner)
    : impl_(std::make_unique<Impl>(config, registry, transport, spawner)) {}

EngineSupervisor::~EngineSupervisor() = default;

// -- Commands -----------------------------------------------------------------

std::optional<CommandResult> EngineSupervisor::handleCommand(ConnectionId requester,
                                                             Command cmd,
                                                             Clock::time_point now) {
    Effects fx;
    std::optional<CommandResult> immediate;
    {
        std::lock_guard lock(impl_->mutex);
        auto& s = *impl_;

        SGW_LOG_INFO(LogCategory::Lifecycle,
                     "command " + std::string(control::commandName(cmd)) + " while engine " +
                         std::string(control::engineStateName(s.state)));

        if (cmd == Command::Status) {
            return s.makeResult(true, ResultCode::Ok, s.describeStatus());
        }

        bool busy = s.op != Operation::None || s.state == EngineState::Starting ||
                    s.state == EngineState::Stopping;
        if (busy) {
            return s.makeResult(false, ResultCode::OperationInProgress,
                                "operation in progress: engine " +
                                    std::string(control::engineStateName(s.state)));
        }

        switch (cmd) {
            case Command::Start:
            case Command::Reload:
                if (s.state == EngineState::Absent) {
                    auto spawned = s.spawn(now, fx);
                    if (!spawned) {
                        immediate = s.makeResult(false, ResultCode::Failed,
                                                 "spawn failed: " +
                                                     std::string(spawned.error().message()));
                        SGW_LOG_ERROR(LogCategory::Process, immediate->detail);
                        break;
                    }
                    s.op = cmd == Command::Start ? Operation::Start : Operation::Reload;
                    s.addWaiter(requester, cmd);
                } else if (cmd == Command::Start) {
                    immediate = s.makeResult(false, ResultCode::AlreadyInState,
                                             "engine already running");
                } else {
                    s.pendingRestart = true;
                    s.op = Operation::Reload;
                    s.addWaiter(requester, cmd);
                    s.requestStop(control::ShutdownMode::Reload, "reload requested", now, fx);
                }
                break;

            case Command::Stop:
            case Command::Shutdown:
                if (s.state == EngineState::Running) {
                    s.op = cmd == Command::Stop ? Operation::Stop : Operation::Shutdown;
                    s.addWaiter(requester, cmd);
                    s.requestStop(control::ShutdownMode::Stop,
                                  cmd == Command::Stop ? "stop requested"
                                                       : "gateway shutting down",
                                  now, fx);
                } else if (cmd == Command::Stop) {
                    immediate = s.makeResult(false, ResultCode::AlreadyInState,
                                             "engine not running");
                } else {
                    immediate = s.makeResult(true, ResultCode::Ok,
                                             "no engine running, gateway shutting down");
                    fx.shutdown = true;
                }
                break;

            case Command::Status:
                break;
        }
    }

    impl_->apply(fx);
    return immediate;
}

// -- Engine connection --------------------------------------------------------

ServiceResult<void> EngineSupervisor::attach(ConnectionId conn, const control::Hello& hello,
                                             Clock::time_point /*now*/) {
    Effects fx;
    {
        std::lock_guard lock(impl_->mutex);
        auto& s = *impl_;

        if (hello.revision != SGW_PROTOCOL_REVISION) {
            auto detail = "protocol revision " + std::to_string(hello.revision) +
                          " not supported (gateway speaks " +
                          std::to_string(SGW_PROTOCOL_REVISION) + ")";
            s.reply(conn, s.makeResult(false, ResultCode::Rejected, detail));
            SGW_LOG_WARN(LogCategory::Lifecycle, "rejected engine '" + hello.name + "': " + detail);
            return ServiceResult<void>::err(
                ServiceError(ErrorCode::ProtocolRevisionMismatch, detail));
        }

        if (s.engineConn) {
            std::string detail = "an engine is already attached";
            s.reply(conn, s.makeResult(false, ResultCode::Rejected, detail));
            SGW_LOG_WARN(LogCategory::Lifecycle,
                         "rejected second engine '" + hello.name + "' (pid " +
                             std::to_string(hello.pid) + ")");
            return ServiceResult<void>::err(
                ServiceError(ErrorCode::EngineAlreadyAttached, detail));
        }

        if (s.pid && hello.pid != 0 && static_cast<ProcessId>(hello.pid) != *s.pid) {
            SGW_LOG_WARN(LogCategory::Lifecycle,
                         "engine announced pid " + std::to_string(hello.pid) +
                             ", spawned pid " + std::to_string(*s.pid));
        }

        s.engineConn = conn;
        s.stoppingSeen = false;
        s.stoppingClean = false;
        s.counters.engineName = hello.name;
        ++s.counters.starts;
        s.setState(EngineState::Running, fx);

        s.reply(conn, s.makeResult(true, ResultCode::Ok, "attached"));
        s.registry.attachEngine(conn);

        SGW_LOG_INFO(LogCategory::Lifecycle,
                     "engine '" + hello.name + "' attached (pid " + std::to_string(hello.pid) +
                         ")");

        if (s.op == Operation::Start || s.op == Operation::Reload) {
            s.complete(true, ResultCode::Ok,
                       s.op == Operation::Start ? "engine started" : "engine reloaded");
        }
    }

    impl_->apply(fx);
    return ServiceResult<void>::ok();
}

void EngineSupervisor::handleStopping(ConnectionId conn, bool clean, Clock::time_point now) {
    Effects fx;
    {
        std::lock_guard lock(impl_->mutex);
        auto& s = *impl_;

        if (!s.engineConn || *s.engineConn != conn) {
            SGW_LOG_WARN(LogCategory::Lifecycle, "STOPPING from a connection that is not the engine");
            return;
        }

        s.stoppingSeen = true;
        s.stoppingClean = clean;
        s.registry.detachEngine();
        if (s.state == EngineState::Running) {
            s.deadline = now + s.config.stopTimeout;
            s.setState(EngineState::Stopping, fx);
        }
        SGW_LOG_INFO(LogCategory::Lifecycle,
                     std::string("engine is stopping") + (clean ? "" : " (unclean)"));
    }
    impl_->apply(fx);
}

void EngineSupervisor::handleDisconnect(ConnectionId conn, Clock::time_point now) {
    Effects fx;
    {
        std::lock_guard lock(impl_->mutex);
        auto& s = *impl_;

        s.waiters.erase(std::remove_if(s.waiters.begin(), s.waiters.end(),
                                       [conn](const Waiter& w) { return w.conn == conn; }),
                        s.waiters.end());

        if (s.engineConn && *s.engineConn == conn) {
            s.engineLost(now, fx);
        }
    }
    impl_->apply(fx);
}

// -- Supervision tick ---------------------------------------------------------

void EngineSupervisor::tick(Clock::time_point now) {
    Effects fx;
    {
        std::lock_guard lock(impl_->mutex);
        auto& s = *impl_;

        s.orphans.erase(std::remove_if(s.orphans.begin(), s.orphans.end(),
                                       [&s](ProcessId child) {
                                           auto ended = s.spawner.poll(child);
                                           if (ended) {
                                               SGW_LOG_DEBUG(LogCategory::Process,
                                                             "reaped " + ended->describe());
                                           }
                                           return ended.has_value();
                                       }),
                        s.orphans.end());

        if (s.pid) {
            if (auto ended = s.spawner.poll(*s.pid)) {
                s.pid.reset();
                if (s.state == EngineState::Starting) {
                    SGW_LOG_ERROR(LogCategory::Process,
                                  "engine exited before attaching: " + ended->describe());
                    s.setState(EngineState::Absent, fx);
                    s.complete(false, ResultCode::Failed,
                               "engine exited before attaching: " + ended->describe());
                } else {
                    // The control connection drop carries the state change.
                    SGW_LOG_INFO(LogCategory::Process, "engine " + ended->describe());
                }
            }
        }

        if (s.state == EngineState::Starting && now >= s.deadline) {
            if (s.pid) {
                s.retire(*s.pid, true);
                s.pid.reset();
                ++s.counters.forcedKills;
            }
            s.setState(EngineState::Absent, fx);
            s.complete(false, ResultCode::Failed,
                       "engine did not attach within " + formatSeconds(s.config.attachTimeout));
        } else if (s.state == EngineState::Stopping && now >= s.deadline) {
            SGW_LOG_ERROR(LogCategory::Lifecycle,
                          "engine did not stop within " + formatSeconds(s.config.stopTimeout) +
                              ", forcing it");
            if (s.pid) {
                s.retire(*s.pid, true);
                s.pid.reset();
                ++s.counters.forcedKills;
            }
            if (s.engineConn) {
                fx.closes.push_back(*s.engineConn);
            }
            s.stoppingSeen = false;
            s.engineLost(now, fx);
        }
    }
    impl_->apply(fx);
}

// -- Queries ------------------------------------------------------------------

EngineState EngineSupervisor::state() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->state;
}

std::optional<ConnectionId> EngineSupervisor::engineConnection() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->engineConn;
}

SupervisorStats EngineSupervisor::stats() const {
    std::lock_guard lock(impl_->mutex);
    auto out = impl_->counters;
    out.state = impl_->state;
    out.pid = impl_->pid;
    return out;
}

sgw::foundation::Signal<EngineState, EngineState>& EngineSupervisor::onStateChanged() {
    return impl_->stateChanged;
}

sgw::foundation::Signal<>& EngineSupervisor::onShutdownRequested() {
    return impl_->shutdownRequested;
}

} // namespace sgw::service
