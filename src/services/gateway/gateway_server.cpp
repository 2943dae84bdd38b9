/// @file gateway_server.cpp
/// @brief GatewayServer implementation: control-channel peers, client
///        session routing and engine supervision.

#include "sgw/service/gateway_server.hpp"

#include <atomic>
#include <mutex>
#include <set>
#include <unordered_map>
#include <vector>

#include "sgw/control/control_codec.hpp"
#include "sgw/foundation/error_code.hpp"
#include "sgw/foundation/service_logger.hpp"
#include "sgw/service/engine_supervisor.hpp"
#include "sgw/service/session_registry.hpp"
#include "sgw/version.hpp"

namespace sgw::service {

using control::ControlMessage;
using control::MessageKind;
using control::Role;
using sgw::foundation::ConnectionId;
using sgw::foundation::ErrorCode;
using sgw::foundation::LogCategory;
using sgw::foundation::LogContext;
using sgw::foundation::LogLevel;
using sgw::foundation::ServiceError;
using sgw::foundation::ServiceLogger;
using sgw::foundation::ServiceResult;

// -- Impl ---------------------------------------------------------------------

struct GatewayServer::Impl {
    /// A connection on the control listener.
    struct ControlPeer {
        control::FrameDecoder decoder;
        std::optional<Role> role;
    };

    GatewayConfig config;
    GatewayTransport& transport;
    ProtocolRegistry protocols;
    SessionRegistry registry;
    EngineSupervisor supervisor;

    std::mutex peersMutex;
    std::unordered_map<ConnectionId, ControlPeer> peers;

    std::atomic<bool> running{false};

    Impl(GatewayConfig cfg, GatewayTransport& tx, sgw::foundation::ProcessSpawner& spawner,
         ProtocolRegistry reg)
        : config(std::move(cfg)),
          transport(tx),
          protocols(std::move(reg)),
          registry(config, transport),
          supervisor(config, registry, transport, spawner) {}

    const ListenerConfig* findListener(std::string_view name) const {
        for (const auto& listener : config.listeners) {
            if (listener.name == name) {
                return &listener;
            }
        }
        return nullptr;
    }

    void protocolError(ConnectionId conn, std::string_view what) {
        LogContext ctx;
        ctx.connectionId = conn;
        ServiceLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Protocol,
                                                 std::string(what) + ", closing control connection",
                                                 ctx);
    }

    void rememberRole(ConnectionId conn, Role role) {
        std::lock_guard lock(peersMutex);
        auto it = peers.find(conn);
        if (it != peers.end()) {
            it->second.role = role;
        }
    }

    /// Handle one message from a control peer. Returns false if the
    /// connection must be closed.
    bool dispatchControl(ConnectionId conn, const ControlMessage& msg,
                         std::optional<Role>& role, Clock::time_point now) {
        auto kind = control::kindOf(msg);

        if (!role) {
            if (kind != MessageKind::Hello) {
                protocolError(conn, "expected HELLO, got " +
                                        std::string(control::messageKindName(kind)));
                return false;
            }
            return acceptHello(conn, std::get<control::Hello>(msg), role, now);
        }

        if (*role == Role::Launcher) {
            if (kind != MessageKind::Cmd) {
                protocolError(conn, "launcher sent " + std::string(control::messageKindName(kind)));
                return false;
            }
            auto cmd = std::get<control::Cmd>(msg).command;
            if (auto immediate = supervisor.handleCommand(conn, cmd, now)) {
                auto sent = transport.send(conn, control::encode(*immediate));
                if (!sent) {
                    SGW_LOG_WARN(LogCategory::Lifecycle, std::string(sent.error().message()));
                }
            }
            return true;
        }

        // Engine role. A connection the supervisor has already given up on
        // may still drain a few frames before it closes; ignore them.
        auto engineConn = supervisor.engineConnection();
        if (!engineConn || *engineConn != conn) {
            SGW_LOG_DEBUG(LogCategory::Protocol,
                          "ignoring " + std::string(control::messageKindName(kind)) +
                              " from a detached engine");
            return true;
        }
        dispatchEngine(conn, msg, kind, now);
        return true;
    }

    bool acceptHello(ConnectionId conn, const control::Hello& hello, std::optional<Role>& role,
                     Clock::time_point now) {
        if (hello.role == Role::Engine) {
            auto attached = supervisor.attach(conn, hello, now);
            if (!attached) {
                return false;
            }
            role = Role::Engine;
            rememberRole(conn, Role::Engine);
            return true;
        }

        if (hello.revision != SGW_PROTOCOL_REVISION) {
            control::CommandResult rejected;
            rejected.ok = false;
            rejected.code = control::ResultCode::Rejected;
            rejected.engineState = supervisor.state();
            rejected.sessionCount = static_cast<uint32_t>(registry.size());
            rejected.detail = "protocol revision " + std::to_string(hello.revision) +
                              " not supported";
            protocolError(conn, rejected.detail);
            auto sent = transport.send(conn, control::encode(rejected));
            if (!sent) {
                SGW_LOG_DEBUG(LogCategory::Protocol, std::string(sent.error().message()));
            }
            return false;
        }

        role = Role::Launcher;
        rememberRole(conn, Role::Launcher);
        SGW_LOG_DEBUG(LogCategory::Lifecycle,
                      "launcher '" + hello.name + "' connected (pid " +
                          std::to_string(hello.pid) + ")");
        return true;
    }

    void dispatchEngine(ConnectionId conn, const ControlMessage& msg, MessageKind kind,
                        Clock::time_point now) {
        switch (kind) {
            case MessageKind::Data: {
                const auto& data = std::get<control::Data>(msg);
                registry.routeOutbound(data.sessionId, control::payloadText(data), now);
                break;
            }
            case MessageKind::SessionUpdate:
                if (!registry.applyUpdate(std::get<control::SessionUpdate>(msg))) {
                    SGW_LOG_DEBUG(LogCategory::Session, "update for a closed session");
                }
                break;
            case MessageKind::ResyncFailed: {
                const auto& failed = std::get<control::ResyncFailed>(msg);
                registry.markResyncFailed(failed.sessionId, failed.reason);
                break;
            }
            case MessageKind::Disconnect: {
                const auto& disc = std::get<control::Disconnect>(msg);
                registry.disconnect(disc.sessionId, disc.reason);
                break;
            }
            case MessageKind::DisconnectAll:
                registry.disconnectAll(std::get<control::DisconnectAll>(msg).reason);
                break;
            case MessageKind::Announce:
                registry.announce(std::get<control::Announce>(msg).text);
                break;
            case MessageKind::Stopping:
                supervisor.handleStopping(conn, std::get<control::Stopping>(msg).clean, now);
                break;
            default:
                SGW_LOG_WARN(LogCategory::Protocol,
                             "unexpected " + std::string(control::messageKindName(kind)) +
                                 " from engine");
                break;
        }
    }

    void handleControlData(ConnectionId conn, std::span<const uint8_t> bytes,
                           Clock::time_point now) {
        std::vector<ControlMessage> messages;
        std::optional<Role> role;
        bool framingError = false;
        {
            std::lock_guard lock(peersMutex);
            auto it = peers.find(conn);
            if (it == peers.end()) {
                return;
            }
            auto fed = it->second.decoder.feed(bytes, messages);
            role = it->second.role;
            if (!fed) {
                protocolError(conn, "framing error: " + std::string(fed.error().message()));
                framingError = true;
            }
        }

        // Frames that arrived intact ahead of a bad one are still honoured.
        // Closing may re-enter handleDisconnect, which takes peersMutex.
        for (const auto& msg : messages) {
            if (!dispatchControl(conn, msg, role, now)) {
                transport.close(conn);
                return;
            }
        }
        if (framingError) {
            transport.close(conn);
        }
    }
};

// -- Construction -------------------------------------------------------------

GatewayServer::GatewayServer(GatewayConfig config, GatewayTransport& transport,
                             sgw::foundation::ProcessSpawner& spawner, ProtocolRegistry protocols)
    : impl_(std::make_unique<Impl>(std::move(config), transport, spawner, std::move(protocols))) {}

GatewayServer::~GatewayServer() = default;

GatewayServer::GatewayServer(GatewayServer&&) noexcept = default;
GatewayServer& GatewayServer::operator=(GatewayServer&&) noexcept = default;

// -- Lifecycle ----------------------------------------------------------------

ServiceResult<void> GatewayServer::start(Clock::time_point now) {
    if (impl_->running.load()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::AlreadyExists, "gateway already running"));
    }

    std::set<std::string> names;
    for (const auto& listener : impl_->config.listeners) {
        if (listener.name == kControlListener) {
            return ServiceResult<void>::err(ServiceError(
                ErrorCode::ConfigInvalidValue, "listener name 'control' is reserved"));
        }
        if (!names.insert(listener.name).second) {
            return ServiceResult<void>::err(ServiceError(
                ErrorCode::ConfigInvalidValue, "duplicate listener name: " + listener.name));
        }
        if (!impl_->protocols.contains(listener.codec)) {
            return ServiceResult<void>::err(ServiceError(
                ErrorCode::ConfigInvalidValue,
                "listener " + listener.name + " uses unknown codec: " + listener.codec));
        }
    }

    impl_->running.store(true);
    SGW_LOG_INFO(LogCategory::Core,
                 "gateway started with " + std::to_string(impl_->config.listeners.size()) +
                     " client listener(s)");

    if (impl_->config.autostartEngine) {
        auto result = executeCommand(control::Command::Start, now);
        if (result && !result->ok) {
            SGW_LOG_ERROR(LogCategory::Lifecycle, "autostart failed: " + result->detail);
        }
    }
    return ServiceResult<void>::ok();
}

void GatewayServer::stop() {
    if (impl_->running.exchange(false)) {
        SGW_LOG_INFO(LogCategory::Core, "gateway stopped");
    }
}

bool GatewayServer::isRunning() const noexcept {
    return impl_->running.load();
}

// -- Connection handling ------------------------------------------------------

void GatewayServer::handleConnect(ConnectionId conn, const std::string& listener,
                                  std::string remoteAddress, Clock::time_point now) {
    if (!impl_->running.load()) {
        impl_->transport.close(conn);
        return;
    }

    if (listener == kControlListener) {
        std::lock_guard lock(impl_->peersMutex);
        impl_->peers.try_emplace(conn);
        return;
    }

    const auto* config = impl_->findListener(listener);
    if (config == nullptr) {
        SGW_LOG_WARN(LogCategory::Network, "connection on unknown listener " + listener);
        impl_->transport.close(conn);
        return;
    }

    CodecOptions options;
    options.maxInputBytes = impl_->config.maxInputBytes;
    options.negotiate = config->negotiate;
    auto codec = impl_->protocols.create(config->codec, options);
    if (!codec) {
        SGW_LOG_ERROR(LogCategory::Network, std::string(codec.error().message()));
        impl_->transport.close(conn);
        return;
    }

    auto created = impl_->registry.create(conn, listener, std::move(codec.value()),
                                          std::move(remoteAddress), now);
    if (!created) {
        SGW_LOG_WARN(LogCategory::Network,
                     "refused connection: " + std::string(created.error().message()));
        impl_->transport.close(conn);
    }
}

void GatewayServer::handleData(ConnectionId conn, std::span<const uint8_t> bytes,
                               Clock::time_point now) {
    if (auto sid = impl_->registry.findByConnection(conn)) {
        impl_->registry.routeInbound(*sid, bytes, now);
        return;
    }
    impl_->handleControlData(conn, bytes, now);
}

void GatewayServer::handleDisconnect(ConnectionId conn, Clock::time_point now) {
    bool wasPeer = false;
    {
        std::lock_guard lock(impl_->peersMutex);
        wasPeer = impl_->peers.erase(conn) > 0;
    }
    if (wasPeer) {
        impl_->supervisor.handleDisconnect(conn, now);
        return;
    }

    if (auto sid = impl_->registry.findByConnection(conn)) {
        impl_->registry.remove(*sid);
    }
}

// -- Maintenance --------------------------------------------------------------

void GatewayServer::tick(Clock::time_point now) {
    impl_->supervisor.tick(now);
    impl_->registry.expireIdle(now);
}

std::optional<control::CommandResult> GatewayServer::executeCommand(control::Command cmd,
                                                                    Clock::time_point now) {
    return impl_->supervisor.handleCommand(ConnectionId{}, cmd, now);
}

// -- Accessors ----------------------------------------------------------------

SessionRegistry& GatewayServer::sessions() {
    return impl_->registry;
}

const SessionRegistry& GatewayServer::sessions() const {
    return impl_->registry;
}

EngineSupervisor& GatewayServer::supervisor() {
    return impl_->supervisor;
}

const EngineSupervisor& GatewayServer::supervisor() const {
    return impl_->supervisor;
}

GatewayStats GatewayServer::stats() const {
    return impl_->registry.stats();
}

const GatewayConfig& GatewayServer::config() const noexcept {
    return impl_->config;
}

sgw::foundation::Signal<>& GatewayServer::onShutdownRequested() {
    return impl_->supervisor.onShutdownRequested();
}

} // namespace sgw::service
