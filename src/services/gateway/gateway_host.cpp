/// @file gateway_host.cpp
/// @brief GatewayHost: NetworkManager-backed transport, POSIX spawner and
///        the supervision loop.

#include "sgw/service/gateway_host.hpp"

#include <atomic>
#include <thread>

#include "sgw/foundation/job_scheduler.hpp"
#include "sgw/foundation/network_manager.hpp"
#include "sgw/foundation/process_spawner.hpp"
#include "sgw/foundation/service_logger.hpp"
#include "sgw/service/engine_supervisor.hpp"
#include "sgw/service/gateway_server.hpp"
#include "sgw/service/service_runner.hpp"

namespace sgw::service {

using sgw::foundation::ConnectionId;
using sgw::foundation::ErrorCode;
using sgw::foundation::JobScheduler;
using sgw::foundation::LogCategory;
using sgw::foundation::NetworkManager;
using sgw::foundation::ServiceResult;
using sgw::foundation::Transport;

namespace {

/// GatewayTransport over the NetworkManager's connections.
class NetworkTransport final : public GatewayTransport {
public:
    explicit NetworkTransport(NetworkManager& network)
        : network_(network) {}

    ServiceResult<void> send(ConnectionId conn, std::vector<uint8_t> bytes) override {
        return network_.send(conn, std::move(bytes));
    }

    void close(ConnectionId conn) override {
        network_.close(conn);
    }

    // network_system sessions do not expose their write queue, so only the
    // output budget limits what a slow client is sent here.
    std::optional<std::size_t> pendingBytes(ConnectionId) const override {
        return std::nullopt;
    }

private:
    NetworkManager& network_;
};

} // namespace

// -- Impl ---------------------------------------------------------------------

struct GatewayHost::Impl {
    NetworkManager network;
    NetworkTransport transport{network};
    sgw::foundation::PosixProcessSpawner spawner;
    GatewayServer gateway;
    JobScheduler scheduler{1};
    std::atomic<bool> shutdownRequested{false};

    explicit Impl(GatewayConfig config)
        : gateway(std::move(config), transport, spawner) {}

    void wire() {
        network.onConnected.connect([this](ConnectionId conn, const std::string& listener) {
            auto info = network.connectionInfo(conn);
            gateway.handleConnect(conn, listener, info ? info->remoteAddress : std::string{});
        });
        network.onData.connect([this](ConnectionId conn, const std::vector<uint8_t>& bytes) {
            gateway.handleData(conn, bytes);
        });
        network.onDisconnected.connect([this](ConnectionId conn) {
            gateway.handleDisconnect(conn);
        });
        network.onError.connect([](ConnectionId conn, ErrorCode code) {
            SGW_LOG_DEBUG(LogCategory::Network,
                          "connection " + std::to_string(conn.value()) + " error " +
                              std::to_string(static_cast<uint32_t>(code)));
        });
        gateway.onShutdownRequested().connect([this] {
            shutdownRequested.store(true);
        });
    }

    void pump() {
        const auto& interval = gateway.config().tickInterval;
        scheduler.processTick(interval);
        std::this_thread::sleep_for(interval);
    }
};

// -- GatewayHost --------------------------------------------------------------

GatewayHost::GatewayHost(GatewayConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {
    impl_->wire();
}

GatewayHost::~GatewayHost() {
    // The callbacks reference the gateway, which is destroyed before the network.
    impl_->network.onConnected.disconnectAll();
    impl_->network.onData.disconnectAll();
    impl_->network.onDisconnected.disconnectAll();
    impl_->network.onError.disconnectAll();
    impl_->network.stopAll();
}

ServiceResult<void> GatewayHost::start() {
    const auto& config = impl_->gateway.config();

    auto control = impl_->network.listen(std::string(GatewayServer::kControlListener),
                                         config.controlPort, Transport::Tcp);
    if (!control) {
        return control;
    }
    SGW_LOG_INFO(LogCategory::Network,
                 "control channel on port " + std::to_string(config.controlPort));

    for (const auto& listener : config.listeners) {
        auto result = impl_->network.listen(listener.name, listener.port, listener.transport);
        if (!result) {
            impl_->network.stopAll();
            return result;
        }
        SGW_LOG_INFO(LogCategory::Network,
                     "listener " + listener.name + " (" +
                         std::string(sgw::foundation::transportName(listener.transport)) + "/" +
                         listener.codec + ") on port " + std::to_string(listener.port));
    }

    auto tick = impl_->scheduler.scheduleTick(config.tickInterval, [this] {
        impl_->gateway.tick();
    });
    if (!tick) {
        impl_->network.stopAll();
        return ServiceResult<void>::err(tick.error());
    }

    auto started = impl_->gateway.start();
    if (!started) {
        impl_->network.stopAll();
    }
    return started;
}

void GatewayHost::run(const SignalHandler& signals) {
    while (!signals.shutdownRequested() && !impl_->shutdownRequested.load()) {
        impl_->pump();
    }
}

void GatewayHost::shutdown() {
    auto& gateway = impl_->gateway;
    const auto& config = gateway.config();

    // Allow a transition already in flight to settle, then stop the engine.
    auto deadline = std::chrono::steady_clock::now() + config.attachTimeout + config.stopTimeout +
                    std::chrono::seconds(1);

    while (std::chrono::steady_clock::now() < deadline) {
        auto result = gateway.executeCommand(control::Command::Shutdown);
        if (!result || result->code != control::ResultCode::OperationInProgress) {
            break;
        }
        impl_->pump();
    }

    while (gateway.supervisor().state() != control::EngineState::Absent &&
           std::chrono::steady_clock::now() < deadline) {
        impl_->pump();
    }
    if (gateway.supervisor().state() != control::EngineState::Absent) {
        SGW_LOG_ERROR(LogCategory::Lifecycle, "engine still present at gateway exit");
    }

    gateway.stop();
    impl_->network.stopAll();
}

GatewayServer& GatewayHost::gateway() {
    return impl_->gateway;
}

} // namespace sgw::service
