/// @file engine_client.cpp
/// @brief EngineClient implementation on TcpChannel.

#include "sgw/service/engine_client.hpp"

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>

#include "sgw/control/control_codec.hpp"
#include "sgw/foundation/service_logger.hpp"
#include "sgw/foundation/tcp_channel.hpp"
#include "sgw/service/engine_core.hpp"
#include "sgw/service/service_runner.hpp"
#include "sgw/version.hpp"

namespace sgw::service {

using sgw::foundation::ErrorCode;
using sgw::foundation::LogCategory;
using sgw::foundation::ServiceError;
using sgw::foundation::ServiceResult;
using sgw::foundation::TcpChannel;

namespace {

/// ControlSink writing encoded frames to the channel. Handlers on several
/// workers send concurrently; one frame is written at a time.
class ChannelSink final : public ControlSink {
public:
    explicit ChannelSink(TcpChannel& channel)
        : channel_(channel) {}

    ServiceResult<void> send(const control::ControlMessage& msg) override {
        auto bytes = control::encode(msg);
        std::lock_guard lock(mutex_);
        return channel_.send(std::move(bytes));
    }

    void close() override {
        channel_.close();
    }

private:
    TcpChannel& channel_;
    std::mutex mutex_;
};

} // namespace

// -- Impl ---------------------------------------------------------------------

struct EngineClient::Impl {
    EngineConfig config;
    TcpChannel channel;
    ChannelSink sink{channel};
    EngineCore core;

    std::mutex decoderMutex;
    control::FrameDecoder decoder;

    std::atomic<bool> disconnected{false};
    std::atomic<bool> shutdownRequested{false};

    Impl(EngineConfig cfg, CommandHandler& handler, PersistenceHook* persistence)
        : config(cfg),
          channel("sgw-engine-" + cfg.name),
          core(std::move(cfg), sink, handler, persistence) {}

    void onBytes(const std::vector<uint8_t>& bytes) {
        std::vector<control::ControlMessage> messages;
        bool framingError = false;
        {
            std::lock_guard lock(decoderMutex);
            auto fed = decoder.feed(bytes, messages);
            if (!fed) {
                SGW_LOG_ERROR(LogCategory::Protocol,
                              "framing error from gateway: " +
                                  std::string(fed.error().message()));
                framingError = true;
            }
        }
        for (const auto& msg : messages) {
            core.handleMessage(msg);
        }
        if (framingError) {
            channel.close();
        }
    }
};

// -- EngineClient -------------------------------------------------------------

EngineClient::EngineClient(EngineConfig config, CommandHandler& handler,
                           PersistenceHook* persistence)
    : impl_(std::make_unique<Impl>(std::move(config), handler, persistence)) {
    impl_->channel.onData.connect([this](const std::vector<uint8_t>& bytes) {
        impl_->onBytes(bytes);
    });
    impl_->channel.onDisconnected.connect([this] {
        impl_->disconnected.store(true);
    });
    impl_->core.onShutdownRequested().connect(
        [this](control::ShutdownMode /*mode*/, const std::string& /*reason*/) {
            impl_->shutdownRequested.store(true);
        });
}

EngineClient::~EngineClient() {
    impl_->channel.onData.disconnectAll();
    impl_->channel.onDisconnected.disconnectAll();
}

ServiceResult<void> EngineClient::connect() {
    const auto& config = impl_->config;
    auto deadline = std::chrono::steady_clock::now() + config.connectDeadline;
    auto backoff = config.initialBackoff;
    int attempt = 0;

    while (true) {
        ++attempt;
        auto connected = impl_->channel.connect(config.gatewayHost, config.gatewayPort,
                                                std::max(backoff, std::chrono::milliseconds(500)));
        if (connected) {
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (now + backoff >= deadline) {
            return ServiceResult<void>::err(ServiceError(
                ErrorCode::ConnectionFailed,
                "gateway " + config.gatewayHost + ":" + std::to_string(config.gatewayPort) +
                    " unreachable after " + std::to_string(attempt) + " attempt(s)"));
        }
        SGW_LOG_DEBUG(LogCategory::Engine,
                      "gateway not reachable, retrying in " + std::to_string(backoff.count()) +
                          "ms");
        std::this_thread::sleep_for(backoff);
        backoff = std::min(backoff * 2, config.maxBackoff);
    }

    control::Hello hello;
    hello.role = control::Role::Engine;
    hello.revision = SGW_PROTOCOL_REVISION;
    hello.name = config.name;
    hello.pid = static_cast<uint32_t>(::getpid());

    auto sent = impl_->sink.send(hello);
    if (!sent) {
        return sent;
    }
    SGW_LOG_INFO(LogCategory::Engine,
                 "connected to gateway " + config.gatewayHost + ":" +
                     std::to_string(config.gatewayPort) + " as '" + config.name + "'");
    return ServiceResult<void>::ok();
}

int EngineClient::run(const SignalHandler& signals) {
    using namespace std::chrono_literals;

    while (!signals.shutdownRequested() && !impl_->shutdownRequested.load() &&
           !impl_->disconnected.load() && !impl_->core.rejected()) {
        std::this_thread::sleep_for(50ms);
    }

    if (impl_->core.rejected()) {
        impl_->channel.close();
        return 1;
    }

    if (impl_->disconnected.load() && !impl_->shutdownRequested.load()) {
        SGW_LOG_ERROR(LogCategory::Engine, "lost the gateway connection");
        impl_->core.shutdown("gateway connection lost");
        return 1;
    }

    bool clean = impl_->core.shutdown(impl_->shutdownRequested.load() ? "gateway request"
                                                                      : "signal");
    return clean ? 0 : 1;
}

EngineCore& EngineClient::core() {
    return impl_->core;
}

} // namespace sgw::service
