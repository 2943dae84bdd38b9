/// @file tcp_channel.cpp
/// @brief TcpChannel implementation on kcenon's tcp_facade client.

#include "sgw/foundation/tcp_channel.hpp"

#include "sgw/foundation/service_logger.hpp"

#include <kcenon/network/facade/tcp_facade.h>
#include <kcenon/network/interfaces/connection_observer.h>
#include <kcenon/network/interfaces/i_protocol_client.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <span>

namespace sgw::foundation {

namespace kni = kcenon::network::interfaces;

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct TcpChannel::Impl {
    std::string clientId;
    std::shared_ptr<kni::i_protocol_client> client;

    std::mutex mutex;
    std::condition_variable connectedCv;
    bool connected = false;
    std::atomic<bool> disconnectNotified{false};
    /// Bumped per connect() so callbacks from an abandoned attempt are ignored.
    std::atomic<uint64_t> generation{0};

    // Cleared by the owning TcpChannel's destructor; observer callbacks that
    // race with destruction then become no-ops.
    TcpChannel* owner = nullptr;
    std::recursive_mutex ownerMutex;

    void notifyDisconnected() {
        {
            std::lock_guard lock(mutex);
            connected = false;
        }
        if (disconnectNotified.exchange(true)) {
            return;
        }
        std::lock_guard<std::recursive_mutex> lock(ownerMutex);
        if (owner) {
            owner->onDisconnected.emit();
        }
    }

    void deliver(std::span<const uint8_t> data) {
        std::vector<uint8_t> bytes(data.begin(), data.end());
        std::lock_guard<std::recursive_mutex> lock(ownerMutex);
        if (owner) {
            owner->onData.emit(bytes);
        }
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction
// ---------------------------------------------------------------------------
TcpChannel::TcpChannel(std::string clientId)
    : impl_(std::make_shared<Impl>()) {
    impl_->clientId = std::move(clientId);
    impl_->owner = this;
}

TcpChannel::~TcpChannel() {
    {
        std::lock_guard<std::recursive_mutex> lock(impl_->ownerMutex);
        impl_->owner = nullptr;
    }
    if (impl_->client) {
        (void)impl_->client->stop();
    }
}

// ---------------------------------------------------------------------------
// connect()
// ---------------------------------------------------------------------------
ServiceResult<void> TcpChannel::connect(const std::string& host, uint16_t port,
                                        std::chrono::milliseconds timeout) {
    if (impl_->client) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::AlreadyExists, "channel already connected"));
    }

    kcenon::network::facade::tcp_facade tcp;
    kcenon::network::facade::tcp_facade::client_config cfg{};
    cfg.host = host;
    cfg.port = port;
    cfg.client_id = impl_->clientId;

    // The tcp facade starts connecting inside create_client().
    impl_->client = tcp.create_client(cfg);
    if (!impl_->client) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ConnectionFailed,
                         "failed to create client for " + host + ":" + std::to_string(port)));
    }

    auto gen = impl_->generation.fetch_add(1) + 1;
    impl_->disconnectNotified.store(false);

    std::weak_ptr<Impl> weak = impl_;
    auto adapter = std::make_shared<kni::callback_adapter>();
    adapter->on_connected([weak, gen]() {
        if (auto self = weak.lock(); self && self->generation.load() == gen) {
            std::lock_guard lock(self->mutex);
            self->connected = true;
            self->connectedCv.notify_all();
        }
    }).on_receive([weak, gen](std::span<const uint8_t> data) {
        if (auto self = weak.lock(); self && self->generation.load() == gen) {
            self->deliver(data);
        }
    }).on_disconnected([weak, gen](std::optional<std::string_view> /*reason*/) {
        if (auto self = weak.lock(); self && self->generation.load() == gen) {
            self->notifyDisconnected();
        }
    }).on_error([weak](std::error_code ec) {
        if (auto self = weak.lock()) {
            SGW_LOG_DEBUG(LogCategory::Network, "client " + self->clientId + " error: " + ec.message());
        }
    });
    impl_->client->set_observer(adapter);

    // The connected callback may have fired before the observer was attached.
    std::unique_lock lock(impl_->mutex);
    if (impl_->client->is_connected()) {
        impl_->connected = true;
    }
    bool ok = impl_->connectedCv.wait_for(lock, timeout, [this] {
        return impl_->connected || impl_->client->is_connected();
    });
    if (!ok) {
        lock.unlock();
        impl_->generation.fetch_add(1);
        (void)impl_->client->stop();
        impl_->client.reset();
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ConnectionFailed,
                         "cannot connect to " + host + ":" + std::to_string(port)));
    }
    impl_->connected = true;
    return ServiceResult<void>::ok();
}

// ---------------------------------------------------------------------------
// send() / close()
// ---------------------------------------------------------------------------
ServiceResult<void> TcpChannel::send(std::vector<uint8_t> bytes) {
    if (!impl_->client || !isConnected()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::NotConnected, "channel is not connected"));
    }
    auto result = impl_->client->send(std::move(bytes));
    if (result.is_err()) {
        return ServiceResult<void>::err(ServiceError(ErrorCode::SendFailed, "channel send failed"));
    }
    return ServiceResult<void>::ok();
}

void TcpChannel::close() {
    if (impl_->client) {
        (void)impl_->client->stop();
    }
    impl_->notifyDisconnected();
}

bool TcpChannel::isConnected() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->connected && impl_->client && impl_->client->is_connected();
}

} // namespace sgw::foundation
