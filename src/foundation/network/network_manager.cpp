/// @file network_manager.cpp
/// @brief NetworkManager implementation wrapping kcenon network_system.

#include "sgw/foundation/network_manager.hpp"

#include "sgw/foundation/service_logger.hpp"

// kcenon facade headers (hidden behind PIMPL)
#include <kcenon/network/facade/tcp_facade.h>
#include <kcenon/network/facade/websocket_facade.h>
#include <kcenon/network/interfaces/i_protocol_server.h>
#include <kcenon/network/interfaces/i_session.h>

#include <atomic>
#include <shared_mutex>
#include <unordered_map>

namespace sgw::foundation {

namespace kni = kcenon::network::interfaces;

std::optional<Transport> parseTransport(std::string_view name) {
    if (name == "tcp") return Transport::Tcp;
    if (name == "websocket" || name == "ws") return Transport::WebSocket;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------

struct NetworkManager::Impl {
    struct Listener {
        Transport transport;
        uint16_t port;
        std::shared_ptr<kni::i_protocol_server> server;
    };

    struct InternalConnection {
        std::string kcSessionId;
        std::shared_ptr<kni::i_session> kcSession;
        ConnectionInfo info;
    };

    std::unordered_map<std::string, Listener> listeners;
    mutable std::shared_mutex listenerMutex;

    std::unordered_map<ConnectionId, InternalConnection> connections;
    // kcenon session ids are only unique per server, so the reverse map is
    // keyed by "<listener>/<kcenon id>".
    std::unordered_map<std::string, ConnectionId> reverseMap;
    mutable std::shared_mutex connectionMutex;

    std::atomic<uint64_t> nextConnectionId{1};

    // Non-owning back-pointer for signal emission.
    NetworkManager* owner = nullptr;

    static std::string reverseKey(const std::string& listener, std::string_view kcId) {
        std::string key = listener;
        key += '/';
        key += kcId;
        return key;
    }

    std::shared_ptr<kni::i_protocol_server> createServer(Transport transport) {
        using namespace kcenon::network::facade;
        switch (transport) {
            case Transport::Tcp: {
                tcp_facade facade;
                return facade.create_server({});
            }
            case Transport::WebSocket: {
                websocket_facade facade;
                return facade.create_server({});
            }
        }
        return nullptr;
    }

    std::optional<ConnectionId> lookup(const std::string& listener, std::string_view kcId) const {
        std::shared_lock lock(connectionMutex);
        auto it = reverseMap.find(reverseKey(listener, kcId));
        if (it == reverseMap.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void setupCallbacks(const std::shared_ptr<kni::i_protocol_server>& server,
                        const std::string& listener, Transport transport) {
        server->set_connection_callback(
            [this, listener, transport](std::shared_ptr<kni::i_session> kcSession) {
                auto cid = ConnectionId(nextConnectionId.fetch_add(1, std::memory_order_relaxed));
                auto kcId = std::string(kcSession->id());

                InternalConnection internal;
                internal.kcSessionId = kcId;
                internal.kcSession = kcSession;
                internal.info.id = cid;
                internal.info.listener = listener;
                internal.info.transport = transport;
                internal.info.remoteAddress = kcId;
                internal.info.connectedAt = std::chrono::steady_clock::now();

                {
                    std::unique_lock lock(connectionMutex);
                    connections.emplace(cid, std::move(internal));
                    reverseMap.emplace(reverseKey(listener, kcId), cid);
                }

                owner->onConnected.emit(cid, listener);
            });

        server->set_receive_callback(
            [this, listener](std::string_view kcId, const std::vector<uint8_t>& data) {
                auto cid = lookup(listener, kcId);
                if (!cid) {
                    return;
                }
                owner->onData.emit(*cid, data);
            });

        server->set_disconnection_callback(
            [this, listener](std::string_view kcId) {
                ConnectionId cid;
                {
                    std::unique_lock lock(connectionMutex);
                    auto it = reverseMap.find(reverseKey(listener, kcId));
                    if (it == reverseMap.end()) {
                        return;
                    }
                    cid = it->second;
                    connections.erase(cid);
                    reverseMap.erase(it);
                }

                owner->onDisconnected.emit(cid);
            });

        server->set_error_callback(
            [this, listener](std::string_view kcId, std::error_code ec) {
                auto cid = lookup(listener, kcId);
                if (!cid) {
                    return;
                }
                LogContext ctx;
                ctx.connectionId = *cid;
                ctx.extra["error"] = ec.message();
                ServiceLogger::instance().logWithContext(
                    LogLevel::Debug, LogCategory::Network, "connection error", ctx);
                owner->onError.emit(*cid, ec ? ErrorCode::NetworkError : ErrorCode::Success);
            });
    }

    // Drop bookkeeping for every connection accepted by one listener.
    void forgetConnections(const std::string& listener) {
        std::unique_lock lock(connectionMutex);
        for (auto it = connections.begin(); it != connections.end();) {
            if (it->second.info.listener == listener) {
                reverseMap.erase(reverseKey(listener, it->second.kcSessionId));
                it = connections.erase(it);
            } else {
                ++it;
            }
        }
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction / Move
// ---------------------------------------------------------------------------

NetworkManager::NetworkManager()
    : impl_(std::make_unique<Impl>()) {
    impl_->owner = this;
}

NetworkManager::~NetworkManager() {
    if (impl_) {
        stopAll();
    }
}

NetworkManager::NetworkManager(NetworkManager&& other) noexcept
    : impl_(std::move(other.impl_)) {
    if (impl_) {
        impl_->owner = this;
    }
}

NetworkManager& NetworkManager::operator=(NetworkManager&& other) noexcept {
    if (this != &other) {
        if (impl_) {
            stopAll();
        }
        impl_ = std::move(other.impl_);
        if (impl_) {
            impl_->owner = this;
        }
    }
    return *this;
}

// ---------------------------------------------------------------------------
// listen() / stop()
// ---------------------------------------------------------------------------

ServiceResult<void> NetworkManager::listen(const std::string& name, uint16_t port,
                                           Transport transport) {
    {
        std::shared_lock lock(impl_->listenerMutex);
        if (impl_->listeners.count(name) > 0) {
            return ServiceResult<void>::err(
                ServiceError(ErrorCode::AlreadyExists, "listener already running: " + name));
        }
    }

    auto server = impl_->createServer(transport);
    if (!server) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ListenFailed,
                         "failed to create " + std::string(transportName(transport)) +
                             " server for " + name));
    }

    impl_->setupCallbacks(server, name, transport);

    auto result = server->start(port);
    if (result.is_err()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ListenFailed,
                         "failed to listen on port " + std::to_string(port) + " (" + name + ")"));
    }

    {
        std::unique_lock lock(impl_->listenerMutex);
        impl_->listeners.emplace(name, Impl::Listener{transport, port, std::move(server)});
    }

    SGW_LOG_INFO(LogCategory::Network,
                 "listening: " + name + " " + std::string(transportName(transport)) +
                     " port " + std::to_string(port));
    return ServiceResult<void>::ok();
}

ServiceResult<void> NetworkManager::stop(const std::string& name) {
    std::shared_ptr<kni::i_protocol_server> server;
    {
        std::unique_lock lock(impl_->listenerMutex);
        auto it = impl_->listeners.find(name);
        if (it == impl_->listeners.end()) {
            return ServiceResult<void>::err(
                ServiceError(ErrorCode::NotFound, "listener not running: " + name));
        }
        server = std::move(it->second.server);
        impl_->listeners.erase(it);
    }

    (void)server->stop();
    impl_->forgetConnections(name);
    return ServiceResult<void>::ok();
}

void NetworkManager::stopAll() {
    std::unordered_map<std::string, Impl::Listener> listeners;
    {
        std::unique_lock lock(impl_->listenerMutex);
        listeners.swap(impl_->listeners);
    }
    for (auto& [name, listener] : listeners) {
        (void)listener.server->stop();
    }

    std::unique_lock lock(impl_->connectionMutex);
    impl_->connections.clear();
    impl_->reverseMap.clear();
}

bool NetworkManager::isListening(const std::string& name) const {
    std::shared_lock lock(impl_->listenerMutex);
    return impl_->listeners.count(name) > 0;
}

// ---------------------------------------------------------------------------
// send() / close()
// ---------------------------------------------------------------------------

ServiceResult<void> NetworkManager::send(ConnectionId conn, std::vector<uint8_t> bytes) {
    std::shared_ptr<kni::i_session> kcSession;
    {
        std::shared_lock lock(impl_->connectionMutex);
        auto it = impl_->connections.find(conn);
        if (it == impl_->connections.end()) {
            return ServiceResult<void>::err(
                ServiceError(ErrorCode::NotFound,
                             "connection " + std::to_string(conn.value()) + " not found"));
        }
        kcSession = it->second.kcSession;
    }

    auto result = kcSession->send(std::move(bytes));
    if (result.is_err()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::SendFailed,
                         "send failed for connection " + std::to_string(conn.value())));
    }
    return ServiceResult<void>::ok();
}

void NetworkManager::close(ConnectionId conn) {
    std::shared_ptr<kni::i_session> kcSession;
    {
        std::shared_lock lock(impl_->connectionMutex);
        auto it = impl_->connections.find(conn);
        if (it == impl_->connections.end()) {
            return;
        }
        kcSession = it->second.kcSession;
    }

    if (kcSession) {
        kcSession->close();
    }
    // Removal happens in the disconnection callback
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

std::optional<ConnectionInfo> NetworkManager::connectionInfo(ConnectionId conn) const {
    std::shared_lock lock(impl_->connectionMutex);
    auto it = impl_->connections.find(conn);
    if (it == impl_->connections.end()) {
        return std::nullopt;
    }
    return it->second.info;
}

std::size_t NetworkManager::connectionCount() const {
    std::shared_lock lock(impl_->connectionMutex);
    return impl_->connections.size();
}

} // namespace sgw::foundation
