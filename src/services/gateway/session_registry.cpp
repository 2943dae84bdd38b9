/// @file session_registry.cpp
/// @brief SessionRegistry implementation: session table, input queueing,
///        output budgets and engine resync.

#include "sgw/service/session_registry.hpp"

#include <algorithm>
#include <deque>
#include <iterator>
#include <map>
#include <mutex>
#include <unordered_map>

#include "sgw/control/control_codec.hpp"
#include "sgw/foundation/service_logger.hpp"
#include "sgw/service/token_bucket.hpp"

namespace sgw::service {

using sgw::foundation::AccountId;
using sgw::foundation::ConnectionId;
using sgw::foundation::ErrorCode;
using sgw::foundation::LogCategory;
using sgw::foundation::LogContext;
using sgw::foundation::LogLevel;
using sgw::foundation::PuppetId;
using sgw::foundation::ServiceError;
using sgw::foundation::ServiceLogger;
using sgw::foundation::ServiceResult;
using sgw::foundation::SessionId;

namespace {

LogContext sessionContext(SessionId sid, ConnectionId conn) {
    LogContext ctx;
    ctx.sessionId = sid;
    ctx.connectionId = conn;
    return ctx;
}

} // namespace

// -- Impl ---------------------------------------------------------------------

struct SessionRegistry::Impl {
    struct Entry {
        SessionInfo info;
        std::unique_ptr<ProtocolCodec> codec;
        std::deque<std::string> queue;
        /// Restarting notice already sent during the current outage.
        bool noticeShown = false;
    };

    const GatewayConfig& config;
    GatewayTransport& transport;

    mutable std::mutex mutex;
    std::map<SessionId, Entry> sessions;
    std::unordered_map<ConnectionId, SessionId> byConnection;
    std::optional<ConnectionId> engineConn;
    uint64_t nextId = 1;

    TokenBucket commandBucket;
    TokenBucket outputBucket;

    GatewayStats counters;

    Impl(const GatewayConfig& cfg, GatewayTransport& tx)
        : config(cfg),
          transport(tx),
          commandBucket(cfg.commandRateCapacity, cfg.commandRateRefillPerSecond),
          outputBucket(cfg.outputBudgetBytes, cfg.outputRefillBytesPerSecond) {}

    // Everything below runs with the mutex held.

    bool sendToEngine(const control::ControlMessage& msg) {
        if (!engineConn) {
            return false;
        }
        auto result = transport.send(*engineConn, control::encode(msg));
        if (!result) {
            SGW_LOG_WARN(LogCategory::Session,
                         "send to engine failed: " + std::string(result.error().message()));
            return false;
        }
        return true;
    }

    void notice(const Entry& entry, std::string_view text) {
        if (text.empty()) {
            return;
        }
        auto result = transport.send(entry.info.connection, entry.codec->encode(text));
        if (!result) {
            SGW_LOG_DEBUG(LogCategory::Session,
                          "notice not delivered to session " +
                              std::to_string(entry.info.id.value()));
        }
    }

    control::ResyncSession resyncFor(const Entry& entry) const {
        control::ResyncSession msg;
        msg.sessionId = entry.info.id;
        msg.protocol = entry.info.protocol;
        msg.auth = entry.info.auth;
        msg.account = entry.info.account;
        msg.puppet = entry.info.puppet;
        msg.capabilities = entry.info.capabilities;
        return msg;
    }

    void enqueue(Entry& entry, std::string input, InboundResult& result) {
        if (!entry.noticeShown) {
            notice(entry, config.restartingNotice);
            entry.noticeShown = true;
        }

        if (config.inputQueueCapacity == 0) {
            ++result.dropped;
            ++counters.inputsDropped;
            return;
        }

        if (entry.queue.size() >= config.inputQueueCapacity) {
            if (config.inputQueuePolicy == InputQueuePolicy::RejectNew) {
                notice(entry, config.unavailableNotice);
                ++result.dropped;
                ++counters.inputsDropped;
                return;
            }
            entry.queue.pop_front();
            ++result.dropped;
            ++counters.inputsDropped;
        }

        entry.queue.push_back(std::move(input));
        ++result.queued;
        ++counters.inputsQueued;
    }

    /// Forward queued inputs until the queue is empty or a send fails.
    void flushQueue(Entry& entry) {
        while (!entry.queue.empty()) {
            if (!sendToEngine(control::makeData(entry.info.id, entry.queue.front()))) {
                return;
            }
            entry.queue.pop_front();
            ++counters.inputsForwarded;
        }
    }

    /// Drop a session. The caller closes the returned connection after
    /// releasing the mutex.
    ConnectionId erase(std::map<SessionId, Entry>::iterator it, bool notifyEngine,
                       std::string_view reason) {
        auto sid = it->first;
        auto conn = it->second.info.connection;
        if (notifyEngine) {
            sendToEngine(control::Disconnect{sid, std::string(reason)});
        }
        byConnection.erase(conn);
        commandBucket.remove(sid);
        outputBucket.remove(sid);
        sessions.erase(it);
        return conn;
    }

    void closeAll(const std::vector<ConnectionId>& conns) {
        for (auto conn : conns) {
            transport.close(conn);
        }
    }
};

// -- Construction -------------------------------------------------------------

SessionRegistry::SessionRegistry(const GatewayConfig& config, GatewayTransport& transport)
    : impl_(std::make_unique<Impl>(config, transport)) {}

SessionRegistry::~SessionRegistry() = default;

// -- Session lifecycle --------------------------------------------------------

ServiceResult<SessionId> SessionRegistry::create(ConnectionId conn, std::string listener,
                                                 std::unique_ptr<ProtocolCodec> codec,
                                                 std::string remoteAddress,
                                                 Clock::time_point now) {
    if (!codec) {
        return ServiceResult<SessionId>::err(
            ServiceError(ErrorCode::InvalidArgument, "session needs a protocol codec"));
    }

    std::lock_guard lock(impl_->mutex);

    if (impl_->sessions.size() >= impl_->config.maxConnections) {
        ++impl_->counters.connectionsRefused;
        return ServiceResult<SessionId>::err(ServiceError(
            ErrorCode::ConnectionLimitReached,
            "session limit reached (" + std::to_string(impl_->config.maxConnections) + ")"));
    }
    if (impl_->byConnection.count(conn) > 0) {
        return ServiceResult<SessionId>::err(
            ServiceError(ErrorCode::AlreadyExists, "connection already has a session"));
    }

    SessionId sid(impl_->nextId++);

    Impl::Entry entry;
    entry.info.id = sid;
    entry.info.connection = conn;
    entry.info.listener = std::move(listener);
    entry.info.protocol = codec->kind();
    entry.info.remoteAddress = std::move(remoteAddress);
    entry.info.connectedAt = now;
    entry.info.lastActivity = now;
    entry.codec = std::move(codec);

    auto& stored = impl_->sessions.emplace(sid, std::move(entry)).first->second;
    impl_->byConnection.emplace(conn, sid);
    impl_->commandBucket.reset(sid, now);
    impl_->outputBucket.reset(sid, now);

    if (impl_->engineConn) {
        impl_->sendToEngine(impl_->resyncFor(stored));
    }

    if (auto greeting = stored.codec->greeting(); !greeting.empty()) {
        auto sent = impl_->transport.send(conn, std::move(greeting));
        if (!sent) {
            SGW_LOG_DEBUG(LogCategory::Session, "negotiation not delivered to session " +
                                                    std::to_string(sid.value()));
        }
    }

    ServiceLogger::instance().logWithContext(
        LogLevel::Info, LogCategory::Session,
        "session opened on " + stored.info.listener + " from " + stored.info.remoteAddress,
        sessionContext(sid, conn));
    return ServiceResult<SessionId>::ok(sid);
}

bool SessionRegistry::remove(SessionId sid) {
    std::lock_guard lock(impl_->mutex);

    auto it = impl_->sessions.find(sid);
    if (it == impl_->sessions.end()) {
        return false;
    }
    auto conn = impl_->erase(it, true, "connection closed");
    ServiceLogger::instance().logWithContext(LogLevel::Info, LogCategory::Session,
                                             "session closed", sessionContext(sid, conn));
    return true;
}

std::optional<SessionId> SessionRegistry::findByConnection(ConnectionId conn) const {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->byConnection.find(conn);
    if (it == impl_->byConnection.end()) {
        return std::nullopt;
    }
    return it->second;
}

// -- Routing ------------------------------------------------------------------

InboundResult SessionRegistry::routeInbound(SessionId sid, std::span<const uint8_t> bytes,
                                            Clock::time_point now) {
    InboundResult result;
    std::lock_guard lock(impl_->mutex);

    auto it = impl_->sessions.find(sid);
    if (it == impl_->sessions.end()) {
        return result;
    }
    auto& entry = it->second;
    entry.info.lastActivity = now;

    auto decoded = entry.codec->decode(bytes);

    if (!decoded.reply.empty()) {
        auto sent = impl_->transport.send(entry.info.connection, std::move(decoded.reply));
        if (!sent) {
            SGW_LOG_DEBUG(LogCategory::Session, "negotiation reply not delivered to session " +
                                                    std::to_string(sid.value()));
        }
    }

    // A capability change made before the engine attaches rides on the resync.
    if (decoded.capabilities.applyTo(entry.info.capabilities) && impl_->engineConn) {
        impl_->sendToEngine(control::SessionCapabilities{sid, entry.info.capabilities});
    }

    for (auto& input : decoded.inputs) {
        if (input.size() > impl_->config.maxInputBytes) {
            impl_->notice(entry, impl_->config.inputTooLargeNotice);
            ++result.dropped;
            ++impl_->counters.inputsDropped;
            continue;
        }

        if (!impl_->commandBucket.consume(sid, 1, now)) {
            impl_->notice(entry, impl_->config.rateLimitNotice);
            ++result.dropped;
            ++impl_->counters.inputsDropped;
            ++impl_->counters.rateLimitHits;
            continue;
        }

        // Anything still queued must reach the engine first.
        if (impl_->engineConn && entry.queue.empty() &&
            impl_->sendToEngine(control::makeData(sid, input))) {
            ++result.forwarded;
            ++impl_->counters.inputsForwarded;
            continue;
        }

        impl_->enqueue(entry, std::move(input), result);
    }
    return result;
}

bool SessionRegistry::routeOutbound(SessionId sid, std::string_view text,
                                    Clock::time_point now) {
    std::optional<ConnectionId> toClose;
    bool delivered = false;
    {
        std::lock_guard lock(impl_->mutex);

        auto it = impl_->sessions.find(sid);
        if (it == impl_->sessions.end()) {
            return false;
        }
        auto& entry = it->second;
        auto bytes = entry.codec->encode(text);

        std::string_view overflow;
        auto pending = impl_->transport.pendingBytes(entry.info.connection);
        auto maxPending = impl_->config.outputMaxPendingBytes;
        if (maxPending > 0 && pending && *pending + bytes.size() > maxPending) {
            overflow = "client is not reading output";
            ++impl_->counters.outputsStalled;
        } else {
            // A single message larger than the whole budget is charged the
            // full budget rather than being undeliverable forever.
            auto cost = static_cast<uint32_t>(
                std::min<std::size_t>(bytes.size(), impl_->outputBucket.capacity()));
            if (!impl_->outputBucket.consume(sid, cost, now)) {
                overflow = "output budget exceeded";
            }
        }

        if (!overflow.empty()) {
            ++impl_->counters.outputsDropped;
            if (impl_->config.outputOverflowPolicy == OutputOverflowPolicy::Disconnect) {
                ServiceLogger::instance().logWithContext(
                    LogLevel::Warning, LogCategory::Session,
                    std::string(overflow) + ", disconnecting",
                    sessionContext(sid, entry.info.connection));
                toClose = impl_->erase(it, true, overflow);
            }
        } else {
            auto result = impl_->transport.send(entry.info.connection, std::move(bytes));
            if (result) {
                ++impl_->counters.outputsDelivered;
                delivered = true;
            } else {
                ++impl_->counters.outputsDropped;
            }
        }
    }

    if (toClose) {
        impl_->transport.close(*toClose);
    }
    return delivered;
}

// -- Engine link --------------------------------------------------------------

std::size_t SessionRegistry::attachEngine(ConnectionId engineConn) {
    std::lock_guard lock(impl_->mutex);

    impl_->engineConn = engineConn;

    for (auto& [sid, entry] : impl_->sessions) {
        entry.info.resyncError = false;
        entry.info.resyncErrorReason.clear();
        impl_->sendToEngine(impl_->resyncFor(entry));
    }
    auto count = impl_->sessions.size();
    impl_->sendToEngine(control::ResyncDone{static_cast<uint32_t>(count)});

    for (auto& [sid, entry] : impl_->sessions) {
        impl_->flushQueue(entry);
        entry.noticeShown = false;
    }

    SGW_LOG_INFO(LogCategory::Session,
                 "engine attached, replayed " + std::to_string(count) + " session(s)");
    return count;
}

void SessionRegistry::detachEngine() {
    std::lock_guard lock(impl_->mutex);
    if (!impl_->engineConn) {
        return;
    }
    impl_->engineConn.reset();
    for (auto& [sid, entry] : impl_->sessions) {
        entry.noticeShown = false;
    }
    SGW_LOG_INFO(LogCategory::Session, "engine detached, client input will be queued");
}

bool SessionRegistry::engineAttached() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->engineConn.has_value();
}

// -- Engine-driven changes ----------------------------------------------------

bool SessionRegistry::applyUpdate(const control::SessionUpdate& update) {
    std::lock_guard lock(impl_->mutex);

    auto it = impl_->sessions.find(update.sessionId);
    if (it == impl_->sessions.end()) {
        return false;
    }
    auto& info = it->second.info;
    info.auth = update.auth;
    info.account = update.account;
    info.puppet = update.puppet;
    info.resyncError = false;
    info.resyncErrorReason.clear();
    return true;
}

bool SessionRegistry::markResyncFailed(SessionId sid, std::string reason) {
    std::lock_guard lock(impl_->mutex);

    auto it = impl_->sessions.find(sid);
    if (it == impl_->sessions.end()) {
        return false;
    }
    // The engine holds no record of this login now; the client starts over.
    auto& info = it->second.info;
    info.resyncError = true;
    info.auth = control::AuthState::Anonymous;
    info.account = AccountId{};
    info.puppet = PuppetId{};
    ServiceLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Session,
                                             "engine could not resume session: " + reason,
                                             sessionContext(sid, info.connection));
    info.resyncErrorReason = std::move(reason);
    return true;
}

bool SessionRegistry::disconnect(SessionId sid, std::string_view reason) {
    ConnectionId conn;
    {
        std::lock_guard lock(impl_->mutex);

        auto it = impl_->sessions.find(sid);
        if (it == impl_->sessions.end()) {
            return false;
        }
        impl_->notice(it->second, reason);
        conn = impl_->erase(it, false, reason);
    }
    impl_->transport.close(conn);
    return true;
}

void SessionRegistry::disconnectAll(std::string_view reason) {
    std::vector<ConnectionId> conns;
    {
        std::lock_guard lock(impl_->mutex);
        for (auto it = impl_->sessions.begin(); it != impl_->sessions.end();) {
            impl_->notice(it->second, reason);
            auto next = std::next(it);
            conns.push_back(impl_->erase(it, false, reason));
            it = next;
        }
    }
    impl_->closeAll(conns);
    SGW_LOG_INFO(LogCategory::Session,
                 "disconnected all " + std::to_string(conns.size()) + " session(s)");
}

void SessionRegistry::announce(std::string_view text) {
    std::lock_guard lock(impl_->mutex);
    for (auto& [sid, entry] : impl_->sessions) {
        impl_->notice(entry, text);
    }
}

std::vector<SessionId> SessionRegistry::expireIdle(Clock::time_point now) {
    std::vector<SessionId> expired;
    if (impl_->config.idleTimeout.count() <= 0) {
        return expired;
    }

    std::vector<ConnectionId> conns;
    {
        std::lock_guard lock(impl_->mutex);
        for (auto it = impl_->sessions.begin(); it != impl_->sessions.end();) {
            auto next = std::next(it);
            if (now - it->second.info.lastActivity > impl_->config.idleTimeout) {
                expired.push_back(it->first);
                conns.push_back(impl_->erase(it, true, "idle timeout"));
            }
            it = next;
        }
    }
    impl_->closeAll(conns);

    if (!expired.empty()) {
        SGW_LOG_INFO(LogCategory::Session,
                     "closed " + std::to_string(expired.size()) + " idle session(s)");
    }
    return expired;
}

// -- Queries ------------------------------------------------------------------

std::optional<SessionInfo> SessionRegistry::info(SessionId sid) const {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->sessions.find(sid);
    if (it == impl_->sessions.end()) {
        return std::nullopt;
    }
    auto out = it->second.info;
    out.queuedInputs = it->second.queue.size();
    return out;
}

std::vector<SessionInfo> SessionRegistry::snapshot() const {
    std::lock_guard lock(impl_->mutex);
    std::vector<SessionInfo> out;
    out.reserve(impl_->sessions.size());
    for (const auto& [sid, entry] : impl_->sessions) {
        out.push_back(entry.info);
        out.back().queuedInputs = entry.queue.size();
    }
    return out;
}

std::size_t SessionRegistry::size() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->sessions.size();
}

GatewayStats SessionRegistry::stats() const {
    std::lock_guard lock(impl_->mutex);
    auto out = impl_->counters;
    out.sessions = impl_->sessions.size();
    out.queuedInputs = 0;
    for (const auto& [sid, entry] : impl_->sessions) {
        out.queuedInputs += entry.queue.size();
    }
    return out;
}

} // namespace sgw::service
