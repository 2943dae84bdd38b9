/// @file engine_core.cpp
/// @brief EngineCore implementation.

#include "sgw/service/engine_core.hpp"

#include <atomic>

#include "sgw/control/control_codec.hpp"
#include "sgw/foundation/job_scheduler.hpp"
#include "sgw/foundation/service_logger.hpp"

namespace sgw::service {

using control::ControlMessage;
using control::MessageKind;
using sgw::foundation::AccountId;
using sgw::foundation::JobScheduler;
using sgw::foundation::LogCategory;
using sgw::foundation::LogContext;
using sgw::foundation::LogLevel;
using sgw::foundation::PuppetId;
using sgw::foundation::ServiceLogger;
using sgw::foundation::ServiceResult;
using sgw::foundation::SessionId;

namespace {

constexpr std::string_view kStoppingNotice = "The server is restarting, please wait...";

} // namespace

// -- Impl ---------------------------------------------------------------------

struct EngineCore::Impl {
    EngineConfig config;
    ControlSink& sink;
    CommandHandler& handler;
    PersistenceHook* persistence;

    EngineSessionTable table;
    JobScheduler scheduler;

    std::atomic<bool> accepting{true};
    std::atomic<bool> stopped{false};
    std::atomic<bool> rejected{false};
    std::atomic<bool> attached{false};

    sgw::foundation::Signal<control::ShutdownMode, const std::string&> shutdownRequested;

    Impl(EngineConfig cfg, ControlSink& s, CommandHandler& h, PersistenceHook* p)
        : config(std::move(cfg)),
          sink(s),
          handler(h),
          persistence(p),
          table(config.policy),
          scheduler(config.workerThreads) {}

    void send(const ControlMessage& msg) {
        auto result = sink.send(msg);
        if (!result) {
            SGW_LOG_WARN(LogCategory::Engine,
                         "control send failed: " + std::string(result.error().message()));
        }
    }

    /// Queue @p job behind everything already queued for the session.
    void onStrand(SessionId sid, JobScheduler::JobFunc job) {
        auto scheduled = scheduler.scheduleSerial(sid.value(), std::move(job));
        if (!scheduled) {
            LogContext ctx;
            ctx.sessionId = sid;
            ServiceLogger::instance().logWithContext(
                LogLevel::Error, LogCategory::Engine,
                "could not schedule session work: " +
                    std::string(scheduled.error().message()),
                ctx);
        }
    }

    void reportUpdate(const SessionView& view) {
        control::SessionUpdate update;
        update.sessionId = view.id;
        update.auth = view.auth;
        update.account = view.account;
        update.puppet = view.puppet;
        send(update);
    }
};

// -- Construction -------------------------------------------------------------

EngineCore::EngineCore(EngineConfig config, ControlSink& sink, CommandHandler& handler,
                       PersistenceHook* persistence)
    : impl_(std::make_unique<Impl>(std::move(config), sink, handler, persistence)) {}

EngineCore::~EngineCore() {
    // Session jobs call back into this object.
    impl_->accepting.store(false);
    if (!impl_->scheduler.waitIdle(impl_->config.drainTimeout)) {
        SGW_LOG_WARN(LogCategory::Engine, "destroying engine core with session jobs pending");
    }
}

// -- Control messages ---------------------------------------------------------

void EngineCore::handleMessage(const ControlMessage& msg) {
    auto kind = control::kindOf(msg);

    switch (kind) {
        case MessageKind::Result: {
            const auto& result = std::get<control::CommandResult>(msg);
            if (result.ok) {
                impl_->attached.store(true);
                SGW_LOG_INFO(LogCategory::Engine, "attached to gateway, " +
                                                      std::to_string(result.sessionCount) +
                                                      " session(s) open");
            } else {
                impl_->rejected.store(true);
                SGW_LOG_ERROR(LogCategory::Engine, "gateway rejected engine: " + result.detail);
            }
            break;
        }

        case MessageKind::ResyncSession: {
            auto resync = std::get<control::ResyncSession>(msg);
            impl_->onStrand(resync.sessionId, [this, resync] {
                auto view = impl_->table.attach(resync);
                if (!view) {
                    std::string reason(view.error().message());
                    LogContext ctx;
                    ctx.sessionId = resync.sessionId;
                    ServiceLogger::instance().logWithContext(
                        LogLevel::Warning, LogCategory::Engine, "resync failed: " + reason, ctx);
                    impl_->send(control::ResyncFailed{resync.sessionId, reason});
                    return;
                }
                impl_->handler.onSessionAttached(*this, view.value());
            });
            break;
        }

        case MessageKind::ResyncDone:
            SGW_LOG_INFO(LogCategory::Engine,
                         "resync complete: " +
                             std::to_string(std::get<control::ResyncDone>(msg).sessionCount) +
                             " session(s)");
            break;

        case MessageKind::Data: {
            const auto& data = std::get<control::Data>(msg);
            auto sid = data.sessionId;
            if (!impl_->accepting.load()) {
                emit(sid, kStoppingNotice);
                break;
            }
            impl_->onStrand(sid, [this, sid, text = control::payloadText(data)] {
                auto view = impl_->table.ensure(sid);
                impl_->handler.handleInput(*this, view, text);
            });
            break;
        }

        case MessageKind::Capabilities: {
            auto update = std::get<control::SessionCapabilities>(msg);
            impl_->onStrand(update.sessionId, [this, update] {
                impl_->table.updateCapabilities(update.sessionId, update.capabilities);
            });
            break;
        }

        case MessageKind::Disconnect: {
            auto sid = std::get<control::Disconnect>(msg).sessionId;
            impl_->onStrand(sid, [this, sid] {
                impl_->table.remove(sid);
            });
            break;
        }

        case MessageKind::Shutdown: {
            const auto& request = std::get<control::Shutdown>(msg);
            SGW_LOG_INFO(LogCategory::Engine,
                         "gateway requested " +
                             std::string(request.mode == control::ShutdownMode::Reload
                                             ? "reload"
                                             : "stop") +
                             ": " + request.reason);
            impl_->shutdownRequested.emit(request.mode, request.reason);
            break;
        }

        default:
            SGW_LOG_WARN(LogCategory::Engine,
                         "unexpected " + std::string(control::messageKindName(kind)) +
                             " from gateway");
            break;
    }
}

// -- Shutdown -----------------------------------------------------------------

bool EngineCore::shutdown(std::string_view reason) {
    if (impl_->stopped.exchange(true)) {
        return false;
    }
    SGW_LOG_INFO(LogCategory::Engine, "shutting down: " + std::string(reason));

    impl_->accepting.store(false);
    bool drained = impl_->scheduler.waitIdle(impl_->config.drainTimeout);
    if (!drained) {
        SGW_LOG_WARN(LogCategory::Engine,
                     std::to_string(impl_->scheduler.pendingJobs()) +
                         " job(s) still pending after drain timeout");
    }

    bool flushed = true;
    if (impl_->persistence != nullptr) {
        auto result = impl_->persistence->flush();
        if (!result) {
            flushed = false;
            SGW_LOG_ERROR(LogCategory::Engine,
                          "persistence flush failed: " + std::string(result.error().message()));
        }
    }

    bool clean = drained && flushed;
    impl_->send(control::Stopping{clean});
    impl_->sink.close();
    return clean;
}

bool EngineCore::waitIdle(std::chrono::milliseconds timeout) {
    return impl_->scheduler.waitIdle(timeout);
}

bool EngineCore::shuttingDown() const noexcept {
    return !impl_->accepting.load();
}

bool EngineCore::rejected() const noexcept {
    return impl_->rejected.load();
}

bool EngineCore::attached() const noexcept {
    return impl_->attached.load();
}

EngineSessionTable& EngineCore::table() {
    return impl_->table;
}

sgw::foundation::Signal<control::ShutdownMode, const std::string&>&
EngineCore::onShutdownRequested() {
    return impl_->shutdownRequested;
}

// -- EngineContext ------------------------------------------------------------

void EngineCore::emit(SessionId sid, std::string_view text) {
    // Output larger than one frame goes out as consecutive DATA frames.
    for (auto piece : control::splitText(text, control::kMaxDataPayload)) {
        impl_->send(control::makeData(sid, piece));
    }
}

ServiceResult<SessionView> EngineCore::login(SessionId sid, AccountId account) {
    auto view = impl_->table.login(sid, account);
    if (view) {
        impl_->reportUpdate(view.value());
    }
    return view;
}

ServiceResult<SessionView> EngineCore::logout(SessionId sid) {
    auto view = impl_->table.logout(sid);
    if (view) {
        impl_->reportUpdate(view.value());
    }
    return view;
}

ServiceResult<SessionView> EngineCore::bindPuppet(SessionId sid, PuppetId puppet) {
    auto view = impl_->table.bindPuppet(sid, puppet);
    if (view) {
        impl_->reportUpdate(view.value());
    }
    return view;
}

void EngineCore::disconnect(SessionId sid, std::string reason) {
    // The gateway does not echo DISCONNECT for closes the engine asked for.
    impl_->table.remove(sid);
    impl_->send(control::Disconnect{sid, std::move(reason)});
}

void EngineCore::announce(std::string text) {
    for (auto piece : control::splitText(text, control::kMaxTextField)) {
        impl_->send(control::Announce{std::string(piece)});
    }
}

std::vector<SessionView> EngineCore::sessions() const {
    return impl_->table.snapshot();
}

const EnginePolicy& EngineCore::policy() const {
    return impl_->config.policy;
}

const std::string& EngineCore::instanceName() const {
    return impl_->config.name;
}

} // namespace sgw::service
