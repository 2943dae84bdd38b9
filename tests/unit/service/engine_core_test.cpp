#include <gtest/gtest.h>

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "sgw/control/control_codec.hpp"
#include "sgw/service/engine_core.hpp"
#include "support/fakes.hpp"

using namespace sgw::service;
using namespace std::chrono_literals;
using sgw::foundation::AccountId;
using sgw::foundation::ErrorCode;
using sgw::foundation::PuppetId;
using sgw::foundation::ServiceError;
using sgw::foundation::ServiceResult;
using sgw::foundation::SessionId;
using sgw::test::messagesOf;

namespace control = sgw::control;

namespace {

/// Records what the engine sends to the gateway.
class RecordingSink final : public ControlSink {
public:
    ServiceResult<void> send(const control::ControlMessage& msg) override {
        std::lock_guard lock(mutex_);
        sent_.push_back(msg);
        return ServiceResult<void>::ok();
    }

    void close() override {
        std::lock_guard lock(mutex_);
        ++closes_;
    }

    std::vector<control::ControlMessage> sent() const {
        std::lock_guard lock(mutex_);
        return sent_;
    }

    int closes() const {
        std::lock_guard lock(mutex_);
        return closes_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<control::ControlMessage> sent_;
    int closes_ = 0;
};

/// Echoes input and keeps every line it saw, per session.
class RecordingHandler final : public CommandHandler {
public:
    void handleInput(EngineContext& ctx, const SessionView& session,
                     std::string_view input) override {
        if (input == "slow") {
            std::this_thread::sleep_for(50ms);
        }
        {
            std::lock_guard lock(mutex_);
            inputs_[session.id].emplace_back(input);
        }
        ctx.emit(session.id, "echo " + std::string(input));
    }

    void onSessionAttached(EngineContext& /*ctx*/, const SessionView& session) override {
        std::lock_guard lock(mutex_);
        attached_.push_back(session.id);
    }

    std::vector<std::string> inputsOf(SessionId sid) const {
        std::lock_guard lock(mutex_);
        auto it = inputs_.find(sid);
        return it == inputs_.end() ? std::vector<std::string>{} : it->second;
    }

    std::vector<SessionId> attached() const {
        std::lock_guard lock(mutex_);
        return attached_;
    }

private:
    mutable std::mutex mutex_;
    std::map<SessionId, std::vector<std::string>> inputs_;
    std::vector<SessionId> attached_;
};

class FailingPersistence final : public PersistenceHook {
public:
    ServiceResult<void> flush() override {
        ++flushes;
        return ServiceResult<void>::err(ServiceError(ErrorCode::LifecycleError, "disk full"));
    }

    int flushes = 0;
};

control::ResyncSession resync(uint64_t sid, uint64_t account, uint64_t puppet) {
    control::ResyncSession msg;
    msg.sessionId = SessionId(sid);
    msg.auth = control::AuthState::Authenticated;
    msg.account = AccountId(account);
    msg.puppet = PuppetId(puppet);
    return msg;
}

} // namespace

// =============================================================================
// Test fixture
// =============================================================================

class EngineCoreTest : public ::testing::Test {
protected:
    EngineCoreTest() {
        config_.name = "blue";
        config_.workerThreads = 4;
        config_.drainTimeout = 2000ms;
        core_ = std::make_unique<EngineCore>(config_, sink_, handler_);
    }

    void settle() { ASSERT_TRUE(core_->waitIdle(5s)); }

    EngineConfig config_;
    RecordingSink sink_;
    RecordingHandler handler_;
    std::unique_ptr<EngineCore> core_;
};

// =============================================================================
// Attach and resync
// =============================================================================

TEST_F(EngineCoreTest, ResultDecidesAttachment) {
    control::CommandResult accepted;
    accepted.ok = true;
    core_->handleMessage(accepted);
    EXPECT_TRUE(core_->attached());
    EXPECT_FALSE(core_->rejected());

    control::CommandResult refused;
    refused.ok = false;
    refused.code = control::ResultCode::Rejected;
    refused.detail = "an engine is already attached";
    core_->handleMessage(refused);
    EXPECT_TRUE(core_->rejected());
}

TEST_F(EngineCoreTest, ResyncRestoresSessions) {
    core_->handleMessage(resync(1, 7, 70));
    core_->handleMessage(resync(2, 8, 80));
    core_->handleMessage(control::ResyncDone{2});
    settle();

    EXPECT_EQ(core_->sessions().size(), 2u);
    auto view = core_->table().find(SessionId(1));
    ASSERT_TRUE(view.has_value());
    EXPECT_TRUE(view->resumed);
    EXPECT_EQ(view->puppet, PuppetId(70));
    EXPECT_EQ(handler_.attached().size(), 2u);
    EXPECT_TRUE(messagesOf<control::ResyncFailed>(sink_.sent()).empty());
}

TEST_F(EngineCoreTest, ConflictingResyncReported) {
    core_->handleMessage(resync(1, 7, 70));
    settle();
    core_->handleMessage(resync(2, 8, 70));
    settle();

    auto failed = messagesOf<control::ResyncFailed>(sink_.sent());
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].sessionId, SessionId(2));
    EXPECT_NE(failed[0].reason.find("already bound"), std::string::npos);
    EXPECT_EQ(handler_.attached(), std::vector<SessionId>{SessionId(1)});
}

TEST_F(EngineCoreTest, RepeatedResyncIsHarmless) {
    core_->handleMessage(resync(1, 7, 70));
    core_->handleMessage(resync(1, 7, 70));
    settle();
    EXPECT_EQ(core_->sessions().size(), 1u);
    EXPECT_TRUE(messagesOf<control::ResyncFailed>(sink_.sent()).empty());
}

// =============================================================================
// Input dispatch
// =============================================================================

TEST_F(EngineCoreTest, InputReachesHandlerAndEchoes) {
    core_->handleMessage(control::makeData(SessionId(3), "look"));
    settle();

    EXPECT_EQ(handler_.inputsOf(SessionId(3)), std::vector<std::string>{"look"});
    auto data = messagesOf<control::Data>(sink_.sent());
    ASSERT_EQ(data.size(), 1u);
    EXPECT_EQ(data[0].sessionId, SessionId(3));
    EXPECT_EQ(control::payloadText(data[0]), "echo look");

    // Unknown sessions are created anonymous on first input.
    auto view = core_->table().find(SessionId(3));
    ASSERT_TRUE(view.has_value());
    EXPECT_FALSE(view->authenticated());
}

TEST_F(EngineCoreTest, PerSessionOrderKeptUnderConcurrency) {
    std::vector<std::string> expectedA;
    std::vector<std::string> expectedB;
    core_->handleMessage(control::makeData(SessionId(1), "slow"));
    expectedA.push_back("slow");
    for (int i = 0; i < 40; ++i) {
        auto a = "a" + std::to_string(i);
        auto b = "b" + std::to_string(i);
        core_->handleMessage(control::makeData(SessionId(1), a));
        core_->handleMessage(control::makeData(SessionId(2), b));
        expectedA.push_back(a);
        expectedB.push_back(b);
    }
    settle();

    EXPECT_EQ(handler_.inputsOf(SessionId(1)), expectedA);
    EXPECT_EQ(handler_.inputsOf(SessionId(2)), expectedB);
}

TEST_F(EngineCoreTest, DisconnectFromGatewayRemovesSession) {
    core_->handleMessage(resync(1, 7, 70));
    core_->handleMessage(control::Disconnect{SessionId(1), "connection closed"});
    settle();
    EXPECT_FALSE(core_->table().find(SessionId(1)).has_value());
    EXPECT_FALSE(core_->table().ownerOf(PuppetId(70)).has_value());
}

// =============================================================================
// EngineContext
// =============================================================================

TEST_F(EngineCoreTest, LoginAndPuppetChangesReported) {
    core_->table().ensure(SessionId(1));
    ASSERT_TRUE(core_->login(SessionId(1), AccountId(7)));
    ASSERT_TRUE(core_->bindPuppet(SessionId(1), PuppetId(70)));
    ASSERT_TRUE(core_->logout(SessionId(1)));

    auto updates = messagesOf<control::SessionUpdate>(sink_.sent());
    ASSERT_EQ(updates.size(), 3u);
    EXPECT_EQ(updates[0].auth, control::AuthState::Authenticated);
    EXPECT_EQ(updates[0].account, AccountId(7));
    EXPECT_EQ(updates[1].puppet, PuppetId(70));
    EXPECT_EQ(updates[2].auth, control::AuthState::Anonymous);
    EXPECT_FALSE(updates[2].puppet.isValid());
}

TEST_F(EngineCoreTest, FailedLoginSendsNothing) {
    auto result = core_->login(SessionId(42), AccountId(7));
    EXPECT_TRUE(result.hasError());
    EXPECT_TRUE(sink_.sent().empty());
}

TEST_F(EngineCoreTest, DisconnectAndAnnounceGoToGateway) {
    core_->table().ensure(SessionId(1));
    core_->disconnect(SessionId(1), "Goodbye.");
    core_->announce("Reboot soon.");

    auto sent = sink_.sent();
    auto disconnects = messagesOf<control::Disconnect>(sent);
    ASSERT_EQ(disconnects.size(), 1u);
    EXPECT_EQ(disconnects[0].reason, "Goodbye.");
    EXPECT_EQ(messagesOf<control::Announce>(sent).size(), 1u);
    EXPECT_EQ(core_->table().size(), 0u);
    EXPECT_EQ(core_->instanceName(), "blue");
}

TEST_F(EngineCoreTest, LargeOutputSpansSeveralFrames) {
    std::string text;
    while (text.size() < control::kMaxDataPayload + 4096) {
        text += "A long scroll of the room's history unrolls before you.\n";
    }
    core_->emit(SessionId(5), text);

    auto data = messagesOf<control::Data>(sink_.sent());
    ASSERT_EQ(data.size(), 2u);
    std::string joined;
    for (const auto& frame : data) {
        EXPECT_EQ(frame.sessionId, SessionId(5));
        EXPECT_LE(frame.payload.size(), control::kMaxDataPayload);
        EXPECT_LE(control::encode(frame).size(), control::kMaxFrameSize);
        joined += control::payloadText(frame);
    }
    EXPECT_EQ(joined, text);
    EXPECT_EQ(control::payloadText(data[0]).back(), '\n');
}

TEST_F(EngineCoreTest, LargeAnnouncementSpansSeveralFrames) {
    std::string text(control::kMaxTextField + 10, '!');
    core_->announce(text);

    auto announces = messagesOf<control::Announce>(sink_.sent());
    ASSERT_EQ(announces.size(), 2u);
    EXPECT_EQ(announces[0].text.size() + announces[1].text.size(), text.size());
    EXPECT_LE(control::encode(announces[0]).size(), control::kMaxFrameSize);
}

TEST_F(EngineCoreTest, CapabilityUpdateKeepsLogin) {
    core_->handleMessage(resync(1, 7, 70));
    settle();

    control::SessionCapabilities update;
    update.sessionId = SessionId(1);
    update.capabilities.screenWidth = 132;
    update.capabilities.screenHeight = 50;
    update.capabilities.clientName = "MUDLET";
    update.capabilities.ansi = true;
    core_->handleMessage(update);
    settle();

    auto view = core_->table().find(SessionId(1));
    ASSERT_TRUE(view.has_value());
    EXPECT_EQ(view->capabilities.screenWidth, 132);
    EXPECT_EQ(view->capabilities.clientName, "MUDLET");
    EXPECT_TRUE(view->capabilities.ansi);
    EXPECT_EQ(view->account, AccountId(7));
    EXPECT_EQ(view->puppet, PuppetId(70));
}

// =============================================================================
// Shutdown
// =============================================================================

TEST_F(EngineCoreTest, ShutdownRequestPublished) {
    control::ShutdownMode seenMode = control::ShutdownMode::Stop;
    std::string seenReason;
    core_->onShutdownRequested().connect(
        [&](control::ShutdownMode mode, const std::string& reason) {
            seenMode = mode;
            seenReason = reason;
        });

    core_->handleMessage(control::Shutdown{control::ShutdownMode::Reload, "reload requested"});
    EXPECT_EQ(seenMode, control::ShutdownMode::Reload);
    EXPECT_EQ(seenReason, "reload requested");
    EXPECT_FALSE(core_->shuttingDown());
}

TEST_F(EngineCoreTest, ShutdownDrainsThenAnnouncesStopping) {
    core_->handleMessage(control::makeData(SessionId(1), "slow"));
    EXPECT_TRUE(core_->shutdown("test"));
    EXPECT_TRUE(core_->shuttingDown());

    // The in-flight input ran before STOPPING went out.
    auto sent = sink_.sent();
    ASSERT_GE(sent.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<control::Data>(sent[sent.size() - 2]));
    auto stopping = std::get<control::Stopping>(sent.back());
    EXPECT_TRUE(stopping.clean);
    EXPECT_EQ(sink_.closes(), 1);

    // Only the first call runs.
    EXPECT_FALSE(core_->shutdown("again"));
    EXPECT_EQ(sink_.closes(), 1);
}

TEST_F(EngineCoreTest, InputAfterShutdownGetsNotice) {
    core_->shutdown("test");
    core_->handleMessage(control::makeData(SessionId(1), "look"));
    settle();

    EXPECT_TRUE(handler_.inputsOf(SessionId(1)).empty());
    auto data = messagesOf<control::Data>(sink_.sent());
    ASSERT_EQ(data.size(), 1u);
    EXPECT_NE(control::payloadText(data[0]).find("restarting"), std::string::npos);
}

TEST(EngineCoreShutdownTest, PersistenceFailureMakesStopUnclean) {
    EngineConfig config;
    config.workerThreads = 1;
    RecordingSink sink;
    RecordingHandler handler;
    FailingPersistence persistence;
    EngineCore core(config, sink, handler, &persistence);

    EXPECT_FALSE(core.shutdown("test"));
    EXPECT_EQ(persistence.flushes, 1);
    auto stopping = messagesOf<control::Stopping>(sink.sent());
    ASSERT_EQ(stopping.size(), 1u);
    EXPECT_FALSE(stopping[0].clean);
}
