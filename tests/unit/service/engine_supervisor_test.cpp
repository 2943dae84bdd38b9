#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <utility>
#include <vector>

#include "sgw/service/engine_supervisor.hpp"
#include "sgw/service/session_registry.hpp"
#include "sgw/version.hpp"
#include "support/fakes.hpp"

using namespace sgw::service;
using namespace std::chrono_literals;
using sgw::control::Command;
using sgw::control::CommandResult;
using sgw::control::EngineState;
using sgw::control::ResultCode;
using sgw::foundation::ConnectionId;
using sgw::foundation::ErrorCode;
using sgw::test::bytesOf;
using sgw::test::FakeSpawner;
using sgw::test::FakeTransport;
using sgw::test::messagesOf;

namespace control = sgw::control;

class EngineSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.engineLaunch.argv = {"sgw_engine", "--config", "test.yaml"};
        config_.attachTimeout = 30s;
        config_.stopTimeout = 15s;
    }

    EngineSupervisor& make() {
        registry_ = std::make_unique<SessionRegistry>(config_, transport_);
        supervisor_ = std::make_unique<EngineSupervisor>(config_, *registry_, transport_,
                                                         spawner_);
        supervisor_->onStateChanged().connect(
            [this](EngineState from, EngineState to) { transitions_.emplace_back(from, to); });
        supervisor_->onShutdownRequested().connect([this] { ++shutdowns_; });
        return *supervisor_;
    }

    static control::Hello hello(uint32_t pid, std::string name = "blue") {
        return control::Hello{control::Role::Engine, SGW_PROTOCOL_REVISION, std::move(name), pid};
    }

    std::vector<CommandResult> resultsTo(ConnectionId conn) const {
        return messagesOf<CommandResult>(transport_.controlSentTo(conn));
    }

    /// Start an engine and attach it on kEngine.
    void startRunning() {
        auto reply = supervisor_->handleCommand(kLauncher, Command::Start, t0_);
        ASSERT_FALSE(reply.has_value());
        ASSERT_TRUE(supervisor_->attach(kEngine, hello(1000), t0_));
        ASSERT_EQ(supervisor_->state(), EngineState::Running);
    }

    static inline const ConnectionId kLauncher{50};
    static inline const ConnectionId kEngine{60};
    static inline const ConnectionId kEngine2{61};

    GatewayConfig config_;
    FakeTransport transport_;
    FakeSpawner spawner_;
    std::unique_ptr<SessionRegistry> registry_;
    std::unique_ptr<EngineSupervisor> supervisor_;
    std::vector<std::pair<EngineState, EngineState>> transitions_;
    int shutdowns_ = 0;
    EngineSupervisor::Clock::time_point t0_ = EngineSupervisor::Clock::now();
};

// =============================================================================
// Immediate replies
// =============================================================================

TEST_F(EngineSupervisorTest, StatusWhileAbsent) {
    auto& supervisor = make();
    auto reply = supervisor.handleCommand(kLauncher, Command::Status, t0_);
    ASSERT_TRUE(reply.has_value());
    EXPECT_TRUE(reply->ok);
    EXPECT_EQ(reply->code, ResultCode::Ok);
    EXPECT_EQ(reply->engineState, EngineState::Absent);
    EXPECT_NE(reply->detail.find("engine absent"), std::string::npos);
}

TEST_F(EngineSupervisorTest, StopWhileAbsentIsNoOp) {
    auto& supervisor = make();
    auto reply = supervisor.handleCommand(kLauncher, Command::Stop, t0_);
    ASSERT_TRUE(reply.has_value());
    EXPECT_FALSE(reply->ok);
    EXPECT_EQ(reply->code, ResultCode::AlreadyInState);
    EXPECT_TRUE(spawner_.spawned().empty());
}

TEST_F(EngineSupervisorTest, StartWhileRunningIsNoOp) {
    auto& supervisor = make();
    startRunning();
    auto reply = supervisor.handleCommand(kLauncher, Command::Start, t0_);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->code, ResultCode::AlreadyInState);
    EXPECT_EQ(spawner_.spawned().size(), 1u);
}

TEST_F(EngineSupervisorTest, CommandsDuringTransitionAreRefused) {
    auto& supervisor = make();
    ASSERT_FALSE(supervisor.handleCommand(kLauncher, Command::Start, t0_).has_value());

    for (auto cmd : {Command::Start, Command::Stop, Command::Reload, Command::Shutdown}) {
        auto reply = supervisor.handleCommand(kLauncher, cmd, t0_);
        ASSERT_TRUE(reply.has_value());
        EXPECT_EQ(reply->code, ResultCode::OperationInProgress);
        EXPECT_EQ(reply->engineState, EngineState::Starting);
    }

    // Status is always answered.
    auto status = supervisor.handleCommand(kLauncher, Command::Status, t0_);
    ASSERT_TRUE(status.has_value());
    EXPECT_TRUE(status->ok);
    EXPECT_EQ(spawner_.spawned().size(), 1u);
}

TEST_F(EngineSupervisorTest, SpawnFailureReportedImmediately) {
    auto& supervisor = make();
    spawner_.failSpawns(true);

    auto reply = supervisor.handleCommand(kLauncher, Command::Start, t0_);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->code, ResultCode::Failed);
    EXPECT_EQ(supervisor.state(), EngineState::Absent);
    EXPECT_EQ(supervisor.stats().spawnFailures, 1u);
}

TEST_F(EngineSupervisorTest, MissingLaunchCommandFails) {
    config_.engineLaunch.argv.clear();
    auto& supervisor = make();
    auto reply = supervisor.handleCommand(kLauncher, Command::Start, t0_);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->code, ResultCode::Failed);
    EXPECT_NE(reply->detail.find("no engine launch command"), std::string::npos);
}

// =============================================================================
// Start / stop / reload
// =============================================================================

TEST_F(EngineSupervisorTest, StartRepliesAfterHello) {
    auto& supervisor = make();
    auto reply = supervisor.handleCommand(kLauncher, Command::Start, t0_);
    EXPECT_FALSE(reply.has_value());
    EXPECT_EQ(supervisor.state(), EngineState::Starting);
    EXPECT_EQ(spawner_.spawned(), std::vector<int>{1000});
    EXPECT_TRUE(resultsTo(kLauncher).empty());

    ASSERT_TRUE(supervisor.attach(kEngine, hello(1000), t0_));
    EXPECT_EQ(supervisor.state(), EngineState::Running);
    EXPECT_EQ(supervisor.engineConnection(), kEngine);

    auto toEngine = transport_.controlSentTo(kEngine);
    ASSERT_EQ(toEngine.size(), 2u);
    EXPECT_TRUE(std::get<CommandResult>(toEngine[0]).ok);
    EXPECT_EQ(std::get<control::ResyncDone>(toEngine[1]).sessionCount, 0u);

    auto results = resultsTo(kLauncher);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].ok);
    EXPECT_EQ(results[0].detail, "engine started");
    EXPECT_EQ(results[0].engineState, EngineState::Running);

    auto stats = supervisor.stats();
    EXPECT_EQ(stats.starts, 1u);
    EXPECT_EQ(stats.engineName, "blue");
    EXPECT_EQ(stats.pid, 1000);
}

TEST_F(EngineSupervisorTest, GracefulStop) {
    auto& supervisor = make();
    startRunning();

    EXPECT_FALSE(supervisor.handleCommand(kLauncher, Command::Stop, t0_).has_value());
    EXPECT_EQ(supervisor.state(), EngineState::Stopping);
    EXPECT_FALSE(registry_->engineAttached());

    auto shutdowns = messagesOf<control::Shutdown>(transport_.controlSentTo(kEngine));
    ASSERT_EQ(shutdowns.size(), 1u);
    EXPECT_EQ(shutdowns[0].mode, control::ShutdownMode::Stop);

    supervisor.handleStopping(kEngine, true, t0_);
    supervisor.handleDisconnect(kEngine, t0_);
    EXPECT_EQ(supervisor.state(), EngineState::Absent);

    auto results = resultsTo(kLauncher);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[1].detail, "engine stopped");
    EXPECT_EQ(results[1].engineState, EngineState::Absent);

    auto stats = supervisor.stats();
    EXPECT_EQ(stats.cleanStops, 1u);
    EXPECT_EQ(stats.crashes, 0u);
    EXPECT_TRUE(spawner_.terminated().empty());
    EXPECT_EQ(spawner_.spawned().size(), 1u);
}

TEST_F(EngineSupervisorTest, ReloadReplaysSessionsToNewEngine) {
    auto& supervisor = make();
    auto sid = registry_->create(ConnectionId(1), "telnet", std::make_unique<LineCodec>(),
                                 "10.0.0.1", t0_);
    ASSERT_TRUE(sid);
    startRunning();

    EXPECT_FALSE(supervisor.handleCommand(kLauncher, Command::Reload, t0_).has_value());
    auto shutdowns = messagesOf<control::Shutdown>(transport_.controlSentTo(kEngine));
    ASSERT_EQ(shutdowns.size(), 1u);
    EXPECT_EQ(shutdowns[0].mode, control::ShutdownMode::Reload);

    // Typed during the restart: queued, not lost.
    auto input = bytesOf("look\n");
    EXPECT_EQ(registry_->routeInbound(sid.value(), input, t0_).queued, 1u);

    supervisor.handleStopping(kEngine, true, t0_);
    supervisor.handleDisconnect(kEngine, t0_);
    EXPECT_EQ(supervisor.state(), EngineState::Starting);
    EXPECT_EQ(spawner_.spawned(), (std::vector<int>{1000, 1001}));
    EXPECT_EQ(resultsTo(kLauncher).size(), 1u);

    ASSERT_TRUE(supervisor.attach(kEngine2, hello(1001, "green"), t0_));
    auto results = resultsTo(kLauncher);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[1].detail, "engine reloaded");
    EXPECT_EQ(results[1].sessionCount, 1u);

    auto toNew = transport_.controlSentTo(kEngine2);
    auto resyncs = messagesOf<control::ResyncSession>(toNew);
    ASSERT_EQ(resyncs.size(), 1u);
    EXPECT_EQ(resyncs[0].sessionId, sid.value());
    auto data = messagesOf<control::Data>(toNew);
    ASSERT_EQ(data.size(), 1u);
    EXPECT_EQ(control::payloadText(data[0]), "look");

    EXPECT_FALSE(transport_.wasClosed(ConnectionId(1)));
    EXPECT_EQ(supervisor.stats().starts, 2u);
}

TEST_F(EngineSupervisorTest, ReloadWhileAbsentStarts) {
    auto& supervisor = make();
    EXPECT_FALSE(supervisor.handleCommand(kLauncher, Command::Reload, t0_).has_value());
    ASSERT_TRUE(supervisor.attach(kEngine, hello(1000), t0_));
    auto results = resultsTo(kLauncher);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].detail, "engine reloaded");
}

// =============================================================================
// Crashes and timeouts
// =============================================================================

TEST_F(EngineSupervisorTest, CrashKeepsSessionsAndDoesNotRespawn) {
    auto& supervisor = make();
    auto sid = registry_->create(ConnectionId(1), "telnet", std::make_unique<LineCodec>(),
                                 "10.0.0.1", t0_);
    ASSERT_TRUE(sid);
    startRunning();

    supervisor.handleDisconnect(kEngine, t0_);
    EXPECT_EQ(supervisor.state(), EngineState::Absent);
    EXPECT_EQ(supervisor.stats().crashes, 1u);
    EXPECT_EQ(spawner_.terminated(), std::vector<int>{1000});
    EXPECT_EQ(spawner_.spawned().size(), 1u);
    EXPECT_EQ(registry_->size(), 1u);
    EXPECT_FALSE(registry_->engineAttached());

    auto status = supervisor.handleCommand(kLauncher, Command::Status, t0_);
    ASSERT_TRUE(status.has_value());
    EXPECT_NE(status->detail.find("starts 1, crashes 1"), std::string::npos);

    // An operator can bring it back.
    EXPECT_FALSE(supervisor.handleCommand(kLauncher, Command::Start, t0_).has_value());
    EXPECT_EQ(spawner_.spawned().size(), 2u);
}

TEST_F(EngineSupervisorTest, AttachTimeoutKillsChild) {
    auto& supervisor = make();
    EXPECT_FALSE(supervisor.handleCommand(kLauncher, Command::Start, t0_).has_value());

    supervisor.tick(t0_ + 29s);
    EXPECT_EQ(supervisor.state(), EngineState::Starting);

    supervisor.tick(t0_ + 31s);
    EXPECT_EQ(supervisor.state(), EngineState::Absent);
    EXPECT_EQ(spawner_.killed(), std::vector<int>{1000});
    EXPECT_EQ(supervisor.stats().forcedKills, 1u);

    auto results = resultsTo(kLauncher);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].code, ResultCode::Failed);
    EXPECT_NE(results[0].detail.find("did not attach within 30s"), std::string::npos);

    // The killed child is reaped on the next tick.
    supervisor.tick(t0_ + 32s);
    EXPECT_EQ(spawner_.reaped(), std::vector<int>{1000});
}

TEST_F(EngineSupervisorTest, StopTimeoutForcesEngineOut) {
    auto& supervisor = make();
    startRunning();
    EXPECT_FALSE(supervisor.handleCommand(kLauncher, Command::Stop, t0_).has_value());

    supervisor.tick(t0_ + 16s);
    EXPECT_EQ(supervisor.state(), EngineState::Absent);
    EXPECT_EQ(spawner_.killed(), std::vector<int>{1000});
    EXPECT_TRUE(transport_.wasClosed(kEngine));
    EXPECT_FALSE(supervisor.engineConnection().has_value());

    auto stats = supervisor.stats();
    EXPECT_EQ(stats.forcedKills, 1u);
    EXPECT_EQ(stats.crashes, 1u);

    auto results = resultsTo(kLauncher);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[1].detail, "engine stopped");

    // The late disconnect of the closed connection changes nothing.
    supervisor.handleDisconnect(kEngine, t0_ + 17s);
    EXPECT_EQ(supervisor.stats().crashes, 1u);
}

TEST_F(EngineSupervisorTest, ExitBeforeAttachFailsStart) {
    auto& supervisor = make();
    EXPECT_FALSE(supervisor.handleCommand(kLauncher, Command::Start, t0_).has_value());
    spawner_.exit(1000, 2);

    supervisor.tick(t0_ + 1s);
    EXPECT_EQ(supervisor.state(), EngineState::Absent);
    auto results = resultsTo(kLauncher);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].code, ResultCode::Failed);
    EXPECT_NE(results[0].detail.find("exited before attaching"), std::string::npos);
}

// =============================================================================
// Attach rules
// =============================================================================

TEST_F(EngineSupervisorTest, SecondEngineRejected) {
    auto& supervisor = make();
    startRunning();

    auto second = supervisor.attach(kEngine2, hello(4242, "intruder"), t0_);
    ASSERT_TRUE(second.hasError());
    EXPECT_EQ(second.error().code(), ErrorCode::EngineAlreadyAttached);

    auto results = resultsTo(kEngine2);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].code, ResultCode::Rejected);
    EXPECT_EQ(supervisor.engineConnection(), kEngine);
}

TEST_F(EngineSupervisorTest, RevisionMismatchRejected) {
    auto& supervisor = make();
    auto bad = hello(1000);
    bad.revision = SGW_PROTOCOL_REVISION + 1;

    auto result = supervisor.attach(kEngine, bad, t0_);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ProtocolRevisionMismatch);
    EXPECT_EQ(supervisor.state(), EngineState::Absent);
}

TEST_F(EngineSupervisorTest, ExternallyStartedEngineMayAttach) {
    auto& supervisor = make();
    ASSERT_TRUE(supervisor.attach(kEngine, hello(777, "manual"), t0_));
    EXPECT_EQ(supervisor.state(), EngineState::Running);
    EXPECT_TRUE(registry_->engineAttached());
    EXPECT_FALSE(supervisor.stats().pid.has_value());
}

TEST_F(EngineSupervisorTest, StoppingFromOtherConnectionIgnored) {
    auto& supervisor = make();
    startRunning();
    supervisor.handleStopping(kEngine2, true, t0_);
    EXPECT_EQ(supervisor.state(), EngineState::Running);
    EXPECT_TRUE(registry_->engineAttached());
}

TEST_F(EngineSupervisorTest, UnpromptedStoppingIsGraceful) {
    auto& supervisor = make();
    startRunning();
    supervisor.handleStopping(kEngine, false, t0_);
    EXPECT_EQ(supervisor.state(), EngineState::Stopping);
    supervisor.handleDisconnect(kEngine, t0_);

    auto stats = supervisor.stats();
    EXPECT_EQ(stats.cleanStops, 1u);
    EXPECT_EQ(stats.crashes, 0u);
    EXPECT_EQ(stats.state, EngineState::Absent);
}

// =============================================================================
// Shutdown, waiters and signals
// =============================================================================

TEST_F(EngineSupervisorTest, ShutdownWithoutEngineIsImmediate) {
    auto& supervisor = make();
    auto reply = supervisor.handleCommand(kLauncher, Command::Shutdown, t0_);
    ASSERT_TRUE(reply.has_value());
    EXPECT_TRUE(reply->ok);
    EXPECT_EQ(shutdowns_, 1);
}

TEST_F(EngineSupervisorTest, ShutdownWaitsForEngine) {
    auto& supervisor = make();
    startRunning();
    EXPECT_FALSE(supervisor.handleCommand(kLauncher, Command::Shutdown, t0_).has_value());
    EXPECT_EQ(shutdowns_, 0);

    supervisor.handleStopping(kEngine, true, t0_);
    supervisor.handleDisconnect(kEngine, t0_);
    EXPECT_EQ(shutdowns_, 1);
    auto results = resultsTo(kLauncher);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[1].ok);
}

TEST_F(EngineSupervisorTest, DepartedLauncherGetsNoReply) {
    auto& supervisor = make();
    EXPECT_FALSE(supervisor.handleCommand(kLauncher, Command::Start, t0_).has_value());
    supervisor.handleDisconnect(kLauncher, t0_);
    ASSERT_TRUE(supervisor.attach(kEngine, hello(1000), t0_));
    EXPECT_TRUE(resultsTo(kLauncher).empty());
}

TEST_F(EngineSupervisorTest, GatewayIssuedCommandHasNoRequester) {
    auto& supervisor = make();
    EXPECT_FALSE(supervisor.handleCommand(ConnectionId{}, Command::Start, t0_).has_value());
    ASSERT_TRUE(supervisor.attach(kEngine, hello(1000), t0_));
    EXPECT_EQ(supervisor.state(), EngineState::Running);
    EXPECT_TRUE(resultsTo(ConnectionId{}).empty());
}

TEST_F(EngineSupervisorTest, StateChangesPublished) {
    auto& supervisor = make();
    startRunning();
    EXPECT_FALSE(supervisor.handleCommand(kLauncher, Command::Stop, t0_).has_value());
    supervisor.handleDisconnect(kEngine, t0_);

    std::vector<std::pair<EngineState, EngineState>> expected = {
        {EngineState::Absent, EngineState::Starting},
        {EngineState::Starting, EngineState::Running},
        {EngineState::Running, EngineState::Stopping},
        {EngineState::Stopping, EngineState::Absent},
    };
    EXPECT_EQ(transitions_, expected);
}
