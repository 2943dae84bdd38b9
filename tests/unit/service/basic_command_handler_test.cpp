#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "sgw/service/basic_command_handler.hpp"
#include "sgw/service/engine_session_table.hpp"

using namespace sgw::service;
using sgw::foundation::AccountId;
using sgw::foundation::PuppetId;
using sgw::foundation::ServiceResult;
using sgw::foundation::SessionId;

namespace {

/// EngineContext over a real session table that records what game logic
/// asked for.
class FakeContext final : public EngineContext {
public:
    explicit FakeContext(EnginePolicy policy = {}) : table(policy), policy_(policy) {}

    void emit(SessionId sid, std::string_view text) override {
        emitted.emplace_back(sid, std::string(text));
    }

    ServiceResult<SessionView> login(SessionId sid, AccountId account) override {
        return table.login(sid, account);
    }

    ServiceResult<SessionView> logout(SessionId sid) override { return table.logout(sid); }

    ServiceResult<SessionView> bindPuppet(SessionId sid, PuppetId puppet) override {
        return table.bindPuppet(sid, puppet);
    }

    void disconnect(SessionId sid, std::string reason) override {
        disconnected.emplace_back(sid, std::move(reason));
    }

    void announce(std::string text) override { announced.push_back(std::move(text)); }

    std::vector<SessionView> sessions() const override { return table.snapshot(); }

    const EnginePolicy& policy() const override { return policy_; }

    const std::string& instanceName() const override { return name_; }

    /// Last line emitted to @p sid.
    std::string lastTo(SessionId sid) const {
        for (auto it = emitted.rbegin(); it != emitted.rend(); ++it) {
            if (it->first == sid) {
                return it->second;
            }
        }
        return {};
    }

    EngineSessionTable table;
    std::vector<std::pair<SessionId, std::string>> emitted;
    std::vector<std::pair<SessionId, std::string>> disconnected;
    std::vector<std::string> announced;

private:
    EnginePolicy policy_;
    std::string name_ = "blue";
};

} // namespace

class BasicCommandHandlerTest : public ::testing::Test {
protected:
    /// Feed one line as the handler would see it from the engine.
    void say(SessionId sid, std::string_view line) {
        auto view = ctx_.table.ensure(sid);
        handler_.handleInput(ctx_, view, line);
    }

    FakeContext ctx_;
    BasicCommandHandler handler_;
};

TEST_F(BasicCommandHandlerTest, EchoNamesTheEngine) {
    say(SessionId(1), "  hello there ");
    EXPECT_EQ(ctx_.lastTo(SessionId(1)), "[blue] hello there");
}

TEST_F(BasicCommandHandlerTest, EmptyLineIgnored) {
    say(SessionId(1), "   ");
    EXPECT_TRUE(ctx_.emitted.empty());
}

TEST_F(BasicCommandHandlerTest, AccountIdIsStableAndCaseInsensitive) {
    EXPECT_EQ(BasicCommandHandler::accountFor("Alice"), BasicCommandHandler::accountFor("alice"));
    EXPECT_NE(BasicCommandHandler::accountFor("alice"), BasicCommandHandler::accountFor("bob"));
    EXPECT_TRUE(BasicCommandHandler::accountFor("").isValid());
}

TEST_F(BasicCommandHandlerTest, LoginBindsPuppet) {
    say(SessionId(1), "login Alice");

    auto view = ctx_.table.find(SessionId(1));
    ASSERT_TRUE(view.has_value());
    EXPECT_TRUE(view->authenticated());
    EXPECT_EQ(view->account, BasicCommandHandler::accountFor("alice"));
    EXPECT_EQ(view->puppet, PuppetId(view->account.value()));
    EXPECT_NE(ctx_.lastTo(SessionId(1)).find("puppet #"), std::string::npos);
}

TEST_F(BasicCommandHandlerTest, LoginWithoutName) {
    say(SessionId(1), "login");
    EXPECT_EQ(ctx_.lastTo(SessionId(1)), "Usage: login <name>");
}

TEST_F(BasicCommandHandlerTest, SecondLoginOnSameSessionRefused) {
    say(SessionId(1), "login alice");
    say(SessionId(1), "login bob");
    EXPECT_EQ(ctx_.lastTo(SessionId(1)), "You are already logged in as alice.");
}

TEST(BasicCommandHandlerPolicyTest, SessionLimitRefusesLogin) {
    EnginePolicy policy;
    policy.maxSessionsPerAccount = 1;
    FakeContext ctx(policy);
    BasicCommandHandler handler;

    handler.handleInput(ctx, ctx.table.ensure(SessionId(1)), "login alice");
    handler.handleInput(ctx, ctx.table.ensure(SessionId(2)), "login alice");
    EXPECT_EQ(ctx.lastTo(SessionId(2)).rfind("Login refused:", 0), 0u);
    EXPECT_FALSE(ctx.table.find(SessionId(2))->authenticated());
}

TEST(BasicCommandHandlerPolicyTest, NoAutoBind) {
    EnginePolicy policy;
    policy.autoBindPuppet = false;
    FakeContext ctx(policy);
    BasicCommandHandler handler;

    handler.handleInput(ctx, ctx.table.ensure(SessionId(1)), "login alice");
    EXPECT_FALSE(ctx.table.find(SessionId(1))->puppet.isValid());
}

TEST(BasicCommandHandlerPolicyTest, NoAutoCreate) {
    EnginePolicy policy;
    policy.autoCreatePuppet = false;
    FakeContext ctx(policy);
    BasicCommandHandler handler;

    handler.handleInput(ctx, ctx.table.ensure(SessionId(1)), "login alice");
    EXPECT_FALSE(ctx.table.find(SessionId(1))->puppet.isValid());
}

TEST_F(BasicCommandHandlerTest, ResumedPuppetReusedOnNextLogin) {
    SessionView resumed;
    resumed.id = SessionId(1);
    resumed.auth = sgw::control::AuthState::Authenticated;
    resumed.account = BasicCommandHandler::accountFor("alice");
    resumed.puppet = PuppetId(500);
    handler_.onSessionAttached(ctx_, resumed);

    say(SessionId(2), "login alice");
    EXPECT_EQ(ctx_.table.find(SessionId(2))->puppet, PuppetId(500));
}

TEST_F(BasicCommandHandlerTest, PuppetCommand) {
    say(SessionId(1), "puppet 7");
    EXPECT_EQ(ctx_.lastTo(SessionId(1)), "Log in first.");

    say(SessionId(1), "login alice");
    say(SessionId(1), "puppet 7");
    EXPECT_EQ(ctx_.table.find(SessionId(1))->puppet, PuppetId(7));

    say(SessionId(1), "puppet");
    EXPECT_EQ(ctx_.lastTo(SessionId(1)), "You control puppet #7.");

    say(SessionId(1), "puppet seven");
    EXPECT_EQ(ctx_.lastTo(SessionId(1)), "Usage: puppet [id|none]");

    say(SessionId(1), "puppet none");
    EXPECT_FALSE(ctx_.table.find(SessionId(1))->puppet.isValid());
    EXPECT_EQ(ctx_.lastTo(SessionId(1)), "You release your puppet.");
}

TEST_F(BasicCommandHandlerTest, PuppetInUseByAnotherSession) {
    say(SessionId(1), "login alice");
    say(SessionId(1), "puppet 7");
    say(SessionId(2), "login bob");
    say(SessionId(2), "puppet 7");
    EXPECT_NE(ctx_.lastTo(SessionId(2)).find("in use"), std::string::npos);
}

TEST_F(BasicCommandHandlerTest, Logout) {
    say(SessionId(1), "logout");
    EXPECT_EQ(ctx_.lastTo(SessionId(1)), "You are not logged in.");

    say(SessionId(1), "login alice");
    say(SessionId(1), "logout");
    EXPECT_EQ(ctx_.lastTo(SessionId(1)), "Logged out.");
    EXPECT_FALSE(ctx_.table.find(SessionId(1))->authenticated());
}

TEST_F(BasicCommandHandlerTest, WhoListsSessions) {
    say(SessionId(1), "login alice");
    say(SessionId(2), "who");
    auto text = ctx_.lastTo(SessionId(2));
    EXPECT_EQ(text.rfind("2 session(s) on blue:", 0), 0u);
    EXPECT_NE(text.find("#1 alice"), std::string::npos);
    EXPECT_NE(text.find("#2 (anonymous)"), std::string::npos);
}

TEST_F(BasicCommandHandlerTest, ShoutAndQuit) {
    say(SessionId(1), "login alice");
    say(SessionId(1), "shout hello all");
    ASSERT_EQ(ctx_.announced.size(), 1u);
    EXPECT_EQ(ctx_.announced[0], "alice shouts: hello all");

    say(SessionId(2), "shout hi");
    EXPECT_EQ(ctx_.announced.back(), "Someone shouts: hi");

    say(SessionId(1), "QUIT");
    ASSERT_EQ(ctx_.disconnected.size(), 1u);
    EXPECT_EQ(ctx_.disconnected[0].first, SessionId(1));
    EXPECT_EQ(ctx_.disconnected[0].second, "Goodbye.");
}
