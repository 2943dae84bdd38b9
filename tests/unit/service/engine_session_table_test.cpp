#include <gtest/gtest.h>

#include "sgw/service/engine_session_table.hpp"

using namespace sgw::service;
using sgw::foundation::AccountId;
using sgw::foundation::ErrorCode;
using sgw::foundation::PuppetId;
using sgw::foundation::SessionId;

namespace control = sgw::control;

namespace {

control::ResyncSession resync(uint64_t sid, uint64_t account = 0, uint64_t puppet = 0) {
    control::ResyncSession msg;
    msg.sessionId = SessionId(sid);
    if (account != 0) {
        msg.auth = control::AuthState::Authenticated;
        msg.account = AccountId(account);
    }
    msg.puppet = PuppetId(puppet);
    return msg;
}

} // namespace

// =============================================================================
// Resync
// =============================================================================

TEST(EngineSessionTableTest, AttachRestoresLoginAndPuppet) {
    EngineSessionTable table;
    auto msg = resync(1, 7, 70);
    msg.capabilities.ansi = true;
    msg.capabilities.clientName = "mudlet";

    auto view = table.attach(msg);
    ASSERT_TRUE(view.hasValue());
    EXPECT_TRUE(view.value().resumed);
    EXPECT_TRUE(view.value().authenticated());
    EXPECT_EQ(view.value().account, AccountId(7));
    EXPECT_EQ(view.value().puppet, PuppetId(70));
    EXPECT_EQ(view.value().capabilities.clientName, "mudlet");
    EXPECT_EQ(table.ownerOf(PuppetId(70)), SessionId(1));
}

TEST(EngineSessionTableTest, AttachIsIdempotent) {
    EngineSessionTable table;
    ASSERT_TRUE(table.attach(resync(1, 7, 70)));
    ASSERT_TRUE(table.attach(resync(1, 7, 70)));

    EXPECT_EQ(table.size(), 1u);
    auto view = table.find(SessionId(1));
    ASSERT_TRUE(view.has_value());
    EXPECT_EQ(view->puppet, PuppetId(70));
    EXPECT_EQ(table.ownerOf(PuppetId(70)), SessionId(1));
}

TEST(EngineSessionTableTest, AnonymousResyncDropsAccount) {
    EngineSessionTable table;
    auto msg = resync(1);
    msg.account = AccountId(5);
    auto view = table.attach(msg);
    ASSERT_TRUE(view);
    EXPECT_FALSE(view.value().authenticated());
    EXPECT_FALSE(view.value().account.isValid());
}

TEST(EngineSessionTableTest, PuppetClaimedTwiceFailsResync) {
    EngineSessionTable table;
    ASSERT_TRUE(table.attach(resync(1, 7, 70)));

    auto clash = table.attach(resync(2, 8, 70));
    ASSERT_TRUE(clash.hasError());
    EXPECT_EQ(clash.error().code(), ErrorCode::ResyncFailed);
    EXPECT_FALSE(table.find(SessionId(2)).has_value());
    EXPECT_EQ(table.ownerOf(PuppetId(70)), SessionId(1));
}

TEST(EngineSessionTableTest, ResyncWithNewPuppetReleasesOldOne) {
    EngineSessionTable table;
    ASSERT_TRUE(table.attach(resync(1, 7, 70)));
    ASSERT_TRUE(table.attach(resync(1, 7, 71)));
    EXPECT_FALSE(table.ownerOf(PuppetId(70)).has_value());
    EXPECT_EQ(table.ownerOf(PuppetId(71)), SessionId(1));
}

// =============================================================================
// Login and puppets
// =============================================================================

TEST(EngineSessionTableTest, EnsureCreatesAnonymous) {
    EngineSessionTable table;
    auto view = table.ensure(SessionId(3));
    EXPECT_EQ(view.id, SessionId(3));
    EXPECT_FALSE(view.authenticated());
    EXPECT_FALSE(view.resumed);
    table.ensure(SessionId(3));
    EXPECT_EQ(table.size(), 1u);
}

TEST(EngineSessionTableTest, LoginUnknownSession) {
    EngineSessionTable table;
    auto result = table.login(SessionId(9), AccountId(1));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::SessionNotFound);
}

TEST(EngineSessionTableTest, LoginRejectsInvalidAccount) {
    EngineSessionTable table;
    table.ensure(SessionId(1));
    auto result = table.login(SessionId(1), AccountId{});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST(EngineSessionTableTest, SessionsPerAccountLimit) {
    EnginePolicy policy;
    policy.maxSessionsPerAccount = 1;
    EngineSessionTable table(policy);
    table.ensure(SessionId(1));
    table.ensure(SessionId(2));

    ASSERT_TRUE(table.login(SessionId(1), AccountId(7)));
    auto second = table.login(SessionId(2), AccountId(7));
    ASSERT_TRUE(second.hasError());
    EXPECT_EQ(second.error().code(), ErrorCode::SessionLimitReached);

    // Logging in again on the same session is not a second session.
    EXPECT_TRUE(table.login(SessionId(1), AccountId(7)));

    ASSERT_TRUE(table.logout(SessionId(1)));
    EXPECT_TRUE(table.login(SessionId(2), AccountId(7)));
}

TEST(EngineSessionTableTest, UnlimitedByDefault) {
    EngineSessionTable table;
    for (uint64_t i = 1; i <= 5; ++i) {
        table.ensure(SessionId(i));
        EXPECT_TRUE(table.login(SessionId(i), AccountId(7)));
    }
}

TEST(EngineSessionTableTest, BindPuppetOwnership) {
    EngineSessionTable table;
    table.ensure(SessionId(1));
    table.ensure(SessionId(2));

    ASSERT_TRUE(table.bindPuppet(SessionId(1), PuppetId(40)));
    auto taken = table.bindPuppet(SessionId(2), PuppetId(40));
    ASSERT_TRUE(taken.hasError());
    EXPECT_EQ(taken.error().code(), ErrorCode::AlreadyExists);

    ASSERT_TRUE(table.bindPuppet(SessionId(1), PuppetId(41)));
    EXPECT_FALSE(table.ownerOf(PuppetId(40)).has_value());
    EXPECT_TRUE(table.bindPuppet(SessionId(2), PuppetId(40)));
}

TEST(EngineSessionTableTest, LogoutAndRemoveReleasePuppet) {
    EngineSessionTable table;
    ASSERT_TRUE(table.attach(resync(1, 7, 70)));
    ASSERT_TRUE(table.attach(resync(2, 8, 80)));

    auto out = table.logout(SessionId(1));
    ASSERT_TRUE(out);
    EXPECT_FALSE(out.value().puppet.isValid());
    EXPECT_FALSE(table.ownerOf(PuppetId(70)).has_value());

    EXPECT_TRUE(table.remove(SessionId(2)));
    EXPECT_FALSE(table.ownerOf(PuppetId(80)).has_value());
    EXPECT_FALSE(table.remove(SessionId(2)));
}

TEST(EngineSessionTableTest, SnapshotOrderedById) {
    EngineSessionTable table;
    table.ensure(SessionId(5));
    table.ensure(SessionId(2));
    auto views = table.snapshot();
    ASSERT_EQ(views.size(), 2u);
    EXPECT_EQ(views[0].id, SessionId(2));
    EXPECT_EQ(views[1].id, SessionId(5));
}
