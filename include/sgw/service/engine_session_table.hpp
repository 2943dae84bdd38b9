#pragma once

/// @file engine_session_table.hpp
/// @brief The engine's view of the sessions the gateway holds.

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "sgw/control/control_message.hpp"
#include "sgw/foundation/service_result.hpp"
#include "sgw/foundation/types.hpp"
#include "sgw/service/engine_types.hpp"

namespace sgw::service {

/// Thread-safe session-to-puppet mapping rebuilt from resync.
///
/// attach() is idempotent: replaying the same RESYNC_SESSION yields the
/// same entry. A puppet is bound to at most one session at a time.
///
/// Example:
/// @code
///   EngineSessionTable table(policy);
///   auto view = table.attach(resync);          // restores login and puppet
///   if (!view) { reportResyncFailed(view.error()); }
///   table.login(sid, AccountId(7));
/// @endcode
class EngineSessionTable {
public:
    explicit EngineSessionTable(EnginePolicy policy = {});

    /// Apply one resync entry. Fails with ResyncFailed when the puppet is
    /// already bound to a different session.
    [[nodiscard]] sgw::foundation::ServiceResult<SessionView> attach(
        const control::ResyncSession& resync);

    /// Entry for @p sid, created anonymous if missing.
    SessionView ensure(sgw::foundation::SessionId sid);

    bool remove(sgw::foundation::SessionId sid);

    /// Replace the client capabilities of @p sid, creating the entry if missing.
    SessionView updateCapabilities(sgw::foundation::SessionId sid,
                                   const control::Capabilities& capabilities);

    /// Fails with SessionNotFound, or SessionLimitReached when the account
    /// already holds maxSessionsPerAccount other sessions.
    [[nodiscard]] sgw::foundation::ServiceResult<SessionView> login(
        sgw::foundation::SessionId sid, sgw::foundation::AccountId account);

    /// Clears login and puppet.
    [[nodiscard]] sgw::foundation::ServiceResult<SessionView> logout(
        sgw::foundation::SessionId sid);

    /// Fails with AlreadyExists when the puppet belongs to another session.
    [[nodiscard]] sgw::foundation::ServiceResult<SessionView> bindPuppet(
        sgw::foundation::SessionId sid, sgw::foundation::PuppetId puppet);

    [[nodiscard]] std::optional<SessionView> find(sgw::foundation::SessionId sid) const;

    [[nodiscard]] std::optional<sgw::foundation::SessionId> ownerOf(
        sgw::foundation::PuppetId puppet) const;

    /// Every session, ordered by id.
    [[nodiscard]] std::vector<SessionView> snapshot() const;

    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] const EnginePolicy& policy() const noexcept { return policy_; }

private:
    void unbindLocked(SessionView& view);

    EnginePolicy policy_;
    mutable std::mutex mutex_;
    std::map<sgw::foundation::SessionId, SessionView> sessions_;
    std::unordered_map<sgw::foundation::PuppetId, sgw::foundation::SessionId> puppetOwners_;
};

} // namespace sgw::service
