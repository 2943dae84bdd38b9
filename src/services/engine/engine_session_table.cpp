/// @file engine_session_table.cpp
/// @brief EngineSessionTable implementation.

#include "sgw/service/engine_session_table.hpp"

#include <string>

namespace sgw::service {

using sgw::foundation::AccountId;
using sgw::foundation::ErrorCode;
using sgw::foundation::PuppetId;
using sgw::foundation::ServiceError;
using sgw::foundation::ServiceResult;
using sgw::foundation::SessionId;

namespace {

std::string idText(uint64_t value) {
    return std::to_string(value);
}

ServiceResult<SessionView> notFound(SessionId sid) {
    return ServiceResult<SessionView>::err(
        ServiceError(ErrorCode::SessionNotFound, "no session " + idText(sid.value())));
}

} // namespace

EngineSessionTable::EngineSessionTable(EnginePolicy policy)
    : policy_(policy) {}

ServiceResult<SessionView> EngineSessionTable::attach(const control::ResyncSession& resync) {
    std::lock_guard lock(mutex_);

    if (resync.puppet.isValid()) {
        auto owner = puppetOwners_.find(resync.puppet);
        if (owner != puppetOwners_.end() && owner->second != resync.sessionId) {
            return ServiceResult<SessionView>::err(ServiceError(
                ErrorCode::ResyncFailed,
                "puppet " + idText(resync.puppet.value()) + " already bound to session " +
                    idText(owner->second.value())));
        }
    }

    auto& view = sessions_[resync.sessionId];
    if (view.puppet.isValid() && view.puppet != resync.puppet) {
        unbindLocked(view);
    }

    view.id = resync.sessionId;
    view.protocol = resync.protocol;
    view.auth = resync.auth;
    view.account = resync.auth == control::AuthState::Authenticated ? resync.account
                                                                    : AccountId{};
    view.puppet = resync.puppet;
    view.capabilities = resync.capabilities;
    view.resumed = true;

    if (view.puppet.isValid()) {
        puppetOwners_[view.puppet] = view.id;
    }
    return ServiceResult<SessionView>::ok(view);
}

SessionView EngineSessionTable::ensure(SessionId sid) {
    std::lock_guard lock(mutex_);
    auto [it, inserted] = sessions_.try_emplace(sid);
    if (inserted) {
        it->second.id = sid;
    }
    return it->second;
}

SessionView EngineSessionTable::updateCapabilities(SessionId sid,
                                                   const control::Capabilities& capabilities) {
    std::lock_guard lock(mutex_);
    auto [it, inserted] = sessions_.try_emplace(sid);
    if (inserted) {
        it->second.id = sid;
    }
    it->second.capabilities = capabilities;
    return it->second;
}

bool EngineSessionTable::remove(SessionId sid) {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(sid);
    if (it == sessions_.end()) {
        return false;
    }
    unbindLocked(it->second);
    sessions_.erase(it);
    return true;
}

ServiceResult<SessionView> EngineSessionTable::login(SessionId sid, AccountId account) {
    std::lock_guard lock(mutex_);

    auto it = sessions_.find(sid);
    if (it == sessions_.end()) {
        return notFound(sid);
    }
    if (!account.isValid()) {
        return ServiceResult<SessionView>::err(
            ServiceError(ErrorCode::InvalidArgument, "invalid account"));
    }

    if (policy_.maxSessionsPerAccount > 0) {
        uint32_t held = 0;
        for (const auto& [otherId, other] : sessions_) {
            if (otherId != sid && other.authenticated() && other.account == account) {
                ++held;
            }
        }
        if (held >= policy_.maxSessionsPerAccount) {
            return ServiceResult<SessionView>::err(ServiceError(
                ErrorCode::SessionLimitReached,
                "account " + idText(account.value()) + " already has " + idText(held) +
                    " session(s)"));
        }
    }

    auto& view = it->second;
    if (view.account != account) {
        unbindLocked(view);
    }
    view.auth = control::AuthState::Authenticated;
    view.account = account;
    return ServiceResult<SessionView>::ok(view);
}

ServiceResult<SessionView> EngineSessionTable::logout(SessionId sid) {
    std::lock_guard lock(mutex_);

    auto it = sessions_.find(sid);
    if (it == sessions_.end()) {
        return notFound(sid);
    }
    auto& view = it->second;
    unbindLocked(view);
    view.auth = control::AuthState::Anonymous;
    view.account = AccountId{};
    return ServiceResult<SessionView>::ok(view);
}

ServiceResult<SessionView> EngineSessionTable::bindPuppet(SessionId sid, PuppetId puppet) {
    std::lock_guard lock(mutex_);

    auto it = sessions_.find(sid);
    if (it == sessions_.end()) {
        return notFound(sid);
    }

    if (puppet.isValid()) {
        auto owner = puppetOwners_.find(puppet);
        if (owner != puppetOwners_.end() && owner->second != sid) {
            return ServiceResult<SessionView>::err(ServiceError(
                ErrorCode::AlreadyExists,
                "puppet " + idText(puppet.value()) + " is in use by session " +
                    idText(owner->second.value())));
        }
    }

    auto& view = it->second;
    unbindLocked(view);
    view.puppet = puppet;
    if (puppet.isValid()) {
        puppetOwners_[puppet] = sid;
    }
    return ServiceResult<SessionView>::ok(view);
}

std::optional<SessionView> EngineSessionTable::find(SessionId sid) const {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(sid);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<SessionId> EngineSessionTable::ownerOf(PuppetId puppet) const {
    std::lock_guard lock(mutex_);
    auto it = puppetOwners_.find(puppet);
    if (it == puppetOwners_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<SessionView> EngineSessionTable::snapshot() const {
    std::lock_guard lock(mutex_);
    std::vector<SessionView> out;
    out.reserve(sessions_.size());
    for (const auto& [sid, view] : sessions_) {
        out.push_back(view);
    }
    return out;
}

std::size_t EngineSessionTable::size() const {
    std::lock_guard lock(mutex_);
    return sessions_.size();
}

void EngineSessionTable::unbindLocked(SessionView& view) {
    if (!view.puppet.isValid()) {
        return;
    }
    auto owner = puppetOwners_.find(view.puppet);
    if (owner != puppetOwners_.end() && owner->second == view.id) {
        puppetOwners_.erase(owner);
    }
    view.puppet = PuppetId{};
}

} // namespace sgw::service
