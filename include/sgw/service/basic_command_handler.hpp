#pragma once

/// @file basic_command_handler.hpp
/// @brief Minimal line-command world used when no game logic is plugged in.

#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "sgw/foundation/types.hpp"
#include "sgw/service/engine_interfaces.hpp"

namespace sgw::service {

/// Commands:
///   login <name>   authenticate as <name>; binds the account's puppet
///                  according to the engine policy
///   logout
///   puppet [id|none]
///   who            list sessions
///   shout <text>   announce to every client
///   quit
/// Anything else is echoed back tagged with the engine instance name, which
/// makes it visible which engine answered.
class BasicCommandHandler final : public CommandHandler {
public:
    void handleInput(EngineContext& ctx, const SessionView& session,
                     std::string_view input) override;

    void onSessionAttached(EngineContext& ctx, const SessionView& session) override;

    /// Stable account id for a login name (case-insensitive).
    static sgw::foundation::AccountId accountFor(std::string_view name);

private:
    void login(EngineContext& ctx, const SessionView& session, std::string_view name);
    void puppet(EngineContext& ctx, const SessionView& session, std::string_view arg);
    void who(EngineContext& ctx, const SessionView& session);

    std::string nameOf(sgw::foundation::AccountId account) const;

    mutable std::mutex mutex_;
    std::unordered_map<sgw::foundation::AccountId, std::string> names_;
    std::unordered_map<sgw::foundation::AccountId, sgw::foundation::PuppetId> puppets_;
};

} // namespace sgw::service
