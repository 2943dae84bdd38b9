/// @file basic_command_handler.cpp
/// @brief BasicCommandHandler implementation.

#include "sgw/service/basic_command_handler.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <system_error>

namespace sgw::service {

using sgw::foundation::AccountId;
using sgw::foundation::PuppetId;

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

std::string lowered(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

AccountId BasicCommandHandler::accountFor(std::string_view name) {
    // FNV-1a, so the same name maps to the same account in every engine.
    uint64_t hash = 14695981039346656037ULL;
    for (char c : lowered(name)) {
        hash ^= static_cast<unsigned char>(c);
        hash *= 1099511628211ULL;
    }
    return AccountId(hash == 0 ? 1 : hash);
}

void BasicCommandHandler::handleInput(EngineContext& ctx, const SessionView& session,
                                      std::string_view input) {
    auto line = trim(input);
    auto space = line.find(' ');
    auto verb = lowered(line.substr(0, space));
    auto arg = space == std::string_view::npos ? std::string_view{} : trim(line.substr(space));

    if (verb == "login") {
        login(ctx, session, arg);
    } else if (verb == "logout") {
        if (!session.authenticated()) {
            ctx.emit(session.id, "You are not logged in.");
            return;
        }
        auto result = ctx.logout(session.id);
        ctx.emit(session.id, result ? "Logged out." : std::string(result.error().message()));
    } else if (verb == "puppet") {
        puppet(ctx, session, arg);
    } else if (verb == "who") {
        who(ctx, session);
    } else if (verb == "shout" && !arg.empty()) {
        auto speaker = session.authenticated() ? nameOf(session.account) : "Someone";
        ctx.announce(speaker + " shouts: " + std::string(arg));
    } else if (verb == "quit") {
        ctx.disconnect(session.id, "Goodbye.");
    } else if (!line.empty()) {
        ctx.emit(session.id, "[" + ctx.instanceName() + "] " + std::string(line));
    }
}

void BasicCommandHandler::onSessionAttached(EngineContext& /*ctx*/, const SessionView& session) {
    if (!session.authenticated() || !session.puppet.isValid()) {
        return;
    }
    std::lock_guard lock(mutex_);
    puppets_.try_emplace(session.account, session.puppet);
}

void BasicCommandHandler::login(EngineContext& ctx, const SessionView& session,
                                std::string_view name) {
    if (name.empty()) {
        ctx.emit(session.id, "Usage: login <name>");
        return;
    }
    if (session.authenticated()) {
        ctx.emit(session.id, "You are already logged in as " + nameOf(session.account) + ".");
        return;
    }

    auto account = accountFor(name);
    auto result = ctx.login(session.id, account);
    if (!result) {
        ctx.emit(session.id, "Login refused: " + std::string(result.error().message()));
        return;
    }

    std::optional<PuppetId> puppetId;
    {
        std::lock_guard lock(mutex_);
        names_.try_emplace(account, std::string(name));
        if (ctx.policy().autoBindPuppet) {
            auto it = puppets_.find(account);
            if (it != puppets_.end()) {
                puppetId = it->second;
            } else if (ctx.policy().autoCreatePuppet) {
                puppetId = PuppetId(account.value());
                puppets_.emplace(account, *puppetId);
            }
        }
    }

    ctx.emit(session.id, "Welcome, " + std::string(name) + ".");
    if (puppetId) {
        auto bound = ctx.bindPuppet(session.id, *puppetId);
        if (bound) {
            ctx.emit(session.id, "You are now controlling puppet #" +
                                     std::to_string(puppetId->value()) + ".");
        } else {
            ctx.emit(session.id, std::string(bound.error().message()));
        }
    }
}

void BasicCommandHandler::puppet(EngineContext& ctx, const SessionView& session,
                                 std::string_view arg) {
    if (arg.empty()) {
        ctx.emit(session.id, session.puppet.isValid()
                                 ? "You control puppet #" + std::to_string(session.puppet.value()) +
                                       "."
                                 : std::string("You control no puppet."));
        return;
    }
    if (!session.authenticated()) {
        ctx.emit(session.id, "Log in first.");
        return;
    }

    uint64_t value = 0;
    if (lowered(arg) != "none") {
        auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), value);
        if (ec != std::errc() || ptr != arg.data() + arg.size()) {
            ctx.emit(session.id, "Usage: puppet [id|none]");
            return;
        }
    }

    auto result = ctx.bindPuppet(session.id, PuppetId(value));
    if (!result) {
        ctx.emit(session.id, std::string(result.error().message()));
        return;
    }
    if (value != 0) {
        std::lock_guard lock(mutex_);
        puppets_[session.account] = PuppetId(value);
    }
    ctx.emit(session.id, value == 0 ? std::string("You release your puppet.")
                                    : "You now control puppet #" + std::to_string(value) + ".");
}

void BasicCommandHandler::who(EngineContext& ctx, const SessionView& session) {
    auto sessions = ctx.sessions();
    std::string text = std::to_string(sessions.size()) + " session(s) on " + ctx.instanceName() +
                       ":";
    for (const auto& other : sessions) {
        text += "\n  #" + std::to_string(other.id.value()) + " ";
        text += other.authenticated() ? nameOf(other.account) : std::string("(anonymous)");
        if (other.puppet.isValid()) {
            text += " puppet #" + std::to_string(other.puppet.value());
        }
    }
    ctx.emit(session.id, text);
}

std::string BasicCommandHandler::nameOf(AccountId account) const {
    std::lock_guard lock(mutex_);
    auto it = names_.find(account);
    if (it != names_.end()) {
        return it->second;
    }
    return "account " + std::to_string(account.value());
}

} // namespace sgw::service
