#pragma once

/// @file control_message.hpp
/// @brief Messages exchanged on the control channel between the gateway,
///        the engine and the launcher.
///
/// One connection carries both lifecycle traffic (HELLO, CMD, RESULT,
/// SHUTDOWN, STOPPING) and session traffic (RESYNC_*, CAPABILITIES, DATA, SESSION_UPDATE,
/// DISCONNECT*). Every session-scoped message names its session id, so no
/// per-session channel is needed.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "sgw/foundation/types.hpp"

namespace sgw::control {

using foundation::AccountId;
using foundation::PuppetId;
using foundation::SessionId;

// -- Enumerations -------------------------------------------------------------

/// Wire discriminator, the u16 that follows the frame length.
enum class MessageKind : uint16_t {
    Hello         = 0x01,
    Cmd           = 0x02,
    Result        = 0x03,
    ResyncSession = 0x10,
    ResyncDone    = 0x11,
    ResyncFailed  = 0x12,
    Capabilities  = 0x13,
    Data          = 0x20,
    SessionUpdate = 0x21,
    Disconnect    = 0x22,
    DisconnectAll = 0x23,
    Announce      = 0x24,
    Shutdown      = 0x30,
    Stopping      = 0x31
};

std::string_view messageKindName(MessageKind kind);

/// Who is on the other end, announced in HELLO.
enum class Role : uint8_t {
    Engine   = 1,
    Launcher = 2
};

std::string_view roleName(Role role);

/// Launcher lifecycle commands.
enum class Command : uint8_t {
    Start    = 1,
    Stop     = 2,
    Reload   = 3,
    Status   = 4,
    Shutdown = 5
};

std::string_view commandName(Command cmd);
std::optional<Command> parseCommand(std::string_view name);

/// State of the gateway's engine slot.
enum class EngineState : uint8_t {
    Absent   = 0,
    Starting = 1,
    Running  = 2,
    Stopping = 3
};

std::string_view engineStateName(EngineState state);

/// Outcome carried in RESULT.
enum class ResultCode : uint8_t {
    Ok                  = 0,
    AlreadyInState      = 1, ///< no-op: start while running, stop while absent
    OperationInProgress = 2, ///< another lifecycle transition is running
    Failed              = 3, ///< the transition was attempted and did not complete
    Rejected            = 4  ///< not allowed for this peer (second engine, bad command)
};

std::string_view resultCodeName(ResultCode code);

enum class ProtocolKind : uint8_t {
    Line       = 0,
    SecureLine = 1,
    WebSocket  = 2
};

std::string_view protocolKindName(ProtocolKind kind);

enum class AuthState : uint8_t {
    Anonymous     = 0,
    Authenticated = 1
};

enum class ShutdownMode : uint8_t {
    Stop   = 0,
    Reload = 1
};

/// Negotiated client capabilities, replayed to every new engine.
struct Capabilities {
    std::string encoding = "utf-8";
    bool ansi = false;
    uint16_t screenWidth = 80;
    uint16_t screenHeight = 24;
    std::string clientName;

    bool operator==(const Capabilities&) const = default;
};

// -- Messages -----------------------------------------------------------------

struct Hello {
    Role role = Role::Engine;
    uint16_t revision = 0;
    std::string name;
    uint32_t pid = 0;
};

struct Cmd {
    Command command = Command::Status;
};

/// RESULT. Named CommandResult to stay clear of sgw::Result.
struct CommandResult {
    bool ok = false;
    ResultCode code = ResultCode::Ok;
    EngineState engineState = EngineState::Absent;
    uint32_t sessionCount = 0;
    std::string detail;
};

/// RESYNC_SESSION: everything the engine needs to resume serving a session
/// without re-running login.
struct ResyncSession {
    SessionId sessionId;
    ProtocolKind protocol = ProtocolKind::Line;
    AuthState auth = AuthState::Anonymous;
    AccountId account;
    PuppetId puppet;
    Capabilities capabilities;

    bool operator==(const ResyncSession&) const = default;
};

struct ResyncDone {
    uint32_t sessionCount = 0;
};

struct ResyncFailed {
    SessionId sessionId;
    std::string reason;
};

/// CAPABILITIES: the client renegotiated mid-session. Carries only the
/// capability set so it cannot race the engine's own login updates.
struct SessionCapabilities {
    SessionId sessionId;
    Capabilities capabilities;
};

struct Data {
    SessionId sessionId;
    std::vector<uint8_t> payload;
};

/// Engine-driven login/puppet change for one session.
struct SessionUpdate {
    SessionId sessionId;
    AuthState auth = AuthState::Anonymous;
    AccountId account;
    PuppetId puppet;
};

struct Disconnect {
    SessionId sessionId;
    std::string reason;
};

struct DisconnectAll {
    std::string reason;
};

struct Announce {
    std::string text;
};

struct Shutdown {
    ShutdownMode mode = ShutdownMode::Stop;
    std::string reason;
};

struct Stopping {
    bool clean = true;
};

using ControlMessage = std::variant<Hello, Cmd, CommandResult, ResyncSession, ResyncDone,
                                    ResyncFailed, SessionCapabilities, Data, SessionUpdate,
                                    Disconnect, DisconnectAll, Announce, Shutdown, Stopping>;

/// Wire kind of a message.
MessageKind kindOf(const ControlMessage& msg);

// -- Helpers ------------------------------------------------------------------

/// DATA frame carrying UTF-8 text.
Data makeData(SessionId sid, std::string_view text);

/// Payload of a DATA frame as text.
std::string payloadText(const Data& data);

} // namespace sgw::control
