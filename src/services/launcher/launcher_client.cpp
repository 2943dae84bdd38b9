/// @file launcher_client.cpp
/// @brief LauncherClient implementation on TcpChannel.

#include "sgw/service/launcher_client.hpp"

#include <unistd.h>

#include <condition_variable>
#include <mutex>
#include <optional>

#include "sgw/control/control_codec.hpp"
#include "sgw/foundation/service_logger.hpp"
#include "sgw/foundation/tcp_channel.hpp"
#include "sgw/version.hpp"

namespace sgw::service {

using control::CommandResult;
using control::ResultCode;
using sgw::foundation::ErrorCode;
using sgw::foundation::LogCategory;
using sgw::foundation::ServiceError;
using sgw::foundation::ServiceResult;
using sgw::foundation::TcpChannel;

LauncherClient::LauncherClient(LauncherConfig config)
    : config_(std::move(config)) {}

ServiceResult<CommandResult> LauncherClient::execute(control::Command cmd) {
    using Outcome = ServiceResult<CommandResult>;

    std::mutex mutex;
    std::condition_variable cv;
    std::optional<CommandResult> reply;
    std::optional<ServiceError> failure;
    control::FrameDecoder decoder;

    TcpChannel channel("sgw-launcher");
    channel.onData.connect([&](const std::vector<uint8_t>& bytes) {
        std::lock_guard lock(mutex);
        std::vector<control::ControlMessage> messages;
        auto fed = decoder.feed(bytes, messages);
        for (auto& msg : messages) {
            if (auto* result = std::get_if<CommandResult>(&msg); result && !reply) {
                reply = std::move(*result);
            }
        }
        if (!fed && !reply) {
            failure = fed.error();
        }
        cv.notify_all();
    });
    channel.onDisconnected.connect([&] {
        std::lock_guard lock(mutex);
        if (!reply && !failure) {
            failure = ServiceError(ErrorCode::ConnectionLost,
                                   "gateway closed the connection before replying");
        }
        cv.notify_all();
    });

    auto connected = channel.connect(config_.gatewayHost, config_.gatewayPort,
                                     config_.connectTimeout);
    if (!connected) {
        return Outcome::err(ServiceError(
            ErrorCode::ConnectionFailed,
            "cannot reach gateway at " + config_.gatewayHost + ":" +
                std::to_string(config_.gatewayPort) + " (is it running?)"));
    }

    control::Hello hello;
    hello.role = control::Role::Launcher;
    hello.revision = SGW_PROTOCOL_REVISION;
    hello.name = "launcher";
    hello.pid = static_cast<uint32_t>(::getpid());

    for (const control::ControlMessage& msg :
         {control::ControlMessage(hello), control::ControlMessage(control::Cmd{cmd})}) {
        auto sent = channel.send(control::encode(msg));
        if (!sent) {
            channel.close();
            return Outcome::err(sent.error());
        }
    }
    SGW_LOG_DEBUG(LogCategory::Launcher, "sent " + std::string(control::commandName(cmd)));

    std::optional<CommandResult> received;
    std::optional<ServiceError> failed;
    {
        std::unique_lock lock(mutex);
        cv.wait_for(lock, config_.timeout, [&] { return reply.has_value() || failure.has_value(); });
        received = reply;
        failed = failure;
    }

    // Detach the callbacks before the locals they reference go away.
    channel.onData.disconnectAll();
    channel.onDisconnected.disconnectAll();
    channel.close();

    if (received) {
        return Outcome::ok(std::move(*received));
    }
    if (failed) {
        return Outcome::err(std::move(*failed));
    }
    return Outcome::err(ServiceError(
        ErrorCode::Timeout,
        "no result within " + std::to_string(config_.timeout.count()) +
            "s; the transition may still complete"));
}

int LauncherClient::exitCodeFor(const ServiceResult<CommandResult>& outcome) {
    if (outcome.hasError()) {
        switch (outcome.error().code()) {
            case ErrorCode::ConnectionFailed: return kLauncherExitUnreachable;
            case ErrorCode::Timeout:          return kLauncherExitTimeout;
            default:                          return kLauncherExitFailed;
        }
    }
    switch (outcome.value().code) {
        case ResultCode::Ok:                  return kLauncherExitOk;
        case ResultCode::AlreadyInState:
        case ResultCode::OperationInProgress:
        case ResultCode::Rejected:            return kLauncherExitRejected;
        case ResultCode::Failed:              return kLauncherExitFailed;
    }
    return kLauncherExitFailed;
}

std::string LauncherClient::describe(const CommandResult& result) {
    std::string text(result.ok ? "ok" : control::resultCodeName(result.code));
    text += ": ";
    text += result.detail.empty() ? std::string("-") : result.detail;
    text += " [engine " + std::string(control::engineStateName(result.engineState)) + ", " +
            std::to_string(result.sessionCount) + " session(s)]";
    return text;
}

} // namespace sgw::service
