#pragma once

/// @file service_runner.hpp
/// @brief Shared utilities for the gateway, engine and launcher entry points.
///
/// Provides signal handling, configuration loading, graceful shutdown
/// coordination, and CLI argument parsing for all three executables.

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sgw/foundation/config_manager.hpp"
#include "sgw/foundation/service_result.hpp"

namespace sgw::service {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process.
/// The handler writes to a static atomic flag in an async-signal-safe
/// manner (relaxed store on a lock-free atomic).
///
/// After shutdown is requested, the original default handlers are
/// restored so that a second signal terminates the process immediately.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// Returns true after SIGINT or SIGTERM is received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Block the calling thread until a shutdown signal arrives.
    void waitForShutdown() const;

    /// Raise the flag from inside the process (e.g. a control command).
    void requestShutdown() noexcept;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

using ShutdownHook = std::function<void()>;

/// Runs named shutdown steps in registration order.
///
/// Usage:
/// @code
///   GracefulShutdown shutdown;
///   shutdown.addHook("engine",    [&]() { stopEngine(); });
///   shutdown.addHook("listeners", [&]() { network.stopAll(); });
///
///   // On signal:
///   shutdown.execute();
/// @endcode
class GracefulShutdown {
public:
    void addHook(std::string name, ShutdownHook hook);

    /// Execute all registered hooks in order. A hook that throws is logged
    /// and does not prevent subsequent hooks from running. Runs once.
    void execute();

    [[nodiscard]] std::size_t hookCount() const;

private:
    struct Hook {
        std::string name;
        ShutdownHook callback;
    };
    std::vector<Hook> hooks_;
    bool executed_ = false;
};

/// Load a YAML configuration file into the provided ConfigManager.
///
/// The config file path is resolved in order:
///   1. SGW_CONFIG_PATH environment variable (if set)
///   2. @p defaultPath parameter
[[nodiscard]] sgw::foundation::ServiceResult<void>
loadConfig(sgw::foundation::ConfigManager& config,
           const std::filesystem::path& defaultPath);

/// Parse `--config <path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path parseConfigArg(int argc, char* argv[]);

/// Value following @p flag (e.g. "--port"), if present.
[[nodiscard]] std::optional<std::string> parseOptionArg(int argc, char* argv[],
                                                        std::string_view flag);

/// Arguments that are neither `--flag` nor the value of one.
[[nodiscard]] std::vector<std::string> positionalArgs(int argc, char* argv[]);

} // namespace sgw::service
