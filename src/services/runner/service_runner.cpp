/// @file service_runner.cpp
/// @brief Implementation of shared entry-point utilities.

#include "sgw/service/service_runner.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <string_view>
#include <thread>

#include "sgw/foundation/service_logger.hpp"

namespace sgw::service {

using sgw::foundation::LogCategory;

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    // async-signal-safe: relaxed store on a lock-free atomic.
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
    // A peer closing its socket must not kill the process.
    std::signal(SIGPIPE, SIG_IGN);
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

void SignalHandler::waitForShutdown() const {
    using namespace std::chrono_literals;
    while (!shutdownFlag_.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(100ms);
    }
}

void SignalHandler::requestShutdown() noexcept {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

// -- GracefulShutdown --------------------------------------------------------

void GracefulShutdown::addHook(std::string name, ShutdownHook hook) {
    hooks_.push_back(Hook{std::move(name), std::move(hook)});
}

void GracefulShutdown::execute() {
    if (executed_) {
        return;
    }
    executed_ = true;

    for (const auto& hook : hooks_) {
        SGW_LOG_DEBUG(LogCategory::Core, "shutdown step: " + hook.name);
        try {
            hook.callback();
        } catch (const std::exception& e) {
            SGW_LOG_ERROR(LogCategory::Core,
                          "shutdown step " + hook.name + " failed: " + e.what());
        }
    }
}

std::size_t GracefulShutdown::hookCount() const {
    return hooks_.size();
}

// -- Config loading ----------------------------------------------------------

sgw::foundation::ServiceResult<void>
loadConfig(sgw::foundation::ConfigManager& config,
           const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv("SGW_CONFIG_PATH");
    if (envPath != nullptr) {
        configPath = envPath;
    }

    return config.load(configPath);
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    auto value = parseOptionArg(argc, argv, "--config");
    return value ? std::filesystem::path(*value) : std::filesystem::path{};
}

std::optional<std::string> parseOptionArg(int argc, char* argv[], std::string_view flag) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == flag) {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return std::string(argv[i + 1]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return std::nullopt;
}

std::vector<std::string> positionalArgs(int argc, char* argv[]) {
    std::vector<std::string> out;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg.size() > 2 && arg.substr(0, 2) == "--") {
            ++i;  // skip the flag's value
            continue;
        }
        out.emplace_back(arg);
    }
    return out;
}

} // namespace sgw::service
