/// @file main.cpp
/// @brief Launcher entry point: one lifecycle command per invocation.
///
///   sgw_launcher [--config path] [--host h] [--port p] [--timeout s]
///                start|stop|reload|status|shutdown

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include "sgw/foundation/config_manager.hpp"
#include "sgw/foundation/service_logger.hpp"
#include "sgw/service/launcher_client.hpp"
#include "sgw/service/service_config.hpp"
#include "sgw/service/service_runner.hpp"

namespace {

void printUsage() {
    std::cerr << "usage: sgw_launcher [--config path] [--host h] [--port p] [--timeout s] "
                 "start|stop|reload|status|shutdown\n";
}

} // namespace

int main(int argc, char* argv[]) {
    using sgw::service::LauncherClient;

    sgw::foundation::installConsoleSink();
    sgw::foundation::ServiceLogger::instance().setProcessTag("launcher");

    auto args = sgw::service::positionalArgs(argc, argv);
    if (args.size() != 1) {
        printUsage();
        return sgw::service::kLauncherExitFailed;
    }
    auto command = sgw::control::parseCommand(args.front());
    if (!command) {
        std::cerr << "unknown command: " << args.front() << "\n";
        printUsage();
        return sgw::service::kLauncherExitFailed;
    }

    auto configPath = sgw::service::parseConfigArg(argc, argv);
    bool explicitPath = !configPath.empty() || std::getenv("SGW_CONFIG_PATH") != nullptr;
    if (configPath.empty()) {
        configPath = "config/session_gateway.yaml";
    }

    sgw::foundation::ConfigManager config;
    if (explicitPath || std::filesystem::exists(configPath)) {
        auto loadResult = sgw::service::loadConfig(config, configPath);
        if (!loadResult) {
            std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
            return sgw::service::kLauncherExitFailed;
        }
    }

    // The launcher only speaks up on warnings unless configured otherwise.
    sgw::foundation::ServiceLogger::instance().setAllLevels(sgw::foundation::LogLevel::Warning);
    auto logging = sgw::service::applyLoggingConfig(config);
    if (!logging) {
        std::cerr << logging.error().message() << "\n";
        return sgw::service::kLauncherExitFailed;
    }

    auto built = sgw::service::buildLauncherConfig(config);
    if (!built) {
        std::cerr << built.error().message() << "\n";
        return sgw::service::kLauncherExitFailed;
    }
    auto launcherConfig = std::move(built).value();

    try {
        if (auto host = sgw::service::parseOptionArg(argc, argv, "--host")) {
            launcherConfig.gatewayHost = *host;
        }
        if (auto port = sgw::service::parseOptionArg(argc, argv, "--port")) {
            launcherConfig.gatewayPort = static_cast<uint16_t>(std::stoul(*port));
        }
        if (auto timeout = sgw::service::parseOptionArg(argc, argv, "--timeout")) {
            launcherConfig.timeout = std::chrono::seconds(std::stol(*timeout));
        }
    } catch (const std::exception&) {
        std::cerr << "invalid numeric option\n";
        printUsage();
        return sgw::service::kLauncherExitFailed;
    }

    LauncherClient launcher(launcherConfig);
    auto outcome = launcher.execute(*command);
    if (!outcome) {
        std::cerr << outcome.error().message() << "\n";
    } else {
        std::cout << LauncherClient::describe(outcome.value()) << "\n";
    }
    return LauncherClient::exitCodeFor(outcome);
}
