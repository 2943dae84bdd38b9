/// @file main.cpp
/// @brief Engine process entry point.
///
/// Dials the gateway's control channel, resumes the sessions it replays
/// and serves client input with the built-in command handler until the
/// gateway asks it to stop.

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include "sgw/foundation/config_manager.hpp"
#include "sgw/foundation/service_logger.hpp"
#include "sgw/service/basic_command_handler.hpp"
#include "sgw/service/engine_client.hpp"
#include "sgw/service/service_config.hpp"
#include "sgw/service/service_runner.hpp"

namespace {

constexpr int kExitCannotConnect = 4;

} // namespace

int main(int argc, char* argv[]) {
    sgw::service::SignalHandler signals;
    sgw::foundation::installConsoleSink();

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
            return EXIT_FAILURE;
        }
    }

    auto logging = sgw::service::applyLoggingConfig(config);
    if (!logging) {
        std::cerr << logging.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto built = sgw::service::buildEngineConfig(config);
    if (!built) {
        std::cerr << built.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto engineConfig = std::move(built).value();

    if (auto name = sgw::service::parseOptionArg(argc, argv, "--name")) {
        engineConfig.name = *name;
    }
    if (auto host = sgw::service::parseOptionArg(argc, argv, "--host")) {
        engineConfig.gatewayHost = *host;
    }
    if (auto port = sgw::service::parseOptionArg(argc, argv, "--port")) {
        try {
            engineConfig.gatewayPort = static_cast<uint16_t>(std::stoul(*port));
        } catch (const std::exception&) {
            std::cerr << "invalid --port: " << *port << "\n";
            return EXIT_FAILURE;
        }
    }

    sgw::foundation::ServiceLogger::instance().setProcessTag("engine:" + engineConfig.name);

    sgw::service::BasicCommandHandler handler;
    sgw::service::EngineClient client(engineConfig, handler);

    auto connected = client.connect();
    if (!connected) {
        std::cerr << "Failed to reach gateway: " << connected.error().message() << "\n";
        return kExitCannotConnect;
    }

    int code = client.run(signals);
    SGW_LOG_INFO(sgw::foundation::LogCategory::Core,
                 "engine " + engineConfig.name + " exiting with status " + std::to_string(code));
    return code;
}
