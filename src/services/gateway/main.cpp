/// @file main.cpp
/// @brief Gateway process entry point.
///
/// Holds client connections and the session registry, serves the control
/// channel and supervises the engine process.

#include <cstdlib>
#include <iostream>

#include "sgw/foundation/config_manager.hpp"
#include "sgw/foundation/service_logger.hpp"
#include "sgw/service/gateway_host.hpp"
#include "sgw/service/service_config.hpp"
#include "sgw/service/service_runner.hpp"
#include "sgw/version.hpp"

int main(int argc, char* argv[]) {
    sgw::service::SignalHandler signals;
    sgw::foundation::installConsoleSink();
    sgw::foundation::ServiceLogger::instance().setProcessTag("gateway");

    auto configPath = sgw::service::parseConfigArg(argc, argv);
    if (configPath.empty()) {
        configPath = "config/session_gateway.yaml";
    }

    sgw::foundation::ConfigManager config;
    auto loadResult = sgw::service::loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto logging = sgw::service::applyLoggingConfig(config);
    if (!logging) {
        std::cerr << logging.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto gwConfig = sgw::service::buildGatewayConfig(config);
    if (!gwConfig) {
        std::cerr << gwConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }

    sgw::service::GatewayHost host(std::move(gwConfig).value());

    auto startResult = host.start();
    if (!startResult) {
        std::cerr << "Failed to start gateway: " << startResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    SGW_LOG_INFO(sgw::foundation::LogCategory::Core,
                 std::string("session gateway ") + SGW_VERSION_STRING + " running");

    sgw::service::GracefulShutdown shutdown;
    shutdown.addHook("engine and listeners", [&host]() { host.shutdown(); });

    host.run(signals);

    SGW_LOG_INFO(sgw::foundation::LogCategory::Core, "shutting down gateway");
    shutdown.execute();
    SGW_LOG_INFO(sgw::foundation::LogCategory::Core, "gateway stopped");
    return EXIT_SUCCESS;
}
