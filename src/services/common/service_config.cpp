/// @file service_config.cpp
/// @brief ConfigManager to GatewayConfig / EngineConfig / LauncherConfig.

#include "sgw/service/service_config.hpp"

#include <string>

#include "sgw/foundation/service_logger.hpp"

namespace sgw::service {

using sgw::foundation::ConfigManager;
using sgw::foundation::ErrorCode;
using sgw::foundation::LogCategory;
using sgw::foundation::ServiceError;
using sgw::foundation::ServiceResult;

namespace {

ServiceError invalid(std::string_view key, std::string_view detail) {
    return ServiceError(ErrorCode::ConfigInvalidValue,
                        "invalid value for " + std::string(key) + ": " + std::string(detail));
}

ServiceResult<uint16_t> readPort(const ConfigManager& config, std::string_view key,
                                 uint16_t fallback) {
    auto port = config.get<int>(key);
    if (!port) {
        return ServiceResult<uint16_t>::ok(fallback);
    }
    if (port.value() <= 0 || port.value() > 65535) {
        return ServiceResult<uint16_t>::err(invalid(key, std::to_string(port.value())));
    }
    return ServiceResult<uint16_t>::ok(static_cast<uint16_t>(port.value()));
}

ServiceResult<std::vector<ListenerConfig>> readListeners(const ConfigManager& config) {
    using Out = ServiceResult<std::vector<ListenerConfig>>;
    constexpr std::string_view key = "gateway.listeners";

    std::vector<ListenerConfig> listeners;
    auto node = config.node(key);
    if (!node) {
        return Out::ok(std::move(listeners));
    }
    if (!node.value().IsSequence()) {
        return Out::err(invalid(key, "expected a list of listeners"));
    }

    try {
        for (const auto& entry : node.value()) {
            ListenerConfig listener;
            if (!entry["name"] || !entry["port"]) {
                return Out::err(invalid(key, "listener needs name and port"));
            }
            listener.name = entry["name"].as<std::string>();

            int port = entry["port"].as<int>();
            if (port <= 0 || port > 65535) {
                return Out::err(invalid(key, listener.name + " port " + std::to_string(port)));
            }
            listener.port = static_cast<uint16_t>(port);

            if (entry["transport"]) {
                auto name = entry["transport"].as<std::string>();
                auto transport = sgw::foundation::parseTransport(name);
                if (!transport) {
                    return Out::err(invalid(key, listener.name + " transport " + name));
                }
                listener.transport = *transport;
            }
            if (entry["codec"]) {
                listener.codec = entry["codec"].as<std::string>();
            } else if (listener.transport == sgw::foundation::Transport::WebSocket) {
                listener.codec = "websocket";
            }
            if (entry["negotiate"]) {
                listener.negotiate = entry["negotiate"].as<bool>();
            }
            listeners.push_back(std::move(listener));
        }
    } catch (const YAML::Exception& e) {
        return Out::err(invalid(key, e.what()));
    }
    return Out::ok(std::move(listeners));
}

} // namespace

// -- Gateway ------------------------------------------------------------------

ServiceResult<GatewayConfig> buildGatewayConfig(const ConfigManager& config) {
    using Out = ServiceResult<GatewayConfig>;
    GatewayConfig cfg;

    auto controlPort = readPort(config, "gateway.control_port", cfg.controlPort);
    if (!controlPort) {
        return Out::err(controlPort.error());
    }
    cfg.controlPort = controlPort.value();

    auto listeners = readListeners(config);
    if (!listeners) {
        return Out::err(listeners.error());
    }
    cfg.listeners = std::move(listeners).value();

    auto maxConn = config.get<unsigned int>("gateway.max_connections");
    if (maxConn) {
        cfg.maxConnections = maxConn.value();
    }

    auto queuePolicy = config.get<std::string>("gateway.input_queue.policy");
    if (queuePolicy) {
        auto parsed = parseInputQueuePolicy(queuePolicy.value());
        if (!parsed) {
            return Out::err(invalid("gateway.input_queue.policy", queuePolicy.value()));
        }
        cfg.inputQueuePolicy = *parsed;
    }
    cfg.inputQueueCapacity =
        config.getOr<unsigned int>("gateway.input_queue.capacity", cfg.inputQueueCapacity);

    cfg.commandRateCapacity =
        config.getOr<unsigned int>("gateway.command_rate.capacity", cfg.commandRateCapacity);
    cfg.commandRateRefillPerSecond = config.getOr<unsigned int>(
        "gateway.command_rate.refill_per_second", cfg.commandRateRefillPerSecond);

    cfg.maxInputBytes = config.getOr<unsigned int>("gateway.max_input_bytes", cfg.maxInputBytes);
    if (cfg.maxInputBytes == 0) {
        return Out::err(invalid("gateway.max_input_bytes", "must be positive"));
    }

    cfg.outputBudgetBytes = config.getOr<unsigned int>("gateway.output_budget.capacity_bytes",
                                                       cfg.outputBudgetBytes);
    cfg.outputRefillBytesPerSecond = config.getOr<unsigned int>(
        "gateway.output_budget.refill_bytes_per_second", cfg.outputRefillBytesPerSecond);
    cfg.outputMaxPendingBytes = config.getOr<unsigned int>(
        "gateway.output_budget.max_pending_bytes", cfg.outputMaxPendingBytes);

    auto overflow = config.get<std::string>("gateway.output_budget.overflow");
    if (overflow) {
        auto parsed = parseOutputOverflowPolicy(overflow.value());
        if (!parsed) {
            return Out::err(invalid("gateway.output_budget.overflow", overflow.value()));
        }
        cfg.outputOverflowPolicy = *parsed;
    }

    auto idleTimeout = config.get<int>("gateway.idle_timeout_seconds");
    if (idleTimeout) {
        cfg.idleTimeout = std::chrono::seconds(idleTimeout.value());
    }

    auto attachTimeout = config.get<int>("gateway.engine.attach_timeout_seconds");
    if (attachTimeout) {
        cfg.attachTimeout = std::chrono::seconds(attachTimeout.value());
    }

    auto stopTimeout = config.get<int>("gateway.engine.stop_timeout_seconds");
    if (stopTimeout) {
        cfg.stopTimeout = std::chrono::seconds(stopTimeout.value());
    }

    auto tick = config.get<int>("gateway.tick_interval_ms");
    if (tick) {
        if (tick.value() <= 0) {
            return Out::err(invalid("gateway.tick_interval_ms", std::to_string(tick.value())));
        }
        cfg.tickInterval = std::chrono::milliseconds(tick.value());
    }

    cfg.autostartEngine = config.getOr<bool>("gateway.engine.autostart", cfg.autostartEngine);

    auto command = config.get<std::vector<std::string>>("gateway.engine.command");
    if (command) {
        cfg.engineLaunch.argv = std::move(command).value();
    } else if (config.hasKey("gateway.engine.command")) {
        return Out::err(invalid("gateway.engine.command", "expected a list of arguments"));
    }
    cfg.engineLaunch.workingDirectory =
        config.getOr<std::string>("gateway.engine.working_directory", "");

    cfg.restartingNotice = config.getOr<std::string>("gateway.notices.restarting",
                                                     cfg.restartingNotice);
    cfg.unavailableNotice = config.getOr<std::string>("gateway.notices.unavailable",
                                                      cfg.unavailableNotice);
    cfg.rateLimitNotice = config.getOr<std::string>("gateway.notices.rate_limited",
                                                    cfg.rateLimitNotice);
    cfg.inputTooLargeNotice = config.getOr<std::string>("gateway.notices.input_too_large",
                                                        cfg.inputTooLargeNotice);

    return Out::ok(std::move(cfg));
}

// -- Engine -------------------------------------------------------------------

ServiceResult<EngineConfig> buildEngineConfig(const ConfigManager& config) {
    using Out = ServiceResult<EngineConfig>;
    EngineConfig cfg;

    cfg.gatewayHost = config.getOr<std::string>("engine.gateway_host", cfg.gatewayHost);

    auto controlPort = readPort(config, "gateway.control_port", cfg.gatewayPort);
    if (!controlPort) {
        return Out::err(controlPort.error());
    }
    auto port = readPort(config, "engine.gateway_port", controlPort.value());
    if (!port) {
        return Out::err(port.error());
    }
    cfg.gatewayPort = port.value();

    cfg.name = config.getOr<std::string>("engine.name", cfg.name);

    auto initial = config.get<int>("engine.connect.initial_backoff_ms");
    if (initial) {
        cfg.initialBackoff = std::chrono::milliseconds(initial.value());
    }
    auto maxBackoff = config.get<int>("engine.connect.max_backoff_ms");
    if (maxBackoff) {
        cfg.maxBackoff = std::chrono::milliseconds(maxBackoff.value());
    }
    if (cfg.initialBackoff.count() <= 0 || cfg.maxBackoff < cfg.initialBackoff) {
        return Out::err(invalid("engine.connect", "backoff must be positive and max >= initial"));
    }
    auto deadline = config.get<int>("engine.connect.deadline_seconds");
    if (deadline) {
        cfg.connectDeadline = std::chrono::seconds(deadline.value());
    }

    auto workers = config.get<unsigned int>("engine.worker_threads");
    if (workers) {
        if (workers.value() == 0) {
            return Out::err(invalid("engine.worker_threads", "must be positive"));
        }
        cfg.workerThreads = workers.value();
    }

    auto drain = config.get<int>("engine.drain_timeout_ms");
    if (drain) {
        cfg.drainTimeout = std::chrono::milliseconds(drain.value());
    }

    cfg.policy.maxSessionsPerAccount = config.getOr<unsigned int>(
        "engine.policy.max_sessions_per_account", cfg.policy.maxSessionsPerAccount);
    cfg.policy.autoBindPuppet =
        config.getOr<bool>("engine.policy.auto_bind_puppet", cfg.policy.autoBindPuppet);
    cfg.policy.autoCreatePuppet =
        config.getOr<bool>("engine.policy.auto_create_puppet", cfg.policy.autoCreatePuppet);

    return Out::ok(std::move(cfg));
}

// -- Launcher -----------------------------------------------------------------

ServiceResult<LauncherConfig> buildLauncherConfig(const ConfigManager& config) {
    using Out = ServiceResult<LauncherConfig>;
    LauncherConfig cfg;

    cfg.gatewayHost = config.getOr<std::string>("launcher.host", cfg.gatewayHost);

    auto controlPort = readPort(config, "gateway.control_port", cfg.gatewayPort);
    if (!controlPort) {
        return Out::err(controlPort.error());
    }
    auto port = readPort(config, "launcher.port", controlPort.value());
    if (!port) {
        return Out::err(port.error());
    }
    cfg.gatewayPort = port.value();

    auto timeout = config.get<int>("launcher.timeout_seconds");
    if (timeout) {
        if (timeout.value() <= 0) {
            return Out::err(invalid("launcher.timeout_seconds", std::to_string(timeout.value())));
        }
        cfg.timeout = std::chrono::seconds(timeout.value());
    }

    auto connectTimeout = config.get<int>("launcher.connect_timeout_ms");
    if (connectTimeout) {
        cfg.connectTimeout = std::chrono::milliseconds(connectTimeout.value());
    }

    return Out::ok(std::move(cfg));
}

// -- Logging ------------------------------------------------------------------

ServiceResult<void> applyLoggingConfig(const ConfigManager& config) {
    using sgw::foundation::kLogCategoryCount;
    using sgw::foundation::logCategoryName;
    using sgw::foundation::parseLogLevel;
    auto& logger = sgw::foundation::ServiceLogger::instance();

    auto level = config.get<std::string>("logging.level");
    if (level) {
        auto parsed = parseLogLevel(level.value());
        if (!parsed) {
            return ServiceResult<void>::err(invalid("logging.level", level.value()));
        }
        logger.setAllLevels(*parsed);
    }

    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        auto cat = static_cast<LogCategory>(i);
        std::string key = "logging.categories." + std::string(logCategoryName(cat));
        auto catLevel = config.get<std::string>(key);
        if (!catLevel) {
            continue;
        }
        auto parsed = parseLogLevel(catLevel.value());
        if (!parsed) {
            return ServiceResult<void>::err(invalid(key, catLevel.value()));
        }
        logger.setCategoryLevel(cat, *parsed);
    }
    return ServiceResult<void>::ok();
}

} // namespace sgw::service
