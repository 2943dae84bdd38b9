#pragma once

/// @file service_config.hpp
/// @brief Build the typed process configurations from a loaded ConfigManager.
///
/// Missing keys keep the struct defaults. Present keys with an invalid
/// value (unknown policy name, port out of range, malformed listener) are
/// reported as ConfigInvalidValue rather than silently ignored.

#include "sgw/foundation/config_manager.hpp"
#include "sgw/foundation/service_result.hpp"
#include "sgw/service/engine_types.hpp"
#include "sgw/service/gateway_types.hpp"
#include "sgw/service/launcher_client.hpp"

namespace sgw::service {

/// gateway.* keys.
[[nodiscard]] sgw::foundation::ServiceResult<GatewayConfig>
buildGatewayConfig(const sgw::foundation::ConfigManager& config);

/// engine.* keys. The gateway port falls back to gateway.control_port.
[[nodiscard]] sgw::foundation::ServiceResult<EngineConfig>
buildEngineConfig(const sgw::foundation::ConfigManager& config);

/// launcher.* keys. The port falls back to gateway.control_port.
[[nodiscard]] sgw::foundation::ServiceResult<LauncherConfig>
buildLauncherConfig(const sgw::foundation::ConfigManager& config);

/// Apply logging.level and logging.categories.<Category> to ServiceLogger.
[[nodiscard]] sgw::foundation::ServiceResult<void>
applyLoggingConfig(const sgw::foundation::ConfigManager& config);

} // namespace sgw::service
