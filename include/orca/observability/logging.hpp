#pragma once

#include "orca/config/service_config.hpp"

#include <string>

namespace orca::observability {

/**
 * @brief Install the "orca" stdout logger as spdlog's default
 *
 * ORCA_LOG_LEVEL and ORCA_LOG_PATTERN override logging.level and
 * logging.pattern from the configuration.
 */
void init_logging(const config::LoggingConfig& config);

void shutdown_logging();

// Effective settings after environment overrides
std::string resolve_level(const config::LoggingConfig& config);
std::string resolve_pattern(const config::LoggingConfig& config);

} // namespace orca::observability
