#include "orca/observability/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>

namespace orca::observability {

namespace {

constexpr const char* kLoggerName = "orca";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

} // namespace

std::string resolve_level(const config::LoggingConfig& config) {
    if (const char* level = std::getenv("ORCA_LOG_LEVEL")) {
        return level;
    }
    if (!config.level.empty()) {
        return config.level;
    }
    return "info";
}

std::string resolve_pattern(const config::LoggingConfig& config) {
    if (const char* pattern = std::getenv("ORCA_LOG_PATTERN")) {
        return pattern;
    }
    if (!config.pattern.empty()) {
        return config.pattern;
    }
    return kDefaultPattern;
}

void init_logging(const config::LoggingConfig& config) {
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        logger = spdlog::stdout_color_mt(kLoggerName);
    }
    logger->set_pattern(resolve_pattern(config));

    const auto level_name = resolve_level(config);
    const auto level = spdlog::level::from_str(level_name);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && level_name != "off") {
        logger->set_level(spdlog::level::info);
        spdlog::set_default_logger(logger);
        spdlog::warn("Unknown log level '{}', using info", level_name);
    } else {
        logger->set_level(level);
        spdlog::set_default_logger(logger);
    }
    spdlog::flush_on(spdlog::level::warn);
}

void shutdown_logging() {
    spdlog::shutdown();
}

} // namespace orca::observability
