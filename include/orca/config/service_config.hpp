#pragma once

/**
 * @file service_config.hpp
 * @brief orca-server configuration and its YAML loader
 *
 * Every field has a default, so an empty file (or no file) is a valid
 * configuration:
 *
 *   server:
 *     address: 0.0.0.0
 *     port: 4200
 *     threads: 2
 *   engine:
 *     workers: 4
 *     shards: 16
 *     sweep_interval_ms: 1000
 *   actions:
 *     workers: 2
 *     event_namespace: prefect-cloud
 *   storage:
 *     page_size: 50
 *     page_token_ttl_s: 3600
 *   logging:
 *     level: info
 *     pattern: "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v"
 *   automations:
 *     - name: cancel-stuck-runs
 *       trigger: {...}
 *       actions: [...]
 *
 * Automations are written in the same shape the HTTP API accepts; the
 * loader converts each YAML entry to JSON and decodes it with the
 * automation codec.
 */

#include "orca/automations/types.hpp"
#include "orca/core/error.hpp"
#include "orca/core/result.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <string>
#include <vector>

namespace orca::config {

struct ServerConfig {
    std::string address = "0.0.0.0";
    uint16_t port = 4200;
    std::size_t threads = 2;
};

struct EngineConfig {
    std::size_t workers = 4;
    std::size_t shards = 16;
    std::int64_t sweep_interval_ms = 1000;
};

struct ActionsConfig {
    std::size_t workers = 2;
    std::string event_namespace = "prefect-cloud";
};

struct StorageConfig {
    std::size_t page_size = 50;
    std::int64_t page_token_ttl_s = 3600;
};

struct LoggingConfig {
    std::string level = "info";
    std::string pattern;
};

struct ServiceConfig {
    ServerConfig server;
    EngineConfig engine;
    ActionsConfig actions;
    StorageConfig storage;
    LoggingConfig logging;
    std::vector<automations::Automation> automations;
};

Result<ServiceConfig, Error> load_config(const std::string& path);

// Same as load_config for YAML held in memory
Result<ServiceConfig, Error> parse_config(const std::string& yaml_text);

// Range checks on the numeric settings and on every configured automation
Result<void, Error> validate(const ServiceConfig& config);

/**
 * @brief YAML tree to JSON
 *
 * Plain scalars become booleans, integers or floats when they read as
 * such; quoted scalars always stay strings.
 */
nlohmann::json yaml_to_json(const YAML::Node& node);

} // namespace orca::config
