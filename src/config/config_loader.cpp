#include "orca/config/service_config.hpp"

#include "orca/automations/serializer.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <set>

namespace orca::config {

namespace fs = std::filesystem;

static nlohmann::json scalar_to_json(const YAML::Node& node) {
    const std::string& text = node.Scalar();

    // Quoted scalars carry the non-specific "!" tag
    if (node.Tag() == "!") {
        return text;
    }

    if (text == "true" || text == "True" || text == "TRUE") {
        return true;
    }
    if (text == "false" || text == "False" || text == "FALSE") {
        return false;
    }
    if (text == "null" || text == "~" || text.empty()) {
        return nullptr;
    }

    char* end = nullptr;
    errno = 0;
    const long long integer = std::strtoll(text.c_str(), &end, 10);
    if (end && *end == '\0' && errno == 0) {
        return integer;
    }

    end = nullptr;
    const double number = std::strtod(text.c_str(), &end);
    if (end && *end == '\0') {
        return number;
    }

    return text;
}

nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;

        case YAML::NodeType::Scalar:
            return scalar_to_json(node);

        case YAML::NodeType::Sequence: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto& item : node) {
                array.push_back(yaml_to_json(item));
            }
            return array;
        }

        case YAML::NodeType::Map: {
            nlohmann::json object = nlohmann::json::object();
            for (const auto& entry : node) {
                object[entry.first.Scalar()] = yaml_to_json(entry.second);
            }
            return object;
        }
    }
    return nullptr;
}

template <typename T>
static void maybe_set(const YAML::Node& section, const char* key, T& out) {
    if (!section || !section[key]) {
        return;
    }
    out = section[key].as<T>();
}

static Result<std::vector<automations::Automation>, Error> decode_automations(const YAML::Node& node) {
    std::vector<automations::Automation> result;
    if (!node) {
        return Ok(result);
    }
    if (!node.IsSequence()) {
        return Err<std::vector<automations::Automation>>(
            Error::configuration("'automations' must be a list"));
    }

    for (std::size_t i = 0; i < node.size(); ++i) {
        auto decoded = automations::automation_from_json(yaml_to_json(node[i]));
        if (decoded.is_error()) {
            return Err<std::vector<automations::Automation>>(Error::configuration(
                "automations[" + std::to_string(i) + "]: " + decoded.error().message));
        }
        result.push_back(decoded.take_value());
    }
    return Ok(result);
}

static Result<ServiceConfig, Error> from_yaml(const YAML::Node& root) {
    ServiceConfig config;
    if (!root || root.IsNull()) {
        return Ok(config);
    }
    if (!root.IsMap()) {
        return Err<ServiceConfig>(Error::configuration("configuration root must be a mapping"));
    }

    try {
        const auto server = root["server"];
        maybe_set(server, "address", config.server.address);
        maybe_set(server, "port", config.server.port);
        maybe_set(server, "threads", config.server.threads);

        const auto engine = root["engine"];
        maybe_set(engine, "workers", config.engine.workers);
        maybe_set(engine, "shards", config.engine.shards);
        maybe_set(engine, "sweep_interval_ms", config.engine.sweep_interval_ms);

        const auto actions = root["actions"];
        maybe_set(actions, "workers", config.actions.workers);
        maybe_set(actions, "event_namespace", config.actions.event_namespace);

        const auto storage = root["storage"];
        maybe_set(storage, "page_size", config.storage.page_size);
        maybe_set(storage, "page_token_ttl_s", config.storage.page_token_ttl_s);

        const auto logging = root["logging"];
        maybe_set(logging, "level", config.logging.level);
        maybe_set(logging, "pattern", config.logging.pattern);
    } catch (const YAML::Exception& e) {
        return Err<ServiceConfig>(Error::configuration(std::string("invalid setting: ") + e.what()));
    }

    auto decoded = decode_automations(root["automations"]);
    if (decoded.is_error()) {
        return Err<ServiceConfig>(decoded.error());
    }
    config.automations = decoded.take_value();

    auto valid = validate(config);
    if (valid.is_error()) {
        return Err<ServiceConfig>(valid.error());
    }
    return Ok(config);
}

Result<ServiceConfig, Error> parse_config(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        return Err<ServiceConfig>(Error::parse_error(std::string("YAML parse error: ") + e.what()));
    }
    return from_yaml(root);
}

Result<ServiceConfig, Error> load_config(const std::string& path) {
    if (!fs::exists(path)) {
        return Err<ServiceConfig>(Error::not_found("config not found: " + path));
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        return Err<ServiceConfig>(Error::parse_error("YAML parse error in " + path + ": " + e.what()));
    }

    auto config = from_yaml(root);
    if (config.is_ok()) {
        spdlog::debug("[Config] loaded {} with {} automations", path, config.value().automations.size());
    }
    return config;
}

Result<void, Error> validate(const ServiceConfig& config) {
    if (config.server.threads == 0) {
        return Err<void>(Error::configuration("server.threads must be at least 1"));
    }
    if (config.engine.workers == 0) {
        return Err<void>(Error::configuration("engine.workers must be at least 1"));
    }
    if (config.engine.shards == 0) {
        return Err<void>(Error::configuration("engine.shards must be at least 1"));
    }
    if (config.engine.sweep_interval_ms <= 0) {
        return Err<void>(Error::configuration("engine.sweep_interval_ms must be positive"));
    }
    if (config.actions.workers == 0) {
        return Err<void>(Error::configuration("actions.workers must be at least 1"));
    }
    if (config.actions.event_namespace.empty()) {
        return Err<void>(Error::configuration("actions.event_namespace must not be empty"));
    }
    if (config.storage.page_size == 0 || config.storage.page_size > 50) {
        return Err<void>(Error::configuration("storage.page_size must be between 1 and 50"));
    }
    if (config.storage.page_token_ttl_s <= 0) {
        return Err<void>(Error::configuration("storage.page_token_ttl_s must be positive"));
    }

    std::set<std::string> ids;
    for (const auto& automation : config.automations) {
        auto valid = automations::validate(automation);
        if (valid.is_error()) {
            return Err<void>(Error::configuration(
                "automation '" + automation.name + "': " + valid.error().message));
        }
        if (!automation.id.empty() && !ids.insert(automation.id).second) {
            return Err<void>(Error::configuration("duplicate automation id " + automation.id));
        }
    }
    return Ok();
}

} // namespace orca::config
