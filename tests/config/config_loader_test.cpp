#include <gtest/gtest.h>
#include "orca/config/service_config.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>

using namespace orca;
using namespace orca::config;

namespace {

const char* kFullConfig = R"(
server:
  address: 127.0.0.1
  port: 8080
  threads: 4
engine:
  workers: 8
  shards: 32
  sweep_interval_ms: 250
actions:
  workers: 3
  event_namespace: acme
storage:
  page_size: 25
  page_token_ttl_s: 60
logging:
  level: debug
automations:
  - id: crash-loop
    name: cancel-crash-loops
    trigger:
      match:
        prefect.resource.id: prefect.flow-run.*
      expect: [prefect.flow-run.Crashed]
      threshold: 3
      within: 600
    actions:
      - type: cancel-flow-run
  - name: stuck-runs
    trigger:
      posture: Proactive
      after: [prefect.flow-run.Running]
      expect: [prefect.flow-run.Completed]
      within: 3600
    actions:
      - type: send-notification
        block_document_id: ops-email
)";

} // namespace

TEST(ConfigLoader, EmptyDocumentUsesDefaults) {
    auto parsed = parse_config("");

    ASSERT_TRUE(parsed.is_ok()) << parsed.error().message;
    const auto& cfg = parsed.value();
    EXPECT_EQ(cfg.server.address, "0.0.0.0");
    EXPECT_EQ(cfg.server.port, 4200);
    EXPECT_EQ(cfg.server.threads, 2u);
    EXPECT_EQ(cfg.engine.workers, 4u);
    EXPECT_EQ(cfg.engine.shards, 16u);
    EXPECT_EQ(cfg.engine.sweep_interval_ms, 1000);
    EXPECT_EQ(cfg.actions.workers, 2u);
    EXPECT_EQ(cfg.actions.event_namespace, "prefect-cloud");
    EXPECT_EQ(cfg.storage.page_size, 50u);
    EXPECT_EQ(cfg.storage.page_token_ttl_s, 3600);
    EXPECT_EQ(cfg.logging.level, "info");
    EXPECT_TRUE(cfg.automations.empty());
}

TEST(ConfigLoader, ReadsEverySection) {
    auto parsed = parse_config(kFullConfig);

    ASSERT_TRUE(parsed.is_ok()) << parsed.error().message;
    const auto& cfg = parsed.value();
    EXPECT_EQ(cfg.server.address, "127.0.0.1");
    EXPECT_EQ(cfg.server.port, 8080);
    EXPECT_EQ(cfg.server.threads, 4u);
    EXPECT_EQ(cfg.engine.workers, 8u);
    EXPECT_EQ(cfg.engine.shards, 32u);
    EXPECT_EQ(cfg.engine.sweep_interval_ms, 250);
    EXPECT_EQ(cfg.actions.workers, 3u);
    EXPECT_EQ(cfg.actions.event_namespace, "acme");
    EXPECT_EQ(cfg.storage.page_size, 25u);
    EXPECT_EQ(cfg.storage.page_token_ttl_s, 60);
    EXPECT_EQ(cfg.logging.level, "debug");

    ASSERT_EQ(cfg.automations.size(), 2u);
    const auto& crash = cfg.automations[0];
    EXPECT_EQ(crash.id, "crash-loop");
    EXPECT_EQ(crash.trigger.threshold, 3);
    EXPECT_EQ(crash.trigger.within, std::chrono::minutes(10));
    EXPECT_TRUE(std::holds_alternative<actions::CancelFlowRun>(crash.actions[0]));

    const auto& stuck = cfg.automations[1];
    EXPECT_TRUE(stuck.id.empty());
    EXPECT_EQ(stuck.trigger.posture, automations::Posture::Proactive);
    EXPECT_EQ(std::get<actions::SendNotification>(stuck.actions[0]).block_document_id, "ops-email");
}

TEST(ConfigLoader, LoadsFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "orca_config_loader_test.yaml";
    {
        std::ofstream out(path);
        out << kFullConfig;
    }

    auto loaded = load_config(path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(loaded.is_ok()) << loaded.error().message;
    EXPECT_EQ(loaded.value().server.port, 8080);
    EXPECT_EQ(loaded.value().automations.size(), 2u);
}

TEST(ConfigLoader, MissingFileIsNotFound) {
    auto loaded = load_config("/nonexistent/orca/config.yaml");

    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error().code, ErrorCode::NotFound);
}

TEST(ConfigLoader, MalformedYamlIsParseError) {
    auto parsed = parse_config("server: [unterminated");

    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().code, ErrorCode::ParseError);
}

TEST(ConfigLoader, RejectsOutOfRangeSettings) {
    EXPECT_EQ(parse_config("storage:\n  page_size: 0\n").error().code, ErrorCode::Configuration);
    EXPECT_EQ(parse_config("storage:\n  page_size: 51\n").error().code, ErrorCode::Configuration);
    EXPECT_EQ(parse_config("engine:\n  workers: 0\n").error().code, ErrorCode::Configuration);
    EXPECT_EQ(parse_config("actions:\n  workers: 0\n").error().code, ErrorCode::Configuration);
    EXPECT_EQ(parse_config("server:\n  port: not-a-port\n").error().code, ErrorCode::Configuration);
    EXPECT_EQ(parse_config("- just\n- a list\n").error().code, ErrorCode::Configuration);
}

TEST(ConfigLoader, RejectsBadAutomations) {
    auto unknown_action = parse_config(R"(
automations:
  - name: bad
    trigger:
      expect: [x]
    actions:
      - type: launch-rockets
)");
    ASSERT_TRUE(unknown_action.is_error());
    EXPECT_EQ(unknown_action.error().code, ErrorCode::Configuration);
    EXPECT_EQ(unknown_action.error().message.rfind("automations[0]: ", 0), 0u);

    auto duplicate = parse_config(R"(
automations:
  - id: same
    name: one
    trigger: {expect: [x]}
    actions: []
  - id: same
    name: two
    trigger: {expect: [y]}
    actions: []
)");
    ASSERT_TRUE(duplicate.is_error());
    EXPECT_NE(duplicate.error().message.find("duplicate automation id"), std::string::npos);
}

TEST(ConfigLoader, YamlScalarsBecomeTypedJson) {
    auto node = YAML::Load(R"(
count: 3
ratio: 0.5
flag: true
empty: ~
quoted: "42"
word: hello
list: [1, two]
)");

    auto j = yaml_to_json(node);
    EXPECT_EQ(j["count"], 3);
    EXPECT_EQ(j["ratio"], 0.5);
    EXPECT_EQ(j["flag"], true);
    EXPECT_TRUE(j["empty"].is_null());
    EXPECT_EQ(j["quoted"], "42");
    EXPECT_EQ(j["word"], "hello");
    ASSERT_TRUE(j["list"].is_array());
    EXPECT_EQ(j["list"][0], 1);
    EXPECT_EQ(j["list"][1], "two");
}
