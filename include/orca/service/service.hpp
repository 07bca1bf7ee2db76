#pragma once

/**
 * @file service.hpp
 * @brief Owns and wires every component of orca-server
 *
 * Construction order is dependency order: bus and its subscribers first,
 * then the registry and store, the engine, the executor, and the pipeline
 * that ties them together. Outcome events emitted by actions are published
 * back through the same pipeline as any external event.
 *
 * EXAMPLE:
 * OrcaService service(config);
 * auto started = service.start();   // installs configured automations
 * service.pipeline().publish(event, "http");
 */

#include "orca/actions/executor.hpp"
#include "orca/actions/notification_sink.hpp"
#include "orca/automations/registry.hpp"
#include "orca/config/service_config.hpp"
#include "orca/core/error.hpp"
#include "orca/core/result.hpp"
#include "orca/events/components.hpp"
#include "orca/events/event_bus.hpp"
#include "orca/orchestration/in_memory_orchestrator.hpp"
#include "orca/service/event_pipeline.hpp"
#include "orca/storage/memory_event_store.hpp"
#include "orca/triggers/trigger_engine.hpp"

namespace orca::service {

class OrcaService {
public:
    explicit OrcaService(config::ServiceConfig config);
    ~OrcaService();

    OrcaService(const OrcaService&) = delete;
    OrcaService& operator=(const OrcaService&) = delete;

    // Registers the configured automations, then starts executor and pipeline
    Result<void, Error> start();
    void stop();

    const config::ServiceConfig& config() const { return config_; }
    events::EventBus& bus() { return bus_; }
    const events::MetricsComponent& metrics() const { return metrics_; }
    automations::AutomationRegistry& registry() { return registry_; }
    storage::MemoryEventStore& store() { return store_; }
    orchestration::InMemoryOrchestrator& orchestrator() { return orchestrator_; }
    triggers::TriggerEngine& engine() { return engine_; }
    actions::ActionExecutor& executor() { return executor_; }
    EventPipeline& pipeline() { return pipeline_; }

private:
    config::ServiceConfig config_;
    events::EventBus bus_;
    events::LoggerComponent logger_;
    events::MetricsComponent metrics_;
    automations::AutomationRegistry registry_;
    storage::MemoryEventStore store_;
    orchestration::InMemoryOrchestrator orchestrator_;
    actions::LoggingNotificationSink notifications_;
    triggers::TriggerEngine engine_;
    actions::ActionExecutor executor_;
    EventPipeline pipeline_;
    bool started_ = false;
};

} // namespace orca::service
