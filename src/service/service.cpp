#include "orca/service/service.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace orca::service {

OrcaService::OrcaService(config::ServiceConfig config)
    : config_(std::move(config))
    , logger_(bus_)
    , metrics_(bus_)
    , registry_(&bus_)
    , store_(std::chrono::seconds(config_.storage.page_token_ttl_s))
    , engine_(registry_, triggers::EngineOptions{config_.engine.shards}, &bus_)
    , executor_(orchestrator_,
                notifications_,
                [this](const events::Event& outcome) {
                    auto published = pipeline_.publish(outcome, "action");
                    if (published.is_error()) {
                        spdlog::error("[Service] outcome event={} not published: {}",
                                      outcome.id, published.error().message);
                    }
                },
                actions::ExecutorOptions{config_.actions.workers, config_.actions.event_namespace},
                &bus_)
    , pipeline_(registry_,
                store_,
                engine_,
                executor_,
                PipelineOptions{config_.engine.workers,
                                std::chrono::milliseconds(config_.engine.sweep_interval_ms)},
                &bus_) {
    engine_.set_evaluation_hook([](const automations::Automation& automation, const events::Event& event) {
        spdlog::trace("[Engine] evaluating automation={} event={} name={}",
                      automation.id, event.id, event.event);
    });
}

OrcaService::~OrcaService() {
    stop();
}

Result<void, Error> OrcaService::start() {
    if (started_) {
        return Ok();
    }

    for (const auto& automation : config_.automations) {
        auto created = registry_.create(automation);
        if (created.is_error()) {
            return Err<void>(Error::configuration(
                "automation '" + automation.name + "': " + created.error().message));
        }
        spdlog::info("[Service] automation '{}' installed as {}", automation.name, created.value().id);
    }

    executor_.start();
    pipeline_.start();
    started_ = true;
    return Ok();
}

void OrcaService::stop() {
    if (!started_) {
        return;
    }
    pipeline_.stop();
    executor_.stop();
    started_ = false;
}

} // namespace orca::service
