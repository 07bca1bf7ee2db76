#include "orca/orchestration/in_memory_orchestrator.hpp"

#include "orca/core/ids.hpp"

#include <spdlog/spdlog.h>

#include <cctype>

namespace orca::orchestration {
namespace {

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.size() > prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

const char* to_string(StateType type) {
    switch (type) {
        case StateType::Scheduled: return "SCHEDULED";
        case StateType::Pending: return "PENDING";
        case StateType::Running: return "RUNNING";
        case StateType::Completed: return "COMPLETED";
        case StateType::Failed: return "FAILED";
        case StateType::Cancelled: return "CANCELLED";
        case StateType::Cancelling: return "CANCELLING";
        case StateType::Crashed: return "CRASHED";
        case StateType::Paused: return "PAUSED";
    }
    return "UNKNOWN";
}

std::string display_name(StateType type) {
    std::string name = to_string(type);
    for (std::size_t i = 1; i < name.size(); ++i) {
        name[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(name[i])));
    }
    return name;
}

std::optional<StateType> state_type_from_string(const std::string& text) {
    static const std::unordered_map<std::string, StateType> table{
        {"SCHEDULED", StateType::Scheduled},
        {"PENDING", StateType::Pending},
        {"RUNNING", StateType::Running},
        {"COMPLETED", StateType::Completed},
        {"FAILED", StateType::Failed},
        {"CANCELLED", StateType::Cancelled},
        {"CANCELLING", StateType::Cancelling},
        {"CRASHED", StateType::Crashed},
        {"PAUSED", StateType::Paused},
    };
    auto it = table.find(text);
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> flow_run_id_from_resource(const std::string& resource_id) {
    if (!starts_with(resource_id, kFlowRunPrefix)) {
        return std::nullopt;
    }
    return resource_id.substr(kFlowRunPrefix.size());
}

std::optional<std::string> deployment_id_from_resource(const std::string& resource_id) {
    if (!starts_with(resource_id, kDeploymentPrefix)) {
        return std::nullopt;
    }
    return resource_id.substr(kDeploymentPrefix.size());
}

void InMemoryOrchestrator::add_flow_run(FlowRun flow_run) {
    std::lock_guard lock(mutex_);
    flow_runs_[flow_run.id] = std::move(flow_run);
}

void InMemoryOrchestrator::add_deployment(Deployment deployment) {
    std::lock_guard lock(mutex_);
    deployments_[deployment.id] = std::move(deployment);
}

Result<FlowRun, Error> InMemoryOrchestrator::read_flow_run(const std::string& flow_run_id) {
    std::lock_guard lock(mutex_);
    auto it = flow_runs_.find(flow_run_id);
    if (it == flow_runs_.end()) {
        return Err<FlowRun>(Error::not_found("Flow run not found: " + flow_run_id));
    }
    return Ok(it->second);
}

Result<StateChange, Error> InMemoryOrchestrator::set_flow_run_state(const std::string& flow_run_id,
                                                                    const State& state,
                                                                    bool force) {
    std::lock_guard lock(mutex_);
    auto it = flow_runs_.find(flow_run_id);
    if (it == flow_runs_.end()) {
        return Err<StateChange>(Error::not_found("Flow run not found: " + flow_run_id));
    }

    State next = state;
    if (next.timestamp == TimePoint{}) {
        next.timestamp = now();
    }
    it->second.state = next;

    spdlog::debug("[Orchestrator] flow_run={} state={} name={} force={}",
                  flow_run_id, to_string(next.type), next.name, force);

    StateChange change;
    change.status_code = 201;
    change.state = next;
    return Ok(change);
}

Result<Deployment, Error> InMemoryOrchestrator::read_deployment(const std::string& deployment_id) {
    std::lock_guard lock(mutex_);
    auto it = deployments_.find(deployment_id);
    if (it == deployments_.end()) {
        return Err<Deployment>(Error::not_found("Deployment not found: " + deployment_id));
    }
    return Ok(it->second);
}

Result<FlowRunCreation, Error> InMemoryOrchestrator::create_flow_run(const std::string& deployment_id,
                                                                     const nlohmann::json& parameters,
                                                                     const std::string& idempotency_key) {
    std::lock_guard lock(mutex_);
    auto it = deployments_.find(deployment_id);
    if (it == deployments_.end()) {
        return Err<FlowRunCreation>(Error::not_found("Deployment not found: " + deployment_id));
    }

    if (!idempotency_key.empty()) {
        auto known = runs_by_key_.find(idempotency_key);
        if (known != runs_by_key_.end()) {
            auto existing = flow_runs_.find(known->second);
            if (existing != flow_runs_.end()) {
                return Ok(FlowRunCreation{200, existing->second});
            }
        }
    }

    FlowRun run;
    run.id = new_uuid();
    run.flow_id = it->second.flow_id;
    run.deployment_id = deployment_id;
    run.state.type = StateType::Scheduled;
    run.state.name = "Scheduled";
    run.state.timestamp = now();
    flow_runs_[run.id] = run;
    if (!idempotency_key.empty()) {
        runs_by_key_[idempotency_key] = run.id;
    }

    spdlog::debug("[Orchestrator] created flow_run={} deployment={} parameters={}",
                  run.id, deployment_id, parameters.dump());
    return Ok(FlowRunCreation{201, run});
}

Result<void, Error> InMemoryOrchestrator::set_deployment_paused(const std::string& deployment_id, bool paused) {
    std::lock_guard lock(mutex_);
    auto it = deployments_.find(deployment_id);
    if (it == deployments_.end()) {
        return Err<void>(Error::not_found("Deployment not found: " + deployment_id));
    }
    it->second.paused = paused;
    return Ok();
}

std::size_t InMemoryOrchestrator::flow_run_count() const {
    std::lock_guard lock(mutex_);
    return flow_runs_.size();
}

} // namespace orca::orchestration
