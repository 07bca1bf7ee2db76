#pragma once

#include "orca/orchestration/client.hpp"

#include <mutex>
#include <string>
#include <unordered_map>

namespace orca::orchestration {

/**
 * @brief Process-local stand-in for the orchestrated system
 *
 * Keeps flow runs and deployments in maps guarded by one mutex. Every
 * requested state is accepted; the orchestrated system's own transition
 * rules are outside this service.
 */
class InMemoryOrchestrator : public OrchestrationClient {
public:
    InMemoryOrchestrator() = default;

    InMemoryOrchestrator(const InMemoryOrchestrator&) = delete;
    InMemoryOrchestrator& operator=(const InMemoryOrchestrator&) = delete;

    void add_flow_run(FlowRun flow_run);
    void add_deployment(Deployment deployment);

    Result<FlowRun, Error> read_flow_run(const std::string& flow_run_id) override;

    Result<StateChange, Error> set_flow_run_state(const std::string& flow_run_id,
                                                  const State& state,
                                                  bool force) override;

    Result<Deployment, Error> read_deployment(const std::string& deployment_id) override;

    Result<FlowRunCreation, Error> create_flow_run(const std::string& deployment_id,
                                                   const nlohmann::json& parameters,
                                                   const std::string& idempotency_key) override;

    Result<void, Error> set_deployment_paused(const std::string& deployment_id, bool paused) override;

    std::size_t flow_run_count() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, FlowRun> flow_runs_;
    std::unordered_map<std::string, Deployment> deployments_;
    std::unordered_map<std::string, std::string> runs_by_key_;
};

} // namespace orca::orchestration
