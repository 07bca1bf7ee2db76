#pragma once

/**
 * @file client.hpp
 * @brief Contract with the orchestrated system
 *
 * The automation engine never changes run state itself; it only requests
 * transitions through this interface. Legality of those transitions is the
 * orchestrated system's business.
 *
 * Status codes mirror the orchestration API: 201 when a requested state
 * was accepted and written, 200 when nothing had to change.
 */

#include "orca/core/error.hpp"
#include "orca/core/result.hpp"
#include "orca/core/time.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace orca::orchestration {

inline const std::string kFlowRunPrefix = "prefect.flow-run.";
inline const std::string kDeploymentPrefix = "prefect.deployment.";

enum class StateType {
    Scheduled,
    Pending,
    Running,
    Completed,
    Failed,
    Cancelled,
    Cancelling,
    Crashed,
    Paused
};

const char* to_string(StateType type);

// Default state name, e.g. "Cancelled" for StateType::Cancelled
std::string display_name(StateType type);
std::optional<StateType> state_type_from_string(const std::string& text);

struct State {
    StateType type = StateType::Pending;
    std::string name;
    std::string message;
    TimePoint timestamp{};
};

struct FlowRun {
    std::string id;
    std::string flow_id;
    std::optional<std::string> deployment_id;
    State state;
};

struct Deployment {
    std::string id;
    std::string name;
    std::string flow_id;
    bool paused = false;
};

struct StateChange {
    int status_code = 200;
    State state;
};

// 201 for a new run, 200 when the idempotency key named an existing one
struct FlowRunCreation {
    int status_code = 201;
    FlowRun flow_run;
};

class OrchestrationClient {
public:
    virtual ~OrchestrationClient() = default;

    virtual Result<FlowRun, Error> read_flow_run(const std::string& flow_run_id) = 0;

    virtual Result<StateChange, Error> set_flow_run_state(const std::string& flow_run_id,
                                                          const State& state,
                                                          bool force) = 0;

    virtual Result<Deployment, Error> read_deployment(const std::string& deployment_id) = 0;

    /**
     * @brief Schedule a run of a deployment
     *
     * A second request carrying the same idempotency key returns the run the
     * first one created instead of scheduling another.
     */
    virtual Result<FlowRunCreation, Error> create_flow_run(const std::string& deployment_id,
                                                           const nlohmann::json& parameters,
                                                           const std::string& idempotency_key) = 0;

    virtual Result<void, Error> set_deployment_paused(const std::string& deployment_id, bool paused) = 0;
};

// "prefect.flow-run.<id>" -> "<id>"; nullopt for any other resource kind
std::optional<std::string> flow_run_id_from_resource(const std::string& resource_id);
std::optional<std::string> deployment_id_from_resource(const std::string& resource_id);

} // namespace orca::orchestration
