#include <gtest/gtest.h>
#include "orca/actions/deployment_actions.hpp"
#include "orca/orchestration/in_memory_orchestrator.hpp"

using namespace orca;
using namespace orca::actions;
using orchestration::InMemoryOrchestrator;

namespace {

class NullSink : public NotificationSink {
public:
    Result<void, Error> send(const Notification&) override { return Ok(); }
};

struct Fixture {
    InMemoryOrchestrator orchestrator;
    NullSink sink;
    ActionContext context{orchestrator, sink, nullptr};

    Fixture() {
        orchestrator.add_deployment(orchestration::Deployment{"etl", "nightly-etl", "flow-1", false});
        orchestrator.add_deployment(orchestration::Deployment{"report", "weekly-report", "flow-2", true});
    }
};

automations::TriggeredAction triggered_for(const std::string& resource_id) {
    automations::TriggeredAction triggered;
    triggered.id = "invocation-1";
    triggered.automation.id = "auto-1";
    triggered.automation.name = "deployments";
    triggered.triggering_labels = {{events::kResourceId, resource_id}};
    return triggered;
}

} // namespace

TEST(DeploymentActions, RunCreatesFlowRun) {
    Fixture f;
    RunDeployment spec;
    spec.deployment_id = "etl";
    spec.parameters = {{"date", "2024-05-01"}};
    RunDeploymentAction action(f.context, spec);

    auto result = action.act(triggered_for("prefect.flow-run.unrelated"));

    ASSERT_TRUE(result.is_ok()) << result.error().reason;
    EXPECT_EQ(result.value().status_code, 201);
    EXPECT_EQ(f.orchestrator.flow_run_count(), 1u);

    const auto& related = action.resulting_related();
    ASSERT_EQ(related.size(), 2u);
    EXPECT_EQ(related[0].id(), "prefect.deployment.etl");
    EXPECT_EQ(related[0].role(), "target");
    EXPECT_EQ(related[1].role(), "flow-run");

    auto flow_run_id = orchestration::flow_run_id_from_resource(related[1].id());
    ASSERT_TRUE(flow_run_id.has_value());
    auto run = f.orchestrator.read_flow_run(*flow_run_id);
    ASSERT_TRUE(run.is_ok());
    EXPECT_EQ(run.value().deployment_id, "etl");
    EXPECT_EQ(run.value().state.type, orchestration::StateType::Scheduled);
}

TEST(DeploymentActions, RunReinvokedWithSameIdReusesFlowRun) {
    Fixture f;
    RunDeployment spec;
    spec.deployment_id = "etl";
    RunDeploymentAction first(f.context, spec);
    RunDeploymentAction again(f.context, spec);
    const auto triggered = triggered_for("prefect.flow-run.unrelated");

    auto created = first.act(triggered);
    auto repeated = again.act(triggered);

    ASSERT_TRUE(created.is_ok());
    ASSERT_TRUE(repeated.is_ok());
    EXPECT_EQ(created.value().status_code, 201);
    EXPECT_EQ(repeated.value().status_code, 200);
    EXPECT_EQ(f.orchestrator.flow_run_count(), 1u);
    EXPECT_EQ(first.resulting_related()[1].id(), again.resulting_related()[1].id());

    auto other = triggered;
    other.id = "invocation-2";
    RunDeploymentAction next(f.context, spec);
    ASSERT_TRUE(next.act(other).is_ok());
    EXPECT_EQ(f.orchestrator.flow_run_count(), 2u);
}

TEST(DeploymentActions, RunInfersDeploymentFromFiring) {
    Fixture f;
    RunDeploymentAction action(f.context, RunDeployment{});

    auto result = action.act(triggered_for("prefect.deployment.report"));

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(action.resulting_related()[0].id(), "prefect.deployment.report");
}

TEST(DeploymentActions, RunFailsForUnknownDeployment) {
    Fixture f;
    RunDeployment spec;
    spec.deployment_id = "missing";
    RunDeploymentAction action(f.context, spec);

    auto result = action.act(triggered_for("prefect.flow-run.x"));

    ASSERT_TRUE(result.is_error());
    EXPECT_NE(result.error().reason.find("missing"), std::string::npos);
    EXPECT_EQ(f.orchestrator.flow_run_count(), 0u);
}

TEST(DeploymentActions, RunFailsWithoutTarget) {
    Fixture f;
    RunDeploymentAction action(f.context, RunDeployment{});

    auto result = action.act(triggered_for("prefect.flow-run.x"));

    ASSERT_TRUE(result.is_error());
    EXPECT_NE(result.error().reason.find("No deployment could be inferred"), std::string::npos);
}

TEST(DeploymentActions, PauseAndResume) {
    Fixture f;
    PauseDeploymentAction pause(f.context, std::nullopt);

    auto paused = pause.act(triggered_for("prefect.deployment.etl"));
    ASSERT_TRUE(paused.is_ok());
    EXPECT_EQ(paused.value().status_code, 201);
    EXPECT_TRUE(f.orchestrator.read_deployment("etl").value().paused);

    PauseDeploymentAction pause_again(f.context, std::nullopt);
    EXPECT_EQ(pause_again.act(triggered_for("prefect.deployment.etl")).value().status_code, 200);

    ResumeDeploymentAction resume(f.context, std::string("etl"));
    auto resumed = resume.act(triggered_for("prefect.flow-run.x"));
    ASSERT_TRUE(resumed.is_ok());
    EXPECT_EQ(resumed.value().status_code, 201);
    EXPECT_FALSE(f.orchestrator.read_deployment("etl").value().paused);
}

TEST(DeploymentActions, ResumeOfActiveDeploymentIsNoop) {
    Fixture f;
    ResumeDeploymentAction resume(f.context, std::string("etl"));

    auto result = resume.act(triggered_for("prefect.flow-run.x"));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().status_code, 200);
}

TEST(DeploymentActions, PauseFailsForUnknownDeployment) {
    Fixture f;
    PauseDeploymentAction pause(f.context, std::string("ghost"));

    auto result = pause.act(triggered_for("prefect.flow-run.x"));
    ASSERT_TRUE(result.is_error());
    EXPECT_NE(result.error().reason.find("could not be read"), std::string::npos);
}
