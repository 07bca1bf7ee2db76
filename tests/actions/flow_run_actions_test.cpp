#include <gtest/gtest.h>
#include "orca/actions/flow_run_actions.hpp"
#include "orca/orchestration/in_memory_orchestrator.hpp"

#include <vector>

using namespace orca;
using namespace orca::actions;
using orchestration::InMemoryOrchestrator;
using orchestration::StateType;

namespace {

class RecordingSink : public NotificationSink {
public:
    Result<void, Error> send(const Notification& notification) override {
        sent.push_back(notification);
        return Ok();
    }
    std::vector<Notification> sent;
};

struct Fixture {
    InMemoryOrchestrator orchestrator;
    RecordingSink sink;
    std::vector<events::Event> emitted;
    ActionContext context{orchestrator, sink, [this](events::Event e) { emitted.push_back(std::move(e)); }};

    void add_run(const std::string& id, StateType type, const std::string& name) {
        orchestration::FlowRun run;
        run.id = id;
        run.flow_id = "flow-1";
        run.state.type = type;
        run.state.name = name;
        orchestrator.add_flow_run(run);
    }
};

automations::TriggeredAction triggered_for(const std::string& resource_id, ActionSpec spec) {
    automations::TriggeredAction triggered;
    triggered.id = "invocation-1";
    triggered.automation.id = "auto-1";
    triggered.automation.name = "stop-the-bleeding";
    triggered.triggering_labels = {{events::kResourceId, resource_id}};
    triggered.action = std::move(spec);
    return triggered;
}

} // namespace

TEST(FlowRunActions, SuspendPausesTheRun) {
    Fixture f;
    f.add_run("run-1", StateType::Running, "Running");
    SuspendFlowRunAction action(f.context);

    auto result = action.act(triggered_for("prefect.flow-run.run-1", SuspendFlowRun{}));

    ASSERT_TRUE(result.is_ok()) << result.error().reason;
    EXPECT_EQ(result.value().status_code, 201);
    auto run = f.orchestrator.read_flow_run("run-1");
    EXPECT_EQ(run.value().state.type, StateType::Paused);
    EXPECT_EQ(run.value().state.name, "Suspended");

    ASSERT_EQ(action.resulting_related().size(), 1u);
    EXPECT_EQ(action.resulting_related()[0].id(), "prefect.flow-run.run-1");
    EXPECT_EQ(action.resulting_related()[0].role(), "target");
}

TEST(FlowRunActions, SuspendOfSuspendedRunIsNoop) {
    Fixture f;
    f.add_run("run-1", StateType::Paused, "Suspended");
    SuspendFlowRunAction action(f.context);

    auto result = action.act(triggered_for("prefect.flow-run.run-1", SuspendFlowRun{}));

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().status_code, 200);
}

TEST(FlowRunActions, CancelMovesToCancelling) {
    Fixture f;
    f.add_run("run-1", StateType::Running, "Running");
    CancelFlowRunAction action(f.context);

    auto result = action.act(triggered_for("prefect.flow-run.run-1", CancelFlowRun{}));

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().status_code, 201);
    EXPECT_EQ(f.orchestrator.read_flow_run("run-1").value().state.type, StateType::Cancelling);
}

TEST(FlowRunActions, CancelLeavesCancelledRunAlone) {
    Fixture f;
    f.add_run("run-1", StateType::Cancelled, "Cancelled");
    CancelFlowRunAction action(f.context);

    auto result = action.act(triggered_for("prefect.flow-run.run-1", CancelFlowRun{}));

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().status_code, 200);
    EXPECT_EQ(f.orchestrator.read_flow_run("run-1").value().state.type, StateType::Cancelled);
}

TEST(FlowRunActions, ChangeStateUsesDefaultName) {
    Fixture f;
    f.add_run("run-1", StateType::Running, "Running");
    ChangeFlowRunState spec;
    spec.state = StateType::Failed;
    ChangeFlowRunStateAction action(f.context, spec);

    auto result = action.act(triggered_for("prefect.flow-run.run-1", spec));

    ASSERT_TRUE(result.is_ok());
    auto run = f.orchestrator.read_flow_run("run-1").value();
    EXPECT_EQ(run.state.type, StateType::Failed);
    EXPECT_EQ(run.state.name, "Failed");
    EXPECT_EQ(run.state.message, "State changed by Automation auto-1");
}

TEST(FlowRunActions, ChangeStateHonoursNameAndMessage) {
    Fixture f;
    f.add_run("run-1", StateType::Running, "Running");
    ChangeFlowRunState spec;
    spec.state = StateType::Cancelled;
    spec.name = "Timed out";
    spec.message = "ran too long";
    ChangeFlowRunStateAction action(f.context, spec);

    ASSERT_TRUE(action.act(triggered_for("prefect.flow-run.run-1", spec)).is_ok());
    auto run = f.orchestrator.read_flow_run("run-1").value();
    EXPECT_EQ(run.state.name, "Timed out");
    EXPECT_EQ(run.state.message, "ran too long");
}

TEST(FlowRunActions, InfersTargetFromTriggeringEvent) {
    Fixture f;
    f.add_run("run-2", StateType::Running, "Running");

    auto triggered = triggered_for("prefect.worker.w1", SuspendFlowRun{});
    events::Event event;
    event.id = "e-1";
    event.event = "prefect.worker.unhealthy";
    event.resource = events::Resource(events::Labels{{events::kResourceId, "prefect.worker.w1"}});
    event.related.push_back(events::Resource(events::Labels{
        {events::kResourceId, "prefect.flow-run.run-2"},
        {events::kResourceRole, "flow-run"}
    }));
    triggered.triggering_event = event;

    EXPECT_EQ(infer_resource(triggered, orchestration::kFlowRunPrefix), "prefect.flow-run.run-2");

    SuspendFlowRunAction action(f.context);
    ASSERT_TRUE(action.act(triggered).is_ok());
    EXPECT_EQ(f.orchestrator.read_flow_run("run-2").value().state.type, StateType::Paused);
}

TEST(FlowRunActions, LabelsTakePrecedenceOverEvent) {
    auto triggered = triggered_for("prefect.flow-run.from-labels", SuspendFlowRun{});
    events::Event event;
    event.resource = events::Resource(events::Labels{{events::kResourceId, "prefect.flow-run.from-event"}});
    triggered.triggering_event = event;

    EXPECT_EQ(infer_resource(triggered, orchestration::kFlowRunPrefix), "prefect.flow-run.from-labels");
    EXPECT_FALSE(infer_resource(triggered, orchestration::kDeploymentPrefix).has_value());
}

TEST(FlowRunActions, FailsWithoutTarget) {
    Fixture f;
    SuspendFlowRunAction action(f.context);

    auto result = action.act(triggered_for("prefect.worker.w1", SuspendFlowRun{}));

    ASSERT_TRUE(result.is_error());
    EXPECT_NE(result.error().reason.find("No flow run could be inferred"), std::string::npos);
    EXPECT_TRUE(action.resulting_related().empty());
}

TEST(FlowRunActions, FailsForUnknownRun) {
    Fixture f;
    SuspendFlowRunAction action(f.context);

    auto result = action.act(triggered_for("prefect.flow-run.ghost", SuspendFlowRun{}));

    ASSERT_TRUE(result.is_error());
    EXPECT_NE(result.error().reason.find("could not be read"), std::string::npos);
}

TEST(FlowRunActions, SucceedEmitsExecutedEvent) {
    Fixture f;
    f.add_run("run-1", StateType::Running, "Running");
    SuspendFlowRunAction action(f.context);
    auto triggered = triggered_for("prefect.flow-run.run-1", SuspendFlowRun{});

    auto result = action.act(triggered);
    ASSERT_TRUE(result.is_ok());
    action.succeed(triggered, result.value());

    ASSERT_EQ(f.emitted.size(), 1u);
    const auto& event = f.emitted[0];
    EXPECT_EQ(event.event, "prefect-cloud.automation.action.executed");
    EXPECT_EQ(event.resource.id(), "prefect-cloud.automation.auto-1");
    EXPECT_EQ(event.resource.get(events::kResourceName), "stop-the-bleeding");
    EXPECT_EQ(event.payload["action_type"], "suspend-flow-run");
    EXPECT_EQ(event.payload["status_code"], 201);
    EXPECT_EQ(event.payload["invocation"], "invocation-1");
    ASSERT_EQ(event.related.size(), 1u);
    EXPECT_EQ(event.related[0].role(), "target");
}
