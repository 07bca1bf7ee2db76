#include <gtest/gtest.h>
#include "orca/automations/registry.hpp"
#include "orca/triggers/trigger_engine.hpp"

#include <chrono>

using namespace orca;
using namespace orca::triggers;
using automations::Automation;
using automations::AutomationRegistry;
using automations::Posture;
using std::chrono::minutes;
using std::chrono::seconds;

namespace {

const TimePoint kBase{seconds(1714521600)};

events::Event run_event(const std::string& id, const std::string& state, TimePoint occurred,
                        const std::string& resource_id = "prefect.flow-run.a") {
    events::Event event;
    event.id = id;
    event.event = "prefect.flow-run." + state;
    event.occurred = occurred;
    event.resource = events::Resource(events::Labels{{events::kResourceId, resource_id}});
    return event;
}

// "expected Completed within 10 minutes of Running"
Automation stuck_runs(const std::string& id, int threshold = 1) {
    Automation automation;
    automation.id = id;
    automation.name = "stuck-runs";
    automation.trigger.posture = Posture::Proactive;
    automation.trigger.match = {{events::kResourceId, {"prefect.flow-run.*"}}};
    automation.trigger.after = {"prefect.flow-run.Running"};
    automation.trigger.expect = {"prefect.flow-run.Completed"};
    automation.trigger.threshold = threshold;
    automation.trigger.within = minutes(10);
    return automation;
}

} // namespace

TEST(ProactiveTrigger, FiresOnceWhenDeadlinePasses) {
    AutomationRegistry registry;
    ASSERT_TRUE(registry.create(stuck_runs("a-1")).is_ok());
    TriggerEngine engine(registry);

    EXPECT_TRUE(engine.observe(run_event("e-1", "Running", kBase)).empty());
    EXPECT_TRUE(engine.tick(kBase + minutes(5)).empty());

    auto firings = engine.tick(kBase + minutes(10));
    ASSERT_EQ(firings.size(), 1u);
    EXPECT_EQ(firings[0].automation_id, "a-1");
    EXPECT_FALSE(firings[0].triggering_event.has_value());
    EXPECT_EQ(firings[0].triggering_labels.at(events::kResourceId), "prefect.flow-run.a");
    EXPECT_EQ(firings[0].triggered, kBase + minutes(10));

    EXPECT_TRUE(engine.tick(kBase + minutes(20)).empty());
}

TEST(ProactiveTrigger, ExpectedEventResolvesDeadline) {
    AutomationRegistry registry;
    registry.create(stuck_runs("a-1"));
    TriggerEngine engine(registry);

    engine.observe(run_event("e-1", "Running", kBase));
    EXPECT_TRUE(engine.observe(run_event("e-2", "Completed", kBase + minutes(3))).empty());

    EXPECT_TRUE(engine.tick(kBase + minutes(10)).empty());
    EXPECT_TRUE(engine.tick(kBase + minutes(30)).empty());
}

TEST(ProactiveTrigger, ExpectedEventAfterDeadlineDoesNotResolve) {
    AutomationRegistry registry;
    registry.create(stuck_runs("a-1"));
    TriggerEngine engine(registry);

    engine.observe(run_event("e-1", "Running", kBase));
    engine.observe(run_event("e-2", "Completed", kBase + minutes(11)));

    EXPECT_EQ(engine.tick(kBase + minutes(11)).size(), 1u);
}

TEST(ProactiveTrigger, ThresholdNeedsEnoughExpectedEvents) {
    AutomationRegistry registry;
    registry.create(stuck_runs("a-1", 2));
    TriggerEngine engine(registry);

    engine.observe(run_event("e-1", "Running", kBase, "prefect.flow-run.a"));
    engine.observe(run_event("e-2", "Completed", kBase + minutes(1), "prefect.flow-run.a"));

    engine.observe(run_event("e-3", "Running", kBase, "prefect.flow-run.b"));
    engine.observe(run_event("e-4", "Completed", kBase + minutes(1), "prefect.flow-run.b"));
    engine.observe(run_event("e-5", "Completed", kBase + minutes(2), "prefect.flow-run.b"));

    auto firings = engine.tick(kBase + minutes(10));
    ASSERT_EQ(firings.size(), 1u);
    EXPECT_EQ(firings[0].triggering_labels.at(events::kResourceId), "prefect.flow-run.a");
}

TEST(ProactiveTrigger, LaterAfterEventRestartsDeadline) {
    AutomationRegistry registry;
    registry.create(stuck_runs("a-1"));
    TriggerEngine engine(registry);

    engine.observe(run_event("e-1", "Running", kBase));
    engine.observe(run_event("e-2", "Running", kBase + minutes(5)));

    EXPECT_TRUE(engine.tick(kBase + minutes(10)).empty());
    EXPECT_EQ(engine.tick(kBase + minutes(15)).size(), 1u);
}

TEST(ProactiveTrigger, HeartbeatRearmsOnEveryExpectedEvent) {
    AutomationRegistry registry;
    Automation automation;
    automation.id = "a-1";
    automation.name = "worker-heartbeat";
    automation.trigger.posture = Posture::Proactive;
    automation.trigger.match = {{events::kResourceId, {"prefect.worker.*"}}};
    automation.trigger.expect = {"prefect.worker.heartbeat"};
    automation.trigger.within = minutes(10);
    registry.create(automation);
    TriggerEngine engine(registry);

    auto beat = [](const std::string& id, TimePoint at) {
        events::Event event;
        event.id = id;
        event.event = "prefect.worker.heartbeat";
        event.occurred = at;
        event.resource = events::Resource(events::Labels{{events::kResourceId, "prefect.worker.w1"}});
        return event;
    };

    engine.observe(beat("h-1", kBase));
    engine.observe(beat("h-2", kBase + minutes(8)));

    EXPECT_TRUE(engine.tick(kBase + minutes(10)).empty());
    auto firings = engine.tick(kBase + minutes(18));
    ASSERT_EQ(firings.size(), 1u);
    EXPECT_EQ(firings[0].triggering_labels.at(events::kResourceId), "prefect.worker.w1");
}

TEST(ProactiveTrigger, FiringIdIsDeterministic) {
    auto run = []() {
        AutomationRegistry registry;
        registry.create(stuck_runs("a-1"));
        TriggerEngine engine(registry);
        engine.observe(run_event("e-1", "Running", kBase));
        return engine.tick(kBase + minutes(12));
    };

    auto first = run();
    auto second = run();
    ASSERT_EQ(first.size(), 1u);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(first[0].id, second[0].id);
}

TEST(ProactiveTrigger, RemovedAutomationDoesNotFire) {
    AutomationRegistry registry;
    registry.create(stuck_runs("a-1"));
    TriggerEngine engine(registry);

    engine.observe(run_event("e-1", "Running", kBase));
    ASSERT_TRUE(registry.remove("a-1").is_ok());

    EXPECT_TRUE(engine.tick(kBase + minutes(10)).empty());
}
