#include "orca/events/components.hpp"
#include "orca/events/event_bus.hpp"
#include "orca/events/signals.hpp"

#include <gtest/gtest.h>

using orca::events::ActionFailed;
using orca::events::ActionSucceeded;
using orca::events::AutomationChange;
using orca::events::AutomationChanged;
using orca::events::EvaluationFault;
using orca::events::EventBus;
using orca::events::EventReceived;
using orca::events::EventRejected;
using orca::events::FiringProduced;
using orca::events::LoggerComponent;
using orca::events::MetricsComponent;

TEST(MetricsComponentTest, CountsPipelineSignals) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(EventReceived{orca::events::Event{}, "http"});
    bus.emit(EventReceived{orca::events::Event{}, "websocket"});
    bus.emit(EventRejected{"e-1", "event name must not be empty"});
    bus.emit(FiringProduced{orca::automations::Firing{}});
    bus.emit(ActionSucceeded{"inv-1", "auto-1", "suspend-flow-run", 201});
    bus.emit(ActionFailed{"inv-2", "auto-1", "pause-deployment", "not found"});
    bus.emit(EvaluationFault{"auto-1", "e-2", "boom"});
    bus.emit(AutomationChanged{"auto-1", AutomationChange::Updated, 2});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.events_received.load(), 2u);
    EXPECT_EQ(stats.events_rejected.load(), 1u);
    EXPECT_EQ(stats.firings.load(), 1u);
    EXPECT_EQ(stats.actions_succeeded.load(), 1u);
    EXPECT_EQ(stats.actions_failed.load(), 1u);
    EXPECT_EQ(stats.evaluation_faults.load(), 1u);
    EXPECT_EQ(stats.automation_changes.load(), 1u);
    EXPECT_EQ(stats.actions_dispatched.load(), 0u);
}

TEST(MetricsComponentTest, JsonReflectsCounters) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(FiringProduced{orca::automations::Firing{}});
    bus.emit(FiringProduced{orca::automations::Firing{}});

    auto j = metrics.to_json();
    EXPECT_EQ(j["firings"].get<uint64_t>(), 2u);
    EXPECT_EQ(j["events_received"].get<uint64_t>(), 0u);
    EXPECT_TRUE(j.contains("actions_failed"));
}

TEST(LoggerComponentTest, UnsubscribesOnDestruction) {
    EventBus bus;
    {
        LoggerComponent logger(bus);
        EXPECT_EQ(bus.subscriber_count<FiringProduced>(), 1u);
        EXPECT_EQ(bus.subscriber_count<ActionFailed>(), 1u);

        EXPECT_NO_THROW(bus.emit(ActionFailed{"inv", "auto", "cancel-flow-run", "reason"}));
    }
    EXPECT_EQ(bus.subscriber_count<FiringProduced>(), 0u);
    EXPECT_EQ(bus.subscriber_count<ActionFailed>(), 0u);
}
