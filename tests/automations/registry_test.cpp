#include <gtest/gtest.h>
#include "orca/automations/registry.hpp"
#include "orca/core/ids.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace orca;
using namespace orca::automations;

namespace {

Automation named(const std::string& name) {
    Automation automation;
    automation.name = name;
    automation.trigger.expect = {"prefect.flow-run.Failed"};
    return automation;
}

} // namespace

TEST(AutomationRegistry, CreateAssignsIdAndStores) {
    AutomationRegistry registry;

    auto created = registry.create(named("first"));
    ASSERT_TRUE(created.is_ok());
    EXPECT_TRUE(is_uuid(created.value().id));
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.generation(), 1u);

    auto fetched = registry.get(created.value().id);
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(fetched->name, "first");
}

TEST(AutomationRegistry, RejectsDuplicateIdAndInvalidAutomation) {
    AutomationRegistry registry;

    auto automation = named("first");
    automation.id = "fixed";
    ASSERT_TRUE(registry.create(automation).is_ok());

    auto duplicate = registry.create(automation);
    ASSERT_TRUE(duplicate.is_error());
    EXPECT_EQ(duplicate.error().code, ErrorCode::AlreadyExists);

    auto invalid = registry.create(named(""));
    ASSERT_TRUE(invalid.is_error());
    EXPECT_EQ(invalid.error().code, ErrorCode::Configuration);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(AutomationRegistry, UpdateAndRemove) {
    AutomationRegistry registry;
    auto id = registry.create(named("first")).value().id;

    auto updated = registry.update(id, named("renamed"));
    ASSERT_TRUE(updated.is_ok());
    EXPECT_EQ(updated.value().id, id);
    EXPECT_EQ(registry.get(id)->name, "renamed");

    auto missing = registry.update("nope", named("x"));
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

    EXPECT_TRUE(registry.remove(id).is_ok());
    EXPECT_FALSE(registry.get(id).has_value());
    EXPECT_EQ(registry.remove(id).error().code, ErrorCode::NotFound);
    EXPECT_EQ(registry.generation(), 3u);
}

TEST(AutomationRegistry, SnapshotIsImmutableAcrossWrites) {
    AutomationRegistry registry;
    registry.create(named("a"));

    auto before = registry.snapshot();
    registry.create(named("b"));
    auto after = registry.snapshot();

    EXPECT_EQ(before->size(), 1u);
    EXPECT_EQ(after->size(), 2u);
}

TEST(AutomationRegistry, EmitsChangeSignals) {
    events::EventBus bus;
    AutomationRegistry registry(&bus);

    std::vector<events::AutomationChange> changes;
    bus.subscribe<events::AutomationChanged>([&](const events::AutomationChanged& s) {
        changes.push_back(s.change);
    });

    auto id = registry.create(named("a")).value().id;
    registry.update(id, named("b"));
    registry.remove(id);

    ASSERT_EQ(changes.size(), 3u);
    EXPECT_EQ(changes[0], events::AutomationChange::Created);
    EXPECT_EQ(changes[1], events::AutomationChange::Updated);
    EXPECT_EQ(changes[2], events::AutomationChange::Deleted);
}

TEST(AutomationRegistry, ConcurrentReadersSeeConsistentSnapshots) {
    AutomationRegistry registry;
    std::atomic<bool> done{false};
    std::atomic<int> bad{0};

    std::thread reader([&]() {
        while (!done) {
            auto snapshot = registry.snapshot();
            for (const auto& automation : *snapshot) {
                if (automation.name.empty()) {
                    bad++;
                }
            }
        }
    });

    for (int i = 0; i < 200; ++i) {
        registry.create(named("a-" + std::to_string(i)));
    }
    done = true;
    reader.join();

    EXPECT_EQ(bad, 0);
    EXPECT_EQ(registry.list().size(), 200u);
}
