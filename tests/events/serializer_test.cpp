#include <gtest/gtest.h>
#include "orca/core/time.hpp"
#include "orca/events/event.hpp"
#include "orca/events/serializer.hpp"

#include <nlohmann/json.hpp>

using namespace orca;
using namespace orca::events;
using json = nlohmann::json;

TEST(EventSerializer, DecodesFullEvent) {
    json j = {
        {"id", "e-1"},
        {"occurred", "2024-05-01T12:30:00.000000Z"},
        {"event", "prefect.flow-run.Running"},
        {"resource", {{"prefect.resource.id", "prefect.flow-run.abc"}, {"team", "data"}}},
        {"related", json::array({
            {{"prefect.resource.id", "prefect.flow.f1"}, {"prefect.resource.role", "flow"}}
        })},
        {"payload", {{"attempt", 2}}}
    };

    auto decoded = event_from_json(j);
    ASSERT_TRUE(decoded.is_ok()) << decoded.error().message;

    const auto& event = decoded.value();
    EXPECT_EQ(event.id, "e-1");
    EXPECT_EQ(event.event, "prefect.flow-run.Running");
    EXPECT_EQ(event.resource.id(), "prefect.flow-run.abc");
    EXPECT_EQ(event.resource.get("team").value_or(""), "data");
    ASSERT_EQ(event.related.size(), 1u);
    EXPECT_EQ(event.related[0].role(), "flow");
    EXPECT_EQ(event.payload["attempt"], 2);
    EXPECT_EQ(format_timestamp(event.occurred), "2024-05-01T12:30:00.000000Z");
    EXPECT_FALSE(event.received.has_value());
}

TEST(EventSerializer, FillsIdAndOccurredWhenMissing) {
    json j = {
        {"event", "prefect.flow-run.Completed"},
        {"resource", {{"prefect.resource.id", "prefect.flow-run.abc"}}}
    };

    auto before = now();
    auto decoded = event_from_json(j);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_FALSE(decoded.value().id.empty());
    EXPECT_GE(decoded.value().occurred, before);
    EXPECT_TRUE(decoded.value().payload.is_object());
}

TEST(EventSerializer, ReportsShapeErrors) {
    auto not_object = event_from_json(json::array());
    ASSERT_TRUE(not_object.is_error());
    EXPECT_EQ(not_object.error().code, ErrorCode::ParseError);

    auto missing_name = event_from_json({{"resource", {{"prefect.resource.id", "x"}}}});
    EXPECT_TRUE(missing_name.is_error());

    auto bad_label = event_from_json({{"event", "a"}, {"resource", {{"prefect.resource.id", 5}}}});
    EXPECT_TRUE(bad_label.is_error());

    auto bad_time = event_from_json({{"event", "a"},
                                     {"resource", {{"prefect.resource.id", "x"}}},
                                     {"occurred", "yesterday"}});
    EXPECT_TRUE(bad_time.is_error());

    auto bad_payload = event_from_json({{"event", "a"},
                                        {"resource", {{"prefect.resource.id", "x"}}},
                                        {"payload", "text"}});
    EXPECT_TRUE(bad_payload.is_error());
}

TEST(EventSerializer, EncodesReceivedOnlyWhenSet) {
    Event event;
    event.id = "e-2";
    event.event = "prefect.flow-run.Failed";
    event.resource = Resource(Labels{{kResourceId, "prefect.flow-run.x"}});

    EXPECT_FALSE(to_json(event).contains("received"));

    auto received = event.receive(now());
    auto j = to_json(received);
    EXPECT_TRUE(j.contains("received"));

    auto decoded = event_from_json(j);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value().received, received.received);
}

TEST(EventSerializer, BatchFailsOnFirstBadEntry) {
    json batch = json::array({
        {{"event", "a"}, {"resource", {{"prefect.resource.id", "x"}}}},
        json(42)
    });
    EXPECT_TRUE(events_from_json(batch).is_error());
    EXPECT_TRUE(events_from_json(json::object()).is_error());

    auto empty = events_from_json(json::array());
    ASSERT_TRUE(empty.is_ok());
    EXPECT_TRUE(empty.value().empty());
}

TEST(EventValidation, RejectsStructuralProblems) {
    Event event;
    event.id = "e-1";
    event.event = "prefect.flow-run.Running";
    event.resource = Resource(Labels{{kResourceId, "prefect.flow-run.abc"}});
    EXPECT_TRUE(validate(event).is_ok());

    Event no_id = event;
    no_id.id.clear();
    EXPECT_TRUE(validate(no_id).is_error());

    Event no_resource = event;
    no_resource.resource = Resource();
    EXPECT_TRUE(validate(no_resource).is_error());

    Event roleless = event;
    roleless.related.push_back(Resource(Labels{{kResourceId, "prefect.flow.f"}}));
    auto result = validate(roleless);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

TEST(FilterSerializer, DecodesSections) {
    json j = {
        {"occurred", {{"since", "2024-05-01T00:00:00Z"}, {"until", "2024-05-02T00:00:00Z"}}},
        {"event", {{"prefix", "prefect.flow-run."}, {"exclude_name", json::array({"prefect.flow-run.Pending"})}}},
        {"resource", {{"id_prefix", json::array({"prefect.flow-run."})},
                      {"labels", {{"team", json::array({"data", "ml"})}}}}},
        {"related", {{"resources_in_roles", json::array({json::array({"prefect.flow.f1", "flow"})})}}},
        {"order", "ASC"}
    };

    auto decoded = filter_from_json(j);
    ASSERT_TRUE(decoded.is_ok()) << decoded.error().message;

    const auto& filter = decoded.value();
    ASSERT_TRUE(filter.since.has_value());
    ASSERT_TRUE(filter.until.has_value());
    EXPECT_EQ(filter.event_prefix, std::vector<std::string>{"prefect.flow-run."});
    EXPECT_EQ(filter.event_exclude_name.size(), 1u);
    EXPECT_EQ(filter.resource_labels.labels.at("team").size(), 2u);
    ASSERT_EQ(filter.related_resources_in_roles.size(), 1u);
    EXPECT_EQ(filter.related_resources_in_roles[0].second, "flow");
    EXPECT_EQ(filter.order, Order::Ascending);
}

TEST(FilterSerializer, RejectsUnknownOrder) {
    auto decoded = filter_from_json({{"order", "SIDEWAYS"}});
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().code, ErrorCode::ParseError);
}

TEST(FilterSerializer, NullIsEmptyFilter) {
    auto decoded = filter_from_json(json(nullptr));
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_FALSE(decoded.value().since.has_value());
    EXPECT_EQ(decoded.value().order, Order::Descending);
}
