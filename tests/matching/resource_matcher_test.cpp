#include <gtest/gtest.h>
#include "orca/matching/resource_matcher.hpp"

using namespace orca;
using namespace orca::matching;
using orca::events::Labels;
using orca::events::Resource;

namespace {

Resource flow_run(const std::string& id, Labels extra = {}) {
    Labels labels = std::move(extra);
    labels[events::kResourceId] = id;
    return Resource(labels);
}

Resource related(const std::string& id, const std::string& role) {
    return Resource(Labels{{events::kResourceId, id}, {events::kResourceRole, role}});
}

} // namespace

TEST(ValueMatches, ExactWildcardAndPrefix) {
    EXPECT_TRUE(value_matches("prefect.flow-run.abc", "prefect.flow-run.abc"));
    EXPECT_FALSE(value_matches("prefect.flow-run.abc", "prefect.flow-run.abd"));
    EXPECT_TRUE(value_matches("*", "anything"));
    EXPECT_TRUE(value_matches("*", ""));
    EXPECT_TRUE(value_matches("prefect.flow-run.*", "prefect.flow-run.abc"));
    EXPECT_FALSE(value_matches("prefect.flow-run.*", "prefect.deployment.abc"));
}

TEST(ResourceMatcher, EmptySpecificationMatchesAnyResource) {
    EXPECT_TRUE(matches(ResourceSpecification{}, flow_run("prefect.flow-run.1")));
    EXPECT_TRUE(matches(ResourceSpecification{}, Resource()));
}

TEST(ResourceMatcher, AllLabelsMustMatchAnyValue) {
    ResourceSpecification spec{
        {events::kResourceId, {"prefect.flow-run.*"}},
        {"team", {"data", "ml"}}
    };

    EXPECT_TRUE(matches(spec, flow_run("prefect.flow-run.1", {{"team", "ml"}})));
    EXPECT_FALSE(matches(spec, flow_run("prefect.flow-run.1", {{"team", "web"}})));
    EXPECT_FALSE(matches(spec, flow_run("prefect.flow-run.1")));  // label missing
}

TEST(ResourceMatcher, WildcardRequiresLabelPresence) {
    ResourceSpecification spec{{"team", {"*"}}};
    EXPECT_FALSE(matches(spec, flow_run("prefect.flow-run.1")));
    EXPECT_TRUE(matches(spec, flow_run("prefect.flow-run.1", {{"team", "x"}})));
}

TEST(ResourceMatcher, UnmentionedLabelsAreIgnored) {
    ResourceSpecification spec{{events::kResourceId, {"prefect.flow-run.1"}}};
    EXPECT_TRUE(matches(spec, flow_run("prefect.flow-run.1", {{"unrelated", "value"}})));
}

TEST(RelatedMatcher, OneRelatedResourceMustSatisfyWholeSpec) {
    ResourceSpecification spec{
        {events::kResourceRole, {"flow"}},
        {events::kResourceId, {"prefect.flow.etl"}}
    };

    std::vector<Resource> split{related("prefect.flow.etl", "tag"), related("prefect.flow.other", "flow")};
    EXPECT_FALSE(matches_related(spec, split));

    std::vector<Resource> joined{related("prefect.tag.x", "tag"), related("prefect.flow.etl", "flow")};
    EXPECT_TRUE(matches_related(spec, joined));
}

TEST(RelatedMatcher, EmptySpecAndEmptyList) {
    EXPECT_TRUE(matches_related(ResourceSpecification{}, {}));

    ResourceSpecification spec{{events::kResourceRole, {"flow"}}};
    EXPECT_FALSE(matches_related(spec, {}));
}

TEST(EventNameMatcher, UsesPatternGrammar) {
    std::set<std::string> patterns{"prefect.flow-run.Failed", "prefect.flow-run.Crash*"};
    EXPECT_TRUE(matches_event_name(patterns, "prefect.flow-run.Failed"));
    EXPECT_TRUE(matches_event_name(patterns, "prefect.flow-run.Crashed"));
    EXPECT_FALSE(matches_event_name(patterns, "prefect.flow-run.Completed"));
    EXPECT_FALSE(matches_event_name({}, "prefect.flow-run.Completed"));
}

TEST(PatternValidation, RejectsMalformedPatterns) {
    EXPECT_TRUE(validate_pattern("prefect.*", "match").is_ok());
    EXPECT_TRUE(validate_pattern("*", "match").is_ok());

    auto empty = validate_pattern("", "match");
    ASSERT_TRUE(empty.is_error());
    EXPECT_EQ(empty.error().code, ErrorCode::Configuration);

    EXPECT_TRUE(validate_pattern("pre*fix", "match").is_error());

    ResourceSpecification no_values;
    no_values.labels["team"] = {};
    EXPECT_TRUE(validate(no_values, "match").is_error());

    ResourceSpecification empty_label{{"", {"x"}}};
    EXPECT_TRUE(validate(empty_label, "match").is_error());

    EXPECT_TRUE(validate_name_patterns({"a.*", "*b"}, "expect").is_error());
}
