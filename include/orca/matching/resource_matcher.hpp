#pragma once

/**
 * @file resource_matcher.hpp
 * @brief Label-pattern matching between triggers/filters and resources
 *
 * WHY THIS FILE EXISTS:
 * An automation only cares about events whose resources look a certain way
 * ("any flow run of deployment X"). The matcher answers that question
 * without side effects so that the engine can call it for every
 * automation and every event.
 *
 * PATTERN GRAMMAR (per value):
 * - "exact.value"       exact string match
 * - "*"                 any value, the label must be present
 * - "prefix.*"          value starts with "prefix."
 *
 * A specification maps each label to a list of accepted values.
 * All labels must match (AND), any listed value may match (OR), labels the
 * specification does not mention are ignored (open-world matching).
 *
 * Malformed patterns ('*' anywhere but the end, empty labels or values) are
 * reported by validate() when an automation is authored; matching itself is
 * total and never fails.
 */

#include "orca/core/error.hpp"
#include "orca/core/result.hpp"
#include "orca/events/event.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace orca::matching {

struct ResourceSpecification {
    std::map<std::string, std::vector<std::string>> labels;

    ResourceSpecification() = default;
    ResourceSpecification(std::initializer_list<std::pair<const std::string, std::vector<std::string>>> init)
        : labels(init) {}

    bool empty() const noexcept { return labels.empty(); }

    bool operator==(const ResourceSpecification& other) const { return labels == other.labels; }
};

bool value_matches(const std::string& pattern, const std::string& value) noexcept;

bool matches(const ResourceSpecification& spec, const events::Resource& resource) noexcept;

/**
 * @brief True when at least one related resource satisfies the whole specification
 *
 * An empty specification matches everything, including events without
 * related resources. A non-empty one never matches an empty list.
 * Roles are filtered through the "prefect.resource.role" label like any
 * other label.
 */
bool matches_related(const ResourceSpecification& spec,
                     const std::vector<events::RelatedResource>& related) noexcept;

// Event-name sets (trigger "after"/"expect") use the same value grammar
bool matches_event_name(const std::set<std::string>& patterns, const std::string& name) noexcept;

Result<void, Error> validate_pattern(const std::string& pattern, const std::string& context);
Result<void, Error> validate(const ResourceSpecification& spec, const std::string& context);
Result<void, Error> validate_name_patterns(const std::set<std::string>& patterns, const std::string& context);

} // namespace orca::matching
