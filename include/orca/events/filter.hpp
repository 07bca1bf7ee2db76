#pragma once

/**
 * @file filter.hpp
 * @brief Criteria for reading and counting stored events
 *
 * Every list criterion is an OR over its entries; the criteria themselves
 * are ANDed. Empty lists and empty specifications do not constrain.
 * Unset since/until are unbounded at the store level; the HTTP layer fills
 * in the interactive defaults (last 24 hours).
 */

#include "orca/core/time.hpp"
#include "orca/events/event.hpp"
#include "orca/matching/resource_matcher.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace orca::events {

enum class Order {
    Ascending,
    Descending
};

struct EventFilter {
    // occurred
    std::optional<TimePoint> since;
    std::optional<TimePoint> until;

    // event name
    std::vector<std::string> event_prefix;
    std::vector<std::string> event_name;
    std::vector<std::string> event_exclude_prefix;
    std::vector<std::string> event_exclude_name;

    // primary resource
    std::vector<std::string> resource_id;
    std::vector<std::string> resource_id_prefix;
    matching::ResourceSpecification resource_labels;

    // related resources
    std::vector<std::string> related_id;
    std::vector<std::string> related_role;
    std::vector<std::pair<std::string, std::string>> related_resources_in_roles;
    matching::ResourceSpecification related_labels;

    // event ids
    std::vector<std::string> ids;

    Order order = Order::Descending;

    bool includes(const Event& event) const;
};

} // namespace orca::events
