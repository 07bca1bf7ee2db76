#pragma once

/**
 * @file event.hpp
 * @brief Canonical event shape for the control plane
 *
 * WHY THIS FILE EXISTS:
 * Every state change of a scheduled work unit (a flow run entering Running,
 * a deployment being paused, an automation action finishing) is described
 * by one Event. The trigger engine, the event store and the HTTP API all
 * speak this one type.
 *
 * SHAPE:
 * - id:        unique identity (UUID); redelivery of the same id is a duplicate
 * - occurred:  when it happened; used for ordering and window placement
 * - event:     dotted name, e.g. "prefect.flow-run.Running"
 * - resource:  labels of the primary resource, must carry "prefect.resource.id"
 * - related:   labelled secondary resources, each with a role
 * - payload:   opaque JSON object
 * - received:  set by the publisher on ingestion, never used for windows
 */

#include "orca/core/error.hpp"
#include "orca/core/result.hpp"
#include "orca/core/time.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace orca::events {

inline const std::string kResourceId = "prefect.resource.id";
inline const std::string kResourceRole = "prefect.resource.role";
inline const std::string kResourceName = "prefect.resource.name";

// Ordered so that encoding and instance keys are deterministic
using Labels = std::map<std::string, std::string>;

/**
 * @brief A labelled resource
 *
 * Used both for the primary resource of an event and for related
 * resources; a related resource additionally carries the
 * "prefect.resource.role" label.
 */
struct Resource {
    Labels labels;

    Resource() = default;
    explicit Resource(Labels l) : labels(std::move(l)) {}

    std::string id() const { return get(kResourceId).value_or(""); }
    std::string role() const { return get(kResourceRole).value_or(""); }

    std::optional<std::string> get(const std::string& label) const {
        auto it = labels.find(label);
        if (it == labels.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool has(const std::string& label) const {
        return labels.find(label) != labels.end();
    }

    bool operator==(const Resource& other) const { return labels == other.labels; }
    bool operator!=(const Resource& other) const { return !(*this == other); }
};

using RelatedResource = Resource;

struct Event {
    std::string id;
    TimePoint occurred{};
    std::string event;
    Resource resource;
    std::vector<RelatedResource> related;
    nlohmann::json payload = nlohmann::json::object();
    std::optional<TimePoint> received;

    /**
     * @brief Copy of this event stamped with the receipt time
     */
    Event receive(TimePoint at) const {
        Event copy = *this;
        copy.received = at;
        return copy;
    }

    std::vector<RelatedResource> resources_in_role(const std::string& role) const {
        std::vector<RelatedResource> result;
        for (const auto& r : related) {
            if (r.role() == role) {
                result.push_back(r);
            }
        }
        return result;
    }
};

/**
 * @brief Structural checks applied on ingestion
 *
 * Rejects an empty id or event name, a primary resource without an id,
 * and related resources missing their id or role.
 */
Result<void, Error> validate(const Event& event);

} // namespace orca::events
