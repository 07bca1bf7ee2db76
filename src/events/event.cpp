#include "orca/events/event.hpp"

namespace orca::events {

Result<void, Error> validate(const Event& event) {
    if (event.id.empty()) {
        return Err<void>(Error::invalid_argument("event id must not be empty"));
    }
    if (event.event.empty()) {
        return Err<void>(Error::invalid_argument("event name must not be empty"));
    }
    if (event.resource.id().empty()) {
        return Err<void>(Error::invalid_argument(
            "resource must include a non-empty '" + kResourceId + "' label"));
    }
    for (std::size_t i = 0; i < event.related.size(); ++i) {
        const auto& related = event.related[i];
        if (related.id().empty()) {
            return Err<void>(Error::invalid_argument(
                "related resource " + std::to_string(i) + " is missing '" + kResourceId + "'"));
        }
        if (related.role().empty()) {
            return Err<void>(Error::invalid_argument(
                "related resource " + std::to_string(i) + " is missing '" + kResourceRole + "'"));
        }
    }
    return Ok();
}

} // namespace orca::events
