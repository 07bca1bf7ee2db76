#include "orca/events/filter.hpp"

#include <algorithm>

namespace orca::events {
namespace {

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

bool any_equal(const std::vector<std::string>& options, const std::string& value) {
    return std::find(options.begin(), options.end(), value) != options.end();
}

bool any_prefix(const std::vector<std::string>& prefixes, const std::string& value) {
    return std::any_of(prefixes.begin(), prefixes.end(),
        [&value](const std::string& p) { return starts_with(value, p); });
}

bool includes_name(const EventFilter& f, const std::string& name) {
    if (!f.event_prefix.empty() && !any_prefix(f.event_prefix, name)) {
        return false;
    }
    if (!f.event_name.empty() && !any_equal(f.event_name, name)) {
        return false;
    }
    if (any_prefix(f.event_exclude_prefix, name)) {
        return false;
    }
    if (any_equal(f.event_exclude_name, name)) {
        return false;
    }
    return true;
}

bool includes_resource(const EventFilter& f, const Resource& resource) {
    const auto id = resource.id();
    if (!f.resource_id.empty() && !any_equal(f.resource_id, id)) {
        return false;
    }
    if (!f.resource_id_prefix.empty() && !any_prefix(f.resource_id_prefix, id)) {
        return false;
    }
    return matching::matches(f.resource_labels, resource);
}

bool includes_related(const EventFilter& f, const std::vector<RelatedResource>& related) {
    if (!f.related_id.empty()) {
        const bool found = std::any_of(related.begin(), related.end(),
            [&f](const RelatedResource& r) { return any_equal(f.related_id, r.id()); });
        if (!found) {
            return false;
        }
    }
    if (!f.related_role.empty()) {
        const bool found = std::any_of(related.begin(), related.end(),
            [&f](const RelatedResource& r) { return any_equal(f.related_role, r.role()); });
        if (!found) {
            return false;
        }
    }
    if (!f.related_resources_in_roles.empty()) {
        const bool found = std::any_of(related.begin(), related.end(), [&f](const RelatedResource& r) {
            return std::any_of(f.related_resources_in_roles.begin(), f.related_resources_in_roles.end(),
                [&r](const auto& pair) { return r.id() == pair.first && r.role() == pair.second; });
        });
        if (!found) {
            return false;
        }
    }
    return matching::matches_related(f.related_labels, related);
}

} // namespace

bool EventFilter::includes(const Event& event) const {
    if (since && event.occurred < *since) {
        return false;
    }
    if (until && event.occurred > *until) {
        return false;
    }
    if (!ids.empty() && !any_equal(ids, event.id)) {
        return false;
    }
    return includes_name(*this, event.event) &&
           includes_resource(*this, event.resource) &&
           includes_related(*this, event.related);
}

} // namespace orca::events
