#include "orca/events/serializer.hpp"

#include "orca/core/ids.hpp"
#include "orca/core/time.hpp"

#include <stdexcept>

namespace orca::events {

using json = nlohmann::json;

namespace {

Labels labels_from_json(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("resource must be an object of string labels");
    }
    Labels labels;
    for (const auto& [key, value] : j.items()) {
        if (!value.is_string()) {
            throw std::invalid_argument("label '" + key + "' must be a string");
        }
        labels[key] = value.get<std::string>();
    }
    return labels;
}

TimePoint timestamp_from_json(const json& j, const char* field) {
    if (!j.is_string()) {
        throw std::invalid_argument(std::string(field) + " must be a timestamp string");
    }
    auto parsed = parse_timestamp(j.get<std::string>());
    if (!parsed) {
        throw std::invalid_argument(std::string(field) + " is not a valid timestamp: " + j.get<std::string>());
    }
    return *parsed;
}

std::vector<std::string> strings_from_json(const json& j, const char* field) {
    std::vector<std::string> values;
    if (j.is_string()) {
        values.push_back(j.get<std::string>());
        return values;
    }
    if (!j.is_array()) {
        throw std::invalid_argument(std::string(field) + " must be a string or a list of strings");
    }
    for (const auto& item : j) {
        if (!item.is_string()) {
            throw std::invalid_argument(std::string(field) + " must contain only strings");
        }
        values.push_back(item.get<std::string>());
    }
    return values;
}

matching::ResourceSpecification spec_from_json(const json& j) {
    matching::ResourceSpecification spec;
    if (j.is_null()) {
        return spec;
    }
    if (!j.is_object()) {
        throw std::invalid_argument("resource specification must be an object");
    }
    for (const auto& [label, values] : j.items()) {
        spec.labels[label] = strings_from_json(values, label.c_str());
    }
    return spec;
}

template<typename T, typename Fn>
Result<T, Error> decode(Fn&& fn) {
    try {
        return Ok(fn());
    } catch (const json::exception& e) {
        return Err<T>(Error::parse_error(e.what()));
    } catch (const std::invalid_argument& e) {
        return Err<T>(Error::parse_error(e.what()));
    }
}

} // namespace

json to_json(const Resource& resource) {
    json j = json::object();
    for (const auto& [label, value] : resource.labels) {
        j[label] = value;
    }
    return j;
}

json to_json(const Event& event) {
    json related = json::array();
    for (const auto& r : event.related) {
        related.push_back(to_json(r));
    }

    json j = {
        {"id", event.id},
        {"occurred", format_timestamp(event.occurred)},
        {"event", event.event},
        {"resource", to_json(event.resource)},
        {"related", related},
        {"payload", event.payload}
    };
    if (event.received) {
        j["received"] = format_timestamp(*event.received);
    }
    return j;
}

json to_json(const std::vector<Event>& events) {
    json array = json::array();
    for (const auto& e : events) {
        array.push_back(to_json(e));
    }
    return array;
}

Result<Resource, Error> resource_from_json(const json& j) {
    return decode<Resource>([&j]() { return Resource(labels_from_json(j)); });
}

Result<Event, Error> event_from_json(const json& j) {
    return decode<Event>([&j]() {
        if (!j.is_object()) {
            throw std::invalid_argument("event must be a JSON object");
        }

        Event event;
        event.id = j.contains("id") && !j["id"].is_null() ? j["id"].get<std::string>() : new_uuid();
        event.occurred = j.contains("occurred") && !j["occurred"].is_null()
            ? timestamp_from_json(j["occurred"], "occurred")
            : now();
        event.event = j.at("event").get<std::string>();
        event.resource = Resource(labels_from_json(j.at("resource")));

        if (j.contains("related") && !j["related"].is_null()) {
            if (!j["related"].is_array()) {
                throw std::invalid_argument("related must be a list");
            }
            for (const auto& r : j["related"]) {
                event.related.emplace_back(labels_from_json(r));
            }
        }

        if (j.contains("payload") && !j["payload"].is_null()) {
            if (!j["payload"].is_object()) {
                throw std::invalid_argument("payload must be an object");
            }
            event.payload = j["payload"];
        }

        if (j.contains("received") && !j["received"].is_null()) {
            event.received = timestamp_from_json(j["received"], "received");
        }
        return event;
    });
}

Result<std::vector<Event>, Error> events_from_json(const json& j) {
    if (!j.is_array()) {
        return Err<std::vector<Event>>(Error::parse_error("expected a JSON array of events"));
    }
    std::vector<Event> events;
    events.reserve(j.size());
    for (const auto& item : j) {
        auto decoded = event_from_json(item);
        if (decoded.is_error()) {
            return Err<std::vector<Event>>(decoded.error());
        }
        events.push_back(decoded.take_value());
    }
    return Ok(std::move(events));
}

json to_json(const matching::ResourceSpecification& spec) {
    json j = json::object();
    for (const auto& [label, values] : spec.labels) {
        if (values.size() == 1) {
            j[label] = values.front();
        } else {
            j[label] = values;
        }
    }
    return j;
}

Result<matching::ResourceSpecification, Error> specification_from_json(const json& j) {
    return decode<matching::ResourceSpecification>([&j]() { return spec_from_json(j); });
}

json to_json(const EventFilter& filter) {
    json occurred = json::object();
    if (filter.since) {
        occurred["since"] = format_timestamp(*filter.since);
    }
    if (filter.until) {
        occurred["until"] = format_timestamp(*filter.until);
    }

    json resources_in_roles = json::array();
    for (const auto& [id, role] : filter.related_resources_in_roles) {
        resources_in_roles.push_back(json::array({id, role}));
    }

    return {
        {"occurred", occurred},
        {"event", {
            {"prefix", filter.event_prefix},
            {"name", filter.event_name},
            {"exclude_prefix", filter.event_exclude_prefix},
            {"exclude_name", filter.event_exclude_name}
        }},
        {"resource", {
            {"id", filter.resource_id},
            {"id_prefix", filter.resource_id_prefix},
            {"labels", to_json(filter.resource_labels)}
        }},
        {"related", {
            {"id", filter.related_id},
            {"role", filter.related_role},
            {"resources_in_roles", resources_in_roles},
            {"labels", to_json(filter.related_labels)}
        }},
        {"id", {{"id", filter.ids}}},
        {"order", filter.order == Order::Ascending ? "ASC" : "DESC"}
    };
}

Result<EventFilter, Error> filter_from_json(const json& j) {
    return decode<EventFilter>([&j]() {
        EventFilter filter;
        if (j.is_null()) {
            return filter;
        }
        if (!j.is_object()) {
            throw std::invalid_argument("filter must be a JSON object");
        }

        auto section = [&j](const char* name) -> const json* {
            auto it = j.find(name);
            if (it == j.end() || it->is_null()) {
                return nullptr;
            }
            if (!it->is_object()) {
                throw std::invalid_argument(std::string(name) + " must be an object");
            }
            return &*it;
        };
        auto list = [](const json& obj, const char* key) {
            auto it = obj.find(key);
            if (it == obj.end() || it->is_null()) {
                return std::vector<std::string>{};
            }
            return strings_from_json(*it, key);
        };

        if (const json* occurred = section("occurred")) {
            if (occurred->contains("since") && !(*occurred)["since"].is_null()) {
                filter.since = timestamp_from_json((*occurred)["since"], "occurred.since");
            }
            if (occurred->contains("until") && !(*occurred)["until"].is_null()) {
                filter.until = timestamp_from_json((*occurred)["until"], "occurred.until");
            }
        }

        if (const json* event = section("event")) {
            filter.event_prefix = list(*event, "prefix");
            filter.event_name = list(*event, "name");
            filter.event_exclude_prefix = list(*event, "exclude_prefix");
            filter.event_exclude_name = list(*event, "exclude_name");
        }

        if (const json* resource = section("resource")) {
            filter.resource_id = list(*resource, "id");
            filter.resource_id_prefix = list(*resource, "id_prefix");
            if (resource->contains("labels")) {
                filter.resource_labels = spec_from_json((*resource)["labels"]);
            }
        }

        if (const json* related = section("related")) {
            filter.related_id = list(*related, "id");
            filter.related_role = list(*related, "role");
            if (related->contains("resources_in_roles") && !(*related)["resources_in_roles"].is_null()) {
                for (const auto& pair : (*related)["resources_in_roles"]) {
                    if (!pair.is_array() || pair.size() != 2) {
                        throw std::invalid_argument("resources_in_roles entries must be [id, role] pairs");
                    }
                    filter.related_resources_in_roles.emplace_back(
                        pair[0].get<std::string>(), pair[1].get<std::string>());
                }
            }
            if (related->contains("labels")) {
                filter.related_labels = spec_from_json((*related)["labels"]);
            }
        }

        if (const json* ids = section("id")) {
            filter.ids = list(*ids, "id");
        }

        if (j.contains("order") && !j["order"].is_null()) {
            const auto order = j["order"].get<std::string>();
            if (order == "ASC") {
                filter.order = Order::Ascending;
            } else if (order == "DESC") {
                filter.order = Order::Descending;
            } else {
                throw std::invalid_argument("order must be ASC or DESC");
            }
        }
        return filter;
    });
}

} // namespace orca::events
