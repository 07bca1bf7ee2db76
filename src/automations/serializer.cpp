#include "orca/automations/serializer.hpp"

#include "orca/core/time.hpp"
#include "orca/events/serializer.hpp"

#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace orca::automations {

using json = nlohmann::json;

namespace {

// Carries a typed Error out of nested decoding
struct DecodeError : std::runtime_error {
    Error error;
    explicit DecodeError(Error e) : std::runtime_error(e.message), error(std::move(e)) {}
};

template<typename T>
T unwrap(Result<T, Error> result) {
    if (result.is_error()) {
        throw DecodeError(result.error());
    }
    return result.take_value();
}

template<typename T, typename Fn>
Result<T, Error> decode(Fn&& fn) {
    try {
        return Ok(fn());
    } catch (const DecodeError& e) {
        return Err<T>(e.error);
    } catch (const json::exception& e) {
        return Err<T>(Error::parse_error(e.what()));
    } catch (const std::invalid_argument& e) {
        return Err<T>(Error::parse_error(e.what()));
    }
}

json optional_string(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<std::string> optional_string(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::set<std::string> string_set(const json& obj, const char* key) {
    std::set<std::string> values;
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return values;
    }
    if (it->is_string()) {
        values.insert(it->get<std::string>());
        return values;
    }
    for (const auto& item : *it) {
        values.insert(item.get<std::string>());
    }
    return values;
}

events::Labels labels_from(const json& j) {
    return unwrap(events::resource_from_json(j)).labels;
}

json deployment_source(const std::optional<std::string>& deployment_id) {
    return {
        {"source", deployment_id ? "selected" : "inferred"},
        {"deployment_id", optional_string(deployment_id)}
    };
}

std::optional<std::string> deployment_from(const json& j) {
    const auto source = j.value("source", std::string("selected"));
    if (source == "inferred") {
        return std::nullopt;
    }
    if (source != "selected") {
        throw DecodeError(Error::configuration("source must be 'selected' or 'inferred'"));
    }
    auto id = optional_string(j, "deployment_id");
    if (!id || id->empty()) {
        throw DecodeError(Error::configuration("deployment_id is required when source is 'selected'"));
    }
    return id;
}

struct ActionEncoder {
    json& out;

    void operator()(const actions::DoNothing&) const {}

    void operator()(const actions::SuspendFlowRun&) const {
        out["source"] = "inferred";
    }

    void operator()(const actions::CancelFlowRun&) const {
        out["source"] = "inferred";
    }

    void operator()(const actions::ChangeFlowRunState& a) const {
        out["state"] = orchestration::to_string(a.state);
        out["name"] = optional_string(a.name);
        out["message"] = optional_string(a.message);
        out["force"] = a.force;
    }

    void operator()(const actions::RunDeployment& a) const {
        out.update(deployment_source(a.deployment_id));
        out["parameters"] = a.parameters;
    }

    void operator()(const actions::PauseDeployment& a) const {
        out.update(deployment_source(a.deployment_id));
    }

    void operator()(const actions::ResumeDeployment& a) const {
        out.update(deployment_source(a.deployment_id));
    }

    void operator()(const actions::SendNotification& a) const {
        out["block_document_id"] = a.block_document_id;
        out["subject"] = a.subject;
        out["body"] = a.body;
    }
};

struct ActionDecoder {
    const json& in;

    void operator()(actions::DoNothing&) const {}
    void operator()(actions::SuspendFlowRun&) const {}
    void operator()(actions::CancelFlowRun&) const {}

    void operator()(actions::ChangeFlowRunState& a) const {
        const auto state = in.at("state").get<std::string>();
        auto parsed = orchestration::state_type_from_string(state);
        if (!parsed) {
            throw DecodeError(Error::configuration("Unknown state type: " + state));
        }
        a.state = *parsed;
        a.name = optional_string(in, "name");
        a.message = optional_string(in, "message");
        a.force = in.value("force", false);
    }

    void operator()(actions::RunDeployment& a) const {
        a.deployment_id = deployment_from(in);
        if (in.contains("parameters") && !in["parameters"].is_null()) {
            if (!in["parameters"].is_object()) {
                throw std::invalid_argument("parameters must be an object");
            }
            a.parameters = in["parameters"];
        }
    }

    void operator()(actions::PauseDeployment& a) const {
        a.deployment_id = deployment_from(in);
    }

    void operator()(actions::ResumeDeployment& a) const {
        a.deployment_id = deployment_from(in);
    }

    void operator()(actions::SendNotification& a) const {
        a.block_document_id = in.at("block_document_id").get<std::string>();
        a.subject = in.value("subject", a.subject);
        a.body = in.value("body", std::string());
    }
};

json optional_event(const std::optional<events::Event>& event) {
    return event ? events::to_json(*event) : json(nullptr);
}

std::optional<events::Event> optional_event(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    return unwrap(events::event_from_json(*it));
}

TimePoint timestamp_from(const json& obj, const char* key) {
    const auto text = obj.at(key).get<std::string>();
    auto parsed = parse_timestamp(text);
    if (!parsed) {
        throw std::invalid_argument(std::string(key) + " is not a valid timestamp: " + text);
    }
    return *parsed;
}

json labels_json(const events::Labels& labels) {
    return events::to_json(events::Resource(labels));
}

} // namespace

json to_json(const actions::ActionSpec& action) {
    json j = {{"type", actions::action_type(action)}};
    std::visit(ActionEncoder{j}, action);
    return j;
}

Result<actions::ActionSpec, Error> action_from_json(const json& j) {
    return decode<actions::ActionSpec>([&j]() {
        if (!j.is_object()) {
            throw std::invalid_argument("action must be a JSON object");
        }
        const auto type = j.at("type").get<std::string>();
        auto action = actions::action_for_type(type);
        if (!action) {
            throw DecodeError(Error::configuration("Unknown action type: " + type));
        }
        std::visit(ActionDecoder{j}, *action);
        return *action;
    });
}

json to_json(const EventTrigger& trigger) {
    const double within = to_seconds(trigger.within);
    json j = {
        {"type", "event"},
        {"match", events::to_json(trigger.match)},
        {"match_related", events::to_json(trigger.match_related)},
        {"after", trigger.after},
        {"expect", trigger.expect},
        {"for_each", trigger.for_each},
        {"posture", to_string(trigger.posture)},
        {"threshold", trigger.threshold}
    };
    if (within == std::floor(within)) {
        j["within"] = static_cast<std::int64_t>(within);
    } else {
        j["within"] = within;
    }
    return j;
}

Result<EventTrigger, Error> trigger_from_json(const json& j) {
    return decode<EventTrigger>([&j]() {
        if (!j.is_object()) {
            throw std::invalid_argument("trigger must be a JSON object");
        }
        const auto type = j.value("type", std::string("event"));
        if (type != "event") {
            throw DecodeError(Error::configuration("Unsupported trigger type: " + type));
        }

        EventTrigger trigger;
        if (j.contains("match")) {
            trigger.match = unwrap(events::specification_from_json(j["match"]));
        }
        if (j.contains("match_related")) {
            trigger.match_related = unwrap(events::specification_from_json(j["match_related"]));
        }
        trigger.after = string_set(j, "after");
        trigger.expect = string_set(j, "expect");
        if (j.contains("for_each") && !j["for_each"].is_null()) {
            trigger.for_each = string_set(j, "for_each");
        }

        const auto posture = j.value("posture", std::string("Reactive"));
        if (posture == "Reactive") {
            trigger.posture = Posture::Reactive;
        } else if (posture == "Proactive") {
            trigger.posture = Posture::Proactive;
        } else {
            throw DecodeError(Error::configuration("posture must be Reactive or Proactive"));
        }

        trigger.threshold = j.value("threshold", 1);
        if (j.contains("within") && !j["within"].is_null()) {
            trigger.within = from_seconds(j["within"].get<double>());
        }
        return trigger;
    });
}

json to_json(const Automation& automation) {
    json actions = json::array();
    for (const auto& action : automation.actions) {
        actions.push_back(to_json(action));
    }
    return {
        {"id", automation.id},
        {"name", automation.name},
        {"description", automation.description},
        {"enabled", automation.enabled},
        {"trigger", to_json(automation.trigger)},
        {"actions", actions}
    };
}

Result<Automation, Error> automation_from_json(const json& j) {
    return decode<Automation>([&j]() {
        if (!j.is_object()) {
            throw std::invalid_argument("automation must be a JSON object");
        }
        Automation automation;
        automation.id = optional_string(j, "id").value_or("");
        automation.name = j.at("name").get<std::string>();
        automation.description = j.value("description", std::string());
        automation.enabled = j.value("enabled", true);
        automation.trigger = unwrap(trigger_from_json(j.at("trigger")));
        if (j.contains("actions") && !j["actions"].is_null()) {
            for (const auto& action : j["actions"]) {
                automation.actions.push_back(unwrap(action_from_json(action)));
            }
        }
        return automation;
    });
}

json to_json(const Firing& firing) {
    json states = json::array();
    for (auto state : firing.trigger_states) {
        states.push_back(to_string(state));
    }
    return {
        {"id", firing.id},
        {"automation_id", firing.automation_id},
        {"trigger", to_json(firing.trigger)},
        {"trigger_states", states},
        {"triggered", format_timestamp(firing.triggered)},
        {"triggering_labels", labels_json(firing.triggering_labels)},
        {"triggering_event", optional_event(firing.triggering_event)}
    };
}

Result<Firing, Error> firing_from_json(const json& j) {
    return decode<Firing>([&j]() {
        Firing firing;
        firing.id = j.at("id").get<std::string>();
        firing.automation_id = j.value("automation_id", std::string());
        firing.trigger = unwrap(trigger_from_json(j.at("trigger")));
        firing.trigger_states.clear();
        for (const auto& state : j.value("trigger_states", json::array({"Triggered"}))) {
            if (state.get<std::string>() != "Triggered") {
                throw std::invalid_argument("Unknown trigger state: " + state.get<std::string>());
            }
            firing.trigger_states.insert(TriggerState::Triggered);
        }
        firing.triggered = timestamp_from(j, "triggered");
        if (j.contains("triggering_labels")) {
            firing.triggering_labels = labels_from(j["triggering_labels"]);
        }
        firing.triggering_event = optional_event(j, "triggering_event");
        return firing;
    });
}

json to_json(const TriggeredAction& triggered) {
    return {
        {"id", triggered.id},
        {"automation", to_json(triggered.automation)},
        {"firing", to_json(triggered.firing)},
        {"triggered", format_timestamp(triggered.triggered)},
        {"triggering_labels", labels_json(triggered.triggering_labels)},
        {"triggering_event", optional_event(triggered.triggering_event)},
        {"action", to_json(triggered.action)},
        {"action_index", triggered.action_index}
    };
}

Result<TriggeredAction, Error> triggered_action_from_json(const json& j) {
    return decode<TriggeredAction>([&j]() {
        TriggeredAction triggered;
        triggered.id = j.at("id").get<std::string>();
        triggered.automation = unwrap(automation_from_json(j.at("automation")));
        triggered.firing = unwrap(firing_from_json(j.at("firing")));
        triggered.triggered = timestamp_from(j, "triggered");
        if (j.contains("triggering_labels")) {
            triggered.triggering_labels = labels_from(j["triggering_labels"]);
        }
        triggered.triggering_event = optional_event(j, "triggering_event");
        triggered.action = unwrap(action_from_json(j.at("action")));
        triggered.action_index = j.at("action_index").get<int>();
        return triggered;
    });
}

} // namespace orca::automations
