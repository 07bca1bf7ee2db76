#include "orca/actions/basic_actions.hpp"

#include <spdlog/spdlog.h>

#include <cctype>

namespace orca::actions {
namespace {

std::string trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::optional<std::string> lookup(const std::string& name, const automations::TriggeredAction& triggered) {
    if (name == "automation.id") return triggered.automation.id;
    if (name == "automation.name") return triggered.automation.name;
    if (name == "firing.id") return triggered.firing.id;
    if (name == "event.event") {
        return triggered.triggering_event ? triggered.triggering_event->event : std::string();
    }
    if (name == "event.resource.id") {
        return triggered.triggering_event ? triggered.triggering_event->resource.id() : std::string();
    }
    return std::nullopt;
}

} // namespace

std::string render_template(const std::string& text, const automations::TriggeredAction& triggered) {
    std::string out;
    out.reserve(text.size());

    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto open = text.find("{{", pos);
        if (open == std::string::npos) {
            break;
        }
        const auto close = text.find("}}", open + 2);
        if (close == std::string::npos) {
            break;
        }

        out.append(text, pos, open - pos);
        auto value = lookup(trim(text.substr(open + 2, close - open - 2)), triggered);
        if (value) {
            out += *value;
        } else {
            out.append(text, open, close + 2 - open);
        }
        pos = close + 2;
    }
    out.append(text, pos, std::string::npos);
    return out;
}

Result<ActionResult, ActionFailure> DoNothingAction::act(const automations::TriggeredAction& triggered) {
    spdlog::debug("[Action] do-nothing invocation={}", triggered.id);
    return Ok(ActionResult{200});
}

Result<ActionResult, ActionFailure> SendNotificationAction::act(const automations::TriggeredAction& triggered) {
    Notification notification;
    notification.block_document_id = spec_.block_document_id;
    notification.subject = render_template(spec_.subject, triggered);
    notification.body = render_template(spec_.body, triggered);

    auto sent = context_.notifications.send(notification);
    if (sent.is_error()) {
        return Err<ActionResult>(ActionFailure{
            "Notification to " + spec_.block_document_id + " failed: " + sent.error().message});
    }
    return Ok(ActionResult{200});
}

Result<void, Error> LoggingNotificationSink::send(const Notification& notification) {
    spdlog::info("[Notify] to={} subject=\"{}\" body=\"{}\"",
                 notification.block_document_id, notification.subject, notification.body);
    return Ok();
}

} // namespace orca::actions
