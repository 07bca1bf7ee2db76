#pragma once

/**
 * @file action.hpp
 * @brief Capability contract every action kind implements
 *
 * WHY THIS FILE EXISTS:
 * The executor does not know what "suspend a flow run" or "pause a
 * deployment" means. It only knows the three steps every action goes
 * through:
 *
 *   act(triggered)             perform the effect, report a status code
 *   succeed(triggered, result) emit "<ns>.automation.action.executed"
 *   fail(triggered, reason)    emit "<ns>.automation.action.failed"
 *
 * ActionBase implements succeed/fail once; concrete actions only
 * implement act(). One Action object is created per invocation, so an
 * action may remember what it touched during act() (the related resources
 * reported in the outcome event).
 */

#include "orca/actions/action_spec.hpp"
#include "orca/actions/notification_sink.hpp"
#include "orca/automations/types.hpp"
#include "orca/core/result.hpp"
#include "orca/events/event.hpp"
#include "orca/orchestration/client.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace orca::actions {

inline const std::string kTargetRole = "target";

struct ActionResult {
    int status_code = 200;
};

struct ActionFailure {
    std::string reason;
};

// Where outcome events go; the service routes them back into ingestion
using OutcomeEmitter = std::function<void(events::Event)>;

struct ActionContext {
    orchestration::OrchestrationClient& orchestration;
    NotificationSink& notifications;
    OutcomeEmitter emit;
    std::string event_namespace = "prefect-cloud";
};

class Action {
public:
    virtual ~Action() = default;

    virtual const char* type() const = 0;

    virtual Result<ActionResult, ActionFailure> act(const automations::TriggeredAction& triggered) = 0;

    virtual void succeed(const automations::TriggeredAction& triggered, const ActionResult& result) = 0;

    virtual void fail(const automations::TriggeredAction& triggered, const std::string& reason) = 0;
};

class ActionBase : public Action {
public:
    explicit ActionBase(ActionContext& context) : context_(context) {}

    void succeed(const automations::TriggeredAction& triggered, const ActionResult& result) override;

    void fail(const automations::TriggeredAction& triggered, const std::string& reason) override;

    const std::vector<events::RelatedResource>& resulting_related() const { return related_; }

protected:
    // Records a resource the action affected; reported in the outcome event
    void add_related(const std::string& resource_id, const std::string& role);

    ActionContext& context_;

private:
    events::Event outcome_event(const automations::TriggeredAction& triggered,
                                const std::string& outcome,
                                nlohmann::json payload) const;

    std::vector<events::RelatedResource> related_;
};

/**
 * @brief Target resolution shared by flow-run and deployment actions
 *
 * Looks at the triggering labels first, then the triggering event's
 * primary resource, then its related resources, and returns the first
 * resource id with the given prefix.
 */
std::optional<std::string> infer_resource(const automations::TriggeredAction& triggered,
                                          const std::string& prefix);

// Creates the executable action for one invocation
std::unique_ptr<Action> make_action(const ActionSpec& spec, ActionContext& context);

} // namespace orca::actions
