#include "orca/actions/action_spec.hpp"

#include <array>
#include <utility>

namespace orca::actions {
namespace {

template<typename T>
struct TypeName;

template<> struct TypeName<DoNothing> { static constexpr const char* value = "do-nothing"; };
template<> struct TypeName<SuspendFlowRun> { static constexpr const char* value = "suspend-flow-run"; };
template<> struct TypeName<CancelFlowRun> { static constexpr const char* value = "cancel-flow-run"; };
template<> struct TypeName<ChangeFlowRunState> { static constexpr const char* value = "change-flow-run-state"; };
template<> struct TypeName<RunDeployment> { static constexpr const char* value = "run-deployment"; };
template<> struct TypeName<PauseDeployment> { static constexpr const char* value = "pause-deployment"; };
template<> struct TypeName<ResumeDeployment> { static constexpr const char* value = "resume-deployment"; };
template<> struct TypeName<SendNotification> { static constexpr const char* value = "send-notification"; };

template<std::size_t... I>
std::array<std::pair<const char*, ActionSpec>, sizeof...(I)> make_table(std::index_sequence<I...>) {
    return {{
        {TypeName<std::variant_alternative_t<I, ActionSpec>>::value,
         ActionSpec(std::in_place_index<I>)}...
    }};
}

const auto& type_table() {
    static const auto table = make_table(std::make_index_sequence<std::variant_size_v<ActionSpec>>{});
    return table;
}

} // namespace

const char* action_type(const ActionSpec& spec) {
    return std::visit([](const auto& s) {
        return TypeName<std::decay_t<decltype(s)>>::value;
    }, spec);
}

std::optional<ActionSpec> action_for_type(const std::string& type) {
    for (const auto& [name, spec] : type_table()) {
        if (type == name) {
            return spec;
        }
    }
    return std::nullopt;
}

} // namespace orca::actions
