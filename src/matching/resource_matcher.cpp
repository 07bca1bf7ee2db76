#include "orca/matching/resource_matcher.hpp"

#include <algorithm>

namespace orca::matching {

bool value_matches(const std::string& pattern, const std::string& value) noexcept {
    if (pattern == "*") {
        return true;
    }
    if (!pattern.empty() && pattern.back() == '*') {
        const std::size_t prefix_len = pattern.size() - 1;
        return value.size() >= prefix_len && value.compare(0, prefix_len, pattern, 0, prefix_len) == 0;
    }
    return pattern == value;
}

bool matches(const ResourceSpecification& spec, const events::Resource& resource) noexcept {
    for (const auto& [label, accepted] : spec.labels) {
        auto it = resource.labels.find(label);
        if (it == resource.labels.end()) {
            return false;
        }
        const auto& actual = it->second;
        const bool any = std::any_of(accepted.begin(), accepted.end(),
            [&actual](const std::string& pattern) { return value_matches(pattern, actual); });
        if (!any) {
            return false;
        }
    }
    return true;
}

bool matches_related(const ResourceSpecification& spec,
                     const std::vector<events::RelatedResource>& related) noexcept {
    if (spec.empty()) {
        return true;
    }
    return std::any_of(related.begin(), related.end(),
        [&spec](const events::RelatedResource& r) { return matches(spec, r); });
}

bool matches_event_name(const std::set<std::string>& patterns, const std::string& name) noexcept {
    return std::any_of(patterns.begin(), patterns.end(),
        [&name](const std::string& pattern) { return value_matches(pattern, name); });
}

Result<void, Error> validate_pattern(const std::string& pattern, const std::string& context) {
    if (pattern.empty()) {
        return Err<void>(Error::configuration(context + ": pattern must not be empty"));
    }
    const auto star = pattern.find('*');
    if (star != std::string::npos && star != pattern.size() - 1) {
        return Err<void>(Error::configuration(
            context + ": wildcard '*' is only allowed at the end of a pattern, got '" + pattern + "'"));
    }
    return Ok();
}

Result<void, Error> validate(const ResourceSpecification& spec, const std::string& context) {
    for (const auto& [label, values] : spec.labels) {
        if (label.empty()) {
            return Err<void>(Error::configuration(context + ": label names must not be empty"));
        }
        if (values.empty()) {
            return Err<void>(Error::configuration(context + ": label '" + label + "' has no values"));
        }
        for (const auto& value : values) {
            auto result = validate_pattern(value, context + "." + label);
            if (result.is_error()) {
                return result;
            }
        }
    }
    return Ok();
}

Result<void, Error> validate_name_patterns(const std::set<std::string>& patterns, const std::string& context) {
    for (const auto& pattern : patterns) {
        auto result = validate_pattern(pattern, context);
        if (result.is_error()) {
            return result;
        }
    }
    return Ok();
}

} // namespace orca::matching
