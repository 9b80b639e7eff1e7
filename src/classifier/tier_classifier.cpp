#include "classifier/tier_classifier.hpp"

#include <algorithm>

namespace piiguard {

DisclosurePolicy DisclosurePolicy::from_config(const GuardianConfig& config) {
    DisclosurePolicy policy;
    policy.always_mask = config.always_mask_types;
    policy.conditional_mask = config.conditional_mask_types;
    policy.sensitive_trigger = config.sensitive_trigger_types;
    return policy;
}

ClassificationMode TierClassifier::mode(const DisclosurePolicy& policy) {
    if (!policy.conditional_mask.empty() || !policy.sensitive_trigger.empty()) {
        return ClassificationMode::TIERED;
    }
    if (!policy.always_mask.empty()) {
        return ClassificationMode::FLAT;
    }
    return ClassificationMode::UNRESTRICTED;
}

std::vector<Entity> TierClassifier::classify(
    const std::vector<Entity>& resolved,
    const DisclosurePolicy& policy) {

    const auto mode = TierClassifier::mode(policy);
    if (mode == ClassificationMode::UNRESTRICTED) {
        return resolved;
    }

    const auto in = [](const std::set<std::string>& set, const Entity& e) {
        return set.contains(e.type);
    };

    bool unlocked = false;
    if (mode == ClassificationMode::TIERED) {
        unlocked = std::any_of(resolved.begin(), resolved.end(), [&](const Entity& e) {
            return in(policy.always_mask, e) || in(policy.sensitive_trigger, e);
        });
    }

    std::vector<Entity> approved;
    for (const auto& e : resolved) {
        if (in(policy.always_mask, e) || (unlocked && in(policy.conditional_mask, e))) {
            approved.push_back(e);
        }
    }
    return approved;
}

} // namespace piiguard
