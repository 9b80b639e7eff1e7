#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"

#include <set>
#include <string>
#include <vector>

namespace piiguard {

/**
 * @brief Three sets of entity type names driving approval
 *
 * Tier 1 (always_mask) is masked whenever present. Tier 2
 * (conditional_mask) is masked only when unlocked by a Tier 1 entity or a
 * sensitive trigger in the same text. Triggers themselves are never masked.
 * Disjointness is by convention, not enforced.
 */
struct DisclosurePolicy {
    std::set<std::string> always_mask;
    std::set<std::string> conditional_mask;
    std::set<std::string> sensitive_trigger;

    [[nodiscard]] static DisclosurePolicy from_config(const GuardianConfig& config);
};

enum class ClassificationMode {
    TIERED,         // conditional or trigger set configured
    FLAT,           // only always_mask configured
    UNRESTRICTED    // nothing configured: approve everything
};

class TierClassifier {
public:
    [[nodiscard]] static ClassificationMode mode(const DisclosurePolicy& policy);

    /**
     * @brief Filter resolved entities down to the approved set
     * @param resolved Non-overlapping entities, ascending by start
     * @return Approved entities, relative order preserved
     */
    [[nodiscard]] static std::vector<Entity> classify(
        const std::vector<Entity>& resolved,
        const DisclosurePolicy& policy);
};

inline const char* classification_mode_to_string(ClassificationMode mode) {
    switch (mode) {
        case ClassificationMode::TIERED: return "tiered";
        case ClassificationMode::FLAT: return "flat";
        case ClassificationMode::UNRESTRICTED: return "unrestricted";
        default: return "unknown";
    }
}

} // namespace piiguard
