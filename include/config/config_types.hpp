#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace piiguard {

// ============================================================================
// Configuration Types
// ============================================================================

struct LoggingConfig {
    std::string level = "info";       // debug | info | warn | error
};

// Extra catalog entry, appended after the built-in patterns
struct PatternSpec {
    std::string type;
    std::string expression;
};

/**
 * @brief Complete guardian configuration
 *
 * Tier sets default to the healthcare/tenant-screening policy. An empty
 * set is meaningful (see TierClassifier modes), so absent and empty are
 * distinguished by the loaders.
 */
struct GuardianConfig {
    // Detection
    double confidence_threshold = 0.8;
    bool enable_regex = true;
    bool enable_model = false;
    std::string model_identifier;     // Recognizer plugin path
    // Longer inputs are rejected with ProtectionError before detection.
    // Custom patterns should bound their repetitions: std::regex recursion
    // depth grows with the length of a match.
    size_t max_text_bytes = 1024 * 1024;

    // Disclosure policy
    std::set<std::string> always_mask_types{
        "EMAIL", "PHONE", "SSN", "CREDIT_CARD", "PASSPORT",
        "DRIVERS_LICENSE", "MEDICAL_RECORD", "IP_ADDRESS", "BANK_ACCOUNT"};
    std::set<std::string> conditional_mask_types{
        "PERSON", "DATE_OF_BIRTH", "ZIP_CODE", "STREET_ADDRESS"};
    std::set<std::string> sensitive_trigger_types{
        "CREDIT_SCORE", "CRIMINAL_HISTORY", "EVICTION_HISTORY"};

    // Redaction
    RedactionStrategy redaction_strategy = RedactionStrategy::MASK;

    std::vector<PatternSpec> custom_patterns;
    LoggingConfig logging;
};

// Helper: parse strategy name ("mask", "hash", "partial", "remove")
[[nodiscard]] inline std::optional<RedactionStrategy> parse_redaction_strategy(std::string_view name) {
    if (name == "mask") return RedactionStrategy::MASK;
    if (name == "hash") return RedactionStrategy::HASH;
    if (name == "partial") return RedactionStrategy::PARTIAL;
    if (name == "remove") return RedactionStrategy::REMOVE;
    return std::nullopt;
}

} // namespace piiguard
