#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace piiguard {

// ============================================================================
// Basic Enums
// ============================================================================

/**
 * @brief Which detection layer produced an entity (informational only)
 */
enum class DetectionMethod {
    PATTERN,
    MODEL,
    RULE
};

/**
 * @brief How an approved span is rewritten
 *
 * Strategies:
 * - MASK:     "[TYPE]"
 * - HASH:     "[TYPE:<16 hex of SHA-256>]" (deterministic pseudonymization)
 * - PARTIAL:  first 2 + "***" + last 2 characters, "[TYPE]" for short spans
 * - REMOVE:   empty replacement
 */
enum class RedactionStrategy {
    MASK,
    HASH,
    PARTIAL,
    REMOVE
};

// ============================================================================
// Entity
// ============================================================================

/**
 * @brief A detected candidate or approved span
 *
 * Offsets are half-open byte offsets into the original input text,
 * 0 <= start < end <= text.size(). Value object: never mutated after
 * the detection layer creates it.
 */
struct Entity {
    std::string type;           // "EMAIL", "PERSON", ... (open vocabulary)
    std::string text;           // Exact matched substring (reporting only)
    size_t start;
    size_t end;
    double confidence;          // [0, 1]
    DetectionMethod method;

    Entity() : start(0), end(0), confidence(0.0), method(DetectionMethod::PATTERN) {}

    Entity(std::string t, std::string txt, size_t s, size_t e, double conf, DetectionMethod m)
        : type(std::move(t)), text(std::move(txt)), start(s), end(e),
          confidence(conf), method(m) {}

    [[nodiscard]] size_t length() const { return end - start; }

    [[nodiscard]] bool overlaps(const Entity& other) const {
        return start < other.end && other.start < end;
    }
};

/**
 * @brief Raw span returned by a recognition model, before label mapping
 */
struct RecognizedSpan {
    std::string label;          // Model vocabulary, e.g. "GPE"
    std::string text;
    size_t start;
    size_t end;

    RecognizedSpan() : start(0), end(0) {}
    RecognizedSpan(std::string l, std::string t, size_t s, size_t e)
        : label(std::move(l)), text(std::move(t)), start(s), end(e) {}
};

// ============================================================================
// Audit Trail
// ============================================================================

struct AuditEntry {
    std::string type;
    std::string placeholder;
    size_t start;               // Original span
    size_t end;
    double confidence;
    DetectionMethod method;
    std::string error;          // Set only on the sentinel entry of a failed batch item

    AuditEntry() : start(0), end(0), confidence(0.0), method(DetectionMethod::PATTERN) {}
};

// ============================================================================
// Protection Result
// ============================================================================

/**
 * @brief Output aggregate of a single protect() call
 *
 * pii_count is the number of approved entities; kErrorCount marks a
 * batch item whose protection failed.
 */
struct ProtectionResult {
    static constexpr int kErrorCount = -1;

    std::string text;
    int pii_count;
    std::vector<Entity> entities;                               // Ascending by start
    std::unordered_map<std::string, std::string> redaction_map; // entity.text -> placeholder
    std::vector<AuditEntry> audit_log;

    ProtectionResult() : pii_count(0) {}

    [[nodiscard]] bool is_safe() const { return pii_count == 0; }
    [[nodiscard]] bool has_pii() const { return pii_count > 0; }
    [[nodiscard]] bool is_error() const { return pii_count == kErrorCount; }
};

// ============================================================================
// Utility Functions
// ============================================================================

inline const char* detection_method_to_string(DetectionMethod method) {
    switch (method) {
        case DetectionMethod::PATTERN: return "pattern";
        case DetectionMethod::MODEL: return "model";
        case DetectionMethod::RULE: return "rule";
        default: return "unknown";
    }
}

inline const char* redaction_strategy_to_string(RedactionStrategy strategy) {
    switch (strategy) {
        case RedactionStrategy::MASK: return "mask";
        case RedactionStrategy::HASH: return "hash";
        case RedactionStrategy::PARTIAL: return "partial";
        case RedactionStrategy::REMOVE: return "remove";
        default: return "unknown";
    }
}

} // namespace piiguard
