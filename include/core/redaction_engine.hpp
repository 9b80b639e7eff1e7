#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace piiguard {

struct RedactionOutcome {
    std::string text;
    std::unordered_map<std::string, std::string> redaction_map;  // entity.text -> placeholder
    std::vector<AuditEntry> audit_log;                            // Processing (descending) order
    int count = 0;
};

/**
 * @brief Rewrites approved spans of a text into placeholders
 *
 * Spans are replaced from the highest start offset down so that original
 * offsets stay valid while the text shrinks or grows. Offsets decide what
 * is replaced; entity.text keys the redaction map and feeds the HASH and
 * PARTIAL placeholders, so callers passing hand-built entities must keep
 * the two consistent.
 *
 * Strategies:
 * - MASK:     "[TYPE]"
 * - HASH:     "[TYPE:" + SHA256 first 16 hex chars + "]"
 * - PARTIAL:  first 2 + "***" + last 2 bytes ("[TYPE]" for spans of 4 bytes or less)
 * - REMOVE:   ""
 */
class RedactionEngine {
public:
    /**
     * @brief Replacement text for one entity under a strategy
     */
    [[nodiscard]] static std::string placeholder_for(
        const Entity& entity,
        RedactionStrategy strategy = RedactionStrategy::MASK);

    /**
     * @brief Apply placeholders for every approved entity
     * @param text Original text the entity offsets refer to
     * @param approved Non-overlapping entities, any order
     * @throws std::out_of_range if a span lies outside text
     * @throws std::invalid_argument if two spans overlap
     */
    [[nodiscard]] static RedactionOutcome redact(
        std::string_view text,
        const std::vector<Entity>& approved,
        RedactionStrategy strategy = RedactionStrategy::MASK);

private:
    static std::string partial_mask(std::string_view value, const std::string& type);
    static std::string hash_value(std::string_view value);
};

} // namespace piiguard
