#pragma once

#include "core/types.hpp"

#include <nlohmann/json.hpp>

namespace piiguard {

// ============================================================================
// JSON rendering of protection results (nlohmann ADL serializers)
// ============================================================================

/**
 * Entity:           {type, text, start, end, confidence, method}
 * AuditEntry:       {type, placeholder, start, end, confidence, method[, error]}
 * ProtectionResult: {text, pii_count, entities, redaction_map, audit_log}
 *
 * Entity text is original PII; strip it before persisting where that matters.
 */
void to_json(nlohmann::json& j, const Entity& entity);
void to_json(nlohmann::json& j, const AuditEntry& entry);
void to_json(nlohmann::json& j, const ProtectionResult& result);

} // namespace piiguard
