#include "audit/audit_json.hpp"

namespace piiguard {

void to_json(nlohmann::json& j, const Entity& entity) {
    j = nlohmann::json{
        {"type", entity.type},
        {"text", entity.text},
        {"start", entity.start},
        {"end", entity.end},
        {"confidence", entity.confidence},
        {"method", detection_method_to_string(entity.method)},
    };
}

void to_json(nlohmann::json& j, const AuditEntry& entry) {
    j = nlohmann::json{
        {"type", entry.type},
        {"placeholder", entry.placeholder},
        {"start", entry.start},
        {"end", entry.end},
        {"confidence", entry.confidence},
        {"method", detection_method_to_string(entry.method)},
    };
    if (!entry.error.empty()) {
        j["error"] = entry.error;
    }
}

void to_json(nlohmann::json& j, const ProtectionResult& result) {
    j = nlohmann::json::object();
    j["text"] = result.text;
    j["pii_count"] = result.pii_count;
    j["entities"] = result.entities;
    j["redaction_map"] = result.redaction_map;
    j["audit_log"] = result.audit_log;
}

} // namespace piiguard
