#include "core/guardian.hpp"
#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/redaction_engine.hpp"
#include "core/utils.hpp"
#include "detector/entity_resolver.hpp"
#include "plugin/plugin_loader.hpp"

#include <format>
#include <set>
#include <stdexcept>

namespace piiguard {

// ============================================================================
// Construction
// ============================================================================

GuardianConfig PiiGuardian::validated(GuardianConfig config) {
    const auto errors = ConfigLoader::validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Invalid guardian configuration:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        throw ConfigurationError(combined);
    }
    return config;
}

std::shared_ptr<const IRecognitionModel> PiiGuardian::load_model(
    const GuardianConfig& config, std::shared_ptr<const IRecognitionModel> model) {
    if (model || !config.enable_model || config.model_identifier.empty()) {
        return model;
    }
    return PluginRecognitionModel::load(config.model_identifier);
}

PiiGuardian::PiiGuardian(GuardianConfig config)
    : PiiGuardian(std::move(config), PatternCatalog::defaults(), nullptr) {}

PiiGuardian::PiiGuardian(GuardianConfig config,
                         PatternCatalog catalog,
                         std::shared_ptr<const IRecognitionModel> model)
    : config_(validated(std::move(config))),
      policy_(DisclosurePolicy::from_config(config_)),
      detector_(config_, std::move(catalog), load_model(config_, std::move(model))) {

    utils::log::info(std::format(
        "PiiGuardian initialized: strategy={}, confidence_threshold={}, patterns={}, model={}, mode={}",
        redaction_strategy_to_string(config_.redaction_strategy),
        config_.confidence_threshold,
        detector_.catalog().size(),
        detector_.model_available() ? "on" : "off",
        classification_mode_to_string(TierClassifier::mode(policy_))));
}

void PiiGuardian::add_rule(DetectionRule rule) {
    detector_.add_rule(std::move(rule));
}

void PiiGuardian::add_pattern(std::string type, std::string expression) {
    detector_.add_pattern(std::move(type), std::move(expression));
}

// ============================================================================
// Pipeline
// ============================================================================

std::vector<Entity> PiiGuardian::approve(std::string_view text) const {
    if (text.size() > config_.max_text_bytes) {
        throw std::length_error(std::format("text is {} bytes, limit is {} (detection.max_text_bytes)",
            text.size(), config_.max_text_bytes));
    }

    const utils::Timer timer;
    auto candidates = detector_.detect_all(text);
    const auto candidate_count = candidates.size();
    auto resolved = EntityResolver::resolve(std::move(candidates), config_.confidence_threshold);
    auto approved = TierClassifier::classify(resolved, policy_);

    utils::log::debug(std::format("Pipeline: {} candidates, {} resolved, {} approved in {}us",
        candidate_count, resolved.size(), approved.size(), timer.elapsed_us().count()));
    return approved;
}

ProtectionResult PiiGuardian::protect(std::string_view text) const {
    try {
        auto approved = approve(text);
        auto outcome = RedactionEngine::redact(text, approved, config_.redaction_strategy);

        ProtectionResult result;
        result.text = std::move(outcome.text);
        result.pii_count = outcome.count;
        result.entities = std::move(approved);
        result.redaction_map = std::move(outcome.redaction_map);
        result.audit_log = std::move(outcome.audit_log);
        return result;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Protection failed: {}", e.what()));
        throw ProtectionError(std::format("Failed to protect text: {}", e.what()));
    } catch (...) {
        utils::log::error("Protection failed: unknown error");
        throw ProtectionError("Failed to protect text: unknown error");
    }
}

std::vector<Entity> PiiGuardian::detect_only(std::string_view text) const {
    try {
        return approve(text);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Detection failed: {}", e.what()));
        throw ProtectionError(std::format("Failed to detect PII: {}", e.what()));
    } catch (...) {
        utils::log::error("Detection failed: unknown error");
        throw ProtectionError("Failed to detect PII: unknown error");
    }
}

std::vector<ProtectionResult> PiiGuardian::protect_batch(const std::vector<std::string>& texts) const {
    std::vector<ProtectionResult> results;
    results.reserve(texts.size());

    for (const auto& text : texts) {
        try {
            results.push_back(protect(text));
        } catch (const ProtectionError& e) {
            utils::log::warn(std::format("Batch item failed: {}", e.what()));

            ProtectionResult failed;
            failed.text = text;
            failed.pii_count = ProtectionResult::kErrorCount;
            AuditEntry entry;
            entry.error = e.what();
            failed.audit_log.push_back(std::move(entry));
            results.push_back(std::move(failed));
        }
    }
    return results;
}

nlohmann::json PiiGuardian::protect_chunks(const nlohmann::json& chunks,
                                           const std::string& text_key) const {
    if (!chunks.is_array()) {
        throw ProtectionError("protect_chunks expects a JSON array");
    }
    nlohmann::json output = nlohmann::json::array();

    size_t redacted = 0;
    for (const auto& chunk : chunks) {
        if (!chunk.is_object()) {
            output.push_back(chunk);
            continue;
        }
        const auto it = chunk.find(text_key);
        if (it == chunk.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
            output.push_back(chunk);
            continue;
        }

        nlohmann::json item = chunk;
        if (!item.contains("metadata") || !item["metadata"].is_object()) {
            item["metadata"] = nlohmann::json::object();
        }
        auto& metadata = item["metadata"];

        try {
            const auto result = protect(it->get_ref<const std::string&>());

            std::set<std::string> types;
            for (const auto& e : result.entities) {
                types.insert(e.type);
            }

            item[text_key] = result.text;
            metadata["pii_redacted"] = result.has_pii();
            metadata["pii_count"] = result.pii_count;
            metadata["pii_types"] = types;
            if (result.has_pii()) ++redacted;
        } catch (const ProtectionError& e) {
            utils::log::warn(std::format("Chunk failed: {}", e.what()));
            metadata["pii_redacted"] = false;
            metadata["pii_count"] = ProtectionResult::kErrorCount;
            metadata["pii_error"] = e.what();
        }
        output.push_back(std::move(item));
    }

    utils::log::info(std::format("Protected {} chunks, {} contained PII", output.size(), redacted));
    return output;
}

bool PiiGuardian::is_safe(std::string_view text, int threshold) const {
    try {
        return protect(text).pii_count <= threshold;
    } catch (const ProtectionError& e) {
        utils::log::warn(std::format("Safety check failed closed: {}", e.what()));
        return false;
    }
}

} // namespace piiguard
