#pragma once

#include "classifier/tier_classifier.hpp"
#include "config/config_types.hpp"
#include "core/types.hpp"
#include "detector/entity_detector.hpp"
#include "detector/pattern_catalog.hpp"
#include "detector/recognition_model.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace piiguard {

/**
 * @brief Detect -> resolve -> classify -> redact facade
 *
 * Holds only construction-time state (compiled catalog, model handle, rule
 * list, policy). Concurrent protect() calls on one instance are safe as
 * long as the recognition model is; add_rule()/add_pattern() must finish
 * before the instance is shared.
 */
class PiiGuardian {
public:
    /**
     * @brief Build with the default catalog; loads the recognizer plugin named
     *        by config.model_identifier when the model layer is enabled
     * @throws ConfigurationError if the config fails validation
     */
    explicit PiiGuardian(GuardianConfig config = {});

    /**
     * @brief Build with an explicit catalog and model
     * @throws ConfigurationError if the config fails validation
     */
    PiiGuardian(GuardianConfig config,
                PatternCatalog catalog,
                std::shared_ptr<const IRecognitionModel> model);

    /**
     * @throws ProtectionError wrapping any failure, including text longer
     *         than max_text_bytes
     */
    [[nodiscard]] ProtectionResult protect(std::string_view text) const;

    /**
     * @brief Sequential protect() with per-item isolation
     *
     * A failed item keeps its original text, pii_count == -1 and a single
     * audit entry carrying the error message.
     */
    [[nodiscard]] std::vector<ProtectionResult> protect_batch(const std::vector<std::string>& texts) const;

    /**
     * @brief Redact text_key of each object in a JSON array of chunks
     *
     * Metadata {pii_redacted, pii_count, pii_types} is merged into
     * item["metadata"]. Items without a non-empty string under text_key,
     * and non-object items, pass through unchanged.
     * @throws ProtectionError if chunks is not an array
     */
    [[nodiscard]] nlohmann::json protect_chunks(const nlohmann::json& chunks,
                                                const std::string& text_key = "text") const;

    /**
     * @brief Approved entities without rewriting the text
     * @throws ProtectionError wrapping any failure
     */
    [[nodiscard]] std::vector<Entity> detect_only(std::string_view text) const;

    /**
     * @return approved count <= threshold; false if protection fails
     */
    [[nodiscard]] bool is_safe(std::string_view text, int threshold = 0) const;

    void add_rule(DetectionRule rule);
    void add_pattern(std::string type, std::string expression);

    [[nodiscard]] const GuardianConfig& config() const { return config_; }
    [[nodiscard]] const DisclosurePolicy& policy() const { return policy_; }
    [[nodiscard]] const EntityDetector& detector() const { return detector_; }

private:
    static GuardianConfig validated(GuardianConfig config);
    static std::shared_ptr<const IRecognitionModel> load_model(
        const GuardianConfig& config, std::shared_ptr<const IRecognitionModel> model);

    // detect -> resolve -> classify
    [[nodiscard]] std::vector<Entity> approve(std::string_view text) const;

    GuardianConfig config_;
    DisclosurePolicy policy_;
    EntityDetector detector_;
};

} // namespace piiguard
