#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"
#include "detector/pattern_catalog.hpp"
#include "detector/recognition_model.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace piiguard {

/**
 * @brief Code-defined detection step run over the whole text
 *
 * The callable returns entities with offsets into the text it was given.
 * Exceptions are not absorbed by the detector.
 */
struct DetectionRule {
    std::string name;
    std::function<std::vector<Entity>(std::string_view text)> detect;
};

/**
 * @brief Built-in AGE_OVER_89 rule: "age"/"aged" followed by a 2-3 digit
 *        number greater than 89
 */
[[nodiscard]] DetectionRule age_over_89_rule();

/**
 * @brief Produces unresolved PII candidates from three layers
 *
 * Pattern layer (catalog, if enabled) ++ model layer (if enabled and a model
 * is present) ++ rule layer (always). Candidates may overlap and may fall
 * below the confidence threshold; resolution happens afterwards.
 */
class EntityDetector {
public:
    static constexpr double kPatternConfidence = 0.95;
    static constexpr double kModelConfidence = 0.85;
    static constexpr double kAgeRuleConfidence = 0.9;

    EntityDetector(const GuardianConfig& config,
                   PatternCatalog catalog,
                   std::shared_ptr<const IRecognitionModel> model = nullptr);

    [[nodiscard]] std::vector<Entity> detect_all(std::string_view text) const;

    // Individual layers, each honouring its enable flag
    [[nodiscard]] std::vector<Entity> detect_patterns(std::string_view text) const;
    [[nodiscard]] std::vector<Entity> detect_model(std::string_view text) const;
    [[nodiscard]] std::vector<Entity> detect_rules(std::string_view text) const;

    // Construction-phase only: must not race with detection
    void add_rule(DetectionRule rule);
    void add_pattern(std::string type, std::string expression);

    [[nodiscard]] const PatternCatalog& catalog() const { return catalog_; }
    [[nodiscard]] bool model_available() const { return enable_model_ && model_ != nullptr; }
    [[nodiscard]] size_t rule_count() const { return rules_.size(); }

private:
    bool enable_patterns_;
    bool enable_model_;
    PatternCatalog catalog_;
    std::shared_ptr<const IRecognitionModel> model_;
    std::vector<DetectionRule> rules_;
};

} // namespace piiguard
