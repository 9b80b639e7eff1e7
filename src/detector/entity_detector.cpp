#include "detector/entity_detector.hpp"
#include "core/utils.hpp"

#include <format>
#include <iterator>
#include <regex>

namespace piiguard {

namespace {

bool valid_span(size_t start, size_t end, size_t text_size) {
    return start < end && end <= text_size;
}

} // anonymous namespace

// ============================================================================
// Built-in rules
// ============================================================================

DetectionRule age_over_89_rule() {
    DetectionRule rule;
    rule.name = "AGE_OVER_89";
    rule.detect = [](std::string_view text) {
        static const std::regex age_re(
            R"(\b(?:age|aged)[\s:]{0,16}(\d{2,3})\b)",
            std::regex::ECMAScript | std::regex::icase | std::regex::optimize);

        std::vector<Entity> found;
        const char* begin = text.data();
        const char* end = text.data() + text.size();
        for (std::cregex_iterator it(begin, end, age_re), last; it != last; ++it) {
            const auto& m = *it;
            const int age = std::stoi(m[1].str());
            if (age <= 89) continue;
            const auto start = static_cast<size_t>(m.position(0));
            const auto length = static_cast<size_t>(m.length(0));
            found.emplace_back("AGE_OVER_89", m.str(0), start, start + length,
                               EntityDetector::kAgeRuleConfidence, DetectionMethod::RULE);
        }
        return found;
    };
    return rule;
}

// ============================================================================
// EntityDetector
// ============================================================================

EntityDetector::EntityDetector(const GuardianConfig& config,
                               PatternCatalog catalog,
                               std::shared_ptr<const IRecognitionModel> model)
    : enable_patterns_(config.enable_regex),
      enable_model_(config.enable_model),
      catalog_(std::move(catalog)),
      model_(std::move(model)) {

    for (const auto& spec : config.custom_patterns) {
        catalog_.add(spec.type, spec.expression);
    }

    if (enable_model_ && !model_) {
        utils::log::warn("Model layer enabled but no recognition model is available; "
                         "model layer disabled");
    }

    rules_.push_back(age_over_89_rule());
}

std::vector<Entity> EntityDetector::detect_all(std::string_view text) const {
    auto entities = detect_patterns(text);

    auto model_entities = detect_model(text);
    entities.insert(entities.end(),
                    std::make_move_iterator(model_entities.begin()),
                    std::make_move_iterator(model_entities.end()));

    auto rule_entities = detect_rules(text);
    entities.insert(entities.end(),
                    std::make_move_iterator(rule_entities.begin()),
                    std::make_move_iterator(rule_entities.end()));

    return entities;
}

std::vector<Entity> EntityDetector::detect_patterns(std::string_view text) const {
    std::vector<Entity> entities;
    if (!enable_patterns_) return entities;

    for (const auto& entry : catalog_.entries()) {
        if (!entry.compiled()) {
            utils::log::debug(std::format("Pattern {} skipped: {}", entry.type, entry.compile_error));
            continue;
        }
        try {
            for (auto& match : entry.find_all(text)) {
                entities.emplace_back(entry.type, std::move(match.text), match.start, match.end,
                                      kPatternConfidence, DetectionMethod::PATTERN);
            }
        } catch (const std::exception& e) {
            utils::log::warn(std::format("Pattern {} failed during matching: {}", entry.type, e.what()));
        }
    }

    utils::log::debug(std::format("Pattern layer: {} candidates", entities.size()));
    return entities;
}

std::vector<Entity> EntityDetector::detect_model(std::string_view text) const {
    std::vector<Entity> entities;
    if (!model_available()) return entities;

    std::vector<RecognizedSpan> spans;
    try {
        spans = model_->recognize(text);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Model {} failed: {}", model_->name(), e.what()));
        return entities;
    }

    for (auto& span : spans) {
        auto type = map_model_label(span.label);
        if (!type) continue;
        if (!valid_span(span.start, span.end, text.size())) {
            utils::log::warn(std::format("Model {} span [{}, {}) out of range; dropped",
                                         *type, span.start, span.end));
            continue;
        }
        std::string matched(text.substr(span.start, span.end - span.start));
        entities.emplace_back(std::move(*type), std::move(matched), span.start, span.end,
                              kModelConfidence, DetectionMethod::MODEL);
    }

    utils::log::debug(std::format("Model layer: {} candidates", entities.size()));
    return entities;
}

std::vector<Entity> EntityDetector::detect_rules(std::string_view text) const {
    std::vector<Entity> entities;
    for (const auto& rule : rules_) {
        if (!rule.detect) continue;
        for (auto& entity : rule.detect(text)) {
            if (!valid_span(entity.start, entity.end, text.size())) {
                utils::log::warn(std::format("Rule {} span [{}, {}) out of range; dropped",
                                             rule.name, entity.start, entity.end));
                continue;
            }
            entities.push_back(std::move(entity));
        }
    }

    utils::log::debug(std::format("Rule layer: {} candidates", entities.size()));
    return entities;
}

void EntityDetector::add_rule(DetectionRule rule) {
    rules_.push_back(std::move(rule));
}

void EntityDetector::add_pattern(std::string type, std::string expression) {
    catalog_.add(std::move(type), std::move(expression));
}

} // namespace piiguard
