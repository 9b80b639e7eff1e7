#include <catch2/catch_test_macros.hpp>
#include "detector/entity_detector.hpp"
#include "mocks/mock_recognition_model.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>

using namespace piiguard;

namespace {

bool has_type(const std::vector<Entity>& entities, const std::string& type) {
    return std::any_of(entities.begin(), entities.end(),
        [&type](const Entity& e) { return e.type == type; });
}

GuardianConfig model_config() {
    GuardianConfig config;
    config.enable_model = true;
    return config;
}

} // anonymous namespace

// ============================================================================
// Pattern layer
// ============================================================================

TEST_CASE("EntityDetector: pattern layer tags entities", "[detector]") {
    const EntityDetector detector(GuardianConfig{}, PatternCatalog::defaults());
    const auto entities = detector.detect_patterns("Email: a@b.com");

    REQUIRE(entities.size() == 1);
    CHECK(entities[0].type == "EMAIL");
    CHECK(entities[0].text == "a@b.com");
    CHECK(entities[0].start == 7);
    CHECK(entities[0].end == 14);
    CHECK(entities[0].confidence == EntityDetector::kPatternConfidence);
    CHECK(entities[0].method == DetectionMethod::PATTERN);
}

TEST_CASE("EntityDetector: disabled pattern layer contributes nothing", "[detector]") {
    GuardianConfig config;
    config.enable_regex = false;
    const EntityDetector detector(config, PatternCatalog::defaults());

    CHECK(detector.detect_patterns("SSN: 123-45-6789").empty());

    // Rules still run
    const auto entities = detector.detect_all("Patient aged 93 was admitted.");
    REQUIRE(entities.size() == 1);
    CHECK(entities[0].type == "AGE_OVER_89");
}

TEST_CASE("EntityDetector: custom patterns are appended to the catalog", "[detector]") {
    GuardianConfig config;
    config.custom_patterns.push_back({"BADGE", R"(BADGE-\d{6})"});
    const EntityDetector detector(config, PatternCatalog::defaults());

    CHECK(detector.catalog().size() == PatternCatalog::defaults().size() + 1);
    CHECK(detector.catalog().entries().back().type == "BADGE");
    CHECK(has_type(detector.detect_all("Visitor BADGE-123456 signed in"), "BADGE"));
}

TEST_CASE("EntityDetector: broken pattern is skipped, others still run", "[detector]") {
    PatternCatalog catalog;
    catalog.add("BROKEN", "([unclosed");
    catalog.add("SSN", R"(\b\d{3}-\d{2}-\d{4}\b)");
    const EntityDetector detector(GuardianConfig{}, std::move(catalog));

    const auto entities = detector.detect_all("SSN: 123-45-6789");
    REQUIRE(entities.size() == 1);
    CHECK(entities[0].type == "SSN");
}

// ============================================================================
// Model layer
// ============================================================================

TEST_CASE("EntityDetector: model labels are mapped through the fixed table", "[detector][model]") {
    const std::string text = "John Smith moved to Boston";
    auto model = std::make_shared<test::MockRecognitionModel>();
    model->spans = {
        {"PERSON", "John Smith", 0, 10},
        {"GPE", "Boston", 20, 26},
        {"WORK_OF_ART", "moved", 11, 16},
    };
    const EntityDetector detector(model_config(), PatternCatalog::defaults(), model);

    const auto entities = detector.detect_model(text);
    REQUIRE(entities.size() == 2);
    CHECK(entities[0].type == "PERSON");
    CHECK(entities[0].text == "John Smith");
    CHECK(entities[0].confidence == EntityDetector::kModelConfidence);
    CHECK(entities[0].method == DetectionMethod::MODEL);
    CHECK(entities[1].type == "LOCATION");
    CHECK(entities[1].text == "Boston");
}

TEST_CASE("EntityDetector: label table", "[detector][model]") {
    CHECK(map_model_label("PERSON") == "PERSON");
    CHECK(map_model_label("GPE") == "LOCATION");
    CHECK(map_model_label("LOC") == "LOCATION");
    CHECK(map_model_label("ORG") == "ORGANIZATION");
    CHECK(map_model_label("DATE") == "DATE");
    CHECK(map_model_label("MONEY") == "MONEY");
    CHECK(map_model_label("CARDINAL") == "NUMBER");
    CHECK_FALSE(map_model_label("NORP").has_value());
    CHECK_FALSE(map_model_label("person").has_value());
}

TEST_CASE("EntityDetector: model spans outside the text are dropped", "[detector][model]") {
    auto model = std::make_shared<test::MockRecognitionModel>();
    model->spans = {
        {"PERSON", "Jane", 0, 4},
        {"PERSON", "ghost", 3, 40},
        {"ORG", "", 5, 5},
    };
    const EntityDetector detector(model_config(), PatternCatalog::defaults(), model);

    const auto entities = detector.detect_model("Jane left");
    REQUIRE(entities.size() == 1);
    CHECK(entities[0].text == "Jane");
}

TEST_CASE("EntityDetector: model failure yields an empty layer", "[detector][model]") {
    auto model = std::make_shared<test::MockRecognitionModel>();
    model->spans = {{"PERSON", "John", 0, 4}};
    model->fail = true;
    const EntityDetector detector(model_config(), PatternCatalog::defaults(), model);

    std::vector<Entity> entities;
    REQUIRE_NOTHROW(entities = detector.detect_all("John: a@b.com"));
    REQUIRE(entities.size() == 1);
    CHECK(entities[0].type == "EMAIL");
    CHECK(model->calls == 1);
}

TEST_CASE("EntityDetector: model is not consulted when disabled", "[detector][model]") {
    auto model = std::make_shared<test::MockRecognitionModel>();
    model->spans = {{"PERSON", "John", 0, 4}};
    const EntityDetector detector(GuardianConfig{}, PatternCatalog::defaults(), model);

    CHECK_FALSE(detector.model_available());
    CHECK(detector.detect_all("John").empty());
    CHECK(model->calls == 0);
}

TEST_CASE("EntityDetector: enabled model without a handle is unavailable", "[detector][model]") {
    const EntityDetector detector(model_config(), PatternCatalog::defaults(), nullptr);
    CHECK_FALSE(detector.model_available());
    CHECK(detector.detect_model("John Smith").empty());
}

// ============================================================================
// Rule layer
// ============================================================================

TEST_CASE("EntityDetector: age over 89 rule", "[detector][rules]") {
    const EntityDetector detector(GuardianConfig{}, PatternCatalog::defaults());

    SECTION("Age above the limit is detected with the full phrase") {
        const auto entities = detector.detect_rules("Patient aged 93 was admitted.");
        REQUIRE(entities.size() == 1);
        CHECK(entities[0].type == "AGE_OVER_89");
        CHECK(entities[0].text == "aged 93");
        CHECK(entities[0].start == 8);
        CHECK(entities[0].end == 15);
        CHECK(entities[0].confidence == EntityDetector::kAgeRuleConfidence);
        CHECK(entities[0].method == DetectionMethod::RULE);
    }

    SECTION("Colon separator and three digits") {
        const auto entities = detector.detect_rules("AGE: 105");
        REQUIRE(entities.size() == 1);
        CHECK(entities[0].text == "AGE: 105");
    }

    SECTION("Age at or below the limit is ignored") {
        CHECK(detector.detect_rules("age 89").empty());
        CHECK(detector.detect_rules("aged 45").empty());
    }
}

TEST_CASE("EntityDetector: caller rules run after the built-in rule", "[detector][rules]") {
    EntityDetector detector(GuardianConfig{}, PatternCatalog::defaults());
    const auto before = detector.rule_count();

    detector.add_rule({"TICKET", [](std::string_view text) {
        std::vector<Entity> found;
        const auto pos = text.find("TKT-");
        if (pos != std::string_view::npos) {
            found.emplace_back("TICKET", std::string(text.substr(pos, 8)), pos, pos + 8,
                               0.99, DetectionMethod::RULE);
        }
        return found;
    }});

    REQUIRE(detector.rule_count() == before + 1);
    const auto entities = detector.detect_rules("see TKT-4411 please");
    REQUIRE(entities.size() == 1);
    CHECK(entities[0].type == "TICKET");
    CHECK(entities[0].start == 4);
}

TEST_CASE("EntityDetector: rule exceptions propagate", "[detector][rules]") {
    EntityDetector detector(GuardianConfig{}, PatternCatalog::defaults());
    detector.add_rule({"EXPLODES", [](std::string_view) -> std::vector<Entity> {
        throw std::runtime_error("rule failure");
    }});

    CHECK_THROWS_AS(detector.detect_all("anything"), std::runtime_error);
}

TEST_CASE("EntityDetector: rule spans outside the text are dropped", "[detector][rules]") {
    EntityDetector detector(GuardianConfig{}, PatternCatalog::defaults());
    detector.add_rule({"SLOPPY", [](std::string_view) {
        return std::vector<Entity>{Entity("SLOPPY", "x", 2, 99, 0.9, DetectionMethod::RULE)};
    }});

    CHECK(detector.detect_rules("short").empty());
}

// ============================================================================
// Layer order
// ============================================================================

TEST_CASE("EntityDetector: layers concatenate pattern, model, rule", "[detector]") {
    const std::string text = "Ann aged 95, a@b.com";
    auto model = std::make_shared<test::MockRecognitionModel>();
    model->spans = {{"PERSON", "Ann", 0, 3}};
    const EntityDetector detector(model_config(), PatternCatalog::defaults(), model);

    const auto entities = detector.detect_all(text);
    REQUIRE(entities.size() == 3);
    CHECK(entities[0].method == DetectionMethod::PATTERN);
    CHECK(entities[0].type == "EMAIL");
    CHECK(entities[1].method == DetectionMethod::MODEL);
    CHECK(entities[2].method == DetectionMethod::RULE);
}
