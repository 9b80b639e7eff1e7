#include <catch2/catch_test_macros.hpp>
#include "core/redaction_engine.hpp"

#include <stdexcept>

using namespace piiguard;

namespace {

Entity span_of(const std::string& type, std::string_view text, size_t start, size_t end) {
    return Entity(type, std::string(text.substr(start, end - start)), start, end,
                  0.95, DetectionMethod::PATTERN);
}

} // anonymous namespace

// ============================================================================
// Placeholders
// ============================================================================

TEST_CASE("Redaction MASK uses the upper-cased type", "[redaction]") {
    const Entity e("email", "a@b.com", 0, 7, 0.95, DetectionMethod::PATTERN);
    CHECK(RedactionEngine::placeholder_for(e) == "[EMAIL]");
    CHECK(RedactionEngine::placeholder_for(e, RedactionStrategy::MASK) == "[EMAIL]");
}

TEST_CASE("Redaction HASH is deterministic and type-tagged", "[redaction]") {
    const Entity a("EMAIL", "test@example.com", 0, 16, 0.95, DetectionMethod::PATTERN);
    const Entity b("EMAIL", "other@example.com", 0, 17, 0.95, DetectionMethod::PATTERN);

    const auto ha = RedactionEngine::placeholder_for(a, RedactionStrategy::HASH);
    CHECK(ha == RedactionEngine::placeholder_for(a, RedactionStrategy::HASH));
    CHECK(ha != RedactionEngine::placeholder_for(b, RedactionStrategy::HASH));

    REQUIRE(ha.size() == 24);   // "[EMAIL:" + 16 hex + "]"
    CHECK(ha.starts_with("[EMAIL:"));
    CHECK(ha.back() == ']');
    for (size_t i = 7; i < 23; ++i) {
        const char c = ha[i];
        CHECK(((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')));
    }
}

TEST_CASE("Redaction PARTIAL keeps two characters on each side", "[redaction]") {
    const Entity e("EMAIL", "user@example.com", 0, 16, 0.95, DetectionMethod::PATTERN);
    CHECK(RedactionEngine::placeholder_for(e, RedactionStrategy::PARTIAL) == "us***om");

    const Entity five("ZIP_CODE", "90210", 0, 5, 0.95, DetectionMethod::PATTERN);
    CHECK(RedactionEngine::placeholder_for(five, RedactionStrategy::PARTIAL) == "90***10");
}

TEST_CASE("Redaction PARTIAL falls back to MASK for short spans", "[redaction]") {
    const Entity e("PIN", "1234", 0, 4, 0.95, DetectionMethod::PATTERN);
    CHECK(RedactionEngine::placeholder_for(e, RedactionStrategy::PARTIAL) == "[PIN]");
}

TEST_CASE("Redaction REMOVE yields an empty replacement", "[redaction]") {
    const std::string text = "Email: a@b.com";
    const auto outcome = RedactionEngine::redact(text, {span_of("EMAIL", text, 7, 14)},
                                                 RedactionStrategy::REMOVE);
    CHECK(outcome.text == "Email: ");
    CHECK(outcome.count == 1);
    CHECK(outcome.audit_log[0].placeholder.empty());
}

// ============================================================================
// Text rewriting
// ============================================================================

TEST_CASE("Redaction with no entities returns the text unchanged", "[redaction]") {
    const auto outcome = RedactionEngine::redact("nothing here", {});
    CHECK(outcome.text == "nothing here");
    CHECK(outcome.count == 0);
    CHECK(outcome.redaction_map.empty());
    CHECK(outcome.audit_log.empty());
}

TEST_CASE("Redaction keeps offsets valid across length changes", "[redaction]") {
    const std::string text = "SSN: 123-45-6789, zip 10001.";
    const auto outcome = RedactionEngine::redact(text, {
        span_of("SSN", text, 5, 16),
        span_of("ZIP_CODE", text, 22, 27),
    });

    CHECK(outcome.text == "SSN: [SSN], zip [ZIP_CODE].");
    CHECK(outcome.count == 2);
    CHECK(outcome.redaction_map.at("123-45-6789") == "[SSN]");
    CHECK(outcome.redaction_map.at("10001") == "[ZIP_CODE]");
}

TEST_CASE("Redaction audit log follows descending start order", "[redaction]") {
    const std::string text = "a@b.com then 123-45-6789";
    const auto outcome = RedactionEngine::redact(text, {
        span_of("EMAIL", text, 0, 7),
        span_of("SSN", text, 13, 24),
    });

    REQUIRE(outcome.audit_log.size() == 2);
    CHECK(outcome.audit_log[0].type == "SSN");
    CHECK(outcome.audit_log[0].start == 13);
    CHECK(outcome.audit_log[0].end == 24);
    CHECK(outcome.audit_log[0].placeholder == "[SSN]");
    CHECK(outcome.audit_log[0].method == DetectionMethod::PATTERN);
    CHECK(outcome.audit_log[0].error.empty());
    CHECK(outcome.audit_log[1].type == "EMAIL");
    CHECK(outcome.text == "[EMAIL] then [SSN]");
}

TEST_CASE("Redaction map keeps the last write for repeated substrings", "[redaction]") {
    const std::string text = "12345 12345";
    const auto outcome = RedactionEngine::redact(text, {
        span_of("ZIP_CODE", text, 0, 5),
        span_of("ACCOUNT", text, 6, 11),
    });

    // Processed from the end: ACCOUNT first, then ZIP_CODE overwrites
    CHECK(outcome.text == "[ZIP_CODE] [ACCOUNT]");
    REQUIRE(outcome.redaction_map.size() == 1);
    CHECK(outcome.redaction_map.at("12345") == "[ZIP_CODE]");
    CHECK(outcome.audit_log.size() == 2);
}

TEST_CASE("Redaction map is keyed by the entity text", "[redaction]") {
    const std::string text = "Call 555-123-4567 now";
    // Offsets cover the number, the entity carries its normalised form
    const Entity e("PHONE", "5551234567", 5, 17, 0.95, DetectionMethod::PATTERN);

    const auto outcome = RedactionEngine::redact(text, {e});
    CHECK(outcome.text == "Call [PHONE] now");
    REQUIRE(outcome.redaction_map.size() == 1);
    CHECK(outcome.redaction_map.at("5551234567") == "[PHONE]");
    CHECK_FALSE(outcome.redaction_map.contains("555-123-4567"));
}

TEST_CASE("Redaction rejects invalid spans", "[redaction]") {
    const std::string text = "short";

    SECTION("Span past the end") {
        const Entity e("X", "", 2, 10, 0.9, DetectionMethod::RULE);
        CHECK_THROWS_AS(RedactionEngine::redact(text, {e}), std::out_of_range);
    }

    SECTION("Empty span") {
        const Entity e("X", "", 3, 3, 0.9, DetectionMethod::RULE);
        CHECK_THROWS_AS(RedactionEngine::redact(text, {e}), std::out_of_range);
    }

    SECTION("Overlapping spans") {
        CHECK_THROWS_AS(RedactionEngine::redact(text, {
            span_of("A", text, 0, 3),
            span_of("B", text, 2, 5),
        }), std::invalid_argument);
    }
}
