#include <catch2/catch_test_macros.hpp>
#include "detector/pattern_catalog.hpp"

#include <stdexcept>

using namespace piiguard;

namespace {

std::vector<PatternMatch> matches_for(const PatternCatalog& catalog, std::string_view type,
                                      std::string_view text) {
    const auto* entry = catalog.find(type);
    REQUIRE(entry != nullptr);
    REQUIRE(entry->compiled());
    return entry->find_all(text);
}

} // anonymous namespace

TEST_CASE("PatternCatalog: defaults ship the built-in table in order", "[catalog]") {
    const auto catalog = PatternCatalog::defaults();

    REQUIRE(catalog.size() == 19);
    CHECK(catalog.entries().front().type == "SSN");
    CHECK(catalog.entries()[1].type == "PHONE");
    CHECK(catalog.entries()[2].type == "EMAIL");
    CHECK(catalog.entries().back().type == "EVICTION_HISTORY");

    for (const auto& entry : catalog.entries()) {
        INFO(entry.type);
        CHECK(entry.compiled());
        CHECK(entry.compile_error.empty());
    }
}

TEST_CASE("PatternCatalog: SSN match carries byte offsets", "[catalog]") {
    const auto catalog = PatternCatalog::defaults();
    const auto matches = matches_for(catalog, "SSN", "SSN: 123-45-6789, zip 10001.");

    REQUIRE(matches.size() == 1);
    CHECK(matches[0].text == "123-45-6789");
    CHECK(matches[0].start == 5);
    CHECK(matches[0].end == 16);
}

TEST_CASE("PatternCatalog: matching is case-insensitive", "[catalog]") {
    const auto catalog = PatternCatalog::defaults();

    SECTION("Sensitive phrase in upper case") {
        const auto matches = matches_for(catalog, "CRIMINAL_HISTORY", "HAS A PRIOR FELONY CONVICTION");
        REQUIRE(matches.size() == 1);
        CHECK(matches[0].text == "PRIOR FELONY CONVICTION");
    }

    SECTION("Email domain in mixed case") {
        const auto matches = matches_for(catalog, "EMAIL", "write to John.Doe@Example.ORG today");
        REQUIRE(matches.size() == 1);
        CHECK(matches[0].text == "John.Doe@Example.ORG");
    }

    SECTION("Credit score phrase") {
        const auto matches = matches_for(catalog, "CREDIT_SCORE", "Credit Score: 540");
        REQUIRE(matches.size() == 1);
        CHECK(matches[0].start == 0);
    }
}

TEST_CASE("PatternCatalog: all matches are reported", "[catalog]") {
    const auto catalog = PatternCatalog::defaults();
    const auto matches = matches_for(catalog, "ZIP_CODE", "from 10001 to 94105-1234");

    REQUIRE(matches.size() == 2);
    CHECK(matches[0].text == "10001");
    CHECK(matches[1].text == "94105-1234");
}

TEST_CASE("PatternCatalog: invalid expression is kept with its error", "[catalog]") {
    PatternCatalog catalog;
    catalog.add("BROKEN", "([unclosed");
    catalog.add("BADGE", R"(BADGE-\d{6})");

    REQUIRE(catalog.size() == 2);
    const auto* broken = catalog.find("BROKEN");
    REQUIRE(broken != nullptr);
    CHECK_FALSE(broken->compiled());
    CHECK_FALSE(broken->compile_error.empty());
    CHECK_THROWS_AS(broken->find_all("anything"), std::runtime_error);

    const auto* badge = catalog.find("BADGE");
    REQUIRE(badge != nullptr);
    CHECK(badge->compiled());
    CHECK(badge->find_all("badge-123456").size() == 1);
}

TEST_CASE("PatternCatalog: adding an existing type replaces it in place", "[catalog]") {
    auto catalog = PatternCatalog::defaults();
    const auto before = catalog.size();

    catalog.add("EMAIL", R"(\bmail:\w+\b)");

    REQUIRE(catalog.size() == before);
    CHECK(catalog.entries()[2].type == "EMAIL");
    CHECK(catalog.entries()[2].expression == R"(\bmail:\w+\b)");
    CHECK(catalog.find("EMAIL")->find_all("a@b.com").empty());
}

TEST_CASE("PatternCatalog: empty matches are skipped", "[catalog]") {
    PatternCatalog catalog;
    catalog.add("XS", "x*");

    const auto* entry = catalog.find("XS");
    REQUIRE(entry != nullptr);
    CHECK(entry->find_all("abc").empty());

    const auto matches = entry->find_all("axxb");
    REQUIRE(matches.size() == 1);
    CHECK(matches[0].text == "xx");
    CHECK(matches[0].start == 1);
    CHECK(matches[0].end == 3);
}

TEST_CASE("PatternCatalog: compile reports errors through Result", "[catalog]") {
    SECTION("Valid expression") {
        const auto result = PatternCatalog::compile(R"(\d+)");
        REQUIRE(result.is_ok());
        CHECK(result.value() != nullptr);
    }

    SECTION("Empty expression") {
        const auto result = PatternCatalog::compile("");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::PATTERN_ERROR);
    }

    SECTION("Malformed expression") {
        const auto result = PatternCatalog::compile("(abc");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::PATTERN_ERROR);
        CHECK_FALSE(result.error_message().empty());
    }
}

TEST_CASE("PatternCatalog: find returns null for unknown type", "[catalog]") {
    const auto catalog = PatternCatalog::defaults();
    CHECK(catalog.find("NOT_A_TYPE") == nullptr);
    CHECK(PatternCatalog{}.empty());
}
