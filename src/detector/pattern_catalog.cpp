#include "detector/pattern_catalog.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace piiguard {

namespace {

struct BuiltinPattern {
    const char* type;
    const char* expression;
};

// Order matters: on equal start and confidence the earlier entry wins resolution.
// Every repetition is bounded. std::regex recurses once per repeated character,
// so an unbounded + or * over a long token exhausts the stack.
constexpr BuiltinPattern kBuiltinPatterns[] = {
    // Direct identifiers
    {"SSN", R"(\b\d{3}-\d{2}-\d{4}\b|\b\d{9}\b)"},
    {"PHONE", R"(\b(?:\+?1[-.\s]?)?\(?([0-9]{3})\)?[-.\s]?([0-9]{3})[-.\s]?([0-9]{4})\b)"},
    {"EMAIL", R"(\b[A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9.-]{1,253}\.[A-Za-z]{2,63}\b)"},
    {"CREDIT_CARD", R"(\b(?:\d{4}[-\s]?){3}\d{4}\b)"},
    {"ZIP_CODE", R"(\b\d{5}(?:-\d{4})?\b)"},
    {"IP_ADDRESS",
     R"(\b(?:(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\.){3}(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\b)"},
    {"URL",
     R"(https?://(?:www\.)?[-a-zA-Z0-9@:%._+~#=]{1,256}\.[a-zA-Z0-9()]{1,6}\b(?:[-a-zA-Z0-9()@:%_+.~#?&/=]{0,2048}))"},
    {"STREET_ADDRESS",
     R"(\b\d{1,5}\s{1,16}[\w\s]{1,50}(?:Street|St|Avenue|Ave|Road|Rd|Boulevard|Blvd|Lane|Ln|Drive|Dr|Court|Ct|Way|Place|Pl)\.?\b)"},
    {"DATE_OF_BIRTH", R"(\b(?:0?[1-9]|1[0-2])[/-](?:0?[1-9]|[12]\d|3[01])[/-](?:19|20)\d{2}\b)"},
    {"BANK_ACCOUNT", R"(\b\d{8,17}\b)"},
    {"DRIVERS_LICENSE", R"(\b[A-Z]{1,2}\d{5,8}\b)"},
    {"PASSPORT", R"(\b[A-Z]\d{8}\b)"},
    {"MEDICAL_RECORD", R"(\b(?:MRN|Medical\s{1,16}Record)[:\s#]{0,16}([A-Z0-9]{6,12})\b)"},

    // Domain-specific identifiers
    {"EMPLOYEE_ID", R"(\b(?:EMP|EMPLOYEE)[:\s#-]{0,16}([A-Z0-9]{4,10})\b)"},
    {"POLICY_NUMBER", R"(\b(?:POL|Policy)[:\s#-]{0,16}([A-Z0-9]{6,15})\b)"},
    {"ACCOUNT_NUMBER", R"(\b(?:ACCT|Account)[:\s#-]{0,16}(\d{6,15})\b)"},

    // Sensitive context (unlock signals under the default policy)
    {"CREDIT_SCORE", R"(\bcredit\s{1,16}score[:\s]{0,16}\d{3}\b)"},
    {"CRIMINAL_HISTORY",
     R"(\b(?:prior\s{1,16})?(?:felony|misdemeanor)(?:\s{1,16}conviction)?\b|\bcriminal\s{1,16}(?:record|history)\b)"},
    {"EVICTION_HISTORY", R"(\b(?:prior\s{1,16})?eviction(?:\s{1,16}(?:record|history|notice))?\b)"},
};

} // anonymous namespace

// ============================================================================
// Entry
// ============================================================================

std::vector<PatternMatch> PatternCatalog::Entry::find_all(std::string_view text) const {
    if (!regex) {
        throw std::runtime_error(std::format("pattern not compiled: {}", compile_error));
    }

    std::vector<PatternMatch> matches;
    const char* begin = text.data();
    const char* end = text.data() + text.size();

    for (std::cregex_iterator it(begin, end, *regex), last; it != last; ++it) {
        const auto& m = *it;
        if (m.length(0) == 0) continue;
        const auto start = static_cast<size_t>(m.position(0));
        const auto len = static_cast<size_t>(m.length(0));
        matches.push_back({std::string(text.substr(start, len)), start, start + len});
    }
    return matches;
}

// ============================================================================
// PatternCatalog
// ============================================================================

PatternCatalog PatternCatalog::defaults() {
    PatternCatalog catalog;
    for (const auto& p : kBuiltinPatterns) {
        catalog.add(p.type, p.expression);
    }
    return catalog;
}

Result<std::shared_ptr<const std::regex>> PatternCatalog::compile(const std::string& expression) {
    if (expression.empty()) {
        return Result<std::shared_ptr<const std::regex>>::error(
            ErrorCategory::PATTERN_ERROR, "empty expression");
    }
    try {
        std::shared_ptr<const std::regex> re = std::make_shared<std::regex>(
            expression,
            std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
        return Result<std::shared_ptr<const std::regex>>::ok(std::move(re));
    } catch (const std::regex_error& e) {
        return Result<std::shared_ptr<const std::regex>>::error(
            ErrorCategory::PATTERN_ERROR, e.what());
    }
}

void PatternCatalog::add(std::string type, std::string expression) {
    Entry entry;
    entry.type = std::move(type);
    entry.expression = std::move(expression);

    auto compiled = compile(entry.expression);
    if (compiled.is_ok()) {
        entry.regex = std::move(compiled.value());
    } else {
        entry.compile_error = compiled.error_message();
        utils::log::warn(std::format("Pattern [{}] failed to compile: {}",
            entry.type, entry.compile_error));
    }

    auto it = std::find_if(entries_.begin(), entries_.end(),
        [&entry](const Entry& e) { return e.type == entry.type; });
    if (it != entries_.end()) {
        *it = std::move(entry);
    } else {
        entries_.emplace_back(std::move(entry));
    }
}

const PatternCatalog::Entry* PatternCatalog::find(std::string_view type) const {
    for (const auto& e : entries_) {
        if (e.type == type) return &e;
    }
    return nullptr;
}

} // namespace piiguard
