#pragma once

#include "core/error.hpp"

#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace piiguard {

struct PatternMatch {
    std::string text;
    size_t start;
    size_t end;
};

/**
 * @brief Ordered table of entity type -> case-insensitive matcher
 *
 * Expressions are compiled once when added (ECMAScript, icase). An
 * expression that fails to compile is kept with its error so the detector
 * can report and skip it; it never prevents other entries from running.
 * Adding a type that already exists replaces its expression in place.
 *
 * Copies share compiled expressions; the catalog is effectively immutable
 * once handed to a detector.
 */
class PatternCatalog {
public:
    struct Entry {
        std::string type;
        std::string expression;
        std::shared_ptr<const std::regex> regex;   // null when compilation failed
        std::string compile_error;

        [[nodiscard]] bool compiled() const { return regex != nullptr; }

        /**
         * @brief Run the matcher over the whole text
         * @return Non-empty matches with byte offsets into text
         * @throws std::regex_error on evaluation failure, std::runtime_error if not compiled
         */
        [[nodiscard]] std::vector<PatternMatch> find_all(std::string_view text) const;
    };

    PatternCatalog() = default;

    /**
     * @brief Built-in table (direct identifiers, quasi-identifiers, domain ids,
     *        sensitive-context phrases)
     */
    [[nodiscard]] static PatternCatalog defaults();

    [[nodiscard]] static Result<std::shared_ptr<const std::regex>> compile(
        const std::string& expression);

    void add(std::string type, std::string expression);

    [[nodiscard]] const std::vector<Entry>& entries() const { return entries_; }
    [[nodiscard]] const Entry* find(std::string_view type) const;
    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

private:
    std::vector<Entry> entries_;
};

} // namespace piiguard
