#pragma once

#include "config/config_types.hpp"

#include <string>
#include <vector>

namespace piiguard {

// ============================================================================
// ConfigLoader - Extract typed config from TOML or the environment
// ============================================================================

/**
 * TOML layout (toml++):
 * - include = "base.toml" (or an array), merged with the main file winning
 * - [detection] confidence_threshold, enable_regex, enable_model, model,
 *   max_text_bytes
 * - [policy] always_mask, conditional_mask, sensitive_trigger
 * - [redaction] strategy
 * - [logging] level
 * - [[patterns]] type, regex
 *
 * ${VAR} inside string values is expanded from the environment. Unknown
 * keys and values of the wrong type fail the load.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        GuardianConfig config;

        static LoadResult ok(GuardianConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file (includes resolved relative to it)
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML content (no include resolution)
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Load config from PII_* environment variables over the defaults
     *
     * List variables are comma separated; an empty value empties the set.
     */
    [[nodiscard]] static LoadResult load_from_env();

    /**
     * @brief Semantic checks shared by every loader and PiiGuardian
     * @return One message per problem, empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const GuardianConfig& config);

private:
    static LoadResult validate_and_return(GuardianConfig config);
};

} // namespace piiguard
