#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <unordered_set>

namespace piiguard {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            s = expand_env_vars(s.get());
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            s = expand_env_vars(s.get());
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars, arrays concatenate.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Included file is the base, the including file the overlay
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

// Unknown keys and wrongly typed values are errors, never silently dropped.
void reject_unknown_keys(const toml::table& tbl, const std::string_view section,
                         std::initializer_list<std::string_view> known) {
    for (const auto& [key, val] : tbl) {
        if (std::find(known.begin(), known.end(), key.str()) == known.end()) {
            throw std::runtime_error(std::format("unknown key '{}{}'",
                section.empty() ? std::string{} : std::format("{}.", section), key.str()));
        }
    }
}

const toml::table* section_table(const toml::table& root, const std::string_view name) {
    const auto node = root[name];
    if (!node) return nullptr;
    const auto* tbl = node.as_table();
    if (!tbl) {
        throw std::runtime_error(std::format("[{}] must be a table", name));
    }
    return tbl;
}

template <typename T>
std::optional<T> typed_value(const toml::table& tbl, const std::string_view section,
                             const std::string_view key, const std::string_view expected) {
    const auto node = tbl[key];
    if (!node) return std::nullopt;
    std::optional<T> value;
    if constexpr (std::is_same_v<T, double>) {
        value = node.value<double>();        // integers widen
    } else {
        value = node.value_exact<T>();
    }
    if (!value) {
        throw std::runtime_error(std::format("{}.{} must be {}", section, key, expected));
    }
    return value;
}

// Absent key -> nullopt (keep default), present array -> its strings (may be empty)
std::optional<std::set<std::string>> toml_type_set(const toml::table& tbl, const std::string_view section,
                                                   const std::string_view key) {
    const auto node = tbl[key];
    if (!node) return std::nullopt;
    const auto* arr = node.as_array();
    if (!arr || (!arr->empty() && !arr->is_homogeneous(toml::node_type::string))) {
        throw std::runtime_error(std::format("{}.{} must be an array of strings", section, key));
    }
    std::set<std::string> result;
    for (const auto& elem : *arr) {
        result.emplace(elem.as_string()->get());
    }
    return result;
}

RedactionStrategy strategy_or_throw(const std::string& name) {
    const auto strategy = parse_redaction_strategy(utils::to_lower(name));
    if (!strategy) {
        throw std::runtime_error(std::format(
            "unknown redaction strategy '{}' (expected mask, hash, partial or remove)", name));
    }
    return *strategy;
}

void extract_detection(const toml::table& root, GuardianConfig& config) {
    const auto* detection = section_table(root, "detection");
    if (!detection) return;
    const auto& d = *detection;
    reject_unknown_keys(d, "detection",
        {"confidence_threshold", "enable_regex", "enable_model", "model", "max_text_bytes"});

    if (const auto v = typed_value<double>(d, "detection", "confidence_threshold", "a number")) {
        config.confidence_threshold = *v;
    }
    if (const auto v = typed_value<bool>(d, "detection", "enable_regex", "a boolean")) {
        config.enable_regex = *v;
    }
    if (const auto v = typed_value<bool>(d, "detection", "enable_model", "a boolean")) {
        config.enable_model = *v;
    }
    if (const auto v = typed_value<std::string>(d, "detection", "model", "a string")) {
        config.model_identifier = *v;
    }
    if (const auto v = typed_value<int64_t>(d, "detection", "max_text_bytes", "an integer")) {
        if (*v < 0) {
            throw std::runtime_error(std::format("detection.max_text_bytes must not be negative, got {}", *v));
        }
        config.max_text_bytes = static_cast<size_t>(*v);
    }
}

void extract_policy(const toml::table& root, GuardianConfig& config) {
    const auto* policy = section_table(root, "policy");
    if (!policy) return;
    reject_unknown_keys(*policy, "policy", {"always_mask", "conditional_mask", "sensitive_trigger"});

    if (auto types = toml_type_set(*policy, "policy", "always_mask")) {
        config.always_mask_types = std::move(*types);
    }
    if (auto types = toml_type_set(*policy, "policy", "conditional_mask")) {
        config.conditional_mask_types = std::move(*types);
    }
    if (auto types = toml_type_set(*policy, "policy", "sensitive_trigger")) {
        config.sensitive_trigger_types = std::move(*types);
    }
}

void extract_redaction(const toml::table& root, GuardianConfig& config) {
    const auto* redaction = section_table(root, "redaction");
    if (!redaction) return;
    reject_unknown_keys(*redaction, "redaction", {"strategy"});
    if (const auto strategy = typed_value<std::string>(*redaction, "redaction", "strategy", "a string")) {
        config.redaction_strategy = strategy_or_throw(*strategy);
    }
}

void extract_logging(const toml::table& root, GuardianConfig& config) {
    const auto* logging = section_table(root, "logging");
    if (!logging) return;
    reject_unknown_keys(*logging, "logging", {"level"});
    if (const auto level = typed_value<std::string>(*logging, "logging", "level", "a string")) {
        config.logging.level = *level;
    }
}

void extract_patterns(const toml::table& root, GuardianConfig& config) {
    const auto node = root["patterns"];
    if (!node) return;
    const auto* arr = node.as_array();
    if (!arr) {
        throw std::runtime_error("patterns must be an array of tables ([[patterns]])");
    }
    for (size_t i = 0; i < arr->size(); ++i) {
        const auto* tbl = (*arr)[i].as_table();
        if (!tbl) {
            throw std::runtime_error(std::format("patterns[{}] must be a table", i));
        }
        const auto section = std::format("patterns[{}]", i);
        reject_unknown_keys(*tbl, section, {"type", "regex"});
        PatternSpec spec;
        spec.type = typed_value<std::string>(*tbl, section, "type", "a string").value_or(std::string{});
        spec.expression = typed_value<std::string>(*tbl, section, "regex", "a string").value_or(std::string{});
        config.custom_patterns.emplace_back(std::move(spec));
    }
}

GuardianConfig extract_all_sections(const toml::table& tbl) {
    // include is consumed by resolve_includes for files and ignored for strings
    reject_unknown_keys(tbl, "", {"include", "detection", "policy", "redaction", "logging", "patterns"});

    GuardianConfig config;
    extract_detection(tbl, config);
    extract_policy(tbl, config);
    extract_redaction(tbl, config);
    extract_logging(tbl, config);
    extract_patterns(tbl, config);
    return config;
}

// ---- Environment helpers ---------------------------------------------------

std::optional<std::string> env_value(const char* name) {
    if (const char* value = std::getenv(name)) {
        return std::string(value);
    }
    return std::nullopt;
}

bool parse_env_bool(const char* name, const std::string& raw) {
    const auto value = utils::to_lower(utils::trim(raw));
    if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
    if (value == "false" || value == "0" || value == "no" || value == "off") return false;
    throw std::runtime_error(std::format("{} must be a boolean, got '{}'", name, raw));
}

size_t parse_env_size(const char* name, const std::string& raw) {
    const auto value = utils::trim(raw);
    size_t parsed = 0;
    const auto* first = value.data();
    const auto* last = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (value.empty() || ec != std::errc{} || ptr != last) {
        throw std::runtime_error(std::format("{} must be a non-negative integer, got '{}'", name, raw));
    }
    return parsed;
}

std::set<std::string> parse_env_types(const std::string& raw) {
    const auto items = utils::split_list(raw);
    return {items.begin(), items.end()};
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::validate_and_return(GuardianConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_env() {
    try {
        GuardianConfig config;

        if (const auto v = env_value("PII_CONFIDENCE_THRESHOLD")) {
            const auto parsed = utils::try_parse_double(utils::trim(*v));
            if (!parsed) {
                return LoadResult::error(std::format(
                    "PII_CONFIDENCE_THRESHOLD must be a number, got '{}'", *v));
            }
            config.confidence_threshold = *parsed;
        }
        if (const auto v = env_value("PII_ENABLE_REGEX")) {
            config.enable_regex = parse_env_bool("PII_ENABLE_REGEX", *v);
        }
        if (const auto v = env_value("PII_ENABLE_MODEL")) {
            config.enable_model = parse_env_bool("PII_ENABLE_MODEL", *v);
        }
        if (const auto v = env_value("PII_MODEL")) {
            config.model_identifier = utils::trim(*v);
        }
        if (const auto v = env_value("PII_MAX_TEXT_BYTES")) {
            config.max_text_bytes = parse_env_size("PII_MAX_TEXT_BYTES", *v);
        }
        if (const auto v = env_value("PII_ALWAYS_MASK_TYPES")) {
            config.always_mask_types = parse_env_types(*v);
        }
        if (const auto v = env_value("PII_CONDITIONAL_MASK_TYPES")) {
            config.conditional_mask_types = parse_env_types(*v);
        }
        if (const auto v = env_value("PII_SENSITIVE_TRIGGER_TYPES")) {
            config.sensitive_trigger_types = parse_env_types(*v);
        }
        if (const auto v = env_value("PII_REDACTION_STRATEGY")) {
            config.redaction_strategy = strategy_or_throw(utils::trim(*v));
        }
        if (const auto v = env_value("PII_LOG_LEVEL")) {
            config.logging.level = utils::trim(*v);
        }

        return validate_and_return(std::move(config));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config from environment: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const GuardianConfig& config) {
    std::vector<std::string> errors;

    // NaN fails both comparisons
    if (!(config.confidence_threshold >= 0.0 && config.confidence_threshold <= 1.0)) {
        errors.push_back(std::format(
            "detection.confidence_threshold must be in [0, 1], got {}", config.confidence_threshold));
    }

    if (config.max_text_bytes == 0) {
        errors.emplace_back("detection.max_text_bytes must be greater than 0");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be debug, info, warn or error, got '{}'", config.logging.level));
    }

    for (size_t i = 0; i < config.custom_patterns.size(); ++i) {
        const auto& p = config.custom_patterns[i];
        if (p.type.empty()) {
            errors.push_back(std::format("patterns[{}].type must not be empty", i));
        }
        if (p.expression.empty()) {
            errors.push_back(std::format("patterns[{}].regex must not be empty", i));
        }
    }

    return errors;
}

} // namespace piiguard
