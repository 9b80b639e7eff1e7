#include "audit/audit_json.hpp"
#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/guardian.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <format>
#include <iostream>
#include <iterator>
#include <string>

using namespace piiguard;

static void print_usage(const char* prog) {
    std::cerr << std::format(
        "Usage: {} [--config FILE] [--json]\n"
        "\n"
        "Reads text from stdin and writes the redacted text to stdout.\n"
        "  --config FILE   Load TOML configuration (default: PII_* environment)\n"
        "  --json          Print the full protection result as JSON\n", prog);
}

int main(int argc, char* argv[]) {
    std::string config_file;
    bool json_output = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--json") {
            json_output = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    // Configuration
    const auto config_result = config_file.empty()
        ? ConfigLoader::load_from_env()
        : ConfigLoader::load_from_file(config_file);
    if (!config_result.success) {
        utils::log::error(config_result.error_message);
        return 1;
    }
    const auto& config = config_result.config;

    if (const auto level = utils::log::parse_level(config.logging.level)) {
        utils::log::set_level(*level);
    }
    utils::log::info(config_file.empty()
        ? std::string("Configuration loaded from environment")
        : std::format("Configuration loaded from {}", config_file));

    try {
        const PiiGuardian guardian(config);

        const std::string input((std::istreambuf_iterator<char>(std::cin)),
                                std::istreambuf_iterator<char>());

        const auto result = guardian.protect(input);
        if (json_output) {
            const nlohmann::json j = result;
            std::cout << j.dump(2) << '\n';
        } else {
            std::cout << result.text;
        }
        utils::log::info(std::format("Redacted {} entities", result.pii_count));
    } catch (const ConfigurationError& e) {
        utils::log::error(e.what());
        return 1;
    } catch (const ProtectionError& e) {
        utils::log::error(e.what());
        return 2;
    }
    return 0;
}
