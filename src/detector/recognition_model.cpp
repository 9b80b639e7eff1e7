#include "detector/recognition_model.hpp"

#include <string_view>
#include <utility>

namespace piiguard {

namespace {

constexpr std::pair<std::string_view, std::string_view> kLabelTable[] = {
    {"PERSON",   "PERSON"},
    {"GPE",      "LOCATION"},
    {"LOC",      "LOCATION"},
    {"ORG",      "ORGANIZATION"},
    {"DATE",     "DATE"},
    {"MONEY",    "MONEY"},
    {"CARDINAL", "NUMBER"},
};

} // anonymous namespace

std::optional<std::string> map_model_label(std::string_view label) {
    for (const auto& [model_label, entity_type] : kLabelTable) {
        if (model_label == label) {
            return std::string(entity_type);
        }
    }
    return std::nullopt;
}

} // namespace piiguard
