#include "core/redaction_engine.hpp"
#include "core/utils.hpp"

#include <openssl/sha.h>

#include <algorithm>
#include <format>
#include <stdexcept>

namespace piiguard {

static constexpr std::string_view kMaskFill = "***";
static constexpr size_t kPartialKeep = 2;

namespace {

std::string bracketed(const std::string& type) {
    return std::format("[{}]", utils::to_upper(type));
}

} // anonymous namespace

std::string RedactionEngine::placeholder_for(const Entity& entity, RedactionStrategy strategy) {
    switch (strategy) {
        case RedactionStrategy::MASK:
            return bracketed(entity.type);

        case RedactionStrategy::HASH:
            return std::format("[{}:{}]", utils::to_upper(entity.type), hash_value(entity.text));

        case RedactionStrategy::PARTIAL:
            return partial_mask(entity.text, entity.type);

        case RedactionStrategy::REMOVE:
            return {};
    }
    return bracketed(entity.type);
}

std::string RedactionEngine::partial_mask(std::string_view value, const std::string& type) {
    // Too short to reveal anything safely
    if (value.size() <= 2 * kPartialKeep) {
        return bracketed(type);
    }

    std::string result;
    result.reserve(2 * kPartialKeep + kMaskFill.size());
    result.append(value.data(), kPartialKeep);
    result.append(kMaskFill);
    result.append(value.data() + value.size() - kPartialKeep, kPartialKeep);
    return result;
}

std::string RedactionEngine::hash_value(std::string_view value) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(value.data()),
           value.size(), hash);

    // First 16 hex chars (8 bytes)
    std::string result;
    result.reserve(16);
    for (int i = 0; i < 8; ++i) {
        result += std::format("{:02x}", hash[i]);
    }
    return result;
}

RedactionOutcome RedactionEngine::redact(
    std::string_view text,
    const std::vector<Entity>& approved,
    RedactionStrategy strategy) {

    RedactionOutcome outcome;
    outcome.text = std::string(text);
    if (approved.empty()) {
        return outcome;
    }

    std::vector<const Entity*> order;
    order.reserve(approved.size());
    for (const auto& e : approved) {
        order.push_back(&e);
    }
    std::stable_sort(order.begin(), order.end(),
        [](const Entity* a, const Entity* b) { return a->start > b->start; });

    size_t boundary = text.size();
    for (const Entity* e : order) {
        if (e->start >= e->end || e->end > text.size()) {
            throw std::out_of_range(std::format(
                "entity {} span [{}, {}) outside text of {} bytes",
                e->type, e->start, e->end, text.size()));
        }
        if (e->end > boundary) {
            throw std::invalid_argument(std::format(
                "entity {} span [{}, {}) overlaps a later span", e->type, e->start, e->end));
        }
        boundary = e->start;

        std::string placeholder = placeholder_for(*e, strategy);

        outcome.text.replace(e->start, e->end - e->start, placeholder);
        outcome.redaction_map[e->text] = placeholder;

        AuditEntry entry;
        entry.type = e->type;
        entry.placeholder = std::move(placeholder);
        entry.start = e->start;
        entry.end = e->end;
        entry.confidence = e->confidence;
        entry.method = e->method;
        outcome.audit_log.push_back(std::move(entry));

        ++outcome.count;
    }
    return outcome;
}

} // namespace piiguard
