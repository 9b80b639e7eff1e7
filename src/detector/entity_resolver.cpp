#include "detector/entity_resolver.hpp"

#include <algorithm>

namespace piiguard {

std::vector<Entity> EntityResolver::resolve(std::vector<Entity> candidates, double threshold) {
    // Stable: equal (start, confidence) keep layer and catalog order
    std::stable_sort(candidates.begin(), candidates.end(),
        [](const Entity& a, const Entity& b) {
            if (a.start != b.start) return a.start < b.start;
            return a.confidence > b.confidence;
        });

    std::vector<Entity> accepted;
    accepted.reserve(candidates.size());
    bool have_last = false;
    size_t last_end = 0;

    for (auto& candidate : candidates) {
        if (!have_last || candidate.start >= last_end) {
            last_end = candidate.end;
            have_last = true;
            accepted.push_back(std::move(candidate));
        } else if (candidate.confidence > accepted.back().confidence) {
            last_end = candidate.end;
            accepted.back() = std::move(candidate);
        }
    }

    std::erase_if(accepted, [threshold](const Entity& e) { return e.confidence < threshold; });
    return accepted;
}

} // namespace piiguard
