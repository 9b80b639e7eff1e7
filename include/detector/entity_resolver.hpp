#pragma once

#include "core/types.hpp"

#include <vector>

namespace piiguard {

/**
 * @brief Collapses overlapping candidates into a non-overlapping set
 *
 * Greedy sweep over candidates ordered by (start asc, confidence desc):
 * a candidate that overlaps the last accepted one replaces it only when
 * strictly more confident; otherwise it is dropped. A replacement is not
 * re-checked against earlier accepted entities, so chains resolve greedily
 * rather than optimally. Candidates below the threshold are cut last.
 */
class EntityResolver {
public:
    /**
     * @return Non-overlapping entities, ascending by start, confidence >= threshold
     */
    [[nodiscard]] static std::vector<Entity> resolve(std::vector<Entity> candidates, double threshold);
};

} // namespace piiguard
