#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace piiguard {

/**
 * @brief Optional named-entity recognition capability
 *
 * Implementations return spans in the model's own label vocabulary with
 * byte offsets into the text they were given. recognize() may throw; the
 * detector treats any exception as an empty layer result.
 *
 * Precondition: recognize() is called concurrently when a guardian is
 * shared across threads. Implementations that are not safe for concurrent
 * read-only use must not be shared that way.
 */
class IRecognitionModel {
public:
    virtual ~IRecognitionModel() = default;

    [[nodiscard]] virtual std::vector<RecognizedSpan> recognize(std::string_view text) const = 0;

    [[nodiscard]] virtual std::string_view name() const = 0;
};

/**
 * @brief Map a model label to an entity type
 *
 * Fixed table: PERSON->PERSON, GPE/LOC->LOCATION, ORG->ORGANIZATION,
 * DATE->DATE, MONEY->MONEY, CARDINAL->NUMBER. Anything else is dropped.
 */
[[nodiscard]] std::optional<std::string> map_model_label(std::string_view label);

} // namespace piiguard
