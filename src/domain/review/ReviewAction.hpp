/**
 * @file ReviewAction.hpp
 * @brief Reviewer input against one cell.
 */

#pragma once

#include <optional>
#include <string>
#include "ReviewState.hpp"
#include "domain/Errors.hpp"

namespace lextable::domain::review {

/**
 * @struct ReviewAction
 * @brief Exactly one of reviewState or manualValue must be set.
 *
 * expectedVersion is the cell version the caller last read; the commit
 * fails if the cell moved on since.
 */
struct ReviewAction {
    std::optional<ReviewState> reviewState;
    std::optional<std::string> manualValue;
    std::optional<std::string> reason;
    std::string actor;
    int expectedVersion = 0;

    /** @throws ValidationError when the action is malformed. */
    void validate() const {
        if (reviewState.has_value() == manualValue.has_value()) {
            throw ValidationError("exactly one of review_state or manual_value must be set");
        }
        if (actor.empty()) {
            throw ValidationError("actor is required");
        }
        if (expectedVersion < 1) {
            throw ValidationError("version must be the cell version last read (>= 1)");
        }
        if (reviewState) {
            if (IsInitialState(*reviewState)) {
                throw ValidationError("cannot transition back to " + ReviewStateToString(*reviewState));
            }
            if (*reviewState == ReviewState::ManualUpdated) {
                throw ValidationError("MANUAL_UPDATED requires manual_value");
            }
        }
    }
};

} // namespace lextable::domain::review
