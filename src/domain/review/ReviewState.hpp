/**
 * @file ReviewState.hpp
 * @brief Reviewer-facing lifecycle status of a cell.
 */

#pragma once

#include <optional>
#include <string>

namespace lextable::domain::review {

enum class ReviewState {
    Extracted,     ///< Initial, a primary match exists.
    MissingData,   ///< Initial, nothing matched (or the document failed).
    Confirmed,
    Rejected,
    ManualUpdated
};

inline std::string ReviewStateToString(ReviewState state) {
    switch (state) {
        case ReviewState::Extracted: return "EXTRACTED";
        case ReviewState::MissingData: return "MISSING_DATA";
        case ReviewState::Confirmed: return "CONFIRMED";
        case ReviewState::Rejected: return "REJECTED";
        case ReviewState::ManualUpdated: return "MANUAL_UPDATED";
    }
    return "MISSING_DATA";
}

inline std::optional<ReviewState> ReviewStateFromString(const std::string& value) {
    if (value == "EXTRACTED") return ReviewState::Extracted;
    if (value == "MISSING_DATA") return ReviewState::MissingData;
    if (value == "CONFIRMED") return ReviewState::Confirmed;
    if (value == "REJECTED") return ReviewState::Rejected;
    if (value == "MANUAL_UPDATED") return ReviewState::ManualUpdated;
    return std::nullopt;
}

/** @brief States that exist only at creation and can never be re-entered. */
inline bool IsInitialState(ReviewState state) {
    return state == ReviewState::Extracted || state == ReviewState::MissingData;
}

} // namespace lextable::domain::review
