/**
 * @file AuditEntry.hpp
 * @brief Append-only record of one cell transition.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include "ReviewState.hpp"

namespace lextable::domain::review {

enum class AuditAction {
    Created,
    Confirm,
    Reject,
    ManualEdit
};

inline std::string AuditActionToString(AuditAction action) {
    switch (action) {
        case AuditAction::Created: return "CREATED";
        case AuditAction::Confirm: return "CONFIRM";
        case AuditAction::Reject: return "REJECT";
        case AuditAction::ManualEdit: return "MANUAL_EDIT";
    }
    return "CREATED";
}

inline std::optional<AuditAction> AuditActionFromString(const std::string& value) {
    if (value == "CREATED") return AuditAction::Created;
    if (value == "CONFIRM") return AuditAction::Confirm;
    if (value == "REJECT") return AuditAction::Reject;
    if (value == "MANUAL_EDIT") return AuditAction::ManualEdit;
    return std::nullopt;
}

/**
 * @struct CellSnapshot
 * @brief Value and state of a cell on one side of a transition.
 */
struct CellSnapshot {
    std::optional<std::string> value;
    std::optional<std::string> valueRaw;
    ReviewState reviewState = ReviewState::MissingData;
};

struct AuditEntry {
    std::string cellId;
    int sequence = 0; ///< 1-based, gap-free per cell.
    std::string actor;
    std::chrono::system_clock::time_point timestamp;
    AuditAction action = AuditAction::Created;
    std::optional<std::string> reason;
    std::optional<CellSnapshot> before; ///< Absent for the creation entry.
    CellSnapshot after;
};

} // namespace lextable::domain::review
