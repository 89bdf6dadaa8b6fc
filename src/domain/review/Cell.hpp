/**
 * @file Cell.hpp
 * @brief Aggregate Root for one field's value in one document within one job.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "AuditEntry.hpp"
#include "ReviewAction.hpp"
#include "ReviewState.hpp"
#include "domain/Citation.hpp"
#include "domain/FieldTemplate.hpp"
#include "domain/extraction/ReasonCode.hpp"

namespace lextable::domain::review {

/**
 * @struct CellRecord
 * @brief Plain state of a cell, as exchanged with persistence and the API.
 */
struct CellRecord {
    std::string cellId;
    std::string jobId;
    std::string documentId;
    std::string documentIdentifier;
    std::string fieldKey;
    std::string fieldLabel;
    FieldType fieldType = FieldType::Text;

    std::optional<std::string> value;           ///< Current value, possibly overridden.
    std::optional<std::string> valueRaw;        ///< Extracted text. Written once.
    std::optional<std::string> valueNormalized;
    double confidence = 0.0;
    std::vector<extraction::ReasonCode> confidenceReasons;
    ReviewState reviewState = ReviewState::MissingData;
    std::optional<Citation> citation;
    int version = 1;
};

/**
 * @class Cell
 * @brief Applies the review state machine and records audit entries.
 *
 * Commands append to the uncommitted audit list; the repository persists
 * them together with the new state and then clears the list.
 */
class Cell {
private:
    CellRecord m_record;
    int m_lastSequence = 0;
    std::vector<AuditEntry> m_uncommitted;

public:
    /** @brief Rehydrates a stored cell whose log already holds lastSequence entries. */
    Cell(CellRecord record, int lastSequence)
        : m_record(std::move(record)), m_lastSequence(lastSequence) {}

    /** @brief Creates a fresh cell and records its CREATED entry. */
    static Cell materialize(CellRecord record, const std::string& actor) {
        record.version = 1;
        Cell cell(std::move(record), 0);

        AuditEntry entry;
        entry.cellId = cell.m_record.cellId;
        entry.sequence = ++cell.m_lastSequence;
        entry.actor = actor;
        entry.timestamp = std::chrono::system_clock::now();
        entry.action = AuditAction::Created;
        entry.after = cell.snapshot();
        cell.m_uncommitted.push_back(entry);
        return cell;
    }

    // --- Accessors ---
    const CellRecord& record() const { return m_record; }
    const std::string& id() const { return m_record.cellId; }
    ReviewState state() const { return m_record.reviewState; }
    int version() const { return m_record.version; }
    int lastSequence() const { return m_lastSequence; }

    const std::vector<AuditEntry>& getUncommittedEntries() const { return m_uncommitted; }
    void clearUncommittedEntries() { m_uncommitted.clear(); }

    CellSnapshot snapshot() const {
        return CellSnapshot{m_record.value, m_record.valueRaw, m_record.reviewState};
    }

    // --- Commands ---

    void confirm(const std::string& actor, const std::optional<std::string>& reason) {
        transition(ReviewState::Confirmed, AuditAction::Confirm, std::nullopt, actor, reason);
    }

    void reject(const std::string& actor, const std::optional<std::string>& reason) {
        transition(ReviewState::Rejected, AuditAction::Reject, std::nullopt, actor, reason);
    }

    // value_raw, value_normalized and citation stay as extracted.
    void manualEdit(const std::string& value, const std::string& actor, const std::optional<std::string>& reason) {
        transition(ReviewState::ManualUpdated, AuditAction::ManualEdit, value, actor, reason);
    }

    /** @throws ValidationError for malformed actions. */
    void apply(const ReviewAction& action) {
        action.validate();
        if (action.manualValue) {
            manualEdit(*action.manualValue, action.actor, action.reason);
        } else if (*action.reviewState == ReviewState::Confirmed) {
            confirm(action.actor, action.reason);
        } else {
            reject(action.actor, action.reason);
        }
    }

private:
    void transition(ReviewState target,
                    AuditAction action,
                    const std::optional<std::string>& newValue,
                    const std::string& actor,
                    const std::optional<std::string>& reason) {
        if (IsInitialState(target)) {
            throw ValidationError("no transition into " + ReviewStateToString(target));
        }

        AuditEntry entry;
        entry.cellId = m_record.cellId;
        entry.actor = actor;
        entry.timestamp = std::chrono::system_clock::now();
        entry.action = action;
        entry.reason = reason;
        entry.before = snapshot();

        if (newValue) {
            m_record.value = *newValue;
        }
        m_record.reviewState = target;
        m_record.version++;

        entry.sequence = ++m_lastSequence;
        entry.after = snapshot();
        m_uncommitted.push_back(entry);
    }
};

} // namespace lextable::domain::review
