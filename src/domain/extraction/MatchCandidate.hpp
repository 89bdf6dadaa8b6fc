/**
 * @file MatchCandidate.hpp
 * @brief Raw pattern match for one field within one document.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace lextable::domain::extraction {

/**
 * @struct MatchCandidate
 * @brief Ephemeral, produced per extraction pass and never persisted.
 */
struct MatchCandidate {
    std::string fieldKey;
    std::string documentId;
    std::size_t segmentIndex = 0; ///< Index into Document::segments.
    int segmentLocation = 1;
    std::string rawText;          ///< Selected capture, whitespace-compacted.
    std::optional<std::string> normalizedValue;
    bool normalizationFailed = false;
    std::size_t charStart = 0;    ///< Canonical-text offsets of the capture.
    std::size_t charEnd = 0;
    int priority = 0;
    std::size_t ruleIndex = 0;    ///< Position of the rule in priority order.

    std::size_t span() const { return charEnd - charStart; }
};

/**
 * @brief Primary-match tie-break: higher priority, earlier segment, earlier
 * start, longer span. Rule index keeps the order total.
 */
inline bool PrecedesAsPrimary(const MatchCandidate& a, const MatchCandidate& b) {
    if (a.priority != b.priority) return a.priority > b.priority;
    if (a.segmentLocation != b.segmentLocation) return a.segmentLocation < b.segmentLocation;
    if (a.charStart != b.charStart) return a.charStart < b.charStart;
    if (a.span() != b.span()) return a.span() > b.span();
    return a.ruleIndex < b.ruleIndex;
}

} // namespace lextable::domain::extraction
