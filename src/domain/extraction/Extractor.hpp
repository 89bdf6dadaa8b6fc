/**
 * @file Extractor.hpp
 * @brief Applies a field's pattern rules to a document's segments.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "MatchCandidate.hpp"
#include "domain/Document.hpp"
#include "domain/FieldTemplate.hpp"

namespace lextable::domain::extraction {

/**
 * @struct FieldExtraction
 * @brief Candidate set for one (document, field) plus the selected value.
 *
 * Candidates are sorted by PrecedesAsPrimary, so the primary match is
 * always the first element.
 */
struct FieldExtraction {
    std::vector<MatchCandidate> candidates;
    std::optional<std::string> value;           ///< Raw value (merged for composite fields).
    std::optional<std::string> valueNormalized;
    bool normalizationFailed = false;

    /// Composite fields only: most candidates produced by any one merged rule.
    std::optional<std::size_t> compositeMultiplicity;

    bool empty() const { return candidates.empty(); }

    /** @brief Number of competing matches the value was chosen from. */
    std::size_t multiplicity() const { return compositeMultiplicity.value_or(candidates.size()); }

    const MatchCandidate* primary() const { return candidates.empty() ? nullptr : &candidates.front(); }
};

class Extractor {
public:
    /**
     * @brief Collects every candidate of the field in the document.
     * @throws ExtractionError if a pattern or normalizer fails unexpectedly.
     */
    FieldExtraction extract(const Document& document, const FieldDefinition& field) const;

    /** @brief Separator between sub-values of a composite field. */
    static constexpr const char* kCompositeSeparator = " | ";

private:
    std::vector<MatchCandidate> collectCandidates(const Document& document, const FieldDefinition& field) const;
    void mergeComposite(FieldExtraction& extraction) const;
};

} // namespace lextable::domain::extraction
