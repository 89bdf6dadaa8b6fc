/**
 * @file ConfidenceScorer.hpp
 * @brief Deterministic confidence for a field's candidate set.
 */

#pragma once

#include <cstddef>
#include <vector>

#include "Extractor.hpp"
#include "ReasonCode.hpp"
#include "domain/FieldTemplate.hpp"

namespace lextable::domain::extraction {

struct ConfidenceScore {
    double value = 0.0;
    std::vector<ReasonCode> reasons; ///< In evaluation order, not by magnitude.
};

/**
 * @class ConfidenceScorer
 * @brief Pure function of the candidate set and its primary match.
 *
 * Base score comes from the primary rule's priority scaled between the
 * field's lowest and highest priorities. Multiplicity, low-priority and
 * normalization adjustments follow, in that order.
 */
class ConfidenceScorer {
public:
    static constexpr double kSinglePriorityBase = 0.95;
    static constexpr double kBaseFloor = 0.60;
    static constexpr double kBaseRange = 0.35;
    static constexpr double kLowPriorityPenalty = 0.10;
    static constexpr double kNormalizationPenalty = 0.15;
    static constexpr double kMatchFloor = 0.01; ///< Keeps real matches distinguishable from failure.

    ConfidenceScore score(const FieldDefinition& field, const FieldExtraction& extraction) const;

    /** @brief 1 for one candidate, decreasing towards 0.5 as the count grows. */
    static double multiplicityFactor(std::size_t candidateCount);

    static double baseScore(const FieldDefinition& field, int priority);
};

} // namespace lextable::domain::extraction
