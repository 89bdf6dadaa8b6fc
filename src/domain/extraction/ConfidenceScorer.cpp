/**
 * @file ConfidenceScorer.cpp
 * @brief Implementation of ConfidenceScorer.
 */

#include "domain/extraction/ConfidenceScorer.hpp"

#include <algorithm>
#include <cmath>

namespace lextable::domain::extraction {

namespace {

double RoundScore(double value) {
    return std::round(value * 10000.0) / 10000.0;
}

} // namespace

double ConfidenceScorer::multiplicityFactor(std::size_t candidateCount) {
    if (candidateCount <= 1) return 1.0;
    return 0.5 + 0.5 / static_cast<double>(candidateCount);
}

double ConfidenceScorer::baseScore(const FieldDefinition& field, int priority) {
    const int best = field.bestPriority();
    const int lowest = field.lowestPriority();
    if (best == lowest) return kSinglePriorityBase;
    const double scaled = static_cast<double>(priority - lowest) / static_cast<double>(best - lowest);
    return kBaseFloor + kBaseRange * std::clamp(scaled, 0.0, 1.0);
}

ConfidenceScore ConfidenceScorer::score(const FieldDefinition& field, const FieldExtraction& extraction) const {
    ConfidenceScore result;
    const MatchCandidate* primary = extraction.primary();
    if (!primary) {
        result.value = 0.0;
        result.reasons.push_back(ReasonCode::NoMatch);
        return result;
    }

    double value = baseScore(field, primary->priority);

    const std::size_t count = extraction.multiplicity();
    if (count == 1) {
        result.reasons.push_back(ReasonCode::SingleMatch);
    } else {
        result.reasons.push_back(ReasonCode::MultipleMatchesReducedConfidence);
        value *= multiplicityFactor(count);
    }

    if (primary->priority < field.bestPriority()) {
        result.reasons.push_back(ReasonCode::LowPriorityPattern);
        value -= kLowPriorityPenalty;
    }

    if (extraction.normalizationFailed) {
        result.reasons.push_back(ReasonCode::NormalizationFailed);
        value -= kNormalizationPenalty;
    }

    result.value = RoundScore(std::clamp(value, kMatchFloor, 1.0));
    return result;
}

} // namespace lextable::domain::extraction
