/**
 * @file ReasonCode.hpp
 * @brief Enumerated explanations attached to a confidence score.
 */

#pragma once

#include <optional>
#include <string>

namespace lextable::domain::extraction {

enum class ReasonCode {
    SingleMatch,
    MultipleMatchesReducedConfidence,
    LowPriorityPattern,
    NormalizationFailed,
    NoMatch,
    ParseError,
    ExtractionError
};

inline std::string ReasonCodeToString(ReasonCode code) {
    switch (code) {
        case ReasonCode::SingleMatch: return "SINGLE_MATCH";
        case ReasonCode::MultipleMatchesReducedConfidence: return "MULTIPLE_MATCHES_REDUCED_CONFIDENCE";
        case ReasonCode::LowPriorityPattern: return "LOW_PRIORITY_PATTERN";
        case ReasonCode::NormalizationFailed: return "NORMALIZATION_FAILED";
        case ReasonCode::NoMatch: return "NO_MATCH";
        case ReasonCode::ParseError: return "PARSE_ERROR";
        case ReasonCode::ExtractionError: return "EXTRACTION_ERROR";
    }
    return "NO_MATCH";
}

inline std::optional<ReasonCode> ReasonCodeFromString(const std::string& value) {
    if (value == "SINGLE_MATCH") return ReasonCode::SingleMatch;
    if (value == "MULTIPLE_MATCHES_REDUCED_CONFIDENCE") return ReasonCode::MultipleMatchesReducedConfidence;
    if (value == "LOW_PRIORITY_PATTERN") return ReasonCode::LowPriorityPattern;
    if (value == "NORMALIZATION_FAILED") return ReasonCode::NormalizationFailed;
    if (value == "NO_MATCH") return ReasonCode::NoMatch;
    if (value == "PARSE_ERROR") return ReasonCode::ParseError;
    if (value == "EXTRACTION_ERROR") return ReasonCode::ExtractionError;
    return std::nullopt;
}

} // namespace lextable::domain::extraction
