/**
 * @file Normalizers.hpp
 * @brief Closed set of value normalization strategies.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include "domain/FieldTemplate.hpp"

namespace lextable::domain::extraction {

struct NormalizationResult {
    std::optional<std::string> value;
    bool success = false;
    std::string reason; ///< e.g. "date_parsed", "date_parse_failed".
};

/** @brief Whitespace cleanup only. */
struct TextNormalizer {
    NormalizationResult operator()(const std::string& input) const;
};

/** @brief Finds a calendar date anywhere in the text and renders it as YYYY-MM-DD. */
struct DateNormalizer {
    NormalizationResult operator()(const std::string& input) const;
};

/** @brief Extracts an amount, drops thousands separators, keeps the symbol. */
struct CurrencyNormalizer {
    NormalizationResult operator()(const std::string& input) const;
};

using Normalizer = std::variant<TextNormalizer, DateNormalizer, CurrencyNormalizer>;

Normalizer MakeNormalizer(NormalizerId id);

NormalizationResult Normalize(const Normalizer& normalizer, const std::string& input);

inline NormalizationResult Normalize(NormalizerId id, const std::string& input) {
    return Normalize(MakeNormalizer(id), input);
}

/** @brief Collapses every whitespace run to one space and trims. */
std::string CompactWhitespace(const std::string& input);

/** @brief At most maxBytes of text, cut back to a UTF-8 code-point boundary. */
std::string TruncateUtf8(const std::string& text, std::size_t maxBytes);

} // namespace lextable::domain::extraction
