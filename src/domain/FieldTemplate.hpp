/**
 * @file FieldTemplate.hpp
 * @brief Field definitions and compiled pattern rules of an extraction template.
 */

#pragma once

#include <algorithm>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace lextable::domain {

enum class FieldType {
    Text,
    Date,
    Currency,
    Composite ///< Sub-captures of several rules merged into one value.
};

inline std::string FieldTypeToString(FieldType type) {
    switch (type) {
        case FieldType::Text: return "text";
        case FieldType::Date: return "date";
        case FieldType::Currency: return "currency";
        case FieldType::Composite: return "composite";
    }
    return "text";
}

inline std::optional<FieldType> FieldTypeFromString(const std::string& value) {
    if (value == "text") return FieldType::Text;
    if (value == "date") return FieldType::Date;
    if (value == "currency") return FieldType::Currency;
    if (value == "composite") return FieldType::Composite;
    return std::nullopt;
}

/**
 * @enum NormalizerId
 * @brief Closed set of normalization strategies a rule may reference.
 */
enum class NormalizerId {
    Text,
    Date,
    Currency
};

inline std::string NormalizerIdToString(NormalizerId id) {
    switch (id) {
        case NormalizerId::Text: return "text";
        case NormalizerId::Date: return "date";
        case NormalizerId::Currency: return "currency";
    }
    return "text";
}

inline std::optional<NormalizerId> NormalizerIdFromString(const std::string& value) {
    if (value == "text") return NormalizerId::Text;
    if (value == "date") return NormalizerId::Date;
    if (value == "currency") return NormalizerId::Currency;
    return std::nullopt;
}

inline NormalizerId DefaultNormalizerFor(FieldType type) {
    switch (type) {
        case FieldType::Date: return NormalizerId::Date;
        case FieldType::Currency: return NormalizerId::Currency;
        case FieldType::Text:
        case FieldType::Composite: return NormalizerId::Text;
    }
    return NormalizerId::Text;
}

/**
 * @struct PatternRule
 * @brief One prioritized, pre-compiled matcher of a field.
 */
struct PatternRule {
    std::string source;          ///< Regex as written in the template.
    std::regex matcher;          ///< Compiled once at load time.
    int priority = 0;            ///< Higher wins. Unique within a field.
    std::size_t group = 0;       ///< Capture group holding the value (0 = whole match).
    std::optional<NormalizerId> normalizer;
    std::size_t declarationIndex = 0;
};

/**
 * @struct FieldDefinition
 * @brief A template field. Rules are kept sorted by descending priority.
 */
struct FieldDefinition {
    std::string key;
    std::string label;
    FieldType type = FieldType::Text;
    std::string description;
    std::vector<PatternRule> rules;

    NormalizerId normalizerFor(const PatternRule& rule) const {
        return rule.normalizer.value_or(DefaultNormalizerFor(type));
    }

    int bestPriority() const { return rules.empty() ? 0 : rules.front().priority; }
    int lowestPriority() const { return rules.empty() ? 0 : rules.back().priority; }

    void sortRules() {
        std::sort(rules.begin(), rules.end(), [](const PatternRule& a, const PatternRule& b) {
            return a.priority > b.priority;
        });
    }
};

} // namespace lextable::domain
