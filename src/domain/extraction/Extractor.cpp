/**
 * @file Extractor.cpp
 * @brief Implementation of candidate collection, primary selection and composite merge.
 */

#include "domain/extraction/Extractor.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <regex>
#include <set>
#include <tuple>

#include "domain/Errors.hpp"
#include "domain/extraction/Normalizers.hpp"

namespace lextable::domain::extraction {

namespace {

std::string Lowercase(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

} // namespace

FieldExtraction Extractor::extract(const Document& document, const FieldDefinition& field) const {
    FieldExtraction extraction;
    extraction.candidates = collectCandidates(document, field);
    if (extraction.candidates.empty()) {
        return extraction;
    }

    std::sort(extraction.candidates.begin(), extraction.candidates.end(), PrecedesAsPrimary);

    if (field.type == FieldType::Composite) {
        mergeComposite(extraction);
    } else {
        const MatchCandidate& best = extraction.candidates.front();
        extraction.value = best.rawText;
        extraction.valueNormalized = best.normalizedValue;
        extraction.normalizationFailed = best.normalizationFailed;
    }
    return extraction;
}

std::vector<MatchCandidate> Extractor::collectCandidates(const Document& document, const FieldDefinition& field) const {
    std::vector<MatchCandidate> candidates;
    // (segment, start, end) already claimed by a higher-priority rule.
    std::set<std::tuple<std::size_t, std::size_t, std::size_t>> seenSpans;

    for (std::size_t segIndex = 0; segIndex < document.segments.size(); ++segIndex) {
        const Segment& segment = document.segments[segIndex];
        if (segment.text.empty()) continue;

        for (std::size_t ruleIndex = 0; ruleIndex < field.rules.size(); ++ruleIndex) {
            const PatternRule& rule = field.rules[ruleIndex];
            const Normalizer normalizer = MakeNormalizer(field.normalizerFor(rule));

            try {
                auto it = std::sregex_iterator(segment.text.begin(), segment.text.end(), rule.matcher);
                const auto end = std::sregex_iterator();
                for (; it != end; ++it) {
                    const std::smatch& match = *it;
                    if (match.length(0) == 0) continue;
                    if (rule.group >= match.size() || !match[rule.group].matched) continue;

                    std::string raw = CompactWhitespace(match[rule.group].str());
                    if (raw.empty()) continue;

                    const std::size_t start = segment.startOffset + static_cast<std::size_t>(match.position(rule.group));
                    const std::size_t stop = start + static_cast<std::size_t>(match.length(rule.group));
                    if (!seenSpans.insert({segIndex, start, stop}).second) continue;

                    NormalizationResult normalized = Normalize(normalizer, raw);

                    MatchCandidate candidate;
                    candidate.fieldKey = field.key;
                    candidate.documentId = document.id;
                    candidate.segmentIndex = segIndex;
                    candidate.segmentLocation = segment.location;
                    candidate.rawText = std::move(raw);
                    candidate.normalizedValue = normalized.value;
                    candidate.normalizationFailed = !normalized.success;
                    candidate.charStart = start;
                    candidate.charEnd = stop;
                    candidate.priority = rule.priority;
                    candidate.ruleIndex = ruleIndex;
                    candidates.push_back(std::move(candidate));
                }
            } catch (const std::regex_error& e) {
                throw ExtractionError(field.key, "pattern '" + rule.source + "' failed: " + e.what());
            } catch (const std::exception& e) {
                throw ExtractionError(field.key, e.what());
            }
        }
    }
    return candidates;
}

// Best candidate of every matching rule, in priority order, duplicates dropped.
// Rules complement each other, so only matches of the same rule compete.
void Extractor::mergeComposite(FieldExtraction& extraction) const {
    std::map<std::size_t, std::size_t> perRule;
    for (const MatchCandidate& candidate : extraction.candidates) {
        ++perRule[candidate.ruleIndex];
    }
    std::size_t multiplicity = 0;
    for (const auto& entry : perRule) {
        multiplicity = std::max(multiplicity, entry.second);
    }
    extraction.compositeMultiplicity = multiplicity;

    std::set<std::size_t> rulesTaken;
    std::set<std::string> valuesTaken;
    std::string raw;
    std::string normalized;

    for (const MatchCandidate& candidate : extraction.candidates) {
        if (!rulesTaken.insert(candidate.ruleIndex).second) continue;
        if (!valuesTaken.insert(Lowercase(candidate.rawText)).second) continue;

        if (!raw.empty()) {
            raw += kCompositeSeparator;
            normalized += kCompositeSeparator;
        }
        raw += candidate.rawText;
        normalized += candidate.normalizedValue.value_or(candidate.rawText);
        if (candidate.normalizationFailed) {
            extraction.normalizationFailed = true;
        }
    }

    extraction.value = raw;
    extraction.valueNormalized = normalized;
}

} // namespace lextable::domain::extraction
