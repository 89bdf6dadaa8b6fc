#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "TestSupport.hpp"
#include "domain/extraction/ConfidenceScorer.hpp"
#include "domain/extraction/Extractor.hpp"
#include "domain/extraction/Normalizers.hpp"

using json = nlohmann::json;
using namespace lextable::domain;
using namespace lextable::domain::extraction;

static void testNormalizers() {
    assert(Normalize(NormalizerId::Date, "January 15, 2025").value == std::optional<std::string>("2025-01-15"));
    assert(Normalize(NormalizerId::Date, "the 3rd day of March, 2021").value == std::optional<std::string>("2021-03-03"));
    assert(Normalize(NormalizerId::Date, "2019-7-4").value == std::optional<std::string>("2019-07-04"));
    assert(Normalize(NormalizerId::Date, "12/31/25").value == std::optional<std::string>("2025-12-31"));
    assert(!Normalize(NormalizerId::Date, "February 30, 2023").success && "Impossible dates are rejected.");
    assert(!Normalize(NormalizerId::Date, "next Tuesday").success);

    assert(Normalize(NormalizerId::Currency, "USD $1,250.50").value == std::optional<std::string>("$1250.50"));
    assert(Normalize(NormalizerId::Currency, "EUR 2,000").value == std::optional<std::string>("EUR 2000"));
    assert(!Normalize(NormalizerId::Currency, "no amount").success);

    assert(Normalize(NormalizerId::Text, "  a \n b ").value == std::optional<std::string>("a b"));
    assert(!Normalize(NormalizerId::Text, "   ").success);
    std::cout << "[PASS] Normalizers." << std::endl;
}

static void testSingleMatchWithCitationOffsets() {
    auto field = lextable::test::FieldFromJson({
        {"key", "effective_date"}, {"type", "date"},
        {"patterns", json::array({
            {{"regex", "effective as of ((?:January|December) \\d{1,2}, \\d{4})"}, {"priority", 10}, {"group", 1}}
        })}
    });
    auto doc = lextable::test::Segmented(lextable::test::TextDocument("d1", "a.txt", {
        "This Agreement is effective as of January 1, 2023 and expires December 31, 2025."
    }));

    FieldExtraction extraction = Extractor{}.extract(doc, field);
    assert(extraction.candidates.size() == 1);
    assert(extraction.value == std::optional<std::string>("January 1, 2023"));
    assert(extraction.valueNormalized == std::optional<std::string>("2023-01-01"));
    assert(!extraction.normalizationFailed);

    const MatchCandidate* primary = extraction.primary();
    assert(doc.canonicalText.substr(primary->charStart, primary->span()) == "January 1, 2023");
    std::cout << "[PASS] Single match carries raw, normalized value and canonical offsets." << std::endl;
}

static void testPrimaryTieBreak() {
    // Same priority everywhere: earliest page wins, then earliest offset.
    auto field = lextable::test::FieldFromJson({
        {"key", "law"},
        {"patterns", json::array({
            {{"regex", "laws of (\\w+)"}, {"priority", 5}, {"group", 1}}
        })}
    });
    auto doc = lextable::test::Segmented(lextable::test::TextDocument("d1", "a.txt", {
        "nothing here",
        "laws of Delaware and laws of Texas",
        "laws of Nevada"
    }));
    FieldExtraction extraction = Extractor{}.extract(doc, field);
    assert(extraction.candidates.size() == 3);
    assert(extraction.value == std::optional<std::string>("Delaware"));
    assert(extraction.candidates[1].rawText == "Texas");
    assert(extraction.candidates[2].segmentLocation == 3);

    // A higher priority rule wins even when it matches later.
    auto prioritized = lextable::test::FieldFromJson({
        {"key", "law"},
        {"patterns", json::array({
            {{"regex", "laws of (\\w+)"}, {"priority", 5}, {"group", 1}},
            {{"regex", "State of (\\w+)"}, {"priority", 9}, {"group", 1}}
        })}
    });
    auto doc2 = lextable::test::Segmented(lextable::test::TextDocument("d2", "b.txt", {
        "laws of Delaware", "the State of Ohio"
    }));
    FieldExtraction second = Extractor{}.extract(doc2, prioritized);
    assert(second.value == std::optional<std::string>("Ohio"));
    assert(second.primary()->priority == 9);

    std::cout << "[PASS] Primary tie-break: priority, location, offset." << std::endl;
}

static void testLongestSpanBreaksTies() {
    // "2 years" against "2 years and 6 months" at the same offset.
    MatchCandidate shortOne;
    shortOne.priority = 3; shortOne.segmentLocation = 1; shortOne.charStart = 8; shortOne.charEnd = 15;
    MatchCandidate longOne = shortOne;
    longOne.charEnd = 28;
    longOne.ruleIndex = 1;
    assert(PrecedesAsPrimary(longOne, shortOne));
    assert(!PrecedesAsPrimary(shortOne, longOne));
    std::cout << "[PASS] Longest span breaks remaining ties." << std::endl;
}

static void testNoMatch() {
    auto field = lextable::test::FieldFromJson({
        {"key", "arbitration"},
        {"patterns", json::array({{{"regex", "arbitration in (\\w+)"}, {"priority", 1}, {"group", 1}}})}
    });
    auto doc = lextable::test::Segmented(lextable::test::TextDocument("d1", "a.txt", {"No dispute clause."}));
    FieldExtraction extraction = Extractor{}.extract(doc, field);
    assert(extraction.empty());
    assert(!extraction.value);
    assert(extraction.primary() == nullptr);
    std::cout << "[PASS] No match yields an empty extraction." << std::endl;
}

static void testCompositeMerge() {
    auto field = lextable::test::FieldFromJson({
        {"key", "effective_date_term"}, {"type", "composite"},
        {"patterns", json::array({
            {{"regex", "effective as of (\\w+ \\d{1,2}, \\d{4})"}, {"priority", 20}, {"group", 1}, {"normalizer", "date"}},
            {{"regex", "expires (\\w+ \\d{1,2}, \\d{4})"}, {"priority", 10}, {"group", 1}, {"normalizer", "date"}},
            {{"regex", "(?:on|as of) (january 1, 2023)"}, {"priority", 5}, {"group", 1}}
        })}
    });
    auto doc = lextable::test::Segmented(lextable::test::TextDocument("d1", "a.txt", {
        "This Agreement is effective as of January 1, 2023 and expires December 31, 2025."
    }));
    FieldExtraction extraction = Extractor{}.extract(doc, field);

    // The third rule hits the very span of the first and is deduplicated.
    assert(extraction.candidates.size() == 2);
    assert(extraction.value == std::optional<std::string>("January 1, 2023 | December 31, 2025"));
    assert(extraction.valueNormalized == std::optional<std::string>("2023-01-01 | 2025-12-31"));
    assert(extraction.primary()->priority == 20);
    assert(extraction.multiplicity() == 1 && "One match per rule does not compete.");

    ConfidenceScore score = ConfidenceScorer{}.score(field, extraction);
    assert(score.reasons == std::vector<ReasonCode>{ReasonCode::SingleMatch});
    assert(score.value == 0.95);
    std::cout << "[PASS] Composite fields merge per-rule matches." << std::endl;
}

static void testCompositeRepeatedRuleCompetes() {
    auto field = lextable::test::FieldFromJson({
        {"key", "effective_date_term"}, {"type", "composite"},
        {"patterns", json::array({
            {{"regex", "effective as of (\\w+ \\d{1,2}, \\d{4})"}, {"priority", 20}, {"group", 1}, {"normalizer", "date"}},
            {{"regex", "expires (\\w+ \\d{1,2}, \\d{4})"}, {"priority", 10}, {"group", 1}, {"normalizer", "date"}}
        })}
    });
    auto doc = lextable::test::Segmented(lextable::test::TextDocument("d1", "a.txt", {
        "Effective as of March 3, 2021. The lease is effective as of April 4, 2021 and expires May 5, 2024."
    }));
    FieldExtraction extraction = Extractor{}.extract(doc, field);

    assert(extraction.candidates.size() == 3);
    assert(extraction.multiplicity() == 2);
    assert(extraction.value == std::optional<std::string>("March 3, 2021 | May 5, 2024") && "Earliest match of the top rule leads.");

    ConfidenceScore score = ConfidenceScorer{}.score(field, extraction);
    assert(score.reasons.front() == ReasonCode::MultipleMatchesReducedConfidence);
    assert(score.value == 0.7125);
    std::cout << "[PASS] Repeated matches of one composite rule still compete." << std::endl;
}

static void testNormalizationFailureIsFlagged() {
    auto field = lextable::test::FieldFromJson({
        {"key", "signed"}, {"type", "date"},
        {"patterns", json::array({{{"regex", "signed on (\\w+ \\w+)"}, {"priority", 1}, {"group", 1}}})}
    });
    auto doc = lextable::test::Segmented(lextable::test::TextDocument("d1", "a.txt", {"It was signed on some Tuesday."}));
    FieldExtraction extraction = Extractor{}.extract(doc, field);
    assert(extraction.value == std::optional<std::string>("some Tuesday"));
    assert(!extraction.valueNormalized);
    assert(extraction.normalizationFailed);
    std::cout << "[PASS] Normalization failure keeps the raw value." << std::endl;
}

int main() {
    std::cout << "[Test] Starting Extractor Test..." << std::endl;
    testNormalizers();
    testSingleMatchWithCitationOffsets();
    testPrimaryTieBreak();
    testLongestSpanBreaksTies();
    testNoMatch();
    testCompositeMerge();
    testCompositeRepeatedRuleCompetes();
    testNormalizationFailureIsFlagged();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
