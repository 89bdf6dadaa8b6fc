#include <cassert>
#include <iostream>
#include <string>

#include "TestSupport.hpp"
#include "domain/extraction/CitationBuilder.hpp"
#include "domain/extraction/Extractor.hpp"

using json = nlohmann::json;
using namespace lextable::domain;
using namespace lextable::domain::extraction;

static bool IsValidUtf8Start(const std::string& s) {
    return s.empty() || (static_cast<unsigned char>(s[0]) & 0xC0) != 0x80;
}

int main() {
    std::cout << "[Test] Starting CitationBuilder Test..." << std::endl;

    auto field = lextable::test::FieldFromJson({
        {"key", "amount"},
        {"patterns", json::array({{{"regex", "pay (\\$\\d+)"}, {"priority", 1}, {"group", 1}}})}
    });
    const std::string filler = "lorem ipsum dolor sit amet consectetur ";
    auto doc = lextable::test::Segmented(lextable::test::TextDocument("d1", "contract.txt", {
        "Cover page",
        filler + filler + "Buyer shall pay $500 on delivery.\n" + filler + filler
    }));

    FieldExtraction extraction = Extractor{}.extract(doc, field);
    const MatchCandidate* match = extraction.primary();
    assert(match != nullptr);

    // Narrow window: ellipsis on both sides
    Citation narrow = CitationBuilder(10).build(doc, *match);
    assert(narrow.documentId == "d1");
    assert(narrow.documentIdentifier == "contract.txt");
    assert(narrow.locationType == LocationType::Page);
    assert(narrow.location == 2);
    assert(narrow.snippet.find("$500") != std::string::npos);
    assert(narrow.snippet.compare(0, 3, "...") == 0);
    assert(narrow.snippet.compare(narrow.snippet.size() - 3, 3, "...") == 0);
    assert(narrow.snippet.find('\n') == std::string::npos && "Newlines are flattened.");

    // Containment
    const Segment& seg = doc.segments[static_cast<std::size_t>(narrow.location - 1)];
    assert(seg.contains(narrow.charStart, narrow.charEnd));
    assert(doc.canonicalText.substr(narrow.charStart, narrow.charEnd - narrow.charStart) == "$500");
    std::cout << "[PASS] Citation offsets lie inside the cited segment." << std::endl;

    // Wide window: clipped to the segment, no ellipsis, never spills into page 1
    Citation wide = CitationBuilder(10000).build(doc, *match);
    assert(wide.snippet.find("Cover page") == std::string::npos);
    assert(wide.snippet.compare(0, 3, "...") != 0);
    std::cout << "[PASS] Snippet is clipped to the segment." << std::endl;

    // Multi-byte characters at the window edge are not split
    auto accented = lextable::test::Segmented(lextable::test::TextDocument("d2", "b.txt", {
        "\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9 pay $42 \xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9"
    }));
    FieldExtraction second = Extractor{}.extract(accented, field);
    for (std::size_t radius = 1; radius < 12; ++radius) {
        Citation c = CitationBuilder(radius).build(accented, *second.primary());
        std::string body = c.snippet;
        if (body.compare(0, 3, "...") == 0) body = body.substr(3);
        assert(IsValidUtf8Start(body));
        assert(c.snippet.find("$42") != std::string::npos);
    }
    std::cout << "[PASS] Snippet boundaries respect UTF-8." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
