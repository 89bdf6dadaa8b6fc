#include <cassert>
#include <iostream>
#include <string>

#include "TestSupport.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ContentExtractor.hpp"
#include "infrastructure/DocumentSegmenter.hpp"
#include "infrastructure/HtmlTextExtractor.hpp"

using namespace lextable::domain;
using namespace lextable::infrastructure;

static void testPagesAndOffsets() {
    auto source = lextable::test::TextDocument("doc-1", "a.txt", {
        "  Page   one\tline  \n\n second line ",
        "",
        "Page three"
    });
    Document doc = lextable::test::Segmented(source);

    assert(doc.segments.size() == 3 && "Empty pages keep their slot.");
    assert(doc.segments[0].text == "Page one line\nsecond line");
    assert(doc.segments[1].text.empty());
    assert(doc.segments[2].location == 3);
    assert(doc.canonicalText == "Page one line\nsecond line\n\n\n\nPage three");

    for (const auto& seg : doc.segments) {
        assert(seg.locationType == LocationType::Page);
        assert(doc.canonicalText.substr(seg.startOffset, seg.endOffset - seg.startOffset) == seg.text);
    }
    std::cout << "[PASS] Pages are canonicalized and offsets index the canonical text." << std::endl;
}

static void testTrailingFormFeedAndCrlf() {
    SourceDocument source;
    source.id = "doc-2";
    source.identifier = "b.txt";
    source.format = DocumentFormat::Text;
    source.rawBytes = "first\r\npage\fsecond\f\n";

    Document doc = DocumentSegmenter{}.segment(source);
    assert(doc.segments.size() == 2 && "Trailing blank page is dropped.");
    assert(doc.segments[0].text == "first\npage");

    auto pages = ContentExtractor::SplitPages("a\fb\f");
    assert(pages.size() == 2);
    std::cout << "[PASS] Form-feed pagination and CRLF handling." << std::endl;
}

static void testEmptyDocumentIsParseError() {
    auto source = lextable::test::TextDocument("doc-3", "empty.txt", {"   ", "\n\n"});
    bool threw = false;
    try {
        lextable::test::Segmented(source);
    } catch (const ParseError& e) {
        threw = true;
        assert(e.documentId() == "doc-3");
    }
    assert(threw && "A document without text must raise ParseError.");
    std::cout << "[PASS] Empty document raises ParseError." << std::endl;
}

static void testPdfWithoutHeaderIsParseError() {
    SourceDocument source;
    source.id = "doc-4";
    source.identifier = "fake.pdf";
    source.format = DocumentFormat::Pdf;
    source.rawBytes = "this is not a pdf";

    bool threw = false;
    try {
        DocumentSegmenter{}.segment(source);
    } catch (const ParseError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Malformed PDF raises ParseError." << std::endl;
}

static void testHtmlSections() {
    std::string filler(300, 'x');
    std::string html =
        "<html><head><title>Ignored</title><style>p{}</style></head><body>"
        "<p>Preamble &amp; recitals " + filler + "</p>"
        "<h2>Section 2. Payment</h2><p>Buyer shall pay within 30 days.</p>"
        "<p>Recorded with Screenity</p>"
        "<script>var hidden = 1;</script>"
        "<table><tr><td>Cell A</td><td>Cell B</td></tr></table>"
        "</body></html>";

    SourceDocument source;
    source.id = "doc-5";
    source.identifier = "c.html";
    source.format = DocumentFormat::Html;
    source.rawBytes = html;

    Document doc = DocumentSegmenter{}.segment(source);
    assert(doc.segments.size() == 2 && "The heading after a long section opens a new one.");
    assert(doc.segments[0].locationType == LocationType::Section);
    assert(doc.segments[0].text.find("Preamble & recitals") == 0);
    assert(doc.segments[1].label == "Section 2. Payment");
    assert(doc.segments[1].text.find("Section 2. Payment\nBuyer shall pay within 30 days.") == 0);
    assert(doc.canonicalText.find("Ignored") == std::string::npos);
    assert(doc.canonicalText.find("hidden") == std::string::npos);
    assert(doc.canonicalText.find("Screenity") == std::string::npos && "Noise lines are removed.");
    assert(doc.canonicalText.find("Cell A Cell B") != std::string::npos);
    std::cout << "[PASS] HTML is flattened and split into sections." << std::endl;
}

static void testShortSectionDoesNotSplit() {
    SourceDocument source;
    source.id = "doc-6";
    source.identifier = "d.html";
    source.format = DocumentFormat::Html;
    source.rawBytes = "<p>Intro</p><p>1. Definitions</p><p>Body</p>";

    Document doc = DocumentSegmenter{}.segment(source);
    assert(doc.segments.size() == 1);
    assert(doc.segments[0].location == 1);
    assert(DocumentSegmenter::IsSectionHeading("ARTICLE IV Termination"));
    assert(!DocumentSegmenter::IsSectionHeading("The parties agree"));
    std::cout << "[PASS] Short sections are not split." << std::endl;
}

static void testSelfClosedScriptKeepsBody() {
    SourceDocument source;
    source.id = "doc-7";
    source.identifier = "e.html";
    source.format = DocumentFormat::Html;
    source.rawBytes =
        "<html><body><script src=\"a.js\"/><p>This Agreement is effective as of January 1, 2023.</p>"
        "<p>Fees&nbsp;apply &amp; the Buyer&rsquo;s duties survive.</p></body></html>";

    Document doc = DocumentSegmenter{}.segment(source);
    assert(doc.segments.size() == 1);
    assert(doc.canonicalText.find("This Agreement is effective as of January 1, 2023.") == 0);
    assert(doc.canonicalText.find("Fees apply & the Buyer\xE2\x80\x99s duties survive.") != std::string::npos);
    assert(doc.canonicalText.find("a.js") == std::string::npos);
    std::cout << "[PASS] Self-closed script does not hide the body; entities are decoded." << std::endl;
}

static void testSectionLabelKeepsUtf8Whole() {
    std::string accents;
    for (int i = 0; i < 60; ++i) accents += "\xC3\xA9";
    const std::string heading = "Section 9. " + accents;

    SourceDocument source;
    source.id = "doc-8";
    source.identifier = "f.html";
    source.format = DocumentFormat::Html;
    source.rawBytes = "<p>" + std::string(300, 'y') + "</p><p>" + heading + "</p><p>Body text.</p>";

    Document doc = DocumentSegmenter{}.segment(source);
    assert(doc.segments.size() == 2);
    const std::string& label = doc.segments[1].label;
    assert(label.size() <= DocumentSegmenter::kMaxLabelChars);
    assert(label.size() == 119 && "Cut backs off to the start of the split character.");
    assert(heading.compare(0, label.size(), label) == 0);
    assert((static_cast<unsigned char>(label.back()) & 0xC0) == 0x80 && "Label ends on a complete character.");
    std::cout << "[PASS] Section labels are cut on a character boundary." << std::endl;
}

int main() {
    std::cout << "[Test] Starting DocumentSegmenter Test..." << std::endl;
    testPagesAndOffsets();
    testTrailingFormFeedAndCrlf();
    testEmptyDocumentIsParseError();
    testPdfWithoutHeaderIsParseError();
    testHtmlSections();
    testShortSectionDoesNotSplit();
    testSelfClosedScriptKeepsBody();
    testSectionLabelKeepsUtf8Whole();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
