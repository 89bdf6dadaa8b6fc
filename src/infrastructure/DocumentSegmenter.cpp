/**
 * @file DocumentSegmenter.cpp
 * @brief Implementation of DocumentSegmenter.
 */

#include "infrastructure/DocumentSegmenter.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

#include "domain/Errors.hpp"
#include "domain/extraction/Normalizers.hpp"
#include "infrastructure/ContentExtractor.hpp"
#include "infrastructure/HtmlTextExtractor.hpp"

namespace lextable::infrastructure {

using namespace lextable::domain;

namespace {

const std::vector<std::string> kNoiseMarkers = {"screenity", "boomerang", "chrome-extension://"};

std::string Lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return std::tolower(c); });
    return value;
}

std::string ReplaceAll(std::string text, const std::string& from, const std::string& to) {
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

bool HasText(const std::vector<std::string>& lines) {
    return std::any_of(lines.begin(), lines.end(), [](const std::string& l) { return !l.empty(); });
}

} // namespace

std::string DocumentSegmenter::CanonicalLine(const std::string& line) {
    return extraction::CompactWhitespace(ReplaceAll(line, "\xC2\xA0", " "));
}

std::vector<std::string> DocumentSegmenter::CanonicalLines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t nl = text.find('\n', start);
        if (nl == std::string::npos) nl = text.size();
        std::string line = CanonicalLine(text.substr(start, nl - start));
        if (!line.empty()) lines.push_back(std::move(line));
        start = nl + 1;
    }
    return lines;
}

bool DocumentSegmenter::IsNoiseLine(const std::string& line) {
    const std::string lowered = Lowercase(line);
    return std::any_of(kNoiseMarkers.begin(), kNoiseMarkers.end(),
                       [&lowered](const std::string& marker) { return lowered.find(marker) != std::string::npos; });
}

bool DocumentSegmenter::IsSectionHeading(const std::string& line) {
    static const std::regex heading(
        "^(ARTICLE\\s+[IVXLC0-9]+\\b.*|Section\\s+[0-9A-Za-z.\\-]+\\b.*|\\d{1,2}\\.\\s+.+)$",
        std::regex::ECMAScript | std::regex::icase);
    return std::regex_match(line, heading);
}

Document DocumentSegmenter::Assemble(const SourceDocument& source, const std::vector<SegmentDraft>& drafts) {
    Document document;
    document.id = source.id;
    document.identifier = source.identifier;
    document.format = source.format;

    for (std::size_t i = 0; i < drafts.size(); ++i) {
        if (i > 0) document.canonicalText += kSegmentSeparator;

        Segment segment;
        segment.locationType = drafts[i].type;
        segment.location = static_cast<int>(i) + 1;
        segment.label = drafts[i].label;
        for (std::size_t l = 0; l < drafts[i].lines.size(); ++l) {
            if (l > 0) segment.text += '\n';
            segment.text += drafts[i].lines[l];
        }
        segment.startOffset = document.canonicalText.size();
        document.canonicalText += segment.text;
        segment.endOffset = document.canonicalText.size();
        document.segments.push_back(std::move(segment));
    }
    return document;
}

Document DocumentSegmenter::FromPages(const SourceDocument& source, const std::vector<std::string>& pages) {
    std::vector<SegmentDraft> drafts;
    drafts.reserve(pages.size());
    bool anyText = false;
    for (const auto& page : pages) {
        SegmentDraft draft;
        draft.type = LocationType::Page;
        draft.lines = CanonicalLines(page);
        anyText = anyText || HasText(draft.lines);
        drafts.push_back(std::move(draft));
    }
    if (!anyText) {
        throw ParseError(source.id, "document has no extractable text");
    }
    return Assemble(source, drafts);
}

Document DocumentSegmenter::FromHtmlText(const SourceDocument& source, const std::string& text) {
    std::vector<std::string> lines;
    for (auto& line : CanonicalLines(text)) {
        if (!IsNoiseLine(line)) lines.push_back(std::move(line));
    }
    if (lines.empty()) {
        throw ParseError(source.id, "document has no extractable text");
    }

    std::vector<SegmentDraft> drafts;
    SegmentDraft current;
    current.type = LocationType::Section;
    std::size_t currentChars = 0;

    for (auto& line : lines) {
        if (currentChars > kMinSectionChars && IsSectionHeading(line)) {
            drafts.push_back(std::move(current));
            current = SegmentDraft{};
            current.type = LocationType::Section;
            current.label = extraction::TruncateUtf8(line, kMaxLabelChars);
            currentChars = 0;
        }
        currentChars += line.size() + (current.lines.empty() ? 0 : 1);
        current.lines.push_back(std::move(line));
    }
    drafts.push_back(std::move(current));
    return Assemble(source, drafts);
}

Document DocumentSegmenter::segment(const SourceDocument& source) const {
    switch (source.format) {
        case DocumentFormat::Pdf:
            return FromPages(source, ContentExtractor::ExtractPdfPages(source.id, source.rawBytes));
        case DocumentFormat::Html:
            return FromHtmlText(source, HtmlTextExtractor::ToText(source.rawBytes));
        case DocumentFormat::Text:
            return FromPages(source, ContentExtractor::SplitPages(ReplaceAll(source.rawBytes, "\r\n", "\n")));
    }
    throw ParseError(source.id, "unsupported document format");
}

} // namespace lextable::infrastructure
