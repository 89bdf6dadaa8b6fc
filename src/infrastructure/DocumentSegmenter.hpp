/**
 * @file DocumentSegmenter.hpp
 * @brief Turns raw document bytes into canonical text and ordered segments.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/Document.hpp"

namespace lextable::infrastructure {

/**
 * @class DocumentSegmenter
 * @brief PDF pages, HTML sections, or form-feed paginated text.
 *
 * Whitespace is normalized before offsets are computed, so every offset
 * indexes the canonical text that extraction actually searches.
 */
class DocumentSegmenter {
public:
    /** @brief Section headings only split once the current section exceeds this many characters. */
    static constexpr std::size_t kMinSectionChars = 250;
    static constexpr std::size_t kMaxLabelChars = 120;
    static constexpr const char* kSegmentSeparator = "\n\n";

    /** @throws domain::ParseError when the document cannot be segmented. */
    domain::Document segment(const domain::SourceDocument& source) const;

    /** @brief Builds a page-segmented document from already extracted page texts. */
    static domain::Document FromPages(const domain::SourceDocument& source, const std::vector<std::string>& pages);

    /** @brief Builds a section-segmented document from flattened HTML text. */
    static domain::Document FromHtmlText(const domain::SourceDocument& source, const std::string& text);

    /** @brief Trims a line and collapses internal whitespace, NBSP included. */
    static std::string CanonicalLine(const std::string& line);

    static bool IsNoiseLine(const std::string& line);
    static bool IsSectionHeading(const std::string& line);

private:
    struct SegmentDraft {
        domain::LocationType type = domain::LocationType::Page;
        std::string label;
        std::vector<std::string> lines;
    };

    static std::vector<std::string> CanonicalLines(const std::string& text);
    static domain::Document Assemble(const domain::SourceDocument& source, const std::vector<SegmentDraft>& drafts);
};

} // namespace lextable::infrastructure
