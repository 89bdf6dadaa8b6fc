/**
 * @file CitationBuilder.cpp
 * @brief Implementation of CitationBuilder.
 */

#include "domain/extraction/CitationBuilder.hpp"

#include <algorithm>

namespace lextable::domain::extraction {

namespace {

bool IsContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // namespace

Citation CitationBuilder::build(const Document& document, const MatchCandidate& match) const {
    const Segment& segment = document.segments.at(match.segmentIndex);

    // Segment-relative window.
    const std::size_t matchStart = match.charStart - segment.startOffset;
    const std::size_t matchEnd = match.charEnd - segment.startOffset;
    std::size_t left = matchStart > m_radius ? matchStart - m_radius : 0;
    std::size_t right = std::min(segment.text.size(), matchEnd + m_radius);

    // Never cut a UTF-8 sequence in half.
    while (left > 0 && IsContinuationByte(segment.text[left])) --left;
    while (right < segment.text.size() && IsContinuationByte(segment.text[right])) ++right;

    std::string window = segment.text.substr(left, right - left);
    std::replace(window.begin(), window.end(), '\n', ' ');

    Citation citation;
    citation.documentId = document.id;
    citation.documentIdentifier = document.identifier;
    citation.locationType = segment.locationType;
    citation.location = segment.location;
    citation.snippet = (left > 0 ? kEllipsis : "") + window + (right < segment.text.size() ? kEllipsis : "");
    citation.charStart = match.charStart;
    citation.charEnd = match.charEnd;
    return citation;
}

} // namespace lextable::domain::extraction
