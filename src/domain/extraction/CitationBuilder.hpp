/**
 * @file CitationBuilder.hpp
 * @brief Turns a primary match into a citation record.
 */

#pragma once

#include <cstddef>
#include "MatchCandidate.hpp"
#include "domain/Citation.hpp"
#include "domain/Document.hpp"

namespace lextable::domain::extraction {

class CitationBuilder {
public:
    static constexpr std::size_t kDefaultRadius = 80;
    static constexpr const char* kEllipsis = "...";

    explicit CitationBuilder(std::size_t radius = kDefaultRadius) : m_radius(radius) {}

    /**
     * @brief Builds the citation for the given match.
     *
     * The snippet is a window of m_radius bytes on each side of the match,
     * clipped to the match's segment and marked with an ellipsis where the
     * window stops short of a segment edge.
     */
    Citation build(const Document& document, const MatchCandidate& match) const;

private:
    std::size_t m_radius;
};

} // namespace lextable::domain::extraction
